#include "typeduuid/UuidGenerator.hh"

#include <boost/uuid/name_generator_md5.hpp>
#include <boost/uuid/name_generator_sha1.hpp>

#include <algorithm>

namespace TypedUuid {

namespace {

void setVersionAndVariant(Uuid& uuid, const int version)
{
    uuid.data[6] = static_cast<Uuid::value_type>(
        (uuid.data[6] & 0x0f) | (version << 4));
    uuid.data[8] = static_cast<Uuid::value_type>((uuid.data[8] & 0x3f) | 0x80);
}

template<typename Integer>
void writeBigEndian(Uuid& uuid, const int offset, const int size, Integer value)
{
    for (auto i = offset + size - 1; i >= offset; --i) {
        uuid.data[i] = static_cast<Uuid::value_type>(value & 0xff);
        value >>= 8;
    }
}

void writeClockSequenceAndNode(
    Uuid& uuid, const Timestamp& timestamp, const NodeId& node)
{
    writeBigEndian(uuid, 8, 2, timestamp.getCounter());
    std::copy(node.begin(), node.end(), uuid.begin() + 10);
}

}

namespace Namespaces {

const Uuid& dns()
{
    static const auto uuid = boost::uuids::ns::dns();
    return uuid;
}

const Uuid& url()
{
    static const auto uuid = boost::uuids::ns::url();
    return uuid;
}

const Uuid& oid()
{
    static const auto uuid = boost::uuids::ns::oid();
    return uuid;
}

const Uuid& x500()
{
    static const auto uuid = boost::uuids::ns::x500dn();
    return uuid;
}

}

UuidGenerator& getUuidGenerator()
{
    thread_local UuidGenerator uuidGenerator {&getRng()};
    return uuidGenerator;
}

Uuid generateUuid()
{
    auto& uuidGenerator = getUuidGenerator();
    return uuidGenerator();
}

Uuid generateNameBasedUuidMd5(const Uuid& ns, const std::string_view name)
{
    const auto gen = boost::uuids::name_generator_md5 {ns};
    return gen(name.data(), name.size());
}

Uuid generateNameBasedUuidSha1(const Uuid& ns, const std::string_view name)
{
    const auto gen = boost::uuids::name_generator_sha1 {ns};
    return gen(name.data(), name.size());
}

Uuid generateTimeBasedUuid(const Timestamp& timestamp, const NodeId& node)
{
    const auto ticks = timestamp.toRfc4122();
    auto uuid = Uuid {};
    writeBigEndian(uuid, 0, 4, ticks & 0xffffffff);
    writeBigEndian(uuid, 4, 2, (ticks >> 32) & 0xffff);
    writeBigEndian(uuid, 6, 2, (ticks >> 48) & 0x0fff);
    writeClockSequenceAndNode(uuid, timestamp, node);
    setVersionAndVariant(uuid, 1);
    return uuid;
}

Uuid generateReorderedTimeBasedUuid(
    const Timestamp& timestamp, const NodeId& node)
{
    const auto ticks = timestamp.toRfc4122();
    auto uuid = Uuid {};
    writeBigEndian(uuid, 0, 4, (ticks >> 28) & 0xffffffff);
    writeBigEndian(uuid, 4, 2, (ticks >> 12) & 0xffff);
    writeBigEndian(uuid, 6, 2, ticks & 0x0fff);
    writeClockSequenceAndNode(uuid, timestamp, node);
    setVersionAndVariant(uuid, 6);
    return uuid;
}

Uuid generateUnixTimeBasedUuid(const Timestamp& timestamp)
{
    auto uuid = Uuid {};
    writeBigEndian(uuid, 0, 6, timestamp.toUnixMillis() & 0xffffffffffff);
    auto& rng = getRng();
    for (auto i = 6; i < 16; i += 2) {
        writeBigEndian(uuid, i, 2, rng() & 0xffff);
    }
    setVersionAndVariant(uuid, 7);
    return uuid;
}

Uuid generateCustomUuid(const UuidBytes& bytes)
{
    auto uuid = fromBytes(bytes);
    setVersionAndVariant(uuid, 8);
    return uuid;
}

}
