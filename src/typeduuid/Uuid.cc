#include "typeduuid/Uuid.hh"

#include "typeduuid/ParseException.hh"
#include "Logging.hh"

#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <stdexcept>

namespace TypedUuid {

namespace {
using namespace std::string_view_literals;
constexpr auto URN_PREFIX = "urn:uuid:"sv;
constexpr auto HYPHENATED_LENGTH = std::string_view::size_type {36};
}

int getVersionNumber(const Uuid& uuid) noexcept
{
    return (uuid.data[6] >> 4) & 0x0f;
}

bool isRfc4122Variant(const Uuid& uuid) noexcept
{
    return (uuid.data[8] & 0xc0) == 0x80;
}

Uuid parseUuid(std::string_view s)
{
    if (s.starts_with(URN_PREFIX)) {
        s.remove_prefix(URN_PREFIX.size());
        // Only the hyphenated form may follow the URN prefix
        if (s.size() != HYPHENATED_LENGTH || s.front() == '{') {
            log(LogLevel::DEBUG,
                "Failed to parse UUID \"%s%s\": not hyphenated"sv, URN_PREFIX, s);
            throw ParseException {"invalid uuid urn"};
        }
    }
    auto gen = boost::uuids::string_generator {};
    try {
        return gen(s.begin(), s.end());
    } catch (const std::runtime_error& e) {
        log(LogLevel::DEBUG, "Failed to parse UUID \"%s\": %s"sv, s, e.what());
        throw ParseException {e.what()};
    }
}

std::string formatUuid(const Uuid& uuid, const UuidFormat format)
{
    auto ret = boost::uuids::to_string(uuid);
    switch (format) {
    case UuidFormat::SIMPLE:
        std::erase(ret, '-');
        break;
    case UuidFormat::BRACED:
        ret.insert(ret.begin(), '{');
        ret.push_back('}');
        break;
    case UuidFormat::URN:
        ret.insert(0, URN_PREFIX);
        break;
    case UuidFormat::HYPHENATED:
        break;
    }
    return ret;
}

UuidBytes toBytes(const Uuid& uuid) noexcept
{
    auto ret = UuidBytes {};
    std::transform(
        uuid.begin(), uuid.end(), ret.begin(),
        [](const auto b) { return std::byte {b}; });
    return ret;
}

Uuid fromBytes(const UuidBytes& bytes) noexcept
{
    auto ret = Uuid {};
    std::transform(
        bytes.begin(), bytes.end(), ret.begin(),
        [](const auto b) { return std::to_integer<Uuid::value_type>(b); });
    return ret;
}

}
