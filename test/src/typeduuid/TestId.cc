#include "typeduuid/Id.hh"
#include "typeduuid/ParseException.hh"
#include "typeduuid/WrongVersionException.hh"
#include "TestEntities.hh"

#include <boost/container_hash/hash.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <functional>
#include <set>
#include <sstream>
#include <string_view>
#include <type_traits>
#include <unordered_set>

namespace Versions = TypedUuid::Versions;

using TypedUuid::Id;
using TypedUuid::ParseException;
using TypedUuid::Role;
using TypedUuid::RoleId;
using TypedUuid::User;
using TypedUuid::UserId;
using TypedUuid::Uuid;
using TypedUuid::UuidFormat;
using TypedUuid::WrongVersionException;

using testing::ElementsAreArray;

using namespace std::string_view_literals;

namespace {
struct Document;
struct Event;
constexpr auto UUID_STRING = "a3cc5805-544f-415b-ba86-31f6237bf122"sv;
constexpr auto LOWER_UUID_STRING = "00000000-0000-4000-8000-000000000001"sv;
constexpr auto HIGHER_UUID_STRING = "00000000-0000-4000-8000-000000000002"sv;
}

// Identifiers with different tags are different types

static_assert(TypedUuid::EqualityComparableWith<UserId, UserId>);
static_assert(TypedUuid::LessThanComparableWith<UserId, UserId>);
static_assert(!TypedUuid::EqualityComparableWith<UserId, RoleId>);
static_assert(!TypedUuid::LessThanComparableWith<UserId, RoleId>);
static_assert(!TypedUuid::EqualityComparableWith<UserId, Id<User, Versions::V7>>);
static_assert(!TypedUuid::EqualityComparableWith<UserId, Uuid>);
static_assert(!std::is_convertible_v<UserId, RoleId>);
static_assert(!std::is_constructible_v<RoleId, UserId>);
static_assert(!std::is_assignable_v<RoleId&, UserId>);
static_assert(!std::is_constructible_v<UserId, Uuid>);
static_assert(!std::is_convertible_v<UserId, Uuid>);
static_assert(!std::is_default_constructible_v<UserId>);

// Identifiers are plain values with the size of a UUID

static_assert(std::is_trivially_copyable_v<UserId>);
static_assert(sizeof(UserId) == sizeof(Uuid));

// Only markers with a generation strategy can generate

static_assert(TypedUuid::Generatable<UserId>);
static_assert(TypedUuid::Generatable<Id<User, Versions::V7>>);
static_assert(!TypedUuid::Generatable<Id<User, Versions::Unversioned>>);
static_assert(!TypedUuid::Generatable<Id<User, Versions::V3>>);
static_assert(
    TypedUuid::Generatable<Id<User, Versions::V3>, const Uuid&, std::string_view>);
static_assert(!TypedUuid::Generatable<UserId, const Uuid&, std::string_view>);

static_assert(
    std::is_same_v<RoleId, decltype(UserId::nil().retagUnchecked<Role>())>);

TEST(IdTest, testGenerate)
{
    const auto id = UserId::generate();
    EXPECT_EQ(4, id.getVersionNumber());
    EXPECT_TRUE(TypedUuid::isRfc4122Variant(id.getUuid()));
    EXPECT_FALSE(id.isNil());
}

TEST(IdTest, testGeneratedIdsAreUnique)
{
    constexpr auto N_SAMPLES = 10000;
    auto ids = std::unordered_set<UserId> {};
    for (auto i = 0; i < N_SAMPLES; ++i) {
        ids.insert(UserId::generate());
    }
    EXPECT_EQ(std::size_t {N_SAMPLES}, ids.size());
}

TEST(IdTest, testGenerateNameBased)
{
    using DocumentId = Id<Document, Versions::V5>;
    const auto id = DocumentId::generate(
        TypedUuid::Namespaces::dns(), "example.com"sv);
    EXPECT_EQ("cfbff0d1-9375-5685-968c-48ce8b15ae17"sv, to_string(id));
    EXPECT_EQ(
        id, DocumentId::generate(TypedUuid::Namespaces::dns(), "example.com"sv));
}

TEST(IdTest, testGenerateTimeBased)
{
    using EventId = Id<Event, Versions::V1>;
    auto clockSequence = TypedUuid::ClockSequence {0};
    const auto timestamp = TypedUuid::Timestamp::fromUnix(
        clockSequence, 1'496'854'535, 812'946'000);
    const auto id = EventId::generate(
        timestamp, TypedUuid::NodeId {1, 2, 3, 4, 5, 6});
    EXPECT_EQ("20616934-4ba2-11e7-8000-010203040506"sv, to_string(id));
}

TEST(IdTest, testNil)
{
    EXPECT_EQ(Uuid {}, UserId::nil().getUuid());
    EXPECT_EQ(Uuid {}, (Id<User, Versions::Unversioned>::nil().getUuid()));
    EXPECT_EQ(Uuid {}, (Id<User, Versions::V1>::nil().getUuid()));
    EXPECT_EQ(Uuid {}, (Id<User, Versions::V8>::nil().getUuid()));
    EXPECT_TRUE(UserId::nil().isNil());
    EXPECT_EQ("00000000-0000-0000-0000-000000000000"sv, to_string(UserId::nil()));
}

TEST(IdTest, testParse)
{
    const auto id = UserId::parse(UUID_STRING);
    EXPECT_EQ(UUID_STRING, to_string(id));
    EXPECT_EQ(TypedUuid::parseUuid(UUID_STRING), id.getUuid());
}

TEST(IdTest, testParseCanonicalizes)
{
    EXPECT_EQ(
        UUID_STRING,
        to_string(UserId::parse("{A3CC5805-544F-415B-BA86-31F6237BF122}"sv)));
    EXPECT_EQ(
        UUID_STRING, to_string(UserId::parse("a3cc5805544f415bba8631f6237bf122"sv)));
}

TEST(IdTest, testParseInvalid)
{
    EXPECT_THROW(UserId::parse("not-a-uuid"sv), ParseException);
    EXPECT_THROW(UserId::parse(""sv), ParseException);
}

TEST(IdTest, testParseDoesNotCheckVersion)
{
    const auto id = Id<User, Versions::V1>::parse(UUID_STRING);
    EXPECT_EQ(4, id.getVersionNumber());
}

TEST(IdTest, testFromRawUnchecked)
{
    const auto uuid = TypedUuid::parseUuid(UUID_STRING);
    EXPECT_EQ(uuid, UserId::fromRawUnchecked(uuid).getUuid());
    EXPECT_EQ(Uuid {}, UserId::fromRawUnchecked(Uuid {}).getUuid());
}

TEST(IdTest, testFromRawUncheckedBytes)
{
    const auto uuid = TypedUuid::parseUuid(UUID_STRING);
    EXPECT_EQ(uuid, UserId::fromRawUnchecked(TypedUuid::toBytes(uuid)).getUuid());
}

TEST(IdTest, testFromUuid)
{
    const auto uuid = TypedUuid::parseUuid(UUID_STRING);
    EXPECT_EQ(uuid, UserId::fromUuid(uuid).getUuid());
}

TEST(IdTest, testFromUuidWithWrongVersion)
{
    const auto uuid = TypedUuid::parseUuid(UUID_STRING);
    try {
        Id<User, Versions::V7>::fromUuid(uuid);
        FAIL() << "Expected WrongVersionException";
    } catch (const WrongVersionException& e) {
        EXPECT_EQ(7, e.getExpected());
        EXPECT_EQ(4, e.getActual());
    }
}

TEST(IdTest, testFromUuidWithNil)
{
    EXPECT_THROW(UserId::fromUuid(Uuid {}), WrongVersionException);
    EXPECT_TRUE((Id<User, Versions::Unversioned>::fromUuid(Uuid {}).isNil()));
}

TEST(IdTest, testFromBytes)
{
    const auto id = UserId::parse(UUID_STRING);
    const auto bytes = id.toBytes();
    EXPECT_EQ(id, UserId::fromBytes(bytes));
}

TEST(IdTest, testFromBytesWithInvalidLength)
{
    const auto bytes = std::array<std::byte, 15> {};
    EXPECT_THROW(UserId::fromBytes(bytes), ParseException);
}

TEST(IdTest, testToBytes)
{
    const auto uuid = TypedUuid::parseUuid(UUID_STRING);
    EXPECT_THAT(
        UserId::fromRawUnchecked(uuid).toBytes(),
        ElementsAreArray(TypedUuid::toBytes(uuid)));
}

TEST(IdTest, testEquality)
{
    EXPECT_EQ(UserId::parse(UUID_STRING), UserId::parse(UUID_STRING));
    EXPECT_NE(UserId::parse(UUID_STRING), UserId::parse(LOWER_UUID_STRING));
}

TEST(IdTest, testEqualityFollowsUuid)
{
    const auto x = UserId::generate();
    const auto y = UserId::generate();
    EXPECT_EQ(x == y, x.getUuid() == y.getUuid());
    EXPECT_EQ(x == x, x.getUuid() == x.getUuid());
}

TEST(IdTest, testOrdering)
{
    const auto lower = UserId::parse(LOWER_UUID_STRING);
    const auto higher = UserId::parse(HIGHER_UUID_STRING);
    EXPECT_LT(lower, higher);
    EXPECT_LE(lower, higher);
    EXPECT_GT(higher, lower);
    EXPECT_GE(higher, lower);
    EXPECT_LE(lower, lower);
    EXPECT_FALSE(lower < lower);
}

TEST(IdTest, testOrderingIsByteLexicographic)
{
    const auto ids = std::set<UserId> {
        UserId::parse("ff000000-0000-4000-8000-000000000000"sv),
        UserId::parse(LOWER_UUID_STRING),
        UserId::parse("0f000000-0000-4000-8000-000000000000"sv),
    };
    auto iter = ids.begin();
    EXPECT_EQ(LOWER_UUID_STRING, to_string(*iter++));
    EXPECT_EQ("0f000000-0000-4000-8000-000000000000"sv, to_string(*iter++));
    EXPECT_EQ("ff000000-0000-4000-8000-000000000000"sv, to_string(*iter++));
}

TEST(IdTest, testHash)
{
    const auto x = UserId::parse(UUID_STRING);
    const auto y = UserId::parse(UUID_STRING);
    EXPECT_EQ(std::hash<UserId> {}(x), std::hash<UserId> {}(y));
    EXPECT_EQ(std::hash<Uuid> {}(x.getUuid()), std::hash<UserId> {}(x));
}

TEST(IdTest, testBoostHash)
{
    const auto x = UserId::parse(UUID_STRING);
    EXPECT_EQ(boost::hash<UserId> {}(x), boost::hash<Uuid> {}(x.getUuid()));
}

TEST(IdTest, testOutput)
{
    std::ostringstream os;
    os << UserId::parse(UUID_STRING);
    EXPECT_EQ(UUID_STRING, os.str());
}

TEST(IdTest, testFormat)
{
    const auto id = UserId::parse(UUID_STRING);
    EXPECT_EQ(UUID_STRING, TypedUuid::formatId(id));
    EXPECT_EQ(
        "a3cc5805544f415bba8631f6237bf122"sv,
        TypedUuid::formatId(id, UuidFormat::SIMPLE));
    EXPECT_EQ(
        "{a3cc5805-544f-415b-ba86-31f6237bf122}"sv,
        TypedUuid::formatId(id, UuidFormat::BRACED));
    EXPECT_EQ(
        "urn:uuid:a3cc5805-544f-415b-ba86-31f6237bf122"sv,
        TypedUuid::formatId(id, UuidFormat::URN));
}

TEST(IdTest, testCopy)
{
    const auto original = UserId::parse(UUID_STRING);
    auto copy = original;
    EXPECT_EQ(original, copy);
    copy = UserId::nil();
    EXPECT_EQ(UUID_STRING, to_string(original));
    EXPECT_TRUE(copy.isNil());
}

TEST(IdTest, testRetag)
{
    const auto user = UserId::parse(UUID_STRING);
    const auto role = user.retagUnchecked<Role>();
    EXPECT_EQ(user.getUuid(), role.getUuid());
    EXPECT_EQ(user.getUuid(), role.retagUnchecked<User>().getUuid());
}

TEST(IdTest, testSameStringParsesToDistinctTypes)
{
    const auto user = UserId::generate();
    const auto s = to_string(user);
    EXPECT_EQ(user, UserId::parse(s));
    const auto role = RoleId::parse(s);
    EXPECT_EQ(user.getUuid(), role.getUuid());
    EXPECT_EQ(user, role.retagUnchecked<User>());
}
