#include "messaging/UuidJsonSerializer.hh"

#include "messaging/SerializationFailureException.hh"
#include "typeduuid/ParseException.hh"
#include "Logging.hh"

#include <algorithm>
#include <string>
#include <string_view>

namespace nlohmann {

using namespace std::string_view_literals;

void adl_serializer<TypedUuid::Uuid>::to_json(json& j, const TypedUuid::Uuid& uuid)
{
    j = TypedUuid::formatUuid(uuid);
}

void adl_serializer<TypedUuid::Uuid>::from_json(const json& j, TypedUuid::Uuid& uuid)
{
    if (j.is_string()) {
        try {
            uuid = TypedUuid::parseUuid(j.get_ref<const std::string&>());
        } catch (const TypedUuid::ParseException& e) {
            throw TypedUuid::Messaging::SerializationFailureException {e.what()};
        }
    } else if (j.is_binary()) {
        const auto& bytes = j.get_binary();
        if (bytes.size() != uuid.size()) {
            TypedUuid::log(
                TypedUuid::LogLevel::DEBUG,
                "Binary UUID has invalid length %d"sv, bytes.size());
            throw TypedUuid::Messaging::SerializationFailureException {
                "Invalid binary UUID length"};
        }
        std::copy(bytes.begin(), bytes.end(), uuid.begin());
    } else {
        TypedUuid::log(
            TypedUuid::LogLevel::DEBUG, "Cannot convert JSON of type %s to UUID"sv,
            j.type_name());
        throw TypedUuid::Messaging::SerializationFailureException {
            "UUID must be a string or binary"};
    }
}

}
