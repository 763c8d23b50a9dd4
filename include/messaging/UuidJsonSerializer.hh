/** \file
 *
 * \brief Definition of JSON serializers for UUIDs and typed identifiers
 *
 * Both are serialized as the canonical UUID string. The type tags of an
 * identifier are not serialized, so an identifier deserializes to whatever
 * identifier type the caller requests.
 */

#ifndef MESSAGING_UUIDJSONSERIALIZER_HH_
#define MESSAGING_UUIDJSONSERIALIZER_HH_

#include <nlohmann/json.hpp>

#include "typeduuid/Id.hh"
#include "typeduuid/Uuid.hh"

namespace nlohmann {

/** \brief Explicit specialization of adl_serializer for Uuid
 */
template<>
struct adl_serializer<TypedUuid::Uuid> {

    /** \brief Convert UUID to JSON
     */
    static void to_json(json&, const TypedUuid::Uuid&);

    /** \brief Convert JSON to UUID
     *
     * Accepts a string in any of the forms accepted by
     * TypedUuid::parseUuid(), or a binary value of exactly 16 bytes.
     *
     * \throw TypedUuid::Messaging::SerializationFailureException if \p j is
     * neither
     */
    static void from_json(const json& j, TypedUuid::Uuid&);

};

/** \brief Partial specialization of adl_serializer for typed identifiers
 */
template<typename Entity, typename Version>
struct adl_serializer<TypedUuid::Id<Entity, Version>> {

    /** \brief Convert identifier to JSON
     */
    static void to_json(json& j, const TypedUuid::Id<Entity, Version>& id)
    {
        j = id.getUuid();
    }

    /** \brief Convert JSON to identifier
     *
     * The version bits of the UUID are not checked.
     *
     * \throw TypedUuid::Messaging::SerializationFailureException on the
     * same conditions as the UUID converter
     */
    static TypedUuid::Id<Entity, Version> from_json(const json& j)
    {
        return TypedUuid::Id<Entity, Version>::fromRawUnchecked(
            j.get<TypedUuid::Uuid>());
    }

};

}

#endif // MESSAGING_UUIDJSONSERIALIZER_HH_
