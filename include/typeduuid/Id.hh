/** \file
 *
 * \brief Definition of TypedUuid::Id class template
 */

#ifndef ID_HH_
#define ID_HH_

#include "ParseException.hh"
#include "Uuid.hh"
#include "Versions.hh"
#include "WrongVersionException.hh"

#include <boost/operators.hpp>
#include <boost/uuid/nil_generator.hpp>
#include <boost/uuid/uuid_hash.hpp>

#include <algorithm>
#include <cstddef>
#include <functional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace TypedUuid {

/** \brief Typed UUID
 *
 * An identifier is a UUID tagged with two types that are never instantiated:
 * \p Entity names what the identifier refers to, and \p Version is one of the
 * markers in Versions.hh. Identifiers that differ in either tag are distinct
 * types: they can be neither compared nor converted to each other, although
 * they are represented by the same 16 bytes.
 *
 * \code
 * struct User;
 * struct Role;
 * using UserId = Id<User, Versions::V4>;
 * using RoleId = Id<Role, Versions::V4>;
 *
 * const auto user = UserId::generate();
 * const auto role = RoleId::parse(to_string(user));
 * // user == role does not compile
 * \endcode
 *
 * Identifiers are totally ordered in the byte‐lexicographic order of the
 * underlying UUIDs, and hashed and formatted like them.
 *
 * There is no public constructor. Identifiers are created with generate(),
 * parse(), fromUuid(), fromBytes(), nil() or one of the unchecked functions.
 *
 * \tparam Entity the entity tag
 * \tparam Version the version marker
 */
template<typename Entity, typename Version>
class Id : private boost::totally_ordered<Id<Entity, Version>> {
public:

    /// \brief The entity tag
    using EntityType = Entity;

    /// \brief The version marker
    using VersionType = Version;

    /** \brief Generate new identifier
     *
     * Available only if \p Version has a \c generate function accepting \p
     * args. For instance Versions::V4 takes no arguments, and Versions::V5
     * takes a namespace and a name.
     *
     * \param args the arguments passed to the generator of \p Version
     *
     * \return identifier wrapping the newly generated UUID
     */
    template<typename... Args>
    requires requires(Args&&... args) {
        Version::generate(std::forward<Args>(args)...);
    }
    static Id generate(Args&&... args)
    {
        return Id {Version::generate(std::forward<Args>(args)...)};
    }

    /** \brief Return the nil identifier
     */
    static Id nil() noexcept
    {
        return Id {boost::uuids::nil_uuid()};
    }

    /** \brief Parse identifier from string
     *
     * The version bits of the parsed UUID are not checked.
     *
     * \param s the string to parse, see parseUuid() for the accepted forms
     *
     * \throw ParseException if \p s is not a well‐formed UUID
     */
    static Id parse(std::string_view s)
    {
        return Id {parseUuid(s)};
    }

    /** \brief Wrap UUID after checking its version
     *
     * \param uuid the UUID to wrap
     *
     * \throw WrongVersionException if \p uuid is not accepted by \p Version
     */
    static Id fromUuid(const Uuid& uuid)
    {
        if (!Version::validate(uuid)) {
            throw WrongVersionException {
                Version::NUMBER, TypedUuid::getVersionNumber(uuid)};
        }
        return Id {uuid};
    }

    /** \brief Create identifier from its binary representation
     *
     * The version bits are not checked.
     *
     * \param bytes the 16 bytes of the UUID in network order
     *
     * \throw ParseException if the size of \p bytes is not 16
     */
    static Id fromBytes(std::span<const std::byte> bytes)
    {
        auto array = UuidBytes {};
        if (bytes.size() != array.size()) {
            throw ParseException {
                "Invalid UUID length: expected 16 bytes, got " +
                std::to_string(bytes.size())};
        }
        std::copy(bytes.begin(), bytes.end(), array.begin());
        return fromRawUnchecked(array);
    }

    /** \brief Wrap UUID without any checks
     *
     * The caller is responsible for \p uuid actually identifying an \p
     * Entity of the \p Version scheme.
     *
     * \param uuid the UUID to wrap
     */
    static Id fromRawUnchecked(const Uuid& uuid) noexcept
    {
        return Id {uuid};
    }

    /** \brief Wrap UUID given as bytes without any checks
     *
     * \param bytes the 16 bytes of the UUID in network order
     *
     * \sa fromRawUnchecked(const Uuid&)
     */
    static Id fromRawUnchecked(const UuidBytes& bytes) noexcept
    {
        return Id {TypedUuid::fromBytes(bytes)};
    }

    /** \brief Return the untyped UUID
     */
    const Uuid& getUuid() const noexcept
    {
        return uuid;
    }

    /** \brief Return the 16 bytes of the UUID in network order
     */
    UuidBytes toBytes() const noexcept
    {
        return TypedUuid::toBytes(uuid);
    }

    /** \brief Determine if this is the nil identifier
     */
    bool isNil() const noexcept
    {
        return uuid.is_nil();
    }

    /** \brief Return the version number stored in the UUID
     *
     * \sa TypedUuid::getVersionNumber()
     */
    int getVersionNumber() const noexcept
    {
        return TypedUuid::getVersionNumber(uuid);
    }

    /** \brief Reinterpret the identifier as identifier of another entity
     *
     * The UUID and the version marker are kept. The caller is responsible for
     * the UUID actually identifying an \p OtherEntity.
     *
     * \tparam OtherEntity the new entity tag
     */
    template<typename OtherEntity>
    Id<OtherEntity, Version> retagUnchecked() const noexcept
    {
        return Id<OtherEntity, Version>::fromRawUnchecked(uuid);
    }

    /** \brief Equality operator for identifiers
     */
    friend bool operator==(const Id& lhs, const Id& rhs) noexcept
    {
        return lhs.uuid == rhs.uuid;
    }

    /** \brief Less than operator for identifiers
     */
    friend bool operator<(const Id& lhs, const Id& rhs) noexcept
    {
        return lhs.uuid < rhs.uuid;
    }

private:

    explicit Id(const Uuid& uuid) noexcept : uuid {uuid} {}

    Uuid uuid;
};

/** \brief Format identifier as string
 *
 * \param id the identifier
 * \param format the representation
 *
 * \return the UUID of \p id formatted with formatUuid()
 */
template<typename Entity, typename Version>
std::string formatId(
    const Id<Entity, Version>& id, UuidFormat format = UuidFormat::HYPHENATED)
{
    return formatUuid(id.getUuid(), format);
}

/** \brief Convert identifier to the canonical string
 *
 * \return the UUID of \p id in lowercase hyphenated form
 */
template<typename Entity, typename Version>
std::string to_string(const Id<Entity, Version>& id)
{
    return formatId(id);
}

/** \brief Output an identifier to stream
 *
 * \param os the output stream
 * \param id the identifier to output
 *
 * \return parameter \p os
 */
template<typename Entity, typename Version>
std::ostream& operator<<(std::ostream& os, const Id<Entity, Version>& id)
{
    return os << formatId(id);
}

/** \brief Hash an identifier
 *
 * Enables using identifiers with \c boost::hash. The result is the hash of the
 * underlying UUID.
 */
template<typename Entity, typename Version>
std::size_t hash_value(const Id<Entity, Version>& id) noexcept
{
    return boost::uuids::hash_value(id.getUuid());
}

}

namespace std {

/** \brief Hash support for typed identifiers
 */
template<typename Entity, typename Version>
struct hash<TypedUuid::Id<Entity, Version>> {
    std::size_t operator()(
        const TypedUuid::Id<Entity, Version>& id) const noexcept
    {
        return hash<TypedUuid::Uuid> {}(id.getUuid());
    }
};

}

#endif // ID_HH_
