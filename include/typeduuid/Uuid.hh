/** \file
 *
 * \brief Definition of TypedUuid::Uuid and utilities for raw UUID values
 *
 * The functions in this file operate on untyped UUIDs. Typed identifiers
 * delegate their parsing, formatting and inspection to these.
 */

#ifndef UUID_HH_
#define UUID_HH_

#include <boost/uuid/uuid.hpp>

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace TypedUuid {

/** \brief The UUID implementation underlying typed identifiers
 */
using Uuid = boost::uuids::uuid;

/** \brief The 16 bytes of a UUID in network order
 */
using UuidBytes = std::array<std::byte, 16>;

/** \brief Textual representations of a UUID
 *
 * \sa formatUuid()
 */
enum class UuidFormat {
    HYPHENATED, ///< \c 67e55044-10b1-426f-9247-bb680e5fe0c8
    SIMPLE,     ///< \c 67e5504410b1426f9247bb680e5fe0c8
    BRACED,     ///< \c {67e55044-10b1-426f-9247-bb680e5fe0c8}
    URN,        ///< \c urn:uuid:67e55044-10b1-426f-9247-bb680e5fe0c8
};

/** \brief Return the version number of a UUID
 *
 * The version is the high nibble of the seventh byte. Unlike \c
 * boost::uuids::uuid::version(), this function reports versions that Boost
 * does not know about (6–8, and the reserved values).
 *
 * \param uuid the UUID
 *
 * \return integer between 0 and 15
 */
int getVersionNumber(const Uuid& uuid) noexcept;

/** \brief Determine if the variant bits of a UUID are those of RFC 4122
 *
 * \param uuid the UUID
 *
 * \return true if the two most significant bits of the ninth byte are 10
 */
bool isRfc4122Variant(const Uuid& uuid) noexcept;

/** \brief Parse UUID from string
 *
 * Accepts the hyphenated form, the simple form without hyphens, either one
 * surrounded by braces, and the hyphenated form prefixed by \c urn:uuid:. The
 * URN prefix is not accepted in front of the simple or the braced forms. Hex
 * digits are case insensitive.
 *
 * \param s the string to parse
 *
 * \return the parsed UUID
 *
 * \throw ParseException if \p s is not a well‐formed UUID
 */
Uuid parseUuid(std::string_view s);

/** \brief Format UUID as string
 *
 * \param uuid the UUID
 * \param format the representation
 *
 * \return \p uuid in the representation \p format, with lowercase hex digits
 */
std::string formatUuid(const Uuid& uuid, UuidFormat format = UuidFormat::HYPHENATED);

/** \brief Return the bytes of a UUID
 */
UuidBytes toBytes(const Uuid& uuid) noexcept;

/** \brief Create UUID from bytes
 */
Uuid fromBytes(const UuidBytes& bytes) noexcept;

}

#endif // UUID_HH_
