/** \file
 *
 * \brief Definition of UUID generator utilities
 *
 * The generators in this file produce untyped UUIDs of a given version. The
 * version markers in Versions.hh bind them to typed identifiers.
 */

#ifndef UUIDGENERATOR_HH_
#define UUIDGENERATOR_HH_

#include "Random.hh"
#include "Timestamp.hh"
#include "Uuid.hh"

#include <boost/uuid/random_generator.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace TypedUuid {

/** \brief The random UUID generator of the TypedUuid library
 */
using UuidGenerator = boost::uuids::basic_random_generator<Rng>;

/** \brief Node identifier of time based UUIDs, typically a MAC address
 */
using NodeId = std::array<std::uint8_t, 6>;

/** \brief Well known namespaces for name based UUIDs (RFC 4122 appendix C)
 */
namespace Namespaces {

/** \brief Namespace for fully qualified domain names
 */
const Uuid& dns();

/** \brief Namespace for URLs
 */
const Uuid& url();

/** \brief Namespace for ISO object identifiers
 */
const Uuid& oid();

/** \brief Namespace for X.500 distinguished names
 */
const Uuid& x500();

}

/** \brief Get reference to the UUID generator of the calling thread
 *
 * The generator draws from getRng().
 *
 * \return Reference to the UUID generator of the calling thread
 */
UuidGenerator& getUuidGenerator();

/** \brief Generate new random (version 4) UUID
 *
 * \return A newly created UUID
 */
Uuid generateUuid();

/** \brief Generate name based UUID using MD5 (version 3)
 *
 * \param ns the namespace
 * \param name the name within \p ns
 */
Uuid generateNameBasedUuidMd5(const Uuid& ns, std::string_view name);

/** \brief Generate name based UUID using SHA‐1 (version 5)
 *
 * \param ns the namespace
 * \param name the name within \p ns
 */
Uuid generateNameBasedUuidSha1(const Uuid& ns, std::string_view name);

/** \brief Generate time based UUID (version 1)
 *
 * The 60 bit RFC 4122 timestamp is laid out low field first, followed by the
 * clock sequence and the node identifier.
 *
 * \param timestamp the timestamp and clock sequence
 * \param node the node identifier
 */
Uuid generateTimeBasedUuid(const Timestamp& timestamp, const NodeId& node);

/** \brief Generate reordered time based UUID (version 6)
 *
 * Same fields as generateTimeBasedUuid(), but the timestamp is laid out most
 * significant bits first so that the UUIDs sort by creation time.
 *
 * \param timestamp the timestamp and clock sequence
 * \param node the node identifier
 */
Uuid generateReorderedTimeBasedUuid(
    const Timestamp& timestamp, const NodeId& node);

/** \brief Generate Unix time ordered UUID (version 7)
 *
 * The first 48 bits are the Unix timestamp in milliseconds. The remaining
 * bits, except version and variant, are drawn from getRng(). The clock
 * sequence of \p timestamp is not used.
 *
 * \param timestamp the timestamp
 */
Uuid generateUnixTimeBasedUuid(const Timestamp& timestamp);

/** \brief Generate custom UUID (version 8)
 *
 * \param bytes the payload, of which the version and variant bits are
 * overwritten
 */
Uuid generateCustomUuid(const UuidBytes& bytes);

}

#endif // UUIDGENERATOR_HH_
