/** \file
 *
 * \brief Definition of UUID version markers
 *
 * A version marker is the second template argument of Id. It selects at
 * compile time how identifiers of that type are generated and which UUIDs
 * Id::fromUuid() accepts. Markers are never instantiated.
 *
 * A marker provides:
 *
 * - \c NUMBER, the UUID version
 * - \c validate(uuid), returning true if \c uuid may be wrapped by an
 *   identifier with the marker
 * - optionally one or more static \c generate() functions returning a new
 *   UUID of the version
 */

#ifndef VERSIONS_HH_
#define VERSIONS_HH_

#include "Timestamp.hh"
#include "Uuid.hh"
#include "UuidGenerator.hh"

#include <string_view>

namespace TypedUuid {
namespace Versions {

/** \brief Common base of the markers of a specific UUID version
 *
 * \tparam N the version number
 */
template<int N>
struct VersionBase {

    /// \brief The UUID version
    static constexpr int NUMBER = N;

    /** \brief Check if UUID has version \c N
     */
    static bool validate(const Uuid& uuid) noexcept
    {
        return getVersionNumber(uuid) == N;
    }
};

/** \brief Marker for identifiers without a version scheme
 *
 * Identifiers with this marker cannot be generated. They wrap any UUID,
 * including the nil UUID.
 */
struct Unversioned {

    /// \brief The version number of the nil UUID
    static constexpr int NUMBER = 0;

    /** \brief Accept any UUID
     */
    static constexpr bool validate(const Uuid&) noexcept
    {
        return true;
    }
};

/** \brief Marker for time based UUIDs
 */
struct V1 : VersionBase<1> {

    /** \brief Generate UUID from timestamp and node identifier
     */
    static Uuid generate(const Timestamp& timestamp, const NodeId& node)
    {
        return generateTimeBasedUuid(timestamp, node);
    }
};

/** \brief Marker for name based UUIDs using MD5
 */
struct V3 : VersionBase<3> {

    /** \brief Generate UUID from namespace and name
     */
    static Uuid generate(const Uuid& ns, std::string_view name)
    {
        return generateNameBasedUuidMd5(ns, name);
    }
};

/** \brief Marker for random UUIDs
 */
struct V4 : VersionBase<4> {

    /** \brief Generate random UUID
     */
    static Uuid generate()
    {
        return generateUuid();
    }
};

/** \brief Marker for name based UUIDs using SHA‐1
 */
struct V5 : VersionBase<5> {

    /** \brief Generate UUID from namespace and name
     */
    static Uuid generate(const Uuid& ns, std::string_view name)
    {
        return generateNameBasedUuidSha1(ns, name);
    }
};

/** \brief Marker for reordered time based UUIDs
 */
struct V6 : VersionBase<6> {

    /** \brief Generate UUID from timestamp and node identifier
     */
    static Uuid generate(const Timestamp& timestamp, const NodeId& node)
    {
        return generateReorderedTimeBasedUuid(timestamp, node);
    }
};

/** \brief Marker for Unix time ordered UUIDs
 */
struct V7 : VersionBase<7> {

    /** \brief Generate UUID from timestamp
     */
    static Uuid generate(const Timestamp& timestamp)
    {
        return generateUnixTimeBasedUuid(timestamp);
    }

    /** \brief Generate UUID from the current time
     */
    static Uuid generate()
    {
        return generateUnixTimeBasedUuid(Timestamp::now());
    }
};

/** \brief Marker for custom UUIDs
 */
struct V8 : VersionBase<8> {

    /** \brief Generate UUID from custom payload
     */
    static Uuid generate(const UuidBytes& bytes)
    {
        return generateCustomUuid(bytes);
    }
};

}
}

#endif // VERSIONS_HH_
