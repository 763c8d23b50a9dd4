/** \file
 *
 * \brief Definition of timestamps for time based UUIDs
 */

#ifndef TIMESTAMP_HH_
#define TIMESTAMP_HH_

#include <boost/core/noncopyable.hpp>
#include <boost/operators.hpp>

#include <atomic>
#include <cstdint>
#include <iosfwd>

namespace TypedUuid {

/** \brief Source of clock sequence values
 *
 * Time based UUIDs (versions 1 and 6) include a 14 bit clock sequence that
 * distinguishes UUIDs created within the same 100 ns tick. A clock sequence
 * hands out consecutive values, wrapping around at 2^14. Clock sequences can
 * be shared between threads.
 */
class ClockSequence : private boost::noncopyable {
public:

    /** \brief Create clock sequence
     *
     * \param initial the first value returned by next()
     */
    explicit ClockSequence(std::uint16_t initial = 0);

    /** \brief Return the next value of the sequence
     *
     * \return integer between 0 and Timestamp::MAX_COUNTER
     */
    std::uint16_t next() noexcept;

private:
    std::atomic<std::uint16_t> count;
};

/** \brief Get reference to the process wide clock sequence
 *
 * The sequence starts at a random value.
 */
ClockSequence& getClockSequence();

/** \brief Point in time together with a clock sequence value
 *
 * The time is stored as seconds and nanoseconds since the Unix epoch. RFC 4122
 * timestamps count 100 ns intervals since the Gregorian epoch (1582‐10‐15)
 * instead, and the conversion between the two is exact to the tick.
 */
class Timestamp : private boost::equality_comparable<Timestamp> {
public:

    /** \brief Number of 100 ns intervals between the Gregorian and Unix epochs
     */
    static constexpr std::uint64_t GREGORIAN_TO_UNIX_TICKS = 0x01b21dd213814000;

    /** \brief Largest tick count representable in the 60 bit UUID field
     */
    static constexpr std::uint64_t MAX_TICKS = 0x0fffffffffffffff;

    /** \brief Largest Unix time in seconds whose ticks fit in MAX_TICKS
     */
    static constexpr std::uint64_t MAX_SECONDS =
        (MAX_TICKS - GREGORIAN_TO_UNIX_TICKS - 9'999'999) / 10'000'000;

    /** \brief Largest clock sequence value
     */
    static constexpr std::uint16_t MAX_COUNTER = 0x3fff;

    /** \brief Create timestamp from Unix time
     *
     * \param clockSequence the source of the counter value
     * \param seconds seconds since the Unix epoch
     * \param nanos the subsecond part in nanoseconds
     *
     * \throw std::invalid_argument if \p nanos is one second or more, or if
     * \p seconds exceeds MAX_SECONDS
     */
    static Timestamp fromUnix(
        ClockSequence& clockSequence, std::uint64_t seconds,
        std::uint32_t nanos);

    /** \brief Create timestamp from RFC 4122 ticks
     *
     * \param ticks 100 ns intervals since the Gregorian epoch
     * \param counter the clock sequence value, of which only the 14 low bits
     * are used
     *
     * \throw std::invalid_argument if \p ticks is before the Unix epoch or
     * exceeds MAX_TICKS
     */
    static Timestamp fromRfc4122(std::uint64_t ticks, std::uint16_t counter);

    /** \brief Create timestamp from the system clock
     *
     * \param clockSequence the source of the counter value
     */
    static Timestamp now(ClockSequence& clockSequence = getClockSequence());

    /** \brief Return seconds since the Unix epoch
     */
    std::uint64_t getSeconds() const { return seconds; }

    /** \brief Return the subsecond part in nanoseconds
     */
    std::uint32_t getNanos() const { return nanos; }

    /** \brief Return the clock sequence value
     */
    std::uint16_t getCounter() const { return counter; }

    /** \brief Return the timestamp as 100 ns intervals since Gregorian epoch
     */
    std::uint64_t toRfc4122() const;

    /** \brief Return the timestamp as milliseconds since Unix epoch
     */
    std::uint64_t toUnixMillis() const;

private:

    Timestamp(std::uint64_t seconds, std::uint32_t nanos, std::uint16_t counter);

    std::uint64_t seconds;
    std::uint32_t nanos;
    std::uint16_t counter;

    friend bool operator==(const Timestamp&, const Timestamp&);
};

/** \brief Equality operator for timestamps
 */
bool operator==(const Timestamp&, const Timestamp&);

/** \brief Output a Timestamp to stream
 *
 * \param os the output stream
 * \param timestamp the timestamp to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const Timestamp& timestamp);

}

#endif // TIMESTAMP_HH_
