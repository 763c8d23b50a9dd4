#include "typeduuid/Timestamp.hh"

#include "typeduuid/Random.hh"

#include <chrono>
#include <iomanip>
#include <ostream>
#include <stdexcept>
#include <tuple>

namespace TypedUuid {

namespace {
constexpr std::uint64_t TICKS_PER_SECOND = 10'000'000;
constexpr std::uint32_t NANOS_PER_TICK = 100;
constexpr std::uint32_t NANOS_PER_SECOND = 1'000'000'000;
}

ClockSequence::ClockSequence(const std::uint16_t initial) :
    count {initial}
{
}

std::uint16_t ClockSequence::next() noexcept
{
    return static_cast<std::uint16_t>(
        count.fetch_add(1, std::memory_order_relaxed) & Timestamp::MAX_COUNTER);
}

ClockSequence& getClockSequence()
{
    static ClockSequence clockSequence {
        static_cast<std::uint16_t>(getRng()() & Timestamp::MAX_COUNTER)};
    return clockSequence;
}

Timestamp::Timestamp(
    const std::uint64_t seconds, const std::uint32_t nanos,
    const std::uint16_t counter) :
    seconds {seconds},
    nanos {nanos},
    counter {static_cast<std::uint16_t>(counter & MAX_COUNTER)}
{
}

Timestamp Timestamp::fromUnix(
    ClockSequence& clockSequence, const std::uint64_t seconds,
    const std::uint32_t nanos)
{
    if (nanos >= NANOS_PER_SECOND) {
        throw std::invalid_argument("Nanoseconds out of range");
    }
    if (seconds > MAX_SECONDS) {
        throw std::invalid_argument("Seconds out of range");
    }
    return Timestamp {seconds, nanos, clockSequence.next()};
}

Timestamp Timestamp::fromRfc4122(
    const std::uint64_t ticks, const std::uint16_t counter)
{
    if (ticks < GREGORIAN_TO_UNIX_TICKS) {
        throw std::invalid_argument("Timestamp before Unix epoch");
    }
    if (ticks > MAX_TICKS) {
        throw std::invalid_argument("Timestamp out of range");
    }
    const auto unixTicks = ticks - GREGORIAN_TO_UNIX_TICKS;
    return Timestamp {
        unixTicks / TICKS_PER_SECOND,
        static_cast<std::uint32_t>(unixTicks % TICKS_PER_SECOND) * NANOS_PER_TICK,
        counter};
}

Timestamp Timestamp::now(ClockSequence& clockSequence)
{
    const auto sinceEpoch = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return fromUnix(
        clockSequence,
        static_cast<std::uint64_t>(sinceEpoch / NANOS_PER_SECOND),
        static_cast<std::uint32_t>(sinceEpoch % NANOS_PER_SECOND));
}

std::uint64_t Timestamp::toRfc4122() const
{
    return seconds * TICKS_PER_SECOND + nanos / NANOS_PER_TICK +
        GREGORIAN_TO_UNIX_TICKS;
}

std::uint64_t Timestamp::toUnixMillis() const
{
    return seconds * 1000 + nanos / 1'000'000;
}

bool operator==(const Timestamp& lhs, const Timestamp& rhs)
{
    return std::tie(lhs.seconds, lhs.nanos, lhs.counter) ==
        std::tie(rhs.seconds, rhs.nanos, rhs.counter);
}

std::ostream& operator<<(std::ostream& os, const Timestamp& timestamp)
{
    return os << timestamp.getSeconds() << "." << std::setw(9) <<
        std::setfill('0') << timestamp.getNanos() << std::setfill(' ') <<
        " (" << timestamp.getCounter() << ")";
}

}
