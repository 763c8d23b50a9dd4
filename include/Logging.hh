/** \file
 *
 * \brief Logging utilities
 */

#ifndef LOGGING_HH_
#define LOGGING_HH_

#include <algorithm>
#include <iterator>
#include <memory>
#include <ostream>
#include <sstream>
#include <string_view>

namespace TypedUuid {

/** \brief Log level
 *
 * \sa setupLogging(), log()
 */
enum class LogLevel {
    NONE,     ///< No logging
    FATAL,    ///< Unrecoverable error situations
    ERROR,    ///< Recoverable error situations
    WARNING,  ///< Unexpected concerning events
    INFO,     ///< Other events of importance
    DEBUG     ///< Verbose debugging logging
};

/// \cond DOXYGEN_IGNORE

namespace Impl {

bool shouldLog(LogLevel level);
void writeRecord(LogLevel level, std::string_view message);

template<typename FormatIterator>
void formatTo(std::ostream& os, FormatIterator first, FormatIterator last)
{
    if (first != last) {
        os.write(std::addressof(*first), last - first);
    }
}

template<typename FormatIterator, typename First, typename... Rest>
void formatTo(
    std::ostream& os, FormatIterator first, FormatIterator last,
    const First& arg, const Rest&... rest)
{
    const auto iter = std::find(first, last, '%');
    if (iter == last || std::next(iter) == last) {
        formatTo(os, first, iter);
    } else {
        os.write(std::addressof(*first), iter - first);
        os << arg;
        formatTo(os, std::next(iter, 2), last, rest...);
    }
}

}

/// \endcond

/** \brief Log a message
 *
 * The message is written if \p level is at least as severe as the level set
 * with setupLogging(). Each placeholder in \p format is a percent sign followed
 * by exactly one (ignored) character, and is replaced by the next argument
 * streamed with its \c operator<<. Placeholders left over after the arguments
 * run out are written as is. Arguments left over after the placeholders run
 * out are ignored.
 *
 * Records are formatted by the calling thread and written to the stream one
 * at a time, so messages logged from different threads are never interleaved.
 *
 * \param level the logging level
 * \param format the formatting string
 * \param ts the values substituted for the placeholders in \p format
 */
template<typename... Ts>
void log(LogLevel level, std::string_view format, const Ts&... ts)
{
    if (Impl::shouldLog(level)) {
        auto message = std::ostringstream {};
        Impl::formatTo(message, format.begin(), format.end(), ts...);
        Impl::writeRecord(level, message.str());
    }
}

/** \brief Setup logging
 *
 * Set the global minimum logging level and the stream the log is written
 * to. Without a call to this function the level is LogLevel::WARNING and the
 * stream is std::cerr.
 *
 * The caller must keep \p stream alive for as long as it is set up. The stream
 * is only accessed while holding the internal logging lock, but other code
 * writing to it directly is not synchronized with logging.
 *
 * \param level the minimum logging level that causes log to be output
 * \param stream the output stream to which the logs are output
 */
void setupLogging(LogLevel level, std::ostream& stream);

}

#endif // LOGGING_HH_
