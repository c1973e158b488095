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
#include <string>

#include "IoUtility.hh"

namespace Clue {

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
void writeLog(LogLevel level, const std::string& message);

template<typename FormatIterator>
void formatMessage(
    std::ostream& out, FormatIterator first, FormatIterator last)
{
    std::copy(first, last, std::ostreambuf_iterator<char> {out});
}

template<typename FormatIterator, typename First, typename... Rest>
void formatMessage(
    std::ostream& out, FormatIterator first, FormatIterator last,
    const First& arg, const Rest&... rest)
{
    const auto iter = std::find(first, last, '%');
    if (iter == last || std::next(iter) == last) {
        formatMessage(out, first, last);
        return;
    }
    std::copy(first, iter, std::ostreambuf_iterator<char> {out});
    {
        // Brings the operator<< overloads of optional and variant into scope
        using Clue::operator<<;
        out << arg;
    }
    formatMessage(out, std::next(iter, 2), last, rest...);
}

}

/// \endcond

/** \brief Log a message
 *
 * The message is written if \p level is at least as important as the level
 * given to setupLogging().
 *
 * Each placeholder in \p format is a percent sign followed by exactly one
 * (ignored) character, for example \c %s or \c %d. The placeholders are
 * replaced by the corresponding \p ts written with \c operator<<.
 *
 * The message is formatted before the logging stream is locked, so several
 * threads may log concurrently without their lines being interleaved.
 *
 * \param level the logging level
 * \param format the formatting string
 * \param ts the values replacing the placeholders
 */
template<typename String, typename... Ts>
void log(LogLevel level, const String& format, const Ts&... ts)
{
    if (Impl::shouldLog(level)) {
        auto out = std::ostringstream {};
        const auto first = std::begin(format);
        // String literals carry their null terminator
        const auto last = std::find(first, std::end(format), '\0');
        Impl::formatMessage(out, first, last, ts...);
        Impl::writeLog(level, out.str());
    }
}

/** \brief Map the number of -v flags to a logging level
 *
 * \param verbosity the number of times verbosity was increased
 *
 * \return LogLevel::WARNING for 0, LogLevel::INFO for 1 and LogLevel::DEBUG
 * for anything higher
 */
LogLevel getLogLevel(int verbosity);

/** \brief Setup logging
 *
 * Sets the minimum level and the stream of the global logger. Until called,
 * messages of LogLevel::WARNING and more important ones are written to
 * std::cerr. LogLevel::NONE disables logging.
 *
 * \p stream must outlive all logging that happens before the next call.
 *
 * \param level the minimum logging level
 * \param stream the stream the messages are written to
 */
void setupLogging(LogLevel level, std::ostream& stream);

}

#endif // LOGGING_HH_
