/** \file
 *
 * \brief Logging utilities
 */

#ifndef LOGGING_HH_
#define LOGGING_HH_

#include <algorithm>
#include <iterator>
#include <memory>
#include <optional>
#include <ostream>
#include <string_view>

#include "Utility.hh"

namespace Klondike {

/** \brief Log level
 *
 * \sa setupLogging(), log()
 */
enum class LogLevel {
    NONE,     ///< No logging
    FATAL,    ///< Broken invariants of the game engine
    ERROR,    ///< Recoverable error situations
    WARNING,  ///< Unexpected concerning events
    INFO,     ///< Rejected moves, finished games and other notable events
    DEBUG     ///< Board dumps and every accepted move
};

/** \brief Output a LogLevel to stream
 *
 * \param os the output stream
 * \param level the level to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, LogLevel level);

/// \cond DOXYGEN_IGNORE
/// These are helpers for implementing log()

namespace Impl {

bool shouldLog(LogLevel level);
std::ostream& logStream();

template<typename FormatIterator>
void log(FormatIterator first, FormatIterator last)
{
    if (first != last) {
        logStream().write(std::addressof(*first), last - first);
    }
}

template<typename FormatIterator, typename First, typename... Rest>
void log(
    FormatIterator first, FormatIterator last, const First& arg,
    const Rest&... rest)
{
    const auto iter = std::find(first, last, '%');
    if (iter == last || std::next(iter) == last) {
        log(first, iter);
    } else {
        logStream().write(std::addressof(*first), iter - first);
        // Brings the operator<< overloads of the Klondike namespace into
        // consideration for arguments from other namespaces
        {
            using Klondike::operator<<;
            logStream() << arg;
        }
        log(std::next(iter, 2), last, rest...);
    }
}

}

/// \endcond

/** \brief Logging utility
 *
 * Log message if \p level is at least the minimum logging level set by
 * setupLogging().
 *
 * \note This utility is not thread safe. The game engine is single threaded
 * and only one thread should log at a time.
 *
 * \note The \p format string resembles the standard C formatting string. The
 * type given by the specifier is ignored and the corresponding value in \p ts
 * is streamed as is. Exactly one character following the \% sign is skipped.
 *
 * \param level the logging level
 * \param format the formatting string
 * \param ts the values streamed to the placeholders in \p format
 */
template<typename... Ts>
void log(LogLevel level, std::string_view format, const Ts&... ts)
{
    if (Impl::shouldLog(level)) {
        Impl::log(format.begin(), format.end(), ts...);
        Impl::logStream() << '\n';
    }
}

/** \brief Default mapping between verbosity and logging level
 *
 * The verbosity of the front end is increased by giving the -v option one or
 * more times.
 *
 * \param verbosity the number of times the verbosity flag is given
 *
 * \return LogLevel corresponding the verbosity (0 warning, 1 info, >=2 debug)
 */
LogLevel getLogLevel(int verbosity);

/** \brief Parse logging level from its name
 *
 * \param name the lowercase name of the level (“none”, “fatal”, “error”,
 * “warning”, “info” or “debug”)
 *
 * \return the level, or none if \p name is not a level
 */
std::optional<LogLevel> logLevelFromString(std::string_view name);

/** \brief Setup logging utility
 *
 * This function sets up the (global) minimum logging level and the stream to
 * which the log is output.
 *
 * If this method is not called, the default logging level is LogLevel::WARNING
 * and the default stream is std::cerr. If the logging level is set to
 * LogLevel::NONE, no logs are produced.
 *
 * The application is responsible for keeping \p stream alive for as long as
 * it is set up as the logging stream.
 *
 * \param level the minimum logging level that causes log to be output
 * \param stream the output stream to which the logs are output
 */
void setupLogging(LogLevel level, std::ostream& stream);

}

#endif // LOGGING_HH_
