/** \file
 *
 * \brief Definition of Klondike::Main::Config class
 */

#ifndef MAIN_CONFIG_HH_
#define MAIN_CONFIG_HH_

#include "klondike/CardType.hh"
#include "Logging.hh"

#include <iosfwd>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace Klondike {

/** \brief The command line front end of the Klondike rule engine
 */
namespace Main {

/** \brief Configuration file processing utility
 *
 * The configuration is a Lua script. After running the script, the following
 * global variables are read:
 *
 * - \c deck: array of 52 strings such as <tt>"queen hearts"</tt>, the deck
 *   the game is dealt from (the last string is the top card)
 * - \c seed: integer used to seed shuffling when \c deck is not given
 * - \c log_level: one of <tt>"none"</tt>, <tt>"fatal"</tt>,
 *   <tt>"error"</tt>, <tt>"warning"</tt>, <tt>"info"</tt>, <tt>"debug"</tt>
 *
 * Variables of unexpected type are ignored with a warning.
 */
class Config {
public:

    /** \brief Create empty configs
     */
    Config();

    /** \brief Create configuration from stream
     *
     * The constructor reads configuration script from stream \p in and
     * processes it. The processing involves reading the stream until EOF,
     * parsing the contents as Lua script and running the script.
     *
     * \throw std::runtime_error if reading the stream or processing the
     * script fails, or if the deck given in the script is malformed
     */
    Config(std::istream& in);

    /** \brief Move constructor
     */
    Config(Config&&);

    ~Config();

    /** \brief Move assignment
     */
    Config& operator=(Config&&);

    /** \brief Get the deck
     *
     * \return pointer to the configured deck, the top card last, or nullptr
     * if the configuration has no deck
     */
    const std::vector<CardType>* getDeck() const;

    /** \brief Get the shuffling seed
     *
     * \return the seed, or none if the configuration has no seed
     */
    std::optional<int> getSeed() const;

    /** \brief Get the logging level
     *
     * \return the logging level, or none if the configuration has no level
     */
    std::optional<LogLevel> getLogLevel() const;

private:

    class Impl;
    std::unique_ptr<const Impl> impl;
};

/** \brief Create configuration from file
 *
 * Depending on the value the \p path, the function generates the config object
 * in different ways:
 * - If \p path is empty, empty configuration is returned
 * - If \p path is hyphen (“-”), configuration is read from stdin
 * - Otherwise \p path is interpreted as path to the configuration file
 *
 * \param path the path of the configuration file
 *
 * \return config object based on the file
 */
Config configFromPath(std::string_view path);

}
}

#endif // MAIN_CONFIG_HH_
