#include "main/Config.hh"

#include "klondike/Deck.hh"
#include "Utility.hh"

#include <array>
#include <cassert>
#include <cerrno>
#include <cstring>
#include <exception>
#include <istream>
#include <new>
#include <sstream>
#include <stdexcept>
#include <string>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

namespace Klondike {
namespace Main {

using namespace std::string_view_literals;

namespace {

constexpr auto DECK = "deck"sv;
constexpr auto SEED = "seed"sv;
constexpr auto LOG_LEVEL = "log_level"sv;

class LuaPopGuard {
public:
    LuaPopGuard(lua_State* lua);
    ~LuaPopGuard();
private:
    lua_State* lua;
};

LuaPopGuard::LuaPopGuard(lua_State* lua) :
    lua {lua}
{
}

LuaPopGuard::~LuaPopGuard()
{
    lua_pop(lua, 1);
}

constexpr auto READ_CHUNK_SIZE = 4096;
struct LuaStreamReaderArgs {
    LuaStreamReaderArgs(std::istream& in) : in {in}, buf {} {};
    std::istream& in;
    std::array<char, READ_CHUNK_SIZE> buf;
};

extern "C"
const char* config_lua_reader(lua_State*, void* data, std::size_t* size)
{
    auto& args = *static_cast<LuaStreamReaderArgs*>(data);
    if (args.in) {
        errno = 0;
        args.in.read(args.buf.data(), args.buf.size());
        if (args.in.bad()) {
            // Cannot throw through Lua, the script just ends here
            log(LogLevel::WARNING, "Failed to read config: %s",
                std::strerror(errno));
        } else {
            *size = args.in.gcount();
            return args.buf.data();
        }
    }
    *size = 0;
    return nullptr;
}

void loadAndExecuteFromStream(lua_State* lua, std::istream& in)
{
    std::istream::sentry s {in, true};
    if (s) {
        const auto reader_args = std::make_unique<LuaStreamReaderArgs>(in);
        auto error = lua_load(
            lua, config_lua_reader, reader_args.get(), "config", nullptr);
        if (!error) {
            // Running the script is all C code, so just die if out of memory
            // instead of handling the exception
            const auto out_of_memory_handler =
                std::set_new_handler(std::terminate);
            error = lua_pcall(lua, 0, 0, 0);
            std::set_new_handler(out_of_memory_handler);
        }
        if (error) {
            log(LogLevel::ERROR, "Error while running config script: %s",
                lua_tostring(lua, -1));
            throw std::runtime_error {"Could not process config"};
        }
    } else {
        log(LogLevel::ERROR, "Bad stream while reading config: %s",
            std::strerror(errno));
        throw std::runtime_error {"Failed to read config"};
    }
}

std::optional<std::string> getString(lua_State* lua, std::string_view key)
{
    lua_getglobal(lua, key.data());
    LuaPopGuard guard {lua};
    if (lua_type(lua, -1) == LUA_TSTRING) {
        return lua_tostring(lua, -1);
    } else if (!lua_isnoneornil(lua, -1)) {
        log(LogLevel::WARNING, "Expected string: %s", key);
    }
    return std::nullopt;
}

std::optional<int> getInt(lua_State* lua, std::string_view key)
{
    lua_getglobal(lua, key.data());
    LuaPopGuard guard {lua};
    auto success = 0;
    const auto ret = lua_tointegerx(lua, -1, &success);
    if (success) {
        return static_cast<int>(ret);
    } else if (!lua_isnoneornil(lua, -1)) {
        log(LogLevel::WARNING, "Expected integer: %s", key);
    }
    return std::nullopt;
}

CardType parseCardType(const char* str)
{
    auto in = std::istringstream {str};
    auto card = CardType {};
    if (!(in >> card) || !(in >> std::ws).eof()) {
        log(LogLevel::ERROR, "Invalid card in deck: %s", str);
        throw std::runtime_error {"Invalid card in deck"};
    }
    return card;
}

}

class Config::Impl {
public:

    Impl();
    Impl(std::istream& in);

    const std::vector<CardType>* getDeck() const;
    std::optional<int> getSeed() const;
    std::optional<LogLevel> getLogLevel() const;

private:

    void createDeckConfig(lua_State* lua);
    void createLogLevelConfig(lua_State* lua);

    std::optional<std::vector<CardType>> deck {};
    std::optional<int> seed {};
    std::optional<LogLevel> logLevel {};
};

Config::Impl::Impl() = default;

Config::Impl::Impl(std::istream& in)
{
    log(LogLevel::INFO, "Reading configs");

    const auto& closer = lua_close;
    const auto lua = std::unique_ptr<lua_State, decltype(closer)> {
        luaL_newstate(), closer};
    if (!lua) {
        throw std::bad_alloc {};
    }
    luaL_openlibs(lua.get());

    loadAndExecuteFromStream(lua.get(), in);

    createDeckConfig(lua.get());
    seed = getInt(lua.get(), SEED);
    createLogLevelConfig(lua.get());

    log(LogLevel::INFO, "Reading configs completed");
}

void Config::Impl::createDeckConfig(lua_State* lua)
{
    lua_getglobal(lua, DECK.data());
    LuaPopGuard guard {lua};
    if (lua_istable(lua, -1)) {
        auto cards = std::vector<CardType> {};
        for (auto i = 1;; ++i) {
            LuaPopGuard guard2 {lua};
            lua_rawgeti(lua, -1, i);
            if (lua_isnil(lua, -1)) {
                break;
            }
            if (lua_type(lua, -1) != LUA_TSTRING) {
                log(LogLevel::ERROR, "deck: expected card %d to be a string",
                    i);
                throw std::runtime_error {"Invalid card in deck"};
            }
            cards.emplace_back(parseCardType(lua_tostring(lua, -1)));
        }
        if (!isCompleteDeck(cards)) {
            log(LogLevel::ERROR,
                "deck: expected each card exactly once, got %d cards",
                cards.size());
            throw std::runtime_error {"Incomplete deck"};
        }
        deck = std::move(cards);
    } else if (!lua_isnoneornil(lua, -1)) {
        log(LogLevel::WARNING, "Expected table: %s", DECK);
    }
}

void Config::Impl::createLogLevelConfig(lua_State* lua)
{
    if (const auto name = getString(lua, LOG_LEVEL)) {
        logLevel = logLevelFromString(*name);
        if (!logLevel) {
            log(LogLevel::WARNING, "Unknown log level: %s", *name);
        }
    }
}

const std::vector<CardType>* Config::Impl::getDeck() const
{
    return deck ? &*deck : nullptr;
}

std::optional<int> Config::Impl::getSeed() const
{
    return seed;
}

std::optional<LogLevel> Config::Impl::getLogLevel() const
{
    return logLevel;
}

Config::Config() :
    impl {std::make_unique<Impl>()}
{
}

Config::Config(std::istream& in) :
    impl {std::make_unique<Impl>(in)}
{
}

Config::Config(Config&&) = default;

Config::~Config() = default;

Config& Config::operator=(Config&&) = default;

const std::vector<CardType>* Config::getDeck() const
{
    assert(impl);
    return impl->getDeck();
}

std::optional<int> Config::getSeed() const
{
    assert(impl);
    return impl->getSeed();
}

std::optional<LogLevel> Config::getLogLevel() const
{
    assert(impl);
    return impl->getLogLevel();
}

Config configFromPath(const std::string_view path)
{
    if (path.empty()) {
        return {};
    } else {
        errno = 0;
        return withInputStream(
            path, [](std::istream& in) { return Config {in}; });
    }
}

}
}
