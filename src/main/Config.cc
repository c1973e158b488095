#include "main/Config.hh"

#include "messaging/EndpointIterator.hh"
#include "IoUtility.hh"
#include "Logging.hh"

#include <boost/uuid/string_generator.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <exception>
#include <istream>
#include <new>
#include <optional>
#include <stdexcept>
#include <string>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

namespace Clue {
namespace Main {

using namespace std::string_literals;
using namespace std::string_view_literals;

namespace {

struct GameUuidsTag {};
auto GAME_UUIDS_TAG = GameUuidsTag {};

constexpr auto BIND_ADDRESS = "bind_address"sv;
constexpr auto BIND_BASE_PORT = "bind_base_port"sv;
constexpr auto DISPROVE_TIMEOUT = "disprove_timeout"sv;
constexpr auto LEGACY_FREE_MOVEMENT = "legacy_free_movement"sv;
constexpr auto GAME_UUID = "uuid"sv;

const auto DEFAULT_BIND_ADDRESS = "*"s;
constexpr auto DEFAULT_BIND_BASE_PORT = 5555;

class LuaPopGuard {
public:
    explicit LuaPopGuard(lua_State* lua) : lua {lua} {}
    ~LuaPopGuard() { lua_pop(lua, 1); }
private:
    lua_State* lua;
};

constexpr auto READ_CHUNK_SIZE = 4096;

struct LuaStreamReader {
    explicit LuaStreamReader(std::istream& in) : in {in} {}
    std::istream& in;
    std::array<char, READ_CHUNK_SIZE> buf {};
};

extern "C"
const char* config_lua_reader(lua_State*, void* data, std::size_t* size)
{
    auto& reader = *static_cast<LuaStreamReader*>(data);
    *size = 0;
    if (reader.in) {
        reader.in.read(reader.buf.data(), reader.buf.size());
        if (reader.in.bad()) {
            log(LogLevel::WARNING, "Failed to read config: %s",
                std::strerror(errno));
            return nullptr;
        }
        *size = static_cast<std::size_t>(reader.in.gcount());
        return reader.buf.data();
    }
    return nullptr;
}

void loadAndExecute(lua_State* lua, std::istream& in)
{
    if (!in) {
        log(LogLevel::ERROR, "Bad stream while reading config: %s",
            std::strerror(errno));
        throw std::runtime_error {"Failed to read config"};
    }
    auto reader = LuaStreamReader {in};
    auto error = lua_load(lua, config_lua_reader, &reader, "config", nullptr);
    if (!error) {
        error = lua_pcall(lua, 0, 0, 0);
    }
    if (error) {
        log(LogLevel::ERROR, "Error while running config script: %s",
            lua_tostring(lua, -1));
        throw std::runtime_error {"Could not process config"};
    }
}

std::optional<std::string> getString(lua_State* lua, std::string_view key)
{
    lua_getglobal(lua, key.data());
    const auto guard = LuaPopGuard {lua};
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
    const auto guard = LuaPopGuard {lua};
    auto success = 0;
    const auto ret = lua_tointegerx(lua, -1, &success);
    if (success) {
        return static_cast<int>(ret);
    } else if (!lua_isnoneornil(lua, -1)) {
        log(LogLevel::WARNING, "Expected integer: %s", key);
    }
    return std::nullopt;
}

std::optional<bool> getBool(lua_State* lua, std::string_view key)
{
    lua_getglobal(lua, key.data());
    const auto guard = LuaPopGuard {lua};
    if (lua_isboolean(lua, -1)) {
        return lua_toboolean(lua, -1) != 0;
    } else if (!lua_isnoneornil(lua, -1)) {
        log(LogLevel::WARNING, "Expected boolean: %s", key);
    }
    return std::nullopt;
}

std::optional<Uuid> parseUuid(const char* str)
{
    auto gen = boost::uuids::string_generator {};
    try {
        return gen(str);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

extern "C"
int config_lua_game(lua_State* lua)
{
    // luaL_error does not return, so nothing with a non-trivial destructor
    // may be in scope when calling it
    luaL_checktype(lua, 1, LUA_TTABLE);
    lua_pushlightuserdata(lua, &GAME_UUIDS_TAG);
    lua_rawget(lua, LUA_REGISTRYINDEX);
    auto& uuids = *static_cast<Config::GameUuidVector*>(
        lua_touserdata(lua, -1));
    lua_pushstring(lua, GAME_UUID.data());
    lua_rawget(lua, 1);
    const auto* uuid_string = lua_tostring(lua, -1);
    if (!uuid_string) {
        return luaL_error(lua, "expected argument to contain uuid");
    }
    const auto uuid = parseUuid(uuid_string);
    if (!uuid) {
        return luaL_error(lua, "invalid uuid: %s", uuid_string);
    }
    uuids.push_back(*uuid);
    lua_pop(lua, 2);
    return 0;
}

}

struct Config::Impl {
    Impl() = default;
    explicit Impl(std::istream& in);

    std::string bindAddress {DEFAULT_BIND_ADDRESS};
    int bindBasePort {DEFAULT_BIND_BASE_PORT};
    Engine::GameSession::Options sessionOptions {};
    GameUuidVector gameUuids {};
};

Config::Impl::Impl(std::istream& in)
{
    log(LogLevel::INFO, "Reading configs");
    const auto lua = std::unique_ptr<lua_State, decltype(&lua_close)> {
        luaL_newstate(), &lua_close};
    if (!lua) {
        throw std::bad_alloc {};
    }
    luaL_openlibs(lua.get());
    lua_pushcfunction(lua.get(), config_lua_game);
    lua_setglobal(lua.get(), "game");
    lua_pushlightuserdata(lua.get(), &GAME_UUIDS_TAG);
    lua_pushlightuserdata(lua.get(), &gameUuids);
    lua_settable(lua.get(), LUA_REGISTRYINDEX);

    loadAndExecute(lua.get(), in);

    bindAddress = getString(lua.get(), BIND_ADDRESS).value_or(bindAddress);
    bindBasePort = getInt(lua.get(), BIND_BASE_PORT).value_or(bindBasePort);
    if (const auto timeout = getInt(lua.get(), DISPROVE_TIMEOUT)) {
        if (*timeout <= 0) {
            throw std::runtime_error {"disprove_timeout must be positive"};
        }
        sessionOptions.disproveTimeout = std::chrono::seconds {*timeout};
    }
    if (const auto free = getBool(lua.get(), LEGACY_FREE_MOVEMENT)) {
        sessionOptions.freeMovementInLobby = *free;
        if (*free) {
            log(LogLevel::WARNING, "Legacy free movement is deprecated");
        }
    }
    log(LogLevel::INFO, "Reading configs completed");
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

Messaging::EndpointIterator Config::getEndpointIterator() const
{
    return {impl->bindAddress, impl->bindBasePort};
}

Engine::GameSession::Options Config::getSessionOptions() const
{
    return impl->sessionOptions;
}

const Config::GameUuidVector& Config::getGameUuids() const
{
    return impl->gameUuids;
}

Config configFromPath(const std::string_view path)
{
    if (path.empty()) {
        return {};
    }
    errno = 0;
    return processStreamFromPath(
        path, [](auto& in) { return Config {in}; });
}

}
}
