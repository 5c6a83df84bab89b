// Licensed under LGPLv3 - see LICENSE file for details.

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

#include "ask/ask.hpp"
#include "ask/macros.hpp"

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace ask::lua {

/// Prompt errors become Lua errors. Argument errors are raised before any
/// C++ object is alive on the stack.
template <int (*F)(lua_State*)>
static int protect(lua_State* lstate)
{
  try {
    return F(lstate);
  } catch (const std::exception& e) {
    lua_pushfstring(lstate, "ask: %s", e.what());
  }
  return lua_error(lstate);
}

static void checkOpts(lua_State* lstate, int idx)
{
  if (!lua_isnoneornil(lstate, idx) && !lua_istable(lstate, idx))
    luaL_error(lstate, "ask: expected table");
}

static std::optional<std::string> optString(lua_State* lstate, int idx, const char* field)
{
  if (!lua_istable(lstate, idx))
    return std::nullopt;
  lua_getfield(lstate, idx, field);
  std::optional<std::string> res;
  if (lua_type(lstate, -1) == LUA_TSTRING) {
    size_t len = 0;
    const char* str = lua_tolstring(lstate, -1, &len);
    res.emplace(str, len);
  }
  lua_pop(lstate, 1);
  return res;
}

static std::optional<lua_Integer> optInteger(lua_State* lstate, int idx, const char* field)
{
  if (!lua_istable(lstate, idx))
    return std::nullopt;
  lua_getfield(lstate, idx, field);
  std::optional<lua_Integer> res;
  if (lua_type(lstate, -1) == LUA_TNUMBER)
    res = lua_tointeger(lstate, -1);
  lua_pop(lstate, 1);
  return res;
}

static std::optional<bool> optBool(lua_State* lstate, int idx, const char* field)
{
  if (!lua_istable(lstate, idx))
    return std::nullopt;
  lua_getfield(lstate, idx, field);
  std::optional<bool> res;
  if (lua_type(lstate, -1) == LUA_TBOOLEAN)
    res = lua_toboolean(lstate, -1) != 0;
  lua_pop(lstate, 1);
  return res;
}

static std::optional<Date> optDate(lua_State* lstate, int idx, const char* field)
{
  auto str = optString(lstate, idx, field);
  if (!str)
    return std::nullopt;
  auto date = Date::parse(*str);
  if (!date)
    throw InvalidConfigurationError { "'" + std::string { field } + "' has to be a YYYY-MM-DD date" };
  return date;
}

static std::vector<std::string> checkItems(lua_State* lstate, int idx)
{
  if (!lua_istable(lstate, idx))
    throw InvalidConfigurationError { "expected a table of items" };

  std::vector<std::string> items;
  for (int i = 1;; ++i) {
    lua_rawgeti(lstate, idx, i);
    if (lua_isnil(lstate, -1)) {
      lua_pop(lstate, 1);
      return items;
    }
    if (!lua_isstring(lstate, -1)) {
      lua_pop(lstate, 1);
      throw InvalidConfigurationError { "items have to be strings" };
    }
    size_t len = 0;
    const char* str = lua_tolstring(lstate, -1, &len);
    items.emplace_back(str, len);
    lua_pop(lstate, 1);
  }
}

static void pushString(lua_State* lstate, const std::string& s)
{
  lua_pushlstring(lstate, s.data(), s.size());
}

static void pushList(lua_State* lstate, const std::vector<std::string>& items)
{
  lua_createtable(lstate, static_cast<int>(items.size()), 0);
  int n = 0;
  for (const auto& item : items) {
    pushString(lstate, item);
    lua_rawseti(lstate, -2, ++n);
  }
}

template <typename P>
static void listOptions(lua_State* lstate, int idx, P& prompt)
{
  if (auto help = optString(lstate, idx, "help"))
    prompt.withHelpMessage(std::move(*help));
  if (auto pageSize = optInteger(lstate, idx, "page_size"))
    prompt.withPageSize(static_cast<size_t>(std::max<lua_Integer>(*pageSize, 0)));
  if (auto vim = optBool(lstate, idx, "vim_mode"))
    prompt.withVimMode(*vim);
}

static int text(lua_State* lstate)
{
  const char* message = luaL_checkstring(lstate, 1);
  checkOpts(lstate, 2);

  Text prompt { message };
  if (auto help = optString(lstate, 2, "help"))
    prompt.withHelpMessage(std::move(*help));
  if (auto value = optString(lstate, 2, "default"))
    prompt.withDefault(std::move(*value));
  if (auto value = optString(lstate, 2, "placeholder"))
    prompt.withPlaceholder(std::move(*value));
  if (auto value = optString(lstate, 2, "initial"))
    prompt.withInitialValue(std::move(*value));
  if (optBool(lstate, 2, "required").value_or(false))
    prompt.withValidator(required());

  if (auto answer = prompt.promptSkippable())
    pushString(lstate, *answer);
  else
    lua_pushnil(lstate);
  return 1;
}

static int confirm(lua_State* lstate)
{
  const char* message = luaL_checkstring(lstate, 1);
  checkOpts(lstate, 2);

  Confirm prompt { message };
  if (auto help = optString(lstate, 2, "help"))
    prompt.withHelpMessage(std::move(*help));
  if (auto value = optBool(lstate, 2, "default"))
    prompt.withDefault(*value);

  if (auto answer = prompt.promptSkippable())
    lua_pushboolean(lstate, *answer);
  else
    lua_pushnil(lstate);
  return 1;
}

static int password(lua_State* lstate)
{
  const char* message = luaL_checkstring(lstate, 1);
  checkOpts(lstate, 2);

  Password prompt { message };
  if (auto help = optString(lstate, 2, "help"))
    prompt.withHelpMessage(std::move(*help));
  if (!optBool(lstate, 2, "confirm").value_or(true))
    prompt.withoutConfirmation();
  if (optBool(lstate, 2, "toggle").value_or(false))
    prompt.withDisplayToggleEnabled();
  if (auto mode = optString(lstate, 2, "mode")) {
    if (*mode == "hidden")
      prompt.withDisplayMode(PasswordDisplayMode::Hidden);
    else if (*mode == "masked")
      prompt.withDisplayMode(PasswordDisplayMode::Masked);
    else if (*mode == "full")
      prompt.withDisplayMode(PasswordDisplayMode::Full);
    else
      throw InvalidConfigurationError { "'mode' has to be one of hidden, masked or full" };
  }

  if (auto answer = prompt.promptSkippable())
    pushString(lstate, *answer);
  else
    lua_pushnil(lstate);
  return 1;
}

static int selectOne(lua_State* lstate)
{
  const char* message = luaL_checkstring(lstate, 1);
  checkOpts(lstate, 3);

  Select<std::string> prompt { message, checkItems(lstate, 2) };
  listOptions(lstate, 3, prompt);
  if (auto cursor = optInteger(lstate, 3, "cursor"))
    prompt.withStartingCursor(static_cast<size_t>(std::max<lua_Integer>(*cursor - 1, 0)));

  if (auto answer = prompt.promptSkippable())
    pushString(lstate, *answer);
  else
    lua_pushnil(lstate);
  return 1;
}

static int multiSelect(lua_State* lstate)
{
  const char* message = luaL_checkstring(lstate, 1);
  checkOpts(lstate, 3);

  MultiSelect<std::string> prompt { message, checkItems(lstate, 2) };
  listOptions(lstate, 3, prompt);
  if (optBool(lstate, 3, "all").value_or(false))
    prompt.withAllSelectedByDefault();

  if (auto answer = prompt.promptSkippable())
    pushList(lstate, *answer);
  else
    lua_pushnil(lstate);
  return 1;
}

static int reorder(lua_State* lstate)
{
  const char* message = luaL_checkstring(lstate, 1);
  checkOpts(lstate, 3);

  Reorder<std::string> prompt { message, checkItems(lstate, 2) };
  listOptions(lstate, 3, prompt);

  if (auto answer = prompt.promptSkippable())
    pushList(lstate, *answer);
  else
    lua_pushnil(lstate);
  return 1;
}

static int date(lua_State* lstate)
{
  const char* message = luaL_checkstring(lstate, 1);
  checkOpts(lstate, 2);

  DateSelect prompt { message };
  if (auto help = optString(lstate, 2, "help"))
    prompt.withHelpMessage(std::move(*help));
  if (auto value = optDate(lstate, 2, "start"))
    prompt.withStartingDate(*value);
  if (auto value = optDate(lstate, 2, "min"))
    prompt.withMinDate(*value);
  if (auto value = optDate(lstate, 2, "max"))
    prompt.withMaxDate(*value);
  if (optBool(lstate, 2, "monday_first").value_or(false))
    prompt.withWeekStart(Weekday::Monday);

  if (auto answer = prompt.promptSkippable())
    pushString(lstate, answer->toString());
  else
    lua_pushnil(lstate);
  return 1;
}

} // namespace ask::lua

// NOLINTNEXTLINE(readability-identifier-naming)
extern "C" EXPORT int luaopen_asklua(lua_State* lstate)
{
  using namespace ask::lua;
  lua_createtable(lstate, 0, 7);
    lua_pushcfunction(lstate, protect<text>);
      lua_setfield(lstate, -2, "text");
    lua_pushcfunction(lstate, protect<confirm>);
      lua_setfield(lstate, -2, "confirm");
    lua_pushcfunction(lstate, protect<password>);
      lua_setfield(lstate, -2, "password");
    lua_pushcfunction(lstate, protect<selectOne>);
      lua_setfield(lstate, -2, "select");
    lua_pushcfunction(lstate, protect<multiSelect>);
      lua_setfield(lstate, -2, "multi_select");
    lua_pushcfunction(lstate, protect<reorder>);
      lua_setfield(lstate, -2, "reorder");
    lua_pushcfunction(lstate, protect<date>);
      lua_setfield(lstate, -2, "date");
  return 1;
}
