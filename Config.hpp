#ifndef CONFIG_DOT_HPP
#define CONFIG_DOT_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "fs.hpp"

// Conversions from configuration text, each returns false and sets msg
// when the text doesn't parse.
bool parse_value(std::string_view value, bool& out, std::string& msg);
bool parse_value(std::string_view value, std::uint64_t& out, std::string& msg);
bool parse_value(std::string_view value, std::uint32_t& out, std::string& msg);
bool parse_value(std::string_view value, std::uint16_t& out, std::string& msg);
bool parse_value(std::string_view value, std::string& out, std::string& msg);

// A duration: an integer followed by one of ms, s, m, h or d. A bare
// integer is in seconds.
bool parse_value(std::string_view           value,
                 std::chrono::milliseconds& out,
                 std::string&               msg);

// Strip one level of matching single or double quotes.
std::string_view unquote(std::string_view value);

// Key/value settings loaded from text. A key may be repeated, and a
// single value may hold a comma separated list. Problems are recorded,
// never thrown, so one bad entry doesn't keep the rest from loading.

class Config {
public:
  enum class error_kind { parse, build, warning };

  struct Error {
    std::string key;
    error_kind  kind;
    std::string message;
  };

  Config() = default;

  // Parse "key = value" lines, # starts a comment line.
  void parse(std::string_view text, std::string_view source = "config");

  // Throws std::system_error if the file can't be read.
  void load(fs::path const& path);

  void add(std::string_view key, std::string_view value);

  bool contains(std::string_view key) const;

  // The last value given for key.
  std::optional<std::string_view> value(std::string_view key) const;

  // Every value given for key, comma lists expanded.
  std::vector<std::string_view> values(std::string_view key) const;

  // The distinct ids x for which some key "prefix.x.*" exists, in
  // order. With a suffix, only those where "prefix.x.suffix" exists.
  std::vector<std::string> sub_keys(std::string_view prefix,
                                    std::string_view suffix = {}) const;

  template <typename T>
  std::optional<T> property(std::string_view key);

  template <typename T>
  std::optional<T> property_require(std::string_view key);

  template <typename T>
  T property_or_default(std::string_view key, std::string_view dflt);

  template <typename T>
  std::vector<T> properties(std::string_view key);

  void new_parse_error(std::string_view key, std::string message);
  void new_build_error(std::string_view key, std::string message);
  void new_parse_warning(std::string_view key, std::string message);

  std::vector<Error> const& errors() const { return errors_; }
  bool                      has_errors() const;

  using entries_t = std::multimap<std::string, std::string, std::less<>>;

  entries_t const& entries() const { return entries_; }

private:
  entries_t          entries_;
  std::vector<Error> errors_;
};

template <typename T>
std::optional<T> Config::property(std::string_view key)
{
  auto const v = value(key);
  if (!v)
    return {};
  T           out{};
  std::string msg;
  if (!parse_value(*v, out, msg)) {
    new_parse_error(key, fmt::format("invalid value \"{}\": {}", *v, msg));
    return {};
  }
  return out;
}

template <typename T>
std::optional<T> Config::property_require(std::string_view key)
{
  if (!contains(key)) {
    new_parse_error(key, "missing required property");
    return {};
  }
  return property<T>(key);
}

template <typename T>
T Config::property_or_default(std::string_view key, std::string_view dflt)
{
  if (auto val = property<T>(key))
    return *val;
  T           out{};
  std::string msg;
  if (!parse_value(dflt, out, msg)) {
    new_build_error(key, fmt::format("bad default \"{}\": {}", dflt, msg));
  }
  return out;
}

template <typename T>
std::vector<T> Config::properties(std::string_view key)
{
  std::vector<T> ret;
  for (auto const v : values(key)) {
    T           out{};
    std::string msg;
    if (parse_value(v, out, msg)) {
      ret.push_back(std::move(out));
    }
    else {
      new_parse_error(key, fmt::format("invalid value \"{}\": {}", v, msg));
    }
  }
  return ret;
}

#endif // CONFIG_DOT_HPP
