#include "Config.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>
#include <system_error>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <glog/logging.h>

#include <tao/pegtl.hpp>

using namespace tao::pegtl;

namespace {

template <typename U>
bool parse_unsigned(std::string_view value, U& out, std::string& msg)
{
  value = boost::algorithm::trim_copy(value);
  if (value.empty()) {
    msg = "empty number";
    return false;
  }
  auto const [ptr, ec]
      = std::from_chars(value.data(), value.data() + value.size(), out);
  if (ec == std::errc::result_out_of_range) {
    msg = "number out of range";
    return false;
  }
  if (ec != std::errc{} || ptr != value.data() + value.size()) {
    msg = "not a number";
    return false;
  }
  return true;
}

} // namespace

std::string_view unquote(std::string_view value)
{
  if (value.length() >= 2) {
    auto const q = value.front();
    if ((q == '"' || q == '\'') && value.back() == q)
      return value.substr(1, value.length() - 2);
  }
  return value;
}

bool parse_value(std::string_view value, bool& out, std::string& msg)
{
  auto const v
      = boost::algorithm::to_lower_copy(std::string(unquote(value)));
  if (v == "true" || v == "yes" || v == "on") {
    out = true;
    return true;
  }
  if (v == "false" || v == "no" || v == "off") {
    out = false;
    return true;
  }
  msg = "expected true or false";
  return false;
}

bool parse_value(std::string_view value, std::uint64_t& out, std::string& msg)
{
  return parse_unsigned(unquote(value), out, msg);
}

bool parse_value(std::string_view value, std::uint32_t& out, std::string& msg)
{
  return parse_unsigned(unquote(value), out, msg);
}

bool parse_value(std::string_view value, std::uint16_t& out, std::string& msg)
{
  return parse_unsigned(unquote(value), out, msg);
}

bool parse_value(std::string_view value, std::string& out, std::string& msg)
{
  out = std::string(unquote(value));
  return true;
}

bool parse_value(std::string_view           value,
                 std::chrono::milliseconds& out,
                 std::string&               msg)
{
  value = unquote(value);
  auto       pos = value.find_first_not_of("0123456789");
  auto const num = value.substr(0, pos);
  auto const unit
      = pos == std::string_view::npos ? std::string_view{} : value.substr(pos);

  std::uint64_t n{};
  if (!parse_unsigned(num, n, msg))
    return false;

  using namespace std::chrono;
  if (unit == "ms") {
    out = milliseconds(n);
  }
  else if (unit.empty() || unit == "s") {
    out = duration_cast<milliseconds>(seconds(n));
  }
  else if (unit == "m") {
    out = duration_cast<milliseconds>(minutes(n));
  }
  else if (unit == "h") {
    out = duration_cast<milliseconds>(hours(n));
  }
  else if (unit == "d") {
    out = duration_cast<milliseconds>(hours(24 * n));
  }
  else {
    msg = fmt::format("unknown duration unit \"{}\"", unit);
    return false;
  }
  return true;
}

namespace ConfigFile {

struct state {
  Config&          cfg;
  std::string_view source;
  std::string      key;
};

struct ws : star<blank> {};

struct comment : seq<one<'#'>, star<not_one<'\n'>>> {};

struct key : plus<sor<alnum, one<'_', '.', '-', ':', '[', ']', '/'>>> {};

struct value : star<not_one<'\r', '\n'>> {};

struct entry : seq<key, ws, one<'='>, ws, value> {};

struct good_line : seq<ws, opt<sor<comment, entry>>, ws, eolf> {};

struct bad_line : seq<star<not_one<'\n'>>, eolf> {};

struct line : sor<good_line, bad_line> {};

struct file : until<eof, line> {};

template <typename Rule>
struct action : nothing<Rule> {};

template <>
struct action<key> {
  template <typename Input>
  static void apply(Input const& in, state& st)
  {
    st.key = in.string();
  }
};

template <>
struct action<value> {
  template <typename Input>
  static void apply(Input const& in, state& st)
  {
    st.cfg.add(st.key, boost::algorithm::trim_copy(in.string()));
  }
};

template <>
struct action<bad_line> {
  template <typename Input>
  static void apply(Input const& in, state& st)
  {
    auto const pos = in.position();
    auto       txt = boost::algorithm::trim_copy(in.string());
    st.cfg.new_parse_error(fmt::format("{}:{}", st.source, pos.line),
                           fmt::format("can't parse \"{}\"", txt));
  }
};

} // namespace ConfigFile

void Config::parse(std::string_view text, std::string_view source)
{
  ConfigFile::state st{*this, source, {}};
  memory_input<>    in{text.data(), text.size(), std::string(source)};
  if (!tao::pegtl::parse<ConfigFile::file, ConfigFile::action>(in, st)) {
    new_parse_error(source, "unparsable configuration");
  }
}

void Config::load(fs::path const& path)
{
  std::ifstream ifs(path, std::ios::in | std::ios::binary);
  if (!ifs.is_open()) {
    throw std::system_error(errno, std::generic_category(),
                            "can't open " + path.string());
  }
  std::string const text{std::istreambuf_iterator<char>(ifs),
                         std::istreambuf_iterator<char>()};
  if (ifs.bad()) {
    throw std::system_error(errno, std::generic_category(),
                            "can't read " + path.string());
  }
  parse(text, path.string());
}

void Config::add(std::string_view key, std::string_view value)
{
  entries_.emplace(std::string(key), std::string(value));
}

bool Config::contains(std::string_view key) const
{
  return entries_.find(key) != entries_.end();
}

std::optional<std::string_view> Config::value(std::string_view key) const
{
  auto [first, last] = entries_.equal_range(key);
  if (first == last)
    return {};
  return std::string_view(std::prev(last)->second);
}

std::vector<std::string_view> Config::values(std::string_view key) const
{
  std::vector<std::string_view> ret;
  auto [first, last] = entries_.equal_range(key);
  for (auto it = first; it != last; ++it) {
    std::string_view v{it->second};

    // Split on commas that aren't inside quotes.
    char        quote = '\0';
    std::size_t start = 0;
    for (std::size_t i = 0; i <= v.length(); ++i) {
      if (i < v.length()) {
        auto const c = v[i];
        if (quote) {
          if (c == quote)
            quote = '\0';
          continue;
        }
        if (c == '"' || c == '\'') {
          quote = c;
          continue;
        }
        if (c != ',')
          continue;
      }
      auto item = boost::algorithm::trim_copy(v.substr(start, i - start));
      if (!item.empty())
        ret.push_back(item);
      start = i + 1;
    }
  }
  return ret;
}

std::vector<std::string> Config::sub_keys(std::string_view prefix,
                                          std::string_view suffix) const
{
  std::vector<std::string> ret;

  auto const full_prefix = fmt::format("{}.", prefix);
  for (auto it = entries_.lower_bound(full_prefix); it != entries_.end();
       ++it) {
    std::string_view k{it->first};
    if (k.substr(0, full_prefix.length()) != full_prefix)
      break;
    k.remove_prefix(full_prefix.length());
    auto const dot = k.find('.');
    auto const id  = k.substr(0, dot);
    if (id.empty())
      continue;
    if (std::find(ret.begin(), ret.end(), id) != ret.end())
      continue;
    if (!suffix.empty()
        && !contains(fmt::format("{}{}.{}", full_prefix, id, suffix)))
      continue;
    ret.emplace_back(id);
  }
  return ret;
}

void Config::new_parse_error(std::string_view key, std::string message)
{
  LOG(WARNING) << "config " << key << ": " << message;
  errors_.push_back(
      Error{std::string(key), error_kind::parse, std::move(message)});
}

void Config::new_build_error(std::string_view key, std::string message)
{
  LOG(WARNING) << "config " << key << ": " << message;
  errors_.push_back(
      Error{std::string(key), error_kind::build, std::move(message)});
}

void Config::new_parse_warning(std::string_view key, std::string message)
{
  LOG(INFO) << "config " << key << ": " << message;
  errors_.push_back(
      Error{std::string(key), error_kind::warning, std::move(message)});
}

bool Config::has_errors() const
{
  for (auto const& err : errors_) {
    if (err.kind != error_kind::warning)
      return true;
  }
  return false;
}
