/*
 * Copyright (c) 2024 UPC Checker Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "upc_checker/config/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace upc_checker
{
namespace config
{

static inline std::string trim(const std::string & s)
{
  size_t i = 0, j = s.size();
  while (i < j && std::isspace(static_cast<unsigned char>(s[i]))) {++i;}
  while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) {--j;}
  return s.substr(i, j - i);
}

// A '#' inside a quoted value is kept
static inline std::string strip_inline_comment(const std::string & s)
{
  char quote = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (quote) {
      if (c == quote) {quote = 0;}
    } else if (c == '"' || c == '\'') {
      quote = c;
    } else if (c == '#') {
      return s.substr(0, i);
    }
  }
  return s;
}

static inline bool ieq(const std::string & a, const std::string & b)
{
  if (a.size() != b.size()) {return false;}
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
      std::tolower(static_cast<unsigned char>(b[i]))) {return false;}
  }
  return true;
}

static inline bool lookup_standard(const std::string & name, checksum::Standard & out)
{
  if (ieq(name, checksum::to_string(checksum::Standard::UPC_A)) || ieq(name, "upc-a")) {
    out = checksum::Standard::UPC_A;
    return true;
  }
  return false;
}

checksum::Standard Config::barcode_standard() const
{
  checksum::Standard parsed;
  if (!lookup_standard(standard, parsed)) {
    throw std::runtime_error("unsupported standard: " + standard);
  }
  return parsed;
}

text::ReadOptions Config::reader_options() const
{
  text::ReadOptions opts;
  opts.separators = separators;
  opts.standard = barcode_standard();
  return opts;
}

void Config::validate() const
{
  checksum::Standard parsed;
  if (!lookup_standard(standard, parsed)) {
    throw std::runtime_error("unsupported standard: " + standard);
  }

  auto is_digit = [](char c) {return std::isdigit(static_cast<unsigned char>(c)) != 0;};
  if (std::any_of(separators.begin(), separators.end(), is_digit)) {
    throw std::runtime_error("separators must not contain digits");
  }

  if (!ieq(log_level, "debug") && !ieq(log_level, "info") &&
    !ieq(log_level, "warn") && !ieq(log_level, "error"))
  {
    throw std::runtime_error("invalid log_level: " + log_level);
  }
}

static inline bool parse_kv_scalar(const std::string & line, std::string & key, std::string & value)
{
  auto s = strip_inline_comment(line);
  auto pos = s.find(':');
  if (pos == std::string::npos) {return false;}
  key = trim(s.substr(0, pos));
  value = trim(s.substr(pos + 1));
  return !key.empty();
}

static inline bool to_bool(const std::string & v)
{
  if (ieq(v, "true") || v == "1") {return true;}
  if (ieq(v, "false") || v == "0") {return false;}
  throw std::runtime_error("invalid bool for: " + v);
}

static inline std::string unquote(std::string v)
{
  if (!v.empty() && (v.front() == '"' || v.front() == '\'')) {
    if (v.size() >= 2 && v.back() == v.front()) {v = v.substr(1, v.size() - 2);}
  }
  return v;
}

Config parse_from_yaml_string(const std::string & yaml)
{
  Config cfg;

  enum class Sect { NONE, ROOT };
  Sect sect = Sect::NONE;

  std::stringstream in(yaml);
  std::string line;
  while (std::getline(in, line)) {
    line = strip_inline_comment(line);
    line = trim(line);
    if (line.empty()) {continue;}

    if (line == "upc_checker:") {sect = Sect::ROOT; continue;}

    std::string key, value;
    if (!parse_kv_scalar(line, key, value)) {continue;}

    // Keys before the upc_checker: header are ignored
    if (sect != Sect::ROOT) {continue;}

    if (key == "standard") {
      cfg.standard = unquote(value);
    } else if (key == "separators") {
      cfg.separators = unquote(value);
    } else if (key == "quiet") {
      cfg.quiet = to_bool(value);
    } else if (key == "log_level") {
      cfg.log_level = unquote(value);
    }
  }

  cfg.validate();
  return cfg;
}

Config parse_from_yaml_file(const std::string & path)
{
  std::ifstream in(path);
  if (!in) {throw std::runtime_error("failed to open YAML: " + path);}
  std::stringstream ss; ss << in.rdbuf();
  return parse_from_yaml_string(ss.str());
}

} // namespace config
} // namespace upc_checker
