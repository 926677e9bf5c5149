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

#include "upc_checker/text/code_reader.hpp"

#include <cctype>
#include <vector>

namespace upc_checker
{
namespace text
{

static inline std::string trim(const std::string & s)
{
  size_t i = 0, j = s.size();
  while (i < j && std::isspace(static_cast<unsigned char>(s[i]))) {++i;}
  while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) {--j;}
  return s.substr(i, j - i);
}

ReadResult tryReadCode(
  const std::string & text, const ReadOptions & options,
  checksum::UpcCode & code)
{
  const std::string s = trim(text);
  if (s.empty()) {
    return ReadResult::EMPTY_INPUT;
  }

  std::vector<int> digits;
  digits.reserve(s.size());
  for (char c : s) {
    if (std::isdigit(static_cast<unsigned char>(c))) {
      digits.push_back(c - '0');
    } else if (options.separators.find(c) == std::string::npos) {
      return ReadResult::INVALID_CHARACTER;
    }
  }

  // Payload plus one check digit
  const size_t payload_len = checksum::payload_length(options.standard);
  if (digits.size() != payload_len + 1) {
    return ReadResult::INVALID_LENGTH;
  }

  switch (options.standard) {
    case checksum::Standard::UPC_A: {
        checksum::UpcA payload{};
        for (size_t i = 0; i < payload_len; ++i) {
          payload.digits[i] = digits[i];
        }
        code = checksum::UpcCode(payload, digits.back());
        break;
      }
  }

  return ReadResult::SUCCESS;
}

const char * to_string(ReadResult result)
{
  switch (result) {
    case ReadResult::SUCCESS: return "success";
    case ReadResult::EMPTY_INPUT: return "empty input";
    case ReadResult::INVALID_CHARACTER: return "invalid character";
    case ReadResult::INVALID_LENGTH: return "invalid length";
  }
  return "unknown";
}

} // namespace text
} // namespace upc_checker
