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

#ifndef UPC_CHECKER__TEXT__CODE_READER_HPP_
#define UPC_CHECKER__TEXT__CODE_READER_HPP_

#pragma once

#include <string>

#include "upc_checker/checksum/upc_code.hpp"

namespace upc_checker
{
namespace text
{

// Read result
enum class ReadResult
{
  SUCCESS,
  EMPTY_INPUT,
  INVALID_CHARACTER,
  INVALID_LENGTH
};

struct ReadOptions
{
  // Characters skipped between digits, e.g. "0 36000 24145 7"
  std::string separators = " -";
  checksum::Standard standard = checksum::Standard::UPC_A;
};

/**
 * @brief Read a printed code (payload digits followed by the check digit)
 *
 * @param text Printed code, surrounding whitespace is ignored
 * @param options Separator set and expected standard
 * @param code Receives the record on ReadResult::SUCCESS, untouched otherwise
 * @return ReadResult
 */
ReadResult tryReadCode(
  const std::string & text, const ReadOptions & options,
  checksum::UpcCode & code);

const char * to_string(ReadResult result);

} // namespace text
} // namespace upc_checker

#endif  // UPC_CHECKER__TEXT__CODE_READER_HPP_
