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

#ifndef UPC_CHECKER__CHECKSUM__UPC_CODE_HPP_
#define UPC_CHECKER__CHECKSUM__UPC_CODE_HPP_

#pragma once

#include <array>
#include <vector>

#include <cstddef>
#include <cstdint>

namespace upc_checker
{
namespace checksum
{

// Largest value a single decimal digit can hold
static constexpr int MAX_DIGIT = 9;

// Number of payload digits in a UPC-A code (check digit excluded)
static constexpr size_t UPC_A_PAYLOAD_LENGTH = 11;

// Barcode standards understood by the validator
enum class Standard : uint8_t
{
  UPC_A = 0
};

// Validation error codes
enum class ErrorCode : uint8_t
{
  OK = 0,
  SEQUENCE_OVERFLOW = 1,        // Payload digit outside 0..9
  CHECK_DIGIT_OVERFLOW = 2      // Check digit outside 0..9
};

// UPC-A payload, 11 digits without the check digit
struct UpcA
{
  std::array<int, UPC_A_PAYLOAD_LENGTH> digits;
};

// Read-only view over a run of digits
struct DigitSpan
{
  const int * data;
  size_t size;

  DigitSpan(const int * d, size_t s)
  : data(d), size(s) {}
};

/**
 * @brief A barcode payload paired with its claimed check digit
 *
 * The record is tagged with the standard it was built from. Digits are stored
 * as given; range checking happens in validate() so malformed input is
 * reported instead of being coerced at construction.
 */
class UpcCode
{
public:
  /**
   * @brief Construct an all-zero UPC-A code with check digit 0
   */
  UpcCode();

  /**
   * @brief Construct a UPC-A record
   *
   * @param payload The 11 payload digits
   * @param check_digit The claimed check digit
   */
  UpcCode(const UpcA & payload, int check_digit);

  Standard standard() const {return standard_;}
  DigitSpan payload() const {return DigitSpan(digits_.data(), digits_.size());}
  int check_digit() const {return check_digit_;}

private:
  Standard standard_;
  std::vector<int> digits_;
  int check_digit_;
};

/**
 * @brief Check a code against its check digit with the modulo-10 checksum
 *
 * @param code Record to check
 * @param is_valid Set to whether the check digit matches; only written when
 *                 ErrorCode::OK is returned
 * @return ErrorCode::OK, or the error naming the operand out of range.
 *         A payload overflow is reported before a check digit overflow.
 */
ErrorCode validate(const UpcCode & code, bool & is_valid);

// Helper functions
bool is_single_digit(int value);
size_t payload_length(Standard standard);
const char * to_string(Standard standard);
const char * to_string(ErrorCode code);

} // namespace checksum
} // namespace upc_checker

#endif  // UPC_CHECKER__CHECKSUM__UPC_CODE_HPP_
