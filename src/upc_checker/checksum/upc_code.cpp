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

#include "upc_checker/checksum/upc_code.hpp"

#include "mod10.hpp"

namespace upc_checker
{
namespace checksum
{

UpcCode::UpcCode()
: standard_(Standard::UPC_A), digits_(UPC_A_PAYLOAD_LENGTH, 0), check_digit_(0)
{
}

UpcCode::UpcCode(const UpcA & payload, int check_digit)
: standard_(Standard::UPC_A),
  digits_(payload.digits.begin(), payload.digits.end()),
  check_digit_(check_digit)
{
}

bool is_single_digit(int value)
{
  return value >= 0 && value <= MAX_DIGIT;
}

size_t payload_length(Standard standard)
{
  switch (standard) {
    case Standard::UPC_A: return UPC_A_PAYLOAD_LENGTH;
  }
  return 0;
}

const char * to_string(Standard standard)
{
  switch (standard) {
    case Standard::UPC_A: return "upc_a";
  }
  return "unknown";
}

const char * to_string(ErrorCode code)
{
  switch (code) {
    case ErrorCode::OK: return "ok";
    case ErrorCode::SEQUENCE_OVERFLOW: return "sequence overflow";
    case ErrorCode::CHECK_DIGIT_OVERFLOW: return "check-digit overflow";
  }
  return "unknown";
}

ErrorCode validate(const UpcCode & code, bool & is_valid)
{
  const DigitSpan payload = code.payload();
  for (size_t i = 0; i < payload.size; ++i) {
    if (!is_single_digit(payload.data[i])) {
      return ErrorCode::SEQUENCE_OVERFLOW;
    }
  }

  if (!is_single_digit(code.check_digit())) {
    return ErrorCode::CHECK_DIGIT_OVERFLOW;
  }

  Mod10 mod10;
  mod10.update(payload);
  is_valid = mod10.finalize() == code.check_digit();
  return ErrorCode::OK;
}

} // namespace checksum
} // namespace upc_checker
