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

#include "mod10.hpp"

namespace upc_checker
{
namespace checksum
{

Mod10::Mod10()
: sum_(0), count_(0)
{
}

void Mod10::reset()
{
  sum_ = 0;
  count_ = 0;
}

void Mod10::update(int digit)
{
  // count_ is the 0-based index, so even indices are the odd 1-indexed positions
  const uint32_t weight = (count_ % 2 == 0) ? ODD_WEIGHT : EVEN_WEIGHT;
  sum_ += weight * static_cast<uint32_t>(digit);
  ++count_;
}

void Mod10::update(DigitSpan digits)
{
  for (size_t i = 0; i < digits.size; ++i) {
    update(digits.data[i]);
  }
}

uint8_t Mod10::finalize() const
{
  return static_cast<uint8_t>((10 - (sum_ % 10)) % 10);
}

size_t Mod10::count() const
{
  return count_;
}

} // namespace checksum
} // namespace upc_checker
