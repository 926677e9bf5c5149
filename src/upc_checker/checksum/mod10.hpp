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

#pragma once

#include <cstdint>
#include <cstddef>

#include "upc_checker/checksum/upc_code.hpp"

namespace upc_checker
{
namespace checksum
{

/**
 * UPC modulo-10 weighted checksum
 *
 * Specifications:
 * - Weights: 3 on odd positions, 1 on even positions (1-indexed)
 * - Check digit: (10 - (sum mod 10)) mod 10
 *
 * Test vector: 03600024145 -> 7
 *
 * Digits fed to update() must already be in 0..9.
 */

class Mod10
{
public:
  static constexpr uint32_t ODD_WEIGHT = 3;
  static constexpr uint32_t EVEN_WEIGHT = 1;

  Mod10();

  void reset();
  void update(int digit);
  void update(DigitSpan digits);
  uint8_t finalize() const;
  size_t count() const;

private:
  uint32_t sum_;
  size_t count_;
};

} // namespace checksum
} // namespace upc_checker
