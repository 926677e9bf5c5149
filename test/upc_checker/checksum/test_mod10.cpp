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

#include <gtest/gtest.h>
#include "upc_checker/checksum/mod10.hpp"
#include <vector>

using upc_checker::checksum::DigitSpan;
using upc_checker::checksum::Mod10;

class Mod10Test : public ::testing::Test
{
protected:
  const std::vector<int> sample_ = {0, 3, 6, 0, 0, 0, 2, 4, 1, 4, 5};
};

TEST_F(Mod10Test, TestVector03600024145) {
  // Odd positions 0+6+0+2+1+5 = 14, x3 = 42; even positions 3+0+0+4+4 = 11
  Mod10 mod10;
  mod10.update(DigitSpan(sample_.data(), sample_.size()));
  EXPECT_EQ(mod10.finalize(), 7);
  EXPECT_EQ(mod10.count(), 11u);
}

TEST_F(Mod10Test, EmptyInputWrapsToZero) {
  Mod10 mod10;
  EXPECT_EQ(mod10.finalize(), 0);
  EXPECT_EQ(mod10.count(), 0u);
}

TEST_F(Mod10Test, FirstDigitWeightedByThree) {
  Mod10 mod10;
  mod10.update(1);
  // sum 3 -> 10 - 3
  EXPECT_EQ(mod10.finalize(), 7);

  mod10.update(1);
  // sum 4 -> 10 - 4
  EXPECT_EQ(mod10.finalize(), 6);
}

TEST_F(Mod10Test, SumMultipleOfTenGivesZero) {
  std::vector<int> digits = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 0};
  Mod10 mod10;
  mod10.update(DigitSpan(digits.data(), digits.size()));
  // 3 * 20 + 25 = 85
  EXPECT_EQ(mod10.finalize(), 5);

  std::vector<int> zeros(11, 0);
  mod10.reset();
  mod10.update(DigitSpan(zeros.data(), zeros.size()));
  EXPECT_EQ(mod10.finalize(), 0);
}

TEST_F(Mod10Test, IncrementalUpdate) {
  // Digit by digit produces the same result as one span
  Mod10 mod10;
  for (int d : sample_) {
    mod10.update(d);
  }
  EXPECT_EQ(mod10.finalize(), 7);
}

TEST_F(Mod10Test, ResetFunctionality) {
  Mod10 mod10;
  mod10.update(9);
  mod10.update(9);

  mod10.reset();
  EXPECT_EQ(mod10.finalize(), 0);
  EXPECT_EQ(mod10.count(), 0u);
}

int main(int argc, char ** argv)
{
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
