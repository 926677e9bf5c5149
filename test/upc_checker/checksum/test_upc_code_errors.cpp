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
#include "upc_checker/checksum/upc_code.hpp"

using namespace upc_checker::checksum;

// Test fixture for malformed input
class UpcCodeErrorTest : public ::testing::Test
{
protected:
  UpcA payload_;
  bool is_valid_ = false;

  void SetUp() override
  {
    payload_ = UpcA{{9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9}};
    // 3 * 54 + 45 = 207, so 3 is the matching check digit
    bool valid = false;
    ASSERT_EQ(validate(UpcCode(payload_, 3), valid), ErrorCode::OK);
    ASSERT_TRUE(valid);
  }
};

TEST_F(UpcCodeErrorTest, PayloadDigitTooLarge) {
  payload_.digits[5] = 12;

  is_valid_ = true;
  ErrorCode err = validate(UpcCode(payload_, 7), is_valid_);

  ASSERT_EQ(err, ErrorCode::SEQUENCE_OVERFLOW);
  // No boolean is produced on error
  EXPECT_TRUE(is_valid_);
}

TEST_F(UpcCodeErrorTest, PayloadDigitTen) {
  payload_.digits[0] = 10;

  ASSERT_EQ(validate(UpcCode(payload_, 3), is_valid_), ErrorCode::SEQUENCE_OVERFLOW);
}

TEST_F(UpcCodeErrorTest, PayloadDigitNegative) {
  payload_.digits[10] = -1;

  ASSERT_EQ(validate(UpcCode(payload_, 3), is_valid_), ErrorCode::SEQUENCE_OVERFLOW);
}

TEST_F(UpcCodeErrorTest, CheckDigitTooLarge) {
  is_valid_ = true;
  ErrorCode err = validate(UpcCode(payload_, 70), is_valid_);

  ASSERT_EQ(err, ErrorCode::CHECK_DIGIT_OVERFLOW);
  EXPECT_TRUE(is_valid_);
}

TEST_F(UpcCodeErrorTest, CheckDigitTen) {
  ASSERT_EQ(validate(UpcCode(payload_, 10), is_valid_), ErrorCode::CHECK_DIGIT_OVERFLOW);
}

TEST_F(UpcCodeErrorTest, CheckDigitNegative) {
  ASSERT_EQ(validate(UpcCode(payload_, -3), is_valid_), ErrorCode::CHECK_DIGIT_OVERFLOW);
}

TEST_F(UpcCodeErrorTest, PayloadOverflowReportedFirst) {
  payload_.digits[3] = 42;

  ASSERT_EQ(validate(UpcCode(payload_, 42), is_valid_), ErrorCode::SEQUENCE_OVERFLOW);
}

int main(int argc, char ** argv)
{
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
