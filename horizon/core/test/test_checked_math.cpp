// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <horizon/core/checked_math.hpp>
#include <horizon/core/int.hpp>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

using namespace horizon;
using namespace intx::literals;

TEST(CheckedMath, add)
{
    EXPECT_EQ(checked_add(1, 2).value(), 3);
    auto const res = checked_add(UINT256_MAX, 1);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MathError::Overflow);
}

TEST(CheckedMath, sub)
{
    EXPECT_EQ(checked_sub(5, 2).value(), 3);
    auto const res = checked_sub(2, 5);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MathError::Underflow);
}

TEST(CheckedMath, mul)
{
    EXPECT_EQ(checked_mul(7, 6).value(), 42);
    auto const res = checked_mul(UINT256_MAX, 2);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MathError::Overflow);
}

TEST(CheckedMath, div)
{
    EXPECT_EQ(checked_div(7, 2).value(), 3);
    auto const res = checked_div(7, 0);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MathError::DivisionByZero);
}

TEST(CheckedMath, mul_div_wide_intermediate)
{
    // the product overflows 256 bits but the quotient fits
    auto const res = checked_mul_div(UINT256_MAX, 4, 8);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value(), UINT256_MAX / 2);

    EXPECT_EQ(checked_mul_div(10, 3, 4).value(), 7);

    auto const overflow = checked_mul_div(UINT256_MAX, 4, 2);
    ASSERT_TRUE(overflow.has_error());
    EXPECT_EQ(overflow.assume_error(), MathError::Overflow);

    auto const div0 = checked_mul_div(1, 1, 0);
    ASSERT_TRUE(div0.has_error());
    EXPECT_EQ(div0.assume_error(), MathError::DivisionByZero);
}
