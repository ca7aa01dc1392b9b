/*
 * Copyright (C) 2026  CZ.NIC, z. s. p. o.
 *
 * This file is part of FRED.
 *
 * FRED is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * FRED is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with FRED.  If not, see <https://www.gnu.org/licenses/>.
 */

#include "src/util/unsigned_number.hh"

#include <gtest/gtest.h>

#include <string>

namespace {

TEST(UnsignedNumber, decimal_digits_are_accepted)
{
    EXPECT_EQ(Util::to_unsigned_number("repeat", "0"), 0u);
    EXPECT_EQ(Util::to_unsigned_number("repeat", "3"), 3u);
    EXPECT_EQ(Util::to_unsigned_number("interval", "18446744073709551615"), 18446744073709551615u);
}

TEST(UnsignedNumber, negative_value_is_rejected)
{
    EXPECT_THROW(Util::to_unsigned_number("repeat", "-1"), Util::InvalidUnsignedNumber);
    EXPECT_THROW(Util::to_unsigned_number("timeout", "-0"), Util::InvalidUnsignedNumber);
}

TEST(UnsignedNumber, malformed_value_is_rejected)
{
    EXPECT_THROW(Util::to_unsigned_number("repeat", ""), Util::InvalidUnsignedNumber);
    EXPECT_THROW(Util::to_unsigned_number("repeat", "+1"), Util::InvalidUnsignedNumber);
    EXPECT_THROW(Util::to_unsigned_number("repeat", " 1"), Util::InvalidUnsignedNumber);
    EXPECT_THROW(Util::to_unsigned_number("repeat", "1s"), Util::InvalidUnsignedNumber);
    EXPECT_THROW(Util::to_unsigned_number("interval", "18446744073709551616"), Util::InvalidUnsignedNumber);
}

TEST(UnsignedNumber, message_names_option)
{
    try
    {
        Util::to_unsigned_number("repeat", "-1");
        ADD_FAILURE() << "InvalidUnsignedNumber expected";
    }
    catch (const Util::InvalidUnsignedNumber& e)
    {
        EXPECT_EQ(std::string{e.what()}, "repeat value has to be an unsigned decimal number");
    }
}

}//namespace {anonymous}
