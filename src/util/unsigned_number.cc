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

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>


namespace Util {

std::uint64_t to_unsigned_number(const std::string& option_name, const std::string& value)
{
    const bool only_digits = !value.empty() && boost::algorithm::all(value, boost::algorithm::is_digit());
    if (!only_digits)
    {
        throw InvalidUnsignedNumber{option_name + " value has to be an unsigned decimal number"};
    }
    try
    {
        return boost::lexical_cast<std::uint64_t>(value);
    }
    catch (const boost::bad_lexical_cast&)
    {
        throw InvalidUnsignedNumber{option_name + " value out of range"};
    }
}

}//namespace Util
