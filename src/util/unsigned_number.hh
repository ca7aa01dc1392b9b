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

#ifndef UNSIGNED_NUMBER_HH_3B0FA31E3B43EBF1A16D6B7C4BD81165//date "+%s"|md5sum|tr "[a-f]" "[A-F]"
#define UNSIGNED_NUMBER_HH_3B0FA31E3B43EBF1A16D6B7C4BD81165

#include <cstdint>
#include <stdexcept>
#include <string>


namespace Util {

struct InvalidUnsignedNumber : std::invalid_argument
{
    using std::invalid_argument::invalid_argument;
};

//decimal digits only, a sign is rejected instead of being wrapped around
std::uint64_t to_unsigned_number(const std::string& option_name, const std::string& value);

}//namespace Util

#endif//UNSIGNED_NUMBER_HH_3B0FA31E3B43EBF1A16D6B7C4BD81165
