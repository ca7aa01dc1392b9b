/*
 * Copyright (C) 2017-2026  CZ.NIC, z. s. p. o.
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

#include "src/time_unit.hh"

#include <iomanip>
#include <iostream>
#include <sstream>


namespace TimeUnit {

Uptime get_uptime()
{
    return Uptime{std::chrono::steady_clock::now().time_since_epoch()};
}

std::ostream& operator<<(std::ostream& out, const Uptime& uptime)
{
    static constexpr auto units_per_second = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds{1}).count();
    const auto t = uptime.as<std::chrono::milliseconds>().count();
    std::ostringstream o;
    o << (t / units_per_second) << "."
      << std::setw(3) << std::setfill('0') << std::right << (t % units_per_second) << "s";
    return out << o.str();
}

}//namespace TimeUnit
