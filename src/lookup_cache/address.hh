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

#ifndef ADDRESS_HH_D37C563D6952CFEF54787A04ABC40C28//date "+%s"|md5sum|tr "[a-f]" "[A-F]"
#define ADDRESS_HH_D37C563D6952CFEF54787A04ABC40C28

#include "src/time_unit.hh"

#include <boost/asio/ip/address.hpp>

#include <iosfwd>
#include <vector>


namespace LookupCache {

enum class Family
{
    ipv4 = 4,
    ipv6 = 6
};

constexpr int to_ip_version(Family family) noexcept
{
    return static_cast<int>(family);
}

std::ostream& operator<<(std::ostream& out, Family family);

using Ttl = TimeUnit::Seconds<struct TtlTag_>;

//one record as delivered by the upstream resolver
struct RawAddress
{
    boost::asio::ip::address address;
    Ttl ttl;
};

using RawAddresses = std::vector<RawAddress>;

struct ResolvedAddress
{
    boost::asio::ip::address address;
    Ttl ttl;
    Family family;
    TimeUnit::Uptime expires_at;
};

using ResolvedAddresses = std::vector<ResolvedAddress>;

ResolvedAddress make_resolved_address(const RawAddress& raw, Family family, TimeUnit::Uptime now);

bool is_expired(const ResolvedAddress& address, TimeUnit::Uptime now) noexcept;

}//namespace LookupCache

#endif//ADDRESS_HH_D37C563D6952CFEF54787A04ABC40C28
