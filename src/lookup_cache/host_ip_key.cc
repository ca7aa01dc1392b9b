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

#include "src/lookup_cache/host_ip_key.hh"

#include <iostream>
#include <tuple>
#include <utility>


namespace LookupCache {

HostIpKey::HostIpKey(std::string hostname, Family family)
    : hostname_{std::move(hostname)},
      family_{family}
{ }

const std::string& HostIpKey::get_hostname() const noexcept
{
    return hostname_;
}

Family HostIpKey::get_family() const noexcept
{
    return family_;
}

bool operator==(const HostIpKey& lhs, const HostIpKey& rhs)
{
    return (lhs.family_ == rhs.family_) && (lhs.hostname_ == rhs.hostname_);
}

bool operator!=(const HostIpKey& lhs, const HostIpKey& rhs)
{
    return !(lhs == rhs);
}

bool operator<(const HostIpKey& lhs, const HostIpKey& rhs)
{
    return std::tie(lhs.hostname_, lhs.family_) < std::tie(rhs.hostname_, rhs.family_);
}

HostIpKey make_key(const std::string& hostname, Family family)
{
    return HostIpKey{hostname, family};
}

std::ostream& operator<<(std::ostream& out, const HostIpKey& key)
{
    return out << key.get_hostname() << "_" << key.get_family();
}

}//namespace LookupCache
