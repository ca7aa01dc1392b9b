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

#ifndef HOST_IP_KEY_HH_E7FF77A9B578787179DE6013CD4B1CA7//date "+%s"|md5sum|tr "[a-f]" "[A-F]"
#define HOST_IP_KEY_HH_E7FF77A9B578787179DE6013CD4B1CA7

#include "src/lookup_cache/address.hh"

#include <iosfwd>
#include <string>


namespace LookupCache {

class HostIpKey
{
public:
    HostIpKey(std::string hostname, Family family);
    const std::string& get_hostname() const noexcept;
    Family get_family() const noexcept;
private:
    std::string hostname_;
    Family family_;
    friend bool operator==(const HostIpKey& lhs, const HostIpKey& rhs);
    friend bool operator!=(const HostIpKey& lhs, const HostIpKey& rhs);
    friend bool operator<(const HostIpKey& lhs, const HostIpKey& rhs);
};

HostIpKey make_key(const std::string& hostname, Family family);

std::ostream& operator<<(std::ostream& out, const HostIpKey& key);

}//namespace LookupCache

#endif//HOST_IP_KEY_HH_E7FF77A9B578787179DE6013CD4B1CA7
