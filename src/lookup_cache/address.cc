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

#include "src/lookup_cache/address.hh"

#include <iostream>


namespace LookupCache {

std::ostream& operator<<(std::ostream& out, Family family)
{
    return out << to_ip_version(family);
}

ResolvedAddress make_resolved_address(const RawAddress& raw, Family family, TimeUnit::Uptime now)
{
    return ResolvedAddress{raw.address, raw.ttl, family, now + raw.ttl.get()};
}

bool is_expired(const ResolvedAddress& address, TimeUnit::Uptime now) noexcept
{
    return address.expires_at < now;
}

}//namespace LookupCache
