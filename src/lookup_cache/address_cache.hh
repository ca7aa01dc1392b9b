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

#ifndef ADDRESS_CACHE_HH_D1CA116F03886F914A987A36908771A8//date "+%s"|md5sum|tr "[a-f]" "[A-F]"
#define ADDRESS_CACHE_HH_D1CA116F03886F914A987A36908771A8

#include "src/lookup_cache/address.hh"
#include "src/lookup_cache/host_ip_key.hh"
#include "src/time_unit.hh"

#include <cstddef>
#include <map>
#include <memory>


namespace LookupCache {

/**
 * Addresses of one hostname and family together with their round-robin cursor.
 *
 * The cursor belongs to the instance, every single address drawn from it moves the cursor forward.
 */
class CacheEntry
{
public:
    explicit CacheEntry(ResolvedAddresses addresses);
    const ResolvedAddresses& get_addresses() const noexcept;
    bool empty() const noexcept;
    //usable only while none of the addresses has expired
    bool is_expired(TimeUnit::Uptime now) const noexcept;
    const ResolvedAddress& get_next_address();
private:
    ResolvedAddresses addresses_;
    std::size_t next_idx_;
};

using CacheEntryPtr = std::shared_ptr<CacheEntry>;

class AddressCache
{
public:
    explicit AddressCache(TimeUnit::Clock clock);
    bool has(const HostIpKey& key) const;
    //returns nullptr if there is no usable entry
    CacheEntryPtr get(const HostIpKey& key) const;
    //replaces the previous entry, an empty list is returned as an entry but never cached
    CacheEntryPtr put(const HostIpKey& key, const ResolvedAddresses& addresses);
    std::size_t size() const noexcept;
private:
    TimeUnit::Clock clock_;
    mutable std::map<HostIpKey, CacheEntryPtr> entries_;
};

}//namespace LookupCache

#endif//ADDRESS_CACHE_HH_D1CA116F03886F914A987A36908771A8
