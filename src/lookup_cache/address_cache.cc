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

#include "src/lookup_cache/address_cache.hh"

#include <algorithm>
#include <stdexcept>
#include <utility>


namespace LookupCache {

CacheEntry::CacheEntry(ResolvedAddresses addresses)
    : addresses_{std::move(addresses)},
      next_idx_{0}
{ }

const ResolvedAddresses& CacheEntry::get_addresses() const noexcept
{
    return addresses_;
}

bool CacheEntry::empty() const noexcept
{
    return addresses_.empty();
}

bool CacheEntry::is_expired(TimeUnit::Uptime now) const noexcept
{
    return std::any_of(begin(addresses_), end(addresses_), [&](auto&& address)
    {
        return LookupCache::is_expired(address, now);
    });
}

const ResolvedAddress& CacheEntry::get_next_address()
{
    if (addresses_.empty())
    {
        throw std::out_of_range{"no address to choose from"};
    }
    const auto& address = addresses_[next_idx_ % addresses_.size()];
    next_idx_ = (next_idx_ + 1) % addresses_.size();
    return address;
}

AddressCache::AddressCache(TimeUnit::Clock clock)
    : clock_{std::move(clock)}
{ }

bool AddressCache::has(const HostIpKey& key) const
{
    return this->get(key) != nullptr;
}

CacheEntryPtr AddressCache::get(const HostIpKey& key) const
{
    const auto entry_itr = entries_.find(key);
    if (entry_itr == entries_.end())
    {
        return nullptr;
    }
    if (entry_itr->second->is_expired(clock_()))
    {
        entries_.erase(entry_itr);
        return nullptr;
    }
    return entry_itr->second;
}

CacheEntryPtr AddressCache::put(const HostIpKey& key, const ResolvedAddresses& addresses)
{
    auto entry = std::make_shared<CacheEntry>(addresses);
    if (entry->empty())
    {
        entries_.erase(key);
        return entry;
    }
    entries_[key] = entry;
    return entry;
}

std::size_t AddressCache::size() const noexcept
{
    return entries_.size();
}

}//namespace LookupCache
