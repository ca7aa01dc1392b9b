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

#ifndef ADDRESSES_TABLE_HH_2B13B054A1A69A09BCE1E83C7CB89656//date "+%s"|md5sum|tr "[a-f]" "[A-F]"
#define ADDRESSES_TABLE_HH_2B13B054A1A69A09BCE1E83C7CB89656

#include "src/event/base.hh"
#include "src/lookup_cache/address.hh"
#include "src/lookup_cache/address_cache.hh"
#include "src/lookup_cache/address_resolver.hh"
#include "src/lookup_cache/error.hh"
#include "src/lookup_cache/resolve_task.hh"
#include "src/lookup_cache/resolve_tasks_list.hh"
#include "src/time_unit.hh"

#include <functional>
#include <string>


namespace LookupCache {

/**
 * Cached and coalesced resolution of hostnames in one address family.
 *
 * The callback is never called before `resolve` returns. Resolver errors are passed through unchanged.
 */
class AddressesTable : private ResolveTask::Observer
{
public:
    AddressesTable(Family family, AddressResolver& resolver, Event::Base& event_base, TimeUnit::Clock clock);
    AddressesTable(const AddressesTable&) = delete;
    AddressesTable& operator=(const AddressesTable&) = delete;
    //in single address mode `addresses` holds just the address chosen by round robin
    using Callback = std::function<void(const ErrorPtr& error, const ResolvedAddresses& addresses)>;
    void resolve(const std::string& hostname, bool all, Callback callback);
    Family get_family() const noexcept;
    const AddressCache& get_cache() const noexcept;
    const ResolveTasksList& get_tasks() const noexcept;
private:
    CacheEntryPtr on_resolved(const HostIpKey& key, const ResolvedAddresses& addresses) override;
    void on_done(const HostIpKey& key) override;
    static ResolvedAddresses pick(CacheEntry& entry, bool all);
    Family family_;
    AddressResolver& resolver_;
    Event::Base& event_base_;
    TimeUnit::Clock clock_;
    AddressCache cache_;
    ResolveTasksList tasks_;
};

}//namespace LookupCache

#endif//ADDRESSES_TABLE_HH_2B13B054A1A69A09BCE1E83C7CB89656
