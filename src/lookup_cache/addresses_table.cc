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

#include "src/lookup_cache/addresses_table.hh"

#include <memory>
#include <utility>


namespace LookupCache {

AddressesTable::AddressesTable(Family family, AddressResolver& resolver, Event::Base& event_base, TimeUnit::Clock clock)
    : family_{family},
      resolver_{resolver},
      event_base_{event_base},
      clock_{std::move(clock)},
      cache_{clock_},
      tasks_{}
{ }

void AddressesTable::resolve(const std::string& hostname, bool all, Callback callback)
{
    const auto key = make_key(hostname, family_);
    const auto entry = cache_.get(key);
    if (entry != nullptr)
    {
        //answer is taken now so that the round-robin order follows the order of calls
        auto addresses = pick(*entry, all);
        event_base_.defer([callback = std::move(callback), addresses = std::move(addresses)]()
        {
            callback(nullptr, addresses);
        });
        return;
    }
    auto on_completion = [all, callback = std::move(callback)](const ErrorPtr& error, const CacheEntryPtr& entry)
    {
        if (error != nullptr)
        {
            callback(error, ResolvedAddresses{});
            return;
        }
        callback(nullptr, pick(*entry, all));
    };
    const auto running_task = tasks_.get(key);
    if (running_task != nullptr)
    {
        running_task->attach(std::move(on_completion));
        return;
    }
    const auto task = std::make_shared<ResolveTask>(key, resolver_, clock_, static_cast<ResolveTask::Observer&>(*this));
    tasks_.add(key, task);
    task->attach(std::move(on_completion));
    try
    {
        task->launch();
    }
    catch (...)
    {
        tasks_.remove(key);
        throw;
    }
}

Family AddressesTable::get_family() const noexcept
{
    return family_;
}

const AddressCache& AddressesTable::get_cache() const noexcept
{
    return cache_;
}

const ResolveTasksList& AddressesTable::get_tasks() const noexcept
{
    return tasks_;
}

CacheEntryPtr AddressesTable::on_resolved(const HostIpKey& key, const ResolvedAddresses& addresses)
{
    return cache_.put(key, addresses);
}

void AddressesTable::on_done(const HostIpKey& key)
{
    tasks_.remove(key);
}

ResolvedAddresses AddressesTable::pick(CacheEntry& entry, bool all)
{
    if (all || entry.empty())
    {
        return entry.get_addresses();
    }
    return ResolvedAddresses{entry.get_next_address()};
}

}//namespace LookupCache
