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

#ifndef RESOLVE_TASK_HH_4B92813B2B07D9956A1F2EA3F70F0ADF//date "+%s"|md5sum|tr "[a-f]" "[A-F]"
#define RESOLVE_TASK_HH_4B92813B2B07D9956A1F2EA3F70F0ADF

#include "src/lookup_cache/address_cache.hh"
#include "src/lookup_cache/address_resolver.hh"
#include "src/lookup_cache/error.hh"
#include "src/lookup_cache/host_ip_key.hh"
#include "src/time_unit.hh"

#include <cstddef>
#include <functional>
#include <memory>
#include <vector>


namespace LookupCache {

/**
 * One upstream resolution of one hostname and family shared by all callers attached to it.
 *
 * Every attached callback is called exactly once with the outcome of the resolution.
 * On completion the task first populates the cache, then marks itself completed and leaves
 * the registry, and only then calls the callbacks. A caller arriving from within a callback
 * therefore never finds this task and starts a new one.
 */
class ResolveTask : public std::enable_shared_from_this<ResolveTask>
{
public:
    class Observer
    {
    public:
        virtual ~Observer() = default;
        //stores successfully resolved addresses, the returned entry is handed over to the callbacks
        virtual CacheEntryPtr on_resolved(const HostIpKey& key, const ResolvedAddresses& addresses) = 0;
        //the task is completed and must be removed from the registry
        virtual void on_done(const HostIpKey& key) = 0;
    };
    //`entry` is nullptr if `error` is set
    using Callback = std::function<void(const ErrorPtr& error, const CacheEntryPtr& entry)>;
    enum class Status
    {
        none,
        running,
        completed
    };
    ResolveTask(HostIpKey key, AddressResolver& resolver, TimeUnit::Clock clock, Observer& observer);
    ResolveTask(const ResolveTask&) = delete;
    ResolveTask& operator=(const ResolveTask&) = delete;
    ResolveTask& attach(Callback callback);
    ResolveTask& launch();
    const HostIpKey& get_key() const noexcept;
    Status get_status() const noexcept;
    std::size_t get_number_of_callbacks() const noexcept;
private:
    void on_upstream_result(const ErrorPtr& error, const RawAddresses& addresses);
    void complete(const ErrorPtr& error, const CacheEntryPtr& entry);
    HostIpKey key_;
    AddressResolver& resolver_;
    TimeUnit::Clock clock_;
    Observer& observer_;
    Status status_;
    std::vector<Callback> callbacks_;
};

}//namespace LookupCache

#endif//RESOLVE_TASK_HH_4B92813B2B07D9956A1F2EA3F70F0ADF
