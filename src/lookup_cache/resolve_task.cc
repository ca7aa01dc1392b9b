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

#include "src/lookup_cache/resolve_task.hh"

#include <iostream>
#include <utility>


namespace LookupCache {

ResolveTask::ResolveTask(HostIpKey key, AddressResolver& resolver, TimeUnit::Clock clock, Observer& observer)
    : key_{std::move(key)},
      resolver_{resolver},
      clock_{std::move(clock)},
      observer_{observer},
      status_{Status::none},
      callbacks_{}
{ }

ResolveTask& ResolveTask::attach(Callback callback)
{
    if (status_ == Status::completed)
    {
        struct TaskAlreadyCompleted : Exception
        {
            const char* what() const noexcept override { return "unable to attach callback to completed task"; }
        };
        throw TaskAlreadyCompleted{};
    }
    callbacks_.push_back(std::move(callback));
    return *this;
}

ResolveTask& ResolveTask::launch()
{
    if (status_ != Status::none)
    {
        struct TaskAlreadyLaunched : Exception
        {
            const char* what() const noexcept override { return "task already launched"; }
        };
        throw TaskAlreadyLaunched{};
    }
    status_ = Status::running;
    //the registry may drop the task before the resolver answers
    std::weak_ptr<ResolveTask> task = this->shared_from_this();
    resolver_.resolve(
            key_.get_family(),
            key_.get_hostname(),
            QueryOptions{true},
            [task](const ErrorPtr& error, const RawAddresses& addresses)
            {
                const auto task_ptr = task.lock();
                if (task_ptr != nullptr)
                {
                    task_ptr->on_upstream_result(error, addresses);
                }
            });
    return *this;
}

const HostIpKey& ResolveTask::get_key() const noexcept
{
    return key_;
}

ResolveTask::Status ResolveTask::get_status() const noexcept
{
    return status_;
}

std::size_t ResolveTask::get_number_of_callbacks() const noexcept
{
    return callbacks_.size();
}

void ResolveTask::on_upstream_result(const ErrorPtr& error, const RawAddresses& addresses)
{
    if (status_ != Status::running)
    {
        std::cerr << "unexpected result of " << key_ << " resolution dropped" << std::endl;
        return;
    }
    if (error != nullptr)
    {
        this->complete(error, nullptr);
        return;
    }
    const auto now = clock_();
    ResolvedAddresses resolved;
    resolved.reserve(addresses.size());
    for (const auto& address : addresses)
    {
        resolved.push_back(make_resolved_address(address, key_.get_family(), now));
    }
    this->complete(nullptr, observer_.on_resolved(key_, resolved));
}

void ResolveTask::complete(const ErrorPtr& error, const CacheEntryPtr& entry)
{
    status_ = Status::completed;
    const auto self = this->shared_from_this();
    std::vector<Callback> callbacks;
    std::swap(callbacks, callbacks_);
    observer_.on_done(key_);
    for (const auto& callback : callbacks)
    {
        try
        {
            callback(error, entry);
        }
        catch (const std::exception& e)
        {
            std::cerr << "callback of " << key_ << " resolution failed: " << e.what() << std::endl;
        }
        catch (...)
        {
            std::cerr << "callback of " << key_ << " resolution threw unexpected exception" << std::endl;
        }
    }
}

}//namespace LookupCache
