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

#include "src/lookup_cache/resolve_tasks_list.hh"

#include <utility>


namespace LookupCache {

bool ResolveTasksList::has(const HostIpKey& key) const
{
    return tasks_.find(key) != tasks_.end();
}

ResolveTasksList::TaskPtr ResolveTasksList::get(const HostIpKey& key) const
{
    const auto task_itr = tasks_.find(key);
    if (task_itr == tasks_.end())
    {
        return nullptr;
    }
    return task_itr->second;
}

ResolveTasksList& ResolveTasksList::add(const HostIpKey& key, TaskPtr task)
{
    const bool task_added = tasks_.emplace(key, std::move(task)).second;
    if (!task_added)
    {
        struct TaskAlreadyRegistered : Exception
        {
            const char* what() const noexcept override { return "task for this key is already registered"; }
        };
        throw TaskAlreadyRegistered{};
    }
    return *this;
}

ResolveTasksList& ResolveTasksList::remove(const HostIpKey& key)
{
    tasks_.erase(key);
    return *this;
}

std::size_t ResolveTasksList::size() const noexcept
{
    return tasks_.size();
}

}//namespace LookupCache
