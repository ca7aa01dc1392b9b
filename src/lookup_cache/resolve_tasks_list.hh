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

#ifndef RESOLVE_TASKS_LIST_HH_52DB5D585850E363A5868BACCE081976//date "+%s"|md5sum|tr "[a-f]" "[A-F]"
#define RESOLVE_TASKS_LIST_HH_52DB5D585850E363A5868BACCE081976

#include "src/lookup_cache/host_ip_key.hh"
#include "src/lookup_cache/resolve_task.hh"

#include <cstddef>
#include <map>
#include <memory>


namespace LookupCache {

//at most one running task per key
class ResolveTasksList
{
public:
    using TaskPtr = std::shared_ptr<ResolveTask>;
    bool has(const HostIpKey& key) const;
    TaskPtr get(const HostIpKey& key) const;
    ResolveTasksList& add(const HostIpKey& key, TaskPtr task);
    ResolveTasksList& remove(const HostIpKey& key);
    std::size_t size() const noexcept;
private:
    std::map<HostIpKey, TaskPtr> tasks_;
};

}//namespace LookupCache

#endif//RESOLVE_TASKS_LIST_HH_52DB5D585850E363A5868BACCE081976
