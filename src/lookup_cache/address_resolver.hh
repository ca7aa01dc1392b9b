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

#ifndef ADDRESS_RESOLVER_HH_DB776E10BDAB56F298DFA2A984ED2DF5//date "+%s"|md5sum|tr "[a-f]" "[A-F]"
#define ADDRESS_RESOLVER_HH_DB776E10BDAB56F298DFA2A984ED2DF5

#include "src/lookup_cache/address.hh"
#include "src/lookup_cache/error.hh"

#include <functional>
#include <string>


namespace LookupCache {

struct QueryOptions
{
    bool ttl;
};

/**
 * Asynchronous source of A/AAAA records.
 *
 * Implementations call `completion` exactly once, either with an error or with the list of records.
 * The completion is never called before `resolve` returns.
 */
class AddressResolver
{
public:
    virtual ~AddressResolver() = default;
    using Completion = std::function<void(const ErrorPtr& error, const RawAddresses& addresses)>;
    virtual void resolve(
            Family family,
            const std::string& hostname,
            const QueryOptions& options,
            Completion completion) = 0;
};

}//namespace LookupCache

#endif//ADDRESS_RESOLVER_HH_DB776E10BDAB56F298DFA2A984ED2DF5
