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

#ifndef DNS_LOOKUP_HH_289C7D004E2B500462BABDB212A63F64//date "+%s"|md5sum|tr "[a-f]" "[A-F]"
#define DNS_LOOKUP_HH_289C7D004E2B500462BABDB212A63F64

#include "src/event/base.hh"
#include "src/lookup_cache/address.hh"
#include "src/lookup_cache/address_resolver.hh"
#include "src/lookup_cache/addresses_table.hh"
#include "src/lookup_cache/arguments.hh"
#include "src/lookup_cache/error.hh"
#include "src/time_unit.hh"

#include <functional>
#include <string>


namespace LookupCache {

/**
 * Asynchronous hostname lookup backed by DNS queries.
 *
 * Invalid arguments are reported by throwing `InvalidArgument` before anything is started, all other
 * outcomes are delivered through the callback, never before the call returns.
 *
 * Without family both IPv4 and IPv6 are resolved simultaneously. Family without any address is treated
 * as an empty result, any other failure is reported immediately. In single address mode IPv4 takes
 * precedence, in all addresses mode IPv4 addresses go first.
 *
 * If starting a resolution throws, the exception propagates to the caller and the callback is never called.
 */
class DnsLookup
{
public:
    DnsLookup(Event::Base& event_base, AddressResolver& resolver, TimeUnit::Clock clock = TimeUnit::get_uptime);
    DnsLookup(const DnsLookup&) = delete;
    DnsLookup& operator=(const DnsLookup&) = delete;
    //`options` is an `Options` structure or the ip version number
    void operator()(const Argument& hostname, const Argument& options, const Callback& callback);
    void operator()(const Argument& hostname, const Callback& callback);
    AddressesTable& get_table(Family family) noexcept;
private:
    using Outcome = std::function<void(const ErrorPtr& error, const Addresses& addresses)>;
    void lookup_family(Family family, const std::string& hostname, bool all, Outcome outcome);
    void lookup_both(const std::string& hostname, bool all, Outcome outcome);
    Event::Base& event_base_;
    AddressesTable ipv4_table_;
    AddressesTable ipv6_table_;
};

}//namespace LookupCache

#endif//DNS_LOOKUP_HH_289C7D004E2B500462BABDB212A63F64
