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

#include "src/lookup_cache/dns_lookup.hh"

#include <boost/optional.hpp>

#include <cstdint>
#include <memory>
#include <utility>


namespace LookupCache {

namespace {

class ToHostname : public boost::static_visitor<std::string>
{
public:
    std::string operator()(const boost::blank&) const { return std::string{}; }
    std::string operator()(bool value) const
    {
        if (!value)
        {
            return std::string{};
        }
        throw InvalidArgument{"hostname must be a string"};
    }
    std::string operator()(std::int64_t value) const
    {
        if (value == 0)
        {
            return std::string{};
        }
        throw InvalidArgument{"hostname must be a string"};
    }
    std::string operator()(const std::string& value) const { return value; }
    std::string operator()(const Options&) const
    {
        throw InvalidArgument{"hostname must be a string"};
    }
};

class ToOptions : public boost::static_visitor<Options>
{
public:
    Options operator()(const Options& value) const { return value; }
    Options operator()(std::int64_t family) const
    {
        Options options;
        options.family = family;
        return options;
    }
    template <typename T>
    Options operator()(const T&) const
    {
        throw InvalidArgument{"options must be an object or an ip version number"};
    }
};

boost::optional<Family> get_family(const Options& options)
{
    if (options.family == boost::none)
    {
        return boost::none;
    }
    switch (*options.family)
    {
        case to_ip_version(Family::ipv4):
            return Family::ipv4;
        case to_ip_version(Family::ipv6):
            return Family::ipv6;
    }
    throw InvalidArgument{"invalid family number, must be one of the {4, 6} or undefined"};
}

Addresses to_addresses(const ResolvedAddresses& resolved)
{
    Addresses addresses;
    addresses.reserve(resolved.size());
    for (const auto& address : resolved)
    {
        addresses.push_back(Address{address.address, address.family});
    }
    return addresses;
}

struct BothFamilies
{
    boost::optional<Addresses> ipv4;
    boost::optional<Addresses> ipv6;
    bool finished = false;
};

}//namespace LookupCache::{anonymous}

DnsLookup::DnsLookup(Event::Base& event_base, AddressResolver& resolver, TimeUnit::Clock clock)
    : event_base_{event_base},
      ipv4_table_{Family::ipv4, resolver, event_base, clock},
      ipv6_table_{Family::ipv6, resolver, event_base, clock}
{ }

void DnsLookup::operator()(const Argument& hostname, const Argument& options, const Callback& callback)
{
    const auto host = boost::apply_visitor(ToHostname{}, hostname.get_value());
    const auto lookup_options = boost::apply_visitor(ToOptions{}, options.get_value());
    if (!callback.is_callable())
    {
        throw InvalidArgument{"callback param must be a function"};
    }
    if (lookup_options.all && !callback.accepts_all())
    {
        throw InvalidArgument{"callback must accept list of addresses if all addresses are requested"};
    }
    if (!lookup_options.all && callback.accepts_all())
    {
        throw InvalidArgument{"callback must accept single address if all addresses are not requested"};
    }
    const auto family = get_family(lookup_options);
    const auto family_hint = family != boost::none ? *family : Family::ipv4;
    if (host.empty())
    {
        event_base_.defer([callback, family_hint]()
        {
            callback(nullptr, Addresses{}, family_hint);
        });
        return;
    }
    auto outcome = [callback, family_hint](const ErrorPtr& error, const Addresses& addresses)
    {
        callback(error, addresses, family_hint);
    };
    if (family != boost::none)
    {
        this->lookup_family(*family, host, lookup_options.all, std::move(outcome));
        return;
    }
    this->lookup_both(host, lookup_options.all, std::move(outcome));
}

void DnsLookup::operator()(const Argument& hostname, const Callback& callback)
{
    (*this)(hostname, Options{}, callback);
}

AddressesTable& DnsLookup::get_table(Family family) noexcept
{
    return family == Family::ipv6 ? ipv6_table_ : ipv4_table_;
}

void DnsLookup::lookup_family(Family family, const std::string& hostname, bool all, Outcome outcome)
{
    this->get_table(family).resolve(
            hostname,
            all,
            [hostname, outcome = std::move(outcome)](const ErrorPtr& error, const ResolvedAddresses& addresses)
            {
                if (error != nullptr)
                {
                    const bool no_data = error->get_code() == ErrorCode::no_data;
                    outcome(no_data ? make_not_found_error(hostname, error->get_syscall()) : error, Addresses{});
                    return;
                }
                if (addresses.empty())
                {
                    outcome(make_not_found_error(hostname), Addresses{});
                    return;
                }
                outcome(nullptr, to_addresses(addresses));
            });
}

void DnsLookup::lookup_both(const std::string& hostname, bool all, Outcome outcome)
{
    const auto state = std::make_shared<BothFamilies>();
    const auto on_family_done = [state, hostname, all, outcome = std::move(outcome)](
            Family family,
            const ErrorPtr& error,
            const Addresses& addresses)
    {
        if (state->finished)
        {
            return;
        }
        const bool family_not_found = (error != nullptr) && (error->get_code() == ErrorCode::not_found);
        if ((error != nullptr) && !family_not_found)
        {
            state->finished = true;
            outcome(error, Addresses{});
            return;
        }
        auto& result = family == Family::ipv4 ? state->ipv4 : state->ipv6;
        result = family_not_found ? Addresses{} : addresses;
        const bool both_done = (state->ipv4 != boost::none) && (state->ipv6 != boost::none);
        if (!both_done)
        {
            return;
        }
        state->finished = true;
        Addresses merged;
        if (all)
        {
            merged = *state->ipv4;
            merged.insert(merged.end(), state->ipv6->begin(), state->ipv6->end());
        }
        else if (!state->ipv4->empty())
        {
            merged.push_back(state->ipv4->front());
        }
        else if (!state->ipv6->empty())
        {
            merged.push_back(state->ipv6->front());
        }
        if (merged.empty())
        {
            outcome(make_not_found_error(hostname), Addresses{});
            return;
        }
        outcome(nullptr, merged);
    };
    this->lookup_family(Family::ipv4, hostname, all, [on_family_done](const ErrorPtr& error, const Addresses& addresses)
    {
        on_family_done(Family::ipv4, error, addresses);
    });
    try
    {
        this->lookup_family(Family::ipv6, hostname, all, [on_family_done](const ErrorPtr& error, const Addresses& addresses)
        {
            on_family_done(Family::ipv6, error, addresses);
        });
    }
    catch (...)
    {
        //the caller gets the exception, the IPv4 outcome must not reach the callback later
        state->finished = true;
        throw;
    }
}

}//namespace LookupCache
