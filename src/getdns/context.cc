/*
 * Copyright (C) 2017-2026  CZ.NIC, z. s. p. o.
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

#include "src/getdns/context.hh"
#include "src/getdns/data.hh"
#include "src/getdns/exception.hh"

#include <getdns/getdns_ext_libevent.h>

#include <string>
#include <utility>
#include <vector>

namespace GetDns {

namespace {

::getdns_context* create_context_from_os()
{
    static constexpr int set_from_os = 1;
    ::getdns_context* context_ptr = nullptr;
    MUST_BE_GOOD(::getdns_context_create(&context_ptr, set_from_os));
    return context_ptr;
}

template <typename Bytes>
Data::Dict make_upstream(const char* address_type, const Bytes& bytes)
{
    Data::Dict upstream{::getdns_dict_create()};
    const Data::BinData type{std::string{address_type}};
    upstream.set("address_type", *type);
    const Data::BinData address_data{bytes.data(), bytes.size()};
    upstream.set("address_data", *address_data);
    return upstream;
}

}//namespace GetDns::{anonymous}

Context::Context(Context&& src) noexcept
    : ptr_{nullptr}
{
    std::swap(src.ptr_, ptr_);
}

Context& Context::operator=(Context&& src) noexcept
{
    std::swap(src.ptr_, ptr_);
    return *this;
}

Context::Context(InitialSettings::FromOs)
    : Context{create_context_from_os()}
{ }

Context::Context(::getdns_context* ptr) noexcept
    : ptr_{ptr}
{ }

Context::~Context()
{
    if (ptr_ != nullptr)
    {
        ::getdns_context_destroy(ptr_);
        ptr_ = nullptr;
    }
}

Context& Context::set_dns_transport_list(const TransportsList& protocols)
{
    std::vector<::getdns_transport_list_t> transports;
    transports.reserve(protocols.size());
    for (const auto protocol : protocols)
    {
        transports.push_back(to_transport_protocol(protocol));
    }
    MUST_BE_GOOD(::getdns_context_set_dns_transport_list(ptr_, transports.size(), transports.data()));
    return *this;
}

Context& Context::set_upstream_recursive_servers(const std::list<boost::asio::ip::address>& servers)
{
    if (!servers.empty())
    {
        Data::List upstreams{::getdns_list_create()};
        for (const auto& address : servers)
        {
            const auto upstream = address.is_v4() ? make_upstream("IPv4", address.to_v4().to_bytes())
                                                  : make_upstream("IPv6", address.to_v6().to_bytes());
            upstreams.push_back(*upstream);
        }
        MUST_BE_GOOD(::getdns_context_set_upstream_recursive_servers(ptr_, upstreams));
    }
    MUST_BE_GOOD(::getdns_context_set_resolution_type(ptr_, ::GETDNS_RESOLUTION_STUB));
    return *this;
}

Context& Context::set_timeout(Timeout value)
{
    MUST_BE_GOOD(::getdns_context_set_timeout(ptr_, value.count()));
    return *this;
}

Context& Context::set_libevent_base(Event::Base& event_base)
{
    MUST_BE_GOOD(::getdns_extension_set_libevent_base(ptr_, event_base));
    return *this;
}

Context::operator ::getdns_context*() noexcept
{
    return ptr_;
}

}//namespace GetDns
