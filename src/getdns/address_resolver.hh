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

#ifndef ADDRESS_RESOLVER_HH_2E4F28B73A9D45FD6A1D2CC6B796BDE3//date "+%s"|md5sum|tr "[a-f]" "[A-F]"
#define ADDRESS_RESOLVER_HH_2E4F28B73A9D45FD6A1D2CC6B796BDE3

#include "src/event/base.hh"

#include "src/getdns/context.hh"
#include "src/getdns/data.hh"
#include "src/getdns/transport.hh"

#include "src/lookup_cache/address.hh"
#include "src/lookup_cache/address_resolver.hh"
#include "src/lookup_cache/error.hh"

#include <boost/asio/ip/address.hpp>
#include <boost/optional.hpp>

#include <getdns/getdns.h>

#include <cstddef>
#include <cstdint>
#include <list>
#include <map>
#include <string>

namespace GetDns {

/**
 * Resolves A and AAAA records by getdns driven by the libevent loop.
 *
 * Queries are sent immediately, their completions are called from the event loop.
 * Outstanding queries are cancelled on destruction, their completions receive ECANCELLED.
 */
class AddressResolver : public LookupCache::AddressResolver
{
public:
    struct Settings
    {
        //empty means servers configured by the system
        std::list<boost::asio::ip::address> upstreams;
        Context::Timeout timeout;
        //empty means getdns default
        TransportsList transports;
    };
    AddressResolver(Event::Base& event_base, const Settings& settings);
    AddressResolver(const AddressResolver&) = delete;
    AddressResolver& operator=(const AddressResolver&) = delete;
    ~AddressResolver() override;
    void resolve(
            LookupCache::Family family,
            const std::string& hostname,
            const LookupCache::QueryOptions& options,
            Completion completion) override;
    std::size_t get_number_of_unresolved_requests() const noexcept;
private:
    struct Query
    {
        LookupCache::Family family;
        std::string hostname;
        bool with_ttl;
        Completion completion;
    };
    static void getdns_callback_function(
            ::getdns_context*,
            ::getdns_callback_type_t,
            ::getdns_dict*,
            void*,
            ::getdns_transaction_t) noexcept;
    void on_finished(::getdns_callback_type_t callback_type, Data::DictRef response, ::getdns_transaction_t transaction_id);
    Event::Base& event_base_;
    Context context_;
    std::map<::getdns_transaction_t, Query> active_requests_;
    //query being submitted, getdns may answer it before its transaction id is known
    boost::optional<Query> submitted_query_;
};

const char* get_syscall_name(LookupCache::Family family) noexcept;

struct Response
{
    boost::optional<std::uint32_t> status;
    boost::optional<std::uint32_t> rcode;
    LookupCache::RawAddresses addresses;
};

//collects addresses of the given family from the `replies_tree`, malformed records are skipped
Response parse_response(Data::DictRef response, LookupCache::Family family, bool with_ttl);

//none means success
boost::optional<LookupCache::ErrorCode> classify_outcome(
        ::getdns_callback_type_t callback_type,
        const boost::optional<std::uint32_t>& status,
        const boost::optional<std::uint32_t>& rcode,
        bool has_addresses) noexcept;

}//namespace GetDns

#endif//ADDRESS_RESOLVER_HH_2E4F28B73A9D45FD6A1D2CC6B796BDE3
