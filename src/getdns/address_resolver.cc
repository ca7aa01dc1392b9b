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

#include "src/getdns/address_resolver.hh"
#include "src/getdns/exception.hh"

#include <chrono>
#include <iostream>
#include <utility>
#include <vector>

namespace GetDns {

namespace {

Context make_context(Event::Base& event_base, const AddressResolver::Settings& settings)
{
    Context context{Context::InitialSettings::FromOs{}};
    if (!settings.upstreams.empty())
    {
        context.set_upstream_recursive_servers(settings.upstreams);
    }
    if (!settings.transports.empty())
    {
        context.set_dns_transport_list(settings.transports);
    }
    context.set_timeout(settings.timeout);
    context.set_libevent_base(event_base);
    return context;
}

constexpr std::uint16_t get_rrtype(LookupCache::Family family) noexcept
{
    return family == LookupCache::Family::ipv4 ? GETDNS_RRTYPE_A : GETDNS_RRTYPE_AAAA;
}

constexpr const char* get_rdata_key(LookupCache::Family family) noexcept
{
    return family == LookupCache::Family::ipv4 ? "ipv4_address" : "ipv6_address";
}

LookupCache::ErrorCode to_error_code(const Exception& e) noexcept
{
    return e.get_return_code() == ::GETDNS_RETURN_BAD_DOMAIN_NAME ? LookupCache::ErrorCode::bad_name
                                                                  : LookupCache::ErrorCode::server_failure;
}

}//namespace GetDns::{anonymous}

AddressResolver::AddressResolver(Event::Base& event_base, const Settings& settings)
    : event_base_{event_base},
      context_{make_context(event_base, settings)}
{ }

AddressResolver::~AddressResolver()
{
    std::vector<::getdns_transaction_t> transactions;
    transactions.reserve(active_requests_.size());
    for (const auto& request : active_requests_)
    {
        transactions.push_back(request.first);
    }
    for (const auto transaction_id : transactions)
    {
        const auto result = ::getdns_cancel_callback(context_, transaction_id);
        if (result != ::GETDNS_RETURN_GOOD)
        {
            std::cerr << "unable to cancel transaction " << transaction_id << std::endl;
        }
    }
}

void AddressResolver::resolve(
        LookupCache::Family family,
        const std::string& hostname,
        const LookupCache::QueryOptions& options,
        Completion completion)
{
    submitted_query_ = Query{family, hostname, options.ttl, std::move(completion)};
    ::getdns_transaction_t transaction_id = 0;
    try
    {
        MUST_BE_GOOD(::getdns_general(
                context_,
                hostname.c_str(),
                get_rrtype(family),
                nullptr,
                this,
                &transaction_id,
                getdns_callback_function));
    }
    catch (const Exception& e)
    {
        if (submitted_query_ != boost::none)
        {
            auto query = std::move(*submitted_query_);
            submitted_query_ = boost::none;
            const auto error = LookupCache::make_error(to_error_code(e), hostname, std::string{get_syscall_name(family)});
            event_base_.defer([completion = std::move(query.completion), error]()
            {
                completion(error, LookupCache::RawAddresses{});
            });
        }
        return;
    }
    const bool already_answered = submitted_query_ == boost::none;
    if (!already_answered)
    {
        active_requests_.emplace(transaction_id, std::move(*submitted_query_));
        submitted_query_ = boost::none;
    }
}

std::size_t AddressResolver::get_number_of_unresolved_requests() const noexcept
{
    return active_requests_.size();
}

void AddressResolver::getdns_callback_function(
        ::getdns_context*,
        ::getdns_callback_type_t callback_type,
        ::getdns_dict* response,
        void* user_data_ptr,
        ::getdns_transaction_t transaction_id) noexcept
{
    try
    {
        const Data::Dict answer{response};
        auto* const resolver_ptr = static_cast<AddressResolver*>(user_data_ptr);
        resolver_ptr->on_finished(callback_type, *answer, transaction_id);
    }
    catch (const std::exception& e)
    {
        std::cerr << "std::exception caught: " << e.what() << std::endl;
    }
    catch (...)
    {
        std::cerr << "unexpected exception caught" << std::endl;
    }
}

void AddressResolver::on_finished(
        ::getdns_callback_type_t callback_type,
        Data::DictRef response,
        ::getdns_transaction_t transaction_id)
{
    const auto request_itr = active_requests_.find(transaction_id);
    const bool answered_during_submission = (request_itr == active_requests_.end()) && (submitted_query_ != boost::none);
    if ((request_itr == active_requests_.end()) && !answered_during_submission)
    {
        std::cerr << "transaction " << transaction_id << " not found" << std::endl;
        return;
    }
    Query query = answered_during_submission ? std::move(*submitted_query_) : std::move(request_itr->second);
    if (answered_during_submission)
    {
        submitted_query_ = boost::none;
    }
    else
    {
        active_requests_.erase(request_itr);
    }
    auto parsed = callback_type == ::GETDNS_CALLBACK_COMPLETE ? parse_response(response, query.family, query.with_ttl)
                                                                : Response{};
    const auto error_code = classify_outcome(callback_type, parsed.status, parsed.rcode, !parsed.addresses.empty());
    LookupCache::ErrorPtr error = nullptr;
    if (error_code != boost::none)
    {
        error = LookupCache::make_error(*error_code, query.hostname, std::string{get_syscall_name(query.family)});
        parsed.addresses.clear();
    }
    if (answered_during_submission)
    {
        event_base_.defer([completion = std::move(query.completion), error, addresses = std::move(parsed.addresses)]()
        {
            completion(error, addresses);
        });
        return;
    }
    query.completion(error, parsed.addresses);
}

const char* get_syscall_name(LookupCache::Family family) noexcept
{
    return family == LookupCache::Family::ipv4 ? "queryA" : "queryAaaa";
}

Response parse_response(Data::DictRef response, LookupCache::Family family, bool with_ttl)
{
    Response result;
    result.status = response.find<std::uint32_t>("status");
    const auto replies = response.find<Data::ListRef>("replies_tree");
    if (replies == boost::none)
    {
        return result;
    }
    const auto number_of_replies = replies->length();
    for (std::size_t reply_idx = 0; reply_idx < number_of_replies; ++reply_idx)
    {
        const auto reply = replies->get<Data::DictRef>(reply_idx);
        if (result.rcode == boost::none)
        {
            const auto header = reply.find<Data::DictRef>("header");
            if (header != boost::none)
            {
                result.rcode = header->find<std::uint32_t>("rcode");
            }
        }
        const auto answers = reply.find<Data::ListRef>("answer");
        if (answers == boost::none)
        {
            continue;
        }
        const auto number_of_records = answers->length();
        for (std::size_t record_idx = 0; record_idx < number_of_records; ++record_idx)
        {
            try
            {
                const auto record = answers->get<Data::DictRef>(record_idx);
                const bool requested_type = record.get<std::uint32_t>("type") == get_rrtype(family);
                const bool internet_class = record.get<std::uint32_t>("class") == GETDNS_RRCLASS_IN;
                if (!requested_type || !internet_class)
                {
                    continue;
                }
                const auto ttl = with_ttl ? record.get<std::uint32_t>("ttl") : 0;
                const auto address = record.get<Data::DictRef>("rdata")
                                           .get<Data::BinDataRef>(get_rdata_key(family))
                                           .as<boost::asio::ip::address>();
                result.addresses.push_back(LookupCache::RawAddress{address, LookupCache::Ttl{std::chrono::seconds{ttl}}});
            }
            catch (const Exception& e)
            {
                std::cerr << "malformed record skipped: " << e.what() << std::endl;
            }
        }
    }
    return result;
}

boost::optional<LookupCache::ErrorCode> classify_outcome(
        ::getdns_callback_type_t callback_type,
        const boost::optional<std::uint32_t>& status,
        const boost::optional<std::uint32_t>& rcode,
        bool has_addresses) noexcept
{
    switch (callback_type)
    {
        case ::GETDNS_CALLBACK_COMPLETE:
            break;
        case ::GETDNS_CALLBACK_CANCEL:
            return LookupCache::ErrorCode::cancelled;
        case ::GETDNS_CALLBACK_TIMEOUT:
            return LookupCache::ErrorCode::timeout;
        case ::GETDNS_CALLBACK_ERROR:
            return LookupCache::ErrorCode::server_failure;
    }
    if (has_addresses)
    {
        return boost::none;
    }
    if ((status != boost::none) && (*status == static_cast<std::uint32_t>(GETDNS_RESPSTATUS_ALL_TIMEOUT)))
    {
        return LookupCache::ErrorCode::timeout;
    }
    if (rcode != boost::none)
    {
        switch (*rcode)
        {
            case GETDNS_RCODE_NXDOMAIN:
                return LookupCache::ErrorCode::not_found;
            case GETDNS_RCODE_SERVFAIL:
                return LookupCache::ErrorCode::server_failure;
            case GETDNS_RCODE_REFUSED:
                return LookupCache::ErrorCode::refused;
            case GETDNS_RCODE_FORMERR:
                return LookupCache::ErrorCode::format_error;
            case GETDNS_RCODE_NOTIMP:
                return LookupCache::ErrorCode::not_implemented;
        }
    }
    if ((status != boost::none) &&
        ((*status == static_cast<std::uint32_t>(GETDNS_RESPSTATUS_NO_SECURE_ANSWERS)) ||
         (*status == static_cast<std::uint32_t>(GETDNS_RESPSTATUS_ALL_BOGUS_ANSWERS))))
    {
        return LookupCache::ErrorCode::server_failure;
    }
    return LookupCache::ErrorCode::no_data;
}

}//namespace GetDns
