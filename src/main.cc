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

#include "src/event/base.hh"

#include "src/getdns/address_resolver.hh"
#include "src/getdns/context.hh"
#include "src/getdns/exception.hh"
#include "src/getdns/transport.hh"

#include "src/lookup_cache/arguments.hh"
#include "src/lookup_cache/dns_lookup.hh"
#include "src/lookup_cache/error.hh"

#include "src/util/unsigned_number.hh"

#include <boost/asio/ip/address.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/optional.hpp>

#include <cstdint>
#include <cstdlib>
#include <cstring>

#include <chrono>
#include <iostream>
#include <list>
#include <string>
#include <vector>

namespace {

//one round of lookups of all hostnames, repeated after the interval
class Batch : public Event::OnTimeout<Batch>
{
public:
    Batch(Event::Base& event_base,
          LookupCache::DnsLookup& lookup,
          std::vector<std::string> hostnames,
          LookupCache::Argument options,
          bool all,
          std::uint64_t rounds,
          std::chrono::milliseconds interval);
    Batch& start();
    bool is_finished() const noexcept;
    void on_timeout_occurrence();
private:
    void on_answered();
    LookupCache::Callback make_callback(const std::string& hostname);
    LookupCache::DnsLookup& lookup_;
    std::vector<std::string> hostnames_;
    LookupCache::Argument options_;
    bool all_;
    std::uint64_t remaining_rounds_;
    std::chrono::milliseconds interval_;
    std::size_t outstanding_;
};

void print_error(const std::string& hostname, const LookupCache::ErrorPtr& error)
{
    std::cout << "unresolved " << hostname << " " << error->get_code_name() << std::endl;
}

std::list<boost::asio::ip::address> split_ip_addresses(const std::string& src);

extern const char cmdline_help_text[];

}//namespace {anonymous}

int main(int argc, char* argv[])
{
    if ((argc <= 0) || (argv[0] == nullptr))
    {
        std::cerr << "main() arguments are crazy" << std::endl;
        return EXIT_SUCCESS;
    }
    std::string resolvers_opt;
    std::string timeout_opt;
    std::string transport_opt;
    std::string family_opt;
    std::string repeat_opt;
    std::string interval_opt;
    bool all_opt = false;
    std::vector<std::string> hostnames;
    const auto get_value = [](char**& arg_ptr, const char* option_name, std::string& value)
    {
        if (!value.empty())
        {
            std::cerr << option_name << " option can be used once only" << std::endl;
            return false;
        }
        ++arg_ptr;
        if (*arg_ptr == nullptr)
        {
            std::cerr << "no argument for " << option_name << " option" << std::endl;
            return false;
        }
        value = *arg_ptr;
        if (value.empty())
        {
            std::cerr << option_name << " argument can not be empty" << std::endl;
            return false;
        }
        return true;
    };
    char** const arg_end = argv + argc;
    char** arg_ptr = argv + 1;
    while ((arg_ptr != arg_end) && (*arg_ptr != nullptr))
    {
        const int are_the_same = 0;
        if (std::strcmp(*arg_ptr, "--resolvers") == are_the_same)
        {
            if (!get_value(arg_ptr, "resolvers", resolvers_opt))
            {
                return EXIT_FAILURE;
            }
        }
        else if (std::strcmp(*arg_ptr, "--timeout") == are_the_same)
        {
            if (!get_value(arg_ptr, "timeout", timeout_opt))
            {
                return EXIT_FAILURE;
            }
        }
        else if (std::strcmp(*arg_ptr, "--transport") == are_the_same)
        {
            if (!get_value(arg_ptr, "transport", transport_opt))
            {
                return EXIT_FAILURE;
            }
        }
        else if (std::strcmp(*arg_ptr, "--family") == are_the_same)
        {
            if (!get_value(arg_ptr, "family", family_opt))
            {
                return EXIT_FAILURE;
            }
        }
        else if (std::strcmp(*arg_ptr, "--repeat") == are_the_same)
        {
            if (!get_value(arg_ptr, "repeat", repeat_opt))
            {
                return EXIT_FAILURE;
            }
        }
        else if (std::strcmp(*arg_ptr, "--interval") == are_the_same)
        {
            if (!get_value(arg_ptr, "interval", interval_opt))
            {
                return EXIT_FAILURE;
            }
        }
        else if (std::strcmp(*arg_ptr, "--all") == are_the_same)
        {
            all_opt = true;
        }
        else if (std::strcmp(*arg_ptr, "--help") == are_the_same)
        {
            std::cerr << cmdline_help_text << std::endl;
            return EXIT_SUCCESS;
        }
        else if ((*arg_ptr)[0] == '-')
        {
            std::cerr << "unknown option: " << *arg_ptr << std::endl;
            return EXIT_FAILURE;
        }
        else
        {
            hostnames.push_back(*arg_ptr);
        }
        ++arg_ptr;
    }
    if (hostnames.empty())
    {
        std::cerr << "at least one hostname has to be set" << std::endl;
        return EXIT_FAILURE;
    }
    try
    {
        static constexpr auto timeout_default = std::chrono::seconds{10};
        GetDns::AddressResolver::Settings settings;
        settings.upstreams = split_ip_addresses(resolvers_opt);
        settings.timeout = GetDns::Context::Timeout{timeout_opt.empty() ? timeout_default
                                                                        : std::chrono::seconds{static_cast<std::chrono::seconds::rep>(Util::to_unsigned_number("timeout", timeout_opt))}};
        if (!transport_opt.empty())
        {
            settings.transports = GetDns::make_transports_list(transport_opt);
        }
        LookupCache::Options options;
        options.all = all_opt;
        if (!family_opt.empty())
        {
            options.family = boost::lexical_cast<std::int64_t>(family_opt);
        }
        const auto rounds = repeat_opt.empty() ? std::uint64_t{1} : Util::to_unsigned_number("repeat", repeat_opt);
        if (rounds == 0)
        {
            std::cerr << "repeat value has to be positive" << std::endl;
            return EXIT_FAILURE;
        }
        static constexpr auto interval_default = std::chrono::milliseconds{1000};
        const auto interval = interval_opt.empty() ? interval_default
                                                   : std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(Util::to_unsigned_number("interval", interval_opt))};
        Event::Base event_base;
        GetDns::AddressResolver resolver{event_base, settings};
        LookupCache::DnsLookup lookup{event_base, resolver};
        Batch batch{event_base, lookup, hostnames, options, all_opt, rounds, interval};
        batch.start();
        while (!batch.is_finished())
        {
            switch (event_base(Event::Loop::Once{}))
            {
                case Event::Base::Result::success:
                    break;
                case Event::Base::Result::no_events:
                    std::cerr << "no events to wait for, " << resolver.get_number_of_unresolved_requests()
                              << " request(s) unresolved" << std::endl;
                    return EXIT_FAILURE;
            }
        }
        return EXIT_SUCCESS;
    }
    catch (const LookupCache::InvalidArgument& e)
    {
        std::cerr << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    catch (const Util::InvalidUnsignedNumber& e)
    {
        std::cerr << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    catch (const Event::Exception& e)
    {
        std::cerr << "caught Event::Exception: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    catch (const GetDns::Exception& e)
    {
        std::cerr << "caught GetDns::Exception: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    catch (const std::exception& e)
    {
        std::cerr << "caught std::exception: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    catch (...)
    {
        std::cerr << "caught an unexpected exception" << std::endl;
        return EXIT_FAILURE;
    }
}

namespace {

Batch::Batch(
        Event::Base& event_base,
        LookupCache::DnsLookup& lookup,
        std::vector<std::string> hostnames,
        LookupCache::Argument options,
        bool all,
        std::uint64_t rounds,
        std::chrono::milliseconds interval)
    : Event::OnTimeout<Batch>{event_base},
      lookup_{lookup},
      hostnames_{std::move(hostnames)},
      options_{std::move(options)},
      all_{all},
      remaining_rounds_{rounds},
      interval_{interval},
      outstanding_{0}
{ }

Batch& Batch::start()
{
    --remaining_rounds_;
    outstanding_ = hostnames_.size();
    for (const auto& hostname : hostnames_)
    {
        lookup_(hostname, options_, this->make_callback(hostname));
    }
    return *this;
}

bool Batch::is_finished() const noexcept
{
    return (outstanding_ == 0) && (remaining_rounds_ == 0);
}

void Batch::on_timeout_occurrence()
{
    this->start();
}

void Batch::on_answered()
{
    --outstanding_;
    if ((outstanding_ == 0) && (0 < remaining_rounds_))
    {
        this->set(interval_);
    }
}

LookupCache::Callback Batch::make_callback(const std::string& hostname)
{
    if (all_)
    {
        return LookupCache::OnAddresses{[this, hostname](const LookupCache::ErrorPtr& error, const LookupCache::Addresses& addresses)
        {
            if (error != nullptr)
            {
                print_error(hostname, error);
            }
            for (const auto& address : addresses)
            {
                std::cout << "resolved " << hostname << " " << address.address << " " << address.family << std::endl;
            }
            this->on_answered();
        }};
    }
    return LookupCache::OnAddress{[this, hostname](
            const LookupCache::ErrorPtr& error,
            const boost::optional<boost::asio::ip::address>& address,
            LookupCache::Family family)
    {
        if (error != nullptr)
        {
            print_error(hostname, error);
        }
        else if (address != boost::none)
        {
            std::cout << "resolved " << hostname << " " << *address << " " << family << std::endl;
        }
        this->on_answered();
    }};
}

std::list<boost::asio::ip::address> split_ip_addresses(const std::string& src)
{
    std::list<boost::asio::ip::address> result;
    if (src.empty())
    {
        return result;
    }
    std::vector<std::string> items;
    boost::algorithm::split(items, src, boost::algorithm::is_any_of(","));
    for (const auto& item : items)
    {
        result.push_back(boost::asio::ip::make_address(item));
    }
    return result;
}

const char cmdline_help_text[] =
        "Hostname lookup backed by cached DNS queries.\n\n"
        "usage: lookup-dns-cache [--resolvers IP address[,...]] "
                                "[--timeout sec] "
                                "[--transport udp|tcp|tls[,...]] "
                                "[--family 4|6] "
                                "[--all] "
                                "[--repeat N] "
                                "[--interval ms] "
                                "HOSTNAME... | "
                                "--help\n\n"
        "    Arguments:\n"
        "        --resolvers ... IP addresses of resolvers used for resolving A and AAAA records;\n"
        "                        default is in system configured resolver\n"
        "        --timeout ..... maximum time (in seconds) spent by one DNS request;\n"
        "                        default is 10 seconds\n"
        "        --transport ... transport protocols in order of preference;\n"
        "                        default is given by getdns library\n"
        "        --family ...... resolve IPv4 (4) or IPv6 (6) addresses only;\n"
        "                        default is both, IPv4 preferred\n"
        "        --all ......... report all addresses instead of one\n"
        "        --repeat ...... number of lookup rounds; default is 1\n"
        "        --interval .... pause (in milliseconds) between lookup rounds; default is 1000\n"
        "        HOSTNAME ...... hostname to look up, repeated hostnames share one DNS request\n"
        "        --help ........ this help\n\n"
        "    Format of data sent to standard output:\n"
        "        resolved hostname ip family\n"
        "        unresolved hostname error_code\n";

}//namespace {anonymous}
