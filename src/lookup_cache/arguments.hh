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

#ifndef ARGUMENTS_HH_3B43AD440AA5F40CD527674533DB19B1//date "+%s"|md5sum|tr "[a-f]" "[A-F]"
#define ARGUMENTS_HH_3B43AD440AA5F40CD527674533DB19B1

#include "src/lookup_cache/address.hh"
#include "src/lookup_cache/error.hh"

#include <boost/asio/ip/address.hpp>
#include <boost/optional.hpp>
#include <boost/variant.hpp>

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>


namespace LookupCache {

struct Options
{
    boost::optional<std::int64_t> family;
    bool all = false;
};

/**
 * Loosely typed call argument.
 *
 * Holds a hostname or options the way they arrive from an untyped source. Validation happens
 * in the lookup itself.
 */
class Argument
{
public:
    using Value = boost::variant<boost::blank, bool, std::int64_t, std::string, Options>;
    Argument();
    Argument(bool value);
    Argument(int value);
    Argument(std::int64_t value);
    Argument(const char* value);
    Argument(std::string value);
    Argument(Options value);
    const Value& get_value() const noexcept;
private:
    Value value_;
};

struct Address
{
    boost::asio::ip::address address;
    Family family;
};

bool operator==(const Address& lhs, const Address& rhs);
std::ostream& operator<<(std::ostream& out, const Address& address);

using Addresses = std::vector<Address>;

//single address mode, `family` is meaningful only if there is no error
using OnAddress = std::function<void(
        const ErrorPtr& error,
        const boost::optional<boost::asio::ip::address>& address,
        Family family)>;

//all addresses mode
using OnAddresses = std::function<void(const ErrorPtr& error, const Addresses& addresses)>;

class Callback
{
public:
    Callback() = default;
    Callback(OnAddress on_address);
    Callback(OnAddresses on_addresses);
    bool is_callable() const noexcept;
    bool accepts_all() const noexcept;
    //in single address mode the first address is reported, none if `addresses` is empty
    void operator()(const ErrorPtr& error, const Addresses& addresses, Family family_hint) const;
private:
    boost::variant<boost::blank, OnAddress, OnAddresses> fn_;
};

}//namespace LookupCache

#endif//ARGUMENTS_HH_3B43AD440AA5F40CD527674533DB19B1
