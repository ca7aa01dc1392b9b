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

#include "src/lookup_cache/arguments.hh"

#include <iostream>
#include <utility>


namespace LookupCache {

namespace {

class IsCallable : public boost::static_visitor<bool>
{
public:
    bool operator()(const boost::blank&) const { return false; }
    template <typename Fn>
    bool operator()(const Fn& fn) const { return static_cast<bool>(fn); }
};

class Call : public boost::static_visitor<>
{
public:
    Call(const ErrorPtr& error, const Addresses& addresses, Family family_hint)
        : error_{error},
          addresses_{addresses},
          family_hint_{family_hint}
    { }
    void operator()(const boost::blank&) const
    {
        struct NotCallable : Exception
        {
            const char* what() const noexcept override { return "empty callback called"; }
        };
        throw NotCallable{};
    }
    void operator()(const OnAddress& on_address) const
    {
        if ((error_ != nullptr) || addresses_.empty())
        {
            on_address(error_, boost::none, family_hint_);
            return;
        }
        on_address(nullptr, addresses_.front().address, addresses_.front().family);
    }
    void operator()(const OnAddresses& on_addresses) const
    {
        on_addresses(error_, addresses_);
    }
private:
    const ErrorPtr& error_;
    const Addresses& addresses_;
    Family family_hint_;
};

}//namespace LookupCache::{anonymous}

Argument::Argument()
    : value_{boost::blank{}}
{ }

Argument::Argument(bool value)
    : value_{value}
{ }

Argument::Argument(int value)
    : value_{static_cast<std::int64_t>(value)}
{ }

Argument::Argument(std::int64_t value)
    : value_{value}
{ }

Argument::Argument(const char* value)
    : value_{boost::blank{}}
{
    if (value != nullptr)
    {
        value_ = std::string{value};
    }
}

Argument::Argument(std::string value)
    : value_{std::move(value)}
{ }

Argument::Argument(Options value)
    : value_{std::move(value)}
{ }

const Argument::Value& Argument::get_value() const noexcept
{
    return value_;
}

bool operator==(const Address& lhs, const Address& rhs)
{
    return (lhs.family == rhs.family) && (lhs.address == rhs.address);
}

std::ostream& operator<<(std::ostream& out, const Address& address)
{
    return out << address.address << " (IPv" << address.family << ")";
}

Callback::Callback(OnAddress on_address)
    : fn_{std::move(on_address)}
{ }

Callback::Callback(OnAddresses on_addresses)
    : fn_{std::move(on_addresses)}
{ }

bool Callback::is_callable() const noexcept
{
    return boost::apply_visitor(IsCallable{}, fn_);
}

bool Callback::accepts_all() const noexcept
{
    return boost::get<OnAddresses>(&fn_) != nullptr;
}

void Callback::operator()(const ErrorPtr& error, const Addresses& addresses, Family family_hint) const
{
    boost::apply_visitor(Call{error, addresses, family_hint}, fn_);
}

}//namespace LookupCache
