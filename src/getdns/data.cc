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

#include "src/getdns/data.hh"
#include "src/getdns/exception.hh"

#include <algorithm>
#include <array>
#include <utility>

namespace GetDns {

Data::DictRef::DictRef(const ::getdns_dict* ptr) noexcept
    : ptr_{ptr}
{ }

Data::DictRef::operator const ::getdns_dict*() const noexcept
{
    return ptr_;
}

template <>
Data::BinDataRef Data::DictRef::get<Data::BinDataRef>(const char* key) const
{
    ::getdns_bindata* bindata_ptr = nullptr;
    MUST_BE_GOOD(::getdns_dict_get_bindata(ptr_, key, &bindata_ptr));
    return BinDataRef{bindata_ptr};
}

template <>
Data::DictRef Data::DictRef::get<Data::DictRef>(const char* key) const
{
    ::getdns_dict* dict_ptr = nullptr;
    MUST_BE_GOOD(::getdns_dict_get_dict(ptr_, key, &dict_ptr));
    return DictRef{dict_ptr};
}

template <>
Data::ListRef Data::DictRef::get<Data::ListRef>(const char* key) const
{
    ::getdns_list* list_ptr = nullptr;
    MUST_BE_GOOD(::getdns_dict_get_list(ptr_, key, &list_ptr));
    return ListRef{list_ptr};
}

template <>
std::uint32_t Data::DictRef::get<std::uint32_t>(const char* key) const
{
    std::uint32_t value = 0;
    MUST_BE_GOOD(::getdns_dict_get_int(ptr_, key, &value));
    return value;
}

Data::ListRef::ListRef(const ::getdns_list* ptr) noexcept
    : ptr_{ptr}
{ }

Data::ListRef::operator const ::getdns_list*() const noexcept
{
    return ptr_;
}

std::size_t Data::ListRef::length() const
{
    std::size_t length = 0;
    MUST_BE_GOOD(::getdns_list_get_length(ptr_, &length));
    return length;
}

template <>
Data::DictRef Data::ListRef::get<Data::DictRef>(std::size_t index) const
{
    ::getdns_dict* dict_ptr = nullptr;
    MUST_BE_GOOD(::getdns_list_get_dict(ptr_, index, &dict_ptr));
    return DictRef{dict_ptr};
}

Data::BinDataRef::BinDataRef(const ::getdns_bindata* ptr) noexcept
    : ptr_{ptr}
{ }

Data::BinDataRef::operator const ::getdns_bindata*() const noexcept
{
    return ptr_;
}

std::size_t Data::BinDataRef::size() const noexcept
{
    return ptr_->size;
}

const std::uint8_t* Data::BinDataRef::data() const noexcept
{
    return ptr_->data;
}

template <>
boost::asio::ip::address Data::BinDataRef::as<boost::asio::ip::address>() const
{
    boost::asio::ip::address_v4::bytes_type ipv4_bytes;
    if (this->size() == ipv4_bytes.size())
    {
        std::copy(this->data(), this->data() + this->size(), ipv4_bytes.begin());
        return boost::asio::ip::address_v4{ipv4_bytes};
    }
    boost::asio::ip::address_v6::bytes_type ipv6_bytes;
    if (this->size() == ipv6_bytes.size())
    {
        std::copy(this->data(), this->data() + this->size(), ipv6_bytes.begin());
        return boost::asio::ip::address_v6{ipv6_bytes};
    }
    throw WrongTypeRequested{::GETDNS_RETURN_WRONG_TYPE_REQUESTED, "binary data of unexpected size, ip address expected"};
}

Data::BinData::BinData(const void* binary_data, std::size_t bytes)
    : content_(static_cast<const std::uint8_t*>(binary_data), static_cast<const std::uint8_t*>(binary_data) + bytes)
{
    bindata_.data = content_.data();
    bindata_.size = content_.size();
}

Data::BinData::BinData(const std::string& text)
    : BinData{text.data(), text.size()}
{ }

Data::BinDataRef Data::BinData::operator*() const noexcept
{
    return BinDataRef{&bindata_};
}

Data::Dict::Dict(::getdns_dict* ptr) noexcept
    : ptr_{ptr}
{ }

Data::Dict::Dict(Dict&& src) noexcept
    : ptr_{nullptr}
{
    std::swap(src.ptr_, ptr_);
}

Data::Dict::~Dict()
{
    ::getdns_dict_destroy(ptr_);
}

Data::Dict& Data::Dict::operator=(Dict&& src) noexcept
{
    std::swap(src.ptr_, ptr_);
    return *this;
}

Data::DictRef Data::Dict::operator*() const noexcept
{
    return DictRef{ptr_};
}

Data::Dict& Data::Dict::set(const char* key, const Data::BinDataRef& value)
{
    MUST_BE_GOOD(::getdns_dict_set_bindata(ptr_, key, value));
    return *this;
}

Data::Dict& Data::Dict::set(const char* key, std::uint32_t value)
{
    MUST_BE_GOOD(::getdns_dict_set_int(ptr_, key, value));
    return *this;
}

Data::Dict& Data::Dict::set(const char* key, const Data::DictRef& value)
{
    MUST_BE_GOOD(::getdns_dict_set_dict(ptr_, key, value));
    return *this;
}

Data::Dict& Data::Dict::set(const char* key, const Data::ListRef& value)
{
    MUST_BE_GOOD(::getdns_dict_set_list(ptr_, key, value));
    return *this;
}

Data::List::List(::getdns_list* ptr) noexcept
    : ptr_{ptr}
{ }

Data::List::List(List&& src) noexcept
    : ptr_{nullptr}
{
    std::swap(src.ptr_, ptr_);
}

Data::List::~List()
{
    ::getdns_list_destroy(ptr_);
}

Data::List& Data::List::operator=(List&& src) noexcept
{
    std::swap(src.ptr_, ptr_);
    return *this;
}

Data::ListRef Data::List::operator*() const noexcept
{
    return ListRef{ptr_};
}

Data::List::operator ::getdns_list*() noexcept
{
    return ptr_;
}

Data::List& Data::List::push_back(const Data::DictRef& value)
{
    MUST_BE_GOOD(::getdns_list_set_dict(ptr_, (**this).length(), value));
    return *this;
}

}//namespace GetDns
