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

#ifndef DATA_HH_4BD03E3BE61C61ADC6A6590A94FC068D//date "+%s"|md5sum|tr "[a-f]" "[A-F]"
#define DATA_HH_4BD03E3BE61C61ADC6A6590A94FC068D

#include "src/getdns/exception.hh"

#include <boost/asio/ip/address.hpp>
#include <boost/optional.hpp>

#include <getdns/getdns.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace GetDns {

struct Data
{
    class BinData;
    class BinDataRef;
    class Dict;
    class DictRef;
    class List;
    class ListRef;
};

class Data::DictRef
{
public:
    explicit DictRef(const ::getdns_dict* ptr) noexcept;
    operator const ::getdns_dict*() const noexcept;
    template <typename T>
    T get(const char* key) const;
    //none if there is no item named `key`
    template <typename T>
    boost::optional<T> find(const char* key) const;
private:
    const ::getdns_dict* ptr_;
};

template <> Data::BinDataRef Data::DictRef::get<Data::BinDataRef>(const char* key) const;
template <> Data::DictRef Data::DictRef::get<Data::DictRef>(const char* key) const;
template <> Data::ListRef Data::DictRef::get<Data::ListRef>(const char* key) const;
template <> std::uint32_t Data::DictRef::get<std::uint32_t>(const char* key) const;

class Data::ListRef
{
public:
    explicit ListRef(const ::getdns_list* ptr) noexcept;
    operator const ::getdns_list*() const noexcept;
    std::size_t length() const;
    template <typename T>
    T get(std::size_t index) const;
private:
    const ::getdns_list* ptr_;
};

template <> Data::DictRef Data::ListRef::get<Data::DictRef>(std::size_t index) const;

class Data::BinDataRef
{
public:
    explicit BinDataRef(const ::getdns_bindata* ptr) noexcept;
    operator const ::getdns_bindata*() const noexcept;
    std::size_t size() const noexcept;
    const std::uint8_t* data() const noexcept;
    template <typename T>
    T as() const;
private:
    const ::getdns_bindata* ptr_;
};

//expects 4 bytes of IPv4 or 16 bytes of IPv6 address in network byte order
template <> boost::asio::ip::address Data::BinDataRef::as<boost::asio::ip::address>() const;

class Data::BinData
{
public:
    BinData(const void* binary_data, std::size_t bytes);
    explicit BinData(const std::string& text);
    BinData(const BinData&) = delete;
    BinData& operator=(const BinData&) = delete;
    Data::BinDataRef operator*() const noexcept;
private:
    std::vector<std::uint8_t> content_;
    ::getdns_bindata bindata_;
};

class Data::Dict
{
public:
    explicit Dict(::getdns_dict* ptr) noexcept;
    Dict(Dict&& src) noexcept;
    Dict(const Dict&) = delete;
    ~Dict();
    Dict& operator=(Dict&& src) noexcept;
    Dict& operator=(const Dict&) = delete;
    Data::DictRef operator*() const noexcept;
    Dict& set(const char* key, const Data::BinDataRef& value);
    Dict& set(const char* key, std::uint32_t value);
    Dict& set(const char* key, const Data::DictRef& value);
    Dict& set(const char* key, const Data::ListRef& value);
private:
    ::getdns_dict* ptr_;
};

class Data::List
{
public:
    explicit List(::getdns_list* ptr) noexcept;
    List(List&& src) noexcept;
    List(const List&) = delete;
    ~List();
    List& operator=(List&& src) noexcept;
    List& operator=(const List&) = delete;
    Data::ListRef operator*() const noexcept;
    operator ::getdns_list*() noexcept;
    List& push_back(const Data::DictRef& value);
private:
    ::getdns_list* ptr_;
};

template <typename T>
boost::optional<T> Data::DictRef::find(const char* key) const
{
    ::getdns_data_type type;
    const auto result = ::getdns_dict_get_data_type(ptr_, key, &type);
    if (result == ::GETDNS_RETURN_NO_SUCH_DICT_NAME)
    {
        return boost::none;
    }
    MUST_BE_GOOD(result);
    return this->get<T>(key);
}

}//namespace GetDns

#endif//DATA_HH_4BD03E3BE61C61ADC6A6590A94FC068D
