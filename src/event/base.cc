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

#include <utility>


namespace Event {

namespace {

::event_base* create_event_base()
{
    ::event_base* const ptr = ::event_base_new();
    if (ptr != nullptr)
    {
        return ptr;
    }
    struct BaseException : Exception
    {
        const char* what() const noexcept override { return "Could not create event base"; }
    };
    throw BaseException{};
}

auto to_timeval(std::chrono::microseconds t)
{
    struct ::timeval result;
    static constexpr auto units_per_second = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::seconds{1}).count();
    result.tv_sec = t.count() / units_per_second;
    result.tv_usec = t.count() % units_per_second;
    return result;
}

}//namespace Event::{anonymous}

Base::Base()
    : ptr_{create_event_base()},
      next_turn_event_{::event_new(ptr_, -1, 0, next_turn_routine, this)}
{
    if (next_turn_event_ == nullptr)
    {
        ::event_base_free(ptr_);
        struct EventNewFailure : Exception
        {
            const char* what() const noexcept override { return "event_new failed"; }
        };
        throw EventNewFailure{};
    }
}

Base::~Base()
{
    deferred_.clear();
    if (next_turn_event_ != nullptr)
    {
        ::event_del(next_turn_event_);
        ::event_free(next_turn_event_);
        next_turn_event_ = nullptr;
    }
    if (ptr_ != nullptr)
    {
        ::event_base_free(ptr_);
        ptr_ = nullptr;
    }
}

Base::Result Base::loop(int flags)
{
    switch (::event_base_loop(ptr_, flags))
    {
        case 0:
            return Result::success;
        case 1:
            return Result::no_events;
        case -1:
            {
                struct DispatchingException : Exception
                {
                    const char* what() const noexcept override { return "Error occurred during events loop"; }
                };
                throw DispatchingException{};
            }
    }
    struct DispatchingException : Exception
    {
        const char* what() const noexcept override { return "event_base_loop returned unexpected value"; }
    };
    throw DispatchingException{};
}

Base::operator ::event_base*() noexcept
{
    return ptr_;
}

Base& Base::defer(Deferred fn)
{
    const bool next_turn_already_scheduled = !deferred_.empty();
    deferred_.push_back(std::move(fn));
    if (!next_turn_already_scheduled)
    {
        ::event_active(next_turn_event_, EV_TIMEOUT, 0);
    }
    return *this;
}

std::size_t Base::get_number_of_deferred() const noexcept
{
    return deferred_.size();
}

void Base::run_deferred()
{
    //functions queued from now on belong to the next turn
    std::deque<Deferred> ready;
    std::swap(ready, deferred_);
    while (!ready.empty())
    {
        const Deferred fn = std::move(ready.front());
        ready.pop_front();
        try
        {
            fn();
        }
        catch (const std::exception& e)
        {
            std::cerr << "deferred call failed: " << e.what() << std::endl;
        }
        catch (...)
        {
            std::cerr << "deferred call threw unexpected exception" << std::endl;
        }
    }
}

void Base::next_turn_routine(evutil_socket_t, short, void* user_data_ptr)
{
    auto* const base_ptr = static_cast<Base*>(user_data_ptr);
    if (base_ptr != nullptr)
    {
        base_ptr->run_deferred();
    }
}

TimeoutEvent::TimeoutEvent(Base& base, ::event_callback_fn on_timeout, void* user_data_ptr)
    : event_ptr_{evtimer_new(static_cast<::event_base*>(base), on_timeout, user_data_ptr)}
{
    if (event_ptr_ == nullptr)
    {
        struct EventNewFailure : Exception
        {
            const char* what() const noexcept override { return "evtimer_new failed"; }
        };
        throw EventNewFailure{};
    }
}

TimeoutEvent::~TimeoutEvent()
{
    if (event_ptr_ != nullptr)
    {
        ::event_del(event_ptr_);
        ::event_free(event_ptr_);
    }
}

TimeoutEvent& TimeoutEvent::set(std::chrono::microseconds timeout)
{
    const auto wait_at_most = [&]()
    {
        static constexpr auto min_timeout = std::chrono::microseconds{1000};
        static_assert((std::chrono::seconds::zero() <= min_timeout) && (min_timeout < std::chrono::seconds{1}));
        const bool timeout_too_short = timeout < min_timeout;
        return timeout_too_short ? to_timeval(min_timeout)
                                 : to_timeval(timeout);
    }();
    const int retval = ::event_add(event_ptr_, &wait_at_most);
    static constexpr int success = 0;
    if (retval == success)
    {
        return *this;
    }
    struct EventAddFailure : Exception
    {
        const char* what() const noexcept override { return "event_add failed"; }
    };
    throw EventAddFailure{};
}

TimeoutEvent& TimeoutEvent::remove()
{
    ::event_del(event_ptr_);
    return *this;
}

bool TimeoutEvent::is_pending() const noexcept
{
    return ::event_pending(event_ptr_, EV_TIMEOUT, nullptr) != 0;
}

}//namespace Event
