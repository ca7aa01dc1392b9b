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

#ifndef BASE_HH_32D195DD34FB9368357A0101AA561CD6//date "+%s"|md5sum|tr "[a-f]" "[A-F]"
#define BASE_HH_32D195DD34FB9368357A0101AA561CD6

#include <event2/event.h>

#include <chrono>
#include <deque>
#include <exception>
#include <functional>
#include <iostream>


namespace Event {

struct Exception : std::exception { };

struct Loop
{
    template <typename> struct Flag { };
    using Once = Flag<struct Once_>;
    using Nonblock = Flag<struct Nonblock_>;
};

class Base
{
public:
    explicit Base();
    Base(const Base&) = delete;
    Base& operator=(const Base&) = delete;
    ~Base();
    enum class Result
    {
        success,
        no_events
    };
    template <typename ...Tags>
    Result operator()(Loop::Flag<Tags>...);
    operator ::event_base*() noexcept;
    using Deferred = std::function<void()>;
    /**
     * Queues `fn` to be called from the event loop, never before this function returns.
     * Functions are called in the order they were queued.
     */
    Base& defer(Deferred fn);
    std::size_t get_number_of_deferred() const noexcept;
private:
    static constexpr int as_int() noexcept { return 0; }
    static constexpr int as_int(Loop::Once) noexcept { return EVLOOP_ONCE; }
    static constexpr int as_int(Loop::Nonblock) noexcept { return EVLOOP_NONBLOCK; }
    template <typename FirstTag, typename ...Tags>
    static constexpr int as_int(Loop::Flag<FirstTag> first_flag, Loop::Flag<Tags> ...other_flags) noexcept
    {
        static_assert(as_int(first_flag) != 0);
        return as_int(first_flag) | as_int(other_flags...);
    }
    Result loop(int flags);
    void run_deferred();
    static void next_turn_routine(evutil_socket_t, short, void* user_data_ptr);
    ::event_base* ptr_;
    struct ::event* next_turn_event_;
    std::deque<Deferred> deferred_;
};


template <typename ...Tags>
Base::Result Base::operator()(Loop::Flag<Tags> ...flags)
{
    return this->loop(as_int(flags...));
}

class TimeoutEvent
{
public:
    TimeoutEvent(Base& base, ::event_callback_fn on_timeout, void* user_data_ptr);
    TimeoutEvent(const TimeoutEvent&) = delete;
    TimeoutEvent& operator=(const TimeoutEvent&) = delete;
    ~TimeoutEvent();
    TimeoutEvent& set(std::chrono::microseconds timeout);
    TimeoutEvent& remove();
    bool is_pending() const noexcept;
private:
    struct ::event* event_ptr_;
};

template <typename Derived>
class OnTimeout
{
public:
    explicit OnTimeout(Base& base);
    OnTimeout& set(std::chrono::microseconds timeout);
    OnTimeout& remove();
    bool is_pending() const noexcept;
private:
    static void callback_routine(evutil_socket_t, short events, void* user_data_ptr);
    TimeoutEvent timeout_event_;
};

template <typename Derived>
OnTimeout<Derived>::OnTimeout(Base& base)
    : timeout_event_{base, callback_routine, this}
{ }

template <typename Derived>
OnTimeout<Derived>& OnTimeout<Derived>::set(std::chrono::microseconds timeout)
{
    timeout_event_.set(timeout);
    return *this;
}

template <typename Derived>
OnTimeout<Derived>& OnTimeout<Derived>::remove()
{
    timeout_event_.remove();
    return *this;
}

template <typename Derived>
bool OnTimeout<Derived>::is_pending() const noexcept
{
    return timeout_event_.is_pending();
}

template <typename Derived>
void OnTimeout<Derived>::callback_routine(evutil_socket_t, short events, void* user_data_ptr)
{
    auto* const event_ptr = static_cast<OnTimeout<Derived>*>(user_data_ptr);
    if (event_ptr != nullptr)
    {
        try
        {
            static_assert(EV_TIMEOUT != 0);
            const bool timeout_occured = (events & EV_TIMEOUT) == EV_TIMEOUT;
            if (timeout_occured)
            {
                static_cast<Derived*>(event_ptr)->on_timeout_occurrence();
            }
        }
        catch (const std::exception& e)
        {
            std::cerr << "Timeout::on_event failed: " << e.what() << std::endl;
        }
        catch (...)
        {
            std::cerr << "Timeout::on_event threw unexpected exception" << std::endl;
        }
    }
}

}//namespace Event

#endif//BASE_HH_32D195DD34FB9368357A0101AA561CD6
