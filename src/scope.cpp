/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#include <unionmount/configuration.hpp>
#include <unionmount/exceptions.hpp>
#include <unionmount/scope.hpp>

#include <fost/log>


void unionmount::scope::stop() {
    std::unique_lock<std::mutex> lock(mutex);
    is_stopped = true;
    signal.notify_all();
}


void unionmount::scope::fail(std::exception_ptr eptr) {
    auto description = describe_exception(eptr);
    std::unique_lock<std::mutex> lock(mutex);
    if ( fault ) {
        fostlib::log::warning(c_fost_unionmount)
            ("", "Further fault after the mount was already failing")
            ("exception", description);
    } else {
        fostlib::log::critical(c_fost_unionmount)
            ("", "Unrecovered fault, stopping the mount")
            ("exception", description);
        fault = eptr;
    }
    is_stopped = true;
    signal.notify_all();
}


bool unionmount::scope::stopped() const {
    std::unique_lock<std::mutex> lock(mutex);
    return is_stopped;
}


void unionmount::scope::wait() {
    std::unique_lock<std::mutex> lock(mutex);
    signal.wait(lock, [this]() { return is_stopped; });
}


void unionmount::scope::rethrow() const {
    std::exception_ptr eptr;
    {
        std::unique_lock<std::mutex> lock(mutex);
        eptr = fault;
    }
    if ( eptr ) std::rethrow_exception(eptr);
}

