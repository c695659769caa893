/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#pragma once


#include <condition_variable>
#include <exception>
#include <mutex>


namespace unionmount {


    /// Cooperative cancellation shared by the tasks of a mount. The first
    /// of them to stop, fail or be stopped from outside stops all of them.
    class scope {
        mutable std::mutex mutex;
        std::condition_variable signal;
        bool is_stopped = false;
        std::exception_ptr fault;

    public:
        scope() = default;
        scope(const scope &) = delete;
        scope &operator = (const scope &) = delete;

        /// Stop without error
        void stop();
        /// Stop because of an unrecovered fault. Only the first fault is
        /// kept, later ones are logged
        void fail(std::exception_ptr);

        /// True once stopped
        bool stopped() const;
        /// Block until stopped
        void wait();
        /// Throw the fault that stopped the scope, if there was one
        void rethrow() const;
    };


}

