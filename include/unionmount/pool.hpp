/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#pragma once


#include <cstddef>
#include <exception>
#include <functional>
#include <memory>

#include <boost/asio/io_service.hpp>


namespace unionmount {


    /// A Boost.ASIO service worker pool. An exception escaping a handler
    /// is passed to the fault function and ends that thread.
    class pool {
    public:
        /// The Boost ASIO service
        boost::asio::io_service io_service;

        /// Determine how many threads are to service requests
        pool(std::size_t threads, std::function<void(std::exception_ptr)> fault);
        /// Stop processing on all threads
        ~pool();

        /// Make non-copyable and non assignable
        pool(const pool &) = delete;
        pool &operator = (const pool &) = delete;

        /// Stop the service and wait for the threads to finish. Safe to
        /// call more than once
        void stop();

    private:
        struct impl;
        std::unique_ptr<impl> pimpl;
    };


}

