/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#include <unionmount/configuration.hpp>
#include <unionmount/pool.hpp>

#include <fost/log>

#include <algorithm>
#include <thread>
#include <vector>


using namespace fostlib;
namespace asio = boost::asio;


struct unionmount::pool::impl {
    impl(unionmount::pool &p, std::function<void(std::exception_ptr)> f)
    : fault(std::move(f)), work(new asio::io_service::work(p.io_service)) {
    }

    std::function<void(std::exception_ptr)> fault;
    std::vector<std::thread> threads;
    std::unique_ptr<asio::io_service::work> work;
};


unionmount::pool::pool(
    std::size_t threads, std::function<void(std::exception_ptr)> fault
) : pimpl(new impl(*this, std::move(fault))) {
    for ( auto t = 0u; t != threads; ++t ) {
        pimpl->threads.emplace_back([this]() {
            try {
                io_service.run();
            } catch ( ... ) {
                log::error(c_fost_unionmount, "Pool thread caught an exception");
                pimpl->fault(std::current_exception());
            }
        });
    }
}


unionmount::pool::~pool() {
    stop();
}


void unionmount::pool::stop() {
    if ( pimpl->threads.empty() ) return;
    log::debug(c_fost_unionmount, "Terminating thread pool");
    pimpl->work.reset();
    io_service.stop();
    std::for_each(pimpl->threads.begin(), pimpl->threads.end(), [](auto &t){ t.join(); });
    pimpl->threads.clear();
}

