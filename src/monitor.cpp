/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#include <unionmount/configuration.hpp>
#include <unionmount/monitor.hpp>
#include <unionmount/pool.hpp>
#include <unionmount/rendezvous.hpp>

#include <fost/counter>
#include <fost/log>

#include <thread>


namespace {
    fostlib::performance p_handed_over(unionmount::c_fost_unionmount,
        "monitor", "events", "handed-over");
    fostlib::performance p_dropped(unionmount::c_fost_unionmount,
        "monitor", "events", "dropped-after-stop");
    fostlib::performance p_consumed(unionmount::c_fost_unionmount,
        "monitor", "events", "consumed");
}


struct unionmount::monitor::impl {
    unionmount::scope &stop;
    rendezvous<event> queue;
    /// One thread per source so that each can block handing over
    pool producers;
    std::vector<std::unique_ptr<notification>> watches;

    impl(const std::vector<boost::filesystem::path> &roots, unionmount::scope &s)
    : stop(s), producers(roots.size(), [&s](std::exception_ptr e) { s.fail(e); }) {
        for ( std::size_t index = 0; index != roots.size(); ++index ) {
            watches.emplace_back(new notification(
                producers.io_service, index, roots[index],
                [this](event e) {
                    const auto source = e.source;
                    const auto path = e.path;
                    if ( queue.put(std::move(e)) ) {
                        ++p_handed_over;
                    } else {
                        ++p_dropped;
                        fostlib::log::warning(c_fost_unionmount)
                            ("", "Event dropped because the mount is stopping")
                            ("source", source)
                            ("path", path);
                    }
                }));
        }
    }
    /// The readers must not be destroyed whilst the threads can still
    /// call into them
    ~impl() {
        queue.close();
        producers.stop();
    }
};


unionmount::monitor::monitor(
    const std::vector<boost::filesystem::path> &roots, scope &s
) : pimpl(new impl(roots, s)) {
}


unionmount::monitor::~monitor() = default;


void unionmount::monitor::operator () (std::function<void(const event &)> consume) {
    for ( auto &watch : pimpl->watches ) (*watch)();
    auto &stop = pimpl->stop;
    auto &queue = pimpl->queue;
    std::thread consumer([&stop, &queue, consume]() {
        try {
            event e;
            while ( queue.take(e) ) {
                ++p_consumed;
                consume(e);
            }
            stop.stop();
        } catch ( ... ) {
            stop.fail(std::current_exception());
        }
    });
    stop.wait();
    fostlib::log::info(c_fost_unionmount, "Stopping change monitor");
    queue.close();
    consumer.join();
    pimpl->producers.stop();
    stop.rethrow();
}

