/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#include <unionmount/rendezvous.hpp>
#include <fost/test>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>


FSL_TEST_SUITE(rendezvous);


FSL_TEST_FUNCTION(items_arrive_in_order) {
    unionmount::rendezvous<int> queue;
    std::thread producer([&queue]() {
        for ( int i = 0; i != 100; ++i ) {
            if ( !queue.put(i) ) return;
        }
    });
    for ( int expected = 0; expected != 100; ++expected ) {
        int got = -1;
        FSL_CHECK(queue.take(got));
        FSL_CHECK_EQ(got, expected);
    }
    producer.join();
}


FSL_TEST_FUNCTION(put_waits_for_take) {
    unionmount::rendezvous<int> queue;
    std::atomic<bool> returned{false};
    std::thread producer([&queue, &returned]() {
        if ( queue.put(42) ) returned = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    FSL_CHECK(not returned);
    int got = 0;
    FSL_CHECK(queue.take(got));
    producer.join();
    FSL_CHECK(returned);
    FSL_CHECK_EQ(got, 42);
}


FSL_TEST_FUNCTION(close_releases_producers_and_consumer) {
    unionmount::rendezvous<int> queue;
    std::atomic<int> refused{0};
    std::vector<std::thread> producers;
    for ( int p = 0; p != 3; ++p ) {
        producers.emplace_back([&queue, &refused, p]() {
            if ( !queue.put(p) ) ++refused;
        });
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    queue.close();
    for ( auto &t : producers ) t.join();
    FSL_CHECK_EQ(refused.load(), 3);
    int got = 0;
    FSL_CHECK(not queue.take(got));
    FSL_CHECK(not queue.put(4));
}


FSL_TEST_FUNCTION(many_producers_one_consumer) {
    unionmount::rendezvous<std::pair<int, int>> queue;
    std::vector<std::thread> producers;
    for ( int p = 0; p != 4; ++p ) {
        producers.emplace_back([&queue, p]() {
            for ( int i = 0; i != 25; ++i ) {
                if ( !queue.put(std::make_pair(p, i)) ) return;
            }
        });
    }
    std::vector<int> next(4, 0);
    for ( int count = 0; count != 100; ++count ) {
        std::pair<int, int> got;
        FSL_CHECK(queue.take(got));
        /// Each producer's items stay in order
        FSL_CHECK_EQ(got.second, next[got.first]);
        ++next[got.first];
    }
    for ( auto &t : producers ) t.join();
}

