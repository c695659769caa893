/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#pragma once


#include <condition_variable>
#include <memory>
#include <mutex>


namespace unionmount {


    /// A synchronous hand-off between any number of producers and one
    /// consumer. It holds at most one item and `put` only returns once the
    /// consumer has taken the item, so items are consumed strictly in the
    /// order that they were handed over.
    template<typename V>
    class rendezvous {
        std::mutex mutex;
        std::condition_variable signal;
        std::unique_ptr<V> slot;
        std::size_t given = 0, taken = 0;
        bool closed = false;

    public:
        rendezvous() = default;
        rendezvous(const rendezvous &) = delete;
        rendezvous &operator = (const rendezvous &) = delete;

        /// Hand the item over, blocking until it has been taken. Returns
        /// false if the rendezvous was closed before the item was taken.
        bool put(V v) {
            std::unique_lock<std::mutex> lock(mutex);
            signal.wait(lock, [this]() { return closed || !slot; });
            if ( closed ) return false;
            slot.reset(new V(std::move(v)));
            const auto ticket = ++given;
            signal.notify_all();
            signal.wait(lock, [this, ticket]() { return closed || taken >= ticket; });
            return taken >= ticket;
        }

        /// Block until an item is available and move it into `v`. Returns
        /// false once the rendezvous has been closed.
        bool take(V &v) {
            std::unique_lock<std::mutex> lock(mutex);
            signal.wait(lock, [this]() { return closed || slot; });
            if ( closed ) return false;
            v = std::move(*slot);
            slot.reset();
            ++taken;
            signal.notify_all();
            return true;
        }

        /// Release every blocked producer and consumer. Nothing more can be
        /// handed over after this.
        void close() {
            std::unique_lock<std::mutex> lock(mutex);
            closed = true;
            signal.notify_all();
        }
    };


}

