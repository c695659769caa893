/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#pragma once


#include <unionmount/exceptions.hpp>

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>


namespace unionmount {


    /// The type of a model update
    template<typename M>
    using transform = std::function<M(M)>;


    /// A reactive store for a model. Readers must see the `set` and
    /// `modify` calls in the order that they completed.
    template<typename M>
    class model_store {
    public:
        virtual ~model_store() = default;

        /// Replace the model
        virtual void set(M) = 0;
        /// Update the model in place
        virtual void modify(transform<M>) = 0;
        /// The current model
        virtual M read() = 0;
    };


    /// A model store that holds its value in memory. Reading blocks until
    /// the value has been set.
    template<typename M>
    class variable : public model_store<M> {
        std::mutex mutex;
        std::condition_variable signal;
        std::unique_ptr<M> value;
        std::size_t writes = 0;

    public:
        void set(M m) override {
            std::unique_lock<std::mutex> lock(mutex);
            value.reset(new M(std::move(m)));
            ++writes;
            signal.notify_all();
        }
        void modify(transform<M> f) override {
            std::unique_lock<std::mutex> lock(mutex);
            if ( !value ) {
                throw fostlib::exceptions::null(
                    "Trying to modify a variable that has not been set");
            }
            value.reset(new M(f(*value)));
            ++writes;
            signal.notify_all();
        }
        M read() override {
            std::unique_lock<std::mutex> lock(mutex);
            signal.wait(lock, [this]() { return bool(value); });
            return *value;
        }

        /// The number of completed `set` and `modify` calls
        std::size_t version() {
            std::unique_lock<std::mutex> lock(mutex);
            return writes;
        }
    };


    /// Applies each handler result to the store. The first result is used
    /// to `set` the store from the initial model and every later one to
    /// `modify` it.
    template<typename M>
    class model_driver {
    public:
        enum class state { awaiting_initial_set, initialized };

    private:
        std::mutex mutex;
        model_store<M> &store;
        const M model0;
        state current = state::awaiting_initial_set;

    public:
        model_driver(model_store<M> &s, M m)
        : store(s), model0(std::move(m)) {
        }
        model_driver(const model_driver &) = delete;
        model_driver &operator = (const model_driver &) = delete;

        /// Run the handler and apply its update. If either the handler or
        /// the update it returns throws, the exception is logged and the
        /// model is left alone. Even then the first call moves the driver
        /// to `initialized`, so a later update is applied with `modify`.
        void operator () (std::function<transform<M>()> handle) {
            auto update = intercept_exceptions(
                transform<M>([](M m) { return m; }), handle);
            std::unique_lock<std::mutex> lock(mutex);
            const auto previous = current;
            current = state::initialized;
            if ( previous == state::awaiting_initial_set ) {
                store.set(intercept_exceptions(model0,
                    [this, &update]() { return update(model0); }));
            } else {
                store.modify([update](M m) {
                    M prior(m);
                    return intercept_exceptions(std::move(prior),
                        [&update, &m]() { return update(std::move(m)); });
                });
            }
        }

        state status() {
            std::unique_lock<std::mutex> lock(mutex);
            return current;
        }
    };


}

