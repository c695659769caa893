/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#include <unionmount/model.hpp>
#include <fost/test>

#include <stdexcept>


FSL_TEST_SUITE(model);


namespace {
    /// Records how the driver uses the store
    struct recording_store : public unionmount::model_store<int> {
        int value = -1;
        std::size_t sets = 0, modifies = 0;

        void set(int v) override {
            ++sets;
            value = v;
        }
        void modify(unionmount::transform<int> f) override {
            ++modifies;
            value = f(value);
        }
        int read() override {
            return value;
        }
    };

    unionmount::transform<int> add(int n) {
        return [n](int v) { return v + n; };
    }
}


FSL_TEST_FUNCTION(set_exactly_once) {
    recording_store store;
    unionmount::model_driver<int> driver(store, 10);
    FSL_CHECK(driver.status() ==
        unionmount::model_driver<int>::state::awaiting_initial_set);
    driver([]() { return add(1); });
    FSL_CHECK(driver.status() ==
        unionmount::model_driver<int>::state::initialized);
    FSL_CHECK_EQ(store.value, 11);
    for ( int n = 0; n != 4; ++n ) {
        driver([]() { return add(2); });
    }
    FSL_CHECK_EQ(store.sets, 1u);
    FSL_CHECK_EQ(store.modifies, 4u);
    FSL_CHECK_EQ(store.read(), 19);
}


FSL_TEST_FUNCTION(faulted_batch_leaves_model_alone) {
    recording_store store;
    unionmount::model_driver<int> driver(store, 0);
    driver([]() { return add(5); });
    driver([]() -> unionmount::transform<int> {
        throw std::runtime_error("handler failed");
    });
    FSL_CHECK_EQ(store.value, 5);
    driver([]() { return add(1); });
    FSL_CHECK_EQ(store.value, 6);
    FSL_CHECK_EQ(store.sets, 1u);
    FSL_CHECK_EQ(store.modifies, 2u);
}


FSL_TEST_FUNCTION(faulted_first_batch_still_initializes) {
    recording_store store;
    unionmount::model_driver<int> driver(store, 7);
    driver([]() -> unionmount::transform<int> {
        throw fostlib::exceptions::not_implemented("first batch failed");
    });
    FSL_CHECK(driver.status() ==
        unionmount::model_driver<int>::state::initialized);
    FSL_CHECK_EQ(store.sets, 1u);
    FSL_CHECK_EQ(store.value, 7);
    driver([]() { return add(3); });
    FSL_CHECK_EQ(store.sets, 1u);
    FSL_CHECK_EQ(store.modifies, 1u);
    FSL_CHECK_EQ(store.value, 10);
}


FSL_TEST_FUNCTION(throwing_update_leaves_model_alone) {
    const auto fails = []() -> unionmount::transform<int> {
        return [](int) -> int {
            throw std::runtime_error("update failed");
        };
    };
    recording_store store;
    unionmount::model_driver<int> driver(store, 4);
    driver(fails);
    FSL_CHECK_EQ(store.sets, 1u);
    FSL_CHECK_EQ(store.value, 4);
    driver([]() { return add(1); });
    FSL_CHECK_EQ(store.value, 5);
    driver(fails);
    FSL_CHECK_EQ(store.value, 5);
    driver([]() { return add(2); });
    FSL_CHECK_EQ(store.value, 7);
    FSL_CHECK_EQ(store.sets, 1u);
    FSL_CHECK_EQ(store.modifies, 3u);
}


FSL_TEST_FUNCTION(throwing_update_on_a_variable) {
    unionmount::variable<int> v;
    unionmount::model_driver<int> driver(v, 1);
    driver([]() -> unionmount::transform<int> {
        return [](int) -> int { throw std::logic_error("first"); };
    });
    FSL_CHECK_EQ(v.read(), 1);
    driver([]() { return add(2); });
    FSL_CHECK_EQ(v.read(), 3);
    FSL_CHECK_EQ(v.version(), 2u);
}


FSL_TEST_FUNCTION(variable_counts_writes) {
    unionmount::variable<int> v;
    FSL_CHECK_EQ(v.version(), 0u);
    FSL_CHECK_EXCEPTION(v.modify(add(1)), fostlib::exceptions::null&);
    v.set(3);
    v.modify(add(4));
    FSL_CHECK_EQ(v.read(), 7);
    FSL_CHECK_EQ(v.version(), 2u);
}


FSL_TEST_FUNCTION(intercept_returns_default) {
    FSL_CHECK_EQ(unionmount::intercept_exceptions(1, []() { return 2; }), 2);
    FSL_CHECK_EQ(unionmount::intercept_exceptions(1, []() -> int {
        throw std::logic_error("nope");
    }), 1);
}

