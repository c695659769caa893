/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#include <unionmount/scope.hpp>
#include <fost/core>
#include <fost/test>

#include <stdexcept>
#include <thread>


FSL_TEST_SUITE(scope);


FSL_TEST_FUNCTION(stop_releases_wait) {
    unionmount::scope s;
    FSL_CHECK(not s.stopped());
    std::thread stopper([&s]() { s.stop(); });
    s.wait();
    stopper.join();
    FSL_CHECK(s.stopped());
    s.rethrow();
}


FSL_TEST_FUNCTION(first_fault_is_kept) {
    unionmount::scope s;
    s.fail(std::make_exception_ptr(
        fostlib::exceptions::not_implemented("first")));
    s.fail(std::make_exception_ptr(std::runtime_error("second")));
    s.wait();
    FSL_CHECK(s.stopped());
    FSL_CHECK_EXCEPTION(s.rethrow(), fostlib::exceptions::not_implemented&);
}


FSL_TEST_FUNCTION(stop_then_fault_still_faults) {
    unionmount::scope s;
    s.stop();
    s.fail(std::make_exception_ptr(std::runtime_error("late")));
    FSL_CHECK_EXCEPTION(s.rethrow(), std::runtime_error&);
}

