/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#include <unionmount/exceptions.hpp>

#include <fost/counter>
#include <fost/insert>

#include <typeinfo>


namespace {
    fostlib::performance p_user_exceptions(unionmount::c_fost_unionmount,
        "handler", "exceptions");
}


fostlib::json unionmount::describe_exception(std::exception_ptr eptr) {
    fostlib::json description;
    if ( !eptr ) return description;
    try {
        std::rethrow_exception(eptr);
    } catch ( fostlib::exceptions::exception &e ) {
        fostlib::insert(description, "message", e.message());
        fostlib::insert(description, "data", e.data());
        fostlib::absorb_exception();
    } catch ( std::exception &e ) {
        fostlib::insert(description, "what", e.what());
        fostlib::insert(description, "type", "name", typeid(e).name());
    } catch ( ... ) {
        fostlib::insert(description, "what", "Unknown exception type");
    }
    return description;
}


void unionmount::count_user_exception() {
    ++p_user_exceptions;
}

