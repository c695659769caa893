/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#pragma once


#include <unionmount/configuration.hpp>

#include <fost/log>

#include <exception>


namespace unionmount {


    /// Describe the exception as JSON so that it can be logged. A fost
    /// exception is marked as handled.
    fostlib::json describe_exception(std::exception_ptr);

    /// Count a user exception
    void count_user_exception();


    /// Run the user supplied function. If it throws then the exception is
    /// logged and the default is returned instead.
    template<typename V, typename F>
    V intercept_exceptions(V default_value, F f) {
        try {
            return f();
        } catch ( ... ) {
            count_user_exception();
            fostlib::log::error(c_fost_unionmount)
                ("", "User exception")
                ("exception", describe_exception(std::current_exception()));
            return default_value;
        }
    }


}

