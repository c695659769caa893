/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#include <unionmount/json.hpp>


fostlib::json fostlib::coercer<fostlib::json, unionmount::refresh_action>::coerce(
    unionmount::refresh_action a
) {
    switch ( a ) {
    case unionmount::refresh_action::existing:
        return json("existing");
    case unionmount::refresh_action::created:
        return json("created");
    case unionmount::refresh_action::updated:
        return json("updated");
    }
    throw fostlib::exceptions::not_implemented(
        "Unknown refresh action", fostlib::coerce<fostlib::string>(int(a)));
}

