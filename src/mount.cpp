/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#include <unionmount/mount.hpp>

#include <fost/counter>


namespace {
    fostlib::performance p_dropped(unionmount::c_fost_unionmount,
        "mount", "changes", "dropped");
    fostlib::performance p_batches(unionmount::c_fost_unionmount,
        "mount", "batches");
}


void unionmount::count_dropped_change() {
    ++p_dropped;
}


void unionmount::count_batch() {
    ++p_batches;
}

