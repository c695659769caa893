/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#pragma once


#include <unionmount/file_action.hpp>

#include <cstdint>


namespace unionmount {


    /// The kinds of native event we care about
    enum class native_event {
        /// Not something we report (open, access, close etc.)
        none,
        added,
        modified,
        removed,
        /// The kernel lost track (e.g. the event queue overflowed)
        unknown
    };


    /// Classify an inotify event mask
    native_event classify(uint32_t mask);

    /// The action reported for the native event
    file_action<void> translate(native_event);


}

