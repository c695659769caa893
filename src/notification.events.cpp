/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#include "notification.events.hpp"

#include <sys/inotify.h>


unionmount::native_event unionmount::classify(uint32_t mask) {
    if ( mask & (IN_CREATE | IN_MOVED_TO) ) {
        return native_event::added;
    } else if ( mask & IN_MODIFY ) {
        return native_event::modified;
    } else if ( mask & (IN_DELETE | IN_MOVED_FROM) ) {
        return native_event::removed;
    } else if ( mask & IN_Q_OVERFLOW ) {
        return native_event::unknown;
    } else {
        return native_event::none;
    }
}


unionmount::file_action<void> unionmount::translate(native_event e) {
    switch ( e ) {
    case native_event::added:
        return file_action<void>::refresh(refresh_action::created);
    case native_event::modified:
        return file_action<void>::refresh(refresh_action::updated);
    default:
        return file_action<void>::deletion();
    }
}

