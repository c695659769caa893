/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#pragma once


#include <unionmount/notification.hpp>
#include <unionmount/scope.hpp>

#include <vector>


namespace unionmount {


    /// Watches all of the source roots and feeds their events, one at a
    /// time, to a single consumer.
    class monitor {
    public:
        /// Set up the watches for the roots, the index of each root being
        /// its source number in the events. Throws if any root can't be
        /// watched.
        monitor(const std::vector<boost::filesystem::path> &roots, scope &);
        /// Stops the watches
        ~monitor();

        /// Run the watches and the consumer until the scope is stopped,
        /// either from outside or by a fault in a watch or in the
        /// consumer. The first fault is rethrown.
        void operator () (std::function<void(const event &)> consume);

    private:
        struct impl;
        std::unique_ptr<impl> pimpl;
    };


}

