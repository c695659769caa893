/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#pragma once


#include <unionmount/file_action.hpp>

#include <boost/asio/io_service.hpp>
#include <boost/filesystem/path.hpp>

#include <functional>
#include <memory>


namespace unionmount {


    /// A change observed under one of the source roots
    struct event {
        /// The index of the source in the mount
        std::size_t source = 0;
        /// Relative to the source root, unless a symlinked directory took
        /// it outside of the root, in which case it is absolute
        boost::filesystem::path path;
        file_action<void> action;
    };


    /// Where a notification sends its events. It may block.
    using event_sink = std::function<void(event)>;


    /// File system notifications for one source root
    class notification {
    public:
        /// Canonicalise the root and watch it and every directory below it.
        /// Throws if the root cannot be watched
        notification(boost::asio::io_service &, std::size_t source,
            const boost::filesystem::path &root, event_sink);
        /// Destruct it
        ~notification();

        /// Start processing the notifications
        void operator() ();
        /// The number of directories currently watched
        std::size_t watches() const;

    private:
        struct impl;
        std::unique_ptr<impl> pimpl;
    };


}

