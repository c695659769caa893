/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#include "notification.events.hpp"
#include "paths.hpp"
#include <unionmount/notification.hpp>
#include <unionmount/pool.hpp>
#include <fost/test>

#include <boost/filesystem.hpp>

#include <chrono>
#include <thread>

#include <sys/inotify.h>


FSL_TEST_SUITE(notification);


FSL_TEST_FUNCTION(classify) {
    using unionmount::native_event;
    FSL_CHECK(unionmount::classify(IN_CREATE) == native_event::added);
    FSL_CHECK(unionmount::classify(IN_MOVED_TO) == native_event::added);
    FSL_CHECK(unionmount::classify(IN_CREATE | IN_ISDIR) == native_event::added);
    FSL_CHECK(unionmount::classify(IN_MODIFY) == native_event::modified);
    FSL_CHECK(unionmount::classify(IN_DELETE) == native_event::removed);
    FSL_CHECK(unionmount::classify(IN_MOVED_FROM) == native_event::removed);
    FSL_CHECK(unionmount::classify(IN_Q_OVERFLOW) == native_event::unknown);
    FSL_CHECK(unionmount::classify(IN_OPEN) == native_event::none);
    FSL_CHECK(unionmount::classify(IN_ACCESS) == native_event::none);
    FSL_CHECK(unionmount::classify(IN_CLOSE_WRITE) == native_event::none);
}


FSL_TEST_FUNCTION(translate) {
    using unionmount::native_event;
    using unionmount::file_action;
    using unionmount::refresh_action;
    FSL_CHECK(unionmount::translate(native_event::added) ==
        file_action<void>::refresh(refresh_action::created));
    FSL_CHECK(unionmount::translate(native_event::modified) ==
        file_action<void>::refresh(refresh_action::updated));
    FSL_CHECK(unionmount::translate(native_event::removed).is_delete());
    FSL_CHECK(unionmount::translate(native_event::unknown).is_delete());
}


FSL_TEST_FUNCTION(relative_to_root) {
    FSL_CHECK_EQ(unionmount::relative_to("/r1", "/r1/a.md"), "a.md");
    FSL_CHECK_EQ(unionmount::relative_to("/r1", "/r1/x/y/a.md"), "x/y/a.md");
    FSL_CHECK_EQ(unionmount::relative_to("/r1/", "/r1/a.md"), "a.md");
    FSL_CHECK_EQ(unionmount::relative_to("/r1", "/r1"), ".");
}


FSL_TEST_FUNCTION(outside_root_stays_absolute) {
    FSL_CHECK_EQ(unionmount::relative_to("/r1", "/r2/a.md"), "/r2/a.md");
    FSL_CHECK_EQ(unionmount::relative_to("/r1", "/r10/a.md"), "/r10/a.md");
    FSL_CHECK(unionmount::relative_to("/r1/x", "/r1/y/a.md").is_absolute());
}


FSL_TEST_FUNCTION(deleted_directories_are_forgotten) {
    const auto root = boost::filesystem::canonical(
        boost::filesystem::temp_directory_path()) /
            boost::filesystem::unique_path();
    boost::filesystem::create_directories(root / "a" / "b");
    boost::filesystem::create_directories(root / "c");

    unionmount::pool threads(1, [](std::exception_ptr) {});
    unionmount::notification watch(threads.io_service, 0, root,
        [](unionmount::event) {});
    FSL_CHECK_EQ(watch.watches(), 4u);
    watch();

    boost::filesystem::remove_all(root / "a");
    for ( auto attempt = 0; attempt < 100 && watch.watches() != 2u; ++attempt ) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    FSL_CHECK_EQ(watch.watches(), 2u);

    threads.stop();
    boost::filesystem::remove_all(root);
}
