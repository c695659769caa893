/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#include <unionmount/overlay.hpp>
#include <fost/test>

#include <map>


using namespace fostlib;


FSL_TEST_SUITE(overlay);


FSL_TEST_FUNCTION(add_and_lookup) {
    unionmount::overlay_table<fostlib::string> overlay;
    FSL_CHECK(overlay.lookup("a.md").isnull());
    overlay.add("a.md", "B");
    overlay.add("a.md", "A");
    overlay.add("a.md", "A");
    auto found = overlay.lookup("a.md");
    FSL_CHECK(not found.isnull());
    FSL_CHECK_EQ(found.value().size(), 2u);
    FSL_CHECK_EQ(found.value()[0].first, "A");
    FSL_CHECK_EQ(found.value()[0].second, "a.md");
    FSL_CHECK_EQ(found.value()[1].first, "B");
}


FSL_TEST_FUNCTION(last_source_removes_path) {
    unionmount::overlay_table<fostlib::string> overlay;
    overlay.add("a.md", "A");
    overlay.add("a.md", "B");
    overlay.remove("a.md", "A");
    FSL_CHECK(overlay.contains("a.md"));
    FSL_CHECK_EQ(overlay.size(), 1u);
    overlay.remove("a.md", "B");
    FSL_CHECK(not overlay.contains("a.md"));
    FSL_CHECK(overlay.lookup("a.md").isnull());
    FSL_CHECK_EQ(overlay.size(), 0u);
}


FSL_TEST_FUNCTION(removing_unknown_is_harmless) {
    unionmount::overlay_table<fostlib::string> overlay;
    overlay.remove("a.md", "A");
    FSL_CHECK_EQ(overlay.size(), 0u);
    overlay.add("a.md", "A");
    overlay.remove("a.md", "B");
    FSL_CHECK_EQ(overlay.providers("a.md").size(), 1u);
}


FSL_TEST_FUNCTION(present_iff_provided) {
    /// Drive a fixed but irregular sequence of operations and compare
    /// against a simple count of providers after every step
    const std::vector<fostlib::string> sources{"A", "B", "C"};
    const std::vector<boost::filesystem::path> paths{"a.md", "b/c.md", "d"};
    std::map<std::pair<std::size_t, std::size_t>, bool> provided;
    unionmount::overlay_table<fostlib::string> overlay;
    for ( std::size_t step = 0; step != 200; ++step ) {
        const auto s = (step * 7) % sources.size();
        const auto p = (step * 5 + step / 3) % paths.size();
        const bool add = (step * 11) % 4 != 0;
        if ( add ) {
            overlay.add(paths[p], sources[s]);
        } else {
            overlay.remove(paths[p], sources[s]);
        }
        provided[std::make_pair(s, p)] = add;
        for ( std::size_t pi = 0; pi != paths.size(); ++pi ) {
            std::size_t count = 0;
            for ( std::size_t si = 0; si != sources.size(); ++si ) {
                if ( provided[std::make_pair(si, pi)] ) ++count;
            }
            FSL_CHECK(overlay.contains(paths[pi]) == (count > 0));
            FSL_CHECK(overlay.lookup(paths[pi]).isnull() == (count == 0));
            FSL_CHECK_EQ(overlay.providers(paths[pi]).size(), count);
        }
    }
}

