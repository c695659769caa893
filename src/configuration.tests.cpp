/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#include <unionmount/configuration.hpp>
#include <fost/insert>
#include <fost/push_back>
#include <fost/test>


using namespace fostlib;


FSL_TEST_SUITE(configuration);


FSL_TEST_FUNCTION(default_patterns_match_everything) {
    auto patterns = unionmount::tag_patterns_from(unionmount::c_patterns.value());
    FSL_CHECK_EQ(patterns.size(), 1u);
    FSL_CHECK_EQ(patterns[0].first, "file");
    FSL_CHECK(patterns[0].second.matches("any/file.at.all"));
    FSL_CHECK(unionmount::ignore_patterns(unionmount::c_ignore.value()).empty());
}


FSL_TEST_FUNCTION(sources) {
    fostlib::json config;
    fostlib::insert(config, "main", "/srv/notes");
    fostlib::insert(config, "overlay", "/home/me/notes");
    fostlib::setting<fostlib::json> sources(
        "configuration.tests.cpp", unionmount::c_sources, config);
    auto roots = unionmount::source_roots(unionmount::c_sources.value());
    FSL_CHECK_EQ(roots.size(), 2u);
    FSL_CHECK_EQ(roots.begin()->first, "main");
    FSL_CHECK_EQ(roots.begin()->second, "/srv/notes");
}


FSL_TEST_FUNCTION(patterns_keep_their_order) {
    fostlib::json config, md, any;
    fostlib::push_back(md, "Doc");
    fostlib::push_back(md, "*.md");
    fostlib::push_back(any, "Other");
    fostlib::push_back(any, "**");
    fostlib::push_back(config, md);
    fostlib::push_back(config, any);
    auto patterns = unionmount::tag_patterns_from(config);
    FSL_CHECK_EQ(patterns.size(), 2u);
    FSL_CHECK_EQ(patterns[0].first, "Doc");
    FSL_CHECK_EQ(patterns[0].second.text(), "*.md");
    FSL_CHECK_EQ(patterns[1].first, "Other");
}


FSL_TEST_FUNCTION(malformed_patterns_are_rejected) {
    fostlib::json config, lonely;
    fostlib::push_back(lonely, "Doc");
    fostlib::push_back(config, lonely);
    FSL_CHECK_EXCEPTION(unionmount::tag_patterns_from(config),
        fostlib::exceptions::not_implemented&);
    fostlib::json numbers;
    fostlib::push_back(numbers, 3);
    FSL_CHECK_EXCEPTION(unionmount::ignore_patterns(numbers),
        fostlib::exceptions::not_implemented&);
}

