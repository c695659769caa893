/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#include <unionmount/pattern.hpp>
#include <fost/test>


using namespace fostlib;
using unionmount::pattern;


FSL_TEST_SUITE(pattern);


FSL_TEST_FUNCTION(star_stays_in_one_segment) {
    FSL_CHECK(pattern("*.md").matches("a.md"));
    FSL_CHECK(pattern("*.md").matches(".md"));
    FSL_CHECK(not pattern("*.md").matches("a.mdx"));
    FSL_CHECK(not pattern("*.md").matches("notes/a.md"));
    FSL_CHECK(pattern("notes/*.md").matches("notes/a.md"));
    FSL_CHECK(pattern("a*b*c").matches("aXbYbZc"));
    FSL_CHECK(not pattern("a*b*c").matches("aXbYbZ"));
}


FSL_TEST_FUNCTION(double_star_spans_segments) {
    FSL_CHECK(pattern("**/*.md").matches("a.md"));
    FSL_CHECK(pattern("**/*.md").matches("x/y/z/a.md"));
    FSL_CHECK(not pattern("**/*.md").matches("x/y/z/a.txt"));
    FSL_CHECK(pattern("**/drafts/**").matches("drafts/a.md"));
    FSL_CHECK(pattern("**/drafts/**").matches("x/drafts/y/a.md"));
    FSL_CHECK(not pattern("**/drafts/**").matches("x/draft/a.md"));
    FSL_CHECK(pattern("**").matches("anything/at/all"));
}


FSL_TEST_FUNCTION(literal) {
    FSL_CHECK(pattern("index.yaml").matches("index.yaml"));
    FSL_CHECK(not pattern("index.yaml").matches("sub/index.yaml"));
}


FSL_TEST_FUNCTION(question_mark) {
    FSL_CHECK(pattern("?.md").matches("a.md"));
    FSL_CHECK(not pattern("?.md").matches("ab.md"));
    FSL_CHECK(not pattern("a?b").matches("a/b"));
}


FSL_TEST_FUNCTION(widened) {
    FSL_CHECK_EQ(pattern("*.md").widened().text(), "**/*.md");
    FSL_CHECK(not pattern("*.md").matches("/home/user/notes/a.md"));
    FSL_CHECK(pattern("*.md").widened().matches("/home/user/notes/a.md"));
}


FSL_TEST_FUNCTION(widened_accepts_everything_relative_accepts) {
    const std::vector<std::string> globs{"*.md", "**/*.md", "notes/*.md", "a*", "**"};
    const std::vector<std::string> paths{
        "a.md", "notes/a.md", "x/notes/a.md", "abc", "b/c.txt"};
    for ( const auto &g : globs ) {
        for ( const auto &p : paths ) {
            if ( pattern(g).matches(p) ) {
                FSL_CHECK(pattern(g).widened().matches("/somewhere/else/" + p));
            }
        }
    }
}


FSL_TEST_FUNCTION(first_tag_wins) {
    unionmount::tag_patterns<fostlib::string> patterns{
        {"T1", pattern("*.a")}, {"T2", pattern("*.*")}};
    auto tag = unionmount::resolve_tag(patterns, "x.a");
    FSL_CHECK(not tag.isnull());
    FSL_CHECK_EQ(tag.value(), "T1");
    auto other = unionmount::resolve_tag(patterns, "x.b");
    FSL_CHECK(not other.isnull());
    FSL_CHECK_EQ(other.value(), "T2");
    FSL_CHECK(unionmount::resolve_tag(patterns, "x").isnull());
}


FSL_TEST_FUNCTION(absolute_paths_are_lenient) {
    unionmount::tag_patterns<fostlib::string> patterns{{"Doc", pattern("*.md")}};
    FSL_CHECK(unionmount::resolve_tag(patterns, "sub/a.md").isnull());
    auto tag = unionmount::resolve_tag(patterns, "/elsewhere/sub/a.md");
    FSL_CHECK(not tag.isnull());
    FSL_CHECK_EQ(tag.value(), "Doc");
}


FSL_TEST_FUNCTION(untagged_event_is_dropped) {
    unionmount::tag_patterns<fostlib::string> patterns{{"Doc", pattern("*.md")}};
    FSL_CHECK(unionmount::accept_event(patterns, {}, "c.txt").isnull());
}


FSL_TEST_FUNCTION(ignored_event_is_dropped) {
    unionmount::tag_patterns<fostlib::string> patterns{{"Doc", pattern("**/*.md")}};
    const std::vector<pattern> ignore{pattern("**/drafts/**")};
    FSL_CHECK(unionmount::accept_event(patterns, ignore, "drafts/a.md").isnull());
    auto tag = unionmount::accept_event(patterns, ignore, "published/a.md");
    FSL_CHECK(not tag.isnull());
    FSL_CHECK_EQ(tag.value(), "Doc");
}

