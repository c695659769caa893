/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#include <unionmount/listing.hpp>
#include <fost/file>
#include <fost/test>

#include <boost/filesystem.hpp>


using namespace fostlib;
using unionmount::pattern;


FSL_TEST_SUITE(listing);


namespace {
    boost::filesystem::path make_tree() {
        const auto root = boost::filesystem::temp_directory_path() /
            boost::filesystem::unique_path();
        boost::filesystem::create_directories(root / "notes");
        boost::filesystem::create_directories(root / "drafts");
        fostlib::utf::save_file(root / "index.md", "index\n");
        fostlib::utf::save_file(root / "notes" / "a.md", "a\n");
        fostlib::utf::save_file(root / "notes" / "b.yaml", "b: 1\n");
        fostlib::utf::save_file(root / "drafts" / "c.md", "c\n");
        fostlib::utf::save_file(root / "d.txt", "d\n");
        return root;
    }
}


FSL_TEST_FUNCTION(include_and_ignore) {
    const auto root = make_tree();
    auto files = unionmount::list_files(root,
        {pattern("**/*.md"), pattern("**/*.yaml")}, {pattern("drafts/**")});
    FSL_CHECK_EQ(files.size(), 3u);
    FSL_CHECK_EQ(files[0], "index.md");
    FSL_CHECK_EQ(files[1], "notes/a.md");
    FSL_CHECK_EQ(files[2], "notes/b.yaml");
    boost::filesystem::remove_all(root);
}


FSL_TEST_FUNCTION(grouped_by_tag) {
    const auto root = make_tree();
    unionmount::tag_patterns<fostlib::string> patterns{
        {"Doc", pattern("**/*.md")}, {"Data", pattern("**/*.yaml")}};
    auto tagged = unionmount::files_matching_with_tag(root, patterns, {});
    FSL_CHECK_EQ(tagged.size(), 2u);
    FSL_CHECK_EQ(tagged["Doc"].size(), 3u);
    FSL_CHECK_EQ(tagged["Data"].size(), 1u);
    FSL_CHECK_EQ(tagged["Data"][0], "notes/b.yaml");
    boost::filesystem::remove_all(root);
}


FSL_TEST_FUNCTION(root_is_canonicalised) {
    const auto root = make_tree();
    auto files = unionmount::list_files(root / "notes" / "..",
        {pattern("*.md")}, {});
    FSL_CHECK_EQ(files.size(), 1u);
    FSL_CHECK_EQ(files[0], "index.md");
    boost::filesystem::remove_all(root);
}


FSL_TEST_FUNCTION(missing_root_throws) {
    const auto root = boost::filesystem::temp_directory_path() /
        boost::filesystem::unique_path();
    FSL_CHECK_EXCEPTION(
        unionmount::list_files(root, {pattern("**")}, {}),
        boost::filesystem::filesystem_error&);
}

