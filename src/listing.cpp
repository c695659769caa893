/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#include "paths.hpp"
#include <unionmount/configuration.hpp>
#include <unionmount/listing.hpp>

#include <fost/counter>
#include <fost/insert>
#include <fost/log>
#include <fost/push_back>

#include <boost/filesystem.hpp>

#include <algorithm>


namespace {
    fostlib::performance p_traversals(unionmount::c_fost_unionmount,
        "listing", "traversals");
    fostlib::performance p_listed(unionmount::c_fost_unionmount,
        "listing", "files", "listed");
    fostlib::performance p_skipped(unionmount::c_fost_unionmount,
        "listing", "files", "skipped");

    fostlib::json as_json(const std::vector<unionmount::pattern> &patterns) {
        fostlib::json j = fostlib::json::array_t();
        for ( const auto &p : patterns ) {
            fostlib::push_back(j, fostlib::coerce<fostlib::json>(p));
        }
        return j;
    }
}


std::vector<boost::filesystem::path> unionmount::list_files(
    const boost::filesystem::path &folder,
    const std::vector<pattern> &include,
    const std::vector<pattern> &ignore
) {
    ++p_traversals;
    const auto root = boost::filesystem::canonical(folder);
    fostlib::log::info(c_fost_unionmount)
        ("", "Traversing for files")
        ("root", root)
        ("include", as_json(include))
        ("ignore", as_json(ignore));
    if ( !boost::filesystem::is_directory(root) ) {
        fostlib::exceptions::not_implemented error(
            "Trying to list a source that is not a directory");
        fostlib::insert(error.data(), "root", root);
        throw error;
    }
    std::vector<boost::filesystem::path> files;
    std::size_t skipped = 0;
    using d_iter = boost::filesystem::recursive_directory_iterator;
    for ( auto inode = d_iter(root, boost::filesystem::symlink_option::recurse), end = d_iter();
            inode != end; ++inode ) {
        if ( !boost::filesystem::is_regular_file(inode->status()) ) continue;
        auto relative = relative_to(root, inode->path());
        if ( any_match(include, relative) && !any_match(ignore, relative) ) {
            ++p_listed;
            files.push_back(std::move(relative));
        } else {
            ++skipped; ++p_skipped;
        }
    }
    std::sort(files.begin(), files.end());
    fostlib::log::info(c_fost_unionmount)
        ("", "Traversed source")
        ("root", root)
        ("files", files.size())
        ("skipped", skipped);
    return files;
}

