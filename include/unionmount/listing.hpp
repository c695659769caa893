/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#pragma once


#include <unionmount/pattern.hpp>

#include <map>


namespace unionmount {


    /// List the regular files below the root that match at least one of the
    /// include patterns and none of the ignore patterns. The root is
    /// canonicalised first and the returned paths are relative to it, in
    /// sorted order. Directory symlinks are followed.
    std::vector<boost::filesystem::path> list_files(
        const boost::filesystem::path &root,
        const std::vector<pattern> &include,
        const std::vector<pattern> &ignore);


    /// Like `list_files` but groups the files by the tag of the first
    /// pattern that matched them
    template<typename T>
    std::map<T, std::vector<boost::filesystem::path>> files_matching_with_tag(
        const boost::filesystem::path &root,
        const tag_patterns<T> &patterns,
        const std::vector<pattern> &ignore
    ) {
        std::vector<pattern> include;
        for ( const auto &p : patterns ) include.push_back(p.second);
        std::map<T, std::vector<boost::filesystem::path>> tagged;
        for ( auto &file : list_files(root, include, ignore) ) {
            auto tag = resolve_tag(patterns, file);
            if ( !tag.isnull() ) tagged[tag.value()].push_back(std::move(file));
        }
        return tagged;
    }


}

