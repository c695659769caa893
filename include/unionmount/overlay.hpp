/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#pragma once


#include <fost/core>

#include <boost/filesystem/path.hpp>

#include <set>
#include <unordered_map>
#include <utility>
#include <vector>


namespace unionmount {


    /// Every source that currently provides a logical path, paired with
    /// that path, in source order. Never empty.
    template<typename S>
    using overlays = std::vector<std::pair<S, boost::filesystem::path>>;


    /// Hash for using paths as unordered keys
    struct path_hash {
        std::size_t operator () (const boost::filesystem::path &p) const {
            return boost::filesystem::hash_value(p);
        }
    };


    /// Records which sources provide each logical path. A path with no
    /// sources is removed, so it is present exactly when at least one
    /// source provides it.
    template<typename S>
    class overlay_table {
        std::unordered_map<boost::filesystem::path, std::set<S>, path_hash> paths;

    public:
        /// Record that the source provides the path
        void add(const boost::filesystem::path &path, const S &source) {
            paths[path].insert(source);
        }
        /// Record that the source no longer provides the path
        void remove(const boost::filesystem::path &path, const S &source) {
            auto found = paths.find(path);
            if ( found == paths.end() ) return;
            found->second.erase(source);
            if ( found->second.empty() ) paths.erase(found);
        }

        /// The overlays for the path, or null if no source provides it
        fostlib::nullable<overlays<S>> lookup(const boost::filesystem::path &path) const {
            auto found = paths.find(path);
            if ( found == paths.end() ) return fostlib::null;
            overlays<S> result;
            for ( const auto &source : found->second ) {
                result.emplace_back(source, path);
            }
            return fostlib::nullable<overlays<S>>(std::move(result));
        }

        /// The sources that provide the path
        std::set<S> providers(const boost::filesystem::path &path) const {
            auto found = paths.find(path);
            if ( found == paths.end() ) return std::set<S>();
            return found->second;
        }
        bool contains(const boost::filesystem::path &path) const {
            return paths.find(path) != paths.end();
        }
        /// The number of logical paths
        std::size_t size() const {
            return paths.size();
        }
    };


}

