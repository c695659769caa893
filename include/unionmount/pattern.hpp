/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#pragma once


#include <fost/core>

#include <boost/filesystem/path.hpp>

#include <string>
#include <utility>
#include <vector>


namespace unionmount {


    /// A glob style file pattern. Paths are compared segment by segment
    /// (split on `/`). A segment that is exactly `**` matches any number
    /// of whole segments, including none. Inside a segment `*` matches any
    /// run of characters and `?` matches exactly one.
    class pattern {
        std::string glob;
        std::vector<std::string> segments;

    public:
        /// Construct from the glob text
        explicit pattern(std::string);

        /// The glob text
        const std::string &text() const {
            return glob;
        }

        /// Return true if the path is matched
        bool matches(const boost::filesystem::path &) const;

        /// The pattern used for paths that escaped the root through a
        /// symlink: it can match at any depth
        pattern widened() const;
    };


    /// An ordered list of tag patterns. Earlier entries take priority
    template<typename T>
    using tag_patterns = std::vector<std::pair<T, pattern>>;


    /// Return the tag of the first pattern that matches the path. Absolute
    /// paths (only seen when a symlinked directory leads out of the root)
    /// are matched against the widened patterns, which means that some
    /// files may be matched that wouldn't have been under the root.
    template<typename T>
    fostlib::nullable<T> resolve_tag(
        const tag_patterns<T> &patterns, const boost::filesystem::path &path
    ) {
        const bool lenient = path.is_absolute();
        for ( const auto &p : patterns ) {
            if ( lenient ? p.second.widened().matches(path) : p.second.matches(path) ) {
                return fostlib::nullable<T>(p.first);
            }
        }
        return fostlib::null;
    }


    /// True if any of the patterns matches the path
    bool any_match(const std::vector<pattern> &, const boost::filesystem::path &);


    /// Decide whether an observed path is to be reported, and under which
    /// tag. Ignored paths are never reported, irrespective of tag.
    template<typename T>
    fostlib::nullable<T> accept_event(
        const tag_patterns<T> &patterns, const std::vector<pattern> &ignore,
        const boost::filesystem::path &path
    ) {
        if ( any_match(ignore, path) ) return fostlib::null;
        return resolve_tag(patterns, path);
    }


}


namespace fostlib {


    /// Allow patterns to be logged
    template<>
    struct coercer<json, unionmount::pattern> {
        json coerce(const unionmount::pattern &p) {
            return json(fostlib::string(p.text()));
        }
    };


}

