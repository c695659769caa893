/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#pragma once


#include <unionmount/pattern.hpp>

#include <fost/core>
#include <fost/file>

#include <set>
#include <utility>


namespace unionmount {


    /// The fost-unionmount module
    extern const fostlib::module c_fost_unionmount;


    /// The sources to union. A JSON object whose keys name the sources and
    /// whose values are the root directories
    extern const fostlib::setting<fostlib::json> c_sources;
    /// The tag patterns. An array of `[tag, pattern]` pairs, in priority
    /// order
    extern const fostlib::setting<fostlib::json> c_patterns;
    /// Patterns for files that are never reported
    extern const fostlib::setting<fostlib::json> c_ignore;


    /// The type used when sources and tags come from configuration
    using source_roots_type =
        std::set<std::pair<fostlib::string, boost::filesystem::path>>;

    /// Turn the `sources` configuration into the named roots
    source_roots_type source_roots(const fostlib::json &);
    /// Turn the `patterns` configuration into tag patterns
    tag_patterns<fostlib::string> tag_patterns_from(const fostlib::json &);
    /// Turn the `ignore` configuration into patterns
    std::vector<pattern> ignore_patterns(const fostlib::json &);


}

