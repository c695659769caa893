/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#include <unionmount/configuration.hpp>

#include <fost/insert>
#include <fost/push_back>


namespace {
    fostlib::json default_patterns() {
        fostlib::json everything;
        fostlib::push_back(everything, "file");
        fostlib::push_back(everything, "**/*");
        fostlib::json patterns;
        fostlib::push_back(patterns, everything);
        return patterns;
    }

    unionmount::pattern to_pattern(const fostlib::json &p) {
        if ( p.get<fostlib::string>().isnull() ) {
            fostlib::exceptions::not_implemented error(
                "A pattern must be a string");
            fostlib::insert(error.data(), "pattern", p);
            throw error;
        }
        return unionmount::pattern(
            fostlib::coerce<fostlib::string>(p).std_str());
    }
}


const fostlib::module unionmount::c_fost_unionmount(fostlib::c_fost, "unionmount");


const fostlib::setting<fostlib::json> unionmount::c_sources(
    "fost-unionmount/configuration.cpp", "unionmount", "sources",
    fostlib::json(), true);
const fostlib::setting<fostlib::json> unionmount::c_patterns(
    "fost-unionmount/configuration.cpp", "unionmount", "patterns",
    default_patterns(), true);
const fostlib::setting<fostlib::json> unionmount::c_ignore(
    "fost-unionmount/configuration.cpp", "unionmount", "ignore",
    fostlib::json(fostlib::json::array_t()), true);


unionmount::source_roots_type unionmount::source_roots(const fostlib::json &config) {
    source_roots_type roots;
    for ( auto s(config.begin()); s != config.end(); ++s ) {
        if ( (*s).get<fostlib::string>().isnull() ) {
            fostlib::exceptions::not_implemented error(
                "A source root must be a directory name");
            fostlib::insert(error.data(), "source", s.key());
            fostlib::insert(error.data(), "root", *s);
            throw error;
        }
        roots.emplace(fostlib::coerce<fostlib::string>(s.key()),
            fostlib::coerce<boost::filesystem::path>(
                fostlib::coerce<fostlib::string>(*s)));
    }
    return roots;
}


unionmount::tag_patterns<fostlib::string> unionmount::tag_patterns_from(
    const fostlib::json &config
) {
    tag_patterns<fostlib::string> patterns;
    for ( auto entry : config ) {
        if ( entry.size() != 2u ) {
            fostlib::exceptions::not_implemented error(
                "A tag pattern must be a [tag, pattern] pair");
            fostlib::insert(error.data(), "entry", entry);
            throw error;
        }
        patterns.emplace_back(
            fostlib::coerce<fostlib::string>(entry[0]), to_pattern(entry[1]));
    }
    return patterns;
}


std::vector<unionmount::pattern> unionmount::ignore_patterns(
    const fostlib::json &config
) {
    std::vector<pattern> patterns;
    for ( auto p : config ) {
        patterns.push_back(to_pattern(p));
    }
    return patterns;
}

