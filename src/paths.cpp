/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#include "paths.hpp"

#include <iterator>


boost::filesystem::path unionmount::relative_to(
    const boost::filesystem::path &root, const boost::filesystem::path &location
) {
    auto r = root.begin(), l = location.begin();
    for ( ; r != root.end() && l != location.end(); ++r, ++l ) {
        if ( *r != *l ) break;
    }
    /// A trailing slash on the root shows up as a final `.` element
    if ( r != root.end() && *r == "." && std::next(r) == root.end() ) ++r;
    if ( r != root.end() ) return location;
    boost::filesystem::path relative;
    for ( ; l != location.end(); ++l ) relative /= *l;
    return relative.empty() ? boost::filesystem::path(".") : relative;
}

