/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#pragma once


#include <boost/filesystem/path.hpp>


namespace unionmount {


    /// Make the path relative to the root. The root itself becomes `.` and a
    /// path that is not below the root is returned unchanged.
    boost::filesystem::path relative_to(
        const boost::filesystem::path &root, const boost::filesystem::path &);


}

