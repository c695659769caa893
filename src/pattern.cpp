/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#include <unionmount/pattern.hpp>


namespace {
    const std::string c_any_depth("**");


    std::vector<std::string> split(const std::string &s) {
        std::vector<std::string> parts;
        std::string::size_type start = 0;
        for ( auto slash = s.find('/'); slash != std::string::npos; slash = s.find('/', start) ) {
            parts.push_back(s.substr(start, slash - start));
            start = slash + 1;
        }
        parts.push_back(s.substr(start));
        return parts;
    }


    /// Match a single segment where `*` matches any run of characters and
    /// `?` any one character. Backtracks to the most recent star only.
    bool segment_matches(const std::string &glob, const std::string &name) {
        std::size_t g = 0, n = 0;
        std::size_t star = std::string::npos, resume = 0;
        while ( n < name.size() ) {
            if ( g < glob.size() && glob[g] == '*' ) {
                star = g++;
                resume = n;
            } else if ( g < glob.size() && (glob[g] == '?' || glob[g] == name[n]) ) {
                ++g; ++n;
            } else if ( star != std::string::npos ) {
                g = star + 1;
                n = ++resume;
            } else {
                return false;
            }
        }
        while ( g < glob.size() && glob[g] == '*' ) ++g;
        return g == glob.size();
    }
}


unionmount::pattern::pattern(std::string g)
: glob(std::move(g)), segments(split(glob)) {
}


bool unionmount::pattern::matches(const boost::filesystem::path &path) const {
    const auto names = split(path.generic_string());
    /// `reachable[n]` is true when the first `n` path segments can be
    /// consumed by the pattern segments processed so far
    std::vector<bool> reachable(names.size() + 1, false);
    reachable[0] = true;
    for ( const auto &segment : segments ) {
        std::vector<bool> next(names.size() + 1, false);
        if ( segment == c_any_depth ) {
            bool seen = false;
            for ( std::size_t n = 0; n <= names.size(); ++n ) {
                seen = seen || reachable[n];
                next[n] = seen;
            }
        } else {
            for ( std::size_t n = 0; n < names.size(); ++n ) {
                if ( reachable[n] && segment_matches(segment, names[n]) ) {
                    next[n + 1] = true;
                }
            }
        }
        reachable.swap(next);
    }
    return reachable[names.size()];
}


unionmount::pattern unionmount::pattern::widened() const {
    return pattern(c_any_depth + "/" + glob);
}


bool unionmount::any_match(
    const std::vector<pattern> &patterns, const boost::filesystem::path &path
) {
    for ( const auto &p : patterns ) {
        if ( p.matches(path) ) return true;
    }
    return false;
}

