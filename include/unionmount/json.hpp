/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#pragma once


#include <unionmount/change.hpp>

#include <fost/file>
#include <fost/insert>
#include <fost/push_back>


namespace fostlib {


    /// Coerce the refresh action to its JSON name
    template<>
    struct coercer<json, unionmount::refresh_action> {
        json coerce(unionmount::refresh_action);
    };


    /// Coerce a reported file action to JSON. The source type must itself
    /// be coercible to JSON.
    template<typename S>
    struct coercer<json, unionmount::file_action<unionmount::overlays<S>>> {
        json coerce(const unionmount::file_action<unionmount::overlays<S>> &a) {
            json j;
            if ( a.is_delete() ) {
                insert(j, "action", "delete");
            } else {
                insert(j, "action", fostlib::coerce<json>(a.action().value()));
                json overlays = json::array_t();
                for ( const auto &o : a.payload() ) {
                    json entry;
                    push_back(entry, fostlib::coerce<json>(o.first));
                    push_back(entry, fostlib::coerce<json>(o.second));
                    push_back(overlays, entry);
                }
                insert(j, "overlays", overlays);
            }
            return j;
        }
    };


}


namespace unionmount {


    /// Describe a change as JSON in the form `{tag: {path: action}}`. Both
    /// the source and tag types must be coercible to JSON.
    template<typename S, typename T>
    fostlib::json change_json(const change<S, T> &batch) {
        fostlib::json j = fostlib::json::object_t();
        for ( const auto &tag : batch ) {
            const auto name = fostlib::coerce<fostlib::string>(
                fostlib::coerce<fostlib::json>(tag.first));
            for ( const auto &file : tag.second ) {
                fostlib::insert(j, name,
                    fostlib::coerce<fostlib::string>(file.first),
                    fostlib::coerce<fostlib::json>(file.second));
            }
        }
        return j;
    }


}

