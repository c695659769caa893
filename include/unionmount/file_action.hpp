/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#pragma once


#include <fost/core>

#include <utility>


namespace unionmount {


    /// Why a path that still exists is being reported
    enum class refresh_action {
        /// No recent change, just notifying that the file exists
        existing,
        /// A new file was created
        created,
        /// An already existing file was updated
        updated
    };


    /// What happened to a path. Either it is available (new, updated or
    /// just existing) and the refresh carries a payload, or it was deleted.
    template<typename T>
    class file_action {
        bool deleted;
        refresh_action act;
        T data;

        file_action(bool d, refresh_action a, T t)
        : deleted(d), act(a), data(std::move(t)) {
        }

    public:
        /// Default constructs a deletion
        file_action()
        : deleted(true), act(refresh_action::existing) {
        }

        /// The file is available
        static file_action refresh(refresh_action a, T t) {
            return file_action(false, a, std::move(t));
        }
        /// The file has gone
        static file_action deletion() {
            return file_action();
        }

        bool is_delete() const {
            return deleted;
        }
        /// The refresh action, or null for a deletion
        fostlib::nullable<refresh_action> action() const {
            if ( deleted ) return fostlib::null;
            return fostlib::nullable<refresh_action>(act);
        }
        /// The payload of a refresh
        const T &payload() const {
            if ( deleted ) {
                throw fostlib::exceptions::null(
                    "A deleted file action has no payload");
            }
            return data;
        }

        bool operator == (const file_action &r) const {
            if ( deleted || r.deleted ) return deleted == r.deleted;
            return act == r.act && data == r.data;
        }
        bool operator != (const file_action &r) const {
            return !(*this == r);
        }
    };


    /// An action with no payload, as reported by a watch
    template<>
    class file_action<void> {
        bool deleted;
        refresh_action act;

        file_action(bool d, refresh_action a)
        : deleted(d), act(a) {
        }

    public:
        /// Default constructs a deletion
        file_action()
        : deleted(true), act(refresh_action::existing) {
        }

        static file_action refresh(refresh_action a) {
            return file_action(false, a);
        }
        static file_action deletion() {
            return file_action();
        }

        bool is_delete() const {
            return deleted;
        }
        fostlib::nullable<refresh_action> action() const {
            if ( deleted ) return fostlib::null;
            return fostlib::nullable<refresh_action>(act);
        }

        bool operator == (const file_action &r) const {
            if ( deleted || r.deleted ) return deleted == r.deleted;
            return act == r.act;
        }
        bool operator != (const file_action &r) const {
            return !(*this == r);
        }
    };


}

