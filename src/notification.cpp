/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#include "notification.events.hpp"
#include "paths.hpp"
#include <unionmount/configuration.hpp>
#include <unionmount/notification.hpp>

#include <f5/fsnotify.hpp>
#include <f5/fsnotify/boost-asio.hpp>
#include <f5/fsnotify/fost.hpp>

#include <fost/counter>
#include <fost/insert>
#include <fost/log>

#include <boost/filesystem.hpp>

#include <map>
#include <mutex>


namespace {
    fostlib::performance p_watches(unionmount::c_fost_unionmount,
        "inotify", "watches");
    fostlib::performance p_watches_failed(unionmount::c_fost_unionmount,
        "inotify", "watches-failed");
    fostlib::performance p_watches_dropped(unionmount::c_fost_unionmount,
        "inotify", "watches-dropped");
    fostlib::performance p_added(unionmount::c_fost_unionmount,
        "inotify", "event", "added");
    fostlib::performance p_modified(unionmount::c_fost_unionmount,
        "inotify", "event", "modified");
    fostlib::performance p_removed(unionmount::c_fost_unionmount,
        "inotify", "event", "removed");
    fostlib::performance p_unknown(unionmount::c_fost_unionmount,
        "inotify", "event", "unknown");
    fostlib::performance p_directories(unionmount::c_fost_unionmount,
        "inotify", "event", "directory");


    /// The part of the notification that the inotify reader needs
    struct state {
        state(boost::asio::io_service &io, std::size_t source,
            boost::filesystem::path root, unionmount::event_sink sink)
        : io(io), source(source), root(std::move(root)), sink(std::move(sink)) {
        }

        boost::asio::io_service &io;
        const std::size_t source;
        const boost::filesystem::path root;
        const unionmount::event_sink sink;
        /// The directory each watch descriptor is for. Descriptors are
        /// removed once the kernel drops the watch
        mutable std::mutex mutex;
        std::map<int, boost::filesystem::path> watches;
        /// Watch a new directory and report the files already in it
        std::function<void(const boost::filesystem::path &)> sweep;

        boost::filesystem::path directory(int wd) const {
            std::unique_lock<std::mutex> lock(mutex);
            auto found = watches.find(wd);
            if ( found == watches.end() ) return boost::filesystem::path();
            return found->second;
        }
        bool added(int wd, const boost::filesystem::path &folder) {
            std::unique_lock<std::mutex> lock(mutex);
            return watches.emplace(wd, folder).second;
        }
        void dropped(int wd) {
            std::unique_lock<std::mutex> lock(mutex);
            if ( watches.erase(wd) ) ++p_watches_dropped;
        }

        void report(const boost::filesystem::path &location, unionmount::file_action<void> act) {
            unionmount::event e;
            e.source = source;
            e.path = unionmount::relative_to(root, location);
            e.action = act;
            sink(std::move(e));
        }
    };


    void count(unionmount::native_event kind) {
        switch ( kind ) {
        case unionmount::native_event::added: ++p_added; break;
        case unionmount::native_event::modified: ++p_modified; break;
        case unionmount::native_event::removed: ++p_removed; break;
        default: ++p_unknown; break;
        }
    }


    struct callback : public f5::fsnotify::boost_asio::reader {
        state &s;

        callback(state &s)
        : reader(s.io), s(s) {
        }

        void process(const inotify_event &event) {
            if ( event.mask & IN_Q_OVERFLOW ) {
                ++p_unknown;
                fostlib::log::error(unionmount::c_fost_unionmount)
                    ("", "inotify event queue overflowed, changes have been lost")
                    ("source", s.source)
                    ("root", s.root);
                return;
            }
            if ( event.mask & IN_IGNORED ) {
                fostlib::log::debug(unionmount::c_fost_unionmount)
                    ("", "Watch removed")
                    ("wd", event.wd)
                    ("source", s.source)
                    ("directory", s.directory(event.wd));
                s.dropped(event.wd);
                return;
            }
            const boost::filesystem::path parent(s.directory(event.wd));
            if ( parent.empty() ) return;
            boost::filesystem::path name;
            if ( event.len ) {
                name = boost::filesystem::path(event.name);
            }
            const boost::filesystem::path filename(parent / name);
            fostlib::log::debug(unionmount::c_fost_unionmount)
                ("", "inotify_event")
                ("wd", "descriptor", event.wd)
                ("wd", "directory", parent)
                ("wd", "pathname", filename)
                ("name", name)
                ("mask", f5::mask_json(event))
                ("cookie", event.cookie);

            const auto kind = unionmount::classify(event.mask);
            if ( kind == unionmount::native_event::none ) return;
            if ( event.mask & IN_ISDIR ) {
                /// Only files are reported, but a new directory needs
                /// watching and may already have files in it
                ++p_directories;
                if ( kind == unionmount::native_event::added ) {
                    try {
                        s.sweep(filename);
                    } catch ( boost::filesystem::filesystem_error &e ) {
                        fostlib::log::warning(unionmount::c_fost_unionmount)
                            ("", "New directory could not be swept")
                            ("directory", filename)
                            ("what", e.what());
                    }
                }
                return;
            }
            count(kind);
            s.report(filename, unionmount::translate(kind));
        }
    };
}


struct unionmount::notification::impl {
    state st;
    f5::notifications<callback> notifications;

    impl(boost::asio::io_service &io, std::size_t source,
        const boost::filesystem::path &root, event_sink sink)
    : st(io, source, boost::filesystem::canonical(root), std::move(sink)),
        notifications(st)
    {
        st.sweep = [this](const boost::filesystem::path &folder) {
            if ( !sweep(folder, true) ) {
                fostlib::log::warning(c_fost_unionmount)
                    ("", "New directory is not being watched")
                    ("source", st.source)
                    ("directory", folder);
            }
        };
    }

    bool watch(const boost::filesystem::path &folder) {
        bool watched = false;
        notifications.watch(folder.c_str(),
            [this, &watched, &folder](int wd) {
                watched = true;
                if ( st.added(wd, folder) ) {
                    ++p_watches;
                    fostlib::log::debug(c_fost_unionmount)
                        ("", "Watch added")
                        ("wd", wd)
                        ("source", st.source)
                        ("directory", folder);
                }
            },
            [this, &folder]() {
                ++p_watches_failed;
                fostlib::log::error(c_fost_unionmount)
                    ("", "Watch failed")
                    ("check", "/proc/sys/fs/inotify/max_user_watches")
                    ("source", st.source)
                    ("directory", folder);
            });
        return watched;
    }

    /// Watch the folder and every directory below it. Directory symlinks
    /// are watched at their canonical location, so events from them arrive
    /// with paths outside of the root. Returns false if the folder itself
    /// could not be watched
    bool sweep(const boost::filesystem::path &folder, bool report) {
        if ( !watch(boost::filesystem::canonical(folder)) ) return false;
        using d_iter = boost::filesystem::recursive_directory_iterator;
        for ( auto inode = d_iter(folder, boost::filesystem::symlink_option::recurse), end = d_iter();
                inode != end; ++inode ) {
            if ( boost::filesystem::is_directory(inode->status()) ) {
                watch(boost::filesystem::canonical(inode->path()));
            } else if ( report && boost::filesystem::is_regular_file(inode->status()) ) {
                ++p_added;
                st.report(
                    boost::filesystem::canonical(inode->path().parent_path()) /
                        inode->path().filename(),
                    file_action<void>::refresh(refresh_action::created));
            }
        }
        return true;
    }
};


unionmount::notification::notification(
    boost::asio::io_service &io, std::size_t source,
    const boost::filesystem::path &root, event_sink sink
) : pimpl(new impl(io, source, root, std::move(sink))) {
    fostlib::log::info(c_fost_unionmount)
        ("", "Monitoring for changes")
        ("source", source)
        ("root", pimpl->st.root);
    if ( !pimpl->sweep(pimpl->st.root, false) ) {
        fostlib::exceptions::not_implemented error(
            "Could not watch the source root");
        fostlib::insert(error.data(), "root", pimpl->st.root);
        fostlib::insert(error.data(), "check", "/proc/sys/fs/inotify/max_user_watches");
        throw error;
    }
}


unionmount::notification::~notification() = default;


void unionmount::notification::operator () () {
    pimpl->notifications();
}


std::size_t unionmount::notification::watches() const {
    std::unique_lock<std::mutex> lock(pimpl->st.mutex);
    return pimpl->st.watches.size();
}

