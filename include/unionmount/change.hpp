/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#pragma once


#include <unionmount/file_action.hpp>
#include <unionmount/overlay.hpp>

#include <map>


namespace unionmount {


    /// A batch of changes. For each tag the files matched by that tag's
    /// patterns. A refresh carries every source that provides the file, so
    /// it is up to the handler to union them.
    template<typename S, typename T>
    using change = std::map<T,
        std::map<boost::filesystem::path, file_action<overlays<S>>>>;


    /// Apply one observed action to the overlays and record the outcome
    /// for the path in the batch. A later entry for the same path in the
    /// same batch replaces the earlier one.
    template<typename S, typename T>
    void change_insert(
        overlay_table<S> &overlay, change<S, T> &batch,
        const S &source, const T &tag, const boost::filesystem::path &path,
        const file_action<void> &act
    ) {
        if ( act.is_delete() ) {
            overlay.remove(path, source);
        } else {
            overlay.add(path, source);
        }
        auto found = overlay.lookup(path);
        if ( found.isnull() ) {
            batch[tag][path] = file_action<overlays<S>>::deletion();
        } else {
            /// Actions aren't tracked per source. A deletion with other
            /// sources remaining is reported as `existing`.
            const auto triggering = act.action();
            batch[tag][path] = file_action<overlays<S>>::refresh(
                triggering.isnull() ? refresh_action::existing : triggering.value(),
                found.value());
        }
    }


    /// The number of path entries across every tag
    template<typename S, typename T>
    std::size_t entries(const change<S, T> &batch) {
        std::size_t count = 0;
        for ( const auto &tag : batch ) count += tag.second.size();
        return count;
    }


}

