/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#pragma once


#include <unionmount/change.hpp>
#include <unionmount/listing.hpp>
#include <unionmount/model.hpp>
#include <unionmount/monitor.hpp>

#include <fost/log>

#include <set>


namespace unionmount {


    /// The sources to union, each with its root directory
    template<typename S>
    using sources_type = std::set<std::pair<S, boost::filesystem::path>>;

    /// Receives each batch of changes
    template<typename S, typename T>
    using handler_fn = std::function<void(const change<S, T> &)>;


    /// Count a change that was ignored or had no tag
    void count_dropped_change();
    /// Count a batch handed to the handler
    void count_batch();


    /// Scan every source and record what each provides. Returns one batch
    /// with every matched file reported as `existing`.
    template<typename S, typename T>
    change<S, T> initial_change(
        overlay_table<S> &overlay, const sources_type<S> &sources,
        const tag_patterns<T> &patterns, const std::vector<pattern> &ignore
    ) {
        change<S, T> batch;
        for ( const auto &source : sources ) {
            auto tagged = files_matching_with_tag(source.second, patterns, ignore);
            for ( const auto &files : tagged ) {
                for ( const auto &file : files.second ) {
                    change_insert(overlay, batch, source.first, files.first, file,
                        file_action<void>::refresh(refresh_action::existing));
                }
            }
        }
        return batch;
    }


    /// Union the sources. The handler is first given a batch describing
    /// everything that matched in the initial scan and then one batch for
    /// each relevant change seen by the watches. Returns when the scope is
    /// stopped and throws if a listing, watch or the handler fails.
    template<typename S, typename T>
    void union_mount(
        const sources_type<S> &sources, const tag_patterns<T> &patterns,
        const std::vector<pattern> &ignore, handler_fn<S, T> handler,
        scope &stop
    ) {
        overlay_table<S> overlay;
        handler(initial_change(overlay, sources, patterns, ignore));
        count_batch();

        std::vector<S> names;
        std::vector<boost::filesystem::path> roots;
        for ( const auto &source : sources ) {
            names.push_back(source.first);
            roots.push_back(source.second);
        }
        monitor watch(roots, stop);
        watch([&](const event &e) {
            auto tag = accept_event(patterns, ignore, e.path);
            if ( tag.isnull() ) {
                count_dropped_change();
                fostlib::log::debug(c_fost_unionmount)
                    ("", "Ignoring change")
                    ("source", e.source)
                    ("path", e.path);
                return;
            }
            change<S, T> batch;
            change_insert(overlay, batch, names[e.source], tag.value(), e.path, e.action);
            handler(batch);
            count_batch();
        });
    }

    /// Union the sources until an unrecovered fault
    template<typename S, typename T>
    void union_mount(
        const sources_type<S> &sources, const tag_patterns<T> &patterns,
        const std::vector<pattern> &ignore, handler_fn<S, T> handler
    ) {
        scope forever;
        union_mount(sources, patterns, ignore, std::move(handler), forever);
    }


    /// Like `union_mount`, but each batch is turned into an update of the
    /// model in the store. The store must not already hold a value as it
    /// is set from `model0` when the initial scan is complete. If `handle`
    /// throws the exception is logged and ignored.
    template<typename S, typename T, typename M>
    void union_mount_on_variable(
        const sources_type<S> &sources, const tag_patterns<T> &patterns,
        const std::vector<pattern> &ignore,
        model_store<M> &store, M model0,
        std::function<transform<M>(const change<S, T> &)> handle,
        scope &stop
    ) {
        model_driver<M> driver(store, std::move(model0));
        union_mount<S, T>(sources, patterns, ignore,
            [&driver, &handle](const change<S, T> &batch) {
                driver([&]() { return handle(batch); });
            }, stop);
    }

    template<typename S, typename T, typename M>
    void union_mount_on_variable(
        const sources_type<S> &sources, const tag_patterns<T> &patterns,
        const std::vector<pattern> &ignore,
        model_store<M> &store, M model0,
        std::function<transform<M>(const change<S, T> &)> handle
    ) {
        scope forever;
        union_mount_on_variable(sources, patterns, ignore,
            store, std::move(model0), std::move(handle), forever);
    }


    /// The source of a mount that only has one
    struct only_source {
        bool operator < (only_source) const {
            return false;
        }
        bool operator == (only_source) const {
            return true;
        }
    };


    /// Mount a single folder. The per file function is called for every
    /// entry in a batch, in order, and the returned updates are applied in
    /// that same order.
    template<typename T, typename M>
    void mount_on_variable(
        const boost::filesystem::path &folder, const tag_patterns<T> &patterns,
        const std::vector<pattern> &ignore,
        model_store<M> &store, M model0,
        std::function<transform<M>(const T &, const boost::filesystem::path &,
            const file_action<void> &)> per_file,
        scope &stop
    ) {
        sources_type<only_source> sources;
        sources.emplace(only_source(), folder);
        union_mount_on_variable<only_source, T, M>(sources, patterns, ignore,
            store, std::move(model0),
            [&per_file](const change<only_source, T> &batch) {
                std::vector<transform<M>> updates;
                for ( const auto &tag : batch ) {
                    for ( const auto &file : tag.second ) {
                        const auto act = file.second.action();
                        updates.push_back(per_file(tag.first, file.first,
                            act.isnull() ? file_action<void>::deletion()
                                : file_action<void>::refresh(act.value())));
                    }
                }
                return transform<M>([updates](M m) {
                    for ( const auto &update : updates ) m = update(std::move(m));
                    return m;
                });
            },
            stop);
    }


}

