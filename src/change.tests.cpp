/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#include <unionmount/change.hpp>
#include <unionmount/json.hpp>
#include <fost/test>


using namespace fostlib;


FSL_TEST_SUITE(change);


namespace {
    using overlays = unionmount::overlays<fostlib::string>;
    using action = unionmount::file_action<overlays>;
    using batch_type = unionmount::change<fostlib::string, fostlib::string>;
    const auto existing = unionmount::file_action<void>::refresh(
        unionmount::refresh_action::existing);
    const auto deleted = unionmount::file_action<void>::deletion();

    /// Two sources with an overlapping a.md and only B with b.md
    batch_type initial(unionmount::overlay_table<fostlib::string> &overlay) {
        batch_type batch;
        unionmount::change_insert(overlay, batch, fostlib::string("A"),
            fostlib::string("Doc"), "a.md", existing);
        unionmount::change_insert(overlay, batch, fostlib::string("B"),
            fostlib::string("Doc"), "a.md", existing);
        unionmount::change_insert(overlay, batch, fostlib::string("B"),
            fostlib::string("Doc"), "b.md", existing);
        return batch;
    }
}


FSL_TEST_FUNCTION(initial_batch_has_full_overlays) {
    unionmount::overlay_table<fostlib::string> overlay;
    auto batch = initial(overlay);
    FSL_CHECK_EQ(batch.size(), 1u);
    FSL_CHECK_EQ(unionmount::entries(batch), 2u);
    FSL_CHECK(batch["Doc"]["a.md"] == action::refresh(
        unionmount::refresh_action::existing,
        overlays{{"A", "a.md"}, {"B", "a.md"}}));
    FSL_CHECK(batch["Doc"]["b.md"] == action::refresh(
        unionmount::refresh_action::existing, overlays{{"B", "b.md"}}));
    FSL_CHECK_EQ(overlay.size(), 2u);
    FSL_CHECK_EQ(overlay.providers("a.md").size(), 2u);
    FSL_CHECK_EQ(overlay.providers("b.md").size(), 1u);
}


FSL_TEST_FUNCTION(delete_with_other_source_remaining) {
    unionmount::overlay_table<fostlib::string> overlay;
    initial(overlay);
    batch_type batch;
    unionmount::change_insert(overlay, batch, fostlib::string("A"),
        fostlib::string("Doc"), "a.md", deleted);
    FSL_CHECK_EQ(unionmount::entries(batch), 1u);
    FSL_CHECK(batch["Doc"]["a.md"] == action::refresh(
        unionmount::refresh_action::existing, overlays{{"B", "a.md"}}));
}


FSL_TEST_FUNCTION(delete_of_last_source) {
    unionmount::overlay_table<fostlib::string> overlay;
    initial(overlay);
    batch_type batch;
    unionmount::change_insert(overlay, batch, fostlib::string("B"),
        fostlib::string("Doc"), "b.md", deleted);
    FSL_CHECK(batch["Doc"]["b.md"].is_delete());
    FSL_CHECK(not overlay.contains("b.md"));
    FSL_CHECK_EQ(overlay.size(), 1u);
}


FSL_TEST_FUNCTION(refresh_keeps_the_triggering_action) {
    unionmount::overlay_table<fostlib::string> overlay;
    initial(overlay);
    batch_type batch;
    unionmount::change_insert(overlay, batch, fostlib::string("A"),
        fostlib::string("Doc"), "a.md",
        unionmount::file_action<void>::refresh(unionmount::refresh_action::updated));
    unionmount::change_insert(overlay, batch, fostlib::string("A"),
        fostlib::string("Doc"), "c.md",
        unionmount::file_action<void>::refresh(unionmount::refresh_action::created));
    FSL_CHECK(batch["Doc"]["a.md"] == action::refresh(
        unionmount::refresh_action::updated,
        overlays{{"A", "a.md"}, {"B", "a.md"}}));
    FSL_CHECK(batch["Doc"]["c.md"] == action::refresh(
        unionmount::refresh_action::created, overlays{{"A", "c.md"}}));
}


FSL_TEST_FUNCTION(last_write_wins) {
    unionmount::overlay_table<fostlib::string> overlay;
    batch_type batch;
    unionmount::change_insert(overlay, batch, fostlib::string("A"),
        fostlib::string("Doc"), "a.md", existing);
    unionmount::change_insert(overlay, batch, fostlib::string("A"),
        fostlib::string("Doc"), "a.md", deleted);
    FSL_CHECK_EQ(unionmount::entries(batch), 1u);
    FSL_CHECK(batch["Doc"]["a.md"].is_delete());
}


FSL_TEST_FUNCTION(deletion_has_no_payload) {
    FSL_CHECK(action::deletion().action().isnull());
    FSL_CHECK_EXCEPTION(action::deletion().payload(), fostlib::exceptions::null&);
}


FSL_TEST_FUNCTION(json) {
    unionmount::overlay_table<fostlib::string> overlay;
    auto batch = initial(overlay);
    auto j = unionmount::change_json(batch);
    FSL_CHECK_EQ(j["Doc"]["a.md"]["action"], fostlib::json("existing"));
    FSL_CHECK_EQ(j["Doc"]["a.md"]["overlays"].size(), 2u);
    FSL_CHECK_EQ(j["Doc"]["a.md"]["overlays"][1][0], fostlib::json("B"));
    FSL_CHECK_EQ(j["Doc"]["b.md"]["overlays"][0][1], fostlib::json("b.md"));
    FSL_CHECK_EQ(
        fostlib::coerce<fostlib::json>(action::deletion())["action"],
        fostlib::json("delete"));
}

