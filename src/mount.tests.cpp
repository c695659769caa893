/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#include <unionmount/mount.hpp>
#include <fost/file>
#include <fost/test>

#include <boost/filesystem.hpp>

#include <atomic>
#include <chrono>
#include <map>
#include <stdexcept>
#include <thread>


using namespace fostlib;
using unionmount::pattern;


FSL_TEST_SUITE(mount);


namespace {
    using overlays = unionmount::overlays<fostlib::string>;
    using action = unionmount::file_action<overlays>;
    using batch_type = unionmount::change<fostlib::string, fostlib::string>;
    using files_model = std::set<boost::filesystem::path>;

    boost::filesystem::path make_root() {
        const auto root = boost::filesystem::canonical(
            boost::filesystem::temp_directory_path()) /
                boost::filesystem::unique_path();
        boost::filesystem::create_directories(root);
        return root;
    }

    unionmount::tag_patterns<fostlib::string> docs() {
        return {{"Doc", pattern("**/*.md")}};
    }

    /// Keeps the set of logical paths that currently exist
    unionmount::transform<files_model> track_files(const batch_type &batch) {
        return [batch](files_model m) {
            for ( const auto &tag : batch ) {
                for ( const auto &file : tag.second ) {
                    if ( file.second.is_delete() ) {
                        m.erase(file.first);
                    } else {
                        m.insert(file.first);
                    }
                }
            }
            return m;
        };
    }

    /// Poll for up to ten seconds, calling `touch` between the checks
    template<typename C, typename T>
    bool eventually(C check, T touch) {
        for ( auto attempt = 0; attempt < 100; ++attempt ) {
            if ( check() ) return true;
            touch();
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        return check();
    }
}


FSL_TEST_FUNCTION(initial_scan_unions_sources) {
    const auto r1 = make_root(), r2 = make_root();
    fostlib::utf::save_file(r1 / "a.md", "one\n");
    fostlib::utf::save_file(r1 / "x.txt", "not a doc\n");
    fostlib::utf::save_file(r2 / "a.md", "two\n");
    fostlib::utf::save_file(r2 / "b.md", "two\n");

    unionmount::sources_type<fostlib::string> sources{{"one", r1}, {"two", r2}};
    unionmount::overlay_table<fostlib::string> overlay;
    auto batch = unionmount::initial_change(overlay, sources, docs(), {});

    FSL_CHECK_EQ(batch.size(), 1u);
    FSL_CHECK_EQ(unionmount::entries(batch), 2u);
    FSL_CHECK(batch["Doc"]["a.md"] == action::refresh(
        unionmount::refresh_action::existing,
        overlays{{"one", "a.md"}, {"two", "a.md"}}));
    FSL_CHECK(batch["Doc"]["b.md"] == action::refresh(
        unionmount::refresh_action::existing, overlays{{"two", "b.md"}}));
    FSL_CHECK(not overlay.contains("x.txt"));

    boost::filesystem::remove_all(r1);
    boost::filesystem::remove_all(r2);
}


FSL_TEST_FUNCTION(empty_sources_give_empty_batch) {
    const auto r1 = make_root();
    unionmount::sources_type<fostlib::string> sources{{"one", r1}};
    unionmount::overlay_table<fostlib::string> overlay;
    auto batch = unionmount::initial_change(overlay, sources, docs(), {});
    FSL_CHECK(batch.empty());
    FSL_CHECK_EQ(overlay.size(), 0u);
    boost::filesystem::remove_all(r1);
}


FSL_TEST_FUNCTION(changes_reach_the_model) {
    const auto r1 = make_root(), r2 = make_root();
    fostlib::utf::save_file(r1 / "a.md", "a\n");
    fostlib::utf::save_file(r2 / "a.md", "a\n");
    unionmount::sources_type<fostlib::string> sources{{"one", r1}, {"two", r2}};

    unionmount::variable<files_model> model;
    unionmount::scope stop;
    std::exception_ptr failed;
    std::thread mount([&]() {
        try {
            unionmount::union_mount_on_variable<fostlib::string, fostlib::string, files_model>(
                sources, docs(), {}, model, files_model(), track_files, stop);
        } catch ( ... ) {
            failed = std::current_exception();
        }
    });

    FSL_CHECK_EQ(model.read().size(), 1u);
    FSL_CHECK_EQ(model.read().count("a.md"), 1u);

    /// The watches may not be in place yet so keep touching the file
    /// until the change comes through
    for ( auto attempt = 0; attempt < 100 && not model.read().count("b.md"); ++attempt ) {
        fostlib::utf::save_file(r2 / "b.md", "b\n");
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    const auto seen = model.read();
    stop.stop();
    mount.join();

    FSL_CHECK(not failed);
    FSL_CHECK_EQ(seen.count("b.md"), 1u);
    FSL_CHECK_EQ(seen.count("a.md"), 1u);
    FSL_CHECK(model.version() >= 2u);
    boost::filesystem::remove_all(r1);
    boost::filesystem::remove_all(r2);
}


FSL_TEST_FUNCTION(single_folder_applies_files_in_order) {
    const auto r1 = make_root();
    fostlib::utf::save_file(r1 / "a.md", "a\n");
    fostlib::utf::save_file(r1 / "b.md", "b\n");
    fostlib::utf::save_file(r1 / "c.txt", "c\n");

    using log_model = std::vector<std::string>;
    unionmount::variable<log_model> model;
    unionmount::scope stop;
    std::exception_ptr failed;
    std::thread mount([&]() {
        try {
            unionmount::mount_on_variable<fostlib::string, log_model>(
                r1, docs(), {}, model, log_model(),
                [](const fostlib::string &tag, const boost::filesystem::path &p,
                        const unionmount::file_action<void> &) {
                    const std::string entry = tag.std_str() + " " + p.string();
                    return unionmount::transform<log_model>([entry](log_model m) {
                        m.push_back(entry);
                        return m;
                    });
                },
                stop);
        } catch ( ... ) {
            failed = std::current_exception();
        }
    });
    const auto initial = model.read();
    stop.stop();
    mount.join();

    FSL_CHECK(not failed);
    FSL_CHECK_EQ(initial.size(), 2u);
    FSL_CHECK_EQ(initial[0], "Doc a.md");
    FSL_CHECK_EQ(initial[1], "Doc b.md");
    boost::filesystem::remove_all(r1);
}


FSL_TEST_FUNCTION(missing_root_fails_before_any_batch) {
    const auto missing = boost::filesystem::temp_directory_path() /
        boost::filesystem::unique_path();
    unionmount::sources_type<fostlib::string> sources{{"one", missing}};
    std::size_t batches = 0;
    unionmount::scope stop;
    FSL_CHECK_EXCEPTION(
        (unionmount::union_mount<fostlib::string, fostlib::string>(
            sources, docs(), {},
            [&batches](const batch_type &) { ++batches; },
            stop)),
        boost::filesystem::filesystem_error&);
    FSL_CHECK_EQ(batches, 0u);
}


FSL_TEST_FUNCTION(handler_fault_stops_the_mount) {
    const auto r1 = make_root();
    unionmount::sources_type<fostlib::string> sources{{"one", r1}};

    std::atomic<int> batches{0};
    std::atomic<bool> finished{false};
    unionmount::scope stop;
    std::exception_ptr failed;
    std::thread mount([&]() {
        try {
            unionmount::union_mount<fostlib::string, fostlib::string>(
                sources, docs(), {},
                [&batches](const batch_type &) {
                    if ( batches++ ) throw std::runtime_error("handler failed");
                },
                stop);
        } catch ( ... ) {
            failed = std::current_exception();
        }
        finished = true;
    });

    const bool ended = eventually(
        [&finished]() { return bool(finished); },
        [&r1]() { fostlib::utf::save_file(r1 / "a.md", "a\n"); });
    stop.stop();
    mount.join();

    FSL_CHECK(ended);
    FSL_CHECK(batches >= 2);
    FSL_CHECK(failed != nullptr);
    if ( failed ) {
        FSL_CHECK_EXCEPTION(std::rethrow_exception(failed), std::runtime_error&);
    }
    boost::filesystem::remove_all(r1);
}


FSL_TEST_FUNCTION(handler_fault_leaves_later_changes_alone) {
    const auto r1 = make_root();
    unionmount::sources_type<fostlib::string> sources{{"one", r1}};

    std::atomic<int> rejected{0};
    unionmount::variable<files_model> model;
    unionmount::scope stop;
    std::exception_ptr failed;
    std::thread mount([&]() {
        try {
            unionmount::union_mount_on_variable<fostlib::string, fostlib::string, files_model>(
                sources, docs(), {}, model, files_model(),
                [&rejected](const batch_type &batch) {
                    for ( const auto &tag : batch ) {
                        if ( tag.second.count("bad.md") ) {
                            ++rejected;
                            throw std::runtime_error("bad.md is not allowed");
                        }
                    }
                    return track_files(batch);
                },
                stop);
        } catch ( ... ) {
            failed = std::current_exception();
        }
    });

    FSL_CHECK(model.read().empty());
    FSL_CHECK(eventually(
        [&rejected]() { return rejected > 0; },
        [&r1]() { fostlib::utf::save_file(r1 / "bad.md", "bad\n"); }));
    FSL_CHECK(eventually(
        [&model]() { return model.read().count("good.md") == 1u; },
        [&r1]() { fostlib::utf::save_file(r1 / "good.md", "good\n"); }));
    const auto seen = model.read();
    stop.stop();
    mount.join();

    FSL_CHECK(failed == nullptr);
    FSL_CHECK_EQ(seen.count("good.md"), 1u);
    FSL_CHECK_EQ(seen.count("bad.md"), 0u);
    boost::filesystem::remove_all(r1);
}


FSL_TEST_FUNCTION(watched_delete_and_ignored_directory) {
    using actions_model = std::map<boost::filesystem::path, action>;
    const auto r1 = make_root(), r2 = make_root();
    fostlib::utf::save_file(r1 / "a.md", "one\n");
    fostlib::utf::save_file(r2 / "a.md", "two\n");
    unionmount::sources_type<fostlib::string> sources{{"one", r1}, {"two", r2}};
    const std::vector<pattern> ignore{pattern("**/drafts/**")};

    unionmount::variable<actions_model> model;
    unionmount::scope stop;
    std::exception_ptr failed;
    std::thread mount([&]() {
        try {
            unionmount::union_mount_on_variable<fostlib::string, fostlib::string, actions_model>(
                sources, docs(), ignore, model, actions_model(),
                [](const batch_type &batch) {
                    return unionmount::transform<actions_model>([batch](actions_model m) {
                        for ( const auto &tag : batch ) {
                            for ( const auto &file : tag.second ) {
                                m[file.first] = file.second;
                            }
                        }
                        return m;
                    });
                },
                stop);
        } catch ( ... ) {
            failed = std::current_exception();
        }
    });

    const auto initial = model.read();
    const auto both = action::refresh(unionmount::refresh_action::existing,
        overlays{{"one", "a.md"}, {"two", "a.md"}});
    FSL_CHECK(initial.at("a.md") == both);

    /// Both sources are watched once a change in the second comes through
    FSL_CHECK(eventually(
        [&model]() { return model.read().count("sync.md") == 1u; },
        [&r2]() { fostlib::utf::save_file(r2 / "sync.md", "sync\n"); }));
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    const auto before = model.version();

    boost::filesystem::create_directories(r1 / "drafts");
    fostlib::utf::save_file(r1 / "drafts" / "x.md", "draft\n");
    boost::filesystem::remove(r1 / "a.md");
    FSL_CHECK(eventually(
        [&model, &both]() { return model.read().at("a.md") != both; },
        []() {}));
    const auto after = model.read();
    const auto version = model.version();
    stop.stop();
    mount.join();

    FSL_CHECK(failed == nullptr);
    FSL_CHECK(after.at("a.md") == action::refresh(
        unionmount::refresh_action::existing, overlays{{"two", "a.md"}}));
    FSL_CHECK_EQ(after.count("drafts/x.md"), 0u);
    FSL_CHECK_EQ(version, before + 1);
    boost::filesystem::remove_all(r1);
    boost::filesystem::remove_all(r2);
}
