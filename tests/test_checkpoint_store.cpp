#include "stagehand/core/errors.hpp"
#include "stagehand/core/utils.hpp"
#include "stagehand/runner/checkpoint_store.hpp"

#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <unistd.h>

namespace fs = std::filesystem;
using stagehand::CheckpointKey;
using stagehand::MarkerStatus;
using stagehand::RunState;
using stagehand::runner::CheckpointStore;
using stagehand::testing::TempDir;

TEST_CASE("checkpoint_store_reports_absent_for_unknown_keys") {
    TempDir tmp;
    CheckpointStore store(tmp.path(), "demo");
    REQUIRE(store.status({"prepare", "fetch"}) == MarkerStatus::ABSENT);
    REQUIRE_FALSE(store.record({"prepare", "fetch"}).has_value());
    REQUIRE(store.list().empty());
    REQUIRE_FALSE(store.run_state().has_value());
}

TEST_CASE("checkpoint_store_keeps_exactly_one_marker_per_key") {
    TempDir tmp;
    CheckpointStore store(tmp.path(), "demo");
    CheckpointKey key{"prepare", "fetch"};

    store.mark_start(key);
    REQUIRE(store.status(key) == MarkerStatus::INITIALIZING);
    REQUIRE(fs::exists(store.marker_path(key, MarkerStatus::INITIALIZING)));

    store.mark_running(key, 4242);
    REQUIRE(store.status(key) == MarkerStatus::RUNNING);
    REQUIRE(store.record(key)->pid == 4242);
    REQUIRE_FALSE(fs::exists(store.marker_path(key, MarkerStatus::INITIALIZING)));

    store.mark_complete(key);
    REQUIRE(store.status(key) == MarkerStatus::COMPLETED);
    REQUIRE_FALSE(fs::exists(store.marker_path(key, MarkerStatus::RUNNING)));

    size_t flags = 0;
    for (const auto& entry : fs::directory_iterator(store.checkpoint_dir())) {
        (void)entry;
        ++flags;
    }
    REQUIRE(flags == 1);
}

TEST_CASE("checkpoint_store_marker_records_are_json") {
    TempDir tmp;
    CheckpointStore store(tmp.path(), "demo");
    CheckpointKey key{"prepare", "fetch"};
    store.mark_failed(key);

    fs::path p = store.marker_path(key, MarkerStatus::FAILED);
    REQUIRE(p.filename() == "demo.prepare.fetch.failed.flag");
    auto j = nlohmann::json::parse(stagehand::core::read_text(p));
    REQUIRE(j["pipeline"] == "demo");
    REQUIRE(j["key"] == "prepare/fetch");
    REQUIRE(j["status"] == "failed");
    REQUIRE(j["pid"] == static_cast<int>(::getpid()));
    REQUIRE(j["updated_ns"].get<int64_t>() > 0);
}

TEST_CASE("checkpoint_store_prefers_the_newest_marker_when_two_exist") {
    TempDir tmp;
    CheckpointStore store(tmp.path(), "demo");
    CheckpointKey key{"prepare", "fetch"};

    fs::create_directories(store.checkpoint_dir());
    stagehand::core::write_text(store.marker_path(key, MarkerStatus::COMPLETED),
                                R"({"status":"completed","updated_ns":100})");
    stagehand::core::write_text(store.marker_path(key, MarkerStatus::RUNNING),
                                R"({"status":"running","updated_ns":200,"pid":7})");
    REQUIRE(store.status(key) == MarkerStatus::RUNNING);
    REQUIRE(store.list().size() == 1);
}

TEST_CASE("checkpoint_store_treats_an_empty_marker_file_as_present") {
    TempDir tmp;
    CheckpointStore store(tmp.path(), "demo");
    CheckpointKey key{"qc", ""};

    fs::create_directories(store.checkpoint_dir());
    stagehand::core::write_text(store.marker_path(key, MarkerStatus::COMPLETED), "");
    REQUIRE(store.status(key) == MarkerStatus::COMPLETED);
    REQUIRE(store.record(key)->updated_ns == 0);
}

TEST_CASE("checkpoint_store_rejects_corrupt_records") {
    TempDir tmp;
    CheckpointStore store(tmp.path(), "demo");
    CheckpointKey key{"qc", "stats"};

    fs::create_directories(store.checkpoint_dir());
    stagehand::core::write_text(store.marker_path(key, MarkerStatus::COMPLETED), "{not json");
    REQUIRE_THROWS_AS(store.status(key), stagehand::CheckpointStoreError);
}

TEST_CASE("checkpoint_store_list_ignores_other_pipelines") {
    TempDir tmp;
    CheckpointStore a(tmp.path(), "alpha");
    CheckpointStore b(tmp.path(), "beta");

    a.mark_complete({"s1", ""});
    a.mark_complete({"s1", "x"});
    b.mark_complete({"s1", "x"});

    auto listed = a.list();
    REQUIRE(listed.size() == 2);
    REQUIRE(listed[0].key.stage == "s1");

    a.clear_all();
    REQUIRE(a.list().empty());
    REQUIRE(b.status({"s1", "x"}) == MarkerStatus::COMPLETED);
}

TEST_CASE("checkpoint_store_run_state_flag_is_unique_and_carries_extra_fields") {
    TempDir tmp;
    CheckpointStore store(tmp.path(), "demo");

    store.set_run_state(RunState::RUNNING, {{"config_sha256", "abc"}});
    auto rec = store.run_state();
    REQUIRE(rec.has_value());
    REQUIRE(rec->state == RunState::RUNNING);
    REQUIRE(rec->pid == ::getpid());
    REQUIRE(rec->data["config_sha256"] == "abc");

    store.set_run_state(RunState::COMPLETED);
    REQUIRE(store.run_state()->state == RunState::COMPLETED);
    REQUIRE_FALSE(fs::exists(store.run_state_path(RunState::RUNNING)));
    REQUIRE(fs::exists(tmp / "demo_completed.flag"));
}

TEST_CASE("checkpoint_store_dynamic_recovery_record_round_trips") {
    TempDir tmp;
    CheckpointStore store(tmp.path(), "demo");

    REQUIRE_FALSE(store.dynamic_recovery_requested());
    store.set_dynamic_recovery(true, "halted by signal 15");
    REQUIRE(store.dynamic_recovery_requested());
    REQUIRE(fs::exists(tmp / "demo_recover.flag"));

    store.set_dynamic_recovery(false);
    REQUIRE_FALSE(store.dynamic_recovery_requested());
    REQUIRE_NOTHROW(store.set_dynamic_recovery(false));
}
