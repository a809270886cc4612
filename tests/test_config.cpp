#include "hirespipe/config/configuration.hpp"
#include "hirespipe/core/errors.hpp"

#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>

#include <yaml-cpp/yaml.h>

using hirespipe::ConfigError;
using hirespipe::ValidationError;
using hirespipe::config::Config;

namespace {

Config valid_config() {
    Config cfg;
    cfg.source_dir = "/data/incoming";
    cfg.dest_dir = "/data/outgoing";
    return cfg;
}

} // namespace

TEST_CASE("config_defaults_match_documented_values") {
    Config cfg;
    REQUIRE(cfg.stability_poll_interval_ms == 500);
    REQUIRE(cfg.stability_required_samples == 2);
    REQUIRE(cfg.stability_timeout_ms == 60000);
    REQUIRE(cfg.worker_count == 2);
    REQUIRE(cfg.max_retries == 5);
    REQUIRE(cfg.retry_base_delay_ms == 1000);
    REQUIRE_FALSE(cfg.overwrite_existing);
    REQUIRE(cfg.transform == "passthrough");
}

TEST_CASE("config_from_yaml_reads_camel_case_keys") {
    YAML::Node node = YAML::Load(R"(
sourceDir: /in
destDir: /out
stabilityPollIntervalMs: 250
stabilityRequiredSamples: 3
stabilityTimeoutMs: 5000
workerCount: 4
maxRetries: 7
retryBaseDelayMs: 200
overwriteExisting: true
recursive: true
extensions: [raw, ".TIF"]
outputSuffix: _70
)");

    Config cfg = Config::from_yaml(node);

    REQUIRE(cfg.source_dir == "/in");
    REQUIRE(cfg.dest_dir == "/out");
    REQUIRE(cfg.stability_poll_interval_ms == 250);
    REQUIRE(cfg.stability_required_samples == 3);
    REQUIRE(cfg.stability_timeout_ms == 5000);
    REQUIRE(cfg.worker_count == 4);
    REQUIRE(cfg.max_retries == 7);
    REQUIRE(cfg.retry_base_delay_ms == 200);
    REQUIRE(cfg.overwrite_existing);
    REQUIRE(cfg.recursive);
    REQUIRE(cfg.extensions.size() == 2);
    REQUIRE(cfg.output_suffix == "_70");
    REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("config_bad_value_is_config_error") {
    YAML::Node node = YAML::Load("workerCount: lots\n");
    REQUIRE_THROWS_AS(Config::from_yaml(node), ConfigError);

    YAML::Node list = YAML::Load("- a\n- b\n");
    REQUIRE_THROWS_AS(Config::from_yaml(list), ConfigError);
}

TEST_CASE("config_load_missing_file_throws") {
    REQUIRE_THROWS_AS(Config::load("/nonexistent/hirespipe.yaml"), ConfigError);
}

TEST_CASE("config_save_and_load_preserves_values") {
    hirespipe::test::TempDir dir;
    Config cfg = valid_config();
    cfg.worker_count = 3;
    cfg.extensions = {".raw"};
    cfg.transform = "command";
    cfg.transform_command = "upscale {input} {output}";

    cfg.save(dir / "config.yaml");
    Config loaded = Config::load(dir / "config.yaml");

    REQUIRE(loaded.source_dir == cfg.source_dir);
    REQUIRE(loaded.worker_count == 3);
    REQUIRE(loaded.extensions == cfg.extensions);
    REQUIRE(loaded.transform_command == cfg.transform_command);
    REQUIRE_NOTHROW(loaded.validate());
}

TEST_CASE("config_validate_rejects_bad_settings") {
    SECTION("missing directories") {
        Config cfg;
        REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
    }
    SECTION("same source and destination") {
        Config cfg = valid_config();
        cfg.dest_dir = cfg.source_dir + "/";
        REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
    }
    SECTION("zero required samples") {
        Config cfg = valid_config();
        cfg.stability_required_samples = 0;
        REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
    }
    SECTION("single required sample") {
        Config cfg = valid_config();
        cfg.stability_required_samples = 1;
        REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
    }
    SECTION("destination inside recursive source") {
        Config cfg = valid_config();
        cfg.dest_dir = cfg.source_dir + "/out";
        cfg.recursive = true;
        REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
    }
    SECTION("timeout shorter than poll interval") {
        Config cfg = valid_config();
        cfg.stability_timeout_ms = 100;
        REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
    }
    SECTION("worker count out of range") {
        Config cfg = valid_config();
        cfg.worker_count = 0;
        REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
    }
    SECTION("zero retries") {
        Config cfg = valid_config();
        cfg.max_retries = 0;
        REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
    }
    SECTION("command template without placeholders") {
        Config cfg = valid_config();
        cfg.transform = "command";
        cfg.transform_command = "upscale";
        REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
    }
    SECTION("unknown transform") {
        Config cfg = valid_config();
        cfg.transform = "magic";
        REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
    }
}

TEST_CASE("config_effective_paths_default_under_destination") {
    Config cfg = valid_config();
    REQUIRE(cfg.effective_ledger_path() == "/data/outgoing/.hirespipe-ledger.jsonl");
    REQUIRE(cfg.effective_log_dir() == "/data/outgoing/.hirespipe-logs");

    cfg.ledger_path = "/var/lib/hirespipe/ledger.jsonl";
    REQUIRE(cfg.effective_ledger_path() == "/var/lib/hirespipe/ledger.jsonl");
}

TEST_CASE("config_nested_destination_allowed_for_flat_scan") {
    Config cfg = valid_config();
    cfg.dest_dir = cfg.source_dir + "/out";
    REQUIRE_NOTHROW(cfg.validate());

    // A sibling sharing the name prefix is not nested.
    cfg.dest_dir = cfg.source_dir + "-out";
    cfg.recursive = true;
    REQUIRE_NOTHROW(cfg.validate());
}
