#include <catch2/catch_test_macros.hpp>

#include <embedded_mcp/config/config_loader.hpp>

#include <string>
#include <vector>

using namespace embedded_mcp;

namespace {

// Tests run from the build directory; derive testdata from this file's path.
std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto test_dir = this_file.substr(0, this_file.rfind('/'));       // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));        // .../test
    return test_root + "/testdata/" + filename;
}

Result<AppConfig, Error> ParseCli(std::vector<const char*> args) {
    args.insert(args.begin(), "embedded-mcp");
    return LoadFromCli(static_cast<int>(args.size()), args.data());
}

} // anonymous namespace

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: full config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("full_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.server.port == 23456);
    CHECK(config.server.startup_timeout_ms == 2500);
    CHECK(config.server.stop_grace_ms == 500);
    CHECK(config.server.tool_timeout_ms == 10000);
    CHECK(config.server.worker_threads == 4);
    CHECK(config.server.latency_scale == 0.5);
    REQUIRE(config.log_file.has_value());
    CHECK(*config.log_file == "/tmp/embedded-mcp.log");
    CHECK(config.json_logs);
    CHECK(config.verbose);
    CHECK_FALSE(config.quiet);
    REQUIRE(config.config_file.has_value());
}

TEST_CASE("LoadFromYaml: minimal config keeps defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("minimal_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.server.port == 15000);
    CHECK(config.server.startup_timeout_ms == 5000);
    CHECK(config.server.stop_grace_ms == 1000);
    CHECK(config.server.tool_timeout_ms == 30000);
    CHECK(config.server.worker_threads == 8);
    CHECK(config.server.latency_scale == 1.0);
    CHECK_FALSE(config.log_file.has_value());
    CHECK_FALSE(config.json_logs);
}

TEST_CASE("LoadFromYaml: errors are Config errors", "[config][yaml]") {
    SECTION("nonexistent file") {
        auto result = LoadFromYaml("/nonexistent/path/config.yaml");
        REQUIRE(result.IsErr());
        CHECK(result.Error().operation == "ConfigLoader");
        CHECK(result.Error().category == ErrorCategory::Config);
    }
    SECTION("wrong value type") {
        auto result = LoadFromYaml(TestDataPath("bad_types_config.yaml"));
        REQUIRE(result.IsErr());
        CHECK(result.Error().category == ErrorCategory::Config);
    }
    SECTION("malformed YAML") {
        auto result = LoadFromYaml(TestDataPath("malformed_config.yaml"));
        REQUIRE(result.IsErr());
        CHECK(result.Error().message.find("Failed to parse YAML file") == 0);
    }
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: no arguments gives defaults", "[config][cli]") {
    auto result = ParseCli({});
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    CHECK(config.server.port == 12345);
    CHECK_FALSE(config.config_file.has_value());
    CHECK_FALSE(config.list_tools);
    CHECK_FALSE(config.verbose);
}

TEST_CASE("LoadFromCli: all options", "[config][cli]") {
    auto result = ParseCli({"--port", "18080", "--startup-timeout", "900", "--grace", "250",
                            "--tool-timeout", "0", "--threads", "2", "--latency-scale", "0",
                            "--json-logs", "--log-file", "out.log", "--list-tools", "-q",
                            "-c", "conf.yaml"});
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    CHECK(config.server.port == 18080);
    CHECK(config.server.startup_timeout_ms == 900);
    CHECK(config.server.stop_grace_ms == 250);
    CHECK(config.server.tool_timeout_ms == 0);
    CHECK(config.server.worker_threads == 2);
    CHECK(config.server.latency_scale == 0.0);
    CHECK(config.json_logs);
    CHECK(*config.log_file == "out.log");
    CHECK(config.list_tools);
    CHECK(config.quiet);
    CHECK(*config.config_file == "conf.yaml");
}

TEST_CASE("LoadFromCli: unknown flag is a Config error", "[config][cli]") {
    auto result = ParseCli({"--bogus"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK(result.Error().message.find("CLI parse error") == 0);
}

TEST_CASE("LoadFromCli: non-numeric port is a Config error", "[config][cli]") {
    auto result = ParseCli({"--port", "abc"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

// ===========================================================================
// MergeConfigs
// ===========================================================================

TEST_CASE("MergeConfigs: CLI overrides YAML where given", "[config][merge]") {
    auto yaml = LoadFromYaml(TestDataPath("full_config.yaml"));
    REQUIRE(yaml.IsOk());
    auto cli = ParseCli({"--port", "19999", "-c", "full_config.yaml"});
    REQUIRE(cli.IsOk());

    auto merged = MergeConfigs(yaml.Value(), cli.Value());
    CHECK(merged.server.port == 19999);
    CHECK(merged.server.worker_threads == 4);       // from YAML
    CHECK(merged.server.latency_scale == 0.5);      // from YAML
    CHECK(merged.json_logs);                        // from YAML
    CHECK(*merged.log_file == "/tmp/embedded-mcp.log");
}

TEST_CASE("MergeConfigs: CLI flags only switch booleans on", "[config][merge]") {
    AppConfig yaml;
    yaml.verbose = true;
    AppConfig cli;
    cli.list_tools = true;

    auto merged = MergeConfigs(yaml, cli);
    CHECK(merged.verbose);
    CHECK(merged.list_tools);
}

// ===========================================================================
// ValidateConfig
// ===========================================================================

TEST_CASE("ValidateConfig: defaults are valid", "[config][validate]") {
    CHECK(ValidateConfig(AppConfig{}).IsOk());
}

TEST_CASE("ValidateConfig: rejects bad values", "[config][validate]") {
    AppConfig config;

    SECTION("privileged port") {
        config.server.port = 80;
        auto r = ValidateConfig(config);
        REQUIRE(r.IsErr());
        CHECK(r.Error().message == "Port must be between 1024 and 65535, got: 80");
    }
    SECTION("zero startup timeout") {
        config.server.startup_timeout_ms = 0;
        CHECK(ValidateConfig(config).IsErr());
    }
    SECTION("negative grace") {
        config.server.stop_grace_ms = -1;
        CHECK(ValidateConfig(config).IsErr());
    }
    SECTION("negative tool timeout") {
        config.server.tool_timeout_ms = -10;
        CHECK(ValidateConfig(config).IsErr());
    }
    SECTION("no worker threads") {
        config.server.worker_threads = 0;
        CHECK(ValidateConfig(config).IsErr());
    }
    SECTION("negative latency scale") {
        config.server.latency_scale = -0.5;
        CHECK(ValidateConfig(config).IsErr());
    }
    SECTION("verbose and quiet") {
        config.verbose = true;
        config.quiet = true;
        auto r = ValidateConfig(config);
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::Config);
    }
}
