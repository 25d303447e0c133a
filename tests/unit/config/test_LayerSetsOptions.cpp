#include <layersets/config/LayerSetsOptions.hpp>

#include <doctest/doctest.h>

#include <chrono>
#include <cstdlib>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

using namespace LS;

namespace {

struct EnvGuard {
    explicit EnvGuard(const char* key, const char* value)
        : key_(key) {
        if (const char* existing = std::getenv(key)) {
            original_ = std::string{existing};
        }
        if (value != nullptr) {
            setenv(key, value, 1);
        } else {
            unsetenv(key);
        }
    }

    ~EnvGuard() {
        if (original_.has_value()) {
            setenv(key_.c_str(), original_->c_str(), 1);
        } else {
            unsetenv(key_.c_str());
        }
    }

    std::string                key_;
    std::optional<std::string> original_;
};

struct ArgvBuilder {
    explicit ArgvBuilder(std::initializer_list<const char*> args) {
        storage.reserve(args.size());
        for (auto value : args) {
            storage.emplace_back(value);
        }
        pointers.reserve(storage.size());
        for (auto& entry : storage) {
            pointers.push_back(entry.data());
        }
    }

    auto argc() const -> int { return static_cast<int>(pointers.size()); }
    auto argv() -> char** { return pointers.data(); }

    std::vector<std::string> storage;
    std::vector<char*>       pointers;
};

} // namespace

TEST_CASE("LayerSetsOptions defaults match the documented limits") {
    EnvGuard db{"LAYERSETS_DB", nullptr};
    EnvGuard layers{"LAYERSETS_MAX_LAYERS", nullptr};
    ArgvBuilder args{"layerset_tool"};
    auto options = ParseLayerSetsArguments(args.argc(), args.argv());
    REQUIRE(options.has_value());
    CHECK(options->database_path == "layersets.db");
    CHECK(options->default_set_name == "default");
    CHECK(options->max_bytes == 2 * 1024 * 1024);
    CHECK(options->max_layer_count == 100);
    CHECK(options->max_named_sets == 15);
    CHECK(options->max_revisions_per_set == 25);
    CHECK(options->max_image_dimension == 8192);
    CHECK(options->save_rate_per_minute == 30);
    CHECK(options->save_rate_burst == 10);
    CHECK(options->wal_mode);
    CHECK(options->command.empty());
}

TEST_CASE("LayerSetsOptions Validate detects invalid combinations") {
    LayerSetsOptions options{};
    CHECK_FALSE(ValidateLayerSetsOptions(options).has_value());

    options.default_set_name = "bad/name";
    auto error = ValidateLayerSetsOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("--default-set") != std::string::npos);

    options.default_set_name = "default";
    options.max_layer_count  = 0;
    error                    = ValidateLayerSetsOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("--max-layers") != std::string::npos);

    options.max_layer_count = 100;
    options.log_level       = "verbose";
    error                   = ValidateLayerSetsOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("--log-level") != std::string::npos);

    options.log_level = "warn";
    options.command   = "explode";
    error             = ValidateLayerSetsOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("explode") != std::string::npos);
}

TEST_CASE("Environment overrides apply to CLI defaults") {
    EnvGuard db{"LAYERSETS_DB", "/tmp/env-layersets.db"};
    EnvGuard sets{"LAYERSETS_MAX_NAMED_SETS", "4"};
    EnvGuard fonts{"LAYERSETS_FONTS", "Roboto, Georgia ,"};
    EnvGuard wal{"LAYERSETS_WAL", "off"};
    EnvGuard level{"LAYERSETS_LOG_LEVEL", "debug"};

    ArgvBuilder args{"layerset_tool", "sets"};
    auto options = ParseLayerSetsArguments(args.argc(), args.argv());
    REQUIRE(options.has_value());
    CHECK(options->database_path == "/tmp/env-layersets.db");
    CHECK(options->max_named_sets == 4);
    CHECK(options->allowed_fonts == std::vector<std::string>{"Roboto", "Georgia"});
    CHECK_FALSE(options->wal_mode);
    CHECK(options->log_level == "debug");
    CHECK(options->command == "sets");
}

TEST_CASE("CLI flags override environment values") {
    EnvGuard db{"LAYERSETS_DB", "/tmp/env-layersets.db"};
    EnvGuard revisions{"LAYERSETS_MAX_REVISIONS", "9"};

    ArgvBuilder args{"layerset_tool", "--db", "/tmp/cli.db", "--max-revisions", "12", "--image", "Example.jpg",
                     "--set", "Notes", "--user", "42", "--limit", "200", "--admin", "--no-wal", "list"};
    auto options = ParseLayerSetsArguments(args.argc(), args.argv());
    REQUIRE(options.has_value());
    CHECK(options->database_path == "/tmp/cli.db");
    CHECK(options->max_revisions_per_set == 12);
    CHECK(options->image_name == "Example.jpg");
    CHECK(options->set_name == "Notes");
    CHECK(options->user_id == 42);
    CHECK(options->list_limit == 200);
    CHECK(options->as_admin);
    CHECK_FALSE(options->wal_mode);
    CHECK(options->command == "list");
}

TEST_CASE("Invalid environment values are rejected") {
    SUBCASE("integer") {
        EnvGuard bytes{"LAYERSETS_MAX_BYTES", "lots"};
        ArgvBuilder args{"layerset_tool"};
        CHECK_FALSE(ParseLayerSetsArguments(args.argc(), args.argv()).has_value());
    }
    SUBCASE("boolean") {
        EnvGuard wal{"LAYERSETS_WAL", "sometimes"};
        ArgvBuilder args{"layerset_tool"};
        CHECK_FALSE(ParseLayerSetsArguments(args.argc(), args.argv()).has_value());
    }
    SUBCASE("default set") {
        EnvGuard set{"LAYERSETS_DEFAULT_SET", "   "};
        ArgvBuilder args{"layerset_tool"};
        CHECK_FALSE(ParseLayerSetsArguments(args.argc(), args.argv()).has_value());
    }
    SUBCASE("empty database path") {
        EnvGuard db{"LAYERSETS_DB", ""};
        ArgvBuilder args{"layerset_tool"};
        CHECK_FALSE(ParseLayerSetsArguments(args.argc(), args.argv()).has_value());
    }
}

TEST_CASE("Invalid CLI arguments are rejected") {
    for (auto const& argv : std::vector<std::vector<char const*>>{
             {"layerset_tool", "--limit", "0"},
             {"layerset_tool", "--limit", "201"},
             {"layerset_tool", "--max-layers", "-3"},
             {"layerset_tool", "--max-bytes"},
             {"layerset_tool", "--user", "abc"},
             {"layerset_tool", "--revision-id", "0"},
             {"layerset_tool", "--fonts", " , "},
             {"layerset_tool", "--log-level", "chatty"},
             {"layerset_tool", "--bogus"},
             {"layerset_tool", "explode"},
             {"layerset_tool", "save", "extra"},
         }) {
        std::vector<std::string> storage(argv.begin(), argv.end());
        std::vector<char*>       pointers;
        for (auto& entry : storage)
            pointers.push_back(entry.data());
        CAPTURE(storage.back());
        CHECK_FALSE(ParseLayerSetsArguments(static_cast<int>(pointers.size()), pointers.data()).has_value());
    }
}

TEST_CASE("Help flag is recorded") {
    ArgvBuilder args{"layerset_tool", "--help"};
    auto options = ParseLayerSetsArguments(args.argc(), args.argv());
    REQUIRE(options.has_value());
    CHECK(options->show_help);
}

TEST_CASE("Component configs follow the options") {
    LayerSetsOptions options{};
    options.database_path         = "/tmp/x.db";
    options.max_named_sets        = 3;
    options.max_revisions_per_set = 7;
    options.busy_timeout_ms       = 250;
    options.max_layer_count       = 20;
    options.max_points            = 50;
    options.coordinate_bound      = 5000;
    options.save_rate_per_minute  = 5;
    options.save_rate_burst       = 1;
    options.default_set_name      = "main";
    options.allowed_fonts         = {"Roboto", "Georgia"};

    auto store = MakeRevisionStoreConfig(options);
    CHECK(store.databasePath == "/tmp/x.db");
    CHECK(store.maxNamedSets == 3);
    CHECK(store.maxRevisionsPerSet == 7);
    CHECK(store.busyTimeout == std::chrono::milliseconds{250});
    CHECK(store.defaultSetName == "main");

    auto validator = MakeValidatorConfig(options);
    CHECK(validator.maxLayerCount == 20);
    CHECK(validator.maxPoints == 50);
    CHECK(validator.coordinateBound == 5000.0);
    CHECK(validator.defaultFont == "Roboto");

    auto capacity = MakeCapacityConfig(options);
    CHECK(capacity.maxLayerCount == 20);
    CHECK(capacity.saveRate.perMinute == 5);
    CHECK(capacity.saveRate.burst == 1);

    auto service = MakeServiceConfig(options);
    CHECK(service.defaultSetName == "main");
    CHECK(service.maxBytes == options.max_bytes);
}

TEST_CASE("Log level names") {
    CHECK(ParseLogLevel("debug") == LogLevel::Debug);
    CHECK(ParseLogLevel("warn") == LogLevel::Warning);
    CHECK(ParseLogLevel("warning") == LogLevel::Warning);
    CHECK_FALSE(ParseLogLevel("trace").has_value());
}
