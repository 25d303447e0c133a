#pragma once

#include <layersets/capacity/CapacityGuard.hpp>
#include <layersets/log/TaggedLogger.hpp>
#include <layersets/service/LayerSetService.hpp>
#include <layersets/storage/RevisionStore.hpp>
#include <layersets/validation/LayerValidator.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace LS {

struct LayerSetsOptions {
    std::string  database_path{"layersets.db"};
    std::string  images_manifest;
    std::string  default_set_name{"default"};
    std::int64_t max_bytes{2 * 1024 * 1024};
    std::int64_t max_layer_count{100};
    std::int64_t max_named_sets{15};
    std::int64_t max_revisions_per_set{25};
    std::int64_t max_image_dimension{8192};
    std::int64_t max_complexity{1000};
    std::int64_t max_image_bytes{1024 * 1024};
    std::int64_t max_points{1000};
    std::int64_t coordinate_bound{100000};
    std::int64_t busy_timeout_ms{5000};
    std::int64_t save_rate_per_minute{30};
    std::int64_t save_rate_burst{10};
    std::int64_t render_rate_per_minute{120};
    std::int64_t render_rate_burst{30};
    std::int64_t create_rate_per_minute{10};
    std::int64_t create_rate_burst{5};
    std::vector<std::string> allowed_fonts = defaultAllowedFonts();
    std::string  log_level{"info"};
    bool         wal_mode{true};
    bool         show_help{false};

    // layerset_tool
    std::string  command;
    std::string  image_name;
    std::string  content_hash;
    std::string  set_name;
    std::string  new_set_name;
    std::string  input_path{"-"};
    std::int64_t user_id{0};
    std::int64_t revision_id{0};
    std::int64_t keep_count{0};
    std::int64_t list_limit{50};
    bool         as_admin{false};
};

auto ParseLayerSetsArguments(int argc, char** argv) -> std::optional<LayerSetsOptions>;

void PrintLayerSetsUsage();

bool ApplyLayerSetsEnvOverrides(LayerSetsOptions& options);

auto ValidateLayerSetsOptions(LayerSetsOptions const& options) -> std::optional<std::string>;

auto ParseLogLevel(std::string_view name) -> std::optional<LogLevel>;

auto MakeRevisionStoreConfig(LayerSetsOptions const& options) -> RevisionStoreConfig;
auto MakeValidatorConfig(LayerSetsOptions const& options) -> ValidatorConfig;
auto MakeCapacityConfig(LayerSetsOptions const& options) -> CapacityConfig;
auto MakeServiceConfig(LayerSetsOptions const& options) -> LayerSetServiceConfig;

} // namespace LS
