#include <layersets/config/LayerSetsOptions.hpp>

#include <layersets/validation/Sanitizers.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace LS {

namespace {

template <typename T>
bool parse_integer(std::string_view text, T& out) {
    T value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    out = value;
    return true;
}

template <typename T>
bool parse_integer_in_range(std::string_view text, T min, T max, T& out) {
    T value{};
    if (!parse_integer(text, value)) {
        return false;
    }
    if (value < min || value > max) {
        return false;
    }
    out = value;
    return true;
}

std::optional<bool> parse_bool(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::string normalized;
    normalized.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    return std::nullopt;
}

std::vector<std::string> split_list(std::string_view text) {
    std::vector<std::string> items;
    while (!text.empty()) {
        auto comma = text.find(',');
        auto item  = text.substr(0, comma);
        while (!item.empty() && std::isspace(static_cast<unsigned char>(item.front())))
            item.remove_prefix(1);
        while (!item.empty() && std::isspace(static_cast<unsigned char>(item.back())))
            item.remove_suffix(1);
        if (!item.empty())
            items.emplace_back(item);
        if (comma == std::string_view::npos)
            break;
        text.remove_prefix(comma + 1);
    }
    return items;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

struct IntegerOption {
    std::string_view             flag;
    char const*                  env;
    std::int64_t LayerSetsOptions::*field;
    std::int64_t                 min;
};

constexpr auto kMax = std::numeric_limits<std::int64_t>::max();

constexpr std::array<IntegerOption, 17> kIntegerOptions{{
    {"--max-bytes", "LAYERSETS_MAX_BYTES", &LayerSetsOptions::max_bytes, 1},
    {"--max-layers", "LAYERSETS_MAX_LAYERS", &LayerSetsOptions::max_layer_count, 1},
    {"--max-named-sets", "LAYERSETS_MAX_NAMED_SETS", &LayerSetsOptions::max_named_sets, 1},
    {"--max-revisions", "LAYERSETS_MAX_REVISIONS", &LayerSetsOptions::max_revisions_per_set, 1},
    {"--max-image-dimension", "LAYERSETS_MAX_IMAGE_DIMENSION", &LayerSetsOptions::max_image_dimension, 1},
    {"--max-complexity", "LAYERSETS_MAX_COMPLEXITY", &LayerSetsOptions::max_complexity, 1},
    {"--max-image-bytes", "LAYERSETS_MAX_IMAGE_BYTES", &LayerSetsOptions::max_image_bytes, 0},
    {"--max-points", "LAYERSETS_MAX_POINTS", &LayerSetsOptions::max_points, 2},
    {"--coordinate-bound", "LAYERSETS_COORDINATE_BOUND", &LayerSetsOptions::coordinate_bound, 1},
    {"--busy-timeout-ms", "LAYERSETS_BUSY_TIMEOUT_MS", &LayerSetsOptions::busy_timeout_ms, 0},
    {"--save-rate-per-minute", "LAYERSETS_SAVE_RATE_PER_MINUTE", &LayerSetsOptions::save_rate_per_minute, 0},
    {"--save-rate-burst", "LAYERSETS_SAVE_RATE_BURST", &LayerSetsOptions::save_rate_burst, 0},
    {"--render-rate-per-minute", "LAYERSETS_RENDER_RATE_PER_MINUTE", &LayerSetsOptions::render_rate_per_minute, 0},
    {"--render-rate-burst", "LAYERSETS_RENDER_RATE_BURST", &LayerSetsOptions::render_rate_burst, 0},
    {"--create-rate-per-minute", "LAYERSETS_CREATE_RATE_PER_MINUTE", &LayerSetsOptions::create_rate_per_minute, 0},
    {"--create-rate-burst", "LAYERSETS_CREATE_RATE_BURST", &LayerSetsOptions::create_rate_burst, 0},
    {"--user", nullptr, &LayerSetsOptions::user_id, 1},
}};

auto find_integer_option(std::string_view flag) -> IntegerOption const* {
    for (auto const& option : kIntegerOptions) {
        if (option.flag == flag)
            return &option;
    }
    return nullptr;
}

bool is_known_command(std::string_view command) {
    static constexpr std::array<std::string_view, 9> kCommands{
        "save", "get", "latest", "list", "sets", "prune", "delete-set", "rename-set", "delete-image"};
    return std::find(kCommands.begin(), kCommands.end(), command) != kCommands.end();
}

} // namespace

auto ParseLogLevel(std::string_view name) -> std::optional<LogLevel> {
    if (name == "debug")
        return LogLevel::Debug;
    if (name == "info")
        return LogLevel::Info;
    if (name == "warning" || name == "warn")
        return LogLevel::Warning;
    if (name == "error")
        return LogLevel::Error;
    return std::nullopt;
}

auto ValidateLayerSetsOptions(LayerSetsOptions const& options) -> std::optional<std::string> {
    if (options.database_path.empty()) {
        return std::string{"--db must not be empty"};
    }
    if (!Sanitize::isValidSetName(options.default_set_name)) {
        return std::string{"--default-set must be a valid set name"};
    }
    for (auto const& option : kIntegerOptions) {
        if (option.env == nullptr)
            continue;
        if (options.*(option.field) < option.min) {
            return std::string{option.flag} + " must be >= " + std::to_string(option.min);
        }
    }
    if (options.allowed_fonts.empty()) {
        return std::string{"--fonts must name at least one font"};
    }
    if (!ParseLogLevel(options.log_level)) {
        return std::string{"--log-level must be one of debug, info, warning, error"};
    }
    if (!options.command.empty() && !is_known_command(options.command)) {
        return "Unknown command: " + options.command;
    }
    return std::nullopt;
}

bool ApplyLayerSetsEnvOverrides(LayerSetsOptions& options) {
    auto require_non_empty = [](char const* key, std::string& target) {
        return apply_env(key, [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << key << " must not be empty\n";
                return false;
            }
            target = std::string{value};
            return true;
        });
    };

    if (!require_non_empty("LAYERSETS_DB", options.database_path)) {
        return false;
    }
    if (!require_non_empty("LAYERSETS_IMAGES", options.images_manifest)) {
        return false;
    }

    if (!apply_env("LAYERSETS_DEFAULT_SET", [&](std::string_view value) {
            if (!Sanitize::isValidSetName(value)) {
                std::cerr << "LAYERSETS_DEFAULT_SET must be a valid set name\n";
                return false;
            }
            options.default_set_name = std::string{value};
            return true;
        })) {
        return false;
    }

    for (auto const& option : kIntegerOptions) {
        if (option.env == nullptr)
            continue;
        if (!apply_env(option.env, [&](std::string_view value) {
                std::int64_t parsed = options.*(option.field);
                if (!parse_integer_in_range<std::int64_t>(value, option.min, kMax, parsed)) {
                    std::cerr << option.env << " must be >= " << option.min << "\n";
                    return false;
                }
                options.*(option.field) = parsed;
                return true;
            })) {
            return false;
        }
    }

    if (!apply_env("LAYERSETS_FONTS", [&](std::string_view value) {
            auto fonts = split_list(value);
            if (fonts.empty()) {
                std::cerr << "LAYERSETS_FONTS must name at least one font\n";
                return false;
            }
            options.allowed_fonts = std::move(fonts);
            return true;
        })) {
        return false;
    }

    if (!apply_env("LAYERSETS_LOG_LEVEL", [&](std::string_view value) {
            if (!ParseLogLevel(value)) {
                std::cerr << "LAYERSETS_LOG_LEVEL must be one of debug, info, warning, error\n";
                return false;
            }
            options.log_level = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("LAYERSETS_WAL", [&](std::string_view value) {
            auto parsed = parse_bool(value);
            if (!parsed.has_value()) {
                std::cerr << "LAYERSETS_WAL must be a boolean (true/false, 1/0, yes/no)\n";
                return false;
            }
            options.wal_mode = *parsed;
            return true;
        })) {
        return false;
    }

    return true;
}

void PrintLayerSetsUsage() {
    std::cout << "Usage: layerset_tool [options] <command>\n"
              << "Commands:\n"
              << "  save          Validate and store layers read from --input (default stdin)\n"
              << "  get           Print the revision with --revision-id\n"
              << "  latest        Print the latest revision of --set\n"
              << "  list          List revisions of --set, newest first\n"
              << "  sets          List the named sets of --image\n"
              << "  prune         Keep only the newest --keep revisions of --set\n"
              << "  delete-set    Delete --set (creator or --admin only)\n"
              << "  rename-set    Rename --set to --new-name (creator or --admin only)\n"
              << "  delete-image  Delete every layer set of --image\n"
              << "Options:\n"
              << "  --db <path>                 SQLite database file (default layersets.db)\n"
              << "  --images <path>             JSON manifest mapping image names to sha1/mime/size\n"
              << "  --image <name>              Image the command applies to\n"
              << "  --hash <sha1>               Content hash, overrides the manifest\n"
              << "  --set <name>                Named set (default: the default set)\n"
              << "  --new-name <name>           Target name for rename-set\n"
              << "  --user <id>                 Acting user id\n"
              << "  --admin                     Act with administrator rights\n"
              << "  --input <path>              Layer JSON file for save, '-' for stdin\n"
              << "  --revision-id <id>          Revision id for get\n"
              << "  --keep <n>                  Revisions kept by prune\n"
              << "  --limit <n>                 Rows returned by list (1-200, default 50)\n"
              << "  --default-set <name>        Name of the default set (default 'default')\n"
              << "  --max-bytes <n>             Maximum layer data size (default 2097152)\n"
              << "  --max-layers <n>            Maximum layers per set (default 100)\n"
              << "  --max-named-sets <n>        Maximum named sets per image (default 15)\n"
              << "  --max-revisions <n>         Revisions kept per set (default 25)\n"
              << "  --max-image-dimension <n>   Largest supported image side (default 8192)\n"
              << "  --max-complexity <n>        Largest complexity score (default 1000)\n"
              << "  --max-image-bytes <n>       Largest embedded image layer (default 1048576)\n"
              << "  --max-points <n>            Points kept per path (default 1000)\n"
              << "  --coordinate-bound <n>      Largest accepted coordinate magnitude (default 100000)\n"
              << "  --busy-timeout-ms <ms>      Storage lock timeout (default 5000)\n"
              << "  --save-rate-per-minute <n>  Saves per minute per user (default 30)\n"
              << "  --save-rate-burst <n>       Save burst per user (default 10)\n"
              << "  --render-rate-per-minute <n> Renders per minute per user (default 120)\n"
              << "  --render-rate-burst <n>     Render burst per user (default 30)\n"
              << "  --create-rate-per-minute <n> New sets per minute per user (default 10)\n"
              << "  --create-rate-burst <n>     New set burst per user (default 5)\n"
              << "  --fonts <a,b,...>           Allowed font families\n"
              << "  --log-level <level>         debug|info|warning|error (default info)\n"
              << "  --no-wal                    Use the rollback journal instead of WAL\n"
              << "  --help                      Show this help\n";
}

std::optional<LayerSetsOptions> ParseLayerSetsArguments(int argc, char** argv) {
    LayerSetsOptions options{};
    if (!ApplyLayerSetsEnvOverrides(options)) {
        return std::nullopt;
    }

    auto require_value = [&](int& index, std::string_view flag) -> std::optional<std::string_view> {
        if (index + 1 >= argc) {
            std::cerr << flag << " requires a value\n";
            return std::nullopt;
        }
        return std::string_view{argv[++index]};
    };

    auto require_string = [&](int& index, std::string_view flag, std::string& target) -> bool {
        auto value = require_value(index, flag);
        if (!value) {
            return false;
        }
        if (value->empty()) {
            std::cerr << flag << " must not be empty\n";
            return false;
        }
        target = std::string{*value};
        return true;
    };

    auto require_integer = [&](int& index, std::string_view flag, std::int64_t min, std::int64_t& target) -> bool {
        auto value = require_value(index, flag);
        if (!value) {
            return false;
        }
        std::int64_t parsed = target;
        if (!parse_integer_in_range<std::int64_t>(*value, min, kMax, parsed)) {
            std::cerr << flag << " must be >= " << min << "\n";
            return false;
        }
        target = parsed;
        return true;
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else if (auto const* integer = find_integer_option(arg)) {
            if (!require_integer(i, arg, integer->min, options.*(integer->field))) {
                return std::nullopt;
            }
        } else if (arg == "--db") {
            if (!require_string(i, arg, options.database_path)) {
                return std::nullopt;
            }
        } else if (arg == "--images") {
            if (!require_string(i, arg, options.images_manifest)) {
                return std::nullopt;
            }
        } else if (arg == "--image") {
            if (!require_string(i, arg, options.image_name)) {
                return std::nullopt;
            }
        } else if (arg == "--hash") {
            if (!require_string(i, arg, options.content_hash)) {
                return std::nullopt;
            }
        } else if (arg == "--set") {
            if (!require_string(i, arg, options.set_name)) {
                return std::nullopt;
            }
        } else if (arg == "--new-name") {
            if (!require_string(i, arg, options.new_set_name)) {
                return std::nullopt;
            }
        } else if (arg == "--input") {
            if (!require_string(i, arg, options.input_path)) {
                return std::nullopt;
            }
        } else if (arg == "--default-set") {
            if (auto value = require_value(i, arg)) {
                if (!Sanitize::isValidSetName(*value)) {
                    std::cerr << "--default-set must be a valid set name\n";
                    return std::nullopt;
                }
                options.default_set_name = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--revision-id") {
            if (!require_integer(i, arg, 1, options.revision_id)) {
                return std::nullopt;
            }
        } else if (arg == "--keep") {
            if (!require_integer(i, arg, 1, options.keep_count)) {
                return std::nullopt;
            }
        } else if (arg == "--limit") {
            if (auto value = require_value(i, arg)) {
                std::int64_t parsed = options.list_limit;
                if (!parse_integer_in_range<std::int64_t>(*value, 1, 200, parsed)) {
                    std::cerr << "--limit must be within 1-200\n";
                    return std::nullopt;
                }
                options.list_limit = parsed;
            } else {
                return std::nullopt;
            }
        } else if (arg == "--fonts") {
            if (auto value = require_value(i, arg)) {
                auto fonts = split_list(*value);
                if (fonts.empty()) {
                    std::cerr << "--fonts must name at least one font\n";
                    return std::nullopt;
                }
                options.allowed_fonts = std::move(fonts);
            } else {
                return std::nullopt;
            }
        } else if (arg == "--log-level") {
            if (auto value = require_value(i, arg)) {
                if (!ParseLogLevel(*value)) {
                    std::cerr << "--log-level must be one of debug, info, warning, error\n";
                    return std::nullopt;
                }
                options.log_level = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--admin") {
            options.as_admin = true;
        } else if (arg == "--no-wal") {
            options.wal_mode = false;
        } else if (!arg.starts_with("-") && options.command.empty()) {
            options.command = std::string{arg};
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return std::nullopt;
        }
    }

    if (auto error = ValidateLayerSetsOptions(options)) {
        std::cerr << *error << "\n";
        return std::nullopt;
    }
    return options;
}

auto MakeRevisionStoreConfig(LayerSetsOptions const& options) -> RevisionStoreConfig {
    RevisionStoreConfig config;
    config.databasePath       = options.database_path;
    config.maxBytes           = options.max_bytes;
    config.maxNamedSets       = options.max_named_sets;
    config.maxRevisionsPerSet = options.max_revisions_per_set;
    config.defaultSetName     = options.default_set_name;
    config.busyTimeout        = std::chrono::milliseconds{options.busy_timeout_ms};
    config.walMode            = options.wal_mode;
    return config;
}

auto MakeValidatorConfig(LayerSetsOptions const& options) -> ValidatorConfig {
    ValidatorConfig config;
    config.maxLayerCount   = static_cast<std::size_t>(options.max_layer_count);
    config.maxPoints       = static_cast<std::size_t>(options.max_points);
    config.maxImageBytes   = static_cast<std::size_t>(options.max_image_bytes);
    config.coordinateBound = static_cast<double>(options.coordinate_bound);
    config.allowedFonts    = options.allowed_fonts;
    if (std::find(config.allowedFonts.begin(), config.allowedFonts.end(), config.defaultFont)
        == config.allowedFonts.end()) {
        config.defaultFont = config.allowedFonts.front();
    }
    return config;
}

auto MakeCapacityConfig(LayerSetsOptions const& options) -> CapacityConfig {
    CapacityConfig config;
    config.maxLayerCount     = static_cast<std::size_t>(options.max_layer_count);
    config.maxComplexity     = options.max_complexity;
    config.maxImageDimension = options.max_image_dimension;
    config.maxBytes          = options.max_bytes;
    config.saveRate          = {options.save_rate_per_minute, options.save_rate_burst};
    config.renderRate        = {options.render_rate_per_minute, options.render_rate_burst};
    config.createRate        = {options.create_rate_per_minute, options.create_rate_burst};
    return config;
}

auto MakeServiceConfig(LayerSetsOptions const& options) -> LayerSetServiceConfig {
    LayerSetServiceConfig config;
    config.maxBytes       = options.max_bytes;
    config.defaultSetName = options.default_set_name;
    return config;
}

} // namespace LS
