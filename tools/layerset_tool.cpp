#include <layersets/LayerSets.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>

using namespace LS;

namespace {

auto read_input(std::string const& path) -> std::optional<std::string> {
    if (path == "-") {
        return std::string{std::istreambuf_iterator<char>{std::cin}, std::istreambuf_iterator<char>{}};
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        std::cerr << "Cannot open " << path << "\n";
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

auto load_resolver(LayerSetsOptions const& options) -> std::optional<StaticImageIdentityResolver> {
    StaticImageIdentityResolver resolver;
    if (!options.images_manifest.empty()) {
        auto text = read_input(options.images_manifest);
        if (!text) {
            return std::nullopt;
        }
        auto manifest = nlohmann::json::parse(*text, nullptr, false);
        if (manifest.is_discarded()) {
            std::cerr << "Image manifest is not valid JSON: " << options.images_manifest << "\n";
            return std::nullopt;
        }
        auto loaded = StaticImageIdentityResolver::fromJson(manifest);
        if (!loaded) {
            std::cerr << describeError(loaded.error()) << "\n";
            return std::nullopt;
        }
        return std::optional<StaticImageIdentityResolver>{std::move(*loaded)};
    }
    if (!options.image_name.empty() && !options.content_hash.empty()) {
        ImageIdentity identity;
        identity.imageName   = options.image_name;
        identity.contentHash = options.content_hash;
        if (auto registered = resolver.registerImage(std::move(identity)); !registered) {
            std::cerr << describeError(registered.error()) << "\n";
            return std::nullopt;
        }
    }
    return std::optional<StaticImageIdentityResolver>{std::move(resolver)};
}

auto revision_to_json(LayerSetRevision const& revision) -> nlohmann::json {
    return nlohmann::json{{"id", revision.id},
                          {"imageName", revision.imageName},
                          {"contentHash", revision.contentHash},
                          {"setName", revision.setName},
                          {"revision", revision.revision},
                          {"userId", revision.userId},
                          {"timestamp", revision.timestamp},
                          {"sizeBytes", revision.sizeBytes},
                          {"layerCount", revision.layerCount},
                          {"data", payloadToJson(revision.payload)}};
}

int fail(Error const& error) {
    std::cerr << describeError(error) << "\n";
    return EXIT_FAILURE;
}

int require(bool present, char const* flag) {
    if (!present) {
        std::cerr << flag << " is required for this command\n";
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

auto contentHashFor(LayerSetsOptions const& options, ImageIdentityResolver& resolver) -> Expected<std::string> {
    auto name = normalizeImageName(options.image_name);
    if (!name)
        return std::unexpected(name.error());
    if (!options.content_hash.empty())
        return options.content_hash;
    auto identity = resolver.resolve(*name);
    if (!identity)
        return std::unexpected(identity.error());
    return identity->contentHash;
}

int run(LayerSetsOptions const& options, TaggedLogger& logger) {
    auto resolver = load_resolver(options);
    if (!resolver) {
        return EXIT_FAILURE;
    }

    auto store = RevisionStore::open(MakeRevisionStoreConfig(options), logger);
    if (!store) {
        return fail(store.error());
    }
    LayerValidator  validator(MakeValidatorConfig(options), logger);
    CapacityGuard   guard(MakeCapacityConfig(options), logger);
    LayerSetService service(MakeServiceConfig(options), validator, guard, **store, *resolver, logger);

    auto const& command = options.command;
    if (command != "get" && require(!options.image_name.empty(), "--image") != EXIT_SUCCESS) {
        return EXIT_FAILURE;
    }

    if (command == "save") {
        if (require(options.user_id > 0, "--user") != EXIT_SUCCESS) {
            return EXIT_FAILURE;
        }
        auto raw = read_input(options.input_path);
        if (!raw) {
            return EXIT_FAILURE;
        }
        SaveLayerSetRequest request;
        request.imageName = options.image_name;
        request.rawLayers = std::move(*raw);
        request.userId    = options.user_id;
        if (!options.content_hash.empty())
            request.contentHash = options.content_hash;
        if (!options.set_name.empty())
            request.setName = options.set_name;

        auto saved = service.save(request);
        if (!saved) {
            return fail(saved.error());
        }
        nlohmann::json out{{"layersetid", saved->revisionId},
                           {"revision", saved->revision},
                           {"setName", saved->setName},
                           {"contentHash", saved->contentHash},
                           {"pruned", saved->prunedCount},
                           {"warnings", saved->warnings}};
        std::cout << out.dump(2) << std::endl;
        return EXIT_SUCCESS;
    }

    if (command == "get") {
        if (require(options.revision_id > 0, "--revision-id") != EXIT_SUCCESS) {
            return EXIT_FAILURE;
        }
        auto revision = service.loadRevision(options.revision_id);
        if (!revision) {
            return fail(revision.error());
        }
        if (!*revision) {
            return fail(Error{Error::Code::NotFound, "Layer set not found: " + std::to_string(options.revision_id)});
        }
        std::cout << revision_to_json(**revision).dump(2) << std::endl;
        return EXIT_SUCCESS;
    }

    auto hash = contentHashFor(options, *resolver);
    if (!hash) {
        return fail(hash.error());
    }
    auto const image = *normalizeImageName(options.image_name);

    if (command == "latest") {
        auto found = (*store)->getByName(image, *hash, options.set_name);
        if (!found) {
            return fail(found.error());
        }
        if (!*found) {
            return fail(Error{Error::Code::NotFound, "No layer set for " + image});
        }
        auto out = revision_to_json((*found)->revision);
        out["usedFallback"] = (*found)->usedFallback;
        std::cout << out.dump(2) << std::endl;
        return EXIT_SUCCESS;
    }

    if (command == "list") {
        auto revisions = (*store)->listRevisions(image, *hash, options.set_name, options.list_limit);
        if (!revisions) {
            return fail(revisions.error());
        }
        auto out = nlohmann::json::array();
        for (auto const& summary : *revisions) {
            out.push_back({{"id", summary.id},
                           {"revision", summary.revision},
                           {"userId", summary.userId},
                           {"timestamp", summary.timestamp},
                           {"layerCount", summary.layerCount},
                           {"sizeBytes", summary.sizeBytes}});
        }
        std::cout << out.dump(2) << std::endl;
        return EXIT_SUCCESS;
    }

    if (command == "sets") {
        auto sets = (*store)->listNamedSets(image, *hash);
        if (!sets) {
            return fail(sets.error());
        }
        auto out = nlohmann::json::array();
        for (auto const& set : *sets) {
            nlohmann::json entry{{"name", set.setName},
                                 {"revisionCount", set.revisionCount},
                                 {"latestRevision", set.latestRevision},
                                 {"latestId", set.latestRevisionId},
                                 {"latestUserId", set.latestUserId},
                                 {"latestTimestamp", set.latestTimestamp}};
            entry["creatorUserId"] = set.creatorUserId ? nlohmann::json(*set.creatorUserId) : nlohmann::json(nullptr);
            out.push_back(std::move(entry));
        }
        std::cout << out.dump(2) << std::endl;
        return EXIT_SUCCESS;
    }

    if (command == "prune") {
        if (require(options.keep_count > 0, "--keep") != EXIT_SUCCESS) {
            return EXIT_FAILURE;
        }
        auto deleted = (*store)->pruneOldRevisions(image, *hash, options.set_name, options.keep_count);
        if (!deleted) {
            return fail(deleted.error());
        }
        std::cout << "pruned " << *deleted << " revision(s)" << std::endl;
        return EXIT_SUCCESS;
    }

    if (command == "delete-set" || command == "rename-set") {
        if (require(options.user_id > 0, "--user") != EXIT_SUCCESS) {
            return EXIT_FAILURE;
        }
        SetActionRequest request;
        request.imageName = options.image_name;
        request.setName   = options.set_name;
        request.newName   = options.new_set_name;
        request.userId    = options.user_id;
        request.isAdmin   = options.as_admin;
        if (command == "rename-set") {
            if (require(!options.new_set_name.empty(), "--new-name") != EXIT_SUCCESS) {
                return EXIT_FAILURE;
            }
            auto renamed = service.renameSet(request);
            if (!renamed) {
                return fail(renamed.error());
            }
            std::cout << "renamed " << *renamed << " revision(s)" << std::endl;
            return EXIT_SUCCESS;
        }
        auto deleted = service.deleteSet(request);
        if (!deleted) {
            return fail(deleted.error());
        }
        std::cout << "deleted " << *deleted << " revision(s)" << std::endl;
        return EXIT_SUCCESS;
    }

    if (command == "delete-image") {
        if (!(*store)->deleteAllForImage(image, options.content_hash)) {
            std::cerr << "Failed to delete layer sets for " << image << "\n";
            return EXIT_FAILURE;
        }
        return EXIT_SUCCESS;
    }

    std::cerr << "Unknown command: " << command << "\n";
    return EXIT_FAILURE;
}

} // namespace

int main(int argc, char** argv) {
    auto options_opt = ParseLayerSetsArguments(argc, argv);
    if (!options_opt) {
        return EXIT_FAILURE;
    }

    auto options = *options_opt;
    if (options.show_help || options.command.empty()) {
        PrintLayerSetsUsage();
        return options.show_help ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    TaggedLogger logger;
    logger.setThreadName("main");
    logger.setMinimumLevel(ParseLogLevel(options.log_level).value_or(LogLevel::Info));

    int status = run(options, logger);
    logger.flush();
    return status;
}
