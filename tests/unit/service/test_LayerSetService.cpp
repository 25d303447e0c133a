#include "../LayerSetsTestHelper.hpp"

#include <layersets/service/LayerSetService.hpp>

#include <doctest/doctest.h>

#include <algorithm>
#include <memory>

using namespace LS;
using json = nlohmann::json;

namespace {

constexpr char const* kHash = "2fd4e1c67a2d28fced849ee1bb76e7391b93eb12";

auto unlimitedRates() -> CapacityConfig {
    CapacityConfig config;
    config.saveRate   = {0, 0};
    config.renderRate = {0, 0};
    config.createRate = {0, 0};
    return config;
}

struct ServiceFixture {
    explicit ServiceFixture(CapacityConfig capacity = unlimitedRates(), LayerSetServiceConfig serviceConfig = {})
        : validator(ValidatorConfig{}, log.logger)
        , guard(capacity, log.logger) {
        RevisionStoreConfig config;
        config.databasePath = Test::tempPath("service.db").string();
        auto opened         = RevisionStore::open(config, log.logger);
        REQUIRE(opened.has_value());
        store = std::move(*opened);
        REQUIRE(resolver.registerImage(ImageIdentity{"Example.jpg", kHash, "image/jpeg", 1024, 768, false})
                    .has_value());
        service = std::make_unique<LayerSetService>(serviceConfig, validator, guard, *store, resolver, log.logger);
    }

    auto saveText(std::string const& setName, std::int64_t userId = 1, std::string const& text = "Hello")
        -> Expected<SaveLayerSetResult> {
        SaveLayerSetRequest request;
        request.imageName = "Example.jpg";
        request.setName   = setName;
        request.userId    = userId;
        request.rawLayers = json::array({Test::textLayer("l1", text)}).dump();
        return service->save(request);
    }

    Test::CollectingLog              log;
    LayerValidator                   validator;
    CapacityGuard                    guard;
    std::unique_ptr<RevisionStore>   store;
    StaticImageIdentityResolver      resolver;
    std::unique_ptr<LayerSetService> service;
};

} // namespace

TEST_SUITE("LayerSetService") {
    TEST_CASE("text layer saved to the default set and loaded back") {
        ServiceFixture fixture;

        SaveLayerSetRequest request;
        request.imageName = "Example.jpg";
        request.userId    = 1;
        request.rawLayers = R"([{"id":"l1","type":"text","x":10,"y":10,"text":"Hello"}])";
        auto saved        = fixture.service->save(request);
        REQUIRE(saved.has_value());
        CHECK(saved->revision == 1);
        CHECK(saved->setName == "default");
        CHECK(saved->contentHash == kHash);
        CHECK(saved->warnings.empty());

        auto loaded = fixture.service->load("Example.jpg");
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->has_value());
        auto const& revision = (*loaded)->revision;
        CHECK(revision.id == saved->revisionId);
        CHECK(revision.majorMime == "image");
        CHECK(revision.minorMime == "jpeg");
        REQUIRE(revision.payload.layers.size() == 1);
        CHECK(revision.payload.layers[0].as<TextLayer>()->text == "Hello");

        auto byId = fixture.service->loadRevision(saved->revisionId);
        REQUIRE(byId.has_value());
        REQUIRE(byId->has_value());
        CHECK((*byId)->revision == 1);
    }

    TEST_CASE("too many layers is a capacity error") {
        ServiceFixture fixture;

        SaveLayerSetRequest request;
        request.imageName = "Example.jpg";
        request.userId    = 1;
        request.rawLayers = Test::textLayers(101).dump();
        auto saved        = fixture.service->save(request);
        REQUIRE_FALSE(saved.has_value());
        CHECK(saved.error().code == Error::Code::CapacityExceeded);
        CHECK(saved.error().message == "Too many layers: 101 (max: 100)");
        CHECK_FALSE(fixture.service->load("Example.jpg")->has_value());
    }

    TEST_CASE("malformed input is rejected before validation") {
        ServiceFixture fixture;

        SaveLayerSetRequest request;
        request.imageName = "Example.jpg";
        request.userId    = 1;
        for (auto raw : {"not json", R"({"background": true})", R"("layers")", R"({"layers": {}})"}) {
            CAPTURE(raw);
            request.rawLayers = raw;
            auto saved        = fixture.service->save(request);
            REQUIRE_FALSE(saved.has_value());
            CHECK(saved.error().code == Error::Code::MalformedInput);
        }
    }

    TEST_CASE("validation errors are reported with details") {
        ServiceFixture fixture;

        SaveLayerSetRequest request;
        request.imageName = "Example.jpg";
        request.userId    = 1;
        request.rawLayers = R"([{"id":"ok","type":"circle","radius":4},{"id":"bad","x":1}])";
        auto saved        = fixture.service->save(request);
        REQUIRE_FALSE(saved.has_value());
        CHECK(saved.error().code == Error::Code::ValidationFailed);
        REQUIRE_FALSE(saved.error().details.empty());
        CHECK(saved.error().details.front() == "Layer 1: Missing layer type");
        CHECK(fixture.log.contains("LayerSetService", "layer validation failed"));
    }

    TEST_CASE("sanitizer warnings are returned with a successful save") {
        ServiceFixture fixture;

        SaveLayerSetRequest request;
        request.imageName = "Example.jpg";
        request.userId    = 1;
        request.rawLayers = R"([{"id":"l1","type":"text","text":"Hi","opacity":4,"onclick":"x()"}])";
        auto saved        = fixture.service->save(request);
        REQUIRE(saved.has_value());
        CHECK(saved->warnings.size() == 2);
        CHECK(fixture.log.contains("LayerSetService", "layer validation warnings"));
    }

    TEST_CASE("background settings are stored and clamped") {
        ServiceFixture fixture;

        SaveLayerSetRequest request;
        request.imageName = "Example.jpg";
        request.userId    = 1;
        request.rawLayers =
            R"({"layers":[{"id":"l1","type":"text","text":"Hi"}],"backgroundVisible":false,"backgroundOpacity":3})";
        REQUIRE(fixture.service->save(request).has_value());

        auto loaded = fixture.service->load("Example.jpg");
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->has_value());
        CHECK_FALSE((*loaded)->revision.payload.backgroundVisible);
        CHECK((*loaded)->revision.payload.backgroundOpacity == 1.0);
    }

    TEST_CASE("set names are sanitized") {
        ServiceFixture fixture;

        auto saved = fixture.saveText("  My   Set!! ");
        REQUIRE(saved.has_value());
        CHECK(saved->setName == "My Set");

        auto sets = fixture.service->listSets("Example.jpg");
        REQUIRE(sets.has_value());
        REQUIRE(sets->size() == 1);
        CHECK(sets->front().setName == "My Set");

        auto loaded = fixture.service->load("Example.jpg", std::string_view{"My Set"});
        REQUIRE(loaded.has_value());
        CHECK(loaded->has_value());
    }

    TEST_CASE("image names are normalized before lookup") {
        ServiceFixture fixture;
        REQUIRE(fixture.resolver.registerImage(ImageIdentity{"Old Map.png", "abc", "image/png", {}, {}, false})
                    .has_value());

        SaveLayerSetRequest request;
        request.imageName = " Old Map.png";
        request.userId    = 1;
        request.rawLayers = Test::textLayers(1).dump();
        auto saved        = fixture.service->save(request);
        REQUIRE(saved.has_value());
        CHECK(saved->contentHash == "abc");
        CHECK(fixture.service->load("Old_Map.png")->has_value());

        request.imageName = "Bad|Name.png";
        CHECK(fixture.service->save(request).error().code == Error::Code::InvalidParameter);
    }

    TEST_CASE("unknown images need an explicit content hash") {
        ServiceFixture fixture;

        SaveLayerSetRequest request;
        request.imageName = "Unknown.png";
        request.userId    = 1;
        request.rawLayers = Test::textLayers(1).dump();
        auto missing      = fixture.service->save(request);
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == Error::Code::NotFound);

        request.contentHash = "0011223344556677889900112233445566778899";
        auto saved          = fixture.service->save(request);
        REQUIRE(saved.has_value());
        CHECK(saved->contentHash == *request.contentHash);
    }

    TEST_CASE("oversized images are refused") {
        ServiceFixture fixture;
        REQUIRE(fixture.resolver.registerImage(ImageIdentity{"Huge.tif", "abc", "image/tiff", 9000, 600, false})
                    .has_value());

        SaveLayerSetRequest request;
        request.imageName = "Huge.tif";
        request.userId    = 1;
        request.rawLayers = Test::textLayers(1).dump();
        auto saved        = fixture.service->save(request);
        REQUIRE_FALSE(saved.has_value());
        CHECK(saved.error().code == Error::Code::CapacityExceeded);
        CHECK(saved.error().message->starts_with("Image dimensions not supported"));
    }

    TEST_CASE("foreign images use the fallback hash") {
        ServiceFixture fixture;
        REQUIRE(fixture.resolver.registerImage(ImageIdentity{"Remote.png", "", "image/png", {}, {}, true})
                    .has_value());

        SaveLayerSetRequest request;
        request.imageName = "Remote.png";
        request.userId    = 1;
        request.rawLayers = Test::textLayers(1).dump();
        auto saved        = fixture.service->save(request);
        REQUIRE(saved.has_value());
        CHECK(saved->contentHash == foreignFallbackHash("Remote.png"));
        CHECK(fixture.log.contains("LayerSetService", "using fallback hash for foreign file"));
        CHECK(fixture.service->load("Remote.png")->has_value());
    }

    TEST_CASE("raw payload size and user id are checked first") {
        LayerSetServiceConfig config;
        config.maxBytes = 64;
        ServiceFixture fixture{unlimitedRates(), config};

        SaveLayerSetRequest request;
        request.imageName = "Example.jpg";
        request.userId    = 1;
        request.rawLayers = Test::textLayers(5).dump();
        auto tooLarge     = fixture.service->save(request);
        REQUIRE_FALSE(tooLarge.has_value());
        CHECK(tooLarge.error().code == Error::Code::CapacityExceeded);

        request.userId = 0;
        CHECK(fixture.service->save(request).error().code == Error::Code::InvalidParameter);
    }

    TEST_CASE("saves are rate limited per principal") {
        CapacityConfig capacity = unlimitedRates();
        capacity.saveRate       = {60, 2};
        ServiceFixture fixture{capacity};

        CHECK(fixture.saveText("A", 1).has_value());
        CHECK(fixture.saveText("A", 1).has_value());
        auto limited = fixture.saveText("A", 1);
        REQUIRE_FALSE(limited.has_value());
        CHECK(limited.error().code == Error::Code::RateLimited);
        CHECK(fixture.saveText("A", 2).has_value());
    }

    TEST_CASE("render requests are rate limited") {
        CapacityConfig capacity = unlimitedRates();
        capacity.renderRate     = {60, 1};
        ServiceFixture fixture{capacity};

        CHECK(fixture.service->authorizeRender("ip:10.0.0.1").has_value());
        auto limited = fixture.service->authorizeRender("ip:10.0.0.1");
        REQUIRE_FALSE(limited.has_value());
        CHECK(limited.error().code == Error::Code::RateLimited);
    }

    TEST_CASE("only the creator or an administrator may change a set") {
        ServiceFixture fixture;
        REQUIRE(fixture.saveText("Mine", 1).has_value());
        REQUIRE(fixture.saveText("Mine", 2).has_value());

        SetActionRequest rename;
        rename.imageName = "Example.jpg";
        rename.setName   = "Mine";
        rename.newName   = "Ours";
        rename.userId    = 2;
        auto denied      = fixture.service->renameSet(rename);
        REQUIRE_FALSE(denied.has_value());
        CHECK(denied.error().code == Error::Code::InvalidPermissions);
        CHECK(fixture.log.contains("LayerSetService", "set permission denied"));

        rename.isAdmin = true;
        auto renamed   = fixture.service->renameSet(rename);
        REQUIRE(renamed.has_value());
        CHECK(*renamed == 2);

        SetActionRequest remove;
        remove.imageName = "Example.jpg";
        remove.setName   = "Ours";
        remove.userId    = 3;
        CHECK(fixture.service->deleteSet(remove).error().code == Error::Code::InvalidPermissions);
        remove.userId = 1;
        auto deleted  = fixture.service->deleteSet(remove);
        REQUIRE(deleted.has_value());
        CHECK(*deleted == 2);
        CHECK(fixture.service->deleteSet(remove).error().code == Error::Code::NotFound);
    }

    TEST_CASE("rename rejects invalid target names") {
        ServiceFixture fixture;
        REQUIRE(fixture.saveText("Draft", 1).has_value());

        SetActionRequest rename;
        rename.imageName = "Example.jpg";
        rename.setName   = "Draft";
        rename.newName   = "bad/name";
        rename.userId    = 1;
        CHECK(fixture.service->renameSet(rename).error().code == Error::Code::InvalidParameter);
        rename.newName = "default";
        CHECK(fixture.service->renameSet(rename).error().code == Error::Code::InvalidParameter);
    }

    TEST_CASE("revision listing through the service") {
        ServiceFixture fixture;
        for (int i = 0; i < 3; ++i)
            REQUIRE(fixture.saveText("Notes", 1, "Rev " + std::to_string(i)).has_value());

        auto revisions = fixture.service->listRevisions("Example.jpg", "Notes", 2);
        REQUIRE(revisions.has_value());
        REQUIRE(revisions->size() == 2);
        CHECK(revisions->front().revision == 3);
        CHECK(revisions->front().setName == "Notes");
    }
}
