#include <layersets/model/LayerJson.hpp>

#include <string>

namespace LS {

namespace {

struct JsonFieldWriter {
    nlohmann::json& out;

    template <typename T>
    void operator()(char const* key, std::optional<T> const& value) const {
        if (value)
            out[key] = *value;
    }

    template <typename T>
    void operator()(char const* key, T const& value) const {
        out[key] = value;
    }
};

struct JsonFieldReader {
    nlohmann::json const& in;

    template <typename T>
    void operator()(char const* key, std::optional<T>& value) const {
        auto it = in.find(key);
        if (it == in.end() || it->is_null()) {
            value.reset();
            return;
        }
        value = it->template get<T>();
    }

    template <typename T>
    void operator()(char const* key, T& value) const {
        auto it = in.find(key);
        if (it != in.end() && !it->is_null())
            value = it->template get<T>();
    }
};

} // namespace

void to_json(nlohmann::json& j, Point const& point) {
    j = nlohmann::json{{"x", point.x}, {"y", point.y}};
}

void from_json(nlohmann::json const& j, Point& point) {
    j.at("x").get_to(point.x);
    j.at("y").get_to(point.y);
}

void to_json(nlohmann::json& j, TextStyle const& style) {
    j = nlohmann::json::object();
    TextStyle::visit(style, JsonFieldWriter{j});
}

void from_json(nlohmann::json const& j, TextStyle& style) {
    TextStyle::visit(style, JsonFieldReader{j});
}

void to_json(nlohmann::json& j, RichTextRun const& run) {
    j = nlohmann::json{{"text", run.text}, {"style", run.style}};
}

void from_json(nlohmann::json const& j, RichTextRun& run) {
    j.at("text").get_to(run.text);
    if (auto it = j.find("style"); it != j.end() && it->is_object())
        it->get_to(run.style);
}

void to_json(nlohmann::json& j, ShapePath const& path) {
    j = nlohmann::json::object();
    ShapePath::visit(path, JsonFieldWriter{j});
}

void from_json(nlohmann::json const& j, ShapePath& path) {
    ShapePath::visit(path, JsonFieldReader{j});
}

auto layerToJson(LayerDocument const& layer) -> nlohmann::json {
    nlohmann::json out = nlohmann::json::object();
    out["type"]        = std::string{layer.type()};
    visitLayerFields(layer, JsonFieldWriter{out});
    return out;
}

auto layersToJson(std::vector<LayerDocument> const& layers) -> nlohmann::json {
    nlohmann::json out = nlohmann::json::array();
    for (auto const& layer : layers)
        out.push_back(layerToJson(layer));
    return out;
}

auto layerFromJson(nlohmann::json const& j) -> Expected<LayerDocument> {
    if (!j.is_object())
        return std::unexpected(Error{Error::Code::MalformedInput, "Layer must be an object"});
    auto typeIt = j.find("type");
    if (typeIt == j.end() || !typeIt->is_string())
        return std::unexpected(Error{Error::Code::MalformedInput, "Layer is missing its type"});
    auto shape = makeShape(typeIt->get<std::string>());
    if (!shape)
        return std::unexpected(Error{Error::Code::MalformedInput, "Unknown layer type: " + typeIt->get<std::string>()});

    LayerDocument layer{LayerBase{}, std::move(*shape)};
    try {
        visitLayerFields(layer, JsonFieldReader{j});
    } catch (nlohmann::json::exception const& e) {
        return std::unexpected(Error{Error::Code::MalformedInput, std::string{"Layer field has wrong type: "} + e.what()});
    }
    return layer;
}

auto layersFromJson(nlohmann::json const& j) -> Expected<std::vector<LayerDocument>> {
    if (!j.is_array())
        return std::unexpected(Error{Error::Code::MalformedInput, "Layers must be an array"});
    std::vector<LayerDocument> layers;
    layers.reserve(j.size());
    for (auto const& entry : j) {
        auto layer = layerFromJson(entry);
        if (!layer)
            return std::unexpected(layer.error());
        layers.push_back(std::move(*layer));
    }
    return layers;
}

auto payloadToJson(LayerSetPayload const& payload) -> nlohmann::json {
    return nlohmann::json{{"schemaVersion", payload.schemaVersion},
                          {"createdAt", payload.createdAt},
                          {"layers", layersToJson(payload.layers)},
                          {"backgroundVisible", payload.backgroundVisible},
                          {"backgroundOpacity", payload.backgroundOpacity}};
}

auto payloadFromJson(nlohmann::json const& j) -> Expected<LayerSetPayload> {
    LayerSetPayload payload;
    // Rows written before the envelope existed hold a bare layer array.
    if (j.is_array()) {
        auto layers = layersFromJson(j);
        if (!layers)
            return std::unexpected(layers.error());
        payload.layers = std::move(*layers);
        return payload;
    }
    if (!j.is_object())
        return std::unexpected(Error{Error::Code::MalformedInput, "Payload must be an object"});
    try {
        payload.schemaVersion     = j.value("schemaVersion", kPayloadSchemaVersion);
        payload.createdAt         = j.value("createdAt", std::string{});
        payload.backgroundVisible = j.value("backgroundVisible", true);
        payload.backgroundOpacity = j.value("backgroundOpacity", 1.0);
    } catch (nlohmann::json::exception const& e) {
        return std::unexpected(Error{Error::Code::MalformedInput, std::string{"Payload field has wrong type: "} + e.what()});
    }
    auto layersIt = j.find("layers");
    if (layersIt == j.end())
        return std::unexpected(Error{Error::Code::MalformedInput, "Payload is missing layers"});
    auto layers = layersFromJson(*layersIt);
    if (!layers)
        return std::unexpected(layers.error());
    payload.layers = std::move(*layers);
    return payload;
}

} // namespace LS
