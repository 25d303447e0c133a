#pragma once

#include <layersets/core/Error.hpp>
#include <layersets/model/LayerDocument.hpp>
#include <layersets/model/LayerSetRevision.hpp>

#include <nlohmann/json.hpp>

#include <vector>

namespace LS {

void to_json(nlohmann::json& j, Point const& point);
void from_json(nlohmann::json const& j, Point& point);
void to_json(nlohmann::json& j, TextStyle const& style);
void from_json(nlohmann::json const& j, TextStyle& style);
void to_json(nlohmann::json& j, RichTextRun const& run);
void from_json(nlohmann::json const& j, RichTextRun& run);
void to_json(nlohmann::json& j, ShapePath const& path);
void from_json(nlohmann::json const& j, ShapePath& path);

// Absent optional fields are omitted from the output.
[[nodiscard]] auto layerToJson(LayerDocument const& layer) -> nlohmann::json;
[[nodiscard]] auto layersToJson(std::vector<LayerDocument> const& layers) -> nlohmann::json;

/*
 * Decodes layers that were already validated before they were stored. This performs
 * type checks only; untrusted input goes through LayerValidator instead.
 */
[[nodiscard]] auto layerFromJson(nlohmann::json const& j) -> Expected<LayerDocument>;
[[nodiscard]] auto layersFromJson(nlohmann::json const& j) -> Expected<std::vector<LayerDocument>>;

[[nodiscard]] auto payloadToJson(LayerSetPayload const& payload) -> nlohmann::json;
[[nodiscard]] auto payloadFromJson(nlohmann::json const& j) -> Expected<LayerSetPayload>;

} // namespace LS
