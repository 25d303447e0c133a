#include <layersets/model/LayerDocument.hpp>

#include <utility>

namespace LS {

namespace {

template <std::size_t... I>
constexpr auto collectTypeNames(std::index_sequence<I...>) {
    return std::array<std::string_view, sizeof...(I)>{std::variant_alternative_t<I, LayerShape>::kType...};
}

constexpr auto kTypeNames = collectTypeNames(std::make_index_sequence<std::variant_size_v<LayerShape>>{});

template <std::size_t I = 0>
auto shapeForIndex(std::size_t index) -> LayerShape {
    if constexpr (I + 1 < std::variant_size_v<LayerShape>) {
        if (index != I)
            return shapeForIndex<I + 1>(index);
    }
    return LayerShape{std::in_place_index<I>};
}

} // namespace

auto LayerDocument::type() const -> std::string_view {
    return kTypeNames[shape.index()];
}

auto makeShape(std::string_view type) -> std::optional<LayerShape> {
    for (std::size_t i = 0; i < kTypeNames.size(); ++i) {
        if (kTypeNames[i] == type)
            return shapeForIndex(i);
    }
    return std::nullopt;
}

auto supportedLayerTypes() -> std::span<std::string_view const> {
    return kTypeNames;
}

} // namespace LS
