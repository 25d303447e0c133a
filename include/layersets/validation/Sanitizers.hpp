#pragma once

#include <layersets/core/Error.hpp>

#include <cstddef>
#include <string>
#include <string_view>

/*
 * Pure string sanitizers shared by the layer validator and the service layer.
 * None of these functions hold state; all of them are safe to call concurrently.
 */
namespace LS::Sanitize {

inline constexpr std::size_t kMaxTextLength       = 1000;
inline constexpr std::size_t kMaxColorLength      = 50;
inline constexpr std::size_t kMaxIdentifierLength = 255;
inline constexpr std::size_t kMaxSetNameLength    = 255;
inline constexpr std::size_t kMaxSvgLength        = 100 * 1024;
inline constexpr std::string_view kDefaultColor   = "#000000";
inline constexpr std::string_view kDefaultSetName = "default";

// Decodes one level of named, decimal and hexadecimal character references.
[[nodiscard]] auto decodeHtmlEntities(std::string_view input) -> std::string;

// Removes markup tags; script and style elements lose their bodies too.
[[nodiscard]] auto stripTags(std::string_view input) -> std::string;

// Truncates to at most maxCodePoints UTF-8 code points without splitting a sequence.
[[nodiscard]] auto truncateUtf8(std::string_view input, std::size_t maxCodePoints) -> std::string;

[[nodiscard]] auto countCodePoints(std::string_view input) -> std::size_t;

/*
 * Plain text for a text-bearing layer field. Markup is removed, entities decoded and
 * script-capable URL schemes and handler attributes stripped until nothing changes.
 * Call-like fragments of alert/confirm/prompt/eval/setTimeout/setInterval are defused
 * with a zero-width space. Leading '@' is removed and the result trimmed.
 * sanitizeText(sanitizeText(x)) == sanitizeText(x).
 */
[[nodiscard]] auto sanitizeText(std::string_view raw, std::size_t maxLength = kMaxTextLength) -> std::string;

// Same cleaning as sanitizeText but keeps surrounding whitespace, which is significant inside a run.
[[nodiscard]] auto sanitizeRichTextRun(std::string_view raw, std::size_t maxLength = kMaxTextLength) -> std::string;

// True when raw contains nothing sanitizeText would neutralize.
[[nodiscard]] auto isSafeText(std::string_view raw) -> bool;

// Canonical CSS color or "#000000".
[[nodiscard]] auto sanitizeColor(std::string_view raw) -> std::string;
[[nodiscard]] auto isValidColor(std::string_view raw) -> bool;
[[nodiscard]] auto isSafeColor(std::string_view raw) -> bool;

[[nodiscard]] auto sanitizeIdentifier(std::string_view raw, std::string_view fallback) -> std::string;

[[nodiscard]] auto sanitizeSetName(std::string_view raw, std::string_view defaultName = kDefaultSetName) -> std::string;
[[nodiscard]] auto isValidSetName(std::string_view raw) -> bool;

/*
 * Accepts SVG built from a fixed set of shape, text, gradient and filter elements whose
 * references all point inside the document. Script, animation, style sheets, embedded
 * content and external or data URLs are rejected; the error message names the reason.
 */
[[nodiscard]] auto sanitizeSvg(std::string_view content, std::size_t maxLength = kMaxSvgLength) -> Expected<std::string>;

// SVG path "d" data: commands, numbers, separators only.
[[nodiscard]] auto isSafePathData(std::string_view data) -> bool;

// base64 data URL of a png, jpeg, gif or webp image.
[[nodiscard]] auto isSafeImageDataUrl(std::string_view src) -> bool;

} // namespace LS::Sanitize
