#include <layersets/validation/Sanitizers.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <string_view>

namespace LS::Sanitize {

namespace {

constexpr char32_t kReplacementChar = 0xFFFD;

auto appendUtf8(std::string& out, char32_t cp) -> void {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// Decodes the code point starting at index and advances past it. Malformed input yields U+FFFD.
auto nextCodePoint(std::string_view input, std::size_t& index) -> char32_t {
    auto const lead = static_cast<unsigned char>(input[index]);
    std::size_t length = 0;
    char32_t    cp     = 0;
    if (lead < 0x80) {
        ++index;
        return lead;
    } else if ((lead & 0xE0) == 0xC0) {
        length = 2;
        cp     = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        cp     = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        cp     = lead & 0x07;
    } else {
        ++index;
        return kReplacementChar;
    }
    if (index + length > input.size()) {
        index = input.size();
        return kReplacementChar;
    }
    for (std::size_t i = 1; i < length; ++i) {
        auto const cont = static_cast<unsigned char>(input[index + i]);
        if ((cont & 0xC0) != 0x80) {
            index += i;
            return kReplacementChar;
        }
        cp = (cp << 6) | (cont & 0x3F);
    }
    index += length;
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
        return kReplacementChar;
    return cp;
}

auto isAsciiSpace(char ch) -> bool {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

auto isAsciiAlpha(char ch) -> bool {
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
}

auto isAsciiDigit(char ch) -> bool {
    return ch >= '0' && ch <= '9';
}

auto toLowerAscii(std::string_view input) -> std::string {
    std::string out{input};
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char ch) {
        return (ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch + 32) : static_cast<char>(ch);
    });
    return out;
}

auto trimAscii(std::string_view input) -> std::string_view {
    while (!input.empty() && isAsciiSpace(input.front()))
        input.remove_prefix(1);
    while (!input.empty() && isAsciiSpace(input.back()))
        input.remove_suffix(1);
    return input;
}

auto removeControlCharacters(std::string_view input) -> std::string {
    std::string out;
    out.reserve(input.size());
    for (char ch : input) {
        auto const byte = static_cast<unsigned char>(ch);
        if ((byte < 0x20 && ch != '\t' && ch != '\n' && ch != '\r') || byte == 0x7F)
            continue;
        out.push_back(ch);
    }
    return out;
}

struct NamedEntity {
    std::string_view name;
    char32_t         codePoint;
};

constexpr std::array<NamedEntity, 34> kNamedEntities{{
    {"amp", U'&'},      {"lt", U'<'},        {"gt", U'>'},         {"quot", U'"'},      {"apos", U'\''},
    {"nbsp", 0xA0},     {"colon", U':'},     {"lpar", U'('},       {"rpar", U')'},      {"sol", U'/'},
    {"bsol", U'\\'},    {"Tab", U'\t'},      {"NewLine", U'\n'},   {"semi", U';'},      {"equals", U'='},
    {"num", U'#'},      {"excl", U'!'},      {"period", U'.'},     {"comma", U','},     {"hellip", 0x2026},
    {"mdash", 0x2014},  {"ndash", 0x2013},   {"copy", 0xA9},       {"reg", 0xAE},       {"trade", 0x2122},
    {"laquo", 0xAB},    {"raquo", 0xBB},     {"lsquo", 0x2018},    {"rsquo", 0x2019},   {"ldquo", 0x201C},
    {"rdquo", 0x201D},  {"deg", 0xB0},       {"euro", 0x20AC},     {"grave", U'`'},
}};

auto lookupEntity(std::string_view name) -> std::optional<char32_t> {
    for (auto const& entity : kNamedEntities) {
        if (entity.name == name)
            return entity.codePoint;
    }
    auto const lowered = toLowerAscii(name);
    for (auto const& entity : kNamedEntities) {
        if (toLowerAscii(entity.name) == lowered)
            return entity.codePoint;
    }
    return std::nullopt;
}

std::regex const kDangerousScheme{
    R"((javascript|vbscript|data|about|chrome-extension|chrome|ms-its|mhtml|file)\s*:)",
    std::regex::ECMAScript | std::regex::icase};
std::regex const kEventHandler{R"(\bon[a-z]+\s*=)", std::regex::ECMAScript | std::regex::icase};
std::regex const kCallLike{R"(\b(alert|confirm|prompt|eval|settimeout|setinterval)\s*\()",
                           std::regex::ECMAScript | std::regex::icase};

// Strip, decode and scrub until nothing changes. Every changing pass either shortens the
// string or replaces an invalid reference with U+FFFD, so the loop terminates.
auto cleanUntilStable(std::string_view input) -> std::string {
    std::string current = removeControlCharacters(input);
    for (;;) {
        auto next = stripTags(current);
        next      = decodeHtmlEntities(next);
        next      = std::regex_replace(next, kDangerousScheme, "");
        next      = std::regex_replace(next, kEventHandler, "");
        next      = removeControlCharacters(next);
        if (next == current)
            return current;
        current = std::move(next);
    }
}

auto defuseCalls(std::string const& input) -> std::string {
    return std::regex_replace(input, kCallLike, "$1\xE2\x80\x8B(");
}

constexpr std::array<std::string_view, 150> kNamedColors{{
    "aliceblue", "antiquewhite", "aqua", "aquamarine", "azure", "beige", "bisque", "black",
    "blanchedalmond", "blue", "blueviolet", "brown", "burlywood", "cadetblue", "chartreuse",
    "chocolate", "coral", "cornflowerblue", "cornsilk", "crimson", "cyan", "darkblue", "darkcyan",
    "darkgoldenrod", "darkgray", "darkgreen", "darkgrey", "darkkhaki", "darkmagenta",
    "darkolivegreen", "darkorange", "darkorchid", "darkred", "darksalmon", "darkseagreen",
    "darkslateblue", "darkslategray", "darkslategrey", "darkturquoise", "darkviolet", "deeppink",
    "deepskyblue", "dimgray", "dimgrey", "dodgerblue", "firebrick", "floralwhite", "forestgreen",
    "fuchsia", "gainsboro", "ghostwhite", "gold", "goldenrod", "gray", "green", "greenyellow",
    "grey", "honeydew", "hotpink", "indianred", "indigo", "ivory", "khaki", "lavender",
    "lavenderblush", "lawngreen", "lemonchiffon", "lightblue", "lightcoral", "lightcyan",
    "lightgoldenrodyellow", "lightgray", "lightgreen", "lightgrey", "lightpink", "lightsalmon",
    "lightseagreen", "lightskyblue", "lightslategray", "lightslategrey", "lightsteelblue",
    "lightyellow", "lime", "limegreen", "linen", "magenta", "maroon", "mediumaquamarine",
    "mediumblue", "mediumorchid", "mediumpurple", "mediumseagreen", "mediumslateblue",
    "mediumspringgreen", "mediumturquoise", "mediumvioletred", "midnightblue", "mintcream",
    "mistyrose", "moccasin", "navajowhite", "navy", "oldlace", "olive", "olivedrab", "orange",
    "orangered", "orchid", "palegoldenrod", "palegreen", "paleturquoise", "palevioletred",
    "papayawhip", "peachpuff", "peru", "pink", "plum", "powderblue", "purple", "rebeccapurple",
    "red", "rosybrown", "royalblue", "saddlebrown", "salmon", "sandybrown", "seagreen", "seashell",
    "sienna", "silver", "skyblue", "slateblue", "slategray", "slategrey", "snow", "springgreen",
    "steelblue", "tan", "teal", "thistle", "tomato", "turquoise", "violet", "wheat", "white",
    "whitesmoke", "yellow", "yellowgreen", "none", "transparent",
}};

std::regex const kHexColor{R"(^#([0-9a-f]{3}|[0-9a-f]{6}|[0-9a-f]{8})$)"};
std::regex const kRgbColor{
    R"(^rgba?\(\s*(\d{1,3})\s*,\s*(\d{1,3})\s*,\s*(\d{1,3})\s*(?:,\s*(\d*\.?\d+)\s*)?\)$)"};
std::regex const kHslColor{
    R"(^hsla?\(\s*(\d{1,3}(?:\.\d+)?)\s*,\s*(\d{1,3}(?:\.\d+)?)%\s*,\s*(\d{1,3}(?:\.\d+)?)%\s*(?:,\s*(\d*\.?\d+)\s*)?\)$)"};

auto parseDouble(std::string const& text) -> std::optional<double> {
    double value = 0.0;
    auto   result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size())
        return std::nullopt;
    return value;
}

auto formatNumber(double value) -> std::string {
    std::array<char, 32> buffer{};
    auto result = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    return std::string(buffer.data(), result.ptr);
}

auto parseColor(std::string_view raw) -> std::optional<std::string> {
    auto const trimmed = trimAscii(raw);
    if (trimmed.empty() || trimmed.size() > kMaxColorLength)
        return std::nullopt;
    auto const color = toLowerAscii(trimmed);

    std::smatch match;
    if (std::regex_match(color, match, kHexColor)) {
        auto const digits = match[1].str();
        if (digits.size() == 3) {
            std::string expanded{"#"};
            for (char ch : digits) {
                expanded.push_back(ch);
                expanded.push_back(ch);
            }
            return expanded;
        }
        return color;
    }

    if (std::regex_match(color, match, kRgbColor)) {
        std::array<int, 3> channels{};
        for (std::size_t i = 0; i < channels.size(); ++i) {
            auto const text = match[i + 1].str();
            std::from_chars(text.data(), text.data() + text.size(), channels[i]);
            if (channels[i] < 0 || channels[i] > 255)
                return std::nullopt;
        }
        std::string out = match[4].matched ? "rgba(" : "rgb(";
        out += std::to_string(channels[0]) + ", " + std::to_string(channels[1]) + ", " + std::to_string(channels[2]);
        if (match[4].matched) {
            auto alpha = parseDouble(match[4].str());
            if (!alpha || *alpha < 0.0 || *alpha > 1.0)
                return std::nullopt;
            out += ", " + formatNumber(*alpha);
        }
        out += ")";
        return out;
    }

    if (std::regex_match(color, match, kHslColor)) {
        auto hue        = parseDouble(match[1].str());
        auto saturation = parseDouble(match[2].str());
        auto lightness  = parseDouble(match[3].str());
        if (!hue || !saturation || !lightness)
            return std::nullopt;
        if (*hue > 360.0 || *saturation > 100.0 || *lightness > 100.0)
            return std::nullopt;
        std::string out = match[4].matched ? "hsla(" : "hsl(";
        out += formatNumber(*hue) + ", " + formatNumber(*saturation) + "%, " + formatNumber(*lightness) + "%";
        if (match[4].matched) {
            auto alpha = parseDouble(match[4].str());
            if (!alpha || *alpha < 0.0 || *alpha > 1.0)
                return std::nullopt;
            out += ", " + formatNumber(*alpha);
        }
        out += ")";
        return out;
    }

    if (std::find(kNamedColors.begin(), kNamedColors.end(), color) != kNamedColors.end())
        return color;
    return std::nullopt;
}

auto isUnicodeSpace(char32_t cp) -> bool {
    return cp == 0xA0 || (cp >= 0x2000 && cp <= 0x200A) || cp == 0x2028 || cp == 0x2029 || cp == 0x202F
           || cp == 0x205F || cp == 0x3000;
}

// Approximates \p{L}|\p{N} for non-ASCII code points by excluding the punctuation, symbol,
// mark, private-use and special blocks.
auto isUnicodeLetterOrDigit(char32_t cp) -> bool {
    if (cp < 0x80)
        return false;
    if (cp <= 0xBF)
        return cp == 0xAA || cp == 0xB2 || cp == 0xB3 || cp == 0xB5 || cp == 0xB9 || cp == 0xBA;
    if (cp == 0xD7 || cp == 0xF7)
        return false;
    if (cp >= 0x0300 && cp <= 0x036F)
        return false;
    if (cp >= 0x2000 && cp <= 0x2BFF)
        return false;
    if (cp >= 0x2E00 && cp <= 0x2E7F)
        return false;
    if (cp >= 0x3000 && cp <= 0x303F)
        return false;
    if (cp >= 0xD800 && cp <= 0xF8FF)
        return false;
    if (cp >= 0xFE00 && cp <= 0xFE4F)
        return false;
    if ((cp >= 0xFF00 && cp <= 0xFF0F) || (cp >= 0xFF1A && cp <= 0xFF20) || (cp >= 0xFF3B && cp <= 0xFF40)
        || (cp >= 0xFF5B && cp <= 0xFF65))
        return false;
    if (cp >= 0xFFF0 && cp <= 0xFFFF)
        return false;
    if (cp >= 0x1F000 && cp <= 0x1FAFF)
        return false;
    if (cp >= 0xE0000)
        return false;
    return true;
}

} // namespace

auto decodeHtmlEntities(std::string_view input) -> std::string {
    std::string out;
    out.reserve(input.size());
    std::size_t i = 0;
    while (i < input.size()) {
        if (input[i] != '&') {
            out.push_back(input[i++]);
            continue;
        }
        if (i + 1 < input.size() && input[i + 1] == '#') {
            std::size_t j   = i + 2;
            bool        hex = j < input.size() && (input[j] == 'x' || input[j] == 'X');
            if (hex)
                ++j;
            std::uint32_t value  = 0;
            std::size_t   digits = 0;
            while (j < input.size() && digits < 8) {
                char const ch = input[j];
                int        d  = -1;
                if (isAsciiDigit(ch))
                    d = ch - '0';
                else if (hex && ch >= 'a' && ch <= 'f')
                    d = ch - 'a' + 10;
                else if (hex && ch >= 'A' && ch <= 'F')
                    d = ch - 'A' + 10;
                if (d < 0)
                    break;
                value = value * (hex ? 16u : 10u) + static_cast<std::uint32_t>(d);
                ++digits;
                ++j;
            }
            if (digits == 0) {
                out.push_back(input[i++]);
                continue;
            }
            if (j < input.size() && input[j] == ';')
                ++j;
            char32_t cp = value;
            if (cp == 0 || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
                cp = kReplacementChar;
            appendUtf8(out, cp);
            i = j;
            continue;
        }
        auto const semicolon = input.find(';', i + 1);
        if (semicolon != std::string_view::npos && semicolon - i <= 10) {
            auto const name = input.substr(i + 1, semicolon - i - 1);
            if (auto cp = lookupEntity(name)) {
                appendUtf8(out, *cp);
                i = semicolon + 1;
                continue;
            }
        }
        out.push_back(input[i++]);
    }
    return out;
}

auto stripTags(std::string_view input) -> std::string {
    auto const  lower = toLowerAscii(input);
    std::string out;
    out.reserve(input.size());
    std::size_t i = 0;
    while (i < input.size()) {
        if (input[i] != '<') {
            out.push_back(input[i++]);
            continue;
        }
        // A tag name follows '<' or "</" directly; "a < b" is text.
        std::size_t const j = i + 1;
        bool consumed = false;
        for (std::string_view element : {std::string_view{"script"}, std::string_view{"style"}}) {
            if (lower.compare(j, element.size(), element) != 0)
                continue;
            auto const after = j + element.size();
            if (after < lower.size() && (isAsciiAlpha(lower[after]) || isAsciiDigit(lower[after])))
                continue;
            auto const closing = lower.find("</" + std::string{element}, after);
            if (closing == std::string::npos) {
                i = input.size();
            } else {
                auto const gt = lower.find('>', closing);
                i = gt == std::string::npos ? input.size() : gt + 1;
            }
            consumed = true;
            break;
        }
        if (consumed)
            continue;
        char const next      = j < input.size() ? input[j] : '\0';
        char const afterNext = j + 1 < input.size() ? input[j + 1] : '\0';
        if (isAsciiAlpha(next) || (next == '/' && isAsciiAlpha(afterNext)) || next == '!' || next == '?') {
            auto const gt = input.find('>', j);
            i = gt == std::string_view::npos ? input.size() : gt + 1;
            continue;
        }
        out.push_back(input[i++]);
    }
    return out;
}

auto countCodePoints(std::string_view input) -> std::size_t {
    std::size_t count = 0;
    std::size_t index = 0;
    while (index < input.size()) {
        nextCodePoint(input, index);
        ++count;
    }
    return count;
}

auto truncateUtf8(std::string_view input, std::size_t maxCodePoints) -> std::string {
    std::string out;
    out.reserve(std::min(input.size(), maxCodePoints * 4));
    std::size_t index = 0;
    std::size_t count = 0;
    while (index < input.size() && count < maxCodePoints) {
        appendUtf8(out, nextCodePoint(input, index));
        ++count;
    }
    return out;
}

auto sanitizeRichTextRun(std::string_view raw, std::size_t maxLength) -> std::string {
    auto cleaned = cleanUntilStable(truncateUtf8(raw, maxLength));
    return truncateUtf8(defuseCalls(cleaned), maxLength);
}

auto sanitizeText(std::string_view raw, std::size_t maxLength) -> std::string {
    auto const cleaned = sanitizeRichTextRun(raw, maxLength);
    std::string_view view{cleaned};
    while (!view.empty() && (view.front() == '@' || isAsciiSpace(view.front())))
        view.remove_prefix(1);
    while (!view.empty() && isAsciiSpace(view.back()))
        view.remove_suffix(1);
    return std::string{view};
}

auto isSafeText(std::string_view raw) -> bool {
    return sanitizeRichTextRun(raw, countCodePoints(raw)) == raw;
}

auto sanitizeColor(std::string_view raw) -> std::string {
    return parseColor(raw).value_or(std::string{kDefaultColor});
}

auto isValidColor(std::string_view raw) -> bool {
    return parseColor(raw).has_value();
}

auto isSafeColor(std::string_view raw) -> bool {
    auto const lower = toLowerAscii(raw);
    for (std::string_view needle : {"javascript:", "expression(", "url(", "<script", "eval("}) {
        if (lower.find(needle) != std::string::npos)
            return false;
    }
    return true;
}

auto sanitizeIdentifier(std::string_view raw, std::string_view fallback) -> std::string {
    std::string out;
    out.reserve(std::min(raw.size(), kMaxIdentifierLength));
    for (char ch : raw) {
        if (out.size() >= kMaxIdentifierLength)
            break;
        if (isAsciiAlpha(ch) || isAsciiDigit(ch) || ch == '_' || ch == '-' || ch == '.')
            out.push_back(ch);
    }
    if (out.empty())
        return std::string{fallback};
    return out;
}

auto sanitizeSetName(std::string_view raw, std::string_view defaultName) -> std::string {
    std::string collapsed;
    collapsed.reserve(raw.size());
    bool        pendingSpace = false;
    std::size_t count        = 0;
    std::size_t index        = 0;
    while (index < raw.size() && count < kMaxSetNameLength) {
        auto const start = index;
        auto const cp    = nextCodePoint(raw, index);
        bool       keep  = false;
        if (cp < 0x80) {
            char const ch = static_cast<char>(cp);
            if (isAsciiSpace(ch)) {
                pendingSpace = !collapsed.empty();
                continue;
            }
            keep = isAsciiAlpha(ch) || isAsciiDigit(ch) || ch == '-' || ch == '_';
        } else if (isUnicodeSpace(cp)) {
            pendingSpace = !collapsed.empty();
            continue;
        } else {
            keep = cp != kReplacementChar && isUnicodeLetterOrDigit(cp);
        }
        if (!keep)
            continue;
        if (pendingSpace) {
            collapsed.push_back(' ');
            ++count;
            pendingSpace = false;
            if (count >= kMaxSetNameLength)
                break;
        }
        collapsed.append(raw.substr(start, index - start));
        ++count;
    }
    while (!collapsed.empty() && collapsed.back() == ' ')
        collapsed.pop_back();
    if (collapsed.empty())
        return std::string{defaultName};
    return collapsed;
}

auto isValidSetName(std::string_view raw) -> bool {
    auto const trimmed = trimAscii(raw);
    if (trimmed.empty() || countCodePoints(trimmed) > kMaxSetNameLength)
        return false;
    return sanitizeSetName(trimmed, "") == trimmed;
}

namespace {

constexpr std::array<std::string_view, 42> kSvgElements{{
    "svg", "g", "path", "rect", "circle", "ellipse", "line", "polyline", "polygon", "text", "tspan",
    "textpath", "defs", "lineargradient", "radialgradient", "stop", "clippath", "mask", "pattern", "symbol",
    "use", "title", "desc", "metadata", "marker", "filter", "feblend", "fecolormatrix", "fecomponenttransfer",
    "fecomposite", "fedropshadow", "feflood", "fefunca", "fefuncb", "fefuncg", "fefuncr", "fegaussianblur",
    "femerge", "femergenode", "femorphology", "feoffset", "feturbulence",
}};

auto isSvgNameChar(char ch) -> bool {
    return isAsciiAlpha(ch) || isAsciiDigit(ch) || ch == ':' || ch == '-' || ch == '_' || ch == '.';
}

auto isAllowedSvgElement(std::string_view name) -> bool {
    if (name.starts_with("svg:"))
        name.remove_prefix(4);
    return std::find(kSvgElements.begin(), kSvgElements.end(), name) != kSvgElements.end();
}

// Every url( target must be a same-document fragment.
auto hasExternalUrl(std::string_view value) -> bool {
    for (auto pos = value.find("url("); pos != std::string_view::npos; pos = value.find("url(", pos + 4)) {
        auto target = trimAscii(value.substr(pos + 4));
        if (!target.empty() && (target.front() == '\'' || target.front() == '"'))
            target = trimAscii(target.substr(1));
        if (target.empty() || target.front() != '#')
            return true;
    }
    return false;
}

// Reason an attribute is refused, empty when it is allowed. Name and value are lowercase.
auto svgAttributeProblem(std::string_view name, std::string_view value) -> std::string_view {
    if (name.starts_with("on"))
        return "SVG contains event handler attribute";
    if (name == "attributename")
        return "SVG contains animation attribute";
    if (name == "src")
        return "SVG contains external reference";
    if (name == "href" || name.ends_with(":href")) {
        auto const target = trimAscii(value);
        if (target.empty() || target.front() != '#')
            return "SVG contains external reference";
    }
    if (value.find("@import") != std::string_view::npos || hasExternalUrl(value))
        return "SVG contains external reference";
    return {};
}

/*
 * Walks the tags of lowercased markup and checks each element against the allowlist and each
 * attribute against svgAttributeProblem. Comments and processing instructions are skipped;
 * other declarations (DOCTYPE, ENTITY, CDATA) are refused.
 */
auto svgMarkupProblem(std::string_view lower) -> std::string {
    std::size_t i = 0;
    while ((i = lower.find('<', i)) != std::string_view::npos) {
        auto const rest = lower.substr(i);
        if (rest.starts_with("<!--")) {
            auto const end = lower.find("-->", i + 4);
            if (end == std::string_view::npos)
                return "SVG contains unterminated comment";
            i = end + 3;
            continue;
        }
        if (rest.starts_with("<!"))
            return "SVG contains markup declaration";
        if (rest.starts_with("<?")) {
            auto const end = lower.find("?>", i + 2);
            if (end == std::string_view::npos)
                return "SVG contains unterminated processing instruction";
            i = end + 2;
            continue;
        }

        std::size_t j = i + 1;
        if (j < lower.size() && lower[j] == '/')
            ++j;
        if (j >= lower.size() || !isAsciiAlpha(lower[j])) {
            i = j;
            continue;
        }
        auto const nameStart = j;
        while (j < lower.size() && isSvgNameChar(lower[j]))
            ++j;
        auto const element = lower.substr(nameStart, j - nameStart);
        if (!isAllowedSvgElement(element))
            return "SVG contains unsupported element: " + std::string{element};

        while (j < lower.size() && lower[j] != '>') {
            if (isAsciiSpace(lower[j]) || lower[j] == '/') {
                ++j;
                continue;
            }
            auto const attrStart = j;
            while (j < lower.size() && !isAsciiSpace(lower[j]) && lower[j] != '=' && lower[j] != '>' && lower[j] != '/')
                ++j;
            auto const attribute = lower.substr(attrStart, j - attrStart);
            while (j < lower.size() && isAsciiSpace(lower[j]))
                ++j;
            std::string_view value;
            if (j < lower.size() && lower[j] == '=') {
                ++j;
                while (j < lower.size() && isAsciiSpace(lower[j]))
                    ++j;
                if (j < lower.size() && (lower[j] == '"' || lower[j] == '\'')) {
                    auto const quote = lower[j];
                    auto const end   = lower.find(quote, j + 1);
                    if (end == std::string_view::npos)
                        return "SVG contains unterminated attribute value";
                    value = lower.substr(j + 1, end - j - 1);
                    j     = end + 1;
                } else {
                    auto const valueStart = j;
                    while (j < lower.size() && !isAsciiSpace(lower[j]) && lower[j] != '>')
                        ++j;
                    value = lower.substr(valueStart, j - valueStart);
                }
            }
            if (auto const problem = svgAttributeProblem(attribute, value); !problem.empty())
                return std::string{problem};
        }
        i = j;
    }
    return {};
}

} // namespace

auto sanitizeSvg(std::string_view content, std::size_t maxLength) -> Expected<std::string> {
    if (content.size() > maxLength) {
        return std::unexpected(Error{Error::Code::ValidationFailed, "SVG exceeds maximum length"});
    }

    std::string decoded{content};
    for (int pass = 0; pass < 8; ++pass) {
        auto next = decodeHtmlEntities(decoded);
        if (next == decoded)
            break;
        decoded = std::move(next);
    }
    auto const lower = toLowerAscii(decoded);
    std::string compact;
    compact.reserve(lower.size());
    for (char ch : lower) {
        if (!isAsciiSpace(ch) && static_cast<unsigned char>(ch) >= 0x20)
            compact.push_back(ch);
    }

    auto reject = [](std::string message) -> Expected<std::string> {
        return std::unexpected(Error{Error::Code::ValidationFailed, std::move(message)});
    };

    if (compact.find("<script") != std::string::npos)
        return reject("SVG contains script element");
    if (compact.find("javascript:") != std::string::npos)
        return reject("SVG contains javascript URL");
    if (compact.find("vbscript:") != std::string::npos)
        return reject("SVG contains vbscript URL");
    if (std::regex_search(lower, kEventHandler))
        return reject("SVG contains event handler attribute");
    if (compact.find("<foreignobject") != std::string::npos)
        return reject("SVG contains foreignObject element");
    for (std::string_view element : {"<iframe", "<embed", "<object"}) {
        if (compact.find(element) != std::string::npos)
            return reject("SVG contains embedded content element");
    }
    if (compact.find("data:") != std::string::npos)
        return reject("SVG contains data URL");
    if (compact.find("@import") != std::string::npos)
        return reject("SVG contains external reference");
    if (auto problem = svgMarkupProblem(lower); !problem.empty())
        return reject(std::move(problem));
    return std::string{content};
}

auto isSafePathData(std::string_view data) -> bool {
    if (data.empty())
        return false;
    constexpr std::string_view kAllowed = "MmLlHhVvCcSsQqTtAaZz0123456789eE.,+- \t\n\r";
    return std::all_of(data.begin(), data.end(), [&](char ch) { return kAllowed.find(ch) != std::string_view::npos; });
}

auto isSafeImageDataUrl(std::string_view src) -> bool {
    auto const lower = toLowerAscii(src.substr(0, std::min<std::size_t>(src.size(), 32)));
    std::size_t prefixLength = 0;
    for (std::string_view prefix : {"data:image/png;base64,", "data:image/jpeg;base64,", "data:image/jpg;base64,",
                                    "data:image/gif;base64,", "data:image/webp;base64,"}) {
        if (lower.starts_with(prefix)) {
            prefixLength = prefix.size();
            break;
        }
    }
    if (prefixLength == 0 || prefixLength == src.size())
        return false;
    auto const payload = src.substr(prefixLength);
    return std::all_of(payload.begin(), payload.end(), [](char ch) {
        return isAsciiAlpha(ch) || isAsciiDigit(ch) || ch == '+' || ch == '/' || ch == '=';
    });
}

} // namespace LS::Sanitize
