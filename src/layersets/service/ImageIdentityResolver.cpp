#include <layersets/service/ImageIdentityResolver.hpp>

#include <openssl/sha.h>

#include <array>
#include <utility>

namespace LS {

namespace {

constexpr std::string_view kForeignPrefix = "foreign_";
constexpr std::string_view kIllegalTitleChars = "#<>[]|{}";
constexpr std::size_t      kMaxImageNameBytes = 255;

auto toHex(unsigned char const* bytes, std::size_t size) -> std::string {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string           out;
    out.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        out.push_back(kDigits[bytes[i] >> 4]);
        out.push_back(kDigits[bytes[i] & 0x0f]);
    }
    return out;
}

template <typename T>
auto optionalInteger(nlohmann::json const& entry, char const* key) -> std::optional<T> {
    auto it = entry.find(key);
    if (it == entry.end() || !it->is_number_integer())
        return std::nullopt;
    return it->template get<T>();
}

} // namespace

auto normalizeImageName(std::string_view raw) -> Expected<std::string> {
    auto const first = raw.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return std::unexpected(Error{Error::Code::InvalidParameter, "Image name must not be empty"});
    }
    auto const last = raw.find_last_not_of(" \t\r\n");
    raw             = raw.substr(first, last - first + 1);

    std::string name;
    name.reserve(raw.size());
    for (char c : raw) {
        auto const byte = static_cast<unsigned char>(c);
        if (byte < 0x20 || byte == 0x7f || kIllegalTitleChars.find(c) != std::string_view::npos) {
            return std::unexpected(Error{Error::Code::InvalidParameter, "Invalid image name"});
        }
        if (c == ' ') {
            if (!name.empty() && name.back() == '_')
                continue;
            name.push_back('_');
        } else {
            name.push_back(c);
        }
    }
    if (name.size() > kMaxImageNameBytes) {
        return std::unexpected(Error{Error::Code::InvalidParameter, "Image name too long"});
    }
    return name;
}

auto foreignFallbackHash(std::string_view imageName) -> std::string {
    std::array<unsigned char, SHA_DIGEST_LENGTH> digest{};
    SHA1(reinterpret_cast<unsigned char const*>(imageName.data()), imageName.size(), digest.data());
    std::string hash{kForeignPrefix};
    hash.append(toHex(digest.data(), digest.size()));
    return hash;
}

auto splitMimeType(std::string_view mime) -> std::pair<std::string, std::string> {
    auto const slash = mime.find('/');
    if (slash == std::string_view::npos)
        return {std::string{mime}, std::string{}};
    return {std::string{mime.substr(0, slash)}, std::string{mime.substr(slash + 1)}};
}

StaticImageIdentityResolver::StaticImageIdentityResolver(StaticImageIdentityResolver&& other) noexcept {
    std::scoped_lock lock(other.mutex_);
    images_ = std::move(other.images_);
}

auto StaticImageIdentityResolver::fromJson(nlohmann::json const& manifest) -> Expected<StaticImageIdentityResolver> {
    if (!manifest.is_object()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "Image manifest must be a JSON object"});
    }
    StaticImageIdentityResolver resolver;
    for (auto const& [name, entry] : manifest.items()) {
        if (!entry.is_object()) {
            return std::unexpected(Error{Error::Code::MalformedInput, "Image manifest entry must be an object: " + name});
        }
        ImageIdentity identity;
        identity.imageName = name;
        if (auto it = entry.find("sha1"); it != entry.end() && it->is_string())
            identity.contentHash = it->get<std::string>();
        if (auto it = entry.find("mime"); it != entry.end() && it->is_string())
            identity.mimeType = it->get<std::string>();
        if (auto it = entry.find("foreign"); it != entry.end() && it->is_boolean())
            identity.foreign = it->get<bool>();
        identity.width  = optionalInteger<std::int64_t>(entry, "width");
        identity.height = optionalInteger<std::int64_t>(entry, "height");
        if (auto registered = resolver.registerImage(std::move(identity)); !registered)
            return std::unexpected(registered.error());
    }
    return resolver;
}

auto StaticImageIdentityResolver::registerImage(ImageIdentity identity) -> Expected<void> {
    auto name = normalizeImageName(identity.imageName);
    if (!name)
        return std::unexpected(name.error());
    if (identity.contentHash.empty() && !identity.foreign) {
        return std::unexpected(Error{Error::Code::InvalidParameter, "Local image requires a content hash: " + *name});
    }
    identity.imageName = *name;
    std::scoped_lock lock(mutex_);
    images_.insert_or_assign(std::move(*name), std::move(identity));
    return {};
}

auto StaticImageIdentityResolver::resolve(std::string_view imageName) -> Expected<ImageIdentity> {
    auto name = normalizeImageName(imageName);
    if (!name)
        return std::unexpected(name.error());

    ImageIdentity identity;
    {
        std::scoped_lock lock(mutex_);
        auto             it = images_.find(*name);
        if (it == images_.end()) {
            return std::unexpected(Error{Error::Code::NotFound, "Image not found: " + *name});
        }
        identity = it->second;
    }
    if (identity.contentHash.empty() && identity.foreign) {
        identity.contentHash = foreignFallbackHash(identity.imageName);
    }
    return identity;
}

} // namespace LS
