#include "stager/staging/manifest.hpp"

namespace stager::staging {
using json = nlohmann::json;

void to_json(json& j, const StagedPackage& package) {
    j = json{
        {"name", package.name},
        {"location", package.location},
        {"size", package.size}
    };
}

void from_json(const json& j, StagedPackage& package) {
    j.at("name").get_to(package.name);
    j.at("location").get_to(package.location);
    package.size = j.value("size", std::uint64_t{0});
}

std::string manifest_to_json(const Manifest& manifest, int indent) {
    json packages = json::array();
    for (const auto& package : manifest) {
        packages.push_back(package);
    }
    return packages.dump(indent);
}

stager::Result<Manifest> manifest_from_json(const std::string& text) {
    try {
        const auto document = json::parse(text);
        if (!document.is_array()) {
            return stager::Err<Manifest>(ErrorKind::InvalidConfiguration, "Manifest must be a JSON array");
        }
        return stager::Ok(document.get<Manifest>());
    } catch (const json::exception& e) {
        return stager::Err<Manifest>(ErrorKind::InvalidConfiguration,
                                     std::string("Malformed manifest: ") + e.what());
    }
}

} // namespace stager::staging
