#pragma once

#include "stager/core/result.hpp"
#include "stager/staging/types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace stager::staging {

using Manifest = std::vector<StagedPackage>;

void to_json(nlohmann::json& j, const StagedPackage& package);
void from_json(const nlohmann::json& j, StagedPackage& package);

/// JSON array of {"name","location","size"} objects, in manifest order.
std::string manifest_to_json(const Manifest& manifest, int indent = 2);

stager::Result<Manifest> manifest_from_json(const std::string& text);

} // namespace stager::staging
