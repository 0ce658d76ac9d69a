#pragma once

#include <string>
#include <vector>

#include "aurora/core/sky_params.h"
#include "aurora/util/json.h"

namespace aurora {

inline constexpr int kSkyParamsVersion = 1;

json::Value sky_params_to_json(const SkyParams& p);

// Starts from the defaults and overrides whatever the document sets, so a
// partial document is fine. Unknown keys are appended to *unknown_keys as
// dotted paths, or logged as warnings when unknown_keys is null.
//
// Throws std::runtime_error when a known key has the wrong type or shape.
// Range checks are left to validate_sky_params().
SkyParams sky_params_from_json(const json::Value& v, std::vector<std::string>* unknown_keys = nullptr);

std::string serialize_sky_params(const SkyParams& p);
SkyParams deserialize_sky_params(const std::string& json_text);

SkyParams load_sky_params_from_file(const std::string& path);
void save_sky_params_to_file(const std::string& path, const SkyParams& p);

} // namespace aurora
