/**
 * Copyright (c) 2026 Cr4nkSt4r
 */
#pragma once

#include "md/md_filter.h"

#include <filesystem>

#include <nlohmann/json.hpp>

namespace rbxmd::settings {
// Builds a filter from a parsed settings object. Unknown keys are ignored;
// keys with the wrong type keep their default.
md::FilterConfig filter_config_from_json(const nlohmann::json& j);

// Missing or malformed files fall back to the default filter.
md::FilterConfig load_filter_config(const std::filesystem::path& path);
}  // namespace rbxmd::settings
