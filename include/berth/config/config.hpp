#pragma once

#include "berth/common/result.hpp"
#include "berth/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace berth::config {

/// Resolution order: --config override, then BERTH_CONFIG, then /etc/berth/berth.toml.
[[nodiscard]] std::filesystem::path config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> load_config_from(const std::filesystem::path &path);
[[nodiscard]] common::Result<Config> parse_config(const std::string &content);

[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

[[nodiscard]] std::string template_config();

} // namespace berth::config
