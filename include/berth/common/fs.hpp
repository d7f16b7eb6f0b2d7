#pragma once

#include "berth/common/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace berth::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] bool ends_with(const std::string &value, const std::string &suffix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::string to_upper(std::string value);
[[nodiscard]] std::string join(const std::vector<std::string> &parts, const std::string &sep);
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

/// Write `content` to a sibling temp file, chmod it to `mode`, then rename over `path`.
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path,
                                       const std::string &content,
                                       std::filesystem::perms mode);

/// Remove a file or directory tree. A missing path is not an error.
[[nodiscard]] Status remove_path(const std::filesystem::path &path);

} // namespace berth::common
