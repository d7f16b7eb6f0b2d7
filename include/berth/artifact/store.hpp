#pragma once

#include "berth/common/result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace berth::artifact {

/// On-disk layout of downloaded builds:
///   <bin>/<name>/<name>-<version>   one file per installed version
///   <bin>/<name>/<name>             symlink to the running version
class ArtifactStore {
public:
  explicit ArtifactStore(std::filesystem::path bin_dir);

  [[nodiscard]] std::filesystem::path service_dir(const std::string &name) const;
  [[nodiscard]] std::filesystem::path versioned_path(const std::string &name,
                                                     const std::string &version) const;
  [[nodiscard]] std::filesystem::path current_path(const std::string &name) const;

  [[nodiscard]] common::Result<std::optional<std::string>>
  current_version(const std::string &name) const;
  [[nodiscard]] common::Result<std::vector<std::string>>
  installed_versions(const std::string &name) const;

  /// Moves `source` to the versioned path with mode 0755.
  [[nodiscard]] common::Status install(const std::string &name, const std::string &version,
                                       const std::filesystem::path &source);
  /// Atomically repoints the current symlink. The versioned file must exist.
  [[nodiscard]] common::Status point_current(const std::string &name, const std::string &version);
  /// Deletes every installed version not listed in `keep`.
  [[nodiscard]] common::Status prune(const std::string &name,
                                     const std::vector<std::string> &keep);
  [[nodiscard]] common::Status remove_version(const std::string &name,
                                              const std::string &version);
  [[nodiscard]] common::Status remove_all(const std::string &name);

  [[nodiscard]] const std::filesystem::path &bin_dir() const { return bin_dir_; }

private:
  std::filesystem::path bin_dir_;
};

[[nodiscard]] common::Status validate_version(const std::string &version);

} // namespace berth::artifact
