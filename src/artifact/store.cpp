#include "berth/artifact/store.hpp"

#include "berth/common/fs.hpp"

#include <algorithm>
#include <unistd.h>

namespace berth::artifact {

namespace {

constexpr auto EXECUTABLE_PERMS =
    std::filesystem::perms::owner_all | std::filesystem::perms::group_read |
    std::filesystem::perms::group_exec | std::filesystem::perms::others_read |
    std::filesystem::perms::others_exec;

} // namespace

common::Status validate_version(const std::string &version) {
  if (version.empty()) {
    return common::Status::error("version must not be empty");
  }
  if (version == "." || version == ".." || version.find('/') != std::string::npos ||
      version.find('\0') != std::string::npos) {
    return common::Status::error("invalid version '" + version + "'");
  }
  return common::Status::success();
}

ArtifactStore::ArtifactStore(std::filesystem::path bin_dir) : bin_dir_(std::move(bin_dir)) {}

std::filesystem::path ArtifactStore::service_dir(const std::string &name) const {
  return bin_dir_ / name;
}

std::filesystem::path ArtifactStore::versioned_path(const std::string &name,
                                                    const std::string &version) const {
  return service_dir(name) / (name + "-" + version);
}

std::filesystem::path ArtifactStore::current_path(const std::string &name) const {
  return service_dir(name) / name;
}

common::Result<std::optional<std::string>>
ArtifactStore::current_version(const std::string &name) const {
  using VersionResult = common::Result<std::optional<std::string>>;
  std::error_code ec;
  const auto link = current_path(name);
  if (!std::filesystem::is_symlink(link, ec)) {
    return VersionResult::success(std::nullopt);
  }
  const auto target = std::filesystem::read_symlink(link, ec);
  if (ec) {
    return VersionResult::failure("reading " + link.string() + ": " + ec.message());
  }
  const std::string prefix = name + "-";
  const std::string file = target.filename().string();
  if (!common::starts_with(file, prefix)) {
    return VersionResult::failure(link.string() + " points at unexpected target " +
                                  target.string());
  }
  return VersionResult::success(file.substr(prefix.size()));
}

common::Result<std::vector<std::string>>
ArtifactStore::installed_versions(const std::string &name) const {
  using VersionsResult = common::Result<std::vector<std::string>>;
  std::vector<std::string> versions;
  const auto dir = service_dir(name);
  std::error_code ec;
  if (!std::filesystem::exists(dir, ec)) {
    return VersionsResult::success(std::move(versions));
  }

  const std::string prefix = name + "-";
  for (const auto &entry : std::filesystem::directory_iterator(dir, ec)) {
    const std::string file = entry.path().filename().string();
    std::error_code entry_ec;
    if (entry.is_symlink(entry_ec) || !common::starts_with(file, prefix) ||
        file.find(".tmp-") != std::string::npos) {
      continue;
    }
    versions.push_back(file.substr(prefix.size()));
  }
  if (ec) {
    return VersionsResult::failure("listing " + dir.string() + ": " + ec.message());
  }
  std::sort(versions.begin(), versions.end());
  return VersionsResult::success(std::move(versions));
}

common::Status ArtifactStore::install(const std::string &name, const std::string &version,
                                      const std::filesystem::path &source) {
  if (auto status = validate_version(version); !status.ok()) {
    return status;
  }
  if (auto dir = common::ensure_dir(service_dir(name)); !dir.ok()) {
    return common::Status::error(dir.error());
  }

  std::error_code ec;
  std::filesystem::permissions(source, EXECUTABLE_PERMS, std::filesystem::perm_options::replace,
                               ec);
  if (ec) {
    return common::Status::error("chmod " + source.string() + ": " + ec.message());
  }

  const auto target = versioned_path(name, version);
  std::filesystem::rename(source, target, ec);
  if (ec) {
    // Cross-device temp directories need a copy instead of a rename.
    std::error_code copy_ec;
    std::filesystem::copy_file(source, target, std::filesystem::copy_options::overwrite_existing,
                               copy_ec);
    if (copy_ec) {
      return common::Status::error("installing " + target.string() + ": " + copy_ec.message());
    }
    std::filesystem::remove(source, copy_ec);
    std::filesystem::permissions(target, EXECUTABLE_PERMS, std::filesystem::perm_options::replace,
                                 copy_ec);
  }
  return common::Status::success();
}

common::Status ArtifactStore::point_current(const std::string &name, const std::string &version) {
  if (auto status = validate_version(version); !status.ok()) {
    return status;
  }

  std::error_code ec;
  const auto target = versioned_path(name, version);
  if (!std::filesystem::is_regular_file(target, ec)) {
    return common::Status::error("artifact " + target.string() + " is not installed");
  }

  const auto link = current_path(name);
  const std::filesystem::path tmp_link =
      link.string() + ".tmp-" + std::to_string(static_cast<long>(getpid()));
  std::filesystem::remove(tmp_link, ec);
  std::filesystem::create_symlink(target.filename(), tmp_link, ec);
  if (ec) {
    return common::Status::error("creating symlink " + tmp_link.string() + ": " + ec.message());
  }
  std::filesystem::rename(tmp_link, link, ec);
  if (ec) {
    std::error_code ignore;
    std::filesystem::remove(tmp_link, ignore);
    return common::Status::error("repointing " + link.string() + " to " + version + ": " +
                                 ec.message());
  }
  return common::Status::success();
}

common::Status ArtifactStore::prune(const std::string &name,
                                    const std::vector<std::string> &keep) {
  auto versions = installed_versions(name);
  if (!versions.ok()) {
    return versions.status();
  }

  std::vector<std::string> failures;
  for (const auto &version : versions.value()) {
    if (std::find(keep.begin(), keep.end(), version) != keep.end()) {
      continue;
    }
    if (auto status = remove_version(name, version); !status.ok()) {
      failures.push_back(status.error());
    }
  }
  if (!failures.empty()) {
    return common::Status::error(common::join(failures, "; "));
  }
  return common::Status::success();
}

common::Status ArtifactStore::remove_version(const std::string &name, const std::string &version) {
  if (auto status = validate_version(version); !status.ok()) {
    return status;
  }
  std::error_code ec;
  std::filesystem::remove(versioned_path(name, version), ec);
  if (ec) {
    return common::Status::error("removing " + versioned_path(name, version).string() + ": " +
                                 ec.message());
  }
  return common::Status::success();
}

common::Status ArtifactStore::remove_all(const std::string &name) {
  if (name.empty()) {
    return common::Status::error("refusing to remove artifacts for an empty service name");
  }
  return common::remove_path(service_dir(name));
}

} // namespace berth::artifact
