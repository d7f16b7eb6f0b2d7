#pragma once

#include "berth/artifact/store.hpp"
#include "berth/common/cancellation.hpp"
#include "berth/common/result.hpp"
#include "berth/fetch/http_client.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace berth::fetch {

struct RepoRef {
  std::string owner;
  std::string name;

  [[nodiscard]] std::string full() const { return owner + "/" + name; }
};

/// Accepts "owner/repo" or a bare "repo" that takes `default_owner`.
[[nodiscard]] common::Result<RepoRef> parse_repo_ref(const std::string &reference,
                                                     const std::string &default_owner);

struct ReleaseAsset {
  std::uint64_t id = 0;
  std::string name;
  std::string api_url;
  std::string download_url;
};

struct Release {
  std::string tag;
  std::vector<ReleaseAsset> assets;
};

[[nodiscard]] common::Result<Release> parse_release(const std::string &json);

/// Expands {name}, {version} and {repo} in an asset pattern.
[[nodiscard]] std::string resolve_asset_name(const std::string &pattern, const std::string &name,
                                             const std::string &version,
                                             const std::string &repo = "");

[[nodiscard]] common::Result<ReleaseAsset> find_asset(const std::vector<ReleaseAsset> &assets,
                                                      const std::string &expected);

struct FetchedArtifact {
  std::filesystem::path path;
  std::string sha256;
};

class IArtifactFetcher {
public:
  virtual ~IArtifactFetcher() = default;

  /// "latest" or an empty string resolves to the newest release tag.
  [[nodiscard]] virtual common::Result<std::string>
  resolve_version(const std::string &repo, const std::string &version,
                  const common::CancellationToken &cancel) = 0;

  /// Lands the build at its versioned path and points "current" at it.
  [[nodiscard]] virtual common::Result<FetchedArtifact>
  fetch_artifact(const std::string &repo, const std::string &version, const std::string &service,
                 const common::CancellationToken &cancel) = 0;
};

struct GithubFetcherOptions {
  std::string api_url = "https://api.github.com";
  std::string token;
  std::string default_owner;
  std::string asset_pattern = "{name}-linux-amd64";
  std::uint64_t api_timeout_ms = 30'000;
  std::uint64_t download_timeout_ms = 600'000;
};

class GithubReleaseFetcher final : public IArtifactFetcher {
public:
  GithubReleaseFetcher(GithubFetcherOptions options, std::shared_ptr<IHttpClient> http,
                       artifact::ArtifactStore &store);

  [[nodiscard]] common::Result<std::string>
  resolve_version(const std::string &repo, const std::string &version,
                  const common::CancellationToken &cancel) override;

  [[nodiscard]] common::Result<FetchedArtifact>
  fetch_artifact(const std::string &repo, const std::string &version, const std::string &service,
                 const common::CancellationToken &cancel) override;

private:
  [[nodiscard]] common::Result<Release> get_release(const RepoRef &repo, const std::string &path,
                                                    const common::CancellationToken &cancel);
  [[nodiscard]] HttpHeaders api_headers(const std::string &accept) const;

  GithubFetcherOptions options_;
  std::shared_ptr<IHttpClient> http_;
  artifact::ArtifactStore &store_;
};

[[nodiscard]] common::Result<std::string> sha256_file(const std::filesystem::path &path);

} // namespace berth::fetch
