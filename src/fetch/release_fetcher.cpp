#include "berth/fetch/release_fetcher.hpp"

#include "berth/common/fs.hpp"
#include "berth/common/json_util.hpp"

#include <openssl/evp.h>

#include <array>
#include <cctype>
#include <charconv>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace berth::fetch {

namespace {

bool is_repo_char(const char ch) {
  const auto uch = static_cast<unsigned char>(ch);
  return std::isalnum(uch) != 0 || ch == '-' || ch == '_' || ch == '.';
}

bool is_valid_repo_part(const std::string &part) {
  if (part.empty() || part == "." || part == "..") {
    return false;
  }
  for (const char ch : part) {
    if (!is_repo_char(ch)) {
      return false;
    }
  }
  return true;
}

std::string replace_all(std::string text, const std::string &needle, const std::string &value) {
  std::size_t pos = 0;
  while ((pos = text.find(needle, pos)) != std::string::npos) {
    text.replace(pos, needle.size(), value);
    pos += value.size();
  }
  return text;
}

// Tags can contain characters that are not URL-safe.
std::string url_escape(const std::string &value) {
  std::ostringstream out;
  for (const char ch : value) {
    const auto uch = static_cast<unsigned char>(ch);
    if (std::isalnum(uch) != 0 || ch == '-' || ch == '_' || ch == '.' || ch == '~') {
      out << ch;
    } else {
      out << '%' << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
          << static_cast<int>(uch) << std::nouppercase << std::dec;
    }
  }
  return out.str();
}

bool is_latest(const std::string &version) {
  const std::string normalized = common::to_lower(common::trim(version));
  return normalized.empty() || normalized == "latest";
}

} // namespace

common::Result<RepoRef> parse_repo_ref(const std::string &reference,
                                       const std::string &default_owner) {
  const std::string trimmed = common::trim(reference);
  RepoRef repo;
  const auto slash = trimmed.find('/');
  if (slash == std::string::npos) {
    repo.owner = default_owner;
    repo.name = trimmed;
  } else {
    repo.owner = trimmed.substr(0, slash);
    repo.name = trimmed.substr(slash + 1);
  }

  if (repo.owner.empty()) {
    return common::Result<RepoRef>::failure("repository '" + reference +
                                            "' has no owner and no default owner is configured");
  }
  if (!is_valid_repo_part(repo.owner) || !is_valid_repo_part(repo.name)) {
    return common::Result<RepoRef>::failure("invalid repository reference '" + reference +
                                            "'; expected owner/repo");
  }
  return common::Result<RepoRef>::success(std::move(repo));
}

common::Result<Release> parse_release(const std::string &json) {
  Release release;
  release.tag = common::json_get_string(json, "tag_name");
  if (release.tag.empty()) {
    return common::Result<Release>::failure("release response has no tag_name");
  }

  for (const auto &object : common::json_array_elements(
           common::json_get_array(json, "assets"))) {
    ReleaseAsset asset;
    asset.name = common::json_get_string(object, "name");
    asset.api_url = common::json_get_string(object, "url");
    asset.download_url = common::json_get_string(object, "browser_download_url");
    const std::string id = common::json_get_number(object, "id");
    (void)std::from_chars(id.data(), id.data() + id.size(), asset.id);
    if (!asset.name.empty()) {
      release.assets.push_back(std::move(asset));
    }
  }
  return common::Result<Release>::success(std::move(release));
}

std::string resolve_asset_name(const std::string &pattern, const std::string &name,
                               const std::string &version, const std::string &repo) {
  std::string out = replace_all(pattern, "{name}", name);
  out = replace_all(out, "{version}", version);
  return replace_all(out, "{repo}", repo.empty() ? name : repo);
}

common::Result<ReleaseAsset> find_asset(const std::vector<ReleaseAsset> &assets,
                                        const std::string &expected) {
  std::vector<std::string> names;
  for (const auto &asset : assets) {
    if (asset.name == expected) {
      return common::Result<ReleaseAsset>::success(asset);
    }
    names.push_back(asset.name);
  }
  return common::Result<ReleaseAsset>::failure("no asset matching \"" + expected +
                                               "\" found; available assets: " +
                                               (names.empty() ? "(none)" : common::join(names, ", ")));
}

common::Result<std::string> sha256_file(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return common::Result<std::string>::failure("unable to open " + path.string());
  }

  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  if (ctx == nullptr) {
    return common::Result<std::string>::failure("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(ctx);
    return common::Result<std::string>::failure("EVP_DigestInit_ex failed");
  }

  std::array<char, 64 * 1024> buffer{};
  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const auto got = in.gcount();
    if (got > 0 && EVP_DigestUpdate(ctx, buffer.data(), static_cast<std::size_t>(got)) != 1) {
      EVP_MD_CTX_free(ctx);
      return common::Result<std::string>::failure("EVP_DigestUpdate failed");
    }
  }

  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_len = 0;
  const int rc = EVP_DigestFinal_ex(ctx, digest.data(), &digest_len);
  EVP_MD_CTX_free(ctx);
  if (rc != 1) {
    return common::Result<std::string>::failure("EVP_DigestFinal_ex failed");
  }

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (unsigned int i = 0; i < digest_len; ++i) {
    stream << std::setw(2) << static_cast<int>(digest[i]);
  }
  return common::Result<std::string>::success(stream.str());
}

GithubReleaseFetcher::GithubReleaseFetcher(GithubFetcherOptions options,
                                           std::shared_ptr<IHttpClient> http,
                                           artifact::ArtifactStore &store)
    : options_(std::move(options)), http_(std::move(http)), store_(store) {}

HttpHeaders GithubReleaseFetcher::api_headers(const std::string &accept) const {
  HttpHeaders headers{{"Accept", accept}, {"X-GitHub-Api-Version", "2022-11-28"}};
  if (!options_.token.empty()) {
    headers["Authorization"] = "Bearer " + options_.token;
  }
  return headers;
}

common::Result<Release> GithubReleaseFetcher::get_release(const RepoRef &repo,
                                                          const std::string &path,
                                                          const common::CancellationToken &cancel) {
  std::string base = options_.api_url;
  while (common::ends_with(base, "/")) {
    base.pop_back();
  }
  const std::string url = base + "/repos/" + repo.full() + "/releases/" + path;
  const auto response =
      http_->get(url, api_headers("application/vnd.github+json"), options_.api_timeout_ms, cancel);
  if (response.status == 404) {
    return common::Result<Release>::failure("release " + path + " not found in " + repo.full());
  }
  if (!response.ok()) {
    return common::Result<Release>::failure(
        describe_failure("fetching release " + path + " of " + repo.full(), response));
  }
  return parse_release(response.body);
}

common::Result<std::string>
GithubReleaseFetcher::resolve_version(const std::string &repo, const std::string &version,
                                      const common::CancellationToken &cancel) {
  auto ref = parse_repo_ref(repo, options_.default_owner);
  if (!ref.ok()) {
    return common::Result<std::string>::failure(ref.error());
  }

  const std::string path = is_latest(version) ? "latest" : "tags/" + url_escape(version);
  auto release = get_release(ref.value(), path, cancel);
  if (!release.ok()) {
    return common::Result<std::string>::failure(release.error());
  }
  return common::Result<std::string>::success(release.value().tag);
}

common::Result<FetchedArtifact>
GithubReleaseFetcher::fetch_artifact(const std::string &repo, const std::string &version,
                                     const std::string &service,
                                     const common::CancellationToken &cancel) {
  using FetchResult = common::Result<FetchedArtifact>;
  if (auto status = artifact::validate_version(version); !status.ok()) {
    return FetchResult::failure(status.error());
  }
  auto ref = parse_repo_ref(repo, options_.default_owner);
  if (!ref.ok()) {
    return FetchResult::failure(ref.error());
  }

  auto release = get_release(ref.value(), "tags/" + url_escape(version), cancel);
  if (!release.ok()) {
    return FetchResult::failure(release.error());
  }

  const std::string expected =
      resolve_asset_name(options_.asset_pattern, service, version, ref.value().name);
  auto asset = find_asset(release.value().assets, expected);
  if (!asset.ok()) {
    return FetchResult::failure(asset.error());
  }

  if (auto dir = common::ensure_dir(store_.service_dir(service)); !dir.ok()) {
    return FetchResult::failure(dir.error());
  }
  const std::filesystem::path partial =
      store_.versioned_path(service, version).string() + ".tmp-download";

  const std::string url =
      asset.value().api_url.empty() ? asset.value().download_url : asset.value().api_url;
  const auto response = http_->download(url, api_headers("application/octet-stream"), partial,
                                        options_.download_timeout_ms, cancel);
  if (!response.ok()) {
    std::error_code ec;
    std::filesystem::remove(partial, ec);
    return FetchResult::failure(describe_failure("downloading " + expected, response));
  }

  auto digest = sha256_file(partial);
  if (!digest.ok()) {
    std::error_code ec;
    std::filesystem::remove(partial, ec);
    return FetchResult::failure(digest.error());
  }

  if (auto status = store_.install(service, version, partial); !status.ok()) {
    std::error_code ec;
    std::filesystem::remove(partial, ec);
    return FetchResult::failure(status.error());
  }
  if (auto status = store_.point_current(service, version); !status.ok()) {
    return FetchResult::failure(status.error());
  }

  return FetchResult::success(
      FetchedArtifact{.path = store_.versioned_path(service, version), .sha256 = digest.value()});
}

} // namespace berth::fetch
