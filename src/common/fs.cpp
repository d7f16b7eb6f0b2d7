#include "berth/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>

#include <unistd.h>

namespace berth::common {

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

bool ends_with(const std::string &value, const std::string &suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::string to_upper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return value;
}

std::string join(const std::vector<std::string> &parts, const std::string &sep) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out += sep;
    }
    out += parts[i];
  }
  return out;
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure("failed to create directory " + path.string() +
                                                  ": " + ec.message());
  }
  return Result<std::filesystem::path>::success(path);
}

std::string expand_path(std::string value) {
  if (value.empty()) {
    return value;
  }

  if (value[0] == '~') {
    if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
      value.replace(0, 1, home);
    }
  }

  std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::smatch match;
  std::string expanded;
  std::string remaining = value;

  while (std::regex_search(remaining, match, env_pattern)) {
    expanded += match.prefix().str();
    const std::string var_name = match[1].str();
    if (const char *var = std::getenv(var_name.c_str()); var != nullptr) {
      expanded += var;
    }
    remaining = match.suffix().str();
  }

  expanded += remaining;
  return expanded;
}

Result<std::string> read_file(const std::filesystem::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return Result<std::string>::failure("unable to open " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return Result<std::string>::success(buffer.str());
}

Status write_file_atomic(const std::filesystem::path &path, const std::string &content,
                         const std::filesystem::perms mode) {
  if (!path.parent_path().empty()) {
    if (auto dir = ensure_dir(path.parent_path()); !dir.ok()) {
      return Status::error(dir.error());
    }
  }

  const std::filesystem::path tmp_path =
      path.string() + ".tmp-" + std::to_string(static_cast<long>(getpid()));
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      return Status::error("unable to write " + tmp_path.string());
    }
    out << content;
    out.flush();
    if (!out) {
      return Status::error("short write to " + tmp_path.string());
    }
  }

  std::error_code ec;
  std::filesystem::permissions(tmp_path, mode, std::filesystem::perm_options::replace, ec);
  if (ec) {
    std::filesystem::remove(tmp_path, ec);
    return Status::error("chmod " + tmp_path.string() + ": " + ec.message());
  }

  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    std::error_code ignore;
    std::filesystem::remove(tmp_path, ignore);
    return Status::error("rename " + tmp_path.string() + " -> " + path.string() + ": " +
                         ec.message());
  }
  return Status::success();
}

Status remove_path(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::remove_all(path, ec);
  if (ec) {
    return Status::error("remove " + path.string() + ": " + ec.message());
  }
  return Status::success();
}

} // namespace berth::common
