#pragma once

#include <string>

namespace berth::cli {

[[nodiscard]] std::string version_string();
void print_help();

/// Entry point for the `berth` binary. Returns the process exit code.
int run_cli(int argc, char **argv);

/// True for keys whose values must not be printed (passwords, tokens, keys, secrets).
[[nodiscard]] bool is_sensitive_key(const std::string &key);
/// Replaces the value of every sensitive KEY=VALUE or KEY = "VALUE" line.
[[nodiscard]] std::string mask_secrets(const std::string &content);

} // namespace berth::cli
