#include "core/config/eval_config.hpp"

#include "core/fs_utils.hpp"
#include "core/string_utils.hpp"

#include <charconv>
#include <cstdlib>
#include <sstream>
#include <utility>

namespace plugeval::core::config {

namespace {

std::optional<std::string> ReadNonEmpty(const EnvLookup& env, std::string_view key) {
  std::optional<std::string> value = env(key);
  if (!value.has_value() || value->empty()) {
    return std::nullopt;
  }
  return value;
}

bool ParseNonNegativeInteger(std::string_view raw, std::int64_t& value) {
  const std::string_view trimmed = TrimView(raw);
  if (trimmed.empty()) {
    return false;
  }
  std::int64_t parsed = 0;
  const auto* end = trimmed.data() + trimmed.size();
  const auto result = std::from_chars(trimmed.data(), end, parsed);
  if (result.ec != std::errc() || result.ptr != end || parsed < 0) {
    return false;
  }
  value = parsed;
  return true;
}

bool IsValidEnvKey(std::string_view key) {
  if (key.empty()) {
    return false;
  }
  for (const char c : key) {
    const bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                    (c >= '0' && c <= '9') || c == '_';
    if (!ok) {
      return false;
    }
  }
  return !(key.front() >= '0' && key.front() <= '9');
}

std::string Unquote(std::string_view raw) {
  if (raw.size() >= 2U && (raw.front() == '"' || raw.front() == '\'') &&
      raw.back() == raw.front()) {
    return std::string(raw.substr(1, raw.size() - 2U));
  }
  return std::string(raw);
}

} // namespace

EnvLookup ProcessEnvironment() {
  return [](std::string_view key) -> std::optional<std::string> {
    const char* value = std::getenv(std::string(key).c_str());
    if (value == nullptr) {
      return std::nullopt;
    }
    return std::string(value);
  };
}

EnvLookup OverlayEnvironment(std::map<std::string, std::string> overrides, EnvLookup fallback) {
  return [overrides = std::move(overrides),
          fallback = std::move(fallback)](std::string_view key) -> std::optional<std::string> {
    const auto it = overrides.find(std::string(key));
    if (it != overrides.end()) {
      return it->second;
    }
    if (!fallback) {
      return std::nullopt;
    }
    return fallback(key);
  };
}

bool LoadEvalConfig(const EnvLookup& env, EvalConfig& config, std::string& error) {
  error.clear();
  config = EvalConfig{};

  if (auto base_url = ReadNonEmpty(env, "FREEPLAY_BASE_URL"); base_url.has_value()) {
    config.remote.base_url = *base_url;
  }
  while (!config.remote.base_url.empty() && config.remote.base_url.back() == '/') {
    config.remote.base_url.pop_back();
  }
  config.remote.api_key = env("FREEPLAY_API_KEY").value_or("");
  config.remote.project_id = env("FREEPLAY_PROJECT_ID").value_or("");
  config.remote.verify_tls = ToLowerAscii(env("FREEPLAY_VERIFY_SSL").value_or("true")) != "false";

  config.eval_start_time = ReadNonEmpty(env, "EVAL_START_TIME");
  config.eval_end_time = ReadNonEmpty(env, "EVAL_END_TIME");

  if (auto duration = ReadNonEmpty(env, "EVAL_DURATION_SECS"); duration.has_value()) {
    if (!ParseNonNegativeInteger(*duration, config.eval_duration_seconds)) {
      error = "EVAL_DURATION_SECS must be a non-negative integer, got '" + *duration + "'";
      return false;
    }
  }

  return true;
}

bool LoadEnvFile(const std::filesystem::path& path, std::map<std::string, std::string>& entries,
                 std::string& error) {
  std::string text;
  if (!ReadTextFile(path, text, error)) {
    return false;
  }

  std::istringstream input(text);
  std::string raw_line;
  std::size_t line_no = 0;
  while (std::getline(input, raw_line)) {
    ++line_no;
    std::string_view line = TrimView(raw_line);
    if (line.empty() || line.front() == '#') {
      continue;
    }
    constexpr std::string_view kExportPrefix = "export ";
    if (line.substr(0, kExportPrefix.size()) == kExportPrefix) {
      line = TrimView(line.substr(kExportPrefix.size()));
    }

    const auto delimiter = line.find('=');
    if (delimiter == std::string_view::npos) {
      error = "expected KEY=VALUE at " + path.string() + ":" + std::to_string(line_no);
      return false;
    }
    const std::string key = Trim(line.substr(0, delimiter));
    if (!IsValidEnvKey(key)) {
      error = "invalid variable name '" + key + "' at " + path.string() + ":" +
              std::to_string(line_no);
      return false;
    }
    entries[key] = Unquote(TrimView(line.substr(delimiter + 1U)));
  }
  return true;
}

} // namespace plugeval::core::config
