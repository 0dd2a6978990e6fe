#include "config.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {
std::string env_or_empty(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

template <typename T>
void read_key(const json& j, const char* key, T& dst, const char* expected) {
  if (!j.contains(key)) return;
  try {
    dst = j.at(key).get<T>();
  } catch (const json::exception&) {
    throw InvalidConfiguration(key, j.at(key).dump(), expected);
  }
}

void check_positive(const char* key, int v) {
  if (v <= 0) throw InvalidConfiguration(key, std::to_string(v), "a positive integer");
}
}

std::string default_models_dir() {
  auto explicit_dir = env_or_empty("CK_MODELS_DIR");
  if (!explicit_dir.empty()) return explicit_dir;
  auto xdg = env_or_empty("XDG_CACHE_HOME");
  if (!xdg.empty()) return (fs::path(xdg) / "ck" / "models").string();
  auto home = env_or_empty("HOME");
  if (!home.empty()) return (fs::path(home) / ".cache" / "ck" / "models").string();
  return ".ck_models";
}

std::string default_config_path() {
  auto xdg = env_or_empty("XDG_CONFIG_HOME");
  if (!xdg.empty()) return (fs::path(xdg) / "ck" / "config.json").string();
  auto home = env_or_empty("HOME");
  if (!home.empty()) return (fs::path(home) / ".config" / "ck" / "config.json").string();
  return "";
}

Config parse_config(const std::string& json_text) {
  json j;
  try {
    j = json::parse(json_text);
  } catch (const json::parse_error& e) {
    throw InvalidConfiguration("config", e.what(), "a JSON object");
  }
  if (!j.is_object()) throw InvalidConfiguration("config", j.dump(), "a JSON object");

  Config c;
  read_key(j, "model", c.model, "a model name");
  read_key(j, "models_dir", c.models_dir, "a directory path");
  read_key(j, "topk", c.topk, "an integer");
  read_key(j, "threshold", c.threshold, "a number");
  read_key(j, "hybrid_threshold", c.hybrid_threshold, "a number");
  read_key(j, "lexical_weight", c.lexical_weight, "a number");
  read_key(j, "semantic_weight", c.semantic_weight, "a number");
  read_key(j, "rerank_model", c.rerank_model, "a model name");
  read_key(j, "rerank_window", c.rerank_window, "an integer");
  read_key(j, "workers", c.workers, "an integer");
  read_key(j, "batch_size", c.batch_size, "an integer");
  read_key(j, "embed_timeout_ms", c.embed_timeout_ms, "an integer");
  read_key(j, "log_level", c.log_level, "trace|debug|info|warn|error|off");

  if (j.contains("retry")) {
    const auto& r = j.at("retry");
    if (!r.is_object()) throw InvalidConfiguration("retry", r.dump(), "an object");
    int attempts = c.retry.max_attempts;
    long base_ms = (long)c.retry.base_delay.count();
    long max_ms = (long)c.retry.max_delay.count();
    read_key(r, "max_attempts", attempts, "an integer");
    read_key(r, "base_delay_ms", base_ms, "an integer");
    read_key(r, "max_delay_ms", max_ms, "an integer");
    check_positive("retry.max_attempts", attempts);
    c.retry.max_attempts = attempts;
    c.retry.base_delay = std::chrono::milliseconds(base_ms);
    c.retry.max_delay = std::chrono::milliseconds(max_ms);
  }

  check_positive("topk", c.topk);
  check_positive("batch_size", c.batch_size);
  check_positive("embed_timeout_ms", c.embed_timeout_ms);
  if (c.workers < 0) throw InvalidConfiguration("workers", std::to_string(c.workers), ">= 0");
  if (c.lexical_weight < 0 || c.semantic_weight < 0 ||
      c.lexical_weight + c.semantic_weight <= 0)
    throw InvalidConfiguration("lexical_weight/semantic_weight",
                               std::to_string(c.lexical_weight) + "/" + std::to_string(c.semantic_weight),
                               "non-negative weights with a positive sum");
  return c;
}

Config load_config(const std::string& path) {
  std::string p = path.empty() ? default_config_path() : path;
  Config c;
  if (!p.empty() && fs::exists(p)) {
    std::ifstream in(p);
    if (!in) throw FileAccessError(p, "read", "cannot open config file");
    std::ostringstream ss; ss << in.rdbuf();
    c = parse_config(ss.str());
    spdlog::debug("loaded config from {}", p);
  } else if (!path.empty()) {
    throw FileAccessError(path, "read", "config file does not exist");
  }
  if (c.models_dir.empty()) c.models_dir = default_models_dir();
  return c;
}
