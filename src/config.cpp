#include "config.hpp"
#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace hubrep {

namespace {

std::shared_ptr<spdlog::logger> config_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("config");
  }();
  return logger;
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

/**
 * Convert a YAML node into a structurally equivalent JSON value.
 *
 * Scalars are typed by content: booleans, integers, and floating point
 * numbers are recognised, everything else stays a string.
 *
 * @param node YAML node to transform.
 * @return JSON value mirroring the YAML content.
 */
nlohmann::json yaml_to_json(const YAML::Node &node) {
  using nlohmann::json;
  switch (node.Type()) {
  case YAML::NodeType::Null:
    return nullptr;
  case YAML::NodeType::Scalar: {
    const std::string s = node.Scalar();
    if (s == "true" || s == "True" || s == "TRUE")
      return true;
    if (s == "false" || s == "False" || s == "FALSE")
      return false;
    try {
      size_t idx = 0;
      long long i = std::stoll(s, &idx, 10);
      if (idx == s.size())
        return i;
    } catch (const std::logic_error &) {
      // Not an integer; fall through to the next interpretation.
    }
    try {
      size_t idx = 0;
      double d = std::stod(s, &idx);
      if (idx == s.size())
        return d;
    } catch (const std::logic_error &) {
      // Not a number either; keep the scalar as text.
    }
    return s;
  }
  case YAML::NodeType::Sequence: {
    json arr = json::array();
    auto &array = arr.get_ref<json::array_t &>();
    array.reserve(node.size());
    std::transform(node.begin(), node.end(), std::back_inserter(array),
                   [](const YAML::Node &item) { return yaml_to_json(item); });
    return arr;
  }
  case YAML::NodeType::Map: {
    json obj = json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  default:
    return nullptr;
  }
}

/**
 * Translate a TOML node to a JSON representation.
 *
 * @param node TOML node read from a parsed document.
 * @return JSON value containing the equivalent data.
 */
nlohmann::json toml_to_json(const toml::node &node) {
  using nlohmann::json;
  if (const auto *table = node.as_table()) {
    json obj = json::object();
    for (const auto &kv : *table) {
      obj[std::string(kv.first.str())] = toml_to_json(kv.second);
    }
    return obj;
  }

  if (const auto *array = node.as_array()) {
    json arr = json::array();
    arr.get_ref<json::array_t &>().reserve(array->size());
    for (const auto &item : *array) {
      arr.push_back(toml_to_json(item));
    }
    return arr;
  }

  if (const auto *value = node.as_boolean())
    return value->get();
  if (const auto *value = node.as_integer())
    return value->get();
  if (const auto *value = node.as_floating_point())
    return value->get();
  if (const auto *value = node.as_string())
    return value->get();
  return nullptr;
}

/// Lift keys of the known sections to the top level.
nlohmann::json normalize_config_sections(const nlohmann::json &source) {
  nlohmann::json normalized = source;
  for (std::string_view name : {"logging", "decode", "output"}) {
    auto it = source.find(std::string{name});
    if (it == source.end() || !it->is_object()) {
      continue;
    }
    for (const auto &[key, value] : it->items()) {
      normalized[key] = value;
    }
  }
  return normalized;
}

} // namespace

/**
 * Populate configuration settings from a JSON object.
 *
 * @param j JSON document holding configuration keys.
 */
void Config::load_json(const nlohmann::json &j) {
  if (!j.is_object()) {
    throw std::runtime_error("Configuration root must be a mapping");
  }
  nlohmann::json cfg = normalize_config_sections(j);

  if (cfg.contains("log_level")) {
    set_log_level(cfg["log_level"].get<std::string>());
  }
  if (cfg.contains("log_pattern")) {
    set_log_pattern(cfg["log_pattern"].get<std::string>());
  }
  if (cfg.contains("log_file")) {
    set_log_file(cfg["log_file"].get<std::string>());
  }
  if (cfg.contains("log_rotate")) {
    set_log_rotate(cfg["log_rotate"].get<int>());
  }
  if (cfg.contains("log_compress")) {
    set_log_compress(cfg["log_compress"].get<bool>());
  }
  if (cfg.contains("log_categories")) {
    const auto &categories = cfg["log_categories"];
    if (!categories.is_object()) {
      config_log()->warn("log_categories must be a mapping; ignoring");
    } else {
      std::unordered_map<std::string, std::string> values;
      for (const auto &[name, level] : categories.items()) {
        values[name] = level.get<std::string>();
      }
      set_log_categories(std::move(values));
    }
  }
  if (cfg.contains("payload_format")) {
    set_payload_format(payload_format_from_string(
        to_lower_copy(cfg["payload_format"].get<std::string>())));
  }
  if (cfg.contains("indent")) {
    set_indent(cfg["indent"].get<int>());
  }
  if (cfg.contains("pretty") && cfg["pretty"].get<bool>() && indent_ < 0) {
    set_indent(2);
  }
}

Config Config::from_json(const nlohmann::json &j) {
  Config cfg;
  cfg.load_json(j);
  return cfg;
}

/**
 * Load configuration from a file on disk.
 *
 * Errors during parsing are logged and rethrown.
 *
 * @param path Filesystem location of the configuration file.
 * @return Fully populated configuration object.
 */
Config Config::from_file(const std::string &path) {
  config_log()->debug("Loading config from {}", path);
  auto pos = path.find_last_of('.');
  if (pos == std::string::npos) {
    config_log()->error("Unknown config file extension for {}", path);
    throw std::runtime_error("Unknown config file extension");
  }
  const std::string ext = to_lower_copy(path.substr(pos + 1));
  nlohmann::json j;
  try {
    if (ext == "yaml" || ext == "yml") {
      YAML::Node node = YAML::LoadFile(path);
      j = yaml_to_json(node);
    } else if (ext == "json") {
      std::ifstream f(path);
      if (!f) {
        config_log()->error("Failed to open config file {}", path);
        throw std::runtime_error("Failed to open config file");
      }
      f >> j;
    } else if (ext == "toml" || ext == "tml") {
      toml::table tbl = toml::parse_file(path);
      j = toml_to_json(tbl);
    } else {
      config_log()->error("Unsupported config format: {}", ext);
      throw std::runtime_error("Unsupported config format");
    }
  } catch (const std::exception &e) {
    config_log()->error("Failed to load config {}: {}", path, e.what());
    throw std::runtime_error("Failed to load config " + path + ": " +
                             e.what());
  }
  Config cfg;
  cfg.load_json(j);
  config_log()->info("Config loaded from {}", path);
  return cfg;
}

} // namespace hubrep
