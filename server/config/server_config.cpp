#include "server/config/server_config.h"

#include "server/logging/logger.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace chatwarden {

namespace {

std::string Trim(const std::string& input) {
  auto start = input.find_first_not_of(" \t");
  auto end = input.find_last_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  return input.substr(start, end - start + 1);
}

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

bool ParseInt(const std::string& text, int* value) {
  std::string trimmed = Trim(text);
  if (trimmed.empty()) {
    return false;
  }
  char* end = nullptr;
  errno = 0;
  long parsed = std::strtol(trimmed.c_str(), &end, 10);
  if (errno != 0 || *end != '\0' || parsed < -2147483647L ||
      parsed > 2147483647L) {
    return false;
  }
  *value = static_cast<int>(parsed);
  return true;
}

bool ParseBool(const std::string& value) {
  auto lowered = ToLower(Trim(value));
  return lowered == "true" || lowered == "1" || lowered == "yes";
}

std::vector<std::string> SplitList(const std::string& raw) {
  std::vector<std::string> items;
  std::stringstream ss(raw);
  std::string item;
  while (std::getline(ss, item, ',')) {
    auto trimmed = Trim(item);
    if (!trimmed.empty()) {
      items.push_back(trimmed);
    }
  }
  return items;
}

std::vector<std::string> ReadStringList(const YAML::Node& node) {
  std::vector<std::string> items;
  if (node && node.IsSequence()) {
    for (const auto& item : node) {
      items.push_back(item.as<std::string>());
    }
  }
  return items;
}

bool ValidPort(int port) { return port > 0 && port <= 65535; }

}  // namespace

const char* ServiceRoleName(ServiceRole role) {
  switch (role) {
    case ServiceRole::kAll:
      return "all";
    case ServiceRole::kGateway:
      return "gateway";
    case ServiceRole::kRelay:
      return "relay";
  }
  return "unknown";
}

bool ParseServiceRole(const std::string& text, ServiceRole* role) {
  auto lowered = ToLower(Trim(text));
  if (lowered == "all") {
    *role = ServiceRole::kAll;
  } else if (lowered == "gateway") {
    *role = ServiceRole::kGateway;
  } else if (lowered == "relay") {
    *role = ServiceRole::kRelay;
  } else {
    return false;
  }
  return true;
}

void ApplyYamlConfig(const YAML::Node& root, ServerConfig* config) {
  if (auto server = root["server"]) {
    if (server["role"]) {
      auto text = server["role"].as<std::string>();
      if (!ParseServiceRole(text, &config->role)) {
        throw std::invalid_argument("unknown server.role: " + text);
      }
    }
    if (server["http_workers"]) config->http_workers = server["http_workers"].as<int>();
  }

  if (auto gateway = root["gateway"]) {
    if (gateway["host"]) config->gateway.host = gateway["host"].as<std::string>();
    if (gateway["port"]) config->gateway.port = gateway["port"].as<int>();
    if (gateway["upstream_url"]) config->gateway.upstream_url = gateway["upstream_url"].as<std::string>();
    if (gateway["upstream_api_key"]) config->gateway.upstream_api_key = gateway["upstream_api_key"].as<std::string>();
    if (gateway["upstream_timeout_seconds"]) {
      config->gateway.upstream_timeout_seconds = gateway["upstream_timeout_seconds"].as<int>();
    }
  }

  if (auto relay = root["relay"]) {
    if (relay["host"]) config->relay.host = relay["host"].as<std::string>();
    if (relay["port"]) config->relay.port = relay["port"].as<int>();
    if (relay["backend_url"]) config->relay.backend_url = relay["backend_url"].as<std::string>();
    if (relay["timeout_seconds"]) config->relay.timeout_seconds = relay["timeout_seconds"].as<int>();
  }

  if (auto policy = root["policy"]) {
    if (policy["terms"]) config->policy.terms = ReadStringList(policy["terms"]);
    if (policy["patterns"]) config->policy.patterns = ReadStringList(policy["patterns"]);
    if (policy["block_status"]) config->policy.block_status = policy["block_status"].as<int>();
    if (policy["prompt_block_message"]) {
      config->policy.prompt_block_message = policy["prompt_block_message"].as<std::string>();
    }
    if (policy["reply_block_message"]) {
      config->policy.reply_block_message = policy["reply_block_message"].as<std::string>();
    }
  }

  if (auto logging = root["logging"]) {
    if (logging["format"]) config->logging.format = logging["format"].as<std::string>();
    if (logging["level"]) config->logging.level = logging["level"].as<std::string>();
  }

  if (auto tls = root["tls"]) {
    if (tls["enabled"]) config->tls.enabled = tls["enabled"].as<bool>();
    if (tls["cert_path"]) config->tls.cert_path = tls["cert_path"].as<std::string>();
    if (tls["key_path"]) config->tls.key_path = tls["key_path"].as<std::string>();
  }
}

bool LoadServerConfig(const std::string& path, bool must_exist,
                      ServerConfig* config, std::string* error) {
  if (path.empty() || !std::filesystem::exists(path)) {
    if (must_exist) {
      *error = "config file not found: " + path;
      return false;
    }
    log::Info("config", "No config file, using defaults", path);
    return true;
  }
  try {
    ServerConfig loaded = *config;
    ApplyYamlConfig(YAML::LoadFile(path), &loaded);
    *config = std::move(loaded);
  } catch (const YAML::Exception& e) {
    *error = "error parsing " + path + ": " + e.what();
    return false;
  } catch (const std::invalid_argument& e) {
    *error = "invalid value in " + path + ": " + e.what();
    return false;
  }
  return true;
}

bool ApplyEnvOverrides(ServerConfig* config, std::string* error) {
  auto int_env = [error](const char* name, int* target) {
    const char* raw = std::getenv(name);
    if (!raw) {
      return true;
    }
    if (!ParseInt(raw, target)) {
      *error = std::string(name) + " is not an integer: " + raw;
      return false;
    }
    return true;
  };

  if (const char* env_role = std::getenv("CHATWARDEN_ROLE")) {
    if (!ParseServiceRole(env_role, &config->role)) {
      *error = std::string("CHATWARDEN_ROLE is not all|gateway|relay: ") + env_role;
      return false;
    }
  }
  if (!int_env("CHATWARDEN_HTTP_WORKERS", &config->http_workers)) return false;

  if (const char* env = std::getenv("CHATWARDEN_GATEWAY_HOST")) {
    config->gateway.host = env;
  }
  if (!int_env("CHATWARDEN_GATEWAY_PORT", &config->gateway.port)) return false;
  if (const char* env = std::getenv("CHATWARDEN_UPSTREAM_URL")) {
    config->gateway.upstream_url = env;
  }
  if (const char* env = std::getenv("CHATWARDEN_UPSTREAM_API_KEY")) {
    config->gateway.upstream_api_key = env;
  }
  if (!int_env("CHATWARDEN_UPSTREAM_TIMEOUT",
               &config->gateway.upstream_timeout_seconds)) {
    return false;
  }

  if (const char* env = std::getenv("CHATWARDEN_RELAY_HOST")) {
    config->relay.host = env;
  }
  if (!int_env("CHATWARDEN_RELAY_PORT", &config->relay.port)) return false;
  if (const char* env = std::getenv("CHATWARDEN_BACKEND_URL")) {
    config->relay.backend_url = env;
  }
  if (!int_env("CHATWARDEN_RELAY_TIMEOUT", &config->relay.timeout_seconds)) {
    return false;
  }

  if (const char* env = std::getenv("CHATWARDEN_POLICY_TERMS")) {
    config->policy.terms = SplitList(env);
  }
  if (!int_env("CHATWARDEN_BLOCK_STATUS", &config->policy.block_status)) {
    return false;
  }

  if (const char* env = std::getenv("CHATWARDEN_LOG_FORMAT")) {
    config->logging.format = env;
  }
  if (const char* env = std::getenv("CHATWARDEN_LOG_LEVEL")) {
    config->logging.level = env;
  }

  if (const char* env = std::getenv("CHATWARDEN_TLS_ENABLED")) {
    config->tls.enabled = ParseBool(env);
  }
  if (const char* env = std::getenv("CHATWARDEN_TLS_CERT_PATH")) {
    config->tls.cert_path = env;
  }
  if (const char* env = std::getenv("CHATWARDEN_TLS_KEY_PATH")) {
    config->tls.key_path = env;
  }
  return true;
}

bool ValidateServerConfig(const ServerConfig& config, std::string* error) {
  if (config.http_workers <= 0) {
    *error = "server.http_workers must be positive";
    return false;
  }
  if (config.role != ServiceRole::kRelay) {
    if (!ValidPort(config.gateway.port)) {
      *error = "gateway.port out of range: " + std::to_string(config.gateway.port);
      return false;
    }
    if (config.gateway.upstream_url.empty()) {
      *error = "gateway.upstream_url is empty";
      return false;
    }
    if (config.gateway.upstream_timeout_seconds <= 0) {
      *error = "gateway.upstream_timeout_seconds must be positive";
      return false;
    }
  }
  if (config.role != ServiceRole::kGateway) {
    if (!ValidPort(config.relay.port)) {
      *error = "relay.port out of range: " + std::to_string(config.relay.port);
      return false;
    }
    if (config.relay.backend_url.empty()) {
      *error = "relay.backend_url is empty";
      return false;
    }
    if (config.relay.timeout_seconds <= 0) {
      *error = "relay.timeout_seconds must be positive";
      return false;
    }
  }
  if (config.role == ServiceRole::kAll &&
      config.gateway.port == config.relay.port) {
    *error = "gateway.port and relay.port must differ when role is all";
    return false;
  }
  if (config.policy.block_status < 400 || config.policy.block_status > 499) {
    *error = "policy.block_status must be a 4xx status: " +
             std::to_string(config.policy.block_status);
    return false;
  }
  if (config.tls.enabled &&
      (config.tls.cert_path.empty() || config.tls.key_path.empty())) {
    *error = "tls.enabled requires tls.cert_path and tls.key_path";
    return false;
  }
  if (config.policy.block_status == 422) {
    *error = "policy.block_status 422 is reserved for invalid requests";
    return false;
  }
  log::Level level;
  if (!log::ParseLevel(config.logging.level, &level)) {
    *error = "logging.level must be debug|info|warn|error: " + config.logging.level;
    return false;
  }
  if (config.logging.format != "text" && config.logging.format != "json") {
    *error = "logging.format must be text|json: " + config.logging.format;
    return false;
  }
  return true;
}

}  // namespace chatwarden
