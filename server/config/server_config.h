#pragma once

#include <yaml-cpp/yaml.h>

#include <string>
#include <vector>

namespace chatwarden {

// Which listeners this process runs.
enum class ServiceRole { kAll, kGateway, kRelay };

const char* ServiceRoleName(ServiceRole role);
bool ParseServiceRole(const std::string& text, ServiceRole* role);

struct GatewayConfig {
  std::string host{"0.0.0.0"};
  int port{4000};
  std::string upstream_url{"http://127.0.0.1:11434"};
  std::string upstream_api_key;
  int upstream_timeout_seconds{600};
};

struct RelayConfig {
  std::string host{"0.0.0.0"};
  int port{8000};
  std::string backend_url{"http://127.0.0.1:4000"};
  int timeout_seconds{600};
};

struct PolicyConfig {
  std::vector<std::string> terms;
  std::vector<std::string> patterns;
  int block_status{400};
  std::string prompt_block_message{
      "⚠️ BLOCKED: Your message violates the content policy. "
      "Please rephrase your question."};
  std::string reply_block_message{
      "⚠️ BLOCKED: The response violated the content policy. "
      "Please ask a different question."};
};

struct LoggingConfig {
  std::string format{"text"};
  std::string level{"info"};
};

struct TlsSettings {
  bool enabled{false};
  std::string cert_path;
  std::string key_path;
};

struct ServerConfig {
  ServiceRole role{ServiceRole::kAll};
  int http_workers{4};
  GatewayConfig gateway;
  RelayConfig relay;
  PolicyConfig policy;
  LoggingConfig logging;
  TlsSettings tls;
};

// Overlays the keys present in `root` onto `config`. Throws YAML::Exception
// on a type mismatch and std::invalid_argument on an unknown role.
void ApplyYamlConfig(const YAML::Node& root, ServerConfig* config);

// Defaults, then `path` when it exists. A missing file keeps the defaults
// unless `must_exist`. Returns false and fills `error` when the file is
// missing but required, or fails to parse; `config` is left untouched then.
bool LoadServerConfig(const std::string& path, bool must_exist,
                      ServerConfig* config, std::string* error);

// CHATWARDEN_* environment variables. Returns false and fills `error` when a
// variable holds an unusable value.
bool ApplyEnvOverrides(ServerConfig* config, std::string* error);

bool ValidateServerConfig(const ServerConfig& config, std::string* error);

}  // namespace chatwarden
