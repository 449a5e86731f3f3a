#include <catch2/catch.hpp>

#include "server/config/server_config.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace chatwarden;

namespace {

// Sets an environment variable for the lifetime of the guard.
class ScopedEnv {
 public:
  ScopedEnv(const char* name, const char* value) : name_(name) {
    ::setenv(name, value, 1);
  }
  ~ScopedEnv() { ::unsetenv(name_); }

 private:
  const char* name_;
};

}  // namespace

TEST_CASE("ServerConfig defaults describe both services", "[config]") {
  ServerConfig config;
  REQUIRE(config.role == ServiceRole::kAll);
  REQUIRE(config.gateway.port == 4000);
  REQUIRE(config.relay.port == 8000);
  REQUIRE(config.relay.backend_url == "http://127.0.0.1:4000");
  REQUIRE(config.policy.block_status == 400);
  REQUIRE(config.gateway.upstream_timeout_seconds == 600);
  std::string error;
  REQUIRE(ValidateServerConfig(config, &error));
}

TEST_CASE("ApplyYamlConfig overlays present keys", "[config]") {
  auto root = YAML::Load(R"(
server: { role: relay, http_workers: 8 }
relay: { port: 9000, backend_url: "http://gw:4000", timeout_seconds: 30 }
policy:
  terms: [secret]
  patterns: ['rabbits?']
  block_status: 451
  prompt_block_message: "no"
logging: { format: json, level: debug }
tls: { enabled: true, cert_path: /c.pem, key_path: /k.pem }
)");
  ServerConfig config;
  ApplyYamlConfig(root, &config);
  REQUIRE(config.role == ServiceRole::kRelay);
  REQUIRE(config.http_workers == 8);
  REQUIRE(config.relay.port == 9000);
  REQUIRE(config.relay.backend_url == "http://gw:4000");
  REQUIRE(config.relay.timeout_seconds == 30);
  REQUIRE(config.gateway.port == 4000);
  REQUIRE(config.policy.terms == std::vector<std::string>{"secret"});
  REQUIRE(config.policy.patterns == std::vector<std::string>{"rabbits?"});
  REQUIRE(config.policy.block_status == 451);
  REQUIRE(config.policy.prompt_block_message == "no");
  REQUIRE(config.policy.reply_block_message.find("BLOCKED") != std::string::npos);
  REQUIRE(config.logging.format == "json");
  REQUIRE(config.tls.enabled);
  REQUIRE(config.tls.key_path == "/k.pem");
}

TEST_CASE("ApplyYamlConfig rejects an unknown role", "[config]") {
  ServerConfig config;
  REQUIRE_THROWS_AS(ApplyYamlConfig(YAML::Load("server: { role: both }"), &config),
                    std::invalid_argument);
}

TEST_CASE("LoadServerConfig refuses a broken file", "[config]") {
  auto path = std::filesystem::temp_directory_path() / "chatwarden_bad.yaml";
  {
    std::ofstream out(path);
    out << "policy:\n  patterns: ['duck'\ngateway: { port: [unterminated\n";
  }
  ServerConfig config;
  std::string error;
  REQUIRE_FALSE(LoadServerConfig(path.string(), false, &config, &error));
  REQUIRE(error.find("chatwarden_bad.yaml") != std::string::npos);
  REQUIRE(config.gateway.port == 4000);

  {
    std::ofstream out(path);
    out << "server: { role: sideways }\n";
  }
  error.clear();
  REQUIRE_FALSE(LoadServerConfig(path.string(), false, &config, &error));
  REQUIRE(error.find("sideways") != std::string::npos);
  std::filesystem::remove(path);
}

TEST_CASE("LoadServerConfig treats a missing file by need", "[config]") {
  ServerConfig config;
  std::string error;
  REQUIRE(LoadServerConfig("/nonexistent/chatwarden.yaml", false, &config,
                           &error));
  REQUIRE(config.relay.port == 8000);
  REQUIRE_FALSE(
      LoadServerConfig("/nonexistent/chatwarden.yaml", true, &config, &error));
  REQUIRE(error.find("not found") != std::string::npos);
}

TEST_CASE("LoadServerConfig reads the sample config", "[config]") {
  auto path = std::filesystem::temp_directory_path() / "chatwarden_ok.yaml";
  {
    std::ofstream out(path);
    out << "gateway:\n  upstream_url: http://llm:8080/v1\n"
           "policy:\n  patterns:\n    - '\\bduck(y|ies?|s)?\\b'\n";
  }
  ServerConfig config;
  std::string error;
  REQUIRE(LoadServerConfig(path.string(), true, &config, &error));
  REQUIRE(config.gateway.upstream_url == "http://llm:8080/v1");
  REQUIRE(config.policy.patterns.size() == 1);
  REQUIRE(config.policy.patterns[0] == "\\bduck(y|ies?|s)?\\b");
  std::filesystem::remove(path);
}

TEST_CASE("Environment overrides win over the file", "[config]") {
  ScopedEnv role("CHATWARDEN_ROLE", "gateway");
  ScopedEnv port("CHATWARDEN_GATEWAY_PORT", "4100");
  ScopedEnv terms("CHATWARDEN_POLICY_TERMS", "alpha, beta ,,gamma");
  ScopedEnv status("CHATWARDEN_BLOCK_STATUS", "403");
  ScopedEnv tls("CHATWARDEN_TLS_ENABLED", "yes");

  ServerConfig config;
  config.policy.terms = {"from-file"};
  std::string error;
  REQUIRE(ApplyEnvOverrides(&config, &error));
  REQUIRE(config.role == ServiceRole::kGateway);
  REQUIRE(config.gateway.port == 4100);
  REQUIRE(config.policy.terms ==
          std::vector<std::string>{"alpha", "beta", "gamma"});
  REQUIRE(config.policy.block_status == 403);
  REQUIRE(config.tls.enabled);
}

TEST_CASE("Environment overrides report unusable values", "[config]") {
  ScopedEnv port("CHATWARDEN_RELAY_PORT", "eighty");
  ServerConfig config;
  std::string error;
  REQUIRE_FALSE(ApplyEnvOverrides(&config, &error));
  REQUIRE(error.find("CHATWARDEN_RELAY_PORT") != std::string::npos);
}

TEST_CASE("ValidateServerConfig rejects bad values", "[config]") {
  std::string error;

  ServerConfig bad_port;
  bad_port.relay.port = 70000;
  REQUIRE_FALSE(ValidateServerConfig(bad_port, &error));

  ServerConfig bad_timeout;
  bad_timeout.gateway.upstream_timeout_seconds = 0;
  REQUIRE_FALSE(ValidateServerConfig(bad_timeout, &error));

  ServerConfig bad_status;
  bad_status.policy.block_status = 200;
  REQUIRE_FALSE(ValidateServerConfig(bad_status, &error));

  ServerConfig reserved_status;
  reserved_status.policy.block_status = 422;
  REQUIRE_FALSE(ValidateServerConfig(reserved_status, &error));

  ServerConfig same_ports;
  same_ports.relay.port = same_ports.gateway.port;
  REQUIRE_FALSE(ValidateServerConfig(same_ports, &error));

  ServerConfig tls_without_cert;
  tls_without_cert.tls.enabled = true;
  REQUIRE_FALSE(ValidateServerConfig(tls_without_cert, &error));

  ServerConfig bad_level;
  bad_level.logging.level = "chatty";
  REQUIRE_FALSE(ValidateServerConfig(bad_level, &error));
}

TEST_CASE("ValidateServerConfig only checks the services that run",
          "[config]") {
  ServerConfig relay_only;
  relay_only.role = ServiceRole::kRelay;
  relay_only.gateway.port = 0;
  std::string error;
  REQUIRE(ValidateServerConfig(relay_only, &error));
}

TEST_CASE("ParseServiceRole accepts the three roles", "[config]") {
  ServiceRole role = ServiceRole::kAll;
  REQUIRE(ParseServiceRole("Gateway", &role));
  REQUIRE(role == ServiceRole::kGateway);
  REQUIRE(ParseServiceRole("relay", &role));
  REQUIRE(std::string(ServiceRoleName(role)) == "relay");
  REQUIRE_FALSE(ParseServiceRole("proxy", &role));
}
