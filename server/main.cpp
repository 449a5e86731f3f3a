#include "net/http_client.h"
#include "server/backend/chat_backend.h"
#include "server/config/server_config.h"
#include "server/gateway/gateway_service.h"
#include "server/http/http_server.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"
#include "server/policy/history_sanitizer.h"
#include "server/policy/policy_classifier.h"
#include "server/policy/preflight_guard.h"
#include "server/policy/response_guard.h"
#include "server/policy/streaming_coordinator.h"
#include "server/relay/status_translator.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_running{true};

void SignalHandler(int) { g_running = false; }

void PrintUsage(const char* argv0) {
  std::cerr << "usage: " << argv0
            << " [--config PATH] [--role all|gateway|relay]" << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
  using namespace chatwarden;

  std::string config_path = "config/chatwarden.yaml";
  bool config_given = false;
  std::string role_override;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
      config_given = true;
    } else if (arg == "--role" && i + 1 < argc) {
      role_override = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      return 0;
    } else {
      PrintUsage(argv[0]);
      return 1;
    }
  }

  ServerConfig config;
  std::string error;
  if (!LoadServerConfig(config_path, config_given, &config, &error)) {
    log::Error("config", "Cannot load configuration", error);
    return 1;
  }
  if (!ApplyEnvOverrides(&config, &error)) {
    log::Error("config", "Invalid environment override", error);
    return 1;
  }
  if (!role_override.empty() && !ParseServiceRole(role_override, &config.role)) {
    log::Error("config", "Unknown role", role_override);
    return 1;
  }
  if (!ValidateServerConfig(config, &error)) {
    log::Error("config", "Invalid configuration", error);
    return 1;
  }

  log::Level level = log::Level::INFO;
  if (log::ParseLevel(config.logging.level, &level)) {
    log::SetMinLevel(level);
  }
  log::SetJsonMode(config.logging.format == "json");

  std::unique_ptr<PolicyClassifier> classifier;
  try {
    classifier = std::make_unique<PolicyClassifier>(config.policy.terms,
                                                    config.policy.patterns);
  } catch (const std::invalid_argument& ex) {
    log::Error("policy", "Invalid policy rule", ex.what());
    return 1;
  }
  if (!classifier->Enabled()) {
    log::Warn("policy", "No policy rules configured; nothing will be blocked");
  }

  log::StderrEventLog events;
  HttpClient http_client;
  const bool run_gateway = config.role != ServiceRole::kRelay;
  const bool run_relay = config.role != ServiceRole::kGateway;

  HistorySanitizer sanitizer(*classifier, &events);
  PreflightGuard preflight(*classifier, sanitizer,
                           config.policy.prompt_block_message, &events);
  ResponseGuard response_guard(*classifier, config.policy.reply_block_message,
                               &events);
  HttpChatBackend backend(&http_client,
                          {config.gateway.upstream_url,
                           config.gateway.upstream_api_key,
                           config.gateway.upstream_timeout_seconds});
  StreamingCoordinator coordinator(&backend, response_guard, &events);

  MetricsRegistry gateway_metrics("gateway");
  GatewayService gateway(&backend, preflight, coordinator,
                         config.policy.block_status, &gateway_metrics, &events);

  MetricsRegistry relay_metrics("relay");
  StatusTranslator relay(&http_client,
                         {config.relay.backend_url, config.policy.block_status,
                          config.relay.timeout_seconds},
                         &relay_metrics, &events);

  // TLS terminates on the client-facing listener: the relay when it runs,
  // the gateway otherwise.
  HttpServer::TlsConfig tls_config{config.tls.enabled, config.tls.cert_path,
                                   config.tls.key_path};
  HttpServer::TlsConfig no_tls;

  std::unique_ptr<HttpServer> gateway_server;
  std::unique_ptr<HttpServer> relay_server;
  if (run_gateway) {
    gateway_server = std::make_unique<HttpServer>(
        "gateway", config.gateway.host, config.gateway.port,
        [&gateway](const HttpRequest& request, ResponseWriter& writer) {
          gateway.Handle(request, writer);
        },
        run_relay ? no_tls : tls_config, config.http_workers);
  }
  if (run_relay) {
    relay_server = std::make_unique<HttpServer>(
        "relay", config.relay.host, config.relay.port,
        [&relay](const HttpRequest& request, ResponseWriter& writer) {
          relay.Handle(request, writer);
        },
        tls_config, config.http_workers);
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);
  std::signal(SIGPIPE, SIG_IGN);

  if (gateway_server && !gateway_server->Start()) {
    return 1;
  }
  if (relay_server && !relay_server->Start()) {
    if (gateway_server) {
      gateway_server->Stop();
    }
    return 1;
  }
  log::Info("main", "chatwarden started",
            std::string("role=") + ServiceRoleName(config.role) +
                " rules=" + std::to_string(classifier->RuleCount()) +
                " block_status=" + std::to_string(config.policy.block_status));

  while (g_running) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  if (relay_server) {
    relay_server->Stop();
  }
  if (gateway_server) {
    gateway_server->Stop();
  }
  log::Info("main", "chatwarden shutting down");
  return 0;
}
