#include "app_context.hpp"
#include "config.hpp"
#include "mdns_browse.hpp"
#include "subnet_probe.hpp"
#include "wled_bridge.hpp"
#include "wled_client/http_transport.hpp"
#include "wled_discovery.hpp"
#include <csignal>
#include <memory>
#include <string>

static constexpr const char* DEFAULT_CONFIG_PATH = "wled_bridge.json";

int main(int argc, char** argv) {
  const std::string config_path = argc > 1 ? argv[1] : DEFAULT_CONFIG_PATH;

  // Block termination signals before any thread starts so only sigwait sees them.
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);

  AppContext ctx;
  auto log = ctx.logger("main");

  AppConfig cfg{};
  if (!config_load(config_path, cfg, *ctx.logger("config"))) {
    log->warn("Continuing with default configuration");
  }
  if (!ctx.configure(cfg.logging)) {
    log->warn("Log file {} unavailable: {}", cfg.logging.file, ctx.file_error());
  }

  log->info("wled_bridge starting, config {}", config_path);

  auto transport = std::make_shared<CurlHttpTransport>();

  SubnetProbeOptions probe_options{};
  probe_options.probe_timeout_ms = cfg.discovery.probe_timeout_ms;
  probe_options.workers = cfg.discovery.workers;
  probe_options.retry_workers = cfg.discovery.retry_workers;

  auto browser = std::make_shared<MdnsBrowser>(ctx.logger("mdns"));
  auto prober = std::make_shared<SubnetProber>(transport, probe_options, ctx.logger("subnet_probe"));
  auto discovery = std::make_shared<WledDiscovery>(browser, prober, ctx.logger("wled_scan"));

  WledBridge bridge(cfg, ctx, transport, discovery);
  bridge.set_name_list_sink([log](const WledPresetMap& presets) {
    for (const auto& entry : presets) {
      log->info("Preset {} = {}", entry.first, entry.second);
    }
  });
  bridge.start();

  for (const auto& snap : bridge.snapshot()) {
    if (snap.online && snap.info) {
      log->info("{} ({}:{}) WLED {} with {} LEDs", snap.name, snap.endpoint.host, snap.endpoint.port,
                snap.info->version, snap.info->led_count);
    } else {
      log->warn("{} ({}:{}) offline: {}", snap.name, snap.endpoint.host, snap.endpoint.port,
                snap.error.describe());
    }
  }

  int received = 0;
  if (sigwait(&signals, &received) != 0) {
    log->error("sigwait failed, shutting down");
  } else {
    log->info("Signal {} received, shutting down", received);
  }
  bridge.stop();
  return 0;
}
