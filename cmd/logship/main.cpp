#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/transport/curl_http_client.hpp"

namespace {

std::string ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot open " + path);
  }
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  std::string event_path;
  if (argc == 3 && std::string(argv[1]).rfind("--", 0) != 0) {
    config_path = argv[1];
    event_path  = argv[2];
  } else if (argc == 5 && std::string(argv[1]) == "--config" && std::string(argv[3]) == "--event") {
    config_path = argv[2];
    event_path  = argv[4];
  } else {
    std::cerr << "Usage: logship <config.yaml> <event.json> OR logship --config <config.yaml> --event <event.json>"
              << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = logship::config::ConfigLoader::LoadFromYaml(config_path);
    logship::config::ConfigLoader::ApplyEnvironmentOverrides(&config);

    logship::observability::InitializeLogging(config);

    logship::transport::ScopeCurlInit curl_init;

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = logship::factory::Build(config);

    // ------------------------------------------------------------
    // Handle the invocation
    // ------------------------------------------------------------
    const auto event   = ReadFile(event_path);
    const auto summary = app.handler->Handle(event, app.context);

    logship::observability::ShutdownLogging();
    return summary.records_failed == 0 ? 0 : 2;
  } catch (const std::exception& e) {
    LOGSHIP_LOG_ERROR("Fatal error", {logship::observability::StringField("error", e.what())});
    logship::observability::ShutdownLogging();
    return 2;
  }
}
