#include "factory.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/transport/curl_http_client.hpp"
#include "internal/trigger/directory_object_source.hpp"

namespace logship::factory {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

Application Build(const logship::runtime::config::RuntimeConfig& config, Collaborators collaborators) {
  Application app;

  // ------------------------------------------------------------------
  // Read-only settings
  // ------------------------------------------------------------------
  app.settings = config::ResolveDeliverySettings(config);
  app.context  = config::ResolveInvocationContext(config);

  // ------------------------------------------------------------------
  // Transport
  // ------------------------------------------------------------------
  if (!collaborators.http) {
    collaborators.http =
        std::make_shared<transport::CurlHttpClient>(app.settings.connect_timeout, app.settings.request_timeout);
  }
  if (!collaborators.sleeper) {
    collaborators.sleeper = std::make_shared<transport::ThreadSleeper>();
  }
  app.transport = std::make_shared<transport::IngestTransport>(app.settings, std::move(collaborators.http),
                                                               std::move(collaborators.sleeper));

  // ------------------------------------------------------------------
  // Pipeline
  // ------------------------------------------------------------------
  app.dispatcher = std::make_shared<dispatch::Dispatcher>(app.transport, app.settings.max_payload_bytes);

  if (!collaborators.objects) {
    const auto& root = config.objects().root_directory();
    collaborators.objects = std::make_shared<trigger::DirectoryObjectSource>(root.empty() ? "." : root);
  }
  app.handler = std::make_shared<trigger::InvocationHandler>(app.dispatcher, std::move(collaborators.objects),
                                                             app.settings.continue_on_record_failure);

  LOGSHIP_LOG_INFO("Delivery configured",
                   {StringField("ingest_host", app.settings.ingest_host),
                    IntField("max_payload_bytes", static_cast<std::int64_t>(app.settings.max_payload_bytes)),
                    IntField("max_attempts", app.settings.retry.max_attempts),
                    BoolField("continue_on_record_failure", app.settings.continue_on_record_failure),
                    StringField("function_name", app.context.function_name())});
  return app;
}

} // namespace logship::factory
