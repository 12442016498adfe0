#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/config/delivery_settings.hpp"
#include "internal/dispatch/dispatcher.hpp"
#include "internal/transport/http_client.hpp"
#include "internal/transport/ingest_transport.hpp"
#include "internal/transport/sleeper.hpp"
#include "internal/trigger/invocation_handler.hpp"
#include "internal/trigger/object_source.hpp"
#include "logship/v1/envelope.pb.h"

namespace logship::factory {

/*
  Seams the composition root would otherwise fill with production
  implementations (libcurl, thread sleep, local object directory).
*/
struct Collaborators {
  std::shared_ptr<transport::HttpClient>  http;
  std::shared_ptr<transport::Sleeper>     sleeper;
  std::shared_ptr<trigger::ObjectSource> objects;
};

/*
  Application

  Everything one invocation needs, wired once at startup. The settings
  and invocation context are read-only from here on.
*/
struct Application {
  config::DeliverySettings       settings;
  logship::v1::InvocationContext context;

  std::shared_ptr<transport::IngestTransport> transport;
  std::shared_ptr<dispatch::Dispatcher>       dispatcher;
  std::shared_ptr<trigger::InvocationHandler> handler;
};

/*
  Build

  Composition root of the application; the only place that knows
  concrete transport and object-source types. Throws util::ConfigError
  for invalid configuration.
*/
Application Build(const logship::runtime::config::RuntimeConfig& config, Collaborators collaborators = {});

} // namespace logship::factory
