#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/activity/activity_tracker.hpp"
#include "internal/coordination/expiry_sweeper.hpp"
#include "internal/coordination/work_stealing_coordinator.hpp"
#include "internal/db/api/claim_store.hpp"
#include "internal/events/audit_log_writer.hpp"
#include "internal/events/event_bus.hpp"
#include "internal/handoff/handoff_manager.hpp"
#include "internal/service/claim_service.hpp"
#include "internal/util/time.hpp"

namespace claims::factory {

/*
  Application

  Owns every long-lived component. Members are declared in dependency
  order so destruction stops the background cycles before the service
  and store they call go away.
*/
struct Application {
  std::shared_ptr<const util::TimeSource>    clock;
  std::shared_ptr<db::ClaimStore>            store;
  std::shared_ptr<events::EventBus>          bus;
  std::shared_ptr<activity::ActivityTracker> tracker;
  std::shared_ptr<service::ClaimService>     service;

  std::unique_ptr<events::AuditLogWriter> audit_log;
  std::unique_ptr<handoff::HandoffManager> handoffs;

  std::unique_ptr<coordination::WorkStealingCoordinator> coordinator;
  std::unique_ptr<coordination::ExpirySweeper>           sweeper;

  void Start();
  void Stop();
};

/*
  Build

  Composition root: the only place that knows concrete store types.
  The activity tracker is rehydrated from the store's active claims and
  started before Build returns; background cycles are left stopped.
*/
Application Build(const claims::runtime::config::RuntimeConfig& config, std::shared_ptr<const util::TimeSource> clock = nullptr);

std::shared_ptr<db::ClaimStore> BuildStore(const claims::runtime::config::RuntimeConfig& config);

} // namespace claims::factory
