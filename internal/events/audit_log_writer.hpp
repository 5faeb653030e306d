#pragma once

#include <fstream>
#include <memory>
#include <mutex>
#include <string>

#include "claims/v1.hpp"
#include "event_bus.hpp"

namespace claims::events {

// Maps a domain event onto its wire message.
claims::v1::ClaimEvent ToProto(const ClaimEvent& event);

std::string ToJsonLine(const ClaimEvent& event);

/*
  Appends every published event to a file as one JSON object per line.

  Attach() subscribes to the bus; the subscription is dropped on Detach()
  or destruction.
*/
class AuditLogWriter {
 public:
  explicit AuditLogWriter(std::string path);
  ~AuditLogWriter();

  AuditLogWriter(const AuditLogWriter&)            = delete;
  AuditLogWriter& operator=(const AuditLogWriter&) = delete;

  void Attach(const std::shared_ptr<EventBus>& bus);
  void Detach();

  void Write(const ClaimEvent& event);

  const std::string& Path() const {
    return path_;
  }

 private:
  std::string   path_;
  std::mutex    mutex_;
  std::ofstream out_;

  std::weak_ptr<EventBus>  bus_;
  EventBus::SubscriptionId subscription_ = 0;
};

} // namespace claims::events
