#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/events/audit_log_writer.hpp"

namespace {

using claims::events::AuditLogWriter;
using claims::events::ClaimEvent;
using claims::events::EventBus;
using claims::events::EventKind;
using claims::model::ClaimStatus;

std::filesystem::path TempLog(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "claims_audit_log_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / (name + ".jsonl");
  std::filesystem::remove(path);
  return path;
}

std::vector<std::string> ReadLines(const std::filesystem::path& path) {
  std::ifstream            in(path);
  std::vector<std::string> lines;
  for (std::string line; std::getline(in, line);) lines.push_back(line);
  return lines;
}

ClaimEvent StolenEvent() {
  ClaimEvent event;
  event.kind              = EventKind::kStolen;
  event.claim_id          = "claim_1";
  event.actor             = "agent-2";
  event.previous_status   = ClaimStatus::kInProgress;
  event.new_status        = ClaimStatus::kClaimed;
  event.reason            = "stale";
  event.timestamp_ms      = 1234;
  event.claim_version     = 5;
  event.previous_claimant = "agent-1";
  return event;
}

void TestProtoMapping() {
  auto proto = claims::events::ToProto(StolenEvent());
  assert(proto.kind() == claims::v1::EVENT_KIND_STOLEN);
  assert(proto.previous_status() == claims::v1::CLAIM_STATUS_IN_PROGRESS);
  assert(proto.new_status() == claims::v1::CLAIM_STATUS_CLAIMED);
  assert(proto.has_reason() && proto.reason() == "stale");
  assert(!proto.has_handoff_id());
  assert(proto.has_previous_claimant() && proto.previous_claimant() == "agent-1");
  assert(proto.claim_version() == 5);
}

void TestJsonLineUsesFieldNames() {
  auto line = claims::events::ToJsonLine(StolenEvent());
  assert(line.find("\"claim_id\":\"claim_1\"") != std::string::npos);
  assert(line.find("EVENT_KIND_STOLEN") != std::string::npos);
  assert(line.find('\n') == std::string::npos);
}

void TestJsonLineKeepsDefaultValues() {
  ClaimEvent event;
  event.kind       = EventKind::kClaimed;
  event.claim_id   = "claim_2";
  event.actor      = "agent-1";
  event.new_status = ClaimStatus::kClaimed;

  auto line = claims::events::ToJsonLine(event);
  assert(line.find("\"previous_status\":\"CLAIM_STATUS_AVAILABLE\"") != std::string::npos);
  assert(line.find("\"timestamp_ms\"") != std::string::npos);
  assert(line.find("\"claim_version\"") != std::string::npos);
}

void TestWriterAppendsPublishedEvents() {
  const auto path = TempLog("append");
  auto       bus  = std::make_shared<EventBus>();
  {
    AuditLogWriter writer(path.string());
    writer.Attach(bus);
    bus->Publish(StolenEvent());

    auto handoff       = StolenEvent();
    handoff.kind       = EventKind::kHandoff;
    handoff.handoff_id = "handoff_1";
    bus->Publish(handoff);

    writer.Detach();
    bus->Publish(StolenEvent());
  }
  assert(bus->SubscriberCount() == 0);

  auto lines = ReadLines(path);
  assert(lines.size() == 2);
  assert(lines[1].find("\"handoff_id\":\"handoff_1\"") != std::string::npos);

  // reopening appends instead of truncating
  {
    AuditLogWriter writer(path.string());
    writer.Write(StolenEvent());
  }
  assert(ReadLines(path).size() == 3);
}

void TestUnwritablePathThrows() {
  bool threw = false;
  try {
    AuditLogWriter writer("/nonexistent-dir/claims/audit.jsonl");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestProtoMapping();
  TestJsonLineUsesFieldNames();
  TestJsonLineKeepsDefaultValues();
  TestWriterAppendsPublishedEvents();
  TestUnwritablePathThrows();

  std::cout << "claims_unit_audit_log_writer: pass\n";
  return 0;
}
