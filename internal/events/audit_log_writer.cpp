#include "audit_log_writer.hpp"

#include <stdexcept>

#include <google/protobuf/util/json_util.h>

namespace claims::events {

namespace {

claims::v1::EventKind KindToProto(EventKind kind) {
  // Wire enumerators are shifted by one for the UNSPECIFIED slot.
  return static_cast<claims::v1::EventKind>(static_cast<int>(kind) + 1);
}

claims::v1::ClaimStatus StatusToProto(model::ClaimStatus status) {
  return static_cast<claims::v1::ClaimStatus>(static_cast<int>(status));
}

} // namespace

claims::v1::ClaimEvent ToProto(const ClaimEvent& event) {
  claims::v1::ClaimEvent out;
  out.set_kind(KindToProto(event.kind));
  out.set_claim_id(event.claim_id);
  out.set_actor(event.actor);
  out.set_previous_status(StatusToProto(event.previous_status));
  out.set_new_status(StatusToProto(event.new_status));
  if (event.reason) out.set_reason(*event.reason);
  out.set_timestamp_ms(event.timestamp_ms);
  out.set_claim_version(event.claim_version);
  if (event.handoff_id) out.set_handoff_id(*event.handoff_id);
  if (event.previous_claimant) out.set_previous_claimant(*event.previous_claimant);
  return out;
}

std::string ToJsonLine(const ClaimEvent& event) {
  std::string json;
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;
#if GOOGLE_PROTOBUF_VERSION >= 5026000
  options.always_print_fields_with_no_presence = true;
#else
  options.always_print_primitive_fields = true;
#endif

  const auto status = google::protobuf::util::MessageToJsonString(ToProto(event), &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to encode claim event: " + std::string(status.message()));
  }
  return json;
}

AuditLogWriter::AuditLogWriter(std::string path) : path_(std::move(path)), out_(path_, std::ios::app) {
  if (!out_) {
    throw std::runtime_error("failed to open audit log: " + path_);
  }
}

AuditLogWriter::~AuditLogWriter() {
  Detach();
}

void AuditLogWriter::Attach(const std::shared_ptr<EventBus>& bus) {
  Detach();
  bus_          = bus;
  subscription_ = bus->Subscribe([this](const ClaimEvent& event) {
    Write(event);
  });
}

void AuditLogWriter::Detach() {
  if (auto bus = bus_.lock(); bus && subscription_ != 0) {
    bus->Unsubscribe(subscription_);
  }
  bus_.reset();
  subscription_ = 0;
}

void AuditLogWriter::Write(const ClaimEvent& event) {
  const auto      line = ToJsonLine(event);
  std::lock_guard lock(mutex_);
  out_ << line << '\n';
  out_.flush();
  if (!out_) {
    throw std::runtime_error("failed to append to audit log: " + path_);
  }
}

} // namespace claims::events
