#include "pg_claim_store.hpp"

#include <optional>

#include "internal/db/api/row_codec.hpp"

namespace claims::db::postgres {

namespace {

template <typename T>
std::optional<T> OptionalOf(bool present, T value) {
  if (!present) return std::nullopt;
  return value;
}

std::string Text(std::string_view value) {
  return std::string(value);
}

// Runs one of the statements taking the 27 claim columns as $1..$27.
template <typename... Extra>
pqxx::result ExecWithClaim(pqxx::work& w, const char* statement, const model::Claim& c, Extra&&... extra) {
  const bool has_claimant = c.claimant.has_value();
  const bool has_result   = c.result.has_value();

  return w.exec_prepared(statement, c.id, Text(model::ToString(c.type)), Text(model::ToString(c.status)), Text(model::ToString(c.priority)),
                         Text(model::ToString(c.severity)), c.domain, c.title, c.description, c.metadata,
                         OptionalOf(has_claimant, has_claimant ? c.claimant->id : std::string{}),
                         OptionalOf(has_claimant, has_claimant ? Text(model::ToString(c.claimant->kind)) : std::string{}),
                         OptionalOf(has_claimant, has_claimant ? c.claimant->name : std::string{}),
                         OptionalOf(has_claimant, has_claimant ? c.claimant->domain : std::string{}),
                         OptionalOf(has_claimant, has_claimant ? c.claimant->agent_type : std::string{}),
                         static_cast<int64_t>(c.claimed_at_ms), static_cast<int64_t>(c.last_activity_at_ms), static_cast<int64_t>(c.ttl_ms),
                         static_cast<int64_t>(c.created_at_ms), static_cast<int64_t>(c.updated_at_ms), static_cast<int>(c.steal_count),
                         c.correlation_id, c.blocked_reason, OptionalOf(has_result, has_result && c.result->success),
                         OptionalOf(has_result, has_result ? c.result->summary : std::string{}),
                         OptionalOf(has_result, has_result ? codec::JoinArtifacts(c.result->artifacts) : std::string{}),
                         OptionalOf(has_result, has_result ? static_cast<int64_t>(c.result->time_spent_ms) : int64_t{0}),
                         static_cast<int64_t>(c.version), std::forward<Extra>(extra)...);
}

uint64_t U64(const pqxx::field& f) {
  return static_cast<uint64_t>(f.as<int64_t>());
}

model::Claim ReadClaim(const pqxx::row& row) {
  model::Claim c;
  c.id          = row[0].c_str();
  c.type        = codec::DecodeType(row[1].c_str());
  c.status      = codec::DecodeStatus(row[2].c_str());
  c.priority    = codec::DecodePriority(row[3].c_str());
  c.severity    = codec::DecodeSeverity(row[4].c_str());
  c.domain      = row[5].c_str();
  c.title       = row[6].c_str();
  c.description = row[7].c_str();
  c.metadata    = row[8].c_str();
  if (!row[9].is_null()) {
    model::Claimant claimant;
    claimant.id         = row[9].c_str();
    claimant.kind       = codec::DecodeClaimantKind(row[10].c_str());
    claimant.name       = row[11].c_str();
    claimant.domain     = row[12].c_str();
    claimant.agent_type = row[13].c_str();
    c.claimant          = std::move(claimant);
  }
  c.claimed_at_ms       = U64(row[14]);
  c.last_activity_at_ms = U64(row[15]);
  c.ttl_ms              = U64(row[16]);
  c.created_at_ms       = U64(row[17]);
  c.updated_at_ms       = U64(row[18]);
  c.steal_count         = static_cast<uint32_t>(row[19].as<int>());
  c.correlation_id      = row[20].c_str();
  c.blocked_reason      = row[21].c_str();
  if (!row[22].is_null()) {
    model::ClaimResult result;
    result.success       = row[22].as<bool>();
    result.summary       = row[23].c_str();
    result.artifacts     = codec::SplitArtifacts(row[24].c_str());
    result.time_spent_ms = U64(row[25]);
    c.result             = std::move(result);
  }
  c.version = U64(row[26]);
  return c;
}

void LoadChildren(pqxx::work& w, model::Claim& claim) {
  for (const auto& row : w.exec_prepared("get_history", claim.id)) {
    model::HistoryEntry entry;
    entry.from_status  = codec::DecodeStatus(row[0].c_str());
    entry.to_status    = codec::DecodeStatus(row[1].c_str());
    entry.actor        = row[2].c_str();
    entry.reason       = row[3].c_str();
    entry.timestamp_ms      = U64(row[4]);
    entry.previous_claimant = row[5].c_str();
    claim.history.push_back(std::move(entry));
  }

  for (const auto& row : w.exec_prepared("get_previous_claimants", claim.id)) {
    model::Claimant claimant;
    claimant.id         = row[0].c_str();
    claimant.kind       = codec::DecodeClaimantKind(row[1].c_str());
    claimant.name       = row[2].c_str();
    claimant.domain     = row[3].c_str();
    claimant.agent_type = row[4].c_str();
    claim.previous_claimants.push_back(std::move(claimant));
  }

  for (const auto& row : w.exec_prepared("get_tags", claim.id)) {
    claim.tags.emplace_back(row[0].c_str());
  }
}

void WriteChildren(pqxx::work& w, const model::Claim& before, const model::Claim& after) {
  for (std::size_t seq = before.history.size(); seq < after.history.size(); ++seq) {
    const auto& entry = after.history[seq];
    w.exec_prepared("insert_history", after.id, static_cast<int>(seq), Text(model::ToString(entry.from_status)),
                    Text(model::ToString(entry.to_status)), entry.actor, entry.reason, static_cast<int64_t>(entry.timestamp_ms),
                    entry.previous_claimant);
  }

  if (before.previous_claimants != after.previous_claimants) {
    w.exec_prepared("clear_previous_claimants", after.id);
    for (std::size_t seq = 0; seq < after.previous_claimants.size(); ++seq) {
      const auto& claimant = after.previous_claimants[seq];
      w.exec_prepared("insert_previous_claimant", after.id, static_cast<int>(seq), claimant.id, Text(model::ToString(claimant.kind)),
                      claimant.name, claimant.domain, claimant.agent_type);
    }
  }

  if (before.tags != after.tags) {
    w.exec_prepared("clear_tags", after.id);
    for (std::size_t seq = 0; seq < after.tags.size(); ++seq) {
      w.exec_prepared("insert_tag", after.id, static_cast<int>(seq), after.tags[seq]);
    }
  }
}

std::vector<model::Claim> ReadAll(pqxx::work& w, const pqxx::result& res) {
  std::vector<model::Claim> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadClaim(row));
  for (auto& claim : out) LoadChildren(w, claim);
  return out;
}

} // namespace

PgClaimStore::PgClaimStore(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

Result PgClaimStore::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgClaimStore::Create(model::Claim& claim) {
  if (auto r = ValidateNewClaim(claim); !r) return r;

  claim.status  = model::ClaimStatus::kAvailable;
  claim.version = 1;
  claim.history.clear();

  try {
    PgTransaction tx(pool_);
    ExecWithClaim(tx.Work(), "insert_claim", claim);
    WriteChildren(tx.Work(), model::Claim{}, claim);
    tx.Commit();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::Claim> PgClaimStore::Get(const std::string& id) {
  PgTransaction tx(pool_);
  auto          res = tx.Work().exec_prepared("get_claim", id);
  if (res.empty()) return std::nullopt;

  auto claim = ReadClaim(res[0]);
  LoadChildren(tx.Work(), claim);
  tx.Commit();
  return claim;
}

Result PgClaimStore::Update(const std::string& id, uint64_t expected_version, const Mutation& mutation, model::Claim& out) {
  try {
    PgTransaction tx(pool_);
    auto&         w   = tx.Work();
    auto          res = w.exec_prepared("get_claim_for_update", id);
    if (res.empty()) return Result::Err(ErrorCode::NotFound, "claim not found: " + id);

    auto current = ReadClaim(res[0]);
    LoadChildren(w, current);
    if (current.version != expected_version) {
      out = std::move(current);
      return Result::Err(ErrorCode::Conflict, "claim version changed concurrently");
    }

    model::Claim working = current;
    mutation(working);
    if (auto r = ValidateMutation(current, working); !r) return r;
    working.version = expected_version + 1;

    auto updated = ExecWithClaim(w, "update_claim", working, static_cast<int64_t>(expected_version));
    if (updated.affected_rows() != 1) {
      out = std::move(current);
      return Result::Err(ErrorCode::Conflict, "claim version changed concurrently");
    }

    WriteChildren(w, current, working);
    tx.Commit();
    out = std::move(working);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::Claim> PgClaimStore::List(const ClaimFilter& filter) {
  PgTransaction tx(pool_);
  auto          all = ReadAll(tx.Work(), tx.Work().exec_prepared("list_claims"));
  tx.Commit();

  std::vector<model::Claim> out;
  for (auto& claim : all) {
    if (Matches(claim, filter)) out.push_back(std::move(claim));
  }
  SortAndLimit(out, filter.limit);
  return out;
}

std::vector<model::Claim> PgClaimStore::FindStale(uint64_t now_ms) {
  PgTransaction tx(pool_);
  auto          candidates = ReadAll(tx.Work(), tx.Work().exec_prepared("find_stale_claims", static_cast<int64_t>(now_ms)));
  tx.Commit();

  std::vector<model::Claim> out;
  for (auto& claim : candidates) {
    if (model::IsStaleAt(claim, now_ms)) out.push_back(std::move(claim));
  }
  SortAndLimit(out, 0);
  return out;
}

std::size_t PgClaimStore::Count(const ClaimFilter& filter) {
  return List(filter).size();
}

Result PgClaimStore::Delete(const std::string& id) {
  try {
    PgTransaction tx(pool_);
    auto          res = tx.Work().exec_prepared("delete_claim", id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "claim not found: " + id);
    tx.Commit();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace claims::db::postgres
