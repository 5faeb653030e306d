#include "sqlite_claim_store.hpp"

#include <exception>

#include "internal/db/api/row_codec.hpp"

namespace claims::db::sqlite {

namespace {

constexpr const char* kSelectClaim =
    "SELECT id,type,status,priority,severity,domain,title,description,metadata,"
    "claimant_id,claimant_kind,claimant_name,claimant_domain,claimant_agent_type,"
    "claimed_at_ms,last_activity_at_ms,ttl_ms,created_at_ms,updated_at_ms,steal_count,correlation_id,blocked_reason,"
    "result_success,result_summary,result_artifacts,result_time_spent_ms,version FROM claims";

constexpr const char* kInsertClaim =
    "INSERT INTO claims(id,type,status,priority,severity,domain,title,description,metadata,"
    "claimant_id,claimant_kind,claimant_name,claimant_domain,claimant_agent_type,"
    "claimed_at_ms,last_activity_at_ms,ttl_ms,created_at_ms,updated_at_ms,steal_count,correlation_id,blocked_reason,"
    "result_success,result_summary,result_artifacts,result_time_spent_ms,version) "
    "VALUES(?1,?2,?3,?4,?5,?6,?7,?8,?9,?10,?11,?12,?13,?14,?15,?16,?17,?18,?19,?20,?21,?22,?23,?24,?25,?26,?27);";

constexpr const char* kUpdateClaim =
    "UPDATE claims SET type=?2,status=?3,priority=?4,severity=?5,domain=?6,title=?7,description=?8,metadata=?9,"
    "claimant_id=?10,claimant_kind=?11,claimant_name=?12,claimant_domain=?13,claimant_agent_type=?14,"
    "claimed_at_ms=?15,last_activity_at_ms=?16,ttl_ms=?17,created_at_ms=?18,updated_at_ms=?19,steal_count=?20,"
    "correlation_id=?21,blocked_reason=?22,result_success=?23,result_summary=?24,result_artifacts=?25,"
    "result_time_spent_ms=?26,version=?27 WHERE id=?1 AND version=?28;";

void BindClaim(SqliteStatement& st, const model::Claim& c) {
  st.BindText(1, c.id);
  st.BindText(2, std::string(model::ToString(c.type)));
  st.BindText(3, std::string(model::ToString(c.status)));
  st.BindText(4, std::string(model::ToString(c.priority)));
  st.BindText(5, std::string(model::ToString(c.severity)));
  st.BindText(6, c.domain);
  st.BindText(7, c.title);
  st.BindText(8, c.description);
  st.BindText(9, c.metadata);
  if (c.claimant) {
    st.BindText(10, c.claimant->id);
    st.BindText(11, std::string(model::ToString(c.claimant->kind)));
    st.BindText(12, c.claimant->name);
    st.BindText(13, c.claimant->domain);
    st.BindText(14, c.claimant->agent_type);
  } else {
    for (int idx = 10; idx <= 14; ++idx) st.BindNull(idx);
  }
  st.BindU64(15, c.claimed_at_ms);
  st.BindU64(16, c.last_activity_at_ms);
  st.BindU64(17, c.ttl_ms);
  st.BindU64(18, c.created_at_ms);
  st.BindU64(19, c.updated_at_ms);
  st.BindU64(20, c.steal_count);
  st.BindText(21, c.correlation_id);
  st.BindText(22, c.blocked_reason);
  if (c.result) {
    st.BindI64(23, c.result->success ? 1 : 0);
    st.BindText(24, c.result->summary);
    st.BindText(25, codec::JoinArtifacts(c.result->artifacts));
    st.BindU64(26, c.result->time_spent_ms);
  } else {
    for (int idx = 23; idx <= 26; ++idx) st.BindNull(idx);
  }
  st.BindU64(27, c.version);
}

model::Claim ReadClaim(const SqliteStatement& st) {
  model::Claim c;
  c.id          = st.ColText(0);
  c.type        = codec::DecodeType(st.ColText(1));
  c.status      = codec::DecodeStatus(st.ColText(2));
  c.priority    = codec::DecodePriority(st.ColText(3));
  c.severity    = codec::DecodeSeverity(st.ColText(4));
  c.domain      = st.ColText(5);
  c.title       = st.ColText(6);
  c.description = st.ColText(7);
  c.metadata    = st.ColText(8);
  if (!st.ColIsNull(9)) {
    model::Claimant claimant;
    claimant.id         = st.ColText(9);
    claimant.kind       = codec::DecodeClaimantKind(st.ColText(10));
    claimant.name       = st.ColText(11);
    claimant.domain     = st.ColText(12);
    claimant.agent_type = st.ColText(13);
    c.claimant          = std::move(claimant);
  }
  c.claimed_at_ms       = st.ColU64(14);
  c.last_activity_at_ms = st.ColU64(15);
  c.ttl_ms              = st.ColU64(16);
  c.created_at_ms       = st.ColU64(17);
  c.updated_at_ms       = st.ColU64(18);
  c.steal_count         = static_cast<uint32_t>(st.ColU64(19));
  c.correlation_id      = st.ColText(20);
  c.blocked_reason      = st.ColText(21);
  if (!st.ColIsNull(22)) {
    model::ClaimResult result;
    result.success       = st.ColU64(22) != 0;
    result.summary       = st.ColText(23);
    result.artifacts     = codec::SplitArtifacts(st.ColText(24));
    result.time_spent_ms = st.ColU64(25);
    c.result             = std::move(result);
  }
  c.version = st.ColU64(26);
  return c;
}

Result Translate(const std::exception& e) {
  if (const auto* sqlite_error = dynamic_cast<const SqliteError*>(&e)) {
    if (sqlite_error->IsBusy()) return Result::Err(ErrorCode::Busy, e.what());
    if (sqlite_error->IsConstraint()) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

bool SameClaimants(const std::vector<model::Claimant>& lhs, const std::vector<model::Claimant>& rhs) {
  return lhs == rhs;
}

} // namespace

SqliteClaimStore::SqliteClaimStore(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

void SqliteClaimStore::LoadChildren(model::Claim& claim) {
  auto* db = db_->Handle();

  SqliteStatement history(db, "SELECT from_status,to_status,actor,reason,timestamp_ms,previous_claimant FROM claim_history WHERE claim_id=? ORDER BY seq;");
  history.BindText(1, claim.id);
  while (history.Step()) {
    model::HistoryEntry entry;
    entry.from_status  = codec::DecodeStatus(history.ColText(0));
    entry.to_status    = codec::DecodeStatus(history.ColText(1));
    entry.actor        = history.ColText(2);
    entry.reason       = history.ColText(3);
    entry.timestamp_ms      = history.ColU64(4);
    entry.previous_claimant = history.ColText(5);
    claim.history.push_back(std::move(entry));
  }

  SqliteStatement previous(db, "SELECT claimant_id,kind,name,domain,agent_type FROM claim_previous_claimants WHERE claim_id=? ORDER BY seq;");
  previous.BindText(1, claim.id);
  while (previous.Step()) {
    model::Claimant claimant;
    claimant.id         = previous.ColText(0);
    claimant.kind       = codec::DecodeClaimantKind(previous.ColText(1));
    claimant.name       = previous.ColText(2);
    claimant.domain     = previous.ColText(3);
    claimant.agent_type = previous.ColText(4);
    claim.previous_claimants.push_back(std::move(claimant));
  }

  SqliteStatement tags(db, "SELECT tag FROM claim_tags WHERE claim_id=? ORDER BY seq;");
  tags.BindText(1, claim.id);
  while (tags.Step()) claim.tags.push_back(tags.ColText(0));
}

// Appends only the new history rows; previous claimants and tags are rewritten when changed.
void SqliteClaimStore::WriteChildren(const model::Claim& before, const model::Claim& after) {
  auto* db = db_->Handle();

  for (std::size_t seq = before.history.size(); seq < after.history.size(); ++seq) {
    const auto&     entry = after.history[seq];
    SqliteStatement st(db, "INSERT INTO claim_history(claim_id,seq,from_status,to_status,actor,reason,timestamp_ms,previous_claimant) "
                              "VALUES(?,?,?,?,?,?,?,?);");
    st.BindText(1, after.id);
    st.BindU64(2, seq);
    st.BindText(3, std::string(model::ToString(entry.from_status)));
    st.BindText(4, std::string(model::ToString(entry.to_status)));
    st.BindText(5, entry.actor);
    st.BindText(6, entry.reason);
    st.BindU64(7, entry.timestamp_ms);
    st.BindText(8, entry.previous_claimant);
    st.Run();
  }

  if (!SameClaimants(before.previous_claimants, after.previous_claimants)) {
    SqliteStatement clear(db, "DELETE FROM claim_previous_claimants WHERE claim_id=?;");
    clear.BindText(1, after.id);
    clear.Run();
    for (std::size_t seq = 0; seq < after.previous_claimants.size(); ++seq) {
      const auto&     claimant = after.previous_claimants[seq];
      SqliteStatement st(db, "INSERT INTO claim_previous_claimants(claim_id,seq,claimant_id,kind,name,domain,agent_type) VALUES(?,?,?,?,?,?,?);");
      st.BindText(1, after.id);
      st.BindU64(2, seq);
      st.BindText(3, claimant.id);
      st.BindText(4, std::string(model::ToString(claimant.kind)));
      st.BindText(5, claimant.name);
      st.BindText(6, claimant.domain);
      st.BindText(7, claimant.agent_type);
      st.Run();
    }
  }

  if (before.tags != after.tags) {
    SqliteStatement clear(db, "DELETE FROM claim_tags WHERE claim_id=?;");
    clear.BindText(1, after.id);
    clear.Run();
    for (std::size_t seq = 0; seq < after.tags.size(); ++seq) {
      SqliteStatement st(db, "INSERT INTO claim_tags(claim_id,seq,tag) VALUES(?,?,?);");
      st.BindText(1, after.id);
      st.BindU64(2, seq);
      st.BindText(3, after.tags[seq]);
      st.Run();
    }
  }
}

std::optional<model::Claim> SqliteClaimStore::Load(const std::string& id) {
  const std::string sql = std::string(kSelectClaim) + " WHERE id=?;";
  SqliteStatement   st(db_->Handle(), sql.c_str());
  st.BindText(1, id);
  if (!st.Step()) return std::nullopt;

  auto claim = ReadClaim(st);
  LoadChildren(claim);
  return claim;
}

std::vector<model::Claim> SqliteClaimStore::Query(const char* where, uint64_t now_ms) {
  const std::string sql = std::string(kSelectClaim) + where;
  SqliteStatement   st(db_->Handle(), sql.c_str());
  if (now_ms > 0) st.BindU64(1, now_ms);

  std::vector<model::Claim> out;
  while (st.Step()) out.push_back(ReadClaim(st));
  for (auto& claim : out) LoadChildren(claim);
  return out;
}

Result SqliteClaimStore::Create(model::Claim& claim) {
  if (auto r = ValidateNewClaim(claim); !r) return r;

  claim.status  = model::ClaimStatus::kAvailable;
  claim.version = 1;
  claim.history.clear();

  std::lock_guard lock(mutex_);
  try {
    SqliteTransaction tx(*db_);
    if (Load(claim.id)) return Result::Err(ErrorCode::AlreadyExists, "claim already exists: " + claim.id);

    SqliteStatement st(db_->Handle(), kInsertClaim);
    BindClaim(st, claim);
    st.Run();

    model::Claim empty;
    WriteChildren(empty, claim);
    tx.Commit();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::Claim> SqliteClaimStore::Get(const std::string& id) {
  std::lock_guard lock(mutex_);
  return Load(id);
}

Result SqliteClaimStore::Update(const std::string& id, uint64_t expected_version, const Mutation& mutation, model::Claim& out) {
  std::lock_guard lock(mutex_);
  try {
    SqliteTransaction tx(*db_);

    auto current = Load(id);
    if (!current) return Result::Err(ErrorCode::NotFound, "claim not found: " + id);
    if (current->version != expected_version) {
      out = *current;
      return Result::Err(ErrorCode::Conflict, "claim version changed concurrently");
    }

    model::Claim working = *current;
    mutation(working);
    if (auto r = ValidateMutation(*current, working); !r) return r;
    working.version = expected_version + 1;

    SqliteStatement st(db_->Handle(), kUpdateClaim);
    BindClaim(st, working);
    st.BindU64(28, expected_version);
    st.Run();
    if (sqlite3_changes(db_->Handle()) != 1) {
      out = *current;
      return Result::Err(ErrorCode::Conflict, "claim version changed concurrently");
    }

    WriteChildren(*current, working);
    tx.Commit();
    out = std::move(working);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::Claim> SqliteClaimStore::List(const ClaimFilter& filter) {
  std::vector<model::Claim> all;
  {
    std::lock_guard lock(mutex_);
    all = Query(";", 0);
  }

  std::vector<model::Claim> out;
  for (auto& claim : all) {
    if (Matches(claim, filter)) out.push_back(std::move(claim));
  }
  SortAndLimit(out, filter.limit);
  return out;
}

std::vector<model::Claim> SqliteClaimStore::FindStale(uint64_t now_ms) {
  std::vector<model::Claim> candidates;
  {
    std::lock_guard lock(mutex_);
    candidates = Query(" WHERE status IN ('claimed','in-progress','blocked') AND ?1 > last_activity_at_ms "
                       "AND ?1 - last_activity_at_ms > ttl_ms;",
                       now_ms);
  }

  std::vector<model::Claim> out;
  for (auto& claim : candidates) {
    if (model::IsStaleAt(claim, now_ms)) out.push_back(std::move(claim));
  }
  SortAndLimit(out, 0);
  return out;
}

std::size_t SqliteClaimStore::Count(const ClaimFilter& filter) {
  return List(filter).size();
}

Result SqliteClaimStore::Delete(const std::string& id) {
  std::lock_guard lock(mutex_);
  try {
    SqliteTransaction tx(*db_);
    SqliteStatement   st(db_->Handle(), "DELETE FROM claims WHERE id=?;");
    st.BindText(1, id);
    st.Run();
    if (sqlite3_changes(db_->Handle()) == 0) return Result::Err(ErrorCode::NotFound, "claim not found: " + id);
    tx.Commit();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace claims::db::sqlite
