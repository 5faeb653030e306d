#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/claim_store.hpp"
#include "internal/db/memory/memory_claim_store.hpp"

#if CLAIMS_DB_SQLITE
#include "internal/db/sqlite/sqlite_claim_store.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

#if CLAIMS_DB_POSTGRES
#include "internal/db/postgres/pg_claim_store.hpp"
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_schema.hpp"
#endif

namespace {

using claims::db::ClaimFilter;
using claims::db::ClaimStore;
using claims::db::ErrorCode;
using claims::db::memory::MemoryClaimStore;
using claims::model::Claim;
using claims::model::Claimant;
using claims::model::ClaimantKind;
using claims::model::ClaimStatus;
using claims::model::Priority;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<ClaimStore>()>      make_store;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<ClaimStore>&)> restart;
  std::function<void()>                             cleanup;
};

// Backends may be shared between runs (postgres), so every claim lives in a run-unique domain.
struct Run {
  std::string prefix;
  std::string domain;
};

Claim MakeClaim(const Run& run, const std::string& suffix, Priority priority, uint64_t created_at_ms) {
  Claim claim;
  claim.id                  = run.prefix + suffix;
  claim.title               = "triage " + suffix;
  claim.description         = "parity fixture";
  claim.domain              = run.domain;
  claim.priority            = priority;
  claim.metadata            = R"({"suite":"parity"})";
  claim.created_at_ms       = created_at_ms;
  claim.updated_at_ms       = created_at_ms;
  claim.last_activity_at_ms = created_at_ms;
  claim.correlation_id      = run.prefix + "corr";
  return claim;
}

Claimant Agent(const std::string& id, const std::string& domain) {
  return Claimant{id, ClaimantKind::kAgent, "agent " + id, domain, "coder"};
}

claims::db::Mutation Take(const Claimant& claimant, uint64_t now_ms, uint64_t ttl_ms) {
  return [=](Claim& c) {
    c.history.push_back({c.status, ClaimStatus::kClaimed, claimant.id, "claim", now_ms});
    c.status              = ClaimStatus::kClaimed;
    c.claimant            = claimant;
    c.claimed_at_ms       = now_ms;
    c.last_activity_at_ms = now_ms;
    c.updated_at_ms       = now_ms;
    c.ttl_ms              = ttl_ms;
  };
}

void VerifyCreateAndGet(ClaimStore& store, const Run& run) {
  auto claim = MakeClaim(run, "create", Priority::kP1, 1000);
  claim.tags = {"flaky", "ci"};
  assert(store.Create(claim));
  assert(claim.version == 1);

  auto loaded = store.Get(claim.id);
  assert(loaded.has_value());
  assert(loaded->status == ClaimStatus::kAvailable);
  assert(loaded->title == claim.title);
  assert(loaded->metadata == claim.metadata);
  assert(loaded->tags == claim.tags);
  assert(loaded->correlation_id == claim.correlation_id);
  assert(!loaded->claimant.has_value());
  assert(!loaded->result.has_value());
  assert(loaded->history.empty());

  auto duplicate = MakeClaim(run, "create", Priority::kP1, 1000);
  assert(store.Create(duplicate).code == ErrorCode::AlreadyExists);

  auto untitled = MakeClaim(run, "untitled", Priority::kP1, 1000);
  untitled.title.clear();
  assert(store.Create(untitled).code == ErrorCode::ConstraintViolation);

  assert(!store.Get(run.prefix + "missing").has_value());
}

void VerifyCompareAndSet(ClaimStore& store, const Run& run) {
  auto claim = MakeClaim(run, "cas", Priority::kP2, 1000);
  assert(store.Create(claim));

  Claim out;
  assert(store.Update(claim.id, 1, Take(Agent("agent-1", run.domain), 2000, 500), out));
  assert(out.version == 2);
  assert(out.IsOwnedBy("agent-1"));

  Claim snapshot;
  auto  lost = store.Update(claim.id, 1, Take(Agent("agent-2", run.domain), 2100, 500), snapshot);
  assert(lost.code == ErrorCode::Conflict);
  assert(snapshot.version == 2);
  assert(snapshot.IsOwnedBy("agent-1"));

  auto illegal = store.Update(
      claim.id, 2,
      [](Claim& c) {
        c.history.push_back({c.status, ClaimStatus::kReleased, "agent-1", "release", 2200});
        c.status = ClaimStatus::kReleased;
      },
      out);
  assert(illegal.code == ErrorCode::ConstraintViolation);

  auto rewritten = store.Update(claim.id, 2, [](Claim& c) { c.history.front().reason = "edited"; }, out);
  assert(rewritten.code == ErrorCode::ConstraintViolation);

  auto stored = store.Get(claim.id);
  assert(stored->version == 2);
  assert(stored->history.size() == 1);
  assert(stored->history.front().reason == "claim");

  Claim missing;
  assert(store.Update(run.prefix + "nope", 1, Take(Agent("agent-1", run.domain), 2000, 500), missing).code == ErrorCode::NotFound);
}

void VerifyFullLifecycleRoundTrip(ClaimStore& store, const Run& run) {
  auto claim = MakeClaim(run, "lifecycle", Priority::kP0, 1000);
  assert(store.Create(claim));

  const auto first  = Agent("agent-1", run.domain);
  const auto second = Agent("agent-2", run.domain);

  Claim out;
  assert(store.Update(claim.id, 1, Take(first, 2000, 500), out));
  assert(store.Update(
      claim.id, out.version,
      [](Claim& c) {
        c.history.push_back({c.status, ClaimStatus::kInProgress, "agent-1", "start", 2100});
        c.status              = ClaimStatus::kInProgress;
        c.last_activity_at_ms = 2100;
      },
      out));
  assert(store.Update(
      claim.id, out.version,
      [=](Claim& c) {
        c.previous_claimants.push_back(*c.claimant);
        c.history.push_back({c.status, ClaimStatus::kClaimed, "agent-2", "stale", 3000, c.claimant->id});
        c.status              = ClaimStatus::kClaimed;
        c.claimant            = second;
        c.claimed_at_ms       = 3000;
        c.last_activity_at_ms = 3000;
        c.steal_count += 1;
        c.tags.push_back("stolen");
      },
      out));
  assert(store.Update(
      claim.id, out.version,
      [](Claim& c) {
        c.history.push_back({c.status, ClaimStatus::kCompleted, "agent-2", "done", 3500});
        c.status              = ClaimStatus::kCompleted;
        c.last_activity_at_ms = 3500;
        c.result              = claims::model::ClaimResult{true, "fixed the race", {"pr/17", "log.txt"}, 1500};
      },
      out));

  auto stored = store.Get(claim.id);
  assert(stored.has_value());
  assert(stored->version == 5);
  assert(stored->status == ClaimStatus::kCompleted);
  assert(stored->steal_count == 1);
  assert(stored->IsOwnedBy("agent-2"));
  assert(stored->claimant->agent_type == "coder");
  assert(stored->previous_claimants.size() == 1);
  assert(stored->previous_claimants.front() == first);
  assert(stored->tags.size() == 1);
  assert(stored->tags.front() == "stolen");

  assert(stored->history.size() == 4);
  assert(stored->history[0].to_status == ClaimStatus::kClaimed);
  assert(stored->history[1].to_status == ClaimStatus::kInProgress);
  assert(stored->history[2].actor == "agent-2");
  assert(stored->history[2].previous_claimant == "agent-1");
  assert(stored->history[1].previous_claimant.empty());
  assert(stored->history[3].to_status == ClaimStatus::kCompleted);
  assert(stored->history[3].timestamp_ms == 3500);

  assert(stored->result.has_value());
  assert(stored->result->success);
  assert(stored->result->summary == "fixed the race");
  assert(stored->result->artifacts.size() == 2);
  assert(stored->result->artifacts[1] == "log.txt");
  assert(stored->result->time_spent_ms == 1500);
}

void VerifyListAndCount(ClaimStore& store, const Run& run) {
  auto low   = MakeClaim(run, "list-low", Priority::kP3, 1000);
  auto late  = MakeClaim(run, "list-late", Priority::kP0, 3000);
  auto early = MakeClaim(run, "list-early", Priority::kP0, 2000);
  late.tags  = {"ui"};
  early.tags = {"ui", "api"};
  assert(store.Create(low));
  assert(store.Create(late));
  assert(store.Create(early));

  Claim out;
  assert(store.Update(low.id, 1, Take(Agent("agent-9", run.domain), 4000, 500), out));

  ClaimFilter in_domain;
  in_domain.domain = run.domain;
  auto all         = store.List(in_domain);
  assert(all.size() >= 3);

  std::vector<std::string> listed;
  for (const auto& claim : all) {
    if (claim.id == low.id || claim.id == late.id || claim.id == early.id) listed.push_back(claim.id);
  }
  assert(listed.size() == 3);
  assert(listed[0] == early.id);
  assert(listed[1] == late.id);
  assert(listed[2] == low.id);

  ClaimFilter tagged = in_domain;
  tagged.tags        = {"ui", "api"};
  auto api_ui        = store.List(tagged);
  assert(api_ui.size() == 1);
  assert(api_ui.front().id == early.id);

  ClaimFilter held = in_domain;
  held.claimant_id = "agent-9";
  assert(store.Count(held) == 1);

  ClaimFilter claimed = in_domain;
  claimed.status      = ClaimStatus::kClaimed;
  claimed.priority    = Priority::kP3;
  assert(store.Count(claimed) == 1);

  ClaimFilter limited = in_domain;
  limited.limit       = 2;
  assert(store.List(limited).size() == 2);
}

void VerifyFindStale(ClaimStore& store, const Run& run) {
  const uint64_t base = 10'000'000;

  auto quiet  = MakeClaim(run, "stale-quiet", Priority::kP2, base);
  auto busy   = MakeClaim(run, "stale-busy", Priority::kP2, base);
  auto border = MakeClaim(run, "stale-border", Priority::kP2, base);
  assert(store.Create(quiet));
  assert(store.Create(busy));
  assert(store.Create(border));

  Claim out;
  assert(store.Update(quiet.id, 1, Take(Agent("agent-q", run.domain), base, 1000), out));
  assert(store.Update(busy.id, 1, Take(Agent("agent-b", run.domain), base + 900, 1000), out));
  assert(store.Update(border.id, 1, Take(Agent("agent-e", run.domain), base + 500, 1000), out));

  auto contains = [](const std::vector<Claim>& claims, const std::string& id) {
    for (const auto& claim : claims) {
      if (claim.id == id) return true;
    }
    return false;
  };

  // silence exactly equal to the TTL is not stale
  auto stale = store.FindStale(base + 1500);
  assert(contains(stale, quiet.id));
  assert(!contains(stale, busy.id));
  assert(!contains(stale, border.id));

  stale = store.FindStale(base + 1501);
  assert(contains(stale, border.id));
  for (const auto& claim : stale) assert(claims::model::IsStaleAt(claim, base + 1501));
}

void VerifyDelete(ClaimStore& store, const Run& run) {
  auto claim = MakeClaim(run, "delete", Priority::kP2, 1000);
  claim.tags = {"archive"};
  assert(store.Create(claim));
  assert(store.Delete(claim.id));
  assert(!store.Get(claim.id).has_value());
  assert(store.Delete(claim.id).code == ErrorCode::NotFound);
}

void VerifyRestartDurability(BackendFactory& backend, const Run& run) {
  if (!backend.supports_restart()) {
    return;
  }

  auto store = backend.make_store();
  auto claim = MakeClaim(run, "durable", Priority::kP1, 1000);
  claim.tags = {"persisted"};
  assert(store->Create(claim));

  Claim out;
  assert(store->Update(claim.id, 1, Take(Agent("agent-d", run.domain), 2000, 750), out));

  backend.restart(store);

  auto reloaded = store->Get(claim.id);
  assert(reloaded.has_value());
  assert(reloaded->version == 2);
  assert(reloaded->status == ClaimStatus::kClaimed);
  assert(reloaded->IsOwnedBy("agent-d"));
  assert(reloaded->ttl_ms == 750);
  assert(reloaded->tags.size() == 1);
  assert(reloaded->history.size() == 1);
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_store       = []() { return std::make_shared<MemoryClaimStore>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<ClaimStore>&) {},
      .cleanup          = []() {},
  };
}

#if CLAIMS_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("claims_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_store = [db_path]() -> std::shared_ptr<ClaimStore> {
    auto db = std::make_shared<claims::db::sqlite::SqliteDB>(db_path);
    claims::db::sqlite::BootstrapSchema(*db);
    return std::make_shared<claims::db::sqlite::SqliteClaimStore>(db);
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_store       = make_store,
      .supports_restart = []() { return true; },
      .restart          = [make_store](std::shared_ptr<ClaimStore>& store) { store = make_store(); },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
  };
}
#endif

#if CLAIMS_DB_SQLITE
void VerifySqliteSchemaVersion() {
  const auto path = (std::filesystem::temp_directory_path() / ("claims_integration_schema_" + std::to_string(NowMs()) + ".db")).string();
  {
    claims::db::sqlite::SqliteDB db(path);
    claims::db::sqlite::BootstrapSchema(db);
    assert(claims::db::sqlite::ReadSchemaVersion(db) == claims::db::sqlite::kSchemaVersion);

    // bootstrapping again is a no-op
    claims::db::sqlite::BootstrapSchema(db);
    {
      claims::db::sqlite::SqliteStatement rows(db.Handle(), "SELECT COUNT(*) FROM claims_schema_migrations;");
      assert(rows.Step());
      assert(rows.ColU64(0) == 1);
    }

    db.Exec("INSERT INTO claims_schema_migrations(version, applied_at_ms) VALUES(99, 0);");
    bool rejected = false;
    try {
      claims::db::sqlite::BootstrapSchema(db);
    } catch (const std::runtime_error&) {
      rejected = true;
    }
    assert(rejected);
  }
  std::filesystem::remove(path);
  std::filesystem::remove(path + "-wal");
  std::filesystem::remove(path + "-shm");
}
#endif

#if CLAIMS_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("CLAIMS_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("CLAIMS_TEST_POSTGRES_URI is not set");
  }
  const std::string conninfo = uri;

  auto make_store = [conninfo]() -> std::shared_ptr<ClaimStore> {
    auto pool = std::make_shared<claims::db::postgres::PgPool>(conninfo, 4);
    claims::db::postgres::BootstrapSchema(pool);
    assert(claims::db::postgres::ReadSchemaVersion(pool) == claims::db::postgres::kSchemaVersion);
    return std::make_shared<claims::db::postgres::PgClaimStore>(pool);
  };

  return BackendFactory{
      .name             = "postgres",
      .make_store       = make_store,
      .supports_restart = []() { return true; },
      .restart          = [make_store](std::shared_ptr<ClaimStore>& store) { store = make_store(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";

  const auto stamp = std::to_string(NowMs());
  const Run  run{backend.name + "-" + stamp + "-", "parity-" + backend.name + "-" + stamp};

  auto store = backend.make_store();

  VerifyCreateAndGet(*store, run);
  VerifyCompareAndSet(*store, run);
  VerifyFullLifecycleRoundTrip(*store, run);
  VerifyListAndCount(*store, run);
  VerifyFindStale(*store, run);
  VerifyDelete(*store, run);

  store.reset();
  VerifyRestartDurability(backend, run);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if CLAIMS_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if CLAIMS_DB_POSTGRES
  if (const char* uri = std::getenv("CLAIMS_TEST_POSTGRES_URI"); uri != nullptr && *uri != '\0') {
    backends.push_back(MakePostgresFactory());
  } else {
    std::cout << "skipping postgres backend: CLAIMS_TEST_POSTGRES_URI is not set\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

#if CLAIMS_DB_SQLITE
  VerifySqliteSchemaVersion();
#endif

  std::cout << "claims_integration_claim_store_parity: pass\n";
  return 0;
}
