#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/store/coordination_store.hpp"

#if BATON_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace {

namespace v1 = baton::coordination::v1;
using baton::db::ErrorCode;
using baton::db::EventQuery;
using baton::db::Repository;
using baton::db::memory::MemoryRepository;
using baton::db::model::EventRecord;
using baton::db::model::SessionRecord;
using baton::db::model::StateSnapshotRecord;
using baton::db::model::TaskGroupRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

SessionRecord NewSession(const std::string& session_id, uint64_t created_at_ms) {
  SessionRecord record;
  record.session_id    = session_id;
  record.scope_json    = R"({"items":[{"itemId":"importer"}]})";
  record.created_at_ms = created_at_ms;
  return record;
}

EventRecord NewEvent(const std::string& session_id, const std::string& group_id, const std::string& type, const std::string& key,
                     uint64_t timestamp_ms) {
  EventRecord record;
  record.session_id   = session_id;
  record.group_id     = group_id;
  record.event_type   = type;
  record.payload_json = R"({"audit":{"category":"test"}})";
  record.timestamp_ms = timestamp_ms;
  record.dedup_key    = key;
  return record;
}

void VerifySessions(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  assert(repo.InsertSession(*tx, NewSession(prefix + "-a", 1000)));
  assert(repo.InsertSession(*tx, NewSession(prefix + "-b", 2000)));
  assert(repo.InsertSession(*tx, NewSession(prefix + "-a", 3000)).code == ErrorCode::AlreadyExists);

  auto read = repo.GetSession(*tx, prefix + "-a");
  assert(read.has_value());
  assert(read->status == v1::SESSION_STATUS_ACTIVE);
  assert(read->scope_json == R"({"items":[{"itemId":"importer"}]})");
  assert(read->closed_at_ms == 0);

  read->status       = v1::SESSION_STATUS_COMPLETED;
  read->closed_at_ms = 5000;
  assert(repo.UpdateSession(*tx, *read));

  const auto closed = repo.GetSession(*tx, prefix + "-a");
  assert(closed->status == v1::SESSION_STATUS_COMPLETED);
  assert(closed->closed_at_ms == 5000);

  assert(repo.UpdateSession(*tx, NewSession(prefix + "-missing", 1)).code == ErrorCode::NotFound);
  assert(!repo.GetSession(*tx, prefix + "-missing").has_value());

  tx->Commit();
}

void VerifyTaskGroups(Repository& repo, const std::string& session_id) {
  auto tx = repo.Begin();
  assert(repo.InsertSession(*tx, NewSession(session_id, NowMs())));

  TaskGroupRecord second;
  second.session_id = session_id;
  second.group_id   = "g2";
  second.name       = "exporter";
  assert(repo.UpsertTaskGroup(*tx, second));

  TaskGroupRecord first;
  first.session_id            = session_id;
  first.group_id              = "g1";
  first.name                  = "importer";
  first.status                = v1::GROUP_STATUS_CHANGES_REQUIRED;
  first.assigned_role         = v1::ROLE_IMPLEMENTER;
  first.implementer_role      = v1::ROLE_SENIOR_IMPLEMENTER;
  first.review_iteration      = 2;
  first.no_progress_count     = 1;
  first.blocking_issues_count = 3;
  first.complexity            = 5;
  first.updated_at_ms         = 42;
  assert(repo.UpsertTaskGroup(*tx, first));

  first.review_iteration = 3;
  assert(repo.UpsertTaskGroup(*tx, first));

  const auto read = repo.GetTaskGroup(*tx, session_id, "g1");
  assert(read.has_value());
  assert(read->status == v1::GROUP_STATUS_CHANGES_REQUIRED);
  assert(read->implementer_role == v1::ROLE_SENIOR_IMPLEMENTER);
  assert(read->review_iteration == 3);
  assert(read->no_progress_count == 1);
  assert(read->blocking_issues_count == 3);
  assert(read->complexity == 5);

  const auto all = repo.ListTaskGroups(*tx, session_id);
  assert(all.size() == 2);
  assert(all[0].group_id == "g1");
  assert(all[1].group_id == "g2");

  TaskGroupRecord orphan;
  orphan.session_id = session_id + "-orphan";
  orphan.group_id   = "g1";
  assert(repo.UpsertTaskGroup(*tx, orphan).code == ErrorCode::ConstraintViolation);

  tx->Commit();
}

void VerifyEvents(Repository& repo, const std::string& session_id) {
  auto tx = repo.Begin();
  assert(repo.InsertSession(*tx, NewSession(session_id, NowMs())));

  std::vector<EventRecord> appended;
  appended.push_back(NewEvent(session_id, "g1", "issues_raised", session_id + ":e1", 1000));
  appended.push_back(NewEvent(session_id, "g2", "issues_raised", session_id + ":e2", 2000));
  appended.push_back(NewEvent(session_id, "g1", "audit", session_id + ":e3", 3000));
  appended.push_back(NewEvent(session_id, "", "scope_change", session_id + ":e4", 4000));
  for (auto& event : appended) {
    assert(repo.AppendEvent(*tx, event));
  }
  for (std::size_t i = 1; i < appended.size(); ++i) {
    assert(appended[i].sequence > appended[i - 1].sequence);
  }

  auto again = NewEvent(session_id, "g1", "audit", session_id + ":e1", 9000);
  assert(repo.AppendEvent(*tx, again).code == ErrorCode::AlreadyExists);

  const auto by_key = repo.GetEventByDedupKey(*tx, session_id + ":e1");
  assert(by_key.has_value());
  assert(by_key->sequence == appended[0].sequence);
  assert(by_key->timestamp_ms == 1000);
  assert(!repo.GetEventByDedupKey(*tx, session_id + ":nope").has_value());

  EventQuery query;
  query.session_id = session_id;
  assert(repo.QueryEvents(*tx, query).size() == 4);

  query.group_id = "g1";
  auto g1 = repo.QueryEvents(*tx, query);
  assert(g1.size() == 2);
  assert(g1[0].dedup_key == session_id + ":e1");
  assert(g1[1].dedup_key == session_id + ":e3");

  query.group_id   = std::nullopt;
  query.event_type = "issues_raised";
  assert(repo.QueryEvents(*tx, query).size() == 2);

  query.event_type       = std::nullopt;
  query.min_timestamp_ms = 2500;
  assert(repo.QueryEvents(*tx, query).size() == 2);

  query.min_timestamp_ms = std::nullopt;
  query.limit            = 2;
  auto latest            = repo.QueryEvents(*tx, query);
  assert(latest.size() == 2);
  assert(latest[0].dedup_key == session_id + ":e3");
  assert(latest[1].dedup_key == session_id + ":e4");

  query.group_id = "";
  query.limit    = std::nullopt;
  auto session_level = repo.QueryEvents(*tx, query);
  assert(session_level.size() == 1);
  assert(session_level[0].event_type == "scope_change");

  tx->Commit();
}

void VerifyState(Repository& repo, const std::string& session_id) {
  auto tx = repo.Begin();
  assert(repo.InsertSession(*tx, NewSession(session_id, NowMs())));

  StateSnapshotRecord state{session_id, "global", "workflow_config", R"({"maxIterations":3})", 100};
  assert(repo.UpsertState(*tx, state));
  state.payload_json  = R"({"maxIterations":5})";
  state.updated_at_ms = 200;
  assert(repo.UpsertState(*tx, state));

  const auto read = repo.GetState(*tx, session_id, "global", "workflow_config");
  assert(read.has_value());
  assert(read->payload_json == R"({"maxIterations":5})");
  assert(read->updated_at_ms == 200);
  assert(!repo.GetState(*tx, session_id, "g1", "workflow_config").has_value());

  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& session_id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertSession(*tx, NewSession(session_id, NowMs())));
    auto event = NewEvent(session_id, "", "audit", session_id + ":rolled-back", NowMs());
    assert(repo.AppendEvent(*tx, event));
    tx->Rollback();
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetSession(*check_tx, session_id).has_value());
  assert(!repo.GetEventByDedupKey(*check_tx, session_id + ":rolled-back").has_value());
  check_tx->Commit();

  {
    auto tx = repo.Begin();
    assert(repo.InsertSession(*tx, NewSession(session_id, NowMs())));
    // Destroyed without Commit.
  }

  auto after_drop = repo.Begin();
  assert(!repo.GetSession(*after_drop, session_id).has_value());
  after_drop->Commit();
}

void VerifyConcurrentStoreWriters(std::shared_ptr<Repository> repo, const std::string& session_id) {
  auto store = std::make_shared<baton::store::CoordinationStore>(repo);
  store->CreateSession(session_id, v1::EXECUTION_MODE_MULTI_TRACK, v1::ScopeDescriptor{});

  constexpr int kThreads = 4;
  constexpr int kPerThread = 10;

  std::vector<std::thread> workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&, t] {
      for (int i = 0; i < kPerThread; ++i) {
        v1::EventPayload payload;
        payload.mutable_audit()->set_category("writer");
        payload.mutable_audit()->set_message(std::to_string(t) + "/" + std::to_string(i));
        store->AppendEvent(session_id, "", "audit", payload, session_id + ":w" + std::to_string(t) + "-" + std::to_string(i));
      }
    });
  }
  for (auto& worker : workers) worker.join();

  baton::store::EventFilter filter;
  filter.session_id = session_id;
  const auto events = store->GetEvents(filter);
  assert(events.size() == kThreads * kPerThread);
  for (std::size_t i = 1; i < events.size(); ++i) {
    assert(events[i].sequence() > events[i - 1].sequence());
  }
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& session_id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto     repo = backend.make_repository();
  uint64_t last_sequence = 0;
  {
    baton::store::CoordinationStore store(repo);
    v1::ScopeDescriptor             scope;
    scope.add_items()->set_item_id("importer");
    store.CreateSession(session_id, v1::EXECUTION_MODE_SINGLE_TRACK, scope);

    v1::TaskGroup group;
    group.set_session_id(session_id);
    group.set_group_id("g1");
    group.set_name("csv importer");
    group.set_status(v1::GROUP_STATUS_IN_PROGRESS);
    store.UpsertTaskGroup(group);

    v1::EventPayload payload;
    payload.mutable_scope_item_completed()->set_item_id("importer");
    last_sequence = store.AppendEvent(session_id, "", "scope_item_completed", payload, session_id + ":done").sequence;
    store.Atomically(session_id, [&](baton::store::AtomicUnit& unit) {
      unit.UpsertState(session_id, "global", "workflow_config", R"({"maxIterations":3})");
    });
  }

  backend.restart(repo);

  baton::store::CoordinationStore store(repo);
  const auto                      session = store.GetSession(session_id);
  assert(session.has_value());
  assert(session->original_scope().items_size() == 1);
  assert(session->original_scope().items(0).item_id() == "importer");

  const auto group = store.GetTaskGroup(session_id, "g1");
  assert(group.has_value());
  assert(group->status() == v1::GROUP_STATUS_IN_PROGRESS);
  assert(group->name() == "csv importer");

  baton::store::EventFilter filter;
  filter.session_id = session_id;
  const auto events = store.GetEvents(filter);
  assert(events.size() == 1);
  assert(events[0].payload().scope_item_completed().item_id() == "importer");

  v1::EventPayload payload;
  payload.mutable_scope_item_completed()->set_item_id("importer");
  const auto retried = store.AppendEvent(session_id, "", "scope_item_completed", payload, session_id + ":done");
  assert(retried.duplicate);
  assert(retried.sequence == last_sequence);

  v1::EventPayload audit;
  audit.mutable_audit()->set_category("restart");
  assert(store.AppendEvent(session_id, "", "audit", audit, session_id + ":after").sequence > last_sequence);

  assert(store.GetState(session_id, "global", "workflow_config").found);

  backend.cleanup();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if BATON_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("baton_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<baton::db::sqlite::SqliteDB>(db_path);
    baton::db::sqlite::BootstrapSqliteSchema(db);
    return std::static_pointer_cast<Repository>(std::make_shared<baton::db::sqlite::SqliteRepository>(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::error_code ec;
        std::filesystem::remove(db_path, ec);
        std::filesystem::remove(db_path + "-wal", ec);
        std::filesystem::remove(db_path + "-shm", ec);
      },
  };
}
#endif

void RunBackend(BackendFactory backend) {
  const auto prefix = backend.name + "-" + std::to_string(NowMs());

  auto repo = backend.make_repository();
  VerifySessions(*repo, prefix + "-sessions");
  VerifyTaskGroups(*repo, prefix + "-groups");
  VerifyEvents(*repo, prefix + "-events");
  VerifyState(*repo, prefix + "-state");
  VerifyRollbackBehavior(*repo, prefix + "-rollback");
  VerifyConcurrentStoreWriters(repo, prefix + "-writers");
  repo.reset();

  VerifyRestartDurability(backend, prefix + "-restart");
  backend.cleanup();

  std::cout << "  " << backend.name << ": ok\n";
}

} // namespace

int main() {
  RunBackend(MakeMemoryFactory());
#if BATON_DB_SQLITE
  RunBackend(MakeSqliteFactory());
#endif

  std::cout << "baton_integration_repository_parity: pass\n";
  return 0;
}
