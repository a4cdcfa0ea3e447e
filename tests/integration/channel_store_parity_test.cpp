#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/channel_store.hpp"
#include "internal/db/memory/memory_channel_store.hpp"

#if MACRELAY_DB_SQLITE
#include "internal/db/sqlite/sqlite_channel_store.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#endif

namespace {

using macrelay::db::ChannelStore;
using macrelay::db::StoreError;
using macrelay::db::memory::MemoryChannelStore;
using macrelay::model::CachedChannelEntry;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                         name;
  std::function<std::shared_ptr<ChannelStore>()>      make_store;
  std::function<bool()>                               supports_restart;
  std::function<void(std::shared_ptr<ChannelStore>&)> restart;
  std::function<void()>                               cleanup;
};

CachedChannelEntry Entry(const std::string& id, const std::string& genre_id, std::vector<std::string> macs) {
  CachedChannelEntry e;
  e.channel_id     = id;
  e.name           = "Channel " + id;
  e.number         = id;
  e.genre_id       = genre_id;
  e.genre          = "Genre " + genre_id;
  e.available_macs = std::move(macs);
  return e;
}

void VerifyReplaceAndGet(ChannelStore& store, const std::string& portal) {
  auto with_cmd       = Entry("1", "10", {"A", "B"});
  with_cmd.cached_cmd = "ffmpeg http://up/1";

  assert(store.ReplacePortalChannels(portal, {with_cmd, Entry("2", "10", {"B"}), Entry("3", "20", {})}));

  auto one = store.Get(portal, "1");
  assert(one.has_value());
  assert(one->portal_id == portal);
  assert(one->name == "Channel 1");
  assert(one->genre == "Genre 10");
  assert(one->cached_cmd && *one->cached_cmd == "ffmpeg http://up/1");
  assert((one->available_macs == std::vector<std::string>{"A", "B"}));
  assert(one->alternate_channel_ids.empty());
  assert(one->enabled);

  auto three = store.Get(portal, "3");
  assert(!three->cached_cmd);
  assert(three->available_macs.empty());

  assert(!store.Get(portal, "4"));
  assert(!store.Get(portal + "-other", "1"));
  assert(store.ListPortalChannels(portal).size() == 3);
}

void VerifyOperatorColumnsSurviveReplace(ChannelStore& store, const std::string& portal) {
  assert(store.ReplacePortalChannels(portal, {Entry("1", "10", {"A"}), Entry("2", "20", {"A"})}));
  assert(store.SetAlternateIds(portal, "1", {"101", "102"}));
  assert(store.SetEnabled(portal, "2", false));

  auto missing = store.SetEnabled(portal, "99", false);
  assert(!missing);
  assert(missing.error == StoreError::kNotFound);

  auto renamed = Entry("1", "10", {"B"});
  renamed.name = "Renamed";
  assert(store.ReplacePortalChannels(portal, {renamed, Entry("2", "20", {"B"})}));

  auto one = store.Get(portal, "1");
  assert(one->name == "Renamed");
  assert((one->available_macs == std::vector<std::string>{"B"}));
  assert((one->alternate_channel_ids == std::vector<std::string>{"101", "102"}));
  assert(!store.Get(portal, "2")->enabled);

  // dropped from the upstream list, dropped from the store
  assert(store.ReplacePortalChannels(portal, {renamed}));
  assert(!store.Get(portal, "2"));
}

void VerifyStats(ChannelStore& store, const std::string& portal) {
  assert(store.ReplacePortalChannels(portal, {Entry("1", "10", {}), Entry("2", "10", {}), Entry("3", "20", {}), Entry("4", "30", {})}));
  assert(store.SetEnabled(portal, "3", false));
  assert(store.SetEnabled(portal, "4", false));

  auto stats = store.Stats(portal);
  assert(stats.total_channels == 4);
  assert(stats.enabled_channels == 2);
  assert(stats.total_groups == 3);
  assert(stats.enabled_groups == 1);

  auto empty = store.Stats(portal + "-none");
  assert(empty.total_channels == 0);
  assert(empty.total_groups == 0);
}

void VerifyVacuum(ChannelStore& store, const std::string& prefix) {
  const auto live = prefix + "-live";
  const auto gone = prefix + "-gone";
  assert(store.ReplacePortalChannels(live, {Entry("1", "10", {})}));
  assert(store.ReplacePortalChannels(gone, {Entry("1", "10", {}), Entry("2", "10", {})}));

  assert(store.Vacuum({live}));
  assert(store.Get(live, "1"));
  assert(store.ListPortalChannels(gone).empty());
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& portal) {
  if (!backend.supports_restart()) {
    return;
  }

  auto store = backend.make_store();
  assert(store->ReplacePortalChannels(portal, {Entry("1", "10", {"A", "B"})}));
  assert(store->SetAlternateIds(portal, "1", {"7"}));

  backend.restart(store);

  auto one = store->Get(portal, "1");
  assert(one.has_value());
  assert((one->available_macs == std::vector<std::string>{"A", "B"}));
  assert((one->alternate_channel_ids == std::vector<std::string>{"7"}));

  backend.cleanup();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_store       = []() { return std::make_shared<MemoryChannelStore>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<ChannelStore>&) {},
      .cleanup          = []() {},
  };
}

#if MACRELAY_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("macrelay_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_store = [db_path]() {
    auto db    = std::make_shared<macrelay::db::sqlite::SqliteDB>(db_path);
    auto store = std::make_shared<macrelay::db::sqlite::SqliteChannelStore>(std::move(db));
    store->Bootstrap();
    return store;
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_store       = make_store,
      .supports_restart = []() { return true; },
      .restart          = [make_store](std::shared_ptr<ChannelStore>& store) { store = make_store(); },
      .cleanup =
          [db_path]() {
            for (const char* suffix : {"", "-wal", "-shm"}) std::filesystem::remove(db_path + suffix);
          },
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto store = backend.make_store();

  VerifyReplaceAndGet(*store, backend.name + "-replace");
  VerifyOperatorColumnsSurviveReplace(*store, backend.name + "-operator");
  VerifyStats(*store, backend.name + "-stats");
  VerifyVacuum(*store, backend.name + "-vacuum");

  store.reset();
  VerifyRestartDurability(backend, backend.name + "-durable");
}

} // namespace

int main() {
  auto memory = MakeMemoryFactory();
  RunBackendSuite(memory);

#if MACRELAY_DB_SQLITE
  auto sqlite = MakeSqliteFactory();
  RunBackendSuite(sqlite);
#endif

  std::cout << "macrelay_integration_channel_store_parity: pass\n";
  return 0;
}
