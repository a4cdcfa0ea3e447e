#include "sqlite_channel_store.hpp"

#include <algorithm>
#include <set>

namespace macrelay::db::sqlite {

namespace {

constexpr char kSelectColumns[] =
    "SELECT portal_id,channel_id,name,number,genre_id,genre,cmd,available_macs,alternate_ids,enabled FROM channels";

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

// MACs and channel ids never contain ','
std::string Join(const std::vector<std::string>& values) {
  std::string out;
  for (const auto& v : values) {
    if (!out.empty()) out += ',';
    out += v;
  }
  return out;
}

std::vector<std::string> Split(const std::string& joined) {
  std::vector<std::string> out;
  std::size_t              start = 0;
  while (start < joined.size()) {
    auto end = joined.find(',', start);
    if (end == std::string::npos) end = joined.size();
    if (end > start) out.push_back(joined.substr(start, end - start));
    start = end + 1;
  }
  return out;
}

model::CachedChannelEntry ReadRow(sqlite3_stmt* st) {
  model::CachedChannelEntry entry;
  entry.portal_id  = ColText(st, 0);
  entry.channel_id = ColText(st, 1);
  entry.name       = ColText(st, 2);
  entry.number     = ColText(st, 3);
  entry.genre_id   = ColText(st, 4);
  entry.genre      = ColText(st, 5);
  if (sqlite3_column_type(st, 6) != SQLITE_NULL) entry.cached_cmd = ColText(st, 6);
  entry.available_macs        = Split(ColText(st, 7));
  entry.alternate_channel_ids = Split(ColText(st, 8));
  entry.enabled               = sqlite3_column_int(st, 9) != 0;
  return entry;
}

} // namespace

SqliteChannelStore::SqliteChannelStore(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

void SqliteChannelStore::Bootstrap() {
  std::lock_guard lock(mutex_);

  db_->Exec(
      "CREATE TABLE IF NOT EXISTS channels ("
      "portal_id TEXT NOT NULL, channel_id TEXT NOT NULL, name TEXT NOT NULL DEFAULT '', number TEXT NOT NULL DEFAULT '', "
      "genre_id TEXT NOT NULL DEFAULT '', genre TEXT NOT NULL DEFAULT '', cmd TEXT, available_macs TEXT NOT NULL DEFAULT '', "
      "alternate_ids TEXT NOT NULL DEFAULT '', enabled INTEGER NOT NULL DEFAULT 1, PRIMARY KEY (portal_id, channel_id));");
}

Result SqliteChannelStore::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Fail(StoreError::kBusy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Fail(StoreError::kConstraint, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_CORRUPT:
    case SQLITE_FULL:
    case SQLITE_NOTADB:
      return Result::Fail(StoreError::kStorage, sqlite3_errmsg(db));
    default:
      return Result::Fail(StoreError::kInternal, sqlite3_errmsg(db));
  }
}

std::optional<model::CachedChannelEntry> SqliteChannelStore::Get(const std::string& portal_id, const std::string& channel_id) {
  std::lock_guard lock(mutex_);

  Statement st(*db_, std::string(kSelectColumns) + " WHERE portal_id=? AND channel_id=?;");
  BindText(st.get(), 1, portal_id);
  BindText(st.get(), 2, channel_id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadRow(st.get());
}

std::vector<model::CachedChannelEntry> SqliteChannelStore::ListPortalChannels(const std::string& portal_id) {
  std::lock_guard lock(mutex_);

  Statement st(*db_, std::string(kSelectColumns) + " WHERE portal_id=? ORDER BY channel_id;");
  BindText(st.get(), 1, portal_id);

  std::vector<model::CachedChannelEntry> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(ReadRow(st.get()));
  return out;
}

Result SqliteChannelStore::ReplacePortalChannels(const std::string& portal_id, const std::vector<model::CachedChannelEntry>& channels) {
  std::lock_guard lock(mutex_);
  auto*           handle = db_->Handle();

  WriteTransaction tx(*db_);
  if (tx.BeginResult() != SQLITE_OK) return Translate(handle, tx.BeginResult());

  std::set<std::string> existing;
  {
    Statement st(*db_, "SELECT channel_id FROM channels WHERE portal_id=?;");
    BindText(st.get(), 1, portal_id);
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) existing.insert(ColText(st.get(), 0));
    if (rc != SQLITE_DONE) return Translate(handle, rc);
  }

  // alternate_ids and enabled are operator-owned and only written on first insert
  Statement upsert(*db_,
                   "INSERT INTO channels(portal_id,channel_id,name,number,genre_id,genre,cmd,available_macs,alternate_ids,enabled) "
                   "VALUES(?,?,?,?,?,?,?,?,?,?) ON CONFLICT(portal_id,channel_id) DO UPDATE SET "
                   "name=excluded.name,number=excluded.number,genre_id=excluded.genre_id,genre=excluded.genre,"
                   "cmd=excluded.cmd,available_macs=excluded.available_macs;");

  for (const auto& entry : channels) {
    upsert.Reset();
    auto* st = upsert.get();

    BindText(st, 1, portal_id);
    BindText(st, 2, entry.channel_id);
    BindText(st, 3, entry.name);
    BindText(st, 4, entry.number);
    BindText(st, 5, entry.genre_id);
    BindText(st, 6, entry.genre);
    if (entry.cached_cmd) {
      BindText(st, 7, *entry.cached_cmd);
    } else {
      sqlite3_bind_null(st, 7);
    }
    BindText(st, 8, Join(entry.available_macs));
    BindText(st, 9, Join(entry.alternate_channel_ids));
    sqlite3_bind_int(st, 10, entry.enabled ? 1 : 0);

    if (int rc = sqlite3_step(st); rc != SQLITE_DONE) return Translate(handle, rc);
    existing.erase(entry.channel_id);
  }

  Statement remove(*db_, "DELETE FROM channels WHERE portal_id=? AND channel_id=?;");
  for (const auto& stale : existing) {
    remove.Reset();
    BindText(remove.get(), 1, portal_id);
    BindText(remove.get(), 2, stale);
    if (int rc = sqlite3_step(remove.get()); rc != SQLITE_DONE) return Translate(handle, rc);
  }

  if (int rc = tx.Commit(); rc != SQLITE_OK) return Translate(handle, rc);
  return Result::Ok();
}

Result SqliteChannelStore::SetAlternateIds(const std::string& portal_id, const std::string& channel_id, const std::vector<std::string>& alternate_ids) {
  std::lock_guard lock(mutex_);

  Statement st(*db_, "UPDATE channels SET alternate_ids=? WHERE portal_id=? AND channel_id=?;");
  BindText(st.get(), 1, Join(alternate_ids));
  BindText(st.get(), 2, portal_id);
  BindText(st.get(), 3, channel_id);

  if (int rc = sqlite3_step(st.get()); rc != SQLITE_DONE) return Translate(db_->Handle(), rc);
  if (sqlite3_changes(db_->Handle()) == 0) return Result::Fail(StoreError::kNotFound, "channel not found");
  return Result::Ok();
}

Result SqliteChannelStore::SetEnabled(const std::string& portal_id, const std::string& channel_id, bool enabled) {
  std::lock_guard lock(mutex_);

  Statement st(*db_, "UPDATE channels SET enabled=? WHERE portal_id=? AND channel_id=?;");
  sqlite3_bind_int(st.get(), 1, enabled ? 1 : 0);
  BindText(st.get(), 2, portal_id);
  BindText(st.get(), 3, channel_id);

  if (int rc = sqlite3_step(st.get()); rc != SQLITE_DONE) return Translate(db_->Handle(), rc);
  if (sqlite3_changes(db_->Handle()) == 0) return Result::Fail(StoreError::kNotFound, "channel not found");
  return Result::Ok();
}

model::PortalChannelStats SqliteChannelStore::Stats(const std::string& portal_id) {
  std::lock_guard lock(mutex_);

  Statement st(*db_,
               "SELECT COUNT(*), COALESCE(SUM(enabled),0), COUNT(DISTINCT genre_id), "
               "COUNT(DISTINCT CASE WHEN enabled=1 THEN genre_id END) FROM channels WHERE portal_id=?;");
  BindText(st.get(), 1, portal_id);

  model::PortalChannelStats stats;
  if (sqlite3_step(st.get()) == SQLITE_ROW) {
    stats.total_channels   = static_cast<std::uint64_t>(sqlite3_column_int64(st.get(), 0));
    stats.enabled_channels = static_cast<std::uint64_t>(sqlite3_column_int64(st.get(), 1));
    stats.total_groups     = static_cast<std::uint64_t>(sqlite3_column_int64(st.get(), 2));
    stats.enabled_groups   = static_cast<std::uint64_t>(sqlite3_column_int64(st.get(), 3));
  }
  return stats;
}

Result SqliteChannelStore::Vacuum(const std::vector<std::string>& live_portal_ids) {
  std::lock_guard lock(mutex_);

  std::vector<std::string> stale;
  {
    Statement st(*db_, "SELECT DISTINCT portal_id FROM channels;");
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
      auto id = ColText(st.get(), 0);
      if (std::find(live_portal_ids.begin(), live_portal_ids.end(), id) == live_portal_ids.end()) stale.push_back(std::move(id));
    }
  }

  {
    Statement remove(*db_, "DELETE FROM channels WHERE portal_id=?;");
    for (const auto& id : stale) {
      remove.Reset();
      BindText(remove.get(), 1, id);
      if (int rc = sqlite3_step(remove.get()); rc != SQLITE_DONE) return Translate(db_->Handle(), rc);
    }
  }

  if (int rc = db_->TryExec("VACUUM;"); rc != SQLITE_OK) {
    return Translate(db_->Handle(), rc);
  }
  return Result::Ok();
}

} // namespace macrelay::db::sqlite
