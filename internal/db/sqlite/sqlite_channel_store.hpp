#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/channel_store.hpp"
#include "sqlite_db.hpp"

namespace macrelay::db::sqlite {

class SqliteChannelStore final : public db::ChannelStore {
 public:
  explicit SqliteChannelStore(std::shared_ptr<SqliteDB> db);

  // Creates the channels table when missing.
  void Bootstrap();

  std::optional<model::CachedChannelEntry> Get(const std::string& portal_id, const std::string& channel_id) override;
  std::vector<model::CachedChannelEntry>   ListPortalChannels(const std::string& portal_id) override;
  Result ReplacePortalChannels(const std::string& portal_id, const std::vector<model::CachedChannelEntry>& channels) override;
  Result SetAlternateIds(const std::string& portal_id, const std::string& channel_id, const std::vector<std::string>& alternate_ids) override;
  Result SetEnabled(const std::string& portal_id, const std::string& channel_id, bool enabled) override;
  model::PortalChannelStats Stats(const std::string& portal_id) override;
  Result                    Vacuum(const std::vector<std::string>& live_portal_ids) override;

 private:
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;

  // one connection; multi-statement writes must not interleave
  std::mutex mutex_;
};

} // namespace macrelay::db::sqlite
