#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace netcrawl::db::sqlite {

// Creates crawl_claims / devices / neighbor_edges if missing.
void BootstrapSchema(SqliteDB& db);

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertClaim(Transaction&, const model::ClaimRecord&) override;
  std::optional<model::ClaimRecord> GetClaim(Transaction&, const std::string&) override;
  Result UpdateClaim(Transaction&, const model::ClaimRecord&) override;
  std::vector<model::ClaimRecord> ListClaims(Transaction&) override;
  Result DeleteAllClaims(Transaction&) override;

  Result UpsertDevice(Transaction&, const model::DeviceRecord&) override;
  std::optional<model::DeviceRecord> GetDevice(Transaction&, const std::string&) override;
  std::vector<model::DeviceRecord> ListDevices(Transaction&) override;
  Result DeleteAllDevices(Transaction&) override;

  Result UpsertEdge(Transaction&, const model::NeighborEdgeRecord&) override;
  std::vector<model::NeighborEdgeRecord> ListEdges(Transaction&) override;
  Result DeleteAllEdges(Transaction&) override;

private:
  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  Result ExecSimple(Transaction& t, const char* sql);

  std::shared_ptr<SqliteDB> db_;
};

}
