#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <optional>
#include <string>
#include <vector>

#include "internal/util/csv.hpp"
#include "internal/util/errors.hpp"

namespace netcrawl::db::sqlite {

using netcrawl::db::ErrorCode;
using netcrawl::db::Result;

namespace {

// list-valued device columns are stored ';'-joined
constexpr char kListSeparator = ';';

// bumped whenever a table below changes shape
constexpr int kSchemaVersion = 1;

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

constexpr const char* kClaimColumns = "hostname,status,reason,claimed_at_ms,updated_at_ms";

constexpr const char* kDeviceColumns =
    "hostname,mgmt_ip,serial_numbers,platform,software_version,rommon_version,config_register,"
    "mac_address,uptime,software_image,reload_reason,device_family,last_crawled_ms,crawl_status,crawl_error";

constexpr const char* kEdgeColumns =
    "from_hostname,to_hostname,local_interface,neighbor_interface,platform,discovered_at_ms";

model::ClaimRecord ReadClaim(sqlite3_stmt* st) {
    model::ClaimRecord r;
    r.hostname      = ColText(st, 0);
    r.status        = static_cast<model::ClaimStatus>(ColI32(st, 1));
    r.reason        = ColText(st, 2);
    r.claimed_at_ms = ColU64(st, 3);
    r.updated_at_ms = ColU64(st, 4);
    return r;
}

model::DeviceRecord ReadDevice(sqlite3_stmt* st) {
    model::DeviceRecord r;
    r.hostname         = ColText(st, 0);
    r.mgmt_ip          = ColText(st, 1);
    r.serial_numbers   = util::Split(ColText(st, 2), kListSeparator);
    r.platform         = util::Split(ColText(st, 3), kListSeparator);
    r.software_version = ColText(st, 4);
    r.rommon_version   = ColText(st, 5);
    r.config_register  = ColText(st, 6);
    r.mac_address      = ColText(st, 7);
    r.uptime           = ColText(st, 8);
    r.software_image   = ColText(st, 9);
    r.reload_reason    = ColText(st, 10);
    r.device_family    = ColText(st, 11);
    r.last_crawled_ms  = ColU64(st, 12);
    r.crawl_status     = static_cast<model::CrawlStatus>(ColI32(st, 13));
    r.crawl_error      = ColText(st, 14);
    return r;
}

model::NeighborEdgeRecord ReadEdge(sqlite3_stmt* st) {
    model::NeighborEdgeRecord r;
    r.from_hostname      = ColText(st, 0);
    r.to_hostname        = ColText(st, 1);
    r.local_interface    = ColText(st, 2);
    r.neighbor_interface = ColText(st, 3);
    r.platform           = ColText(st, 4);
    r.discovered_at_ms   = ColU64(st, 5);
    return r;
}

// Reads have no Result to carry a failure; they throw instead.
sqlite3_stmt* PrepareRead(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        throw util::StoreError(std::string("inventory read failed: ") + sqlite3_errmsg(db));
    return st;
}

// Steps a single-row lookup; nullopt when the row is absent.
template <typename Record, typename Reader>
std::optional<Record> ReadOne(sqlite3* db, sqlite3_stmt* st, Reader read) {
    const int rc = sqlite3_step(st);
    std::optional<Record> out;
    if (rc == SQLITE_ROW) out = read(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE)
        throw util::StoreError(std::string("inventory read failed: ") + sqlite3_errmsg(db));
    return out;
}

// Runs a prepared SELECT to completion, collecting every row.
template <typename Record, typename Reader>
std::vector<Record> CollectRows(sqlite3* db, const std::string& sql, Reader read) {
    std::vector<Record> out;

    sqlite3_stmt* st = PrepareRead(db, sql);

    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(read(st));
    }

    sqlite3_finalize(st);
    if (rc != SQLITE_DONE)
        throw util::StoreError(std::string("inventory read failed: ") + sqlite3_errmsg(db));
    return out;
}

} // namespace

void BootstrapSchema(SqliteDB& db) {
    static const std::vector<std::string> kBootstrapSql = {
        "CREATE TABLE IF NOT EXISTS crawl_claims (hostname TEXT PRIMARY KEY, status INTEGER NOT NULL, reason TEXT NOT NULL DEFAULT '', claimed_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
        "CREATE TABLE IF NOT EXISTS devices (hostname TEXT PRIMARY KEY, mgmt_ip TEXT, serial_numbers TEXT, platform TEXT, software_version TEXT, rommon_version TEXT, config_register TEXT, mac_address TEXT, uptime TEXT, software_image TEXT, reload_reason TEXT, device_family TEXT, last_crawled_ms INTEGER NOT NULL, crawl_status INTEGER NOT NULL, crawl_error TEXT);",
        "CREATE TABLE IF NOT EXISTS neighbor_edges (from_hostname TEXT NOT NULL, to_hostname TEXT NOT NULL, local_interface TEXT NOT NULL, neighbor_interface TEXT, platform TEXT, discovered_at_ms INTEGER NOT NULL, PRIMARY KEY (from_hostname, to_hostname, local_interface));"};

    const int found = db.SchemaVersion();
    if (found > kSchemaVersion) {
        throw util::StoreError(db.Path() + " has inventory schema version " + std::to_string(found) +
                               ", this build understands up to " + std::to_string(kSchemaVersion));
    }

    for (const auto& sql : kBootstrapSql) {
        db.Exec(sql);
    }
    if (found != kSchemaVersion) db.SetSchemaVersion(kSchemaVersion);
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

Result SqliteRepository::ExecSimple(Transaction& t, const char* sql) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Claims
// ------------------------------------------------------------------

Result SqliteRepository::InsertClaim(Transaction& t, const model::ClaimRecord& r) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("INSERT INTO crawl_claims(") + kClaimColumns + ") VALUES(?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.hostname);
    BindI32(st, 2, static_cast<int>(r.status));
    BindText(st, 3, r.reason);
    BindU64(st, 4, r.claimed_at_ms);
    BindU64(st, 5, r.updated_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    // primary key clash means someone else already owns the hostname
    if ((rc & 0xff) == SQLITE_CONSTRAINT)
        return Result::Err(ErrorCode::AlreadyExists, r.hostname);

    return Translate(db, rc);
}

std::optional<model::ClaimRecord>
SqliteRepository::GetClaim(Transaction& t, const std::string& hostname) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kClaimColumns + " FROM crawl_claims WHERE hostname=?;";

    sqlite3_stmt* st = PrepareRead(db, sql);
    BindText(st, 1, hostname);
    return ReadOne<model::ClaimRecord>(db, st, ReadClaim);
}

Result SqliteRepository::UpdateClaim(Transaction& t, const model::ClaimRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE crawl_claims SET status=?,reason=?,claimed_at_ms=?,updated_at_ms=? WHERE hostname=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI32(st, 1, static_cast<int>(r.status));
    BindText(st, 2, r.reason);
    BindU64(st, 3, r.claimed_at_ms);
    BindU64(st, 4, r.updated_at_ms);
    BindText(st, 5, r.hostname);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, r.hostname);

    return Translate(db, rc);
}

std::vector<model::ClaimRecord> SqliteRepository::ListClaims(Transaction& t) {
    const std::string sql = std::string("SELECT ") + kClaimColumns + " FROM crawl_claims ORDER BY hostname;";
    return CollectRows<model::ClaimRecord>(TX(t).Handle(), sql, ReadClaim);
}

Result SqliteRepository::DeleteAllClaims(Transaction& t) {
    return ExecSimple(t, "DELETE FROM crawl_claims;");
}

// ------------------------------------------------------------------
// Devices
// ------------------------------------------------------------------

Result SqliteRepository::UpsertDevice(Transaction& t, const model::DeviceRecord& r) {
    if (r.hostname.empty())
        return Result::Err(ErrorCode::ConstraintViolation, "device hostname is empty");

    auto* db = TX(t).Handle();

    const std::string sql = std::string("INSERT INTO devices(") + kDeviceColumns +
        ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?) "
        "ON CONFLICT(hostname) DO UPDATE SET "
        "mgmt_ip=excluded.mgmt_ip,serial_numbers=excluded.serial_numbers,platform=excluded.platform,"
        "software_version=excluded.software_version,rommon_version=excluded.rommon_version,"
        "config_register=excluded.config_register,mac_address=excluded.mac_address,uptime=excluded.uptime,"
        "software_image=excluded.software_image,reload_reason=excluded.reload_reason,"
        "device_family=excluded.device_family,last_crawled_ms=excluded.last_crawled_ms,"
        "crawl_status=excluded.crawl_status,crawl_error=excluded.crawl_error;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.hostname);
    BindText(st, 2, r.mgmt_ip);
    BindText(st, 3, util::Join(r.serial_numbers, std::string(1, kListSeparator)));
    BindText(st, 4, util::Join(r.platform, std::string(1, kListSeparator)));
    BindText(st, 5, r.software_version);
    BindText(st, 6, r.rommon_version);
    BindText(st, 7, r.config_register);
    BindText(st, 8, r.mac_address);
    BindText(st, 9, r.uptime);
    BindText(st, 10, r.software_image);
    BindText(st, 11, r.reload_reason);
    BindText(st, 12, r.device_family);
    BindU64(st, 13, r.last_crawled_ms);
    BindI32(st, 14, static_cast<int>(r.crawl_status));
    BindText(st, 15, r.crawl_error);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::optional<model::DeviceRecord>
SqliteRepository::GetDevice(Transaction& t, const std::string& hostname) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kDeviceColumns + " FROM devices WHERE hostname=?;";

    sqlite3_stmt* st = PrepareRead(db, sql);
    BindText(st, 1, hostname);
    return ReadOne<model::DeviceRecord>(db, st, ReadDevice);
}

std::vector<model::DeviceRecord> SqliteRepository::ListDevices(Transaction& t) {
    const std::string sql = std::string("SELECT ") + kDeviceColumns + " FROM devices ORDER BY hostname;";
    return CollectRows<model::DeviceRecord>(TX(t).Handle(), sql, ReadDevice);
}

Result SqliteRepository::DeleteAllDevices(Transaction& t) {
    return ExecSimple(t, "DELETE FROM devices;");
}

// ------------------------------------------------------------------
// Edges
// ------------------------------------------------------------------

Result SqliteRepository::UpsertEdge(Transaction& t, const model::NeighborEdgeRecord& r) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("INSERT INTO neighbor_edges(") + kEdgeColumns +
        ") VALUES(?,?,?,?,?,?) "
        "ON CONFLICT(from_hostname,to_hostname,local_interface) DO UPDATE SET "
        "neighbor_interface=excluded.neighbor_interface,platform=excluded.platform,"
        "discovered_at_ms=excluded.discovered_at_ms;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.from_hostname);
    BindText(st, 2, r.to_hostname);
    BindText(st, 3, r.local_interface);
    BindText(st, 4, r.neighbor_interface);
    BindText(st, 5, r.platform);
    BindU64(st, 6, r.discovered_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::vector<model::NeighborEdgeRecord> SqliteRepository::ListEdges(Transaction& t) {
    const std::string sql = std::string("SELECT ") + kEdgeColumns +
        " FROM neighbor_edges ORDER BY from_hostname,to_hostname,local_interface;";
    return CollectRows<model::NeighborEdgeRecord>(TX(t).Handle(), sql, ReadEdge);
}

Result SqliteRepository::DeleteAllEdges(Transaction& t) {
    return ExecSimple(t, "DELETE FROM neighbor_edges;");
}

} // namespace netcrawl::db::sqlite
