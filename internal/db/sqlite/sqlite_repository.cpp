#include "sqlite_repository.hpp"

#include <sqlite3.h>

namespace resource::db::sqlite {

using resource::db::ErrorCode;
using resource::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

static std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* data = sqlite3_column_blob(st, col);
  const int   size = sqlite3_column_bytes(st, col);
  return data ? std::string(static_cast<const char*>(data), static_cast<size_t>(size)) : std::string{};
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static const char* kSourceColumns = "id,properties_json,content_hash,change_counter,sequence,size_bytes,namespace,removed";

static const char* kCompiledColumns = "key,id,platform,compiler_version,source_change_counter,size_bytes,record,last_access_ms";

static model::SourceRow ReadSourceRow(sqlite3_stmt* st) {
  model::SourceRow r;
  r.id                 = ColText(st, 0);
  r.properties_json    = ColText(st, 1);
  r.content_hash       = ColText(st, 2);
  r.change_counter     = ColU64(st, 3);
  r.sequence           = ColU64(st, 4);
  r.size_bytes         = ColU64(st, 5);
  r.resource_namespace = ColText(st, 6);
  r.removed            = sqlite3_column_int(st, 7) != 0;
  return r;
}

static model::CompiledRow ReadCompiledRow(sqlite3_stmt* st) {
  model::CompiledRow r;
  r.key                   = ColText(st, 0);
  r.id                    = ColText(st, 1);
  r.platform              = ColU64(st, 2);
  r.compiler_version      = static_cast<uint32_t>(ColU64(st, 3));
  r.source_change_counter = ColU64(st, 4);
  r.size_bytes            = ColU64(st, 5);
  r.record                = ColBlob(st, 6);
  r.last_access_ms        = ColU64(st, 7);
  return r;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

void SqliteRepository::BootstrapSchema(SqliteDB& db) {
  db.Exec(
      "CREATE TABLE IF NOT EXISTS source_resource (id TEXT PRIMARY KEY, properties_json TEXT NOT NULL, content_hash TEXT NOT NULL, "
      "change_counter INTEGER NOT NULL, sequence INTEGER NOT NULL, size_bytes INTEGER NOT NULL, namespace TEXT NOT NULL, "
      "removed INTEGER NOT NULL DEFAULT 0);");
  db.Exec(
      "CREATE TABLE IF NOT EXISTS compiled_resource (key TEXT PRIMARY KEY, id TEXT NOT NULL, platform INTEGER NOT NULL, "
      "compiler_version INTEGER NOT NULL, source_change_counter INTEGER NOT NULL, size_bytes INTEGER NOT NULL, record BLOB NOT NULL, "
      "last_access_ms INTEGER NOT NULL);");
  db.Exec("CREATE INDEX IF NOT EXISTS compiled_resource_id ON compiled_resource(id);");

  db.Exec(std::string("SELECT ") + kSourceColumns + " FROM source_resource LIMIT 1;");
  db.Exec(std::string("SELECT ") + kCompiledColumns + " FROM compiled_resource LIMIT 1;");
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc) {
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

// ------------------------------------------------------------------
// Source
// ------------------------------------------------------------------

Result SqliteRepository::UpsertSource(Transaction& t, const model::SourceRow& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO source_resource(id,properties_json,content_hash,change_counter,sequence,size_bytes,namespace,removed) "
      "VALUES(?,?,?,?,?,?,?,?) ON CONFLICT(id) DO UPDATE SET properties_json=excluded.properties_json, "
      "content_hash=excluded.content_hash, change_counter=excluded.change_counter, sequence=excluded.sequence, "
      "size_bytes=excluded.size_bytes, namespace=excluded.namespace, removed=excluded.removed;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, r.id);
  BindText(st, 2, r.properties_json);
  BindText(st, 3, r.content_hash);
  BindU64(st, 4, r.change_counter);
  BindU64(st, 5, r.sequence);
  BindU64(st, 6, r.size_bytes);
  BindText(st, 7, r.resource_namespace);
  sqlite3_bind_int(st, 8, r.removed ? 1 : 0);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  return Translate(db, rc);
}

std::optional<model::SourceRow> SqliteRepository::GetSource(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kSourceColumns + " FROM source_resource WHERE id=?;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) return std::nullopt;

  BindText(st, 1, id);

  if (sqlite3_step(st) != SQLITE_ROW) {
    sqlite3_finalize(st);
    return std::nullopt;
  }

  auto r = ReadSourceRow(st);
  sqlite3_finalize(st);
  return r;
}

std::vector<model::SourceRow> SqliteRepository::ListSources(Transaction& t) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kSourceColumns + " FROM source_resource;";

  std::vector<model::SourceRow> rows;
  sqlite3_stmt*                 st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) return rows;

  while (sqlite3_step(st) == SQLITE_ROW) {
    rows.push_back(ReadSourceRow(st));
  }
  sqlite3_finalize(st);
  return rows;
}

// ------------------------------------------------------------------
// Compiled
// ------------------------------------------------------------------

Result SqliteRepository::UpsertCompiled(Transaction& t, const model::CompiledRow& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO compiled_resource(key,id,platform,compiler_version,source_change_counter,size_bytes,record,last_access_ms) "
      "VALUES(?,?,?,?,?,?,?,?) ON CONFLICT(key) DO UPDATE SET source_change_counter=excluded.source_change_counter, "
      "size_bytes=excluded.size_bytes, record=excluded.record, last_access_ms=excluded.last_access_ms;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, r.key);
  BindText(st, 2, r.id);
  BindU64(st, 3, r.platform);
  BindU64(st, 4, r.compiler_version);
  BindU64(st, 5, r.source_change_counter);
  BindU64(st, 6, r.size_bytes);
  BindBlob(st, 7, r.record);
  BindU64(st, 8, r.last_access_ms);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  return Translate(db, rc);
}

std::optional<model::CompiledRow> SqliteRepository::GetCompiled(Transaction& t, const std::string& key) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kCompiledColumns + " FROM compiled_resource WHERE key=?;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) return std::nullopt;

  BindText(st, 1, key);

  if (sqlite3_step(st) != SQLITE_ROW) {
    sqlite3_finalize(st);
    return std::nullopt;
  }

  auto r = ReadCompiledRow(st);
  sqlite3_finalize(st);
  return r;
}

std::vector<model::CompiledRow> SqliteRepository::ListCompiled(Transaction& t) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kCompiledColumns + " FROM compiled_resource ORDER BY key;";

  std::vector<model::CompiledRow> rows;
  sqlite3_stmt*                   st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) return rows;

  while (sqlite3_step(st) == SQLITE_ROW) {
    rows.push_back(ReadCompiledRow(st));
  }
  sqlite3_finalize(st);
  return rows;
}

std::vector<model::CompiledRow> SqliteRepository::ListCompiledFor(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kCompiledColumns + " FROM compiled_resource WHERE id=? ORDER BY key;";

  std::vector<model::CompiledRow> rows;
  sqlite3_stmt*                   st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) return rows;

  BindText(st, 1, id);
  while (sqlite3_step(st) == SQLITE_ROW) {
    rows.push_back(ReadCompiledRow(st));
  }
  sqlite3_finalize(st);
  return rows;
}

Result SqliteRepository::TouchCompiled(Transaction& t, const std::string& key, uint64_t last_access_ms) {
  auto* db = TX(t).Handle();

  const char* sql = "UPDATE compiled_resource SET last_access_ms=? WHERE key=?;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st, 1, last_access_ms);
  BindText(st, 2, key);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, key);
  return Translate(db, rc);
}

Result SqliteRepository::DeleteCompiled(Transaction& t, const std::string& key) {
  auto* db = TX(t).Handle();

  const char* sql = "DELETE FROM compiled_resource WHERE key=?;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, key);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  return Translate(db, rc);
}

} // namespace resource::db::sqlite
