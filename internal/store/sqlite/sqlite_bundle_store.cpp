#include "sqlite_bundle_store.hpp"

#include <sqlite3.h>

#include <exception>
#include <memory>

#include "internal/util/time.hpp"

namespace workbundle::store::sqlite {

namespace {

using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

constexpr const char* kBootstrapSql =
    "CREATE TABLE IF NOT EXISTS work_bundle ("
    " target_location TEXT NOT NULL,"
    " name TEXT NOT NULL,"
    " resource_version INTEGER NOT NULL,"
    " created_at_ms INTEGER NOT NULL,"
    " spec BLOB NOT NULL,"
    " status BLOB NOT NULL,"
    " PRIMARY KEY (target_location, name));";

StatementPtr Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    return StatementPtr(nullptr, &sqlite3_finalize);
  }
  return StatementPtr(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& bytes) {
  sqlite3_bind_blob(st, idx, bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* data = sqlite3_column_blob(st, col);
  const int   size = sqlite3_column_bytes(st, col);
  return data ? std::string(static_cast<const char*>(data), static_cast<std::size_t>(size)) : std::string();
}

// Spec column: everything except the store-owned fields and status.
std::string SerializeSpec(const workbundle::v1::WorkBundle& bundle) {
  workbundle::v1::WorkBundle spec = bundle;
  spec.clear_resource_version();
  spec.clear_created_at_ms();
  spec.clear_status();
  return spec.SerializeAsString();
}

std::string NotFoundMessage(const std::string& name, const std::string& target_location) {
  return "bundle " + name + " not found in " + target_location;
}

} // namespace

SqliteBundleStore::SqliteBundleStore(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

void SqliteBundleStore::Bootstrap() {
  std::scoped_lock lock(mutex_);
  db_->Exec(kBootstrapSql);
}

Result SqliteBundleStore::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Unavailable, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

Result SqliteBundleStore::GetLocked(const std::string& name, const std::string& target_location, workbundle::v1::WorkBundle* out) {
  auto* db = db_->Handle();
  auto  st = Prepare(db,
                     "SELECT resource_version, created_at_ms, spec, status FROM work_bundle "
                      "WHERE target_location = ? AND name = ?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, target_location);
  BindText(st.get(), 2, name);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return Result::Err(ErrorCode::NotFound, NotFoundMessage(name, target_location));
  if (rc != SQLITE_ROW) return Translate(db, rc);

  if (!out) return Result::Ok();

  workbundle::v1::WorkBundle bundle;
  if (!bundle.ParseFromString(ColBlob(st.get(), 2))) {
    return Result::Err(ErrorCode::Corruption, "unreadable spec for bundle " + name);
  }
  if (!bundle.mutable_status()->ParseFromString(ColBlob(st.get(), 3))) {
    return Result::Err(ErrorCode::Corruption, "unreadable status for bundle " + name);
  }
  bundle.set_resource_version(ColU64(st.get(), 0));
  bundle.set_created_at_ms(ColU64(st.get(), 1));

  *out = std::move(bundle);
  return Result::Ok();
}

Result SqliteBundleStore::Get(const CallContext& ctx, const std::string& name, const std::string& target_location,
                              workbundle::v1::WorkBundle* out) {
  if (auto check = ctx.Check(); !check) return check;

  std::scoped_lock lock(mutex_);
  return GetLocked(name, target_location, out);
}

Result SqliteBundleStore::Create(const CallContext& ctx, workbundle::v1::WorkBundle& bundle) {
  if (auto check = ctx.Check(); !check) return check;

  std::scoped_lock lock(mutex_);
  auto*            db = db_->Handle();
  auto             st = Prepare(db,
                                "INSERT INTO work_bundle(target_location, name, resource_version, created_at_ms, spec, status) "
                                            "VALUES(?, ?, 1, ?, ?, ?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  const auto created_at_ms = util::NowUnixMillis();
  BindText(st.get(), 1, bundle.target_location());
  BindText(st.get(), 2, bundle.name());
  BindU64(st.get(), 3, created_at_ms);
  BindBlob(st.get(), 4, SerializeSpec(bundle));
  BindBlob(st.get(), 5, workbundle::v1::BundleStatus().SerializeAsString());

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) {
    auto result = Translate(db, rc);
    if (result.code == ErrorCode::AlreadyExists) {
      result.message = "bundle " + bundle.name() + " already exists in " + bundle.target_location();
    }
    return result;
  }

  bundle.set_resource_version(1);
  bundle.set_created_at_ms(created_at_ms);
  bundle.clear_status();
  return Result::Ok();
}

Result SqliteBundleStore::ConditionalWrite(const CallContext& ctx, workbundle::v1::WorkBundle& bundle, const char* sql,
                                           const std::string& blob) {
  if (auto check = ctx.Check(); !check) return check;

  std::scoped_lock lock(mutex_);
  try {
    SqliteTransaction tx(db_);
    auto*             db = tx.Handle();

    auto st = Prepare(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindBlob(st.get(), 1, blob);
    BindText(st.get(), 2, bundle.target_location());
    BindText(st.get(), 3, bundle.name());
    BindU64(st.get(), 4, bundle.resource_version());

    const int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    if (sqlite3_changes(db) == 0) {
      workbundle::v1::WorkBundle current;
      auto                       existing = GetLocked(bundle.name(), bundle.target_location(), &current);
      if (!existing) return existing;
      return Result::Err(ErrorCode::Conflict, "stale resource_version " + std::to_string(bundle.resource_version()) + ", current " +
                                                  std::to_string(current.resource_version()));
    }

    workbundle::v1::WorkBundle stored;
    auto                       reread = GetLocked(bundle.name(), bundle.target_location(), &stored);
    if (!reread) return reread;

    tx.Commit();
    bundle = std::move(stored);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Result::Err(ErrorCode::Unavailable, e.what());
  }
}

Result SqliteBundleStore::Update(const CallContext& ctx, workbundle::v1::WorkBundle& bundle) {
  return ConditionalWrite(ctx, bundle,
                          "UPDATE work_bundle SET spec = ?, resource_version = resource_version + 1 "
                          "WHERE target_location = ? AND name = ? AND resource_version = ?;",
                          SerializeSpec(bundle));
}

Result SqliteBundleStore::UpdateStatus(const CallContext& ctx, workbundle::v1::WorkBundle& bundle) {
  return ConditionalWrite(ctx, bundle,
                          "UPDATE work_bundle SET status = ?, resource_version = resource_version + 1 "
                          "WHERE target_location = ? AND name = ? AND resource_version = ?;",
                          bundle.status().SerializeAsString());
}

Result SqliteBundleStore::Delete(const CallContext& ctx, const std::string& name, const std::string& target_location) {
  if (auto check = ctx.Check(); !check) return check;

  std::scoped_lock lock(mutex_);
  auto*            db = db_->Handle();
  auto             st = Prepare(db, "DELETE FROM work_bundle WHERE target_location = ? AND name = ?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, target_location);
  BindText(st.get(), 2, name);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, NotFoundMessage(name, target_location));
  return Result::Ok();
}

} // namespace workbundle::store::sqlite
