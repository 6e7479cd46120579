#include "sqlite_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace usbforge::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)), lock_(db_->TransactionMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      USBFORGE_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  if (finished_) throw util::InvalidState("transaction already finished");
  db_->Exec("COMMIT;");
  finished_ = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  db_->Exec("ROLLBACK;");
  lock_.unlock();
}

} // namespace usbforge::db::sqlite
