#include "pg_tx.hpp"

#include "internal/util/errors.hpp"

namespace usbforge::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  conn_ = pool->Acquire();
  tx_ = std::make_unique<pqxx::work>(*conn_);
}

// pqxx::work aborts on destruction if still open
PgTransaction::~PgTransaction() = default;

void PgTransaction::Commit() {
  if (finished_) throw util::InvalidState("transaction already finished");
  try {
    tx_->commit();
  } catch (const pqxx::serialization_failure& e) {
    finished_ = true;
    throw util::TransactionConflict(e.what());
  } catch (const pqxx::deadlock_detected& e) {
    finished_ = true;
    throw util::TransactionConflict(e.what());
  } catch (const pqxx::failure& e) {
    finished_ = true;
    throw util::StorageError(e.what());
  }
  finished_ = true;
}

void PgTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  tx_->abort();
}

}
