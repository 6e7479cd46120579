#pragma once

#include <type_traits>
#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"

namespace usbforge::db {

inline constexpr int kDefaultCommitAttempts = 8;

/*
  Runs fn(tx) in a fresh transaction and commits it.

  A commit that loses an optimistic race (util::TransactionConflict) is
  retried from scratch with a new snapshot; any other exception rolls back
  and propagates.
*/
template <typename Fn>
auto RunInTransaction(Repository& repo, Fn&& fn, int max_attempts = kDefaultCommitAttempts)
    -> std::invoke_result_t<Fn&, Transaction&> {
  using R = std::invoke_result_t<Fn&, Transaction&>;

  for (int attempt = 1;; ++attempt) {
    try {
      auto tx = repo.Begin();
      if constexpr (std::is_void_v<R>) {
        fn(*tx);
        if (!tx->IsCommitted()) tx->Commit();
        return;
      } else {
        R result = fn(*tx);
        if (!tx->IsCommitted()) tx->Commit();
        return result;
      }
    } catch (const util::TransactionConflict&) {
      if (attempt >= max_attempts) throw;
    }
  }
}

} // namespace usbforge::db
