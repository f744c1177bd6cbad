#pragma once

#include <string>
#include <thread>
#include <type_traits>
#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"

namespace prdchat::db {

inline constexpr int kDefaultTxAttempts = 1000;

// Translates a failed Result into the matching util exception.
void ThrowIfDbError(const Result& result, const std::string& context);

/*
  Runs fn(tx) in a fresh transaction and commits it.

  A util::TransactionConflict raised by fn or by Commit() restarts the
  whole unit with a new snapshot, up to max_attempts times.
*/
template <typename Fn>
auto RunInTransaction(Repository& repository, Fn&& fn, int max_attempts = kDefaultTxAttempts) {
  for (int attempt = 1;; ++attempt) {
    try {
      auto tx = repository.Begin();
      if constexpr (std::is_void_v<decltype(fn(*tx))>) {
        fn(*tx);
        tx->Commit();
        return;
      } else {
        auto value = fn(*tx);
        tx->Commit();
        return value;
      }
    } catch (const util::TransactionConflict&) {
      if (attempt >= max_attempts) {
        throw;
      }
      std::this_thread::yield();
    }
  }
}

} // namespace prdchat::db
