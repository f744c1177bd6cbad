#include "internal/db/api/tx_runner.hpp"

#include <stdexcept>

namespace prdchat::db {

void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  if (result.Retryable()) {
    throw util::TransactionConflict(message);
  }
  switch (result.code) {
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::Conflict:
      throw util::InvalidStage(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace prdchat::db
