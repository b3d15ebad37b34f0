#pragma once

#include <arrow/result.h>
#include <arrow/status.h>

#include <string>

#include "internal/util/errors.hpp"

namespace upload::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw util::StorageError
*/
template <typename T>
T Unwrap(arrow::Result<T> result, const std::string& context = {}) {
  if (!result.ok()) throw util::StorageError(context.empty() ? result.status().ToString() : context + ": " + result.status().ToString());
  return std::move(result).ValueUnsafe();
}

inline void Unwrap(const arrow::Status& status, const std::string& context = {}) {
  if (!status.ok()) throw util::StorageError(context.empty() ? status.ToString() : context + ": " + status.ToString());
}

} // namespace upload::storage::common
