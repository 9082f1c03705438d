#pragma once

/// @file kit_result.hpp
/// @brief KitResult<T> type alias for toolkit error handling.

#include "rsk/core/result.hpp"
#include "rsk/foundation/kit_error.hpp"

namespace rsk::foundation {

/// Result type specialized with KitError.
///
/// Every synchronous toolkit call that can fail returns KitResult<T>, and
/// every Future<T> settles with one.
///
/// Example:
/// @code
///   KitResult<std::size_t> parseConcurrency(int raw) {
///       if (raw < 1) {
///           return KitResult<std::size_t>::err(
///               KitError(ErrorCode::InvalidArgument, "concurrency must be >= 1"));
///       }
///       return KitResult<std::size_t>::ok(static_cast<std::size_t>(raw));
///   }
/// @endcode
template <typename T>
using KitResult = rsk::Result<T, KitError>;

}  // namespace rsk::foundation
