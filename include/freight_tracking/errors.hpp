// === Error Taxonomy ==========================================================
//
// Exception types raised by the tracking core. Every error derives from
// `TrackingError` so callers can handle the whole family in one place while
// still distinguishing, for example, a timeout from an unknown entity.

#pragma once

#include <stdexcept>
#include <string>

namespace freight_tracking {

/** @brief Common base for all tracking failures. */
class TrackingError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief Malformed sample or argument; nothing was persisted. */
class ValidationError final : public TrackingError {
  public:
    using TrackingError::TrackingError;
};

/** @brief Duplicate write under the configured uniqueness constraint. */
class ConflictError final : public TrackingError {
  public:
    using TrackingError::TrackingError;
};

/** @brief The entity (or load) is unknown to the system. */
class NotFoundError final : public TrackingError {
  public:
    using TrackingError::TrackingError;
};

/** @brief A store or routing call exceeded its deadline. */
class TimeoutError final : public TrackingError {
  public:
    using TrackingError::TrackingError;
};

/** @brief No current position exists to compute an ETA from. */
class PositionUnavailableError final : public TrackingError {
  public:
    using TrackingError::TrackingError;
};

/** @brief Transport-level failure on the push connection. */
class ConnectionError final : public TrackingError {
  public:
    using TrackingError::TrackingError;
};

}  // namespace freight_tracking
