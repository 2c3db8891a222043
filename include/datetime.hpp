/**
 * @file datetime.hpp
 * @brief UTC timestamps decoded from either date-time strings or epoch
 * seconds.
 *
 * GitHub is inconsistent in how it reports dates and times: some endpoints
 * return an RFC 3339 string while others return the number of seconds since
 * the Unix epoch. Timestamp accepts both and normalizes them to one instant.
 */

#ifndef HUBREP_DATETIME_HPP
#define HUBREP_DATETIME_HPP

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace hubrep {

/// Hints from the surrounding decoder about the payload encoding.
struct DecodeContext {
  /// True for self-describing text formats (JSON), false for compact binary
  /// encodings where timestamps are always integers.
  bool human_readable{true};
};

/// Classification of timestamp decode failures.
enum class TimestampErrorKind {
  FormatMismatch,  ///< Node is neither textual nor an integer.
  ParseFailure,    ///< Text does not follow the date-time grammar.
  RangeFailure,    ///< Integer does not fit in signed 64-bit seconds.
  IllegalInstant,  ///< Integer maps to no representable instant.
  AmbiguousInstant ///< Integer maps to more than one instant.
};

/// Lower-case name of an error kind, e.g. "parse_failure".
const char *to_string(TimestampErrorKind kind);

class Timestamp;

/**
 * Raised when a value cannot be interpreted as a timestamp.
 */
class TimestampError : public std::runtime_error {
public:
  TimestampError(TimestampErrorKind kind, const std::string &message);

  /// Construct an ambiguity error carrying both candidate instants.
  TimestampError(const std::string &message, const Timestamp &earliest,
                 const Timestamp &latest);

  TimestampErrorKind kind() const noexcept { return kind_; }

  /**
   * Candidate instants for an AmbiguousInstant failure.
   *
   * @return Earliest and latest candidate, or `std::nullopt` for any other
   *         kind of failure.
   */
  std::optional<std::pair<Timestamp, Timestamp>> candidates() const;

private:
  TimestampErrorKind kind_;
  bool has_candidates_{false};
  std::int64_t earliest_{0};
  std::int64_t latest_{0};
};

/**
 * A single instant in UTC, accurate to the second.
 *
 * Instances are immutable. Only instants between 0000-01-01T00:00:00Z and
 * 9999-12-31T23:59:59Z are legal so that every value can be written with a
 * four digit year and parsed back unchanged.
 */
class Timestamp {
public:
  /// Whole-second time point on the system clock.
  using time_point =
      std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>;

  /// Smallest legal value in seconds since the epoch.
  static constexpr std::int64_t kMinEpochSeconds = -62167219200LL;
  /// Largest legal value in seconds since the epoch.
  static constexpr std::int64_t kMaxEpochSeconds = 253402300799LL;

  /// The Unix epoch.
  Timestamp() = default;

  /**
   * Build a timestamp from seconds since the Unix epoch.
   *
   * @throws TimestampError With kind IllegalInstant when @p seconds is
   *         outside the legal range.
   */
  static Timestamp from_epoch_seconds(std::int64_t seconds);

  /**
   * Parse an RFC 3339 date-time such as `2011-01-26T19:01:12Z` or
   * `2011-01-26T21:01:12.250+02:00`.
   *
   * Fractional seconds are truncated and offsets are folded into UTC.
   *
   * @throws TimestampError With kind ParseFailure on malformed input.
   */
  static Timestamp parse(const std::string &text);

  /// Convert a system clock time point, truncating to whole seconds.
  static Timestamp from_time_point(std::chrono::system_clock::time_point tp);

  /// Current time truncated to the second.
  static Timestamp now();

  std::int64_t epoch_seconds() const noexcept { return seconds_; }

  time_point to_time_point() const {
    return time_point{std::chrono::seconds{seconds_}};
  }

  /// RFC 3339 form in UTC, e.g. `2011-01-26T19:01:12Z`.
  std::string to_string() const;

  friend bool operator==(const Timestamp &a, const Timestamp &b) noexcept {
    return a.seconds_ == b.seconds_;
  }
  friend bool operator!=(const Timestamp &a, const Timestamp &b) noexcept {
    return a.seconds_ != b.seconds_;
  }
  friend bool operator<(const Timestamp &a, const Timestamp &b) noexcept {
    return a.seconds_ < b.seconds_;
  }
  friend bool operator<=(const Timestamp &a, const Timestamp &b) noexcept {
    return a.seconds_ <= b.seconds_;
  }
  friend bool operator>(const Timestamp &a, const Timestamp &b) noexcept {
    return a.seconds_ > b.seconds_;
  }
  friend bool operator>=(const Timestamp &a, const Timestamp &b) noexcept {
    return a.seconds_ >= b.seconds_;
  }

private:
  friend class TimestampError;

  explicit Timestamp(std::int64_t seconds) : seconds_(seconds) {}

  std::int64_t seconds_{0};
};

std::ostream &operator<<(std::ostream &os, const Timestamp &ts);

/**
 * Decode a timestamp from a JSON value node.
 *
 * Strings are parsed as RFC 3339 date-times and integers as seconds since
 * the Unix epoch. When @p ctx is not human readable only the integer form is
 * accepted.
 *
 * @param node Value taken from a decoded payload.
 * @param ctx Encoding hints supplied by the caller.
 * @return Canonical UTC instant.
 * @throws TimestampError Describing why the node was rejected.
 */
Timestamp decode_timestamp(const nlohmann::json &node,
                           const DecodeContext &ctx = {});

/// Serialize as an RFC 3339 string.
void to_json(nlohmann::json &j, const Timestamp &ts);

/// Deserialize from a JSON text document, accepting either representation.
void from_json(const nlohmann::json &j, Timestamp &ts);

} // namespace hubrep

#endif // HUBREP_DATETIME_HPP
