/**
 * @file datetime.cpp
 * @brief Timestamp parsing, formatting, and JSON decoding.
 */

#include "datetime.hpp"

#include <cstdio>
#include <limits>
#include <string>

namespace hubrep {

namespace {

constexpr std::int64_t kSecondsPerDay = 86400;

/**
 * Number of days since 1970-01-01 for a proleptic Gregorian date.
 *
 * @param y Calendar year.
 * @param m Month in the range [1, 12].
 * @param d Day of month in the range [1, 31].
 * @return Days relative to the Unix epoch, negative before it.
 */
std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
  y -= m <= 2 ? 1 : 0;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const auto yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

struct CivilDate {
  std::int64_t year;
  unsigned month;
  unsigned day;
};

/// Inverse of days_from_civil().
CivilDate civil_from_days(std::int64_t z) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const auto doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  return {y + (m <= 2 ? 1 : 0), m, d};
}

bool is_leap_year(std::int64_t y) {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned days_in_month(std::int64_t y, unsigned m) {
  static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30,
                                       31, 31, 30, 31, 30, 31};
  if (m == 2 && is_leap_year(y)) {
    return 29;
  }
  return kDays[m - 1];
}

std::string kind_of(const nlohmann::json &node) {
  switch (node.type()) {
  case nlohmann::json::value_t::null:
    return "null";
  case nlohmann::json::value_t::boolean:
    return std::string("boolean `") + (node.get<bool>() ? "true" : "false") +
           "`";
  case nlohmann::json::value_t::number_float:
    return "floating point `" + node.dump() + "`";
  case nlohmann::json::value_t::object:
    return "map";
  case nlohmann::json::value_t::array:
    return "sequence";
  case nlohmann::json::value_t::binary:
    return "byte array";
  case nlohmann::json::value_t::string:
    return "string " + node.dump();
  case nlohmann::json::value_t::number_integer:
  case nlohmann::json::value_t::number_unsigned:
    return "integer `" + node.dump() + "`";
  case nlohmann::json::value_t::discarded:
    break;
  }
  return "discarded value";
}

TimestampError format_mismatch(const nlohmann::json &node) {
  return TimestampError(
      TimestampErrorKind::FormatMismatch,
      "invalid type: " + kind_of(node) +
          ", expected date time string or seconds since unix epoch");
}

/**
 * Cursor over an RFC 3339 string producing the diagnostics used for
 * ParseFailure errors.
 */
class Rfc3339Reader {
public:
  explicit Rfc3339Reader(const std::string &text) : text_(text) {}

  bool at_end() const { return pos_ >= text_.size(); }

  char peek() const {
    if (at_end()) {
      fail_short();
    }
    return text_[pos_];
  }

  /// Read exactly @p width decimal digits.
  unsigned digits(std::size_t width) {
    unsigned value = 0;
    for (std::size_t i = 0; i < width; ++i) {
      char c = peek();
      if (c < '0' || c > '9') {
        fail_invalid();
      }
      value = value * 10 + static_cast<unsigned>(c - '0');
      ++pos_;
    }
    return value;
  }

  void expect(char c) {
    if (peek() != c) {
      fail_invalid();
    }
    ++pos_;
  }

  /// Skip an optional fraction; only whole seconds are kept.
  void skip_fraction() {
    if (at_end() || text_[pos_] != '.') {
      return;
    }
    ++pos_;
    std::size_t start = pos_;
    while (!at_end() && text_[pos_] >= '0' && text_[pos_] <= '9') {
      ++pos_;
    }
    if (pos_ == start) {
      at_end() ? fail_short() : fail_invalid();
    }
  }

  void advance() { ++pos_; }

  [[noreturn]] static void fail_short() {
    throw TimestampError(TimestampErrorKind::ParseFailure,
                         "premature end of input");
  }
  [[noreturn]] static void fail_invalid() {
    throw TimestampError(TimestampErrorKind::ParseFailure,
                         "input contains invalid characters");
  }
  [[noreturn]] static void fail_range() {
    throw TimestampError(TimestampErrorKind::ParseFailure,
                         "input is out of range");
  }
  [[noreturn]] static void fail_trailing() {
    throw TimestampError(TimestampErrorKind::ParseFailure, "trailing input");
  }

private:
  const std::string &text_;
  std::size_t pos_{0};
};

/// Outcome of mapping epoch seconds onto the UTC calendar.
struct Resolution {
  enum class Kind { None, Single, Ambiguous } kind;
  std::int64_t earliest{0};
  std::int64_t latest{0};
};

Resolution resolve_utc(std::int64_t seconds) {
  if (seconds < Timestamp::kMinEpochSeconds ||
      seconds > Timestamp::kMaxEpochSeconds) {
    return {Resolution::Kind::None};
  }
  // UTC has a fixed offset, so every legal value maps to one instant.
  return {Resolution::Kind::Single, seconds, seconds};
}

Timestamp from_integer(std::int64_t value) {
  Resolution r = resolve_utc(value);
  switch (r.kind) {
  case Resolution::Kind::None:
    throw TimestampError(TimestampErrorKind::IllegalInstant,
                         "value is not a legal timestamp: " +
                             std::to_string(value));
  case Resolution::Kind::Ambiguous: {
    auto earliest = Timestamp::from_epoch_seconds(r.earliest);
    auto latest = Timestamp::from_epoch_seconds(r.latest);
    throw TimestampError("value is an ambiguous timestamp: " +
                             std::to_string(value) + ", could be either of " +
                             earliest.to_string() + ", " + latest.to_string(),
                         earliest, latest);
  }
  case Resolution::Kind::Single:
    break;
  }
  return Timestamp::from_epoch_seconds(r.earliest);
}

Timestamp from_unsigned(std::uint64_t value) {
  if (value >
      static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
    throw TimestampError(TimestampErrorKind::RangeFailure,
                         "invalid value: integer `" + std::to_string(value) +
                             "`, expected i64");
  }
  return from_integer(static_cast<std::int64_t>(value));
}

} // namespace

const char *to_string(TimestampErrorKind kind) {
  switch (kind) {
  case TimestampErrorKind::FormatMismatch:
    return "format_mismatch";
  case TimestampErrorKind::ParseFailure:
    return "parse_failure";
  case TimestampErrorKind::RangeFailure:
    return "range_failure";
  case TimestampErrorKind::IllegalInstant:
    return "illegal_instant";
  case TimestampErrorKind::AmbiguousInstant:
    return "ambiguous_instant";
  }
  return "unknown";
}

TimestampError::TimestampError(TimestampErrorKind kind,
                               const std::string &message)
    : std::runtime_error(message), kind_(kind) {}

TimestampError::TimestampError(const std::string &message,
                               const Timestamp &earliest,
                               const Timestamp &latest)
    : std::runtime_error(message), kind_(TimestampErrorKind::AmbiguousInstant),
      has_candidates_(true), earliest_(earliest.epoch_seconds()),
      latest_(latest.epoch_seconds()) {}

std::optional<std::pair<Timestamp, Timestamp>>
TimestampError::candidates() const {
  if (!has_candidates_) {
    return std::nullopt;
  }
  return std::make_pair(Timestamp(earliest_), Timestamp(latest_));
}

Timestamp Timestamp::from_epoch_seconds(std::int64_t seconds) {
  if (seconds < kMinEpochSeconds || seconds > kMaxEpochSeconds) {
    throw TimestampError(TimestampErrorKind::IllegalInstant,
                         "value is not a legal timestamp: " +
                             std::to_string(seconds));
  }
  return Timestamp(seconds);
}

/**
 * Parse `YYYY-MM-DD(T|t| )HH:MM:SS[.frac](Z|z|+HH:MM|-HH:MM|+HHMM|-HHMM)`.
 *
 * A leap second (`:60`) folds onto second 59 of the same minute.
 */
Timestamp Timestamp::parse(const std::string &text) {
  Rfc3339Reader in(text);
  const unsigned year = in.digits(4);
  in.expect('-');
  const unsigned month = in.digits(2);
  in.expect('-');
  const unsigned day = in.digits(2);
  const char sep = in.peek();
  if (sep != 'T' && sep != 't' && sep != ' ') {
    Rfc3339Reader::fail_invalid();
  }
  in.advance();
  const unsigned hour = in.digits(2);
  in.expect(':');
  const unsigned minute = in.digits(2);
  in.expect(':');
  unsigned second = in.digits(2);
  in.skip_fraction();

  std::int64_t offset = 0;
  const char tz = in.peek();
  if (tz == 'Z' || tz == 'z') {
    in.advance();
  } else if (tz == '+' || tz == '-') {
    in.advance();
    const unsigned off_hour = in.digits(2);
    if (!in.at_end() && in.peek() == ':') {
      in.advance();
    }
    const unsigned off_minute = in.digits(2);
    if (off_hour > 23 || off_minute > 59) {
      Rfc3339Reader::fail_range();
    }
    offset = static_cast<std::int64_t>(off_hour) * 3600 + off_minute * 60;
    if (tz == '-') {
      offset = -offset;
    }
  } else {
    Rfc3339Reader::fail_invalid();
  }
  if (!in.at_end()) {
    Rfc3339Reader::fail_trailing();
  }

  if (month < 1 || month > 12 || day < 1 ||
      day > days_in_month(year, month) || hour > 23 || minute > 59 ||
      second > 60) {
    Rfc3339Reader::fail_range();
  }
  if (second == 60) {
    second = 59;
  }

  const std::int64_t local = days_from_civil(year, month, day) * kSecondsPerDay +
                             static_cast<std::int64_t>(hour) * 3600 +
                             minute * 60 + second;
  const std::int64_t utc = local - offset;
  if (utc < kMinEpochSeconds || utc > kMaxEpochSeconds) {
    Rfc3339Reader::fail_range();
  }
  return Timestamp(utc);
}

Timestamp
Timestamp::from_time_point(std::chrono::system_clock::time_point tp) {
  auto secs = std::chrono::floor<std::chrono::seconds>(tp.time_since_epoch());
  return from_epoch_seconds(secs.count());
}

Timestamp Timestamp::now() {
  return from_time_point(std::chrono::system_clock::now());
}

std::string Timestamp::to_string() const {
  std::int64_t days = seconds_ / kSecondsPerDay;
  std::int64_t rem = seconds_ % kSecondsPerDay;
  if (rem < 0) {
    rem += kSecondsPerDay;
    --days;
  }
  const CivilDate date = civil_from_days(days);
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02uT%02d:%02d:%02dZ",
                static_cast<long long>(date.year), date.month, date.day,
                static_cast<int>(rem / 3600), static_cast<int>(rem % 3600 / 60),
                static_cast<int>(rem % 60));
  return buffer;
}

std::ostream &operator<<(std::ostream &os, const Timestamp &ts) {
  return os << ts.to_string();
}

Timestamp decode_timestamp(const nlohmann::json &node,
                           const DecodeContext &ctx) {
  switch (node.type()) {
  case nlohmann::json::value_t::string:
    if (!ctx.human_readable) {
      throw format_mismatch(node);
    }
    return Timestamp::parse(node.get_ref<const std::string &>());
  case nlohmann::json::value_t::number_integer:
    return from_integer(node.get<std::int64_t>());
  case nlohmann::json::value_t::number_unsigned:
    return from_unsigned(node.get<std::uint64_t>());
  default:
    throw format_mismatch(node);
  }
}

void to_json(nlohmann::json &j, const Timestamp &ts) { j = ts.to_string(); }

void from_json(const nlohmann::json &j, Timestamp &ts) {
  ts = decode_timestamp(j, DecodeContext{true});
}

} // namespace hubrep
