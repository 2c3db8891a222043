#include "datetime.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <cstdint>
#include <limits>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

using hubrep::DecodeContext;
using hubrep::Timestamp;
using hubrep::TimestampError;
using hubrep::TimestampErrorKind;

namespace {

/// Decode @p node and report the failure, or fail the test if it decodes.
TimestampError decode_failure(const nlohmann::json &node,
                              const DecodeContext &ctx = {}) {
  try {
    Timestamp ts = hubrep::decode_timestamp(node, ctx);
    FAIL("decoded unexpectedly to " << ts);
  } catch (const TimestampError &e) {
    return e;
  }
  throw std::logic_error("unreachable");
}

} // namespace

TEST_CASE("timestamp decodes date time strings", "[datetime]") {
  Timestamp ts = hubrep::decode_timestamp("2011-01-26T19:01:12Z");
  REQUIRE(ts.epoch_seconds() == 1296068472);
  REQUIRE(ts.to_string() == "2011-01-26T19:01:12Z");

  SECTION("offsets are applied") {
    REQUIRE(hubrep::decode_timestamp("2011-01-26T20:01:12+01:00") == ts);
    REQUIRE(hubrep::decode_timestamp("2011-01-26T20:01:12+0100") == ts);
    REQUIRE(hubrep::decode_timestamp("2011-01-26T14:01:12-05:00") == ts);
    REQUIRE(hubrep::decode_timestamp("2011-01-27T00:31:12+05:30") == ts);
  }

  SECTION("separators and zone letters are case insensitive") {
    REQUIRE(hubrep::decode_timestamp("2011-01-26t19:01:12z") == ts);
    REQUIRE(hubrep::decode_timestamp("2011-01-26 19:01:12Z") == ts);
  }

  SECTION("fractional seconds are truncated") {
    REQUIRE(hubrep::decode_timestamp("2011-01-26T19:01:12.999Z") == ts);
    REQUIRE(hubrep::decode_timestamp("2011-01-26T19:01:12.000001Z") == ts);
  }

  SECTION("leap second folds onto second 59") {
    Timestamp leap = hubrep::decode_timestamp("2016-12-31T23:59:60Z");
    REQUIRE(leap.epoch_seconds() == 1483228799);
  }

  SECTION("leap days follow the Gregorian calendar") {
    REQUIRE(hubrep::decode_timestamp("2020-02-29T00:00:00Z").epoch_seconds() ==
            1582934400);
    REQUIRE(hubrep::decode_timestamp("2000-02-29T00:00:00Z").to_string() ==
            "2000-02-29T00:00:00Z");
  }
}

TEST_CASE("timestamp decodes epoch seconds", "[datetime]") {
  Timestamp ts = hubrep::decode_timestamp(1296068472);
  REQUIRE(ts.to_string() == "2011-01-26T19:01:12Z");
  REQUIRE(ts == hubrep::decode_timestamp("2011-01-26T19:01:12Z"));

  REQUIRE(hubrep::decode_timestamp(0).to_string() == "1970-01-01T00:00:00Z");
  REQUIRE(hubrep::decode_timestamp(-1).to_string() == "1969-12-31T23:59:59Z");
  REQUIRE(hubrep::decode_timestamp(std::uint64_t{1370037505}).to_string() ==
          "2013-05-31T21:58:25Z");

  SECTION("decoding is deterministic") {
    for (std::int64_t n : {std::int64_t{-86401}, std::int64_t{0},
                           std::int64_t{1356998399}, std::int64_t{4102444800}}) {
      REQUIRE(hubrep::decode_timestamp(n) == hubrep::decode_timestamp(n));
      REQUIRE(hubrep::decode_timestamp(n).epoch_seconds() == n);
    }
  }

  SECTION("consecutive integers are one second apart") {
    for (std::int64_t n : {std::int64_t{-1}, std::int64_t{1356998399},
                           std::int64_t{1483228799}}) {
      auto a = hubrep::decode_timestamp(n).to_time_point();
      auto b = hubrep::decode_timestamp(n + 1).to_time_point();
      REQUIRE(b - a == std::chrono::seconds(1));
    }
  }

  SECTION("legal range bounds") {
    REQUIRE(hubrep::decode_timestamp(Timestamp::kMaxEpochSeconds).to_string() ==
            "9999-12-31T23:59:59Z");
    REQUIRE(hubrep::decode_timestamp(Timestamp::kMinEpochSeconds).to_string() ==
            "0000-01-01T00:00:00Z");
  }
}

TEST_CASE("timestamp rejects instants outside the calendar", "[datetime]") {
  auto past_max = decode_failure(Timestamp::kMaxEpochSeconds + 1);
  REQUIRE(past_max.kind() == TimestampErrorKind::IllegalInstant);
  REQUIRE(std::string(past_max.what()) ==
          "value is not a legal timestamp: 253402300800");
  REQUIRE(!past_max.candidates());

  auto before_min = decode_failure(Timestamp::kMinEpochSeconds - 1);
  REQUIRE(before_min.kind() == TimestampErrorKind::IllegalInstant);

  auto lowest = decode_failure(std::numeric_limits<std::int64_t>::min());
  REQUIRE(lowest.kind() == TimestampErrorKind::IllegalInstant);

  REQUIRE_THROWS_AS(Timestamp::from_epoch_seconds(Timestamp::kMaxEpochSeconds + 1),
                    TimestampError);
}

TEST_CASE("timestamp rejects unsigned values above the signed range",
          "[datetime]") {
  auto err = decode_failure(std::uint64_t{9223372036854775808ULL});
  REQUIRE(err.kind() == TimestampErrorKind::RangeFailure);
  REQUIRE(std::string(err.what()) ==
          "invalid value: integer `9223372036854775808`, expected i64");

  auto max = decode_failure(std::numeric_limits<std::uint64_t>::max());
  REQUIRE(max.kind() == TimestampErrorKind::RangeFailure);

  auto signed_max = decode_failure(
      static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()));
  REQUIRE(signed_max.kind() == TimestampErrorKind::IllegalInstant);
}

TEST_CASE("timestamp reports parse diagnostics", "[datetime]") {
  struct Case {
    const char *text;
    const char *message;
  };
  const Case cases[] = {
      {"", "premature end of input"},
      {"2011-01-26", "premature end of input"},
      {"2011-01-26T19:01:12", "premature end of input"},
      {"2011-01-26T19:01:12.", "premature end of input"},
      {"yesterday", "input contains invalid characters"},
      {"2011/01/26T19:01:12Z", "input contains invalid characters"},
      {"2011-01-26X19:01:12Z", "input contains invalid characters"},
      {"2011-01-26T19:01:12Q", "input contains invalid characters"},
      {"2011-13-26T19:01:12Z", "input is out of range"},
      {"2011-00-26T19:01:12Z", "input is out of range"},
      {"2011-02-29T00:00:00Z", "input is out of range"},
      {"2011-04-31T00:00:00Z", "input is out of range"},
      {"2011-01-26T24:00:00Z", "input is out of range"},
      {"2011-01-26T23:60:00Z", "input is out of range"},
      {"2011-01-26T23:59:61Z", "input is out of range"},
      {"2011-01-26T19:01:12+24:00", "input is out of range"},
      {"2011-01-26T19:01:12+05:60", "input is out of range"},
      {"2011-01-26T19:01:12Zjunk", "trailing input"},
      {"2011-01-26T19:01:12+01:00 ", "trailing input"},
  };
  for (const auto &c : cases) {
    INFO(c.text);
    auto err = decode_failure(c.text);
    REQUIRE(err.kind() == TimestampErrorKind::ParseFailure);
    REQUIRE(std::string(err.what()) == c.message);
  }
}

TEST_CASE("timestamp rejects non temporal nodes", "[datetime]") {
  const std::string suffix =
      ", expected date time string or seconds since unix epoch";

  auto null_err = decode_failure(nullptr);
  REQUIRE(null_err.kind() == TimestampErrorKind::FormatMismatch);
  REQUIRE(std::string(null_err.what()) == "invalid type: null" + suffix);

  REQUIRE(std::string(decode_failure(true).what()) ==
          "invalid type: boolean `true`" + suffix);
  REQUIRE(std::string(decode_failure(1.5).what()) ==
          "invalid type: floating point `1.5`" + suffix);
  REQUIRE(std::string(decode_failure(nlohmann::json::array()).what()) ==
          "invalid type: sequence" + suffix);
  REQUIRE(std::string(decode_failure(nlohmann::json::object()).what()) ==
          "invalid type: map" + suffix);
  REQUIRE(decode_failure(nlohmann::json::binary({1, 2})).kind() ==
          TimestampErrorKind::FormatMismatch);
}

TEST_CASE("compact contexts accept only epoch seconds", "[datetime]") {
  DecodeContext compact{false};
  REQUIRE(hubrep::decode_timestamp(1296068472, compact).to_string() ==
          "2011-01-26T19:01:12Z");

  auto err = decode_failure("2011-01-26T19:01:12Z", compact);
  REQUIRE(err.kind() == TimestampErrorKind::FormatMismatch);
  REQUIRE(std::string(err.what()) ==
          "invalid type: string \"2011-01-26T19:01:12Z\", expected date time "
          "string or seconds since unix epoch");
}

TEST_CASE("timestamp ordering and conversions", "[datetime]") {
  Timestamp early = Timestamp::from_epoch_seconds(1296068472);
  Timestamp late = Timestamp::from_epoch_seconds(1370037505);
  REQUIRE(early < late);
  REQUIRE(early <= late);
  REQUIRE(late > early);
  REQUIRE(late >= early);
  REQUIRE(early != late);
  REQUIRE(Timestamp() == Timestamp::from_epoch_seconds(0));

  Timestamp back = Timestamp::from_time_point(late.to_time_point());
  REQUIRE(back == late);

  auto with_millis = std::chrono::system_clock::time_point(
      std::chrono::milliseconds(1296068472999LL));
  REQUIRE(Timestamp::from_time_point(with_millis) == early);

  std::ostringstream out;
  out << late;
  REQUIRE(out.str() == "2013-05-31T21:58:25Z");
}

TEST_CASE("timestamp json conversions", "[datetime]") {
  nlohmann::json doc = {{"at", Timestamp::from_epoch_seconds(1370037505)}};
  REQUIRE(doc.dump() == R"({"at":"2013-05-31T21:58:25Z"})");

  REQUIRE(doc["at"].get<Timestamp>().epoch_seconds() == 1370037505);
  REQUIRE(nlohmann::json(1370037505).get<Timestamp>().to_string() ==
          "2013-05-31T21:58:25Z");
  REQUIRE_THROWS_AS(nlohmann::json("not a date").get<Timestamp>(),
                    TimestampError);
}

TEST_CASE("ambiguity errors carry both candidates", "[datetime]") {
  Timestamp a = Timestamp::from_epoch_seconds(1351991400);
  Timestamp b = Timestamp::from_epoch_seconds(1351995000);
  TimestampError err("value is an ambiguous timestamp: 1351991400, could be "
                     "either of 2012-11-04T01:10:00Z, 2012-11-04T02:10:00Z",
                     a, b);
  REQUIRE(err.kind() == TimestampErrorKind::AmbiguousInstant);
  auto candidates = err.candidates();
  REQUIRE(candidates);
  REQUIRE(candidates->first == a);
  REQUIRE(candidates->second == b);
  REQUIRE(std::string(hubrep::to_string(err.kind())) == "ambiguous_instant");
  REQUIRE(std::string(hubrep::to_string(TimestampErrorKind::ParseFailure)) ==
          "parse_failure");
}
