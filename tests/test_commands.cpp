#include "commands.hpp"
#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

using namespace hubrep;

TEST_CASE("timestamp arguments", "[commands]") {
  REQUIRE(timestamp_argument("1296068472").is_number_integer());
  REQUIRE(timestamp_argument("-1").is_number_integer());
  REQUIRE(timestamp_argument("0").is_number_integer());
  REQUIRE(timestamp_argument("007").is_string());
  REQUIRE(timestamp_argument("12a").is_string());
  REQUIRE(timestamp_argument("-").is_string());
  REQUIRE(timestamp_argument("2011-01-26T19:01:12Z").is_string());

  REQUIRE(describe_timestamp("2011-01-26T20:01:12+01:00", false) ==
          "2011-01-26T19:01:12Z 1296068472");
  REQUIRE(describe_timestamp("1296068472", true) ==
          "2011-01-26T19:01:12Z 1296068472");
  REQUIRE(describe_timestamp("-1", false) == "1969-12-31T23:59:59Z -1");

  auto kind_of = [](const std::string &value, bool compact) {
    try {
      describe_timestamp(value, compact);
    } catch (const TimestampError &e) {
      return e.kind();
    }
    FAIL("decoded unexpectedly: " << value);
    return TimestampErrorKind::FormatMismatch;
  };
  REQUIRE(kind_of("2011-01-26T19:01:12Z", true) ==
          TimestampErrorKind::FormatMismatch);
  REQUIRE(kind_of("9223372036854775808", false) ==
          TimestampErrorKind::RangeFailure);
  REQUIRE(kind_of("253402300800", false) == TimestampErrorKind::IllegalInstant);
  REQUIRE(kind_of("99999999999999999999", false) ==
          TimestampErrorKind::FormatMismatch);
  REQUIRE(kind_of("tomorrow", false) == TimestampErrorKind::ParseFailure);
}

TEST_CASE("record summaries", "[commands]") {
  Payload payload;
  payload.value = {{"id", 2},
                   {"key", "ssh-rsa AAA"},
                   {"title", "laptop"},
                   {"verified", true},
                   {"created_at", 1403083800}};
  REQUIRE(summarize_record("key", payload).dump() ==
          R"({"id":2,"title":"laptop","verified":true,"read_only":false,)"
          R"("created_at":"2014-06-18T09:30:00Z"})");

  payload.value = {{"message", "Not Found"}};
  REQUIRE(summarize_record("client-error", payload).dump() ==
          R"({"message":"Not Found","documentation_url":null})");

  REQUIRE_THROWS_AS(summarize_record("commit-comment", payload),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(summarize_record("key", payload), DecodeError);
}

TEST_CASE("request building from options", "[commands]") {
  EncodeOptions options;

  SECTION("deployment") {
    options.kind = "deployment";
    REQUIRE_THROWS_AS(build_request(options), std::invalid_argument);
    options.commit_ref = "main";
    options.payload = "{\"room\":1}";
    options.auto_merge = false;
    REQUIRE(build_request(options).dump() ==
            R"({"ref":"main","auto_merge":false,"payload":"{\"room\":1}"})");
    options.payload = "{not json";
    REQUIRE_THROWS_AS(build_request(options), std::invalid_argument);
  }

  SECTION("statuses need a state") {
    options.kind = "status";
    REQUIRE_THROWS_AS(build_request(options), std::invalid_argument);
    options.state = "pending";
    options.context = "ci";
    REQUIRE(build_request(options).dump() ==
            R"({"state":"pending","context":"ci"})");

    options.kind = "deployment-status";
    options.target_url = "";
    REQUIRE(build_request(options).dump() ==
            R"({"state":"pending","target_url":""})");
  }

  SECTION("pull edit") {
    options.kind = "pull-edit";
    REQUIRE(build_request(options).dump() == "{}");
    options.pull_state = "closed";
    REQUIRE(build_request(options).dump() == R"({"state":"closed"})");
  }

  SECTION("gist") {
    options.kind = "gist";
    REQUIRE_THROWS_AS(build_request(options), std::invalid_argument);
    options.files = {"foo=bar"};
    options.is_public = true;
    REQUIRE(build_request(options).dump() ==
            R"({"public":true,"files":{"foo":{"content":"bar"}}})");
    options.files = {"=bar"};
    REQUIRE_THROWS_AS(build_request(options), std::invalid_argument);
  }

  SECTION("release") {
    options.kind = "release";
    REQUIRE_THROWS_AS(build_request(options), std::invalid_argument);
    options.tag_name = "v1.0.0";
    options.draft = true;
    REQUIRE(build_request(options).dump() ==
            R"({"tag_name":"v1.0.0","draft":true})");
  }

  SECTION("unknown kind") {
    options.kind = "comment";
    REQUIRE_THROWS_AS(build_request(options), std::invalid_argument);
  }
}
