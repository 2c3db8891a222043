#include "decode.hpp"
#include "records.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

using namespace hubrep;

namespace {

nlohmann::json user_json() {
  return {{"login", "octocat"},
          {"id", 1},
          {"avatar_url", "https://github.com/images/error/octocat_happy.gif"},
          {"gravatar_id", ""},
          {"url", "https://api.github.com/users/octocat"},
          {"html_url", "https://github.com/octocat"},
          {"site_admin", false}};
}

nlohmann::json key_json() {
  return {{"id", 2},
          {"key", "ssh-rsa AAA"},
          {"title", "laptop"},
          {"verified", true},
          {"read_only", false},
          {"created_at", "2014-06-18T09:30:00Z"}};
}

std::string as_string(const std::vector<std::uint8_t> &bytes) {
  return std::string(bytes.begin(), bytes.end());
}

DecodeError decode_failure(const nlohmann::json &value,
                           const DecodeContext &ctx = {}) {
  try {
    decode_record<Key>(value, ctx);
    FAIL("decoded unexpectedly");
  } catch (const DecodeError &e) {
    return e;
  }
  throw std::logic_error("unreachable");
}

} // namespace

TEST_CASE("payload formats", "[decode]") {
  REQUIRE(payload_format_from_string("json") == PayloadFormat::Json);
  REQUIRE(payload_format_from_string("messagepack") == PayloadFormat::MsgPack);
  REQUIRE(payload_format_from_string("msgpack") == PayloadFormat::MsgPack);
  REQUIRE(std::string(to_string(PayloadFormat::Ubjson)) == "ubjson");
  REQUIRE_THROWS_AS(payload_format_from_string("xml"), std::invalid_argument);
}

TEST_CASE("json payloads are human readable", "[decode]") {
  Payload payload = decode_payload(key_json().dump(), PayloadFormat::Json);
  REQUIRE(payload.context.human_readable);
  Key key = decode_record<Key>(payload.value, payload.context);
  REQUIRE(key.id == 2);
  REQUIRE(key.verified);
  REQUIRE(key.created_at.epoch_seconds() == 1403083800);
}

TEST_CASE("binary payloads carry epoch seconds", "[decode]") {
  nlohmann::json doc = key_json();
  doc["created_at"] = 1403083800;

  SECTION("cbor") {
    Payload payload = decode_payload(as_string(nlohmann::json::to_cbor(doc)),
                                     PayloadFormat::Cbor);
    REQUIRE(!payload.context.human_readable);
    Key key = decode_record<Key>(payload.value, payload.context);
    REQUIRE(key.created_at.to_string() == "2014-06-18T09:30:00Z");
  }

  SECTION("msgpack") {
    Payload payload = decode_payload(
        as_string(nlohmann::json::to_msgpack(doc)), PayloadFormat::MsgPack);
    Key key = decode_record<Key>(payload.value, payload.context);
    REQUIRE(key.created_at.to_string() == "2014-06-18T09:30:00Z");
  }

  SECTION("strings are rejected in binary payloads") {
    Payload payload =
        decode_payload(as_string(nlohmann::json::to_cbor(key_json())),
                       PayloadFormat::Cbor);
    auto err = decode_failure(payload.value, payload.context);
    REQUIRE(err.path() == "created_at");
    REQUIRE(err.timestamp_error() == TimestampErrorKind::FormatMismatch);
  }
}

TEST_CASE("malformed payloads raise decode errors", "[decode]") {
  REQUIRE_THROWS_AS(decode_payload("{\"id\":", PayloadFormat::Json),
                    DecodeError);
  REQUIRE_THROWS_AS(decode_payload("\xff\xff", PayloadFormat::Cbor),
                    DecodeError);
  REQUIRE_THROWS_AS(decode_payload(std::string("\x16\x00\x00", 3),
                                   PayloadFormat::Bson),
                    DecodeError);
}

TEST_CASE("impossible container sizes raise decode errors", "[decode]") {
  // Optimized UBJSON array claiming INT64_MAX elements.
  const std::string bytes("[$i#L\x7f\xff\xff\xff\xff\xff\xff\xff", 13);
  try {
    decode_payload(bytes, PayloadFormat::Ubjson);
    FAIL("decoded unexpectedly");
  } catch (const DecodeError &e) {
    REQUIRE(std::string(e.what()).find("malformed ubjson payload") !=
            std::string::npos);
  }
}

TEST_CASE("long raw values are cut on a character boundary", "[decode]") {
  std::string text = "a";
  for (int i = 0; i < 100; ++i) {
    text += "\xc3\xa9";
  }
  std::string expected = "[\"a";
  for (int i = 0; i < 58; ++i) {
    expected += "\xc3\xa9";
  }
  expected += "...";
  try {
    decode_record<User>(nlohmann::json::array({text}));
    FAIL("decoded unexpectedly");
  } catch (const DecodeError &e) {
    REQUIRE(e.raw_value() == expected);
    REQUIRE_NOTHROW(nlohmann::json(std::string(e.what())).dump());
  }
}

TEST_CASE("decode errors name the failing field", "[decode]") {
  SECTION("missing field") {
    nlohmann::json doc = key_json();
    doc.erase("title");
    auto err = decode_failure(doc);
    REQUIRE(err.path() == "title");
    REQUIRE(std::string(err.what()) == "title: missing field");
    REQUIRE(!err.timestamp_error());
  }

  SECTION("wrong type") {
    nlohmann::json doc = key_json();
    doc["id"] = "two";
    auto err = decode_failure(doc);
    REQUIRE(err.path() == "id");
    REQUIRE(err.raw_value() == "\"two\"");
  }

  SECTION("bad timestamp") {
    nlohmann::json doc = key_json();
    doc["created_at"] = "2014-06-31T09:30:00Z";
    auto err = decode_failure(doc);
    REQUIRE(err.path() == "created_at");
    REQUIRE(err.timestamp_error() == TimestampErrorKind::ParseFailure);
    REQUIRE(std::string(err.what()) ==
            "created_at: input is out of range "
            "(value: \"2014-06-31T09:30:00Z\")");
  }

  SECTION("null where a timestamp is required") {
    nlohmann::json doc = key_json();
    doc["created_at"] = nullptr;
    auto err = decode_failure(doc);
    REQUIRE(err.timestamp_error() == TimestampErrorKind::FormatMismatch);
  }

  SECTION("not an object") {
    auto err = decode_failure(nlohmann::json::array());
    REQUIRE(err.path().empty());
    REQUIRE(err.raw_value() == "[]");
  }
}

TEST_CASE("nested paths", "[decode]") {
  nlohmann::json status = {{"id", 1},
                           {"url", "https://api.github.com/statuses/1"},
                           {"state", "success"},
                           {"target_url", nullptr},
                           {"description", "Build passed"},
                           {"context", "ci/build"},
                           {"creator", user_json()},
                           {"created_at", "2012-07-20T01:19:13Z"},
                           {"updated_at", 1342747153}};

  Status ok = decode_record<Status>(status);
  REQUIRE(ok.state == State::Success);
  REQUIRE(!ok.target_url);
  REQUIRE(ok.created_at == ok.updated_at);

  SECTION("field inside a nested record") {
    status["creator"].erase("login");
    try {
      decode_record<Status>(status);
      FAIL("decoded unexpectedly");
    } catch (const DecodeError &e) {
      REQUIRE(e.path() == "creator.login");
    }
  }

  SECTION("unknown state tag") {
    status["state"] = "done";
    try {
      decode_record<Status>(status);
      FAIL("decoded unexpectedly");
    } catch (const DecodeError &e) {
      REQUIRE(e.path() == "state");
      REQUIRE(e.raw_value() == "\"done\"");
    }
  }
}
