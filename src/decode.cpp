/**
 * @file decode.cpp
 * @brief Payload parsing and field-aware record decoding.
 */

#include "decode.hpp"
#include "log.hpp"

#include <memory>
#include <spdlog/spdlog.h>
#include <utility>

namespace hubrep {

namespace {

std::shared_ptr<spdlog::logger> decode_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("decode");
  }();
  return logger;
}

std::string describe(const std::string &path, const std::string &reason,
                     const std::string &raw_value) {
  std::string message = path.empty() ? reason : path + ": " + reason;
  if (!raw_value.empty()) {
    message += " (value: " + raw_value + ")";
  }
  return message;
}

/// Keep long raw values readable in error messages.
std::string abbreviate(const nlohmann::json &node) {
  constexpr std::size_t kMaxRaw = 120;
  std::string raw =
      node.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  if (raw.size() > kMaxRaw) {
    std::size_t cut = kMaxRaw;
    // Back off over UTF-8 continuation bytes so no code point is split.
    while (cut > 0 && (static_cast<unsigned char>(raw[cut]) & 0xC0) == 0x80) {
      --cut;
    }
    raw = raw.substr(0, cut) + "...";
  }
  return raw;
}

} // namespace

DecodeError::DecodeError(std::string path, const std::string &reason,
                         std::string raw_value,
                         std::optional<TimestampErrorKind> timestamp_kind)
    : std::runtime_error(describe(path, reason, raw_value)),
      path_(std::move(path)), raw_value_(std::move(raw_value)),
      timestamp_kind_(timestamp_kind) {}

PayloadFormat payload_format_from_string(const std::string &name) {
  if (name == "json") {
    return PayloadFormat::Json;
  }
  if (name == "cbor") {
    return PayloadFormat::Cbor;
  }
  if (name == "msgpack" || name == "messagepack") {
    return PayloadFormat::MsgPack;
  }
  if (name == "bson") {
    return PayloadFormat::Bson;
  }
  if (name == "ubjson") {
    return PayloadFormat::Ubjson;
  }
  throw std::invalid_argument("unknown payload format '" + name + "'");
}

const char *to_string(PayloadFormat format) {
  switch (format) {
  case PayloadFormat::Json:
    return "json";
  case PayloadFormat::Cbor:
    return "cbor";
  case PayloadFormat::MsgPack:
    return "msgpack";
  case PayloadFormat::Bson:
    return "bson";
  case PayloadFormat::Ubjson:
    return "ubjson";
  }
  return "json";
}

Payload decode_payload(const std::string &bytes, PayloadFormat format) {
  Payload payload;
  payload.context.human_readable = format == PayloadFormat::Json;
  try {
    switch (format) {
    case PayloadFormat::Json:
      payload.value = nlohmann::json::parse(bytes);
      break;
    case PayloadFormat::Cbor:
      payload.value = nlohmann::json::from_cbor(bytes);
      break;
    case PayloadFormat::MsgPack:
      payload.value = nlohmann::json::from_msgpack(bytes);
      break;
    case PayloadFormat::Bson:
      payload.value = nlohmann::json::from_bson(bytes);
      break;
    case PayloadFormat::Ubjson:
      payload.value = nlohmann::json::from_ubjson(bytes);
      break;
    }
  } catch (const nlohmann::json::exception &e) {
    // parse_error for bad syntax, out_of_range for impossible container sizes.
    decode_log()->debug("Rejected {} payload of {} bytes: {}",
                        to_string(format), bytes.size(), e.what());
    throw DecodeError({}, std::string("malformed ") + to_string(format) +
                              " payload: " + e.what());
  }
  decode_log()->trace("Decoded {} payload of {} bytes", to_string(format),
                      bytes.size());
  return payload;
}

FieldReader::FieldReader(const nlohmann::json &object, const DecodeContext &ctx,
                         std::string path)
    : object_(object), ctx_(ctx), path_(std::move(path)) {
  if (!object_.is_object()) {
    decode_log()->debug("Expected object at '{}'", path_);
    throw DecodeError(path_, "invalid type: expected a map",
                      abbreviate(object_));
  }
}

const nlohmann::json *FieldReader::find(const char *name) const {
  auto it = object_.find(name);
  return it == object_.end() ? nullptr : &*it;
}

const nlohmann::json &FieldReader::node_at(const char *name) const {
  const nlohmann::json *node = find(name);
  if (node == nullptr) {
    decode_log()->debug("Missing field '{}'", join(name));
    throw DecodeError(join(name), "missing field");
  }
  return *node;
}

FieldReader FieldReader::child(const char *name,
                               const nlohmann::json &node) const {
  return FieldReader(node, ctx_, join(name));
}

std::string FieldReader::join(const char *name) const {
  return path_.empty() ? std::string(name) : path_ + "." + name;
}

void FieldReader::fail(const char *name, const nlohmann::json &node,
                       const std::string &reason) const {
  decode_log()->debug("Field '{}' rejected: {}", join(name), reason);
  throw DecodeError(join(name), reason, abbreviate(node));
}

Timestamp FieldReader::timestamp(const char *name) const {
  const nlohmann::json &node = node_at(name);
  try {
    return decode_timestamp(node, ctx_);
  } catch (const TimestampError &e) {
    decode_log()->debug("Field '{}' rejected ({}): {}", join(name),
                        to_string(e.kind()), e.what());
    throw DecodeError(join(name), e.what(), abbreviate(node), e.kind());
  }
}

std::optional<Timestamp>
FieldReader::optional_timestamp(const char *name) const {
  const nlohmann::json *node = find(name);
  if (node == nullptr || node->is_null()) {
    return std::nullopt;
  }
  return timestamp(name);
}

} // namespace hubrep
