/**
 * @file decode.hpp
 * @brief Field-aware decoding of inbound payloads into typed records.
 *
 * Payloads arrive as JSON text or as one of the binary encodings understood
 * by nlohmann::json. FieldReader walks a decoded object while tracking the
 * path of the field being read so that failures point at the offending
 * field and value instead of producing a partially populated record.
 */

#ifndef HUBREP_DECODE_HPP
#define HUBREP_DECODE_HPP

#include "datetime.hpp"

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace hubrep {

/**
 * Raised when a payload cannot be decoded into the requested record.
 */
class DecodeError : public std::runtime_error {
public:
  /**
   * @param path Dotted path of the failing field, e.g. `creator.created_at`.
   * @param reason Description of the failure.
   * @param raw_value Serialized offending value, empty when the field is
   *        missing.
   * @param timestamp_kind Underlying timestamp failure, if any.
   */
  DecodeError(std::string path, const std::string &reason,
              std::string raw_value = {},
              std::optional<TimestampErrorKind> timestamp_kind = std::nullopt);

  const std::string &path() const noexcept { return path_; }
  const std::string &raw_value() const noexcept { return raw_value_; }

  /// Set when the failure came from timestamp decoding.
  std::optional<TimestampErrorKind> timestamp_error() const noexcept {
    return timestamp_kind_;
  }

private:
  std::string path_;
  std::string raw_value_;
  std::optional<TimestampErrorKind> timestamp_kind_;
};

/// Wire encodings accepted by decode_payload().
enum class PayloadFormat { Json, Cbor, MsgPack, Bson, Ubjson };

/**
 * Parse a format name such as "json" or "msgpack".
 *
 * @throws std::invalid_argument When the name is not recognised.
 */
PayloadFormat payload_format_from_string(const std::string &name);

const char *to_string(PayloadFormat format);

/// Decoded value tree together with the hints needed to interpret it.
struct Payload {
  nlohmann::json value;
  DecodeContext context;
};

/**
 * Parse raw bytes into a value tree.
 *
 * Only JSON text is considered human readable; binary encodings require
 * timestamps in integer form.
 *
 * @throws DecodeError When the bytes are not a valid document.
 */
Payload decode_payload(const std::string &bytes, PayloadFormat format);

/**
 * Read-only view over one object of a payload.
 */
class FieldReader {
public:
  /**
   * @throws DecodeError When @p object is not a JSON object.
   */
  FieldReader(const nlohmann::json &object, const DecodeContext &ctx,
              std::string path = {});

  const DecodeContext &context() const noexcept { return ctx_; }
  const std::string &path() const noexcept { return path_; }

  /// Read a mandatory scalar or container field.
  ///
  /// Conversion failures, including unknown enum tags reported as
  /// std::invalid_argument, become DecodeError.
  template <typename T> T required(const char *name) const {
    const nlohmann::json &node = node_at(name);
    try {
      return node.get<T>();
    } catch (const nlohmann::json::exception &e) {
      fail(name, node, e.what());
    } catch (const std::invalid_argument &e) {
      fail(name, node, e.what());
    }
  }

  /// Read a field that may be missing or null.
  template <typename T> std::optional<T> optional(const char *name) const {
    const nlohmann::json *node = find(name);
    if (node == nullptr || node->is_null()) {
      return std::nullopt;
    }
    try {
      return node->get<T>();
    } catch (const nlohmann::json::exception &e) {
      fail(name, *node, e.what());
    } catch (const std::invalid_argument &e) {
      fail(name, *node, e.what());
    }
  }

  Timestamp timestamp(const char *name) const;
  std::optional<Timestamp> optional_timestamp(const char *name) const;

  /// Decode a nested object with read_record().
  template <typename Record> Record record(const char *name) const {
    Record out{};
    read_record(child(name, node_at(name)), out);
    return out;
  }

  template <typename Record>
  std::optional<Record> optional_record(const char *name) const {
    const nlohmann::json *node = find(name);
    if (node == nullptr || node->is_null()) {
      return std::nullopt;
    }
    Record out{};
    read_record(child(name, *node), out);
    return out;
  }

  /// Decode an array of nested objects.
  template <typename Record>
  std::vector<Record> records(const char *name) const {
    const nlohmann::json &node = node_at(name);
    if (!node.is_array()) {
      fail(name, node, "expected a sequence");
    }
    std::vector<Record> out;
    out.reserve(node.size());
    for (std::size_t i = 0; i < node.size(); ++i) {
      Record item{};
      read_record(FieldReader(node[i], ctx_, join(name) + "[" +
                                                 std::to_string(i) + "]"),
                  item);
      out.push_back(std::move(item));
    }
    return out;
  }

  /// Decode an object whose values are nested records.
  template <typename Record>
  std::map<std::string, Record> record_map(const char *name) const {
    const nlohmann::json &node = node_at(name);
    if (!node.is_object()) {
      fail(name, node, "expected a map");
    }
    std::map<std::string, Record> out;
    for (const auto &[key, value] : node.items()) {
      Record item{};
      read_record(FieldReader(value, ctx_, join(name) + "." + key), item);
      out.emplace(key, std::move(item));
    }
    return out;
  }

private:
  const nlohmann::json *find(const char *name) const;
  const nlohmann::json &node_at(const char *name) const;
  FieldReader child(const char *name, const nlohmann::json &node) const;
  std::string join(const char *name) const;
  [[noreturn]] void fail(const char *name, const nlohmann::json &node,
                         const std::string &reason) const;

  const nlohmann::json &object_;
  DecodeContext ctx_;
  std::string path_;
};

/**
 * Decode a complete record from a value tree.
 *
 * @tparam Record Any type with a matching read_record() overload.
 * @throws DecodeError Naming the first field that failed.
 */
template <typename Record>
Record decode_record(const nlohmann::json &value,
                     const DecodeContext &ctx = {}) {
  Record out{};
  read_record(FieldReader(value, ctx), out);
  return out;
}

} // namespace hubrep

#endif // HUBREP_DECODE_HPP
