/**
 * @file sparse_encoder.hpp
 * @brief Ordered, presence-aware JSON object construction for request bodies.
 */

#ifndef HUBREP_SPARSE_ENCODER_HPP
#define HUBREP_SPARSE_ENCODER_HPP

#include <nlohmann/json.hpp>
#include <optional>
#include <utility>

namespace hubrep {

/**
 * Builds a JSON object from a fixed sequence of field slots.
 *
 * Callers visit every slot of a request in declaration order. Required slots
 * are always written, optional slots only when they hold a value, so the
 * output preserves declaration order and never contains placeholders for
 * fields the caller did not set.
 */
class SparseEncoder {
public:
  SparseEncoder() : object_(nlohmann::ordered_json::object()) {}

  /// Emit a field that is always present.
  template <typename T>
  SparseEncoder &required(const char *wire_name, const T &value) {
    object_[wire_name] = value;
    return *this;
  }

  /// Emit a field only when it was set; empty values still count as set.
  template <typename T>
  SparseEncoder &optional(const char *wire_name,
                          const std::optional<T> &value) {
    if (value) {
      object_[wire_name] = *value;
    }
    return *this;
  }

  /// Hand over the accumulated object.
  nlohmann::ordered_json finish() { return std::move(object_); }

private:
  nlohmann::ordered_json object_;
};

} // namespace hubrep

#endif // HUBREP_SPARSE_ENCODER_HPP
