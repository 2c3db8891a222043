/**
 * @file commands.hpp
 * @brief Implementations of the hubrep subcommands.
 *
 * Each command returns its result as a value so the application layer decides
 * where it is printed.
 */

#ifndef HUBREP_COMMANDS_HPP
#define HUBREP_COMMANDS_HPP

#include "cli.hpp"
#include "decode.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace hubrep {

/**
 * Turn a command line argument into the node a payload would carry.
 *
 * Integer literals become number nodes, anything else a string node.
 */
nlohmann::json timestamp_argument(const std::string &value);

/**
 * Decode a timestamp argument.
 *
 * @param value Text given on the command line.
 * @param compact Decode as a non human readable format would.
 * @return The canonical form followed by the epoch seconds, space separated.
 * @throws TimestampError When the value is rejected.
 */
std::string describe_timestamp(const std::string &value, bool compact);

/**
 * Decode @p payload as the named record kind and summarize its key fields.
 *
 * @throws std::invalid_argument For an unknown kind.
 * @throws DecodeError When the payload does not match the record.
 */
nlohmann::ordered_json summarize_record(const std::string &kind,
                                        const Payload &payload);

/**
 * Build the request described by @p options.
 *
 * @throws std::invalid_argument When a field the request needs is missing or
 *         malformed.
 */
nlohmann::ordered_json build_request(const EncodeOptions &options);

} // namespace hubrep

#endif // HUBREP_COMMANDS_HPP
