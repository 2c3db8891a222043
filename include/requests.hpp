/**
 * @file requests.hpp
 * @brief Outbound request bodies and the builders that assemble them.
 *
 * Every request is a plain snapshot produced by its builder. Optional fields
 * that were never set are left out of the encoded body entirely, while
 * fields set to an empty value are still sent.
 */

#ifndef HUBREP_REQUESTS_HPP
#define HUBREP_REQUESTS_HPP

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace hubrep {

/// Commit status and deployment status states.
enum class State {
  Pending, ///< Work has not finished yet.
  Success, ///< Completed successfully.
  Error,   ///< Could not complete because of an error.
  Failure  ///< Completed and failed.
};

/// Wire tag of a state, e.g. "pending".
const char *to_string(State state);

/**
 * Parse a wire tag into a state.
 *
 * @throws std::invalid_argument For anything other than the four known tags.
 */
State state_from_string(const std::string &tag);

void to_json(nlohmann::json &j, State state);
void to_json(nlohmann::ordered_json &j, State state);
void from_json(const nlohmann::json &j, State &state);

/// Target state of a pull request edit.
enum class PullState { Open, Closed };

const char *to_string(PullState state);

void to_json(nlohmann::ordered_json &j, PullState state);

class DeploymentRequestBuilder;
class DeploymentStatusRequestBuilder;
class StatusRequestBuilder;
class PullEditBuilder;
class GistRequestBuilder;
class ReleaseRequestBuilder;
class PullCreateRequestBuilder;
class IssueRequestBuilder;

/// Body of `POST /repos/{owner}/{repo}/deployments`.
struct DeploymentRequest {
  std::string commit_ref; ///< Sent as `ref`
  std::optional<std::string> task;
  std::optional<bool> auto_merge;
  std::optional<std::vector<std::string>> required_contexts;
  std::optional<std::string> payload; ///< Serialized JSON document
  std::optional<std::string> environment;
  std::optional<std::string> description;

  static DeploymentRequestBuilder builder(std::string commit_ref);
};

class DeploymentRequestBuilder {
public:
  explicit DeploymentRequestBuilder(std::string commit_ref);

  DeploymentRequestBuilder &task(std::string task);
  DeploymentRequestBuilder &auto_merge(bool auto_merge);
  DeploymentRequestBuilder &
  required_contexts(std::vector<std::string> contexts);

  /**
   * Attach extra information for the deployment consumer.
   *
   * The value is trusted as-is and captured in serialized form when the
   * request is built.
   */
  DeploymentRequestBuilder &payload(nlohmann::json payload);
  DeploymentRequestBuilder &environment(std::string environment);
  DeploymentRequestBuilder &description(std::string description);

  DeploymentRequest build() const;

private:
  DeploymentRequest request_;
  std::optional<nlohmann::json> payload_;
};

/// Body of `POST /repos/{owner}/{repo}/deployments/{id}/statuses`.
struct DeploymentStatusRequest {
  State state;
  std::optional<std::string> target_url;
  std::optional<std::string> description;

  static DeploymentStatusRequestBuilder builder(State state);
};

class DeploymentStatusRequestBuilder {
public:
  explicit DeploymentStatusRequestBuilder(State state);

  DeploymentStatusRequestBuilder &target_url(std::string url);
  DeploymentStatusRequestBuilder &description(std::string description);

  DeploymentStatusRequest build() const { return request_; }

private:
  DeploymentStatusRequest request_;
};

/// Body of `POST /repos/{owner}/{repo}/statuses/{sha}`.
struct StatusRequest {
  State state;
  std::optional<std::string> target_url;
  std::optional<std::string> description;
  std::optional<std::string> context;

  static StatusRequestBuilder builder(State state);
};

class StatusRequestBuilder {
public:
  explicit StatusRequestBuilder(State state);

  StatusRequestBuilder &target_url(std::string url);
  StatusRequestBuilder &description(std::string description);
  StatusRequestBuilder &context(std::string context);

  StatusRequest build() const { return request_; }

private:
  StatusRequest request_;
};

/// Body of `PATCH /repos/{owner}/{repo}/pulls/{number}`.
struct PullEdit {
  std::optional<std::string> title;
  std::optional<std::string> body;
  std::optional<PullState> state;

  static PullEditBuilder builder();
};

class PullEditBuilder {
public:
  PullEditBuilder &title(std::string title);
  PullEditBuilder &body(std::string body);
  PullEditBuilder &state(PullState state);

  PullEdit build() const { return edit_; }

private:
  PullEdit edit_;
};

/// One file of a gist; `filename` renames the file when set.
struct GistContent {
  std::optional<std::string> filename;
  std::string content;
};

/// Body of `POST /gists` and `PATCH /gists/{id}`.
struct GistRequest {
  std::optional<std::string> description;
  std::optional<bool> is_public;             ///< Sent as `public`
  std::map<std::string, GistContent> files; ///< Keyed by file name

  static GistRequestBuilder builder(std::map<std::string, std::string> files);
};

class GistRequestBuilder {
public:
  /// Start from file name to content pairs.
  explicit GistRequestBuilder(std::map<std::string, std::string> files);

  GistRequestBuilder &description(std::string description);
  GistRequestBuilder &is_public(bool is_public);
  /// Add or replace a file, optionally renaming it.
  GistRequestBuilder &file(std::string name, GistContent content);

  GistRequest build() const { return request_; }

private:
  GistRequest request_;
};

/// Body of `POST /repos/{owner}/{repo}/releases`.
struct ReleaseRequest {
  std::string tag_name;
  std::optional<std::string> target_commitish;
  std::optional<std::string> name;
  std::optional<std::string> body;
  std::optional<bool> draft;
  std::optional<bool> prerelease;

  static ReleaseRequestBuilder builder(std::string tag_name);
};

class ReleaseRequestBuilder {
public:
  explicit ReleaseRequestBuilder(std::string tag_name);

  ReleaseRequestBuilder &commitish(std::string commitish);
  ReleaseRequestBuilder &name(std::string name);
  ReleaseRequestBuilder &body(std::string body);
  ReleaseRequestBuilder &draft(bool draft);
  ReleaseRequestBuilder &prerelease(bool prerelease);

  ReleaseRequest build() const { return request_; }

private:
  ReleaseRequest request_;
};

/// Body of `POST /repos/{owner}/{repo}/pulls`.
struct PullCreateRequest {
  std::string title;
  std::string head;
  std::string base;
  std::optional<std::string> body;

  static PullCreateRequestBuilder builder(std::string title, std::string head,
                                          std::string base);
};

class PullCreateRequestBuilder {
public:
  PullCreateRequestBuilder(std::string title, std::string head,
                           std::string base);

  PullCreateRequestBuilder &body(std::string body);

  PullCreateRequest build() const { return request_; }

private:
  PullCreateRequest request_;
};

/// Body of `POST /repos/{owner}/{repo}/issues`.
struct IssueRequest {
  std::string title;
  std::optional<std::string> body;
  std::optional<std::string> assignee;
  std::optional<std::uint64_t> milestone;
  std::vector<std::string> labels; ///< Always sent, possibly empty

  static IssueRequestBuilder builder(std::string title);
};

class IssueRequestBuilder {
public:
  explicit IssueRequestBuilder(std::string title);

  IssueRequestBuilder &body(std::string body);
  IssueRequestBuilder &assignee(std::string assignee);
  IssueRequestBuilder &milestone(std::uint64_t milestone);
  IssueRequestBuilder &labels(std::vector<std::string> labels);

  IssueRequest build() const { return request_; }

private:
  IssueRequest request_;
};

/// Body of `POST /repos/{owner}/{repo}/labels`.
struct LabelRequest {
  std::string name;
  std::string color;
};

/// Body of `POST /user/keys`.
struct KeyRequest {
  std::string title;
  std::string key;
  bool read_only{false};
};

void to_json(nlohmann::ordered_json &j, const DeploymentRequest &request);
void to_json(nlohmann::ordered_json &j,
             const DeploymentStatusRequest &request);
void to_json(nlohmann::ordered_json &j, const StatusRequest &request);
void to_json(nlohmann::ordered_json &j, const PullEdit &edit);
void to_json(nlohmann::ordered_json &j, const GistContent &content);
void to_json(nlohmann::ordered_json &j, const GistRequest &request);
void to_json(nlohmann::ordered_json &j, const ReleaseRequest &request);
void to_json(nlohmann::ordered_json &j, const PullCreateRequest &request);
void to_json(nlohmann::ordered_json &j, const IssueRequest &request);
void to_json(nlohmann::ordered_json &j, const LabelRequest &request);
void to_json(nlohmann::ordered_json &j, const KeyRequest &request);

/**
 * Serialize a request body to JSON text.
 *
 * @param request Any request declared in this header.
 * @param indent Pretty-print indentation, or -1 for compact output.
 * @return Encoded body with keys in declaration order.
 * @throws nlohmann::json::type_error When a string is not valid UTF-8.
 */
template <typename Request>
std::string encode(const Request &request, int indent = -1) {
  nlohmann::ordered_json j = request;
  return j.dump(indent);
}

} // namespace hubrep

#endif // HUBREP_REQUESTS_HPP
