/**
 * @file requests.cpp
 * @brief Builders and sparse encoders for outbound request bodies.
 */

#include "requests.hpp"
#include "sparse_encoder.hpp"

#include <stdexcept>
#include <utility>

namespace hubrep {

const char *to_string(State state) {
  switch (state) {
  case State::Pending:
    return "pending";
  case State::Success:
    return "success";
  case State::Error:
    return "error";
  case State::Failure:
    return "failure";
  }
  return "pending";
}

State state_from_string(const std::string &tag) {
  if (tag == "pending") {
    return State::Pending;
  }
  if (tag == "success") {
    return State::Success;
  }
  if (tag == "error") {
    return State::Error;
  }
  if (tag == "failure") {
    return State::Failure;
  }
  throw std::invalid_argument("unknown state '" + tag + "'");
}

void to_json(nlohmann::json &j, State state) { j = to_string(state); }

void to_json(nlohmann::ordered_json &j, State state) { j = to_string(state); }

void from_json(const nlohmann::json &j, State &state) {
  state = state_from_string(j.get<std::string>());
}

const char *to_string(PullState state) {
  return state == PullState::Closed ? "closed" : "open";
}

void to_json(nlohmann::ordered_json &j, PullState state) {
  j = to_string(state);
}

DeploymentRequestBuilder DeploymentRequest::builder(std::string commit_ref) {
  return DeploymentRequestBuilder(std::move(commit_ref));
}

DeploymentRequestBuilder::DeploymentRequestBuilder(std::string commit_ref) {
  request_.commit_ref = std::move(commit_ref);
}

DeploymentRequestBuilder &DeploymentRequestBuilder::task(std::string task) {
  request_.task = std::move(task);
  return *this;
}

DeploymentRequestBuilder &DeploymentRequestBuilder::auto_merge(bool auto_merge) {
  request_.auto_merge = auto_merge;
  return *this;
}

DeploymentRequestBuilder &
DeploymentRequestBuilder::required_contexts(std::vector<std::string> contexts) {
  request_.required_contexts = std::move(contexts);
  return *this;
}

DeploymentRequestBuilder &
DeploymentRequestBuilder::payload(nlohmann::json payload) {
  payload_ = std::move(payload);
  return *this;
}

DeploymentRequestBuilder &
DeploymentRequestBuilder::environment(std::string environment) {
  request_.environment = std::move(environment);
  return *this;
}

DeploymentRequestBuilder &
DeploymentRequestBuilder::description(std::string description) {
  request_.description = std::move(description);
  return *this;
}

DeploymentRequest DeploymentRequestBuilder::build() const {
  DeploymentRequest request = request_;
  if (payload_) {
    request.payload = payload_->dump();
  }
  return request;
}

DeploymentStatusRequestBuilder DeploymentStatusRequest::builder(State state) {
  return DeploymentStatusRequestBuilder(state);
}

DeploymentStatusRequestBuilder::DeploymentStatusRequestBuilder(State state)
    : request_{state, std::nullopt, std::nullopt} {}

DeploymentStatusRequestBuilder &
DeploymentStatusRequestBuilder::target_url(std::string url) {
  request_.target_url = std::move(url);
  return *this;
}

DeploymentStatusRequestBuilder &
DeploymentStatusRequestBuilder::description(std::string description) {
  request_.description = std::move(description);
  return *this;
}

StatusRequestBuilder StatusRequest::builder(State state) {
  return StatusRequestBuilder(state);
}

StatusRequestBuilder::StatusRequestBuilder(State state)
    : request_{state, std::nullopt, std::nullopt, std::nullopt} {}

StatusRequestBuilder &StatusRequestBuilder::target_url(std::string url) {
  request_.target_url = std::move(url);
  return *this;
}

StatusRequestBuilder &StatusRequestBuilder::description(std::string description) {
  request_.description = std::move(description);
  return *this;
}

StatusRequestBuilder &StatusRequestBuilder::context(std::string context) {
  request_.context = std::move(context);
  return *this;
}

PullEditBuilder PullEdit::builder() { return PullEditBuilder(); }

PullEditBuilder &PullEditBuilder::title(std::string title) {
  edit_.title = std::move(title);
  return *this;
}

PullEditBuilder &PullEditBuilder::body(std::string body) {
  edit_.body = std::move(body);
  return *this;
}

PullEditBuilder &PullEditBuilder::state(PullState state) {
  edit_.state = state;
  return *this;
}

GistRequestBuilder
GistRequest::builder(std::map<std::string, std::string> files) {
  return GistRequestBuilder(std::move(files));
}

GistRequestBuilder::GistRequestBuilder(
    std::map<std::string, std::string> files) {
  for (auto &[name, content] : files) {
    request_.files[name] = GistContent{std::nullopt, std::move(content)};
  }
}

GistRequestBuilder &GistRequestBuilder::description(std::string description) {
  request_.description = std::move(description);
  return *this;
}

GistRequestBuilder &GistRequestBuilder::is_public(bool is_public) {
  request_.is_public = is_public;
  return *this;
}

GistRequestBuilder &GistRequestBuilder::file(std::string name,
                                             GistContent content) {
  request_.files[std::move(name)] = std::move(content);
  return *this;
}

ReleaseRequestBuilder ReleaseRequest::builder(std::string tag_name) {
  return ReleaseRequestBuilder(std::move(tag_name));
}

ReleaseRequestBuilder::ReleaseRequestBuilder(std::string tag_name) {
  request_.tag_name = std::move(tag_name);
}

ReleaseRequestBuilder &ReleaseRequestBuilder::commitish(std::string commitish) {
  request_.target_commitish = std::move(commitish);
  return *this;
}

ReleaseRequestBuilder &ReleaseRequestBuilder::name(std::string name) {
  request_.name = std::move(name);
  return *this;
}

ReleaseRequestBuilder &ReleaseRequestBuilder::body(std::string body) {
  request_.body = std::move(body);
  return *this;
}

ReleaseRequestBuilder &ReleaseRequestBuilder::draft(bool draft) {
  request_.draft = draft;
  return *this;
}

ReleaseRequestBuilder &ReleaseRequestBuilder::prerelease(bool prerelease) {
  request_.prerelease = prerelease;
  return *this;
}

PullCreateRequestBuilder PullCreateRequest::builder(std::string title,
                                                    std::string head,
                                                    std::string base) {
  return PullCreateRequestBuilder(std::move(title), std::move(head),
                                  std::move(base));
}

PullCreateRequestBuilder::PullCreateRequestBuilder(std::string title,
                                                   std::string head,
                                                   std::string base)
    : request_{std::move(title), std::move(head), std::move(base),
               std::nullopt} {}

PullCreateRequestBuilder &PullCreateRequestBuilder::body(std::string body) {
  request_.body = std::move(body);
  return *this;
}

IssueRequestBuilder IssueRequest::builder(std::string title) {
  return IssueRequestBuilder(std::move(title));
}

IssueRequestBuilder::IssueRequestBuilder(std::string title) {
  request_.title = std::move(title);
}

IssueRequestBuilder &IssueRequestBuilder::body(std::string body) {
  request_.body = std::move(body);
  return *this;
}

IssueRequestBuilder &IssueRequestBuilder::assignee(std::string assignee) {
  request_.assignee = std::move(assignee);
  return *this;
}

IssueRequestBuilder &IssueRequestBuilder::milestone(std::uint64_t milestone) {
  request_.milestone = milestone;
  return *this;
}

IssueRequestBuilder &
IssueRequestBuilder::labels(std::vector<std::string> labels) {
  request_.labels = std::move(labels);
  return *this;
}

void to_json(nlohmann::ordered_json &j, const DeploymentRequest &request) {
  j = SparseEncoder()
          .required("ref", request.commit_ref)
          .optional("task", request.task)
          .optional("auto_merge", request.auto_merge)
          .optional("required_contexts", request.required_contexts)
          .optional("payload", request.payload)
          .optional("environment", request.environment)
          .optional("description", request.description)
          .finish();
}

void to_json(nlohmann::ordered_json &j,
             const DeploymentStatusRequest &request) {
  j = SparseEncoder()
          .required("state", request.state)
          .optional("target_url", request.target_url)
          .optional("description", request.description)
          .finish();
}

void to_json(nlohmann::ordered_json &j, const StatusRequest &request) {
  j = SparseEncoder()
          .required("state", request.state)
          .optional("target_url", request.target_url)
          .optional("description", request.description)
          .optional("context", request.context)
          .finish();
}

void to_json(nlohmann::ordered_json &j, const PullEdit &edit) {
  j = SparseEncoder()
          .optional("title", edit.title)
          .optional("body", edit.body)
          .optional("state", edit.state)
          .finish();
}

void to_json(nlohmann::ordered_json &j, const GistContent &content) {
  j = SparseEncoder()
          .optional("filename", content.filename)
          .required("content", content.content)
          .finish();
}

void to_json(nlohmann::ordered_json &j, const GistRequest &request) {
  j = SparseEncoder()
          .optional("description", request.description)
          .optional("public", request.is_public)
          .required("files", request.files)
          .finish();
}

void to_json(nlohmann::ordered_json &j, const ReleaseRequest &request) {
  j = SparseEncoder()
          .required("tag_name", request.tag_name)
          .optional("target_commitish", request.target_commitish)
          .optional("name", request.name)
          .optional("body", request.body)
          .optional("draft", request.draft)
          .optional("prerelease", request.prerelease)
          .finish();
}

void to_json(nlohmann::ordered_json &j, const PullCreateRequest &request) {
  j = SparseEncoder()
          .required("title", request.title)
          .required("head", request.head)
          .required("base", request.base)
          .optional("body", request.body)
          .finish();
}

void to_json(nlohmann::ordered_json &j, const IssueRequest &request) {
  j = SparseEncoder()
          .required("title", request.title)
          .optional("body", request.body)
          .optional("assignee", request.assignee)
          .optional("milestone", request.milestone)
          .required("labels", request.labels)
          .finish();
}

void to_json(nlohmann::ordered_json &j, const LabelRequest &request) {
  j = SparseEncoder()
          .required("name", request.name)
          .required("color", request.color)
          .finish();
}

void to_json(nlohmann::ordered_json &j, const KeyRequest &request) {
  j = SparseEncoder()
          .required("title", request.title)
          .required("key", request.key)
          .required("read_only", request.read_only)
          .finish();
}

} // namespace hubrep
