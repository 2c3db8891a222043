#include "commands.hpp"
#include "log.hpp"
#include "records.hpp"
#include "requests.hpp"

#include <cctype>
#include <map>
#include <memory>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace hubrep {

namespace {

std::shared_ptr<spdlog::logger> encode_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("encode");
  }();
  return logger;
}

bool is_integer_literal(const std::string &value) {
  std::size_t start = (!value.empty() && value[0] == '-') ? 1 : 0;
  if (start == value.size()) {
    return false;
  }
  // JSON number grammar: no leading zeros.
  if (value[start] == '0' && value.size() - start > 1) {
    return false;
  }
  for (std::size_t i = start; i < value.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(value[i]))) {
      return false;
    }
  }
  return true;
}

nlohmann::ordered_json optional_text(const std::optional<std::string> &value) {
  return value ? nlohmann::ordered_json(*value) : nlohmann::ordered_json();
}

nlohmann::ordered_json optional_time(const std::optional<Timestamp> &value) {
  return value ? nlohmann::ordered_json(value->to_string())
               : nlohmann::ordered_json();
}

nlohmann::ordered_json summarize(const User &user) {
  return {{"login", user.login}, {"id", user.id}};
}

nlohmann::ordered_json summarize(const Repo &repo) {
  return {{"id", repo.id},
          {"full_name", repo.full_name},
          {"owner", repo.owner.login},
          {"default_branch", repo.default_branch},
          {"stargazers_count", repo.stargazers_count},
          {"pushed_at", optional_time(repo.pushed_at)},
          {"created_at", repo.created_at.to_string()},
          {"updated_at", repo.updated_at.to_string()}};
}

nlohmann::ordered_json summarize(const Deployment &deployment) {
  return {{"id", deployment.id},
          {"ref", deployment.commit_ref},
          {"sha", deployment.sha},
          {"task", deployment.task},
          {"environment", deployment.environment},
          {"creator", deployment.creator.login},
          {"created_at", deployment.created_at.to_string()},
          {"updated_at", deployment.updated_at.to_string()}};
}

nlohmann::ordered_json summarize(const DeploymentStatus &status) {
  return {{"id", status.id},
          {"state", to_string(status.state)},
          {"target_url", optional_text(status.target_url)},
          {"creator", status.creator.login},
          {"created_at", status.created_at.to_string()},
          {"updated_at", status.updated_at.to_string()}};
}

nlohmann::ordered_json summarize(const Status &status) {
  return {{"id", status.id},
          {"state", to_string(status.state)},
          {"context", status.context},
          {"description", optional_text(status.description)},
          {"created_at", status.created_at.to_string()},
          {"updated_at", status.updated_at.to_string()}};
}

nlohmann::ordered_json summarize(const Release &release) {
  return {{"id", release.id},
          {"tag_name", release.tag_name},
          {"name", optional_text(release.name)},
          {"draft", release.draft},
          {"prerelease", release.prerelease},
          {"assets", release.assets.size()},
          {"created_at", release.created_at.to_string()},
          {"published_at", optional_time(release.published_at)}};
}

nlohmann::ordered_json summarize(const Issue &issue) {
  nlohmann::ordered_json labels = nlohmann::ordered_json::array();
  for (const auto &label : issue.labels) {
    labels.push_back(label.name);
  }
  return {{"number", issue.number},
          {"state", issue.state},
          {"title", issue.title},
          {"user", issue.user.login},
          {"labels", labels},
          {"created_at", issue.created_at.to_string()},
          {"updated_at", issue.updated_at.to_string()},
          {"closed_at", optional_time(issue.closed_at)}};
}

nlohmann::ordered_json summarize(const Pull &pull) {
  return {{"number", pull.number},
          {"state", pull.state},
          {"title", pull.title},
          {"user", pull.user.login},
          {"head", pull.head ? nlohmann::ordered_json(pull.head->commit_ref)
                             : nlohmann::ordered_json()},
          {"base", pull.base ? nlohmann::ordered_json(pull.base->commit_ref)
                             : nlohmann::ordered_json()},
          {"created_at", pull.created_at.to_string()},
          {"updated_at", pull.updated_at.to_string()},
          {"merged_at", optional_time(pull.merged_at)}};
}

nlohmann::ordered_json summarize(const Key &key) {
  return {{"id", key.id},
          {"title", key.title},
          {"verified", key.verified},
          {"read_only", key.read_only},
          {"created_at", key.created_at.to_string()}};
}

nlohmann::ordered_json summarize(const Gist &gist) {
  nlohmann::ordered_json files = nlohmann::ordered_json::array();
  for (const auto &entry : gist.files) {
    files.push_back(entry.first);
  }
  return {{"id", gist.id},
          {"description", optional_text(gist.description)},
          {"public", gist.is_public},
          {"files", files},
          {"created_at", gist.created_at.to_string()},
          {"updated_at", gist.updated_at.to_string()}};
}

nlohmann::ordered_json summarize(const GistFork &fork) {
  return {{"id", fork.id},
          {"user", fork.user.login},
          {"created_at", fork.created_at.to_string()},
          {"updated_at", fork.updated_at.to_string()}};
}

nlohmann::ordered_json summarize(const ClientError &error) {
  nlohmann::ordered_json out = {{"message", error.message}};
  if (error.errors) {
    nlohmann::ordered_json fields = nlohmann::ordered_json::array();
    for (const auto &field : *error.errors) {
      fields.push_back({{"resource", field.resource},
                        {"field", field.field},
                        {"code", field.code}});
    }
    out["errors"] = fields;
  }
  out["documentation_url"] = optional_text(error.documentation_url);
  return out;
}

template <typename Record>
nlohmann::ordered_json decode_and_summarize(const Payload &payload) {
  return summarize(decode_record<Record>(payload.value, payload.context));
}

using Summarizer = nlohmann::ordered_json (*)(const Payload &);

const std::map<std::string, Summarizer> &summarizers() {
  static const std::map<std::string, Summarizer> table = {
      {"user", &decode_and_summarize<User>},
      {"repo", &decode_and_summarize<Repo>},
      {"deployment", &decode_and_summarize<Deployment>},
      {"deployment-status", &decode_and_summarize<DeploymentStatus>},
      {"status", &decode_and_summarize<Status>},
      {"release", &decode_and_summarize<Release>},
      {"issue", &decode_and_summarize<Issue>},
      {"pull", &decode_and_summarize<Pull>},
      {"key", &decode_and_summarize<Key>},
      {"gist", &decode_and_summarize<Gist>},
      {"gist-fork", &decode_and_summarize<GistFork>},
      {"client-error", &decode_and_summarize<ClientError>}};
  return table;
}

State require_state(const EncodeOptions &options) {
  if (options.state.empty()) {
    throw std::invalid_argument(options.kind + " requires --state");
  }
  return state_from_string(options.state);
}

nlohmann::ordered_json deployment(const EncodeOptions &o) {
  if (o.commit_ref.empty()) {
    throw std::invalid_argument("deployment requires --ref");
  }
  auto builder = DeploymentRequest::builder(o.commit_ref);
  if (o.task)
    builder.task(*o.task);
  if (o.auto_merge)
    builder.auto_merge(*o.auto_merge);
  if (o.required_contexts)
    builder.required_contexts(*o.required_contexts);
  if (o.payload) {
    auto parsed = nlohmann::json::parse(*o.payload, nullptr, false);
    if (parsed.is_discarded()) {
      throw std::invalid_argument("--payload is not a JSON document");
    }
    builder.payload(std::move(parsed));
  }
  if (o.environment)
    builder.environment(*o.environment);
  if (o.description)
    builder.description(*o.description);
  return builder.build();
}

nlohmann::ordered_json deployment_status(const EncodeOptions &o) {
  auto builder = DeploymentStatusRequest::builder(require_state(o));
  if (o.target_url)
    builder.target_url(*o.target_url);
  if (o.description)
    builder.description(*o.description);
  return builder.build();
}

nlohmann::ordered_json status(const EncodeOptions &o) {
  auto builder = StatusRequest::builder(require_state(o));
  if (o.target_url)
    builder.target_url(*o.target_url);
  if (o.description)
    builder.description(*o.description);
  if (o.context)
    builder.context(*o.context);
  return builder.build();
}

nlohmann::ordered_json pull_edit(const EncodeOptions &o) {
  auto builder = PullEdit::builder();
  if (o.title)
    builder.title(*o.title);
  if (o.body)
    builder.body(*o.body);
  if (o.pull_state) {
    if (*o.pull_state == "open") {
      builder.state(PullState::Open);
    } else if (*o.pull_state == "closed") {
      builder.state(PullState::Closed);
    } else {
      throw std::invalid_argument("unknown pull request state '" +
                                  *o.pull_state + "'");
    }
  }
  return builder.build();
}

nlohmann::ordered_json gist(const EncodeOptions &o) {
  std::map<std::string, std::string> files;
  for (const auto &entry : o.files) {
    auto pos = entry.find('=');
    if (pos == std::string::npos || pos == 0) {
      throw std::invalid_argument("gist file '" + entry +
                                  "' must be NAME=CONTENT");
    }
    files[entry.substr(0, pos)] = entry.substr(pos + 1);
  }
  if (files.empty()) {
    throw std::invalid_argument("gist requires at least one --file");
  }
  auto builder = GistRequest::builder(std::move(files));
  if (o.description)
    builder.description(*o.description);
  if (o.is_public)
    builder.is_public(*o.is_public);
  return builder.build();
}

nlohmann::ordered_json release(const EncodeOptions &o) {
  if (o.tag_name.empty()) {
    throw std::invalid_argument("release requires --tag");
  }
  auto builder = ReleaseRequest::builder(o.tag_name);
  if (o.commitish)
    builder.commitish(*o.commitish);
  if (o.name)
    builder.name(*o.name);
  if (o.body)
    builder.body(*o.body);
  if (o.draft)
    builder.draft(*o.draft);
  if (o.prerelease)
    builder.prerelease(*o.prerelease);
  return builder.build();
}

} // namespace

nlohmann::json timestamp_argument(const std::string &value) {
  if (is_integer_literal(value)) {
    // Out-of-range literals parse as floating point and are rejected later.
    return nlohmann::json::parse(value);
  }
  return value;
}

std::string describe_timestamp(const std::string &value, bool compact) {
  DecodeContext ctx;
  ctx.human_readable = !compact;
  Timestamp ts = decode_timestamp(timestamp_argument(value), ctx);
  return ts.to_string() + " " + std::to_string(ts.epoch_seconds());
}

nlohmann::ordered_json summarize_record(const std::string &kind,
                                        const Payload &payload) {
  const auto &table = summarizers();
  auto it = table.find(kind);
  if (it == table.end()) {
    throw std::invalid_argument("unknown record kind '" + kind + "'");
  }
  return it->second(payload);
}

nlohmann::ordered_json build_request(const EncodeOptions &options) {
  encode_log()->debug("Building {} request", options.kind);
  if (options.kind == "deployment")
    return deployment(options);
  if (options.kind == "deployment-status")
    return deployment_status(options);
  if (options.kind == "status")
    return status(options);
  if (options.kind == "pull-edit")
    return pull_edit(options);
  if (options.kind == "gist")
    return gist(options);
  if (options.kind == "release")
    return release(options);
  throw std::invalid_argument("unknown request kind '" + options.kind + "'");
}

} // namespace hubrep
