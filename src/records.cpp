/**
 * @file records.cpp
 * @brief Field mappings for GitHub response records.
 */

#include "records.hpp"

#include <string>

namespace hubrep {

void read_record(const FieldReader &in, User &out) {
  out.login = in.required<std::string>("login");
  out.id = in.required<std::uint64_t>("id");
  out.avatar_url = in.optional<std::string>("avatar_url").value_or("");
  out.gravatar_id = in.optional<std::string>("gravatar_id").value_or("");
  out.url = in.required<std::string>("url");
  out.html_url = in.required<std::string>("html_url");
  out.followers_url = in.optional<std::string>("followers_url").value_or("");
  out.repos_url = in.optional<std::string>("repos_url").value_or("");
  out.site_admin = in.optional<bool>("site_admin").value_or(false);
}

void read_record(const FieldReader &in, Permissions &out) {
  out.admin = in.required<bool>("admin");
  out.push = in.required<bool>("push");
  out.pull = in.required<bool>("pull");
}

void read_record(const FieldReader &in, Repo &out) {
  out.id = in.required<std::uint64_t>("id");
  out.owner = in.record<User>("owner");
  out.name = in.required<std::string>("name");
  out.full_name = in.required<std::string>("full_name");
  out.description = in.optional<std::string>("description");
  out.fork = in.required<bool>("fork");
  out.url = in.required<std::string>("url");
  out.html_url = in.required<std::string>("html_url");
  out.clone_url = in.optional<std::string>("clone_url").value_or("");
  out.homepage = in.optional<std::string>("homepage");
  out.language = in.optional<std::string>("language");
  out.forks_count = in.optional<std::uint64_t>("forks_count").value_or(0);
  out.stargazers_count =
      in.optional<std::uint64_t>("stargazers_count").value_or(0);
  out.watchers_count = in.optional<std::uint64_t>("watchers_count").value_or(0);
  out.open_issues_count =
      in.optional<std::uint64_t>("open_issues_count").value_or(0);
  out.default_branch = in.optional<std::string>("default_branch").value_or("");
  out.permissions = in.optional_record<Permissions>("permissions");
  out.pushed_at = in.optional_timestamp("pushed_at");
  out.created_at = in.timestamp("created_at");
  out.updated_at = in.timestamp("updated_at");
}

void read_record(const FieldReader &in, Commit &out) {
  out.label = in.required<std::string>("label");
  out.commit_ref = in.required<std::string>("ref");
  out.sha = in.required<std::string>("sha");
  out.user = in.record<User>("user");
  out.repo = in.optional_record<Repo>("repo");
}

void read_record(const FieldReader &in, Label &out) {
  out.url = in.required<std::string>("url");
  out.name = in.required<std::string>("name");
  out.color = in.required<std::string>("color");
}

void read_record(const FieldReader &in, Deployment &out) {
  out.url = in.required<std::string>("url");
  out.id = in.required<std::uint64_t>("id");
  out.sha = in.required<std::string>("sha");
  out.commit_ref = in.required<std::string>("ref");
  out.task = in.required<std::string>("task");
  out.environment = in.required<std::string>("environment");
  out.description = in.optional<std::string>("description");
  out.creator = in.record<User>("creator");
  out.created_at = in.timestamp("created_at");
  out.updated_at = in.timestamp("updated_at");
  out.statuses_url = in.required<std::string>("statuses_url");
  out.repository_url = in.required<std::string>("repository_url");
}

void read_record(const FieldReader &in, DeploymentStatus &out) {
  out.url = in.required<std::string>("url");
  out.id = in.required<std::uint64_t>("id");
  out.state = in.required<State>("state");
  out.target_url = in.optional<std::string>("target_url");
  out.description = in.optional<std::string>("description");
  out.creator = in.record<User>("creator");
  out.created_at = in.timestamp("created_at");
  out.updated_at = in.timestamp("updated_at");
  out.deployment_url = in.required<std::string>("deployment_url");
  out.repository_url = in.required<std::string>("repository_url");
}

void read_record(const FieldReader &in, Status &out) {
  out.id = in.required<std::uint64_t>("id");
  out.url = in.required<std::string>("url");
  out.state = in.required<State>("state");
  out.target_url = in.optional<std::string>("target_url");
  out.description = in.optional<std::string>("description");
  out.context = in.required<std::string>("context");
  out.creator = in.record<User>("creator");
  out.created_at = in.timestamp("created_at");
  out.updated_at = in.timestamp("updated_at");
}

void read_record(const FieldReader &in, Asset &out) {
  out.url = in.required<std::string>("url");
  out.browser_download_url = in.required<std::string>("browser_download_url");
  out.id = in.required<std::uint64_t>("id");
  out.name = in.required<std::string>("name");
  out.label = in.optional<std::string>("label");
  out.state = in.required<std::string>("state");
  out.content_type = in.required<std::string>("content_type");
  out.size = in.required<std::uint64_t>("size");
  out.download_count = in.required<std::uint64_t>("download_count");
  out.created_at = in.timestamp("created_at");
  out.updated_at = in.timestamp("updated_at");
  out.uploader = in.record<User>("uploader");
}

void read_record(const FieldReader &in, Release &out) {
  out.url = in.required<std::string>("url");
  out.html_url = in.required<std::string>("html_url");
  out.assets_url = in.required<std::string>("assets_url");
  out.upload_url = in.required<std::string>("upload_url");
  out.tarball_url = in.optional<std::string>("tarball_url");
  out.zipball_url = in.optional<std::string>("zipball_url");
  out.id = in.required<std::uint64_t>("id");
  out.tag_name = in.required<std::string>("tag_name");
  out.target_commitish = in.required<std::string>("target_commitish");
  out.name = in.optional<std::string>("name");
  out.body = in.optional<std::string>("body");
  out.draft = in.required<bool>("draft");
  out.prerelease = in.required<bool>("prerelease");
  out.created_at = in.timestamp("created_at");
  out.published_at = in.optional_timestamp("published_at");
  out.author = in.record<User>("author");
  out.assets = in.records<Asset>("assets");
}

void read_record(const FieldReader &in, Issue &out) {
  out.id = in.required<std::uint64_t>("id");
  out.url = in.required<std::string>("url");
  out.html_url = in.required<std::string>("html_url");
  out.number = in.required<std::uint64_t>("number");
  out.state = in.required<std::string>("state");
  out.title = in.required<std::string>("title");
  out.body = in.optional<std::string>("body");
  out.user = in.record<User>("user");
  out.labels = in.records<Label>("labels");
  out.assignee = in.optional_record<User>("assignee");
  out.locked = in.optional<bool>("locked").value_or(false);
  out.comments = in.optional<std::uint64_t>("comments").value_or(0);
  out.closed_at = in.optional_timestamp("closed_at");
  out.created_at = in.timestamp("created_at");
  out.updated_at = in.timestamp("updated_at");
}

void read_record(const FieldReader &in, Pull &out) {
  out.id = in.required<std::uint64_t>("id");
  out.url = in.required<std::string>("url");
  out.html_url = in.required<std::string>("html_url");
  out.diff_url = in.required<std::string>("diff_url");
  out.patch_url = in.required<std::string>("patch_url");
  out.number = in.required<std::uint64_t>("number");
  out.state = in.required<std::string>("state");
  out.title = in.required<std::string>("title");
  out.body = in.optional<std::string>("body");
  out.user = in.record<User>("user");
  out.head = in.optional_record<Commit>("head");
  out.base = in.optional_record<Commit>("base");
  out.created_at = in.timestamp("created_at");
  out.updated_at = in.timestamp("updated_at");
  out.closed_at = in.optional_timestamp("closed_at");
  out.merged_at = in.optional_timestamp("merged_at");
  out.changed_files = in.optional<std::uint64_t>("changed_files");
}

void read_record(const FieldReader &in, Key &out) {
  out.id = in.required<std::uint64_t>("id");
  out.key = in.required<std::string>("key");
  out.title = in.required<std::string>("title");
  out.verified = in.optional<bool>("verified").value_or(false);
  out.read_only = in.optional<bool>("read_only").value_or(false);
  out.created_at = in.timestamp("created_at");
}

void read_record(const FieldReader &in, GistFile &out) {
  out.size = in.required<std::uint64_t>("size");
  out.raw_url = in.required<std::string>("raw_url");
  out.type = in.optional<std::string>("type");
  out.language = in.optional<std::string>("language");
}

void read_record(const FieldReader &in, Gist &out) {
  out.url = in.required<std::string>("url");
  out.forks_url = in.required<std::string>("forks_url");
  out.commits_url = in.required<std::string>("commits_url");
  out.id = in.required<std::string>("id");
  out.description = in.optional<std::string>("description");
  out.is_public = in.required<bool>("public");
  out.owner = in.optional_record<User>("owner");
  out.files = in.record_map<GistFile>("files");
  out.comments = in.optional<std::uint64_t>("comments").value_or(0);
  out.comments_url = in.required<std::string>("comments_url");
  out.html_url = in.required<std::string>("html_url");
  out.git_pull_url = in.required<std::string>("git_pull_url");
  out.git_push_url = in.required<std::string>("git_push_url");
  out.created_at = in.timestamp("created_at");
  out.updated_at = in.timestamp("updated_at");
}

void read_record(const FieldReader &in, GistFork &out) {
  out.user = in.record<User>("user");
  out.url = in.required<std::string>("url");
  out.id = in.required<std::string>("id");
  out.created_at = in.timestamp("created_at");
  out.updated_at = in.timestamp("updated_at");
}

void read_record(const FieldReader &in, FieldErr &out) {
  out.resource = in.required<std::string>("resource");
  out.field = in.required<std::string>("field");
  out.code = in.required<std::string>("code");
}

void read_record(const FieldReader &in, ClientError &out) {
  out.message = in.required<std::string>("message");
  if (in.optional<nlohmann::json>("errors")) {
    out.errors = in.records<FieldErr>("errors");
  }
  out.documentation_url = in.optional<std::string>("documentation_url");
}

void from_json(const nlohmann::json &j, User &out) {
  out = decode_record<User>(j);
}
void from_json(const nlohmann::json &j, Repo &out) {
  out = decode_record<Repo>(j);
}
void from_json(const nlohmann::json &j, Deployment &out) {
  out = decode_record<Deployment>(j);
}
void from_json(const nlohmann::json &j, DeploymentStatus &out) {
  out = decode_record<DeploymentStatus>(j);
}
void from_json(const nlohmann::json &j, Status &out) {
  out = decode_record<Status>(j);
}
void from_json(const nlohmann::json &j, Release &out) {
  out = decode_record<Release>(j);
}
void from_json(const nlohmann::json &j, Issue &out) {
  out = decode_record<Issue>(j);
}
void from_json(const nlohmann::json &j, Pull &out) {
  out = decode_record<Pull>(j);
}
void from_json(const nlohmann::json &j, Key &out) {
  out = decode_record<Key>(j);
}
void from_json(const nlohmann::json &j, Gist &out) {
  out = decode_record<Gist>(j);
}
void from_json(const nlohmann::json &j, ClientError &out) {
  out = decode_record<ClientError>(j);
}

} // namespace hubrep
