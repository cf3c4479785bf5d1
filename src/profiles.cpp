#include "assay/profiles.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

#include "assay/hash.hpp"
#include "assay/jsonlite.hpp"

namespace fs = std::filesystem;

namespace assay {

namespace {

std::string trim(std::string_view s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return std::string(s.substr(b, e - b));
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string normalize_id(std::string_view raw) { return lower(trim(raw)); }

// Accepts integers, positive doubles (floored) and numeric strings.
// Anything else, or a non-positive value, is "absent".
std::uint64_t positive_int(const jsonlite::Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end()) return 0;
  const auto& v = it->second.v;
  if (std::holds_alternative<std::uint64_t>(v)) return std::get<std::uint64_t>(v);
  if (std::holds_alternative<double>(v)) {
    const double d = std::get<double>(v);
    return (std::isfinite(d) && d >= 1.0) ? static_cast<std::uint64_t>(std::floor(d)) : 0;
  }
  if (std::holds_alternative<std::string>(v)) {
    const std::string text = trim(std::get<std::string>(v));
    if (text.empty()) return 0;
    char* end = nullptr;
    const double d = std::strtod(text.c_str(), &end);
    if (!end || *end != '\0' || !std::isfinite(d) || d < 1.0) return 0;
    return static_cast<std::uint64_t>(std::floor(d));
  }
  return 0;
}

std::uint64_t positive_int_alias(const jsonlite::Object& obj, const std::string& key,
                                 const std::string& alias) {
  if (obj.contains(key)) return positive_int(obj, key);
  return positive_int(obj, alias);
}

std::vector<std::string> normalize_params(const jsonlite::Object& obj) {
  std::vector<std::string> out;
  std::set<std::string> seen;
  for (const auto& raw : jsonlite::get_string_array(obj, "params")) {
    std::string key = normalize_id(raw);
    if (key.empty() || seen.contains(key)) continue;
    seen.insert(key);
    out.push_back(std::move(key));
  }
  return out;
}

void replace_all(std::string& text, const std::string& needle, const std::string& value) {
  if (needle.empty()) return;
  std::string out;
  out.reserve(text.size());
  size_t pos = 0;
  while (true) {
    const size_t hit = text.find(needle, pos);
    if (hit == std::string::npos) break;
    out.append(text, pos, hit - pos);
    out += value;
    pos = hit + needle.size();
  }
  out.append(text, pos, std::string::npos);
  text.swap(out);
}

}  // namespace

ProfileMap default_profiles(const std::string& default_cwd) {
  ProfileMap out;
  {
    ExperimentProfile p;
    p.id = "jest-suite";
    p.command = "npx jest --no-coverage";
    p.timeout_ms = 120000;
    p.description = "Full test suite";
    p.cwd = default_cwd;
    out[p.id] = p;
  }
  {
    ExperimentProfile p;
    p.id = "jest-file";
    p.command = "npx jest --no-coverage -- {file}";
    p.timeout_ms = 30000;
    p.description = "Single test file";
    p.cwd = default_cwd;
    p.params = {"file"};
    out[p.id] = p;
  }
  {
    ExperimentProfile p;
    p.id = "lint";
    p.command = "npx eslint {file}";
    p.timeout_ms = 15000;
    p.description = "Lint a specific file";
    p.cwd = default_cwd;
    p.params = {"file"};
    out[p.id] = p;
  }
  return out;
}

ProfileMap normalize_profiles(const std::string& json_text, const std::string& default_cwd,
                              bool* parse_ok) {
  ProfileMap out;
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object root = jsonlite::parse(json_text, &err);
  if (parse_ok) *parse_ok = !err.has_value();
  if (err) return out;

  for (const auto& [raw_id, raw_profile] : root) {
    const std::string id = normalize_id(raw_id);
    if (id.empty()) continue;
    if (!std::holds_alternative<jsonlite::Object>(raw_profile.v)) continue;
    const auto& obj = std::get<jsonlite::Object>(raw_profile.v);

    ExperimentProfile p;
    p.id = id;
    p.command = trim(jsonlite::get_string(obj, "command"));
    if (p.command.empty()) continue;
    const std::uint64_t timeout = positive_int_alias(obj, "timeoutMs", "timeout_ms");
    p.timeout_ms = timeout > 0 ? timeout : kDefaultProfileTimeoutMs;
    const std::string description = trim(jsonlite::get_string(obj, "description"));
    if (!description.empty()) p.description = description;
    const std::string cwd = trim(jsonlite::get_string(obj, "cwd"));
    p.cwd = cwd.empty() ? default_cwd : cwd;
    p.params = normalize_params(obj);
    const std::uint64_t cap = positive_int_alias(obj, "outputCapBytes", "output_cap_bytes");
    if (cap > 0) p.output_cap_bytes = cap;
    out[id] = std::move(p);
  }
  return out;
}

std::string profiles_to_json(const ProfileMap& profiles) {
  using jsonlite::Value;
  jsonlite::Object root;
  for (const auto& [id, p] : profiles) {
    jsonlite::Object o;
    o["id"] = Value{p.id};
    o["command"] = Value{p.command};
    o["timeoutMs"] = Value{p.timeout_ms};
    o["description"] = p.description ? Value{*p.description} : Value{nullptr};
    o["cwd"] = Value{p.cwd};
    o["params"] = jsonlite::string_array(p.params);
    if (p.output_cap_bytes) o["outputCapBytes"] = Value{*p.output_cap_bytes};
    root[id] = Value{std::move(o)};
  }
  return jsonlite::to_json(root);
}

LoadProfilesResult load_profiles(const std::string& path, const ProfileMap& defaults,
                                 const std::string& default_cwd) {
  LoadProfilesResult result;
  result.path = path;

  std::error_code ec;
  const fs::path target(path);
  if (target.has_parent_path()) {
    // Best effort; the write or read below reports the failure.
    fs::create_directories(target.parent_path(), ec);
  }

  if (!fs::exists(target, ec)) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs << profiles_to_json(defaults) << "\n";
    ofs.flush();
    if (!ofs) {
      result.error = ErrorCode::profiles_write_failed;
      result.detail = "cannot write " + path;
      return result;
    }
    result.created = true;
  }

  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    result.error = ErrorCode::profiles_parse_failed;
    result.detail = "cannot read " + path;
    return result;
  }
  std::ostringstream buf;
  buf << ifs.rdbuf();

  bool parse_ok = false;
  result.profiles = normalize_profiles(buf.str(), default_cwd, &parse_ok);
  if (!parse_ok) {
    result.profiles.clear();
    result.error = ErrorCode::profiles_parse_failed;
    result.detail = "malformed profiles document: " + path;
    return result;
  }
  for (const auto& [id, _] : result.profiles) result.profile_ids.push_back(id);
  result.ok = true;
  return result;
}

bool is_valid_param_value(std::string_view value) {
  if (value.empty()) return false;
  for (unsigned char c : value) {
    const bool ok = std::isalnum(c) || c == '_' || c == '.' || c == '/' || c == ':' ||
                    c == '\\' || c == '-';
    if (!ok) return false;
  }
  return true;
}

ResolvedCommand resolve_profile_and_command(const ExperimentRequest& request,
                                            const ProfileMap& profiles) {
  ResolvedCommand r;
  r.profile_id = normalize_id(request.profile_id);
  if (r.profile_id.empty()) {
    r.error = ErrorCode::profile_id_required;
    return r;
  }

  auto it = profiles.find(r.profile_id);
  if (it == profiles.end() || it->second.command.empty()) {
    r.error = ErrorCode::profile_not_found;
    return r;
  }
  r.profile = it->second;

  std::string command = r.profile.command;
  for (const auto& param : r.profile.params) {
    auto arg = request.args.find(param);
    const std::string value = arg == request.args.end() ? std::string() : trim(arg->second);
    if (!is_valid_param_value(value)) {
      r.error = ErrorCode::invalid_or_missing_param;
      r.param = param;
      return r;
    }
    replace_all(command, "{" + param + "}", value);
  }

  r.command = std::move(command);
  const std::string repo_path = trim(request.repo_path);
  r.cwd = repo_path.empty() ? r.profile.cwd : repo_path;
  r.timeout_ms = (request.timeout_ms && *request.timeout_ms > 0) ? *request.timeout_ms
                                                                 : r.profile.timeout_ms;
  r.ok = true;
  return r;
}

const std::vector<std::string>& baseline_env_keys() {
  static const std::vector<std::string> keys = {
      "PATH", "Path", "PATHEXT", "SystemRoot", "COMSPEC",
      "HOME", "USERPROFILE", "TMP", "TEMP", "TERM",
  };
  return keys;
}

EnvMap build_experiment_env(const std::vector<std::string>& extra_keys) {
  EnvMap env;
  std::set<std::string> keys(baseline_env_keys().begin(), baseline_env_keys().end());
  for (const auto& k : extra_keys) {
    std::string key = trim(k);
    if (!key.empty()) keys.insert(std::move(key));
  }
  for (const auto& key : keys) {
    if (const char* v = std::getenv(key.c_str())) env[key] = v;
  }
  return env;
}

std::string fingerprint_env(const EnvMap& env) {
  std::string canonical;
  bool first = true;
  for (const auto& [k, v] : env) {
    if (!first) canonical += '\n';
    first = false;
    canonical += k;
    canonical += '=';
    canonical += v;
  }
  return env_fingerprint_hash(canonical);
}

}  // namespace assay
