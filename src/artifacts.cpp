#include "assay/artifacts.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <random>
#include <regex>
#include <sstream>

#include "assay/sandbox.hpp"

namespace fs = std::filesystem;

namespace assay {

namespace {

constexpr std::uint64_t kGitTimeoutMs = 5000;

std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937 rng(std::random_device{}());
  std::uniform_int_distribution<std::uint64_t> dist;
  return (dir / (".tmp_" + std::to_string(dist(rng)))).string();
}

std::string trim_trailing_newlines(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
  return s;
}

}  // namespace

ArtifactPaths artifact_paths(const std::string& artifact_dir) {
  const fs::path dir(artifact_dir);
  ArtifactPaths p;
  p.dir = artifact_dir;
  p.stdout_raw = (dir / "stdout.raw.log").string();
  p.stderr_raw = (dir / "stderr.raw.log").string();
  p.stdout_log = (dir / "stdout.log").string();
  p.stderr_log = (dir / "stderr.log").string();
  p.meta = (dir / "meta.json").string();
  p.result = (dir / "result.json").string();
  return p;
}

std::string escape_regex(const std::string& literal) {
  static const std::string kSpecial = R"(\^$.|?*+()[]{})";
  std::string out;
  out.reserve(literal.size() * 2);
  for (char c : literal) {
    if (kSpecial.find(c) != std::string::npos) out += '\\';
    out += c;
  }
  return out;
}

RedactionResult apply_redaction(const std::string& text, const std::vector<RedactionRule>& rules) {
  RedactionResult r;
  r.text = text;
  for (const auto& rule : rules) {
    if (rule.pattern.empty()) continue;
    const std::string pattern = rule.literal ? escape_regex(rule.pattern) : rule.pattern;
    const std::string flags = rule.literal || rule.flags.empty() ? std::string("g") : rule.flags;

    std::regex_constants::syntax_option_type syntax = std::regex_constants::ECMAScript;
    if (flags.find('i') != std::string::npos) syntax |= std::regex_constants::icase;
    if (flags.find('m') != std::string::npos) syntax |= std::regex_constants::multiline;
    std::regex_constants::match_flag_type match_flags = std::regex_constants::format_default;
    if (flags.find('g') == std::string::npos) match_flags |= std::regex_constants::format_first_only;

    std::regex re;
    try {
      re.assign(pattern, syntax);
    } catch (const std::regex_error&) {
      continue;  // invalid pattern: rule ignored
    }
    std::string next = std::regex_replace(r.text, re, kRedactionMarker, match_flags);
    if (next != r.text) {
      r.redacted = true;
      r.text = std::move(next);
    }
  }
  return r;
}

std::vector<RedactionRule> redaction_rules_from_json(const jsonlite::Array& items) {
  std::vector<RedactionRule> out;
  for (const auto& item : items) {
    if (std::holds_alternative<std::string>(item.v)) {
      const auto& s = std::get<std::string>(item.v);
      if (s.empty()) continue;
      RedactionRule rule;
      rule.pattern = s;
      rule.literal = true;
      out.push_back(std::move(rule));
    } else if (std::holds_alternative<jsonlite::Object>(item.v)) {
      const auto& o = std::get<jsonlite::Object>(item.v);
      RedactionRule rule;
      rule.pattern = jsonlite::get_string(o, "pattern");
      rule.flags = jsonlite::get_string(o, "flags");
      if (!rule.pattern.empty()) out.push_back(std::move(rule));
    }
  }
  return out;
}

jsonlite::Value redaction_rules_to_json(const std::vector<RedactionRule>& rules) {
  jsonlite::Array out;
  for (const auto& rule : rules) {
    if (rule.literal) {
      out.push_back(jsonlite::Value{rule.pattern});
      continue;
    }
    jsonlite::Object o;
    o["pattern"] = jsonlite::Value{rule.pattern};
    o["flags"] = jsonlite::Value{rule.flags.empty() ? std::string("g") : rule.flags};
    out.push_back(jsonlite::Value{std::move(o)});
  }
  return jsonlite::Value{std::move(out)};
}

TruncateResult truncate_bytes(const std::string& text, std::uint64_t cap_bytes) {
  TruncateResult r;
  if (text.size() <= cap_bytes) {
    r.text = text;
  } else {
    r.text = text.substr(0, static_cast<size_t>(cap_bytes));
    r.truncated = true;
  }
  r.bytes = r.text.size();
  return r;
}

std::string read_text_file_safe(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return {};
  std::ostringstream buf;
  buf << ifs.rdbuf();
  return buf.str();
}

bool atomic_write(const std::string& target_path, const std::string& data) {
  const fs::path target(target_path);
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  const std::string tmp = make_tmp_name(target.parent_path());
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) return false;
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    ofs.flush();
    if (!ofs) {
      std::remove(tmp.c_str());
      return false;
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

GitFingerprint git_fingerprint(const std::string& cwd) {
  GitFingerprint none;
  const auto sha = run_captured({"git", "rev-parse", "HEAD"}, cwd, kGitTimeoutMs);
  if (!sha.ok) return none;
  const auto branch = run_captured({"git", "rev-parse", "--abbrev-ref", "HEAD"}, cwd, kGitTimeoutMs);
  if (!branch.ok) return none;
  const auto status = run_captured({"git", "status", "--porcelain"}, cwd, kGitTimeoutMs);
  if (!status.ok) return none;

  GitFingerprint g;
  const std::string sha_text = trim_trailing_newlines(sha.stdout_text);
  const std::string branch_text = trim_trailing_newlines(branch.stdout_text);
  if (!sha_text.empty()) g.sha = sha_text;
  if (!branch_text.empty()) g.branch = branch_text;
  g.dirty = !status.stdout_text.empty();
  return g;
}

jsonlite::Value git_to_json(const GitFingerprint& git) {
  jsonlite::Object o;
  o["sha"] = git.sha ? jsonlite::Value{*git.sha} : jsonlite::Value{nullptr};
  o["branch"] = git.branch ? jsonlite::Value{*git.branch} : jsonlite::Value{nullptr};
  o["dirty"] = git.dirty ? jsonlite::Value{*git.dirty} : jsonlite::Value{nullptr};
  return jsonlite::Value{std::move(o)};
}

GitFingerprint git_from_json(const jsonlite::Object* obj) {
  GitFingerprint g;
  if (!obj) return g;
  const std::string sha = jsonlite::get_string(*obj, "sha");
  const std::string branch = jsonlite::get_string(*obj, "branch");
  if (!sha.empty()) g.sha = sha;
  if (!branch.empty()) g.branch = branch;
  auto it = obj->find("dirty");
  if (it != obj->end() && std::holds_alternative<bool>(it->second.v)) {
    g.dirty = std::get<bool>(it->second.v);
  }
  return g;
}

void remove_raw_files(const ArtifactPaths& paths) {
  std::error_code ec;
  fs::remove(paths.stdout_raw, ec);
  fs::remove(paths.stderr_raw, ec);
}

}  // namespace assay
