#include "assay/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace assay {

namespace {

const char* env_or_null(const char* key) {
  const char* e = std::getenv(key);
  return (e && e[0]) ? e : nullptr;
}

bool env_flag(const char* key) {
  const char* e = env_or_null(key);
  return e && std::string(e) == "1";
}

}  // namespace

RuntimeConfig RuntimeConfig::under(const std::string& home) {
  RuntimeConfig c;
  c.home = home;
  const fs::path base(home);
  c.db_path = (base / "assay.db").string();
  c.artifact_root = (base / "experiments").string();
  c.profiles_path = (base / "experiment-profiles.json").string();
  c.ledger_path = (base / "evidence-ledger.ndjson").string();
  std::error_code ec;
  const fs::path cwd = fs::current_path(ec);
  c.default_profile_cwd = ec ? std::string(".") : cwd.string();
  return c;
}

RuntimeConfig RuntimeConfig::from_env() {
  const char* home = env_or_null("ASSAY_HOME");
  RuntimeConfig c = under(home ? home : ".assay");
  if (const char* e = env_or_null("ASSAY_DB_PATH")) c.db_path = e;
  if (const char* e = env_or_null("ASSAY_ARTIFACT_ROOT")) c.artifact_root = e;
  if (const char* e = env_or_null("ASSAY_PROFILES_PATH")) c.profiles_path = e;
  if (const char* e = env_or_null("ASSAY_LEDGER_PATH")) c.ledger_path = e;
  if (const char* e = env_or_null("ASSAY_EVENT_LOG")) c.event_log_path = e;
  c.ledger_enabled = !env_flag("ASSAY_LEDGER_DISABLED");
  c.log_stderr = env_flag("ASSAY_LOG_STDERR");
  if (const char* e = env_or_null("ASSAY_QUEUE_CAPACITY")) {
    char* end = nullptr;
    const unsigned long long v = std::strtoull(e, &end, 10);
    // A malformed value leaves capacity at 0 so validate() reports it.
    c.queue_capacity = (end && *end == '\0') ? static_cast<std::size_t>(v) : 0;
  }
  return c;
}

std::vector<std::string> RuntimeConfig::validate() const {
  std::vector<std::string> problems;
  if (db_path.empty()) problems.push_back("db_path: required");
  if (artifact_root.empty()) problems.push_back("artifact_root: required");
  if (profiles_path.empty()) problems.push_back("profiles_path: required");
  if (ledger_enabled && ledger_path.empty()) problems.push_back("ledger_path: required when ledger is enabled");
  if (queue_capacity == 0) problems.push_back("queue_capacity: must be a positive integer");
  if (default_output_cap_bytes == 0) problems.push_back("default_output_cap_bytes: must be positive");
  return problems;
}

}  // namespace assay
