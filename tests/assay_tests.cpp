#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "assay/artifacts.hpp"
#include "assay/claims.hpp"
#include "assay/config.hpp"
#include "assay/evidence.hpp"
#include "assay/evidence_ledger.hpp"
#include "assay/hash.hpp"
#include "assay/jsonlite.hpp"
#include "assay/observability.hpp"
#include "assay/profiles.hpp"
#include "assay/runtime.hpp"
#include "assay/sandbox.hpp"
#include "assay/store.hpp"
#include "assay/types.hpp"
#include "assay/version.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

fs::path fresh_dir(const std::string& name) {
  const fs::path dir = fs::temp_directory_path() / assay::random_id("assay_test_" + name + "_");
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

std::string read_file(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  std::ostringstream buf;
  buf << ifs.rdbuf();
  return buf.str();
}

void set_env(const std::string& key, const std::string& value) {
#ifdef _WIN32
  _putenv_s(key.c_str(), value.c_str());
#else
  setenv(key.c_str(), value.c_str(), 1);
#endif
}

assay::ExperimentProfile make_profile(const std::string& id, const std::string& command,
                                      std::uint64_t timeout_ms, const std::string& cwd,
                                      std::vector<std::string> params = {}) {
  assay::ExperimentProfile p;
  p.id = id;
  p.command = command;
  p.timeout_ms = timeout_ms;
  p.cwd = cwd;
  p.params = std::move(params);
  return p;
}

// Profiles used by every runtime test. Commands are plain POSIX sh.
assay::ProfileMap test_profiles(const std::string& cwd) {
  assay::ProfileMap m;
  m["echo"] = make_profile("echo", "echo hello-{word}", 10000, cwd, {"word"});
  m["fail"] = make_profile("fail", "echo boom 1>&2; exit 3", 10000, cwd);
  m["sleepy"] = make_profile("sleepy", "sleep 5", 300, cwd);
  m["slow"] = make_profile("slow", "sleep 2", 10000, cwd);
  m["nap"] = make_profile("nap", "sleep 1", 10000, cwd);
  m["blink"] = make_profile("blink", "sleep 5", 50, cwd);
  m["secret"] = make_profile("secret", "echo token=sk-live-42 other", 10000, cwd);
  return m;
}

assay::RuntimeConfig config_under(const fs::path& root) {
  assay::RuntimeConfig cfg = assay::RuntimeConfig::under(root.string());
  cfg.default_profile_cwd = root.string();
  return cfg;
}

assay::RuntimeOptions options_for(const fs::path& root) {
  assay::RuntimeOptions opts;
  opts.default_profiles = test_profiles(root.string());
  opts.kill_grace_ms = 500;
  return opts;
}

assay::ExperimentRequest echo_request(const std::string& word) {
  assay::ExperimentRequest req;
  req.profile_id = "echo";
  req.args["word"] = word;
  return req;
}

assay::ExperimentRecord record_at(const std::string& id, std::uint64_t created_at,
                                  const std::string& profile) {
  assay::ExperimentRecord r;
  r.id = id;
  r.profile_id = profile;
  r.command = "true";
  r.requested_by = "tester";
  r.timeout_ms = 1000;
  r.output_cap_bytes = 1024;
  r.artifact_dir = "/tmp/" + id;
  r.cwd = "/tmp";
  r.created_at_ms = created_at;
  r.updated_at_ms = created_at;
  return r;
}

// ============================================================================
// Hashing & versioning
// ============================================================================

void test_blake3_known_vectors() {
  expect(assay::blake3_hex("") ==
             "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(assay::blake3_hex("hello") ==
             "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_file_hash_matches_payload_hash() {
  const fs::path dir = fresh_dir("hash");
  const fs::path f = dir / "payload.txt";
  {
    std::ofstream ofs(f, std::ios::binary);
    ofs << "experiment output\n";
  }
  expect(assay::hash_file_blake3_hex(f.string()) == assay::blake3_hex("experiment output\n"),
         "file hash must equal in-memory hash");
  expect(assay::hash_file_blake3_hex((dir / "missing").string()).empty(),
         "missing file hashes to empty string");
  expect(assay::env_fingerprint_hash("A=1") != assay::ledger_chain_hash("A=1"),
         "domain separation between env and ledger digests");
  fs::remove_all(dir);
}

void test_store_schema_compatibility() {
  expect(assay::version::check_store_schema(0).ok, "fresh store accepted");
  expect(assay::version::check_store_schema(assay::version::STORE_SCHEMA_VERSION).ok,
         "current schema accepted");
  expect(!assay::version::check_store_schema(assay::version::STORE_SCHEMA_VERSION + 1).ok,
         "newer schema rejected");
}

// ============================================================================
// JSON
// ============================================================================

void test_json_sorted_serialisation() {
  assay::jsonlite::Object o;
  o["b"] = assay::jsonlite::Value{std::uint64_t{1}};
  o["a"] = assay::jsonlite::Value{std::string("x")};
  o["c"] = assay::jsonlite::int_value(-2);
  const std::string out = assay::jsonlite::to_json(o);
  expect(out.find("\"a\"") < out.find("\"b\"") && out.find("\"b\"") < out.find("\"c\""),
         "object keys serialised in sorted order: " + out);
}

void test_json_duplicate_key_rejected() {
  std::optional<assay::jsonlite::JsonError> err;
  (void)assay::jsonlite::parse(R"({"a":1,"a":2})", &err);
  expect(err.has_value(), "duplicate key must fail to parse");
  expect(err->code == "json_duplicate_key", "duplicate key error code: " + err->code);

  std::optional<assay::jsonlite::JsonError> err2;
  (void)assay::jsonlite::parse("[1,2]", &err2);
  expect(err2.has_value(), "non-object root rejected by parse()");
}

// ============================================================================
// Configuration
// ============================================================================

void test_config_defaults_and_validation() {
  const auto cfg = assay::RuntimeConfig::under("/tmp/assay-home");
  expect(cfg.validate().empty(), "derived config must validate");
  expect(cfg.db_path == (fs::path("/tmp/assay-home") / "assay.db").string(), "db path derived");
  expect(cfg.queue_capacity == assay::kDefaultQueueCapacity, "default queue capacity");
  expect(cfg.default_output_cap_bytes == 1024 * 1024, "default output cap is 1 MiB");

  assay::RuntimeConfig bad;
  bad.queue_capacity = 0;
  const auto problems = bad.validate();
  expect(problems.size() >= 4, "empty config reports every missing field");
}

void test_config_from_env_overrides() {
  set_env("ASSAY_HOME", "/tmp/assay-env-home");
  set_env("ASSAY_DB_PATH", "/tmp/assay-env-other.db");
  set_env("ASSAY_QUEUE_CAPACITY", "7");
  const auto cfg = assay::RuntimeConfig::from_env();
  expect(cfg.db_path == "/tmp/assay-env-other.db", "ASSAY_DB_PATH overrides db path");
  expect(cfg.artifact_root == (fs::path("/tmp/assay-env-home") / "experiments").string(),
         "artifact root derived from ASSAY_HOME");
  expect(cfg.queue_capacity == 7, "ASSAY_QUEUE_CAPACITY parsed");
  set_env("ASSAY_HOME", "");
  set_env("ASSAY_DB_PATH", "");
  set_env("ASSAY_QUEUE_CAPACITY", "");
}

// ============================================================================
// Profiles
// ============================================================================

void test_profiles_first_run_writes_defaults() {
  const fs::path dir = fresh_dir("profiles");
  const std::string path = (dir / "nested" / "profiles.json").string();
  const auto loaded =
      assay::load_profiles(path, assay::default_profiles(dir.string()), dir.string());
  expect(loaded.ok, "load_profiles ok on first run");
  expect(loaded.created, "defaults written on first run");
  expect(fs::exists(path), "profiles file created");
  expect(loaded.profiles.contains("lint") && loaded.profiles.contains("jest-file"),
         "built-in profiles present");

  const auto again =
      assay::load_profiles(path, assay::default_profiles(dir.string()), dir.string());
  expect(again.ok && !again.created, "second load reads the existing file");
  expect(again.profile_ids == loaded.profile_ids, "profile ids stable across loads");
  fs::remove_all(dir);
}

void test_profiles_normalisation() {
  bool parse_ok = false;
  const auto profiles = assay::normalize_profiles(
      R"({"Lint":{"command":"  npx eslint {file}  ","timeout_ms":0,"params":["FILE","file"],)"
      R"("description":"   ","output_cap_bytes":2048},"empty":{"command":"   "},"":{"command":"x"}})",
      "/work", &parse_ok);
  expect(parse_ok, "document parses");
  expect(profiles.size() == 1, "empty id and empty command dropped");
  const auto& p = profiles.at("lint");
  expect(p.command == "npx eslint {file}", "command trimmed");
  expect(p.timeout_ms == assay::kDefaultProfileTimeoutMs, "non-positive timeout defaulted");
  expect(p.params.size() == 1 && p.params[0] == "file", "params lower-cased and deduplicated");
  expect(!p.description.has_value(), "blank description absent");
  expect(p.cwd == "/work", "cwd defaulted");
  expect(p.output_cap_bytes && *p.output_cap_bytes == 2048, "output cap alias accepted");

  const fs::path dir = fresh_dir("profiles_bad");
  const std::string path = (dir / "profiles.json").string();
  {
    std::ofstream ofs(path);
    ofs << "[\"not\",\"an\",\"object\"]";
  }
  const auto loaded = assay::load_profiles(path, {}, dir.string());
  expect(!loaded.ok && loaded.error == assay::ErrorCode::profiles_parse_failed,
         "non-object root fails with profiles_parse_failed");
  fs::remove_all(dir);
}

void test_resolve_rejects_injection() {
  const auto profiles = assay::default_profiles("/repo");

  assay::ExperimentRequest req;
  req.profile_id = "  LINT ";
  req.args["file"] = "src/app.js; rm -rf /";
  auto r = assay::resolve_profile_and_command(req, profiles);
  expect(!r.ok && r.error == assay::ErrorCode::invalid_or_missing_param,
         "shell metacharacters rejected");
  expect(r.param == "file", "offending parameter named");

  req.args["file"] = " src/app.js ";
  r = assay::resolve_profile_and_command(req, profiles);
  expect(r.ok, "valid parameter accepted");
  expect(r.command == "npx eslint src/app.js", "placeholder substituted with trimmed value");
  expect(r.cwd == "/repo" && r.timeout_ms == 15000, "profile defaults applied");

  req.repo_path = "/elsewhere";
  req.timeout_ms = 999;
  r = assay::resolve_profile_and_command(req, profiles);
  expect(r.cwd == "/elsewhere" && r.timeout_ms == 999, "caller overrides applied");

  assay::ExperimentRequest missing;
  expect(assay::resolve_profile_and_command(missing, profiles).error ==
             assay::ErrorCode::profile_id_required,
         "empty profile id");
  missing.profile_id = "nope";
  expect(assay::resolve_profile_and_command(missing, profiles).error ==
             assay::ErrorCode::profile_not_found,
         "unknown profile");
}

void test_experiment_env_is_allow_listed() {
  set_env("ASSAY_TEST_EXTRA", "visible");
  set_env("ASSAY_TEST_SECRET", "hidden");
  const auto env = assay::build_experiment_env({"ASSAY_TEST_EXTRA", "ASSAY_TEST_UNSET_KEY"});
  expect(env.contains("ASSAY_TEST_EXTRA") && env.at("ASSAY_TEST_EXTRA") == "visible",
         "declared extra key copied");
  expect(!env.contains("ASSAY_TEST_SECRET"), "undeclared variable not passed through");
  expect(!env.contains("ASSAY_TEST_UNSET_KEY"), "unset variable not invented");

  const std::string fp = assay::fingerprint_env(env);
  expect(fp.size() == 64 && fp == assay::fingerprint_env(env), "fingerprint stable");
  auto changed = env;
  changed["ASSAY_TEST_EXTRA"] = "different";
  expect(assay::fingerprint_env(changed) != fp, "fingerprint tracks values");
}

// ============================================================================
// Artifact processing
// ============================================================================

void test_redaction_rules() {
  assay::RedactionRule literal;
  literal.pattern = "sk-live-42";
  literal.literal = true;
  auto r = assay::apply_redaction("a sk-live-42 b sk-live-42", {literal});
  expect(r.redacted, "literal redaction flagged");
  expect(r.text == "a [REDACTED] b [REDACTED]", "literal replaced globally: " + r.text);

  assay::RedactionRule dotted;
  dotted.pattern = "a.b";
  dotted.literal = true;
  r = assay::apply_redaction("axb a.b", {dotted});
  expect(r.text == "axb [REDACTED]", "literal metacharacters escaped: " + r.text);

  assay::RedactionRule first_only;
  first_only.pattern = "x+";
  first_only.flags = "i";
  r = assay::apply_redaction("XX-xx", {first_only});
  expect(r.text == "[REDACTED]-xx", "without g only the first match is replaced: " + r.text);

  assay::RedactionRule broken;
  broken.pattern = "(";
  broken.flags = "g";
  r = assay::apply_redaction("untouched", {broken});
  expect(!r.redacted && r.text == "untouched", "invalid pattern skipped");
}

void test_redaction_rules_from_json() {
  std::optional<assay::jsonlite::JsonError> err;
  const auto arr = assay::jsonlite::parse_value(
      R"(["literal", {"pattern":"t[0-9]+","flags":"gi"}, 5, ""])", &err);
  expect(!err, "rules document parses");
  const auto rules =
      assay::redaction_rules_from_json(std::get<assay::jsonlite::Array>(arr.v));
  expect(rules.size() == 2, "non-rule entries ignored");
  expect(rules[0].literal && rules[0].pattern == "literal", "string entry is literal");
  expect(!rules[1].literal && rules[1].flags == "gi", "object entry keeps flags");
}

void test_truncation_is_exact_bytes() {
  const std::string text = "h\xC3\xA9llo";  // "héllo", 6 bytes
  auto t = assay::truncate_bytes(text, 2);
  expect(t.truncated && t.bytes == 2 && t.text.size() == 2, "cut at exactly the cap");
  t = assay::truncate_bytes(text, 64);
  expect(!t.truncated && t.bytes == 6 && t.text == text, "short text untouched");
}

void test_atomic_write_replaces_target() {
  const fs::path dir = fresh_dir("atomic");
  const std::string target = (dir / "sub" / "meta.json").string();
  expect(assay::atomic_write(target, "one"), "first write");
  expect(assay::atomic_write(target, "two"), "overwrite");
  expect(read_file(target) == "two", "target holds the last write");
  size_t entries = 0;
  for (const auto& e : fs::directory_iterator(dir / "sub")) {
    (void)e;
    ++entries;
  }
  expect(entries == 1, "no temp files left behind");
  fs::remove_all(dir);
}

void test_git_fingerprint_outside_repo() {
  const fs::path dir = fresh_dir("nogit");
  const auto g = assay::git_fingerprint(dir.string());
  expect(!g.sha && !g.branch && !g.dirty, "non-repo directory degrades to nulls");
  fs::remove_all(dir);
}

// ============================================================================
// Sandbox
// ============================================================================

void test_shell_invocation_shape() {
  expect(assay::quote_path_for_shell("a\"b") == "\"a\\\"b\"", "embedded quote escaped");
#ifndef _WIN32
  const auto inv = assay::build_shell_invocation("echo hi", "/o/out.log", "/o/err.log");
  expect(inv.shell == "/bin/sh", "POSIX shell");
  expect(inv.args.size() == 2 && inv.args[0] == "-c", "sh -c form");
  expect(inv.args[1] == "echo hi 1> \"/o/out.log\" 2> \"/o/err.log\"",
         "streams redirected: " + inv.args[1]);
#endif
}

void test_pty_runs_command_to_completion() {
  const fs::path dir = fresh_dir("pty");
  assay::PtySpec spec;
  spec.invocation = assay::build_shell_invocation(
      "echo out-text; echo err-text 1>&2; exit 4", (dir / "o.log").string(),
      (dir / "e.log").string());
  spec.cwd = dir.string();
  spec.env = assay::build_experiment_env({});
  spec.timeout_ms = 10000;

  int kills = 0;
  std::atomic<assay::ProcessId> pid{0};
  const auto res = assay::run_in_pty(spec, [&](assay::ProcessId) { ++kills; }, &pid);
  expect(!res.spawn_failed, "spawned");
  expect(!res.timed_out && kills == 0, "no timeout, no kill");
  expect(res.exit_code && *res.exit_code == 4, "exit code propagated");
  expect(read_file(dir / "o.log") == "out-text\n", "stdout captured to file");
  expect(read_file(dir / "e.log") == "err-text\n", "stderr captured to file");
  expect(pid.load() == 0, "current pid cleared on return");
  fs::remove_all(dir);
}

void test_pty_timeout_kills_exactly_once() {
  const fs::path dir = fresh_dir("pty_timeout");
  assay::PtySpec spec;
  spec.invocation = assay::build_shell_invocation("sleep 5", (dir / "o.log").string(),
                                                  (dir / "e.log").string());
  spec.cwd = dir.string();
  spec.env = assay::build_experiment_env({});
  spec.timeout_ms = 200;
  spec.kill_grace_ms = 500;

  int kills = 0;
  const auto started = std::chrono::steady_clock::now();
  const auto res = assay::run_in_pty(
      spec,
      [&](assay::ProcessId p) {
        ++kills;
        assay::kill_process_tree(p);
      },
      nullptr);
  const auto elapsed = std::chrono::steady_clock::now() - started;
  expect(res.timed_out, "flagged as timed out");
  expect(kills == 1, "kill invoked exactly once, got " + std::to_string(kills));
  expect(elapsed < std::chrono::seconds(4), "run resolved well before the sleep finished");
  fs::remove_all(dir);
}

// ============================================================================
// Store
// ============================================================================

void test_store_idempotency_index() {
  const fs::path dir = fresh_dir("store");
  assay::Database db;
  expect(db.open((dir / "db" / "assay.db").string(), 1000).ok, "database opens");
  assay::ExperimentStore store(db);

  auto a = record_at("exp_a", 100, "echo");
  a.idempotency_key = "key-1";
  auto b = record_at("exp_b", 200, "echo");
  b.idempotency_key = "key-1";
  expect(store.insert(a), "first insert");
  expect(!store.insert(b), "second insert with same key rejected by the index");
  const auto found = store.find_by_idempotency_key("key-1");
  expect(found && found->id == "exp_a", "lookup by key");

  auto c = record_at("exp_c", 300, "echo");
  auto d = record_at("exp_d", 400, "echo");
  expect(store.insert(c) && store.insert(d), "rows without a key never collide");
  db.close();

  assay::Database reopened;
  expect(reopened.open((dir / "db" / "assay.db").string(), 2000).ok, "reopen migrates cleanly");
  assay::ExperimentStore again(reopened);
  expect(again.get("exp_c").has_value(), "rows persisted");
  reopened.close();
  fs::remove_all(dir);
}

void test_store_finalize_and_status_counts() {
  const fs::path dir = fresh_dir("store_final");
  assay::Database db;
  expect(db.open((dir / "assay.db").string(), 1).ok, "database opens");
  assay::ExperimentStore store(db);
  auto rec = record_at("exp_f", 10, "echo");
  rec.relation = assay::EvidenceRelation::caused_by;
  rec.guard = assay::GuardContext{"guard-7", "deploy", true};
  expect(store.insert(rec), "insert");
  expect(store.mark_running("exp_f", 20), "mark running");
  expect(store.count_with_status(assay::ExperimentStatus::running) == 1, "one running row");

  assay::CompletionUpdate u;
  u.status = assay::ExperimentStatus::failed;
  u.exit_code = -1;
  u.duration_ms = 5;
  u.completed_at_ms = 25;
  u.error_message = "first; second";
  expect(store.finalize("exp_f", u), "finalize");
  const auto got = store.get("exp_f");
  expect(got.has_value(), "row readable");
  expect(got->status == assay::ExperimentStatus::failed, "terminal status stored");
  expect(got->exit_code && *got->exit_code == -1, "negative exit code round-trips");
  expect(got->relation == assay::EvidenceRelation::caused_by,
         "relation kept when the update carries none");
  expect(got->guard && got->guard->guard_id == "guard-7" && got->guard->blocking,
         "guard context stored as JSON");
  expect(got->started_at_ms && *got->started_at_ms == 20, "started_at set");

  assay::ListFilters by_guard;
  by_guard.guard_id = "guard-7";
  expect(store.list(by_guard).rows.size() == 1, "guard filter matches");
  by_guard.guard_id = "guard-70";
  expect(store.list(by_guard).rows.empty(), "guard filter is exact");
  db.close();
  fs::remove_all(dir);
}

void test_store_keyset_pagination() {
  const fs::path dir = fresh_dir("store_page");
  assay::Database db;
  expect(db.open((dir / "assay.db").string(), 1).ok, "database opens");
  assay::ExperimentStore store(db);
  expect(store.insert(record_at("exp_1", 100, "echo")), "insert 1");
  expect(store.insert(record_at("exp_2", 200, "echo")), "insert 2");
  expect(store.insert(record_at("exp_3", 200, "lint")), "insert 3");
  expect(store.insert(record_at("exp_4", 300, "echo")), "insert 4");

  assay::ListFilters f;
  f.limit = 2;
  auto page = store.list(f);
  expect(page.ok && page.rows.size() == 2, "first page size");
  expect(page.rows[0].id == "exp_4" && page.rows[1].id == "exp_3",
         "ordered by created_at desc, id desc");
  expect(!page.next_cursor.empty(), "cursor when more rows exist");

  f.cursor = page.next_cursor;
  page = store.list(f);
  expect(page.rows.size() == 2 && page.rows[0].id == "exp_2" && page.rows[1].id == "exp_1",
         "second page continues after the last returned row");
  expect(page.next_cursor.empty(), "exhausted listing has no cursor");

  assay::ListFilters by_profile;
  by_profile.profile = "LINT";
  expect(store.list(by_profile).rows.size() == 1, "profile filter lower-cased");

  assay::ListFilters bogus;
  bogus.cursor = "!!not-base64!!";
  bogus.status = "exploded";
  expect(store.list(bogus).rows.size() == 4, "bad cursor and unknown status ignored");

  assay::ListFilters range;
  range.since_ms = 150;
  range.until_ms = 250;
  expect(store.list(range).rows.size() == 2, "created_at range filter");

  assay::ListFilters huge;
  huge.limit = 100000;
  expect(store.list(huge).rows.size() == 4, "limit clamped, not rejected");
  db.close();
  fs::remove_all(dir);
}

void test_cursor_codec() {
  const std::string c = assay::encode_cursor(1700000000000ULL, "exp_x");
  expect(c.find('=') == std::string::npos && c.find('+') == std::string::npos,
         "cursor is unpadded base64url");
  std::uint64_t at = 0;
  std::string id;
  expect(assay::decode_cursor(c, &at, &id) && at == 1700000000000ULL && id == "exp_x",
         "cursor decodes");
  expect(!assay::decode_cursor(assay::encode_cursor(0, "exp_x"), &at, &id),
         "zero createdAt rejected");
  expect(!assay::decode_cursor(assay::base64url_encode("{\"createdAt\":5}"), &at, &id),
         "missing id rejected");
}

// ============================================================================
// Claims
// ============================================================================

void test_claim_transitions() {
  const fs::path dir = fresh_dir("claims");
  assay::Database db;
  expect(db.open((dir / "assay.db").string(), 1).ok, "database opens");
  assay::SqliteClaimStore claims(db);

  const auto created =
      claims.create_claim("", "cache is safe", "alice", assay::ClaimStatus::proposed, 10);
  expect(created.ok && created.claim.id.rfind("clm_", 0) == 0, "generated claim id");
  const std::string id = created.claim.id;

  auto u = claims.update_claim_status(id, assay::ClaimStatus::proposed, "bob", "noop", 11);
  expect(u.ok && u.no_change, "same status is a no-op");
  u = claims.update_claim_status(id, assay::ClaimStatus::pending_proof, "bob", "needs_run", 12);
  expect(u.ok && u.previous == assay::ClaimStatus::proposed, "proposed -> pending_proof");
  u = claims.update_claim_status(id, assay::ClaimStatus::proposed, "bob", "undo", 13);
  expect(!u.ok && u.reason == "invalid_transition", "pending_proof -> proposed refused");
  u = claims.update_claim_status("clm_missing", assay::ClaimStatus::confirmed, "bob", "x", 14);
  expect(!u.ok && u.reason == "claim_not_found", "unknown claim");

  expect(assay::is_allowed_claim_transition(assay::ClaimStatus::confirmed,
                                            assay::ClaimStatus::contested),
         "confirmed -> contested allowed");
  expect(!assay::is_allowed_claim_transition(assay::ClaimStatus::deprecated,
                                             assay::ClaimStatus::confirmed),
         "deprecated is terminal");
  db.close();
  fs::remove_all(dir);
}

void test_claim_evidence_dedupe() {
  const fs::path dir = fresh_dir("claims_ev");
  assay::Database db;
  expect(db.open((dir / "assay.db").string(), 1).ok, "database opens");
  assay::SqliteClaimStore claims(db);
  expect(claims.create_claim("clm_1", "x", "alice", assay::ClaimStatus::proposed, 1).ok,
         "claim created");

  assay::AddEvidenceOptions opts;
  opts.now_ms = 5;
  auto r = claims.add_evidence("clm_1", "evt_1", assay::EvidenceRelation::supports, opts);
  expect(r.ok && r.status == "inserted", "first evidence inserted");
  r = claims.add_evidence("clm_1", "evt_1", assay::EvidenceRelation::supports, opts);
  expect(r.ok && r.status == "duplicate", "same ref is a duplicate");
  expect(claims.evidence_count("clm_1") == 1, "one evidence row");
  r = claims.add_evidence("clm_nope", "evt_1", assay::EvidenceRelation::supports, opts);
  expect(!r.ok && r.reason == "claim_not_found", "evidence on unknown claim refused");
  db.close();
  fs::remove_all(dir);
}

void test_link_evidence_transitions_pending_proof() {
  const fs::path dir = fresh_dir("link");
  assay::Database db;
  expect(db.open((dir / "assay.db").string(), 1).ok, "database opens");
  assay::SqliteClaimStore claims(db);
  expect(claims.create_claim("clm_p", "x", "a", assay::ClaimStatus::pending_proof, 1).ok,
         "pending claim");
  expect(claims.create_claim("clm_q", "y", "a", assay::ClaimStatus::proposed, 1).ok,
         "proposed claim");

  auto out = assay::link_evidence_to_claim(claims, "clm_p", "evt_a",
                                           assay::EvidenceRelation::contradicts,
                                           assay::ExperimentStatus::timed_out, "ci", 2);
  expect(out.attached && out.status_update && out.status_update->ok, "attached + updated");
  expect(claims.get_claim("clm_p")->status == assay::ClaimStatus::contested,
         "timed out run contests a pending claim");

  out = assay::link_evidence_to_claim(claims, "clm_q", "evt_b",
                                      assay::EvidenceRelation::supports,
                                      assay::ExperimentStatus::succeeded, "ci", 3);
  expect(out.attached && !out.status_update, "non-pending claim status untouched");
  expect(claims.get_claim("clm_q")->status == assay::ClaimStatus::proposed, "still proposed");

  expect(assay::derive_evidence_relation(assay::ExperimentStatus::succeeded,
                                         assay::EvidenceRelation::contradicts) ==
             assay::EvidenceRelation::supports,
         "success always supports");
  expect(assay::derive_evidence_relation(assay::ExperimentStatus::attached,
                                         assay::EvidenceRelation::caused_by) ==
             assay::EvidenceRelation::caused_by,
         "declared relation kept for non-phase statuses");
  db.close();
  fs::remove_all(dir);
}

// ============================================================================
// Evidence ledger
// ============================================================================

void test_ledger_chain_and_dedupe() {
  const fs::path dir = fresh_dir("ledger");
  const std::string path = (dir / "ledger" / "events.ndjson").string();

  assay::CompletedRun run;
  run.run_id = "exp_l1";
  run.profile_id = "echo";
  run.phase_status = assay::ExperimentStatus::succeeded;
  run.exit_code = 0;
  run.completed_at_ms = 1234;
  run.files = assay::artifact_paths((dir / "exp_l1").string());

  auto first = assay::append_completed_event(assay::default_ledger_factory(), path, true, run);
  expect(first.ok && first.status == "inserted", "first append inserted");
  expect(first.event_id == "evt_experiment_exp_l1", "deterministic event id");

  auto again = assay::append_completed_event(assay::default_ledger_factory(), path, true, run);
  expect(again.ok && again.status == "duplicate", "recomputed event deduplicated after reopen");

  run.run_id = "exp_l2";
  expect(assay::append_completed_event(assay::default_ledger_factory(), path, true, run).ok,
         "second event");
  expect(assay::verify_ledger_chain(path) == 2, "two chained events");

  const std::string text = read_file(path);
  const auto first_line = assay::jsonlite::parse(text.substr(0, text.find('\n')), nullptr);
  expect(assay::jsonlite::get_string(first_line, "traceId") == "trc_experiment_exp_l1",
         "default trace id");
  expect(assay::jsonlite::get_string(first_line, "source") == "assay.experiment-worker",
         "event source");

  {
    std::ofstream ofs(path, std::ios::app);
    ofs << "{\"seq\":3,\"prev\":\"forged\",\"eventId\":\"x\",\"type\":\"t\"}\n";
  }
  expect(assay::verify_ledger_chain(path) == -1, "forged link detected");

  const auto disabled =
      assay::append_completed_event(assay::default_ledger_factory(), path, false, run);
  expect(!disabled.ok && disabled.reason == "ledger_disabled", "disabled ledger refuses appends");
  fs::remove_all(dir);
}

assay::CompletedRun ledger_run(const fs::path& dir, const std::string& run_id) {
  assay::CompletedRun run;
  run.run_id = run_id;
  run.profile_id = "echo";
  run.phase_status = assay::ExperimentStatus::succeeded;
  run.exit_code = 0;
  run.completed_at_ms = 1000;
  run.files = assay::artifact_paths((dir / run_id).string());
  return run;
}

void test_ledger_torn_tail_is_cut() {
  const fs::path dir = fresh_dir("ledger_torn");
  const std::string path = (dir / "events.ndjson").string();
  const auto factory = assay::default_ledger_factory();
  expect(assay::append_completed_event(factory, path, true, ledger_run(dir, "exp_t1")).ok,
         "first event");
  const auto good_size = fs::file_size(path);
  {
    std::ofstream ofs(path, std::ios::binary | std::ios::app);
    ofs << "{\"seq\":2,\"eventId\":\"evt_x\",\"pay";
  }

  const auto next = assay::append_completed_event(factory, path, true, ledger_run(dir, "exp_t2"));
  expect(next.ok && next.status == "inserted", "append after a torn write: " + next.reason);
  expect(fs::file_size(path) > good_size, "new record written");
  expect(read_file(path).find("evt_x") == std::string::npos, "torn bytes cut");
  expect(assay::verify_ledger_chain(path) == 2, "chain intact across the recovery");
  fs::remove_all(dir);
}

void test_ledger_mid_file_corruption_refused() {
  const fs::path dir = fresh_dir("ledger_mid");
  const std::string path = (dir / "events.ndjson").string();
  {
    std::ofstream ofs(path, std::ios::binary);
    ofs << "{not json\n{\"seq\":1,\"prev\":\"x\",\"eventId\":\"evt_a\"}\n";
  }
  const auto out = assay::append_completed_event(assay::default_ledger_factory(), path, true,
                                                 ledger_run(dir, "exp_m1"));
  expect(!out.ok && out.reason == "ledger_corrupt", "damaged history is not repaired");
  fs::remove_all(dir);
}

void test_ledger_replay_tracks_file() {
  const fs::path dir = fresh_dir("ledger_replay");
  const std::string path = (dir / "events.ndjson").string();
  const auto factory = assay::default_ledger_factory();
  for (int i = 0; i < 5; ++i) {
    const auto out = assay::append_completed_event(factory, path, true,
                                                   ledger_run(dir, "exp_r" + std::to_string(i)));
    expect(out.ok && out.status == "inserted", "sequential append " + std::to_string(i));
  }
  expect(assay::verify_ledger_chain(path) == 5, "fresh handles continue the chain");

  fs::resize_file(path, 0);
  const auto restarted = assay::append_completed_event(factory, path, true,
                                                       ledger_run(dir, "exp_r0"));
  expect(restarted.ok && restarted.status == "inserted",
         "a truncated file is replayed from the start");
  expect(assay::verify_ledger_chain(path) == 1, "chain restarts at seq 1");
  fs::remove_all(dir);
}

void test_event_trace_id_precedence() {
  assay::CompletedRun run;
  run.run_id = "exp_t";
  run.guard = assay::GuardContext{"guard-1", "merge", false};
  expect(assay::build_completed_event(run).trace_id == "guard-1", "guard id used as trace id");
  run.trace_id = "trace-explicit";
  expect(assay::build_completed_event(run).trace_id == "trace-explicit", "explicit trace id wins");
  const auto ev = assay::build_completed_event(run);
  expect(ev.evidence_refs.size() == 3, "stdout, stderr and meta refs");
  expect(ev.pane_id == "2" && ev.direction == "internal" && ev.role == "system",
         "fixed event envelope");
}

// ============================================================================
// Runtime
// ============================================================================

std::atomic<int> g_completed_events{0};

void count_completed(const assay::RuntimeEvent& ev) {
  if (ev.kind == assay::RuntimeEventKind::completed) g_completed_events.fetch_add(1);
}

void test_runtime_open_and_health() {
  const fs::path root = fresh_dir("rt_health");
  assay::ExperimentRuntime rt(config_under(root), options_for(root));
  expect(!rt.health().available, "closed runtime reports unavailable");
  expect(rt.create(echo_request("x")).error == assay::ErrorCode::unavailable,
         "create before open is rejected");

  const auto opened = rt.open();
  expect(opened.ok, "runtime opens: " + opened.reason);
  const auto h = rt.health();
  expect(h.available && !h.running && h.queued == 0, "idle after open");
  expect(h.profile_count == test_profiles(root.string()).size(), "profiles loaded");
  expect(fs::exists(rt.config().profiles_path), "profiles file written");
  expect(fs::is_directory(rt.config().artifact_root), "artifact root created");
  rt.close();
  expect(!rt.is_available(), "closed");
  fs::remove_all(root);
}

void test_runtime_rejects_without_side_effects() {
  const fs::path root = fresh_dir("rt_reject");
  assay::ExperimentRuntime rt(config_under(root), options_for(root));
  expect(rt.open().ok, "open");

  auto bad = echo_request("$(whoami)");
  auto res = rt.create(bad);
  expect(!res.ok && res.error == assay::ErrorCode::invalid_or_missing_param && res.param == "word",
         "injection attempt rejected");
  assay::ExperimentRequest unknown;
  unknown.profile_id = "does-not-exist";
  expect(rt.create(unknown).error == assay::ErrorCode::profile_not_found, "unknown profile");

  size_t dirs = 0;
  for (const auto& e : fs::directory_iterator(rt.config().artifact_root)) {
    (void)e;
    ++dirs;
  }
  expect(dirs == 0, "no artifact directory for rejected submissions");
  expect(rt.list({}).experiments.empty(), "no row for rejected submissions");
  expect(rt.stats().rejected.load() == 2, "rejections counted");
  rt.close();
  fs::remove_all(root);
}

void test_runtime_success_attaches_and_confirms() {
  const fs::path root = fresh_dir("rt_success");
  g_completed_events = 0;
  assay::set_runtime_event_hook(count_completed);
  assay::ExperimentRuntime rt(config_under(root), options_for(root));
  expect(rt.open().ok, "open");
  expect(rt.claim_store()
             ->create_claim("clm_ok", "echo works", "alice", assay::ClaimStatus::pending_proof,
                            assay::unix_now_ms())
             .ok,
         "claim created");

  auto req = echo_request("world");
  req.claim_id = "clm_ok";
  req.requested_by = "alice";
  req.guard = assay::GuardContext{"guard-42", "merge", true};
  const auto created = rt.create(req);
  expect(created.ok && created.outcome == assay::CreateOutcome::started, "started immediately");
  expect(created.run_id.rfind("exp_", 0) == 0, "generated run id");
  expect(fs::is_directory(created.artifact_dir), "artifact dir exists at submission");

  const auto row = rt.wait_for_terminal(created.run_id, 20000);
  expect(row.has_value(), "row present");
  expect(row->status == assay::ExperimentStatus::attached,
         "run attached, got " + assay::to_string(row->status) + " / " + row->error_message);
  expect(row->exit_code && *row->exit_code == 0, "exit 0");
  expect(row->relation == assay::EvidenceRelation::supports, "success supports");
  expect(row->evidence_ref == "evt_experiment_" + created.run_id, "evidence ref recorded");

  const auto claim = rt.claim_store()->get_claim("clm_ok");
  expect(claim && claim->status == assay::ClaimStatus::confirmed, "pending claim confirmed");
  expect(rt.claim_store()->evidence_count("clm_ok") == 1, "evidence attached once");

  const auto files = assay::artifact_paths(created.artifact_dir);
  expect(read_file(files.stdout_log) == "hello-world\n", "stdout log persisted");
  expect(assay::hash_file_blake3_hex(files.stdout_log) == row->stdout_hash,
         "stored hash matches persisted log");
  expect(!fs::exists(files.stdout_raw) && !fs::exists(files.stderr_raw), "raw files removed");
  expect(fs::exists(files.meta) && fs::exists(files.result), "meta and result written");

  const auto meta = assay::jsonlite::parse(read_file(files.meta), nullptr);
  expect(assay::jsonlite::get_string(meta, "envFingerprint").size() == 64, "env fingerprint");
  expect(assay::jsonlite::get_u64(meta, "meta_version") == assay::version::ARTIFACT_META_VERSION,
         "meta version stamped");
  const auto* attach = assay::jsonlite::get_object(meta, "attach");
  expect(attach && assay::jsonlite::get_string(*attach, "status") == "attached",
         "meta attach section");
  const auto result = assay::jsonlite::parse(read_file(files.result), nullptr);
  expect(assay::jsonlite::get_bool(result, "ok"), "result.json ok");

  const auto got = rt.get(created.run_id);
  expect(got.ok && got.cwd == root.string(), "get merges cwd");
  expect(got.record.guard && got.record.guard->guard_id == "guard-42", "guard context stored");
  const auto got_json = assay::jsonlite::parse(got.to_json(), nullptr);
  const auto* exp = assay::jsonlite::get_object(got_json, "experiment");
  expect(exp && assay::jsonlite::get_object(*exp, "files") != nullptr, "full view has files");
  const auto* attach_view = assay::jsonlite::get_object(*exp, "attach");
  expect(attach_view &&
             assay::jsonlite::get_string(*attach_view, "claimEvidenceStatus") == "attached",
         "claimEvidenceStatus rendered");

  expect(assay::verify_ledger_chain(rt.config().ledger_path) == 1, "one ledger event");
  rt.close();
  assay::set_runtime_event_hook(nullptr);
  expect(g_completed_events.load() == 1, "completed event emitted once");
  expect(rt.stats().succeeded.load() == 1, "success counted");
  fs::remove_all(root);
}

void test_runtime_failure_contests_claim() {
  const fs::path root = fresh_dir("rt_fail");
  assay::ExperimentRuntime rt(config_under(root), options_for(root));
  expect(rt.open().ok, "open");
  expect(rt.claim_store()
             ->create_claim("clm_bad", "fail passes", "bob", assay::ClaimStatus::pending_proof, 1)
             .ok,
         "claim created");

  assay::ExperimentRequest req;
  req.profile_id = "fail";
  req.claim_id = "clm_bad";
  req.relation = assay::EvidenceRelation::supports;
  const auto created = rt.create(req);
  expect(created.ok, "accepted");
  const auto row = rt.wait_for_terminal(created.run_id, 20000);
  expect(row && row->status == assay::ExperimentStatus::attached, "failed run still attaches");
  expect(row->exit_code && *row->exit_code == 3, "exit code 3");
  expect(row->relation == assay::EvidenceRelation::contradicts, "failure contradicts");
  expect(rt.claim_store()->get_claim("clm_bad")->status == assay::ClaimStatus::contested,
         "pending claim contested");
  expect(read_file(assay::artifact_paths(created.artifact_dir).stderr_log) == "boom\n",
         "stderr persisted");
  rt.close();
  fs::remove_all(root);
}

void test_runtime_timeout() {
  const fs::path root = fresh_dir("rt_timeout");
  static std::atomic<int> kills{0};
  kills = 0;
  auto opts = options_for(root);
  opts.kill_process_tree = [](assay::ProcessId pid) {
    kills.fetch_add(1);
    assay::kill_process_tree(pid);
  };
  assay::ExperimentRuntime rt(config_under(root), opts);
  expect(rt.open().ok, "open");

  assay::ExperimentRequest req;
  req.profile_id = "sleepy";
  const auto created = rt.create(req);
  const auto row = rt.wait_for_terminal(created.run_id, 20000);
  expect(row && row->status == assay::ExperimentStatus::timed_out,
         "timed out status, got " + (row ? assay::to_string(row->status) : std::string("none")));
  expect(row->error_message.find("Timed out after 300ms") != std::string::npos,
         "timeout annotation: " + row->error_message);
  expect(kills.load() == 1, "kill capability invoked exactly once");
  rt.close();
  expect(rt.stats().timed_out.load() == 1, "timeout counted");
  fs::remove_all(root);
}

void test_runtime_short_timeout_resolves_quickly() {
  const fs::path root = fresh_dir("rt_blink");
  static std::atomic<int> kills{0};
  kills = 0;
  auto opts = options_for(root);
  opts.kill_process_tree = [](assay::ProcessId pid) {
    kills.fetch_add(1);
    assay::kill_process_tree(pid);
  };
  assay::ExperimentRuntime rt(config_under(root), opts);
  expect(rt.open().ok, "open");

  assay::ExperimentRequest req;
  req.profile_id = "blink";
  const auto started = std::chrono::steady_clock::now();
  const auto created = rt.create(req);
  const auto row = rt.wait_for_terminal(created.run_id, 20000);
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::steady_clock::now() - started)
                           .count();
  expect(row && row->status == assay::ExperimentStatus::timed_out, "50ms timeout fires");
  expect(row->error_message.find("Timed out after 50ms") != std::string::npos,
         "timeout annotation: " + row->error_message);
  expect(elapsed < 1000, "terminal well before the sleep ends, took " +
                             std::to_string(elapsed) + "ms");
  expect(kills.load() == 1, "one kill for the timeout");
  rt.close();
  fs::remove_all(root);
}

void test_runtime_fifo_serialisation() {
  const fs::path root = fresh_dir("rt_fifo");
  assay::ExperimentRuntime rt(config_under(root), options_for(root));
  expect(rt.open().ok, "open");

  assay::ExperimentRequest nap;
  nap.profile_id = "nap";
  const auto a = rt.create(nap);
  const auto b = rt.create(echo_request("second"));
  const auto c = rt.create(echo_request("third"));
  expect(a.ok && b.ok && c.ok, "all accepted");
  expect(b.outcome == assay::CreateOutcome::queued && c.outcome == assay::CreateOutcome::queued,
         "later jobs queued behind the first");

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (rt.get(a.run_id).record.status != assay::ExperimentStatus::running &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  expect(rt.get(a.run_id).record.status == assay::ExperimentStatus::running, "first running");
  expect(rt.get(b.run_id).record.status == assay::ExperimentStatus::queued,
         "second waits while the first runs");

  const auto ra = rt.wait_for_terminal(a.run_id, 20000);
  const auto rb = rt.wait_for_terminal(b.run_id, 20000);
  const auto rc = rt.wait_for_terminal(c.run_id, 20000);
  expect(ra && rb && rc, "all rows present");
  expect(ra->status == assay::ExperimentStatus::succeeded &&
             rb->status == assay::ExperimentStatus::succeeded &&
             rc->status == assay::ExperimentStatus::succeeded,
         "all succeeded");
  expect(ra->completed_at_ms && rb->started_at_ms && *rb->started_at_ms >= *ra->completed_at_ms,
         "second started only after the first completed");
  expect(rb->completed_at_ms && rc->started_at_ms && *rc->started_at_ms >= *rb->completed_at_ms,
         "third started only after the second completed");
  expect(*rb->started_at_ms <= *rc->started_at_ms, "submission order kept");
  rt.close();
  fs::remove_all(root);
}

void test_runtime_reused_run_id_keeps_artifacts() {
  const fs::path root = fresh_dir("rt_runid");
  assay::ExperimentRuntime rt(config_under(root), options_for(root));
  expect(rt.open().ok, "open");

  auto req = echo_request("pinned");
  req.run_id = "exp_fixed";
  const auto first = rt.create(req);
  expect(first.ok && first.run_id == "exp_fixed", "caller-chosen run id used");
  expect(rt.wait_for_terminal(first.run_id, 20000).has_value(), "first finished");
  const auto files = assay::artifact_paths(first.artifact_dir);
  expect(fs::exists(files.stdout_log) && fs::exists(files.meta), "bundle written");

  const auto again = rt.create(echo_request("other"));
  expect(again.ok, "unrelated run accepted");
  auto reuse = echo_request("other");
  reuse.run_id = "exp_fixed";
  const auto second = rt.create(reuse);
  expect(second.ok && second.outcome == assay::CreateOutcome::duplicate &&
             second.run_id == "exp_fixed",
         "reused run id reports the existing run");
  expect(fs::exists(files.stdout_log) && fs::exists(files.meta) && fs::exists(files.result),
         "existing bundle untouched");
  expect(read_file(files.stdout_log) == "hello-pinned\n", "existing output unchanged");

  auto escape = echo_request("x");
  escape.run_id = "../outside";
  const auto bad = rt.create(escape);
  expect(!bad.ok && bad.error == assay::ErrorCode::invalid_or_missing_param &&
             bad.param == "runId",
         "path-like run id rejected");
  expect(!fs::exists(root / "outside"), "nothing created outside the artifact root");
  rt.close();
  fs::remove_all(root);
}

void test_runtime_recovers_from_torn_ledger_tail() {
  const fs::path root = fresh_dir("rt_torn");
  assay::ExperimentRuntime rt(config_under(root), options_for(root));
  expect(rt.open().ok, "open");
  expect(rt.claim_store()
             ->create_claim("clm_t", "after crash", "erin", assay::ClaimStatus::pending_proof, 1)
             .ok,
         "claim");

  const auto first = rt.create(echo_request("one"));
  const auto r1 = rt.wait_for_terminal(first.run_id, 20000);
  expect(r1 && !r1->evidence_ref.empty(), "first run has an event");
  {
    std::ofstream ofs(rt.config().ledger_path, std::ios::binary | std::ios::app);
    ofs << "{\"seq\":2,\"eventId\":\"evt_x\",\"pay";
  }

  auto req = echo_request("two");
  req.claim_id = "clm_t";
  const auto second = rt.create(req);
  const auto r2 = rt.wait_for_terminal(second.run_id, 20000);
  expect(r2 && r2->evidence_ref == "evt_experiment_" + second.run_id,
         "next run still gets an event: " + (r2 ? r2->error_message : std::string()));
  expect(r2->status == assay::ExperimentStatus::attached, "claim link not left pending");
  expect(assay::verify_ledger_chain(rt.config().ledger_path) == 2, "chain verifies");
  rt.close();
  fs::remove_all(root);
}

void test_runtime_idempotent_resubmission() {
  const fs::path root = fresh_dir("rt_idem");
  assay::ExperimentRuntime rt(config_under(root), options_for(root));
  expect(rt.open().ok, "open");

  auto req = echo_request("once");
  req.idempotency_key = "build-123";
  const auto first = rt.create(req);
  expect(first.ok, "first accepted");
  expect(rt.wait_for_terminal(first.run_id, 20000).has_value(), "first finished");

  const auto second = rt.create(req);
  expect(second.ok && second.outcome == assay::CreateOutcome::duplicate, "duplicate outcome");
  expect(second.run_id == first.run_id, "same run id returned");
  expect(!second.queued && second.status == assay::ExperimentStatus::succeeded,
         "finished duplicate is not queued");
  expect(rt.list({}).experiments.size() == 1, "no second row");
  expect(assay::verify_ledger_chain(rt.config().ledger_path) == 1, "no second execution");
  rt.close();
  fs::remove_all(root);
}

void test_runtime_redaction_and_cap() {
  const fs::path root = fresh_dir("rt_redact");
  assay::ExperimentRuntime rt(config_under(root), options_for(root));
  expect(rt.open().ok, "open");

  assay::ExperimentRequest req;
  req.profile_id = "secret";
  assay::RedactionRule rule;
  rule.pattern = "sk-live-[0-9]+";
  rule.flags = "g";
  req.redaction_rules.push_back(rule);
  req.output_cap_bytes = 12;
  const auto created = rt.create(req);
  const auto row = rt.wait_for_terminal(created.run_id, 20000);
  expect(row && row->status == assay::ExperimentStatus::succeeded, "run succeeded");
  expect(row->redacted && row->truncated, "redacted and truncated flags");
  expect(row->stdout_bytes == 12, "stdout capped at exactly 12 bytes");
  const std::string out = read_file(assay::artifact_paths(created.artifact_dir).stdout_log);
  expect(out == "token=[REDAC", "redaction applied before the cap: " + out);
  rt.close();
  fs::remove_all(root);
}

void test_runtime_attach_repair() {
  const fs::path root = fresh_dir("rt_attach");
  assay::ExperimentRuntime rt(config_under(root), options_for(root));
  expect(rt.open().ok, "open");
  expect(rt.claim_store()
             ->create_claim("clm_r", "later proof", "carol", assay::ClaimStatus::pending_proof, 1)
             .ok,
         "claim");

  const auto created = rt.create(echo_request("repair"));
  const auto row = rt.wait_for_terminal(created.run_id, 20000);
  expect(row && row->status == assay::ExperimentStatus::succeeded, "unclaimed run succeeded");
  expect(!row->evidence_ref.empty(), "ledger event recorded without a claim");

  assay::AttachRequest missing;
  missing.run_id = created.run_id;
  expect(rt.attach_to_claim(missing).error ==
             assay::ErrorCode::run_id_claim_id_relation_required,
         "all fields required");

  assay::AttachRequest req;
  req.run_id = "exp_unknown";
  req.claim_id = "clm_r";
  req.relation = "supports";
  expect(rt.attach_to_claim(req).error == assay::ErrorCode::experiment_not_found,
         "unknown run");

  req.run_id = created.run_id;
  req.relation = "proves";
  expect(rt.attach_to_claim(req).error == assay::ErrorCode::invalid_relation, "bad relation");

  req.relation = "Supports";
  req.added_by = "carol";
  const auto attached = rt.attach_to_claim(req);
  expect(attached.ok && attached.status == "attached", "manual attach");
  expect(attached.claim_status_update && attached.claim_status_update->ok,
         "pending_proof transition applied");
  expect(rt.claim_store()->get_claim("clm_r")->status == assay::ClaimStatus::confirmed,
         "claim confirmed by manual attach");
  expect(rt.get(created.run_id).record.status == assay::ExperimentStatus::attached,
         "row marked attached");

  const auto again = rt.attach_to_claim(req);
  expect(again.ok && again.status == "duplicate", "second attach is a no-op");
  rt.close();
  fs::remove_all(root);
}

void test_runtime_ledger_disabled_leaves_attach_pending() {
  const fs::path root = fresh_dir("rt_noledger");
  auto cfg = config_under(root);
  cfg.ledger_enabled = false;
  assay::ExperimentRuntime rt(cfg, options_for(root));
  expect(rt.open().ok, "open");
  expect(rt.claim_store()
             ->create_claim("clm_n", "x", "dave", assay::ClaimStatus::pending_proof, 1)
             .ok,
         "claim");

  auto req = echo_request("pending");
  req.claim_id = "clm_n";
  const auto created = rt.create(req);
  const auto row = rt.wait_for_terminal(created.run_id, 20000);
  expect(row && row->status == assay::ExperimentStatus::attach_pending, "attach pending");
  expect(row->error_message.find("ledger_event_failed:ledger_disabled") != std::string::npos,
         "ledger failure annotated: " + row->error_message);
  expect(row->evidence_ref.empty(), "no evidence ref");

  assay::AttachRequest attach;
  attach.run_id = created.run_id;
  attach.claim_id = "clm_n";
  attach.relation = "supports";
  expect(rt.attach_to_claim(attach).error == assay::ErrorCode::evidence_event_missing,
         "repair refused without a ledger event");
  expect(rt.claim_store()->get_claim("clm_n")->status == assay::ClaimStatus::pending_proof,
         "claim untouched");
  rt.close();
  fs::remove_all(root);
}

void test_runtime_queue_full_and_close() {
  const fs::path root = fresh_dir("rt_queue");
  auto cfg = config_under(root);
  cfg.queue_capacity = 1;
  assay::ExperimentRuntime rt(cfg, options_for(root));
  expect(rt.open().ok, "open");

  assay::ExperimentRequest slow;
  slow.profile_id = "slow";
  const auto first = rt.create(slow);
  expect(first.ok, "first accepted");
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (rt.get(first.run_id).record.status != assay::ExperimentStatus::running &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  expect(rt.health().running, "first job became current");

  const auto second = rt.create(echo_request("behind"));
  expect(second.ok && second.outcome == assay::CreateOutcome::queued && second.queued,
         "second job queued behind the active run");
  expect(rt.health().queued == 1, "queue depth reported");

  const auto third = rt.create(echo_request("overflow"));
  expect(!third.ok && third.error == assay::ErrorCode::queue_full, "bounded queue rejects");
  expect(third.run_id.empty(), "no run id assigned for queue_full");

  const auto page = rt.list({});
  expect(page.experiments.size() == 2, "two rows persisted");

  rt.close();
  expect(rt.stats().abandoned.load() == 1, "active run abandoned on close");

  // Rows are not rewritten on close; the killed run stays `running`.
  assay::ExperimentRuntime reopened(cfg, options_for(root));
  expect(reopened.open().ok, "reopen");
  const auto first_row = reopened.get(first.run_id);
  expect(first_row.ok && first_row.record.status == assay::ExperimentStatus::running,
         "killed run left running");
  const auto second_row = reopened.get(second.run_id);
  expect(second_row.ok && second_row.record.status == assay::ExperimentStatus::queued,
         "dropped job left queued");
  expect(reopened.health().stale_running == 1, "stale running row reported");
  reopened.close();
  fs::remove_all(root);
}

void test_runtime_get_and_list_queries() {
  const fs::path root = fresh_dir("rt_list");
  assay::ExperimentRuntime rt(config_under(root), options_for(root));
  expect(rt.open().ok, "open");

  expect(rt.get("").error == assay::ErrorCode::run_id_required, "empty run id");
  expect(rt.get("exp_nope").error == assay::ErrorCode::experiment_not_found, "unknown run id");

  std::vector<std::string> ids;
  for (int i = 0; i < 3; ++i) {
    auto req = echo_request("n" + std::to_string(i));
    req.created_at_ms = 1000 + static_cast<std::uint64_t>(i);
    const auto c = rt.create(req);
    expect(c.ok, "created");
    expect(rt.wait_for_terminal(c.run_id, 20000).has_value(), "finished");
    ids.push_back(c.run_id);
  }

  assay::ListFilters f;
  f.limit = 2;
  f.profile = "ECHO";
  auto page = rt.list(f);
  expect(page.ok && page.experiments.size() == 2, "first page");
  expect(page.experiments[0].id == ids[2] && page.experiments[1].id == ids[1], "newest first");
  f.cursor = page.next_cursor;
  page = rt.list(f);
  expect(page.experiments.size() == 1 && page.experiments[0].id == ids[0], "last page");
  const auto json = assay::jsonlite::parse(page.to_json(), nullptr);
  expect(assay::jsonlite::is_null(json, "nextCursor"), "exhausted cursor rendered as null");

  assay::ListFilters by_status;
  by_status.status = "succeeded";
  expect(rt.list(by_status).experiments.size() == 3, "status filter");
  rt.close();
  fs::remove_all(root);
}

}  // namespace

int main() {
  std::cout << "=== assay Test Suite ===\n";

  std::cout << "\n[Hashing] BLAKE3 and version manifest\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("file hash matches payload hash", test_file_hash_matches_payload_hash);
  run_test("store schema compatibility", test_store_schema_compatibility);

  std::cout << "\n[JSON] jsonlite\n";
  run_test("sorted serialisation", test_json_sorted_serialisation);
  run_test("duplicate key rejected", test_json_duplicate_key_rejected);

  std::cout << "\n[Config]\n";
  run_test("defaults and validation", test_config_defaults_and_validation);
  run_test("environment overrides", test_config_from_env_overrides);

  std::cout << "\n[Profiles] registry, resolution, child env\n";
  run_test("first run writes defaults", test_profiles_first_run_writes_defaults);
  run_test("normalisation", test_profiles_normalisation);
  run_test("parameter injection rejected", test_resolve_rejects_injection);
  run_test("child env is allow-listed", test_experiment_env_is_allow_listed);

  std::cout << "\n[Artifacts] redaction, truncation, persistence\n";
  run_test("redaction rules", test_redaction_rules);
  run_test("redaction rules from JSON", test_redaction_rules_from_json);
  run_test("truncation is exact bytes", test_truncation_is_exact_bytes);
  run_test("atomic write", test_atomic_write_replaces_target);
  run_test("git fingerprint outside a repo", test_git_fingerprint_outside_repo);

  std::cout << "\n[Sandbox] pseudo-terminal executor\n";
  run_test("shell invocation shape", test_shell_invocation_shape);
  run_test("command runs to completion", test_pty_runs_command_to_completion);
  run_test("timeout kills exactly once", test_pty_timeout_kills_exactly_once);

  std::cout << "\n[Store] SQLite persistence\n";
  run_test("idempotency index", test_store_idempotency_index);
  run_test("finalize and status counts", test_store_finalize_and_status_counts);
  run_test("keyset pagination", test_store_keyset_pagination);
  run_test("cursor codec", test_cursor_codec);

  std::cout << "\n[Claims] reference collaborator\n";
  run_test("status transitions", test_claim_transitions);
  run_test("evidence dedupe", test_claim_evidence_dedupe);
  run_test("pending_proof transition on link", test_link_evidence_transitions_pending_proof);

  std::cout << "\n[Ledger] NDJSON evidence ledger\n";
  run_test("hash chain and dedupe", test_ledger_chain_and_dedupe);
  run_test("trace id precedence", test_event_trace_id_precedence);
  run_test("torn tail is cut", test_ledger_torn_tail_is_cut);
  run_test("mid-file corruption refused", test_ledger_mid_file_corruption_refused);
  run_test("replay tracks the file", test_ledger_replay_tracks_file);

  std::cout << "\n[Runtime] end to end\n";
  run_test("open and health", test_runtime_open_and_health);
  run_test("rejection has no side effects", test_runtime_rejects_without_side_effects);
  run_test("success attaches and confirms", test_runtime_success_attaches_and_confirms);
  run_test("failure contests claim", test_runtime_failure_contests_claim);
  run_test("timeout", test_runtime_timeout);
  run_test("short timeout resolves quickly", test_runtime_short_timeout_resolves_quickly);
  run_test("FIFO serialisation", test_runtime_fifo_serialisation);
  run_test("reused run id keeps artifacts", test_runtime_reused_run_id_keeps_artifacts);
  run_test("recovers from torn ledger tail", test_runtime_recovers_from_torn_ledger_tail);
  run_test("idempotent resubmission", test_runtime_idempotent_resubmission);
  run_test("redaction and output cap", test_runtime_redaction_and_cap);
  run_test("attach repair", test_runtime_attach_repair);
  run_test("ledger disabled leaves attach_pending",
           test_runtime_ledger_disabled_leaves_attach_pending);
  run_test("queue full and close", test_runtime_queue_full_and_close);
  run_test("get and list queries", test_runtime_get_and_list_queries);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
