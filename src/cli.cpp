#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "assay/artifacts.hpp"
#include "assay/config.hpp"
#include "assay/evidence_ledger.hpp"
#include "assay/hash.hpp"
#include "assay/jsonlite.hpp"
#include "assay/profiles.hpp"
#include "assay/runtime.hpp"
#include "assay/version.hpp"

// assay — command-line front end for the experiment runtime.
//
// Every invocation prints exactly one JSON document to stdout on success.
// Failures print {"error":"<code>", ...} to stderr and exit non-zero:
//   1 usage error, 2 operation failed, 3 runtime could not be opened.
//
// The runtime lives inside this process, so `create` always lets the run
// reach a terminal state before exiting; --wait additionally prints the
// finished run instead of the submission receipt.

namespace {

constexpr std::uint64_t kDefaultWaitMs = 24ULL * 60 * 60 * 1000;

const std::set<std::string>& boolean_flags() {
  static const std::set<std::string> flags = {"--wait", "--no-ledger", "--guard-blocking",
                                              "--log-stderr"};
  return flags;
}

struct Args {
  std::vector<std::string> positional;
  std::map<std::string, std::vector<std::string>> values;
  std::set<std::string> switches;

  bool has(const std::string& flag) const { return switches.contains(flag); }
  std::string get(const std::string& flag, const std::string& def = "") const {
    auto it = values.find(flag);
    return it == values.end() || it->second.empty() ? def : it->second.back();
  }
  const std::vector<std::string>& all(const std::string& flag) const {
    static const std::vector<std::string> empty;
    auto it = values.find(flag);
    return it == values.end() ? empty : it->second;
  }
};

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string tok = argv[i];
    if (tok.rfind("--", 0) != 0) {
      a.positional.push_back(tok);
    } else if (boolean_flags().contains(tok)) {
      a.switches.insert(tok);
    } else if (i + 1 < argc) {
      a.values[tok].push_back(argv[++i]);
    } else {
      a.values[tok];
    }
  }
  return a;
}

std::string read_file(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

int fail(const std::string& code, const std::string& detail, int exit_code) {
  std::cerr << "{\"error\":\"" << assay::jsonlite::escape(code) << "\"";
  if (!detail.empty()) std::cerr << ",\"detail\":\"" << assay::jsonlite::escape(detail) << "\"";
  std::cerr << "}\n";
  return exit_code;
}

std::optional<std::uint64_t> parse_u64(const std::string& text) {
  if (text.empty()) return std::nullopt;
  for (char c : text) {
    if (c < '0' || c > '9') return std::nullopt;
  }
  try {
    return static_cast<std::uint64_t>(std::stoull(text));
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

assay::RuntimeConfig config_from_args(const Args& a) {
  assay::RuntimeConfig cfg =
      a.values.contains("--home") ? assay::RuntimeConfig::under(a.get("--home"))
                                  : assay::RuntimeConfig::from_env();
  if (!a.get("--db").empty()) cfg.db_path = a.get("--db");
  if (!a.get("--artifact-root").empty()) cfg.artifact_root = a.get("--artifact-root");
  if (!a.get("--profiles").empty()) cfg.profiles_path = a.get("--profiles");
  if (!a.get("--ledger").empty()) cfg.ledger_path = a.get("--ledger");
  if (!a.get("--event-log").empty()) cfg.event_log_path = a.get("--event-log");
  if (a.has("--no-ledger")) cfg.ledger_enabled = false;
  if (a.has("--log-stderr")) cfg.log_stderr = true;
  return cfg;
}

// Request document accepted by `create --request <file>`; flags given on the
// command line override its fields.
assay::ExperimentRequest request_from_json(const assay::jsonlite::Object& o) {
  namespace jl = assay::jsonlite;
  assay::ExperimentRequest r;
  r.profile_id = jl::get_string(o, "profileId");
  r.args = jl::get_string_map(o, "args");
  r.repo_path = jl::get_string(o, "repoPath");
  if (jl::has_key(o, "timeoutMs") && !jl::is_null(o, "timeoutMs")) {
    r.timeout_ms = jl::get_u64(o, "timeoutMs");
  }
  r.requested_by = jl::get_string(o, "requestedBy", "system");
  r.claim_id = jl::get_string(o, "claimId");
  r.relation = assay::parse_evidence_relation(jl::get_string(o, "relation"));
  r.session = jl::get_string(o, "session");
  r.idempotency_key = jl::get_string(o, "idempotencyKey");
  if (const auto* g = jl::get_object(o, "guardContext")) {
    assay::GuardContext guard;
    guard.guard_id = jl::get_string(*g, "guardId");
    guard.action = jl::get_string(*g, "action");
    guard.blocking = jl::get_bool(*g, "blocking");
    if (!guard.empty()) r.guard = guard;
  }
  if (jl::has_key(o, "outputCapBytes") && !jl::is_null(o, "outputCapBytes")) {
    r.output_cap_bytes = jl::get_u64(o, "outputCapBytes");
  }
  if (const auto* rules = jl::get_array(o, "redactionRules")) {
    r.redaction_rules = assay::redaction_rules_from_json(*rules);
  }
  r.run_id = jl::get_string(o, "runId");
  r.env_allowlist = jl::get_string_array(o, "envAllowlist");
  r.trace_id = jl::get_string(o, "traceId");
  r.parent_event_id = jl::get_string(o, "parentEventId");
  return r;
}

int cmd_create(assay::ExperimentRuntime& rt, const Args& a) {
  assay::ExperimentRequest req;
  if (!a.get("--request").empty()) {
    std::optional<assay::jsonlite::JsonError> err;
    const auto doc = assay::jsonlite::parse(read_file(a.get("--request")), &err);
    if (err) return fail(err->code, err->message, 1);
    req = request_from_json(doc);
  }
  if (!a.get("--profile").empty()) req.profile_id = a.get("--profile");
  for (const auto& kv : a.all("--arg")) {
    const auto eq = kv.find('=');
    if (eq == std::string::npos) return fail("invalid_arg", kv, 1);
    req.args[kv.substr(0, eq)] = kv.substr(eq + 1);
  }
  if (!a.get("--repo").empty()) req.repo_path = a.get("--repo");
  if (!a.get("--timeout-ms").empty()) {
    const auto t = parse_u64(a.get("--timeout-ms"));
    if (!t) return fail("invalid_timeout", a.get("--timeout-ms"), 1);
    req.timeout_ms = *t;
  }
  if (!a.get("--output-cap").empty()) {
    const auto cap = parse_u64(a.get("--output-cap"));
    if (!cap) return fail("invalid_output_cap", a.get("--output-cap"), 1);
    req.output_cap_bytes = *cap;
  }
  if (!a.get("--requested-by").empty()) req.requested_by = a.get("--requested-by");
  if (!a.get("--claim").empty()) req.claim_id = a.get("--claim");
  if (!a.get("--relation").empty()) {
    req.relation = assay::parse_evidence_relation(a.get("--relation"));
    if (!req.relation) return fail("invalid_relation", a.get("--relation"), 1);
  }
  if (!a.get("--session").empty()) req.session = a.get("--session");
  if (!a.get("--idempotency-key").empty()) req.idempotency_key = a.get("--idempotency-key");
  if (!a.get("--run-id").empty()) req.run_id = a.get("--run-id");
  if (!a.get("--trace-id").empty()) req.trace_id = a.get("--trace-id");
  if (!a.get("--parent-event-id").empty()) req.parent_event_id = a.get("--parent-event-id");
  if (!a.get("--guard-id").empty() || !a.get("--guard-action").empty() ||
      a.has("--guard-blocking")) {
    assay::GuardContext guard;
    guard.guard_id = a.get("--guard-id");
    guard.action = a.get("--guard-action");
    guard.blocking = a.has("--guard-blocking");
    req.guard = guard;
  }
  for (const auto& lit : a.all("--redact")) {
    assay::RedactionRule rule;
    rule.pattern = lit;
    rule.literal = true;
    req.redaction_rules.push_back(rule);
  }
  for (const auto& pattern : a.all("--redact-pattern")) {
    assay::RedactionRule rule;
    rule.pattern = pattern;
    rule.flags = a.get("--redact-flags");
    req.redaction_rules.push_back(rule);
  }
  for (const auto& key : a.all("--env")) req.env_allowlist.push_back(key);

  const assay::CreateResult created = rt.create(req);
  if (!created.ok) {
    std::cerr << created.to_json() << "\n";
    return 2;
  }

  std::uint64_t wait_ms = kDefaultWaitMs;
  if (!a.get("--wait-ms").empty()) wait_ms = parse_u64(a.get("--wait-ms")).value_or(kDefaultWaitMs);
  const auto final_row = rt.wait_for_terminal(created.run_id, wait_ms);
  if (!a.has("--wait")) {
    std::cout << created.to_json() << "\n";
    return 0;
  }
  if (!final_row) return fail("experiment_not_found", created.run_id, 2);
  std::cout << rt.get(created.run_id).to_json() << "\n";
  return 0;
}

int cmd_list(assay::ExperimentRuntime& rt, const Args& a) {
  assay::ListFilters f;
  f.status = a.get("--status");
  f.profile = a.get("--profile");
  f.claim = a.get("--claim");
  f.guard_id = a.get("--guard");
  f.since_ms = parse_u64(a.get("--since"));
  f.until_ms = parse_u64(a.get("--until"));
  f.cursor = a.get("--cursor");
  if (!a.get("--limit").empty()) {
    try {
      f.limit = std::stoll(a.get("--limit"));
    } catch (const std::exception&) {
      return fail("invalid_limit", a.get("--limit"), 1);
    }
  }
  const assay::ListResult res = rt.list(f);
  if (!res.ok) {
    std::cerr << res.to_json() << "\n";
    return 2;
  }
  std::cout << res.to_json() << "\n";
  return 0;
}

int cmd_claim(assay::ExperimentRuntime& rt, const Args& a) {
  namespace jl = assay::jsonlite;
  const std::string sub = a.positional.size() > 1 ? a.positional[1] : "";
  assay::SqliteClaimStore* claims = rt.claim_store();
  if (!claims) return fail("unavailable", "claims store", 2);

  if (sub == "create") {
    const std::string statement = a.get("--statement");
    if (statement.empty()) return fail("statement_required", "", 1);
    auto status = assay::ClaimStatus::proposed;
    if (!a.get("--status").empty()) {
      const auto parsed = assay::parse_claim_status(a.get("--status"));
      if (!parsed) return fail("invalid_status", a.get("--status"), 1);
      status = *parsed;
    }
    const auto created = claims->create_claim(a.get("--id"), statement,
                                              a.get("--owner", "system"), status,
                                              assay::unix_now_ms());
    if (!created.ok) return fail(created.reason.empty() ? "db_error" : created.reason, "", 2);
    std::cout << assay::claim_to_json(created.claim) << "\n";
    return 0;
  }
  if (sub == "get") {
    const std::string id = a.positional.size() > 2 ? a.positional[2] : a.get("--id");
    if (id.empty()) return fail("claim_id_required", "", 1);
    const auto claim = claims->get_claim(id);
    if (!claim) return fail("claim_not_found", id, 2);
    jl::Object o = jl::parse(assay::claim_to_json(*claim), nullptr);
    o["evidenceCount"] = jl::Value{claims->evidence_count(id)};
    std::cout << jl::to_json(o) << "\n";
    return 0;
  }
  return fail("unknown_subcommand", "claim " + sub, 1);
}

void print_usage() {
  std::cerr << "usage: assay <command> [options]\n"
               "  health | version | profiles\n"
               "  create --profile <id> [--arg k=v]... [--repo dir] [--timeout-ms n]\n"
               "         [--claim id --relation r] [--idempotency-key k] [--wait]\n"
               "  get <runId>\n"
               "  list [--status s] [--profile p] [--claim c] [--guard g]\n"
               "       [--since ms] [--until ms] [--cursor c] [--limit n]\n"
               "  attach --run-id <id> --claim-id <id> --relation <r> [--added-by who]\n"
               "  claim create --statement <text> [--id id] [--status s]\n"
               "  claim get <id>\n"
               "  ledger verify\n"
               "global: --home dir --db path --artifact-root dir --profiles path\n"
               "        --ledger path --no-ledger --event-log path --log-stderr\n";
}

}  // namespace

int main(int argc, char** argv) {
  const Args args = parse_args(argc, argv);
  if (args.positional.empty()) {
    print_usage();
    return 1;
  }
  const std::string cmd = args.positional[0];

  if (cmd == "version") {
    std::cout << assay::version::manifest_to_json(assay::version::current_manifest()) << "\n";
    return 0;
  }

  const assay::RuntimeConfig cfg = config_from_args(args);

  if (cmd == "ledger") {
    if (args.positional.size() < 2 || args.positional[1] != "verify") {
      return fail("unknown_subcommand", "ledger", 1);
    }
    const long long events = assay::verify_ledger_chain(cfg.ledger_path);
    if (events < 0) return fail("ledger_corrupt", cfg.ledger_path, 2);
    std::cout << "{\"ok\":true,\"path\":\"" << assay::jsonlite::escape(cfg.ledger_path)
              << "\",\"events\":" << events << "}\n";
    return 0;
  }

  assay::ExperimentRuntime rt(cfg);
  const assay::InitResult opened = rt.open();
  if (cmd == "health") {
    // Health is still reported when the runtime failed to open.
    assay::jsonlite::Object o = assay::jsonlite::parse(rt.health().to_json(), nullptr);
    const auto h = assay::hash_runtime_info();
    o["hashPrimitive"] = assay::jsonlite::Value{h.primitive};
    if (!opened.ok) o["error"] = assay::jsonlite::Value{opened.reason};
    std::cout << assay::jsonlite::to_json(o) << "\n";
    return opened.ok ? 0 : 3;
  }
  if (!opened.ok) {
    const std::string code = opened.error == assay::ErrorCode::none
                                 ? std::string("unavailable")
                                 : assay::to_string(opened.error);
    return fail(code, opened.reason, 3);
  }

  if (cmd == "profiles") {
    assay::jsonlite::Object o;
    o["ok"] = assay::jsonlite::Value{true};
    o["path"] = assay::jsonlite::Value{cfg.profiles_path};
    o["profileIds"] = assay::jsonlite::string_array(rt.profile_ids());
    o["profiles"] = assay::jsonlite::parse_value(assay::profiles_to_json(rt.profiles()), nullptr);
    std::cout << assay::jsonlite::to_json(o) << "\n";
    return 0;
  }

  if (cmd == "create") return cmd_create(rt, args);

  if (cmd == "get") {
    const std::string run_id =
        args.positional.size() > 1 ? args.positional[1] : args.get("--run-id");
    const assay::GetResult res = rt.get(run_id);
    if (!res.ok) {
      std::cerr << res.to_json() << "\n";
      return 2;
    }
    std::cout << res.to_json() << "\n";
    return 0;
  }

  if (cmd == "list") return cmd_list(rt, args);

  if (cmd == "attach") {
    assay::AttachRequest req;
    req.run_id = args.get("--run-id");
    req.claim_id = args.get("--claim-id");
    req.relation = args.get("--relation");
    req.added_by = args.get("--added-by", "system");
    const assay::AttachResult res = rt.attach_to_claim(req);
    if (!res.ok) {
      std::cerr << res.to_json() << "\n";
      return 2;
    }
    std::cout << res.to_json() << "\n";
    return 0;
  }

  if (cmd == "claim") return cmd_claim(rt, args);

  print_usage();
  return fail("unknown_command", cmd, 1);
}
