#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "ethos/cli/commands.hpp"
#include "ethos/common/fs.hpp"
#include "ethos/common/json.hpp"

#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

namespace {

struct CliRun {
  int code = -1;
  std::string out;
  std::string err;
};

/// Runs one command against the workspace config, with observability
/// disabled unless a backend is given.
CliRun run_cli(const ethos::testing::TempWorkspace &ws, std::vector<std::string> args,
               const std::string &backend = "none") {
  ethos::testing::EnvGuard observability("ETHOS_OBSERVABILITY", backend);
  ethos::testing::ConfigOverrideGuard restore_override;
  args.insert(args.begin(), {"--config", (ws.path() / "ethos.toml").string()});
  std::ostringstream out;
  std::ostringstream err;
  CliRun run;
  run.code = ethos::cli::run_command(std::move(args), out, err);
  run.out = out.str();
  run.err = err.str();
  return run;
}

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

constexpr const char *TRANSCRIPT =
    "{\"type\":\"message\",\"role\":\"assistant\",\"ts\":\"2024-01-01T00:00:00Z\","
    "\"text\":\"Mail test@example.com\"}\n"
    "{\"type\":\"tool_call\",\"tool_name\":\"shell\",\"ts\":\"2024-01-01T00:00:01Z\","
    "\"payload\":{\"cmd\":\"ls\"}}\n";

/// init, then run, then sign. Returns the output directory.
std::filesystem::path signed_run(const ethos::testing::TempWorkspace &ws) {
  using ethos::tests::require;
  const auto init = run_cli(ws, {"init"});
  require(init.code == 0, init.err);
  const auto transcript = ws.create_file("transcript.jsonl", TRANSCRIPT);
  const auto out_dir = ws.path() / "out";
  const auto run = run_cli(ws, {"run", "--agent", "cli-agent", "--input", transcript.string(),
                                "--out", out_dir.string()});
  require(run.code == 0, run.err);
  const auto sign = run_cli(ws, {"sign", "--in", (out_dir / "sig.graph.json").string(), "--out",
                                 (out_dir / "sig.sig.json").string()});
  require(sign.code == 0, sign.err);
  return out_dir;
}

} // namespace

void register_cli_integration_tests(std::vector<ethos::tests::TestCase> &tests) {
  using ethos::tests::require;
  namespace common = ethos::common;

  tests.push_back({"cli_version_and_help", [] {
                     ethos::testing::TempWorkspace ws;
                     const auto version = run_cli(ws, {"version"});
                     require(version.code == 0, version.err);
                     require(version.out.rfind("ethos ", 0) == 0, version.out);

                     const auto help = run_cli(ws, {"--help"});
                     require(help.code == 0 && contains(help.out, "verify --sig"), help.out);

                     const auto unknown = run_cli(ws, {"frobnicate"});
                     require(unknown.code == 2, "unknown command is a usage error");
                     require(contains(unknown.err, "unknown command 'frobnicate'"), unknown.err);
                   }});

  tests.push_back({"cli_init_writes_config_and_keys", [] {
                     ethos::testing::TempWorkspace ws;
                     const auto first = run_cli(ws, {"init"});
                     require(first.code == 0, first.err);
                     require(std::filesystem::exists(ws.path() / "ethos.toml"), "config written");
                     require(std::filesystem::exists(ws.path() / "sig.key"), "private key written");
                     require(std::filesystem::exists(ws.path() / "sig.pub"), "public key written");
                     require(contains(first.out, "Generated Ed25519 keypair"), first.out);

                     const auto key_before = ws.read("sig.key");
                     const auto second = run_cli(ws, {"init"});
                     require(second.code == 0, second.err);
                     require(contains(second.out, "Keys already present"), second.out);
                     require(ws.read("sig.key") == key_before, "init must keep existing keys");

                     const auto forced = run_cli(ws, {"init", "--force"});
                     require(forced.code == 0, forced.err);
                     require(ws.read("sig.key") != key_before, "--force regenerates keys");
                   }});

  tests.push_back({"cli_run_sign_verify_roundtrip", [] {
                     ethos::testing::TempWorkspace ws;
                     const auto out_dir = signed_run(ws);
                     require(std::filesystem::exists(out_dir / "sig.summary.json"), "summary");

                     const auto verify = run_cli(ws, {"verify", "--sig",
                                                      (out_dir / "sig.sig.json").string(), "--in",
                                                      (out_dir / "sig.graph.json").string()});
                     require(verify.code == 0, verify.err);
                     require(verify.out == "signature verified\n", verify.out);

                     const auto explicit_pub = run_cli(
                         ws, {"verify", "--sig", (out_dir / "sig.sig.json").string(), "--in",
                              (out_dir / "sig.graph.json").string(), "--pub",
                              (ws.path() / "sig.pub").string()});
                     require(explicit_pub.code == 0, explicit_pub.err);
                   }});

  tests.push_back({"cli_log_backend_writes_to_error_stream", [] {
                     ethos::testing::TempWorkspace ws;
                     const auto out_dir = signed_run(ws);
                     const auto verify = run_cli(ws,
                                                 {"verify", "--sig",
                                                  (out_dir / "sig.sig.json").string(), "--in",
                                                  (out_dir / "sig.graph.json").string()},
                                                 "log");
                     require(verify.code == 0, verify.err);
                     require(contains(verify.err, "[INFO] graph.verify ok=true"), verify.err);
                     require(verify.out == "signature verified\n", verify.out);

                     const auto version = run_cli(ws, {"version"}, "log");
                     require(version.code == 0 && version.err.empty(), version.err);
                     const auto bad = run_cli(ws, {"check", "--file", "x"}, "syslog");
                     require(bad.code == 1, "unknown backend must fail the command");
                     require(contains(bad.err, "syslog"), bad.err);
                   }});

  tests.push_back({"cli_verify_rejects_tampered_graph", [] {
                     ethos::testing::TempWorkspace ws;
                     const auto out_dir = signed_run(ws);
                     auto graph = common::parse_json(ws.read("out/sig.graph.json"));
                     require(graph.ok(), graph.error());
                     graph.value().as_object()["agent"] = common::JsonValue("someone-else");
                     ws.create_file("out/sig.graph.json", common::dump_json_pretty(graph.value()));

                     const auto verify = run_cli(ws, {"verify", "--sig",
                                                      (out_dir / "sig.sig.json").string(), "--in",
                                                      (out_dir / "sig.graph.json").string()});
                     require(verify.code == 1, "tampered graph must exit 1");
                     require(verify.out == "graph hash mismatch\n", verify.out);
                   }});

  tests.push_back({"cli_verify_bad_input_exits_two", [] {
                     ethos::testing::TempWorkspace ws;
                     const auto out_dir = signed_run(ws);
                     const auto missing = run_cli(
                         ws, {"verify", "--sig", (ws.path() / "absent.json").string(), "--in",
                              (out_dir / "sig.graph.json").string()});
                     require(missing.code == 2, "missing signature file must exit 2");
                     require(contains(missing.err, "error: "), missing.err);

                     const auto no_sig =
                         run_cli(ws, {"verify", "--in", (out_dir / "sig.graph.json").string()});
                     require(no_sig.code == 2, "missing --sig is a usage error");
                     require(contains(no_sig.err, "missing required option --sig"), no_sig.err);
                   }});

  tests.push_back({"cli_sign_without_key_points_at_init", [] {
                     ethos::testing::TempWorkspace ws;
                     const auto graph = ws.create_file("graph.json", R"({"nodes":[],"edges":[]})");
                     const auto sign = run_cli(ws, {"sign", "--in", graph.string(), "--out",
                                                    (ws.path() / "graph.sig.json").string()});
                     require(sign.code == 1, "signing without a key must fail");
                     require(contains(sign.err, "Run `ethos init` first."), sign.err);
                   }});

  tests.push_back({"cli_run_refuses_to_overwrite_without_force", [] {
                     ethos::testing::TempWorkspace ws;
                     const auto out_dir = signed_run(ws);
                     const auto transcript = ws.path() / "transcript.jsonl";
                     const std::vector<std::string> args = {"run", "--agent", "cli-agent",
                                                            "--input", transcript.string(),
                                                            "--out", out_dir.string()};
                     const auto again = run_cli(ws, args);
                     require(again.code == 1, "existing outputs must not be overwritten");

                     auto forced_args = args;
                     forced_args.push_back("--force");
                     const auto forced = run_cli(ws, forced_args);
                     require(forced.code == 0, forced.err);
                   }});

  tests.push_back({"cli_run_checks_every_output_before_writing", [] {
                     ethos::testing::TempWorkspace ws;
                     const auto transcript = ws.create_file("transcript.jsonl", TRANSCRIPT);
                     ws.create_file("out/sig.summary.json", "{}\n");
                     const auto run = run_cli(ws, {"run", "--agent", "a", "--input",
                                                   transcript.string(), "--out",
                                                   (ws.path() / "out").string()});
                     require(run.code == 1, "existing summary must stop the run");
                     require(contains(run.err, "sig.summary.json"), run.err);
                     require(!std::filesystem::exists(ws.path() / "out" / "sig.graph.json"),
                             "no graph may be written");
                     require(ws.read("out/sig.summary.json") == "{}\n", "summary untouched");
                   }});

  tests.push_back({"cli_run_removes_graph_when_summary_write_fails", [] {
                     ethos::testing::TempWorkspace ws;
                     const auto transcript = ws.create_file("transcript.jsonl", TRANSCRIPT);
                     const auto out_dir = ws.path() / "out";
                     std::filesystem::create_directories(out_dir / "sig.summary.json");
                     const auto run = run_cli(ws, {"run", "--agent", "a", "--input",
                                                   transcript.string(), "--out", out_dir.string(),
                                                   "--force"});
                     require(run.code == 1, "unwritable summary must fail the run");
                     require(!std::filesystem::exists(out_dir / "sig.graph.json"),
                             "graph must be removed again");
                   }});

  tests.push_back({"cli_check_reports_violations", [] {
                     ethos::testing::TempWorkspace ws;
                     const auto transcript = ws.create_file("transcript.jsonl", TRANSCRIPT);
                     const auto check = run_cli(ws, {"check", "--file", transcript.string()});
                     require(check.code == 0, check.err);
                     auto summary = common::parse_json(check.out);
                     require(summary.ok(), summary.error());
                     const auto *violations = summary.value().find("violations");
                     require(violations != nullptr && violations->is_array(), check.out);
                     require(violations->as_array().size() == 1, check.out);
                     require(violations->as_array()[0].find("name")->as_string() ==
                                 "sensitive_data",
                             check.out);
                   }});

  tests.push_back({"cli_gate_applies_tool_policy", [] {
                     ethos::testing::TempWorkspace ws;
                     const auto payload = ws.create_file("payload.json", R"({"path":"/tmp/x"})");

                     const auto denied = run_cli(
                         ws, {"gate", "--tool", "delete_files", "--payload", payload.string()});
                     require(denied.code == 0, denied.err);
                     require(contains(denied.out, "tool policy denies delete_files"), denied.out);

                     const auto allowed =
                         run_cli(ws, {"gate", "--tool", "shell", "--payload", payload.string()});
                     require(allowed.code == 0, allowed.err);
                     auto summary = common::parse_json(allowed.out);
                     require(summary.ok(), summary.error());
                     const auto &decisions = summary.value().find("tool_decisions")->as_array();
                     require(decisions.size() == 1, allowed.out);
                     require(decisions[0].find("decision")->as_string() == "allow", allowed.out);

                     const auto missing = run_cli(ws, {"gate", "--tool", "shell"});
                     require(missing.code == 2, "missing --payload is a usage error");
                   }});
}
