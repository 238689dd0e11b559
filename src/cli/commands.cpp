#include "ethos/cli/commands.hpp"

#include "ethos/checks/checks.hpp"
#include "ethos/checks/decision.hpp"
#include "ethos/common/fs.hpp"
#include "ethos/common/json.hpp"
#include "ethos/config/config.hpp"
#include "ethos/observability/factory.hpp"
#include "ethos/observability/global.hpp"
#include "ethos/sig/graph_builder.hpp"
#include "ethos/sig/keys.hpp"
#include "ethos/sig/signer.hpp"
#include "ethos/sig/transcript.hpp"
#include "ethos/sig/verifier.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace ethos::cli {

namespace {

struct CommandContext {
  config::Config config;
  std::filesystem::path config_file;
  /// Relative key paths in the config resolve against this directory.
  std::filesystem::path base_dir;

  [[nodiscard]] std::filesystem::path resolve(const std::string &value) const {
    const std::filesystem::path path(common::expand_path(value));
    if (path.is_absolute() || base_dir.empty()) {
      return path;
    }
    return base_dir / path;
  }
};

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
    if (common::starts_with(args[i], long_name + "=")) {
      out_value = args[i].substr(long_name.size() + 1);
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(std::filesystem::path(args[i + 1]));
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(std::filesystem::path(value));
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

/// Fails with a usage message naming the option when it is absent.
bool require_option(std::vector<std::string> &args, const std::string &name, std::string &value,
                    std::ostream &err) {
  if (take_option(args, name, "", value) && !value.empty()) {
    return true;
  }
  err << "error: missing required option " << name << "\n";
  return false;
}

bool reject_leftovers(const std::vector<std::string> &args, std::ostream &err) {
  if (args.empty()) {
    return true;
  }
  err << "error: unexpected argument '" << args.front() << "'\n";
  return false;
}

int report_error(const std::string &component, const std::string &message, std::ostream &err) {
  observability::record_error(component, message);
  err << "error: " << message << "\n";
  return EXIT_FAILURE_RESULT;
}

std::optional<CommandContext> load_context(std::ostream &err) {
  const auto path = config::config_path();
  auto loaded = config::load_config(path);
  if (!loaded.ok()) {
    err << "error: " << loaded.error() << "\n";
    return std::nullopt;
  }
  const auto validated = config::validate_config(loaded.value());
  if (!validated.ok()) {
    err << "error: " << path.string() << ": " << validated.error() << "\n";
    return std::nullopt;
  }
  for (const auto &warning : validated.value()) {
    err << "warning: " << warning << "\n";
  }

  auto observer = observability::create_observer(loaded.value(), err);
  if (!observer.ok()) {
    err << "error: " << path.string() << ": " << observer.error() << "\n";
    return std::nullopt;
  }
  observability::set_global_observer(std::move(observer.value()));

  CommandContext context;
  context.config = std::move(loaded.value());
  context.config_file = path;
  context.base_dir = path.parent_path();
  return context;
}

checks::ScorerSet scorers_for(const config::Config &config) {
  return checks::default_scorers({.require_uncertainty = config.require_uncertainty});
}

void print_json(const common::JsonValue &value, std::ostream &out) {
  out << common::dump_json_pretty(value) << "\n";
}

int run_init(std::vector<std::string> args, const CommandContext &context, std::ostream &out,
             std::ostream &err) {
  const bool force = take_flag(args, "--force");
  if (!reject_leftovers(args, err)) {
    return EXIT_USAGE;
  }

  std::error_code ec;
  if (!std::filesystem::exists(context.config_file, ec)) {
    if (auto written = config::write_default_config(context.config_file); !written.ok()) {
      return report_error("init", written.error(), err);
    }
    out << "Wrote " << context.config_file.string() << "\n";
  }

  const auto private_path = context.resolve(context.config.keys.private_key);
  const auto public_path = context.resolve(context.config.keys.public_key);
  const bool have_keys = std::filesystem::exists(private_path, ec) &&
                         std::filesystem::exists(public_path, ec);
  if (have_keys && !force) {
    out << "Keys already present: " << private_path.string() << ", " << public_path.string()
        << "\n";
    return EXIT_OK;
  }

  auto keypair = sig::generate_keypair();
  if (!keypair.ok()) {
    return report_error("init", keypair.error(), err);
  }
  // An incomplete pair is replaced as a whole.
  if (auto persisted =
          sig::persist_keypair(keypair.value(), private_path, public_path, {.overwrite = true});
      !persisted.ok()) {
    return report_error("init", persisted.error(), err);
  }
  const auto fingerprint = sig::public_key_fingerprint(keypair.value().public_key);
  if (!fingerprint.ok()) {
    return report_error("init", fingerprint.error(), err);
  }
  out << "Generated Ed25519 keypair " << fingerprint.value() << ": " << private_path.string()
      << ", " << public_path.string() << "\n";
  return EXIT_OK;
}

int run_check(std::vector<std::string> args, const CommandContext &context, std::ostream &out,
              std::ostream &err) {
  std::string file;
  if (!require_option(args, "--file", file, err) || !reject_leftovers(args, err)) {
    return EXIT_USAGE;
  }

  const auto events = sig::load_transcript(file);
  if (!events.ok()) {
    return report_error("check", events.error(), err);
  }
  const auto results =
      scorers_for(context.config).run(sig::GraphBuilder::transcript_text(events.value()));
  auto options = checks::decision_options_from_config(context.config);
  print_json(checks::summary_to_json(checks::build_summary(results, options)), out);
  return EXIT_OK;
}

int run_gate(std::vector<std::string> args, const CommandContext &context, std::ostream &out,
             std::ostream &err) {
  std::string tool;
  std::string payload_path;
  if (!require_option(args, "--tool", tool, err) ||
      !require_option(args, "--payload", payload_path, err) || !reject_leftovers(args, err)) {
    return EXIT_USAGE;
  }

  const auto content = common::read_file(payload_path);
  if (!content.ok()) {
    return report_error("gate", content.error(), err);
  }
  const auto payload = common::parse_json(content.value());
  if (!payload.ok()) {
    return report_error("gate", payload_path + ": " + payload.error(), err);
  }

  auto options = checks::decision_options_from_config(context.config);
  options.tool_name = tool;
  const auto summary =
      checks::build_summary(scorers_for(context.config).run(common::dump_json(payload.value())),
                            options);
  for (const auto &decision : summary.tool_decisions) {
    observability::record_tool_decision(decision.tool_name, decision.decision,
                                        summary.overall_risk_score);
  }
  print_json(checks::summary_to_json(summary), out);
  return EXIT_OK;
}

int run_run(std::vector<std::string> args, const CommandContext &context, std::ostream &out,
            std::ostream &err) {
  std::string agent;
  std::string input;
  std::string out_dir;
  const bool strict_ts = take_flag(args, "--strict-ts");
  const bool force = take_flag(args, "--force");
  if (!require_option(args, "--agent", agent, err) ||
      !require_option(args, "--input", input, err) ||
      !require_option(args, "--out", out_dir, err) || !reject_leftovers(args, err)) {
    return EXIT_USAGE;
  }

  const auto events = sig::load_transcript(input);
  if (!events.ok()) {
    return report_error("run", events.error(), err);
  }

  sig::GraphBuilderOptions options;
  options.agent = agent;
  options.reject_missing_timestamps = strict_ts;
  options.scorers = scorers_for(context.config);
  options.decision = checks::decision_options_from_config(context.config);
  const sig::GraphBuilder builder(std::move(options));
  const auto built = builder.build(events.value());
  if (!built.ok()) {
    return report_error("run", built.error(), err);
  }

  std::error_code ec;
  std::filesystem::create_directories(out_dir, ec);
  if (ec) {
    return report_error("run", "failed to create " + out_dir + ": " + ec.message(), err);
  }

  const std::filesystem::path graph_path = std::filesystem::path(out_dir) / "sig.graph.json";
  const std::filesystem::path summary_path = std::filesystem::path(out_dir) / "sig.summary.json";
  const common::WriteOptions write_options{.overwrite = force};
  if (!force) {
    for (const auto &path : {graph_path, summary_path}) {
      if (std::filesystem::exists(path, ec)) {
        return report_error("run", "refusing to overwrite existing file: " + path.string(), err);
      }
    }
  }
  if (auto written = common::write_file_atomic(
          graph_path, common::dump_json_pretty(built.value().graph.to_json()) + "\n",
          write_options);
      !written.ok()) {
    return report_error("run", written.error(), err);
  }
  if (auto written = common::write_file_atomic(
          summary_path, common::dump_json_pretty(checks::summary_to_json(built.value().summary)) +
                            "\n",
          write_options);
      !written.ok()) {
    // The graph written above must not outlive a failed run.
    std::filesystem::remove(graph_path, ec);
    return report_error("run", written.error(), err);
  }

  out << "Wrote " << graph_path.string() << " and " << summary_path.string() << "\n";
  return EXIT_OK;
}

int run_sign(std::vector<std::string> args, const CommandContext &context, std::ostream &out,
             std::ostream &err) {
  std::string in_path;
  std::string out_path;
  std::string key_value;
  const bool force = take_flag(args, "--force");
  const bool has_key = take_option(args, "--key", "", key_value);
  if (!require_option(args, "--in", in_path, err) ||
      !require_option(args, "--out", out_path, err) || !reject_leftovers(args, err)) {
    return EXIT_USAGE;
  }

  const std::filesystem::path key_path =
      has_key ? std::filesystem::path(key_value) : context.resolve(context.config.keys.private_key);
  std::error_code ec;
  if (!std::filesystem::exists(key_path, ec)) {
    return report_error("sign",
                        "private key not found: " + key_path.string() +
                            ". Run `ethos init` first.",
                        err);
  }

  const auto key = sig::load_private_key(key_path);
  if (!key.ok()) {
    return report_error("sign", key.error(), err);
  }
  const auto content = common::read_file(in_path);
  if (!content.ok()) {
    return report_error("sign", content.error(), err);
  }
  const auto graph = common::parse_json(content.value());
  if (!graph.ok()) {
    return report_error("sign", in_path + ": " + graph.error(), err);
  }

  const auto doc = sig::sign_graph(graph.value(), key.value());
  if (!doc.ok()) {
    return report_error("sign", doc.error(), err);
  }
  if (auto written = sig::write_signature_document(out_path, doc.value(), {.overwrite = force});
      !written.ok()) {
    return report_error("sign", written.error(), err);
  }
  out << "Wrote signature to " << out_path << " (graph_sha256 " << doc.value().graph_sha256
      << ")\n";
  return EXIT_OK;
}

int run_verify(std::vector<std::string> args, const CommandContext &context, std::ostream &out,
               std::ostream &err) {
  std::string sig_path;
  std::string in_path;
  std::string pub_value;
  const bool has_pub = take_option(args, "--pub", "", pub_value);
  if (!require_option(args, "--sig", sig_path, err) ||
      !require_option(args, "--in", in_path, err) || !reject_leftovers(args, err)) {
    return EXIT_USAGE;
  }
  const std::filesystem::path pub_path =
      has_pub ? std::filesystem::path(pub_value) : context.resolve(context.config.keys.public_key);

  const auto result = sig::verify_files(sig_path, in_path, pub_path);
  if (!result.ok()) {
    observability::record_error("verify", result.error());
    err << "error: " << result.error() << "\n";
    return EXIT_USAGE;
  }
  out << result.value().reason << "\n";
  return result.value().ok ? EXIT_OK : EXIT_FAILURE_RESULT;
}

} // namespace

std::string version_string() {
#ifdef ETHOS_VERSION
  return std::string("ethos ") + ETHOS_VERSION;
#else
  return "ethos 0.1.0";
#endif
}

void print_help(std::ostream &out) {
  out << version_string() << "\n\n";
  out << "Usage: ethos [--config PATH] <command> [options]\n\n";
  out << "Commands:\n";
  out << "  init [--force]                         Write ethos.toml and an Ed25519 keypair\n";
  out << "  check --file TRANSCRIPT                Score a JSONL transcript\n";
  out << "  gate --tool NAME --payload FILE        Allow or deny one tool payload\n";
  out << "  run --agent ID --input TRANSCRIPT --out DIR [--strict-ts] [--force]\n";
  out << "                                         Build sig.graph.json and sig.summary.json\n";
  out << "  sign --in GRAPH --out SIG [--key PATH] [--force]\n";
  out << "                                         Sign the canonical form of a graph\n";
  out << "  verify --sig SIG --in GRAPH [--pub PATH]\n";
  out << "                                         Exit 0 verified, 1 rejected, 2 bad input\n";
  out << "  version                                Show version\n";
}

int run_command(std::vector<std::string> args, std::ostream &out, std::ostream &err) {
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    err << "error: " << global_error << "\n";
    return EXIT_USAGE;
  }

  if (args.empty()) {
    print_help(out);
    return EXIT_OK;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help(out);
    return EXIT_OK;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    out << version_string() << "\n";
    return EXIT_OK;
  }

  auto context = load_context(err);
  if (!context.has_value()) {
    return EXIT_FAILURE_RESULT;
  }

  int code = EXIT_USAGE;
  if (subcommand == "init") {
    code = run_init(std::move(args), *context, out, err);
  } else if (subcommand == "check") {
    code = run_check(std::move(args), *context, out, err);
  } else if (subcommand == "gate") {
    code = run_gate(std::move(args), *context, out, err);
  } else if (subcommand == "run") {
    code = run_run(std::move(args), *context, out, err);
  } else if (subcommand == "sign") {
    code = run_sign(std::move(args), *context, out, err);
  } else if (subcommand == "verify") {
    code = run_verify(std::move(args), *context, out, err);
  } else {
    err << "error: unknown command '" << subcommand << "'\n";
    print_help(err);
  }

  // The observer logs to `err`, which does not outlive this call. Replacing it flushes it.
  observability::set_global_observer(nullptr);
  return code;
}

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help(std::cout);
    return EXIT_OK;
  }
  return run_command(collect_args(argc - 1, argv + 1), std::cout, std::cerr);
}

} // namespace ethos::cli
