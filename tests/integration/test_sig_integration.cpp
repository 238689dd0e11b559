#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "ethos/common/fs.hpp"
#include "ethos/common/json.hpp"
#include "ethos/sig/keys.hpp"
#include "ethos/sig/signer.hpp"
#include "ethos/sig/transcript.hpp"
#include "ethos/sig/verifier.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace {

struct SignedArtifacts {
  std::filesystem::path private_key;
  std::filesystem::path public_key;
  std::filesystem::path graph;
  std::filesystem::path signature;
};

SignedArtifacts sign_fixture(const ethos::testing::TempWorkspace &ws) {
  using ethos::tests::require;
  namespace sig = ethos::sig;
  namespace common = ethos::common;

  SignedArtifacts files{.private_key = ws.path() / "sig.key",
                        .public_key = ws.path() / "sig.pub",
                        .graph = ws.path() / "sig.graph.json",
                        .signature = ws.path() / "sig.sig.json"};

  auto keypair = sig::generate_keypair();
  require(keypair.ok(), keypair.error());
  auto persisted = sig::persist_keypair(keypair.value(), files.private_key, files.public_key);
  require(persisted.ok(), persisted.error());

  const auto transcript = ws.create_file(
      "transcript.jsonl",
      "{\"type\":\"message\",\"role\":\"user\",\"ts\":\"2024-01-01T00:00:00Z\"}\n"
      "\n"
      "{\"type\":\"tool_call\",\"tool_name\":\"web_search\",\"payload\":{\"q\":\"weather\"}}\n");
  auto events = sig::load_transcript(transcript);
  require(events.ok(), events.error());
  const auto graph = ethos::testing::build_test_graph(events.value(), "integration-agent");

  auto written = common::write_file_atomic(
      files.graph, common::dump_json_pretty(graph.to_json()) + "\n", {});
  require(written.ok(), written.error());

  auto private_key = sig::load_private_key(files.private_key);
  require(private_key.ok(), private_key.error());
  auto doc = sig::sign_graph(graph, private_key.value());
  require(doc.ok(), doc.error());
  auto stored = sig::write_signature_document(files.signature, doc.value());
  require(stored.ok(), stored.error());
  return files;
}

} // namespace

void register_sig_integration_tests(std::vector<ethos::tests::TestCase> &tests) {
  using ethos::tests::require;
  namespace sig = ethos::sig;
  namespace common = ethos::common;

  tests.push_back({"sig_integration_files_verify", [] {
                     ethos::testing::TempWorkspace ws;
                     const auto files = sign_fixture(ws);
                     auto result = sig::verify_files(files.signature, files.graph, files.public_key);
                     require(result.ok(), result.error());
                     require(result.value().ok, result.value().reason);
                     require(result.value().reason == "signature verified", result.value().reason);
                   }});

  tests.push_back({"sig_integration_private_key_mode", [] {
                     ethos::testing::TempWorkspace ws;
                     const auto files = sign_fixture(ws);
                     const auto perms = std::filesystem::status(files.private_key).permissions();
                     require((perms & (std::filesystem::perms::group_all |
                                       std::filesystem::perms::others_all)) ==
                                 std::filesystem::perms::none,
                             "private key must not be group or world accessible");
                   }});

  tests.push_back({"sig_integration_tampered_file_rejected", [] {
                     ethos::testing::TempWorkspace ws;
                     const auto files = sign_fixture(ws);
                     auto content = common::read_file(files.graph);
                     require(content.ok(), content.error());
                     auto graph = common::parse_json(content.value());
                     require(graph.ok(), graph.error());
                     graph.value().as_object().at("nodes").as_array().at(0).as_object()["content_hash"] =
                         common::JsonValue(std::string(64, 'f'));
                     auto written = common::write_file_atomic(
                         files.graph, common::dump_json(graph.value()), {.overwrite = true});
                     require(written.ok(), written.error());

                     auto result = sig::verify_files(files.signature, files.graph, files.public_key);
                     require(result.ok(), result.error());
                     require(!result.value().ok, "tampered graph verified");
                     require(result.value().reason == "graph hash mismatch", result.value().reason);
                   }});

  tests.push_back({"sig_integration_compact_rewrite_still_verifies", [] {
                     ethos::testing::TempWorkspace ws;
                     const auto files = sign_fixture(ws);
                     auto content = common::read_file(files.graph);
                     require(content.ok(), content.error());
                     auto graph = common::parse_json(content.value());
                     require(graph.ok(), graph.error());
                     auto written = common::write_file_atomic(
                         files.graph, common::dump_json(graph.value()), {.overwrite = true});
                     require(written.ok(), written.error());

                     auto result = sig::verify_files(files.signature, files.graph, files.public_key);
                     require(result.ok(), result.error());
                     require(result.value().ok, result.value().reason);
                   }});

  tests.push_back({"sig_integration_input_errors", [] {
                     ethos::testing::TempWorkspace ws;
                     const auto files = sign_fixture(ws);

                     auto missing = sig::verify_files(ws.path() / "absent.json", files.graph,
                                                      files.public_key);
                     require(!missing.ok(), "missing signature file must be an error");

                     const auto bad_json = ws.create_file("bad.json", "{\"nodes\":[");
                     auto malformed = sig::verify_files(files.signature, bad_json, files.public_key);
                     require(!malformed.ok() && malformed.kind() == common::ErrorKind::Input,
                             "malformed graph JSON must be an input error");

                     const auto bad_key = ws.create_file(
                         "bad.pub", "-----BEGIN PUBLIC KEY-----\nAAAA\n-----END PUBLIC KEY-----\n");
                     auto corrupt = sig::verify_files(files.signature, files.graph, bad_key);
                     require(!corrupt.ok() && corrupt.kind() == common::ErrorKind::Crypto,
                             "corrupt public key must be a crypto error");
                   }});

  tests.push_back({"sig_integration_persist_refuses_overwrite", [] {
                     ethos::testing::TempWorkspace ws;
                     const auto files = sign_fixture(ws);
                     const auto before = common::read_file(files.private_key);
                     require(before.ok(), before.error());

                     auto keypair = sig::generate_keypair();
                     require(keypair.ok(), keypair.error());
                     auto again =
                         sig::persist_keypair(keypair.value(), files.private_key, files.public_key);
                     require(!again.ok(), "existing keys must not be overwritten");
                     require(common::read_file(files.private_key).value() == before.value(),
                             "private key changed");
                   }});
}
