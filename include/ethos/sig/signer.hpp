#pragma once

#include "ethos/common/fs.hpp"
#include "ethos/common/json.hpp"
#include "ethos/common/result.hpp"
#include "ethos/sig/graph.hpp"
#include "ethos/sig/keys.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace ethos::sig {

constexpr const char *SIGNATURE_ALGORITHM = "ed25519";
constexpr std::size_t ED25519_SIGNATURE_SIZE = 64;

struct SignatureDocument {
  std::string algorithm = SIGNATURE_ALGORITHM;
  /// SHA-256 of the canonical graph bytes, lowercase hex.
  std::string graph_sha256;
  /// Standard base64 of the raw signature, as stored under `signature_b64`.
  std::string signature_b64;
};

/// Validates the graph shape, then signs its canonical bytes (not the hash).
[[nodiscard]] common::Result<SignatureDocument> sign_graph(const common::JsonValue &graph,
                                                           const PrivateKey &key);
[[nodiscard]] common::Result<SignatureDocument> sign_graph(const Graph &graph,
                                                           const PrivateKey &key);

[[nodiscard]] common::JsonValue signature_document_to_json(const SignatureDocument &doc);
/// Missing or mistyped fields are input errors; an algorithm other than
/// ed25519 is a crypto error.
[[nodiscard]] common::Result<SignatureDocument>
signature_document_from_json(const common::JsonValue &value);

[[nodiscard]] common::Status write_signature_document(const std::filesystem::path &path,
                                                      const SignatureDocument &doc,
                                                      const common::WriteOptions &options = {});
[[nodiscard]] common::Result<SignatureDocument>
load_signature_document(const std::filesystem::path &path);

} // namespace ethos::sig
