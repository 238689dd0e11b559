#pragma once

#include "ethos/common/json.hpp"
#include "ethos/common/result.hpp"
#include "ethos/sig/keys.hpp"
#include "ethos/sig/signer.hpp"

#include <filesystem>
#include <string>

namespace ethos::sig {

constexpr const char *REASON_VERIFIED = "signature verified";
constexpr const char *REASON_HASH_MISMATCH = "graph hash mismatch";
constexpr const char *REASON_SIGNATURE_FAILED = "signature verification failed";

struct VerificationResult {
  bool ok = false;
  std::string reason;
};

/// Hash comparison first; the signature is only checked when the hashes
/// agree. Every signature-side failure collapses into one reason.
[[nodiscard]] VerificationResult verify_graph(const SignatureDocument &doc,
                                              const common::JsonValue &graph,
                                              const PublicKey &key);

/// Loads the signature document, graph and public key, then verifies.
/// Unreadable or malformed inputs are errors, not verification results.
[[nodiscard]] common::Result<VerificationResult>
verify_files(const std::filesystem::path &signature_path, const std::filesystem::path &graph_path,
             const std::filesystem::path &public_key_path);

} // namespace ethos::sig
