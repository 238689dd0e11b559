#include "ethos/sig/verifier.hpp"

#include "ethos/common/encoding.hpp"
#include "ethos/common/fs.hpp"
#include "ethos/observability/global.hpp"
#include "ethos/sig/canonical.hpp"
#include "ethos/sig/hasher.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>

namespace ethos::sig {

namespace {

VerificationResult finish(const bool ok, const char *reason) {
  observability::record_verification(ok, reason);
  return {.ok = ok, .reason = reason};
}

bool ed25519_verify(const std::string &message, const common::Bytes &signature,
                    const PublicKey &key) {
  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  if (ctx == nullptr) {
    return false;
  }
  auto cleanup = [&ctx]() { EVP_MD_CTX_free(ctx); };

  bool verified = false;
  if (EVP_DigestVerifyInit(ctx, nullptr, nullptr, nullptr, key.get()) == 1) {
    verified = EVP_DigestVerify(ctx, signature.data(), signature.size(),
                                reinterpret_cast<const unsigned char *>(message.data()),
                                message.size()) == 1;
  }
  cleanup();
  ERR_clear_error();
  return verified;
}

} // namespace

VerificationResult verify_graph(const SignatureDocument &doc, const common::JsonValue &graph,
                                const PublicKey &key) {
  const std::string canonical = canonical_json(graph);
  if (sha256_hex(canonical) != doc.graph_sha256) {
    return finish(false, REASON_HASH_MISMATCH);
  }

  const auto signature = common::base64_decode(doc.signature_b64);
  if (!signature.ok() || signature.value().size() != ED25519_SIGNATURE_SIZE) {
    return finish(false, REASON_SIGNATURE_FAILED);
  }
  if (!ed25519_verify(canonical, signature.value(), key)) {
    return finish(false, REASON_SIGNATURE_FAILED);
  }
  return finish(true, REASON_VERIFIED);
}

common::Result<VerificationResult> verify_files(const std::filesystem::path &signature_path,
                                                const std::filesystem::path &graph_path,
                                                const std::filesystem::path &public_key_path) {
  const auto doc = load_signature_document(signature_path);
  if (!doc.ok()) {
    return common::Result<VerificationResult>::failure(doc);
  }

  const auto graph_text = common::read_file(graph_path);
  if (!graph_text.ok()) {
    return common::Result<VerificationResult>::failure(graph_text);
  }
  const auto graph = common::parse_json(graph_text.value());
  if (!graph.ok()) {
    return common::Result<VerificationResult>::failure(
        graph.kind(), graph_path.string() + ": " + graph.error());
  }

  const auto key = load_public_key(public_key_path);
  if (!key.ok()) {
    return common::Result<VerificationResult>::failure(key);
  }

  return common::Result<VerificationResult>::success(
      verify_graph(doc.value(), graph.value(), key.value()));
}

} // namespace ethos::sig
