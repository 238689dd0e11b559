#include "ethos/sig/signer.hpp"

#include "ethos/common/encoding.hpp"
#include "ethos/observability/global.hpp"
#include "ethos/sig/canonical.hpp"
#include "ethos/sig/hasher.hpp"

#include <openssl/evp.h>

namespace ethos::sig {

namespace {

common::Result<std::string> required_string(const common::JsonValue &object,
                                            const std::string &key) {
  const common::JsonValue *value = object.find(key);
  if (value == nullptr || !value->is_string()) {
    return common::Result<std::string>::failure(common::ErrorKind::Input,
                                                "signature document field '" + key +
                                                    "' must be a string");
  }
  return common::Result<std::string>::success(value->as_string());
}

common::Result<common::Bytes> ed25519_sign(const std::string &message, const PrivateKey &key) {
  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  if (ctx == nullptr) {
    return common::Result<common::Bytes>::failure(
        common::ErrorKind::Crypto, openssl_error_string("failed to create signing context"));
  }
  auto cleanup = [&ctx]() { EVP_MD_CTX_free(ctx); };

  if (EVP_DigestSignInit(ctx, nullptr, nullptr, nullptr, key.get()) != 1) {
    cleanup();
    return common::Result<common::Bytes>::failure(
        common::ErrorKind::Crypto, openssl_error_string("Ed25519 sign init failed"));
  }

  common::Bytes signature(ED25519_SIGNATURE_SIZE);
  std::size_t signature_size = signature.size();
  if (EVP_DigestSign(ctx, signature.data(), &signature_size,
                     reinterpret_cast<const unsigned char *>(message.data()),
                     message.size()) != 1) {
    cleanup();
    return common::Result<common::Bytes>::failure(common::ErrorKind::Crypto,
                                                  openssl_error_string("Ed25519 signing failed"));
  }
  cleanup();
  signature.resize(signature_size);
  return common::Result<common::Bytes>::success(std::move(signature));
}

} // namespace

common::Result<SignatureDocument> sign_graph(const common::JsonValue &graph,
                                             const PrivateKey &key) {
  if (auto valid = validate_graph_json(graph); !valid.ok()) {
    return common::Result<SignatureDocument>::failure(valid);
  }

  const std::string canonical = canonical_json(graph);
  observability::record_metric(observability::CanonicalBytesMetric{.bytes = canonical.size()});

  auto signature = ed25519_sign(canonical, key);
  if (!signature.ok()) {
    observability::record_error("signer", signature.error());
    return common::Result<SignatureDocument>::failure(signature);
  }

  SignatureDocument doc;
  doc.graph_sha256 = sha256_hex(canonical);
  doc.signature_b64 = common::base64_encode(signature.value());

  std::string fingerprint = "unknown";
  if (auto public_key = derive_public_key(key); public_key.ok()) {
    if (auto fp = public_key_fingerprint(public_key.value()); fp.ok()) {
      fingerprint = fp.value();
    }
  }
  observability::record_graph_signed(doc.graph_sha256, fingerprint);
  return common::Result<SignatureDocument>::success(std::move(doc));
}

common::Result<SignatureDocument> sign_graph(const Graph &graph, const PrivateKey &key) {
  return sign_graph(graph.to_json(), key);
}

common::JsonValue signature_document_to_json(const SignatureDocument &doc) {
  return common::JsonObject{
      {"algorithm", doc.algorithm},
      {"graph_sha256", doc.graph_sha256},
      {"signature_b64", doc.signature_b64},
  };
}

common::Result<SignatureDocument> signature_document_from_json(const common::JsonValue &value) {
  if (!value.is_object()) {
    return common::Result<SignatureDocument>::failure(common::ErrorKind::Input,
                                                      "signature document must be a JSON object");
  }
  auto algorithm = required_string(value, "algorithm");
  if (!algorithm.ok()) {
    return common::Result<SignatureDocument>::failure(algorithm);
  }
  auto graph_sha256 = required_string(value, "graph_sha256");
  if (!graph_sha256.ok()) {
    return common::Result<SignatureDocument>::failure(graph_sha256);
  }
  auto signature_b64 = required_string(value, "signature_b64");
  if (!signature_b64.ok()) {
    return common::Result<SignatureDocument>::failure(signature_b64);
  }
  if (algorithm.value() != SIGNATURE_ALGORITHM) {
    return common::Result<SignatureDocument>::failure(
        common::ErrorKind::Crypto, "unsupported signature algorithm: " + algorithm.value());
  }

  SignatureDocument doc;
  doc.algorithm = algorithm.value();
  doc.graph_sha256 = graph_sha256.value();
  doc.signature_b64 = signature_b64.value();
  return common::Result<SignatureDocument>::success(std::move(doc));
}

common::Status write_signature_document(const std::filesystem::path &path,
                                        const SignatureDocument &doc,
                                        const common::WriteOptions &options) {
  return common::write_file_atomic(
      path, common::dump_json_pretty(signature_document_to_json(doc)) + "\n", options);
}

common::Result<SignatureDocument> load_signature_document(const std::filesystem::path &path) {
  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<SignatureDocument>::failure(content);
  }
  const auto parsed = common::parse_json(content.value());
  if (!parsed.ok()) {
    return common::Result<SignatureDocument>::failure(parsed.kind(),
                                                      path.string() + ": " + parsed.error());
  }
  auto doc = signature_document_from_json(parsed.value());
  if (!doc.ok()) {
    return common::Result<SignatureDocument>::failure(doc.kind(),
                                                      path.string() + ": " + doc.error());
  }
  return doc;
}

} // namespace ethos::sig
