#pragma once

#include "ethos/common/fs.hpp"
#include "ethos/common/result.hpp"

#include <filesystem>
#include <memory>
#include <string>

// OpenSSL's key object, kept out of the public headers.
struct evp_pkey_st;

namespace ethos::sig {

struct PkeyDeleter {
  void operator()(evp_pkey_st *key) const;
};

using PkeyHandle = std::unique_ptr<evp_pkey_st, PkeyDeleter>;

/// Move-only owner of an Ed25519 private key.
class PrivateKey {
public:
  explicit PrivateKey(PkeyHandle key) : key_(std::move(key)) {}

  [[nodiscard]] evp_pkey_st *get() const { return key_.get(); }

private:
  PkeyHandle key_;
};

/// Move-only owner of an Ed25519 public key.
class PublicKey {
public:
  explicit PublicKey(PkeyHandle key) : key_(std::move(key)) {}

  [[nodiscard]] evp_pkey_st *get() const { return key_.get(); }

private:
  PkeyHandle key_;
};

struct Keypair {
  PrivateKey private_key;
  PublicKey public_key;
};

/// Fresh Ed25519 keypair from the OpenSSL CSPRNG. Fails with
/// ErrorKind::Crypto if the generator is not seeded.
[[nodiscard]] common::Result<Keypair> generate_keypair();

/// Public half of an existing private key.
[[nodiscard]] common::Result<PublicKey> derive_public_key(const PrivateKey &key);

/// Unencrypted PKCS#8 PEM.
[[nodiscard]] common::Result<std::string> private_key_pem(const PrivateKey &key);
/// SubjectPublicKeyInfo PEM.
[[nodiscard]] common::Result<std::string> public_key_pem(const PublicKey &key);

[[nodiscard]] common::Result<PrivateKey> parse_private_key_pem(const std::string &pem);
[[nodiscard]] common::Result<PublicKey> parse_public_key_pem(const std::string &pem);

[[nodiscard]] common::Result<PrivateKey> load_private_key(const std::filesystem::path &path);
[[nodiscard]] common::Result<PublicKey> load_public_key(const std::filesystem::path &path);

/// Writes both halves. The private key file gets mode 0600. If the public
/// key cannot be written the private key file written here is removed again.
[[nodiscard]] common::Status persist_keypair(const Keypair &keypair,
                                             const std::filesystem::path &private_path,
                                             const std::filesystem::path &public_path,
                                             const common::WriteOptions &options = {});

/// First 16 hex characters of SHA-256 over the raw 32-byte public key.
[[nodiscard]] common::Result<std::string> public_key_fingerprint(const PublicKey &key);

/// Most recent OpenSSL error queue entry, or `fallback` when the queue is empty.
[[nodiscard]] std::string openssl_error_string(const std::string &fallback);

} // namespace ethos::sig
