#include "ethos/sig/keys.hpp"

#include "ethos/observability/global.hpp"
#include "ethos/sig/hasher.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rand.h>

#include <array>

namespace ethos::sig {

namespace {

constexpr std::size_t ED25519_PUBLIC_KEY_SIZE = 32;

struct BioDeleter {
  void operator()(BIO *bio) const { BIO_free(bio); }
};

using BioHandle = std::unique_ptr<BIO, BioDeleter>;

template <typename T> common::Result<T> crypto_failure(const std::string &what) {
  return common::Result<T>::failure(common::ErrorKind::Crypto, openssl_error_string(what));
}

common::Result<std::string> bio_to_string(BIO *bio) {
  char *data = nullptr;
  const long size = BIO_get_mem_data(bio, &data);
  if (size < 0 || (size > 0 && data == nullptr)) {
    return crypto_failure<std::string>("failed to read PEM buffer");
  }
  return common::Result<std::string>::success(std::string(data, static_cast<std::size_t>(size)));
}

BioHandle memory_bio_for(const std::string &text) {
  return BioHandle(BIO_new_mem_buf(text.data(), static_cast<int>(text.size())));
}

bool is_ed25519(const EVP_PKEY *key) { return EVP_PKEY_id(key) == EVP_PKEY_ED25519; }

} // namespace

void PkeyDeleter::operator()(evp_pkey_st *key) const { EVP_PKEY_free(key); }

std::string openssl_error_string(const std::string &fallback) {
  const unsigned long code = ERR_get_error();
  ERR_clear_error();
  if (code == 0) {
    return fallback;
  }
  std::array<char, 256> buffer{};
  ERR_error_string_n(code, buffer.data(), buffer.size());
  return fallback + ": " + buffer.data();
}

common::Result<Keypair> generate_keypair() {
  if (RAND_status() != 1) {
    return common::Result<Keypair>::failure(common::ErrorKind::Crypto,
                                            "random number generator is not seeded");
  }

  EVP_PKEY_CTX *ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr);
  if (ctx == nullptr) {
    return crypto_failure<Keypair>("failed to create Ed25519 key context");
  }
  auto cleanup = [&ctx]() { EVP_PKEY_CTX_free(ctx); };

  if (EVP_PKEY_keygen_init(ctx) != 1) {
    cleanup();
    return crypto_failure<Keypair>("Ed25519 keygen init failed");
  }
  EVP_PKEY *raw = nullptr;
  if (EVP_PKEY_keygen(ctx, &raw) != 1 || raw == nullptr) {
    cleanup();
    return crypto_failure<Keypair>("Ed25519 key generation failed");
  }
  cleanup();

  PrivateKey private_key{PkeyHandle(raw)};
  auto public_key = derive_public_key(private_key);
  if (!public_key.ok()) {
    return common::Result<Keypair>::failure(public_key);
  }
  return common::Result<Keypair>::success(
      Keypair{.private_key = std::move(private_key), .public_key = std::move(public_key.value())});
}

common::Result<PublicKey> derive_public_key(const PrivateKey &key) {
  std::array<unsigned char, ED25519_PUBLIC_KEY_SIZE> raw{};
  std::size_t raw_size = raw.size();
  if (EVP_PKEY_get_raw_public_key(key.get(), raw.data(), &raw_size) != 1 ||
      raw_size != raw.size()) {
    return crypto_failure<PublicKey>("failed to extract Ed25519 public key");
  }
  EVP_PKEY *pub = EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, raw.data(), raw_size);
  if (pub == nullptr) {
    return crypto_failure<PublicKey>("failed to build Ed25519 public key");
  }
  return common::Result<PublicKey>::success(PublicKey{PkeyHandle(pub)});
}

common::Result<std::string> private_key_pem(const PrivateKey &key) {
  BioHandle bio(BIO_new(BIO_s_mem()));
  if (bio == nullptr) {
    return crypto_failure<std::string>("failed to allocate PEM buffer");
  }
  if (PEM_write_bio_PrivateKey(bio.get(), key.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1) {
    return crypto_failure<std::string>("failed to encode private key");
  }
  return bio_to_string(bio.get());
}

common::Result<std::string> public_key_pem(const PublicKey &key) {
  BioHandle bio(BIO_new(BIO_s_mem()));
  if (bio == nullptr) {
    return crypto_failure<std::string>("failed to allocate PEM buffer");
  }
  if (PEM_write_bio_PUBKEY(bio.get(), key.get()) != 1) {
    return crypto_failure<std::string>("failed to encode public key");
  }
  return bio_to_string(bio.get());
}

common::Result<PrivateKey> parse_private_key_pem(const std::string &pem) {
  BioHandle bio = memory_bio_for(pem);
  if (bio == nullptr) {
    return crypto_failure<PrivateKey>("failed to allocate PEM buffer");
  }
  EVP_PKEY *raw = PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);
  if (raw == nullptr) {
    return crypto_failure<PrivateKey>("invalid private key PEM");
  }
  PkeyHandle key(raw);
  if (!is_ed25519(key.get())) {
    return common::Result<PrivateKey>::failure(common::ErrorKind::Crypto,
                                               "private key is not an Ed25519 key");
  }
  return common::Result<PrivateKey>::success(PrivateKey{std::move(key)});
}

common::Result<PublicKey> parse_public_key_pem(const std::string &pem) {
  BioHandle bio = memory_bio_for(pem);
  if (bio == nullptr) {
    return crypto_failure<PublicKey>("failed to allocate PEM buffer");
  }
  EVP_PKEY *raw = PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr);
  if (raw == nullptr) {
    return crypto_failure<PublicKey>("invalid public key PEM");
  }
  PkeyHandle key(raw);
  if (!is_ed25519(key.get())) {
    return common::Result<PublicKey>::failure(common::ErrorKind::Crypto,
                                              "public key is not an Ed25519 key");
  }
  return common::Result<PublicKey>::success(PublicKey{std::move(key)});
}

common::Result<PrivateKey> load_private_key(const std::filesystem::path &path) {
  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<PrivateKey>::failure(content);
  }
  auto key = parse_private_key_pem(content.value());
  if (!key.ok()) {
    return common::Result<PrivateKey>::failure(key.kind(), path.string() + ": " + key.error());
  }
  return key;
}

common::Result<PublicKey> load_public_key(const std::filesystem::path &path) {
  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<PublicKey>::failure(content);
  }
  auto key = parse_public_key_pem(content.value());
  if (!key.ok()) {
    return common::Result<PublicKey>::failure(key.kind(), path.string() + ": " + key.error());
  }
  return key;
}

common::Status persist_keypair(const Keypair &keypair, const std::filesystem::path &private_path,
                               const std::filesystem::path &public_path,
                               const common::WriteOptions &options) {
  const auto private_text = private_key_pem(keypair.private_key);
  if (!private_text.ok()) {
    return private_text.status();
  }
  const auto public_text = public_key_pem(keypair.public_key);
  if (!public_text.ok()) {
    return public_text.status();
  }

  std::error_code ec;
  if (!options.overwrite) {
    for (const auto &path : {private_path, public_path}) {
      if (std::filesystem::exists(path, ec)) {
        return common::Status::error(common::ErrorKind::Io,
                                     "refusing to overwrite existing file: " + path.string());
      }
    }
  }

  common::WriteOptions private_options = options;
  private_options.permissions =
      std::filesystem::perms::owner_read | std::filesystem::perms::owner_write;
  if (auto written = common::write_file_atomic(private_path, private_text.value(), private_options);
      !written.ok()) {
    return written;
  }

  if (auto written = common::write_file_atomic(public_path, public_text.value(), options);
      !written.ok()) {
    std::filesystem::remove(private_path, ec);
    return written;
  }

  const auto fingerprint = public_key_fingerprint(keypair.public_key);
  if (!fingerprint.ok()) {
    observability::record_error("keys", fingerprint.error());
  } else {
    observability::record_keypair_generated(fingerprint.value(), private_path.string(),
                                            public_path.string());
  }
  return common::Status::success();
}

common::Result<std::string> public_key_fingerprint(const PublicKey &key) {
  std::array<unsigned char, ED25519_PUBLIC_KEY_SIZE> raw{};
  std::size_t raw_size = raw.size();
  if (EVP_PKEY_get_raw_public_key(key.get(), raw.data(), &raw_size) != 1) {
    return crypto_failure<std::string>("failed to read raw public key");
  }
  const std::string digest =
      sha256_hex(std::string_view(reinterpret_cast<const char *>(raw.data()), raw_size));
  return common::Result<std::string>::success(digest.substr(0, 16));
}

} // namespace ethos::sig
