#ifndef FSTORE_CRYPTO_DIGEST_HPP
#define FSTORE_CRYPTO_DIGEST_HPP

#include <filesystem>
#include <memory>
#include <string>
#include "crypto_error.hpp"

namespace fstore::crypto {

struct DigestContext;

// Incremental SHA-256 using OpenSSL EVP. Results are lower-case hex.
class Digest {
public:
  Digest();
  ~Digest();

  Digest(const Digest&) = delete;
  Digest& operator=(const Digest&) = delete;

  void update(const void* data, std::size_t size);
  // Finalizes the digest; the object cannot be updated afterwards
  std::string hex_final();

  
  // ---- ONE-SHOT HELPERS ----
  static std::string sha256_hex(const std::string& data);
  // Reads the file in 1 MiB chunks
  static std::string file_sha256_hex(const std::filesystem::path& path);

private:
  std::unique_ptr<DigestContext> context_;
  bool finalized_ = false;
};

} // namespace fstore::crypto

#endif // FSTORE_CRYPTO_DIGEST_HPP
