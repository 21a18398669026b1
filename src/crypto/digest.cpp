#include "crypto/digest.hpp"
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace fstore::crypto {

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw DigestError("Failed to create hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};

Digest::Digest() : context_(std::make_unique<DigestContext>()) {
  if (!EVP_DigestInit_ex(context_->get(), EVP_sha256(), nullptr)) {
    throw DigestError("Failed to initialize hash context");
  }
}

Digest::~Digest() = default;

void Digest::update(const void* data, std::size_t size) {
  if (finalized_) {
    throw DigestError("Digest already finalized");
  }
  if (size == 0) {
    return;
  }
  if (!EVP_DigestUpdate(context_->get(), data, size)) {
    throw DigestError("Failed to update hash");
  }
}

std::string Digest::hex_final() {
  if (finalized_) {
    throw DigestError("Digest already finalized");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (!EVP_DigestFinal_ex(context_->get(), hash, &hash_len)) {
    throw DigestError("Failed to finalize hash");
  }
  finalized_ = true;

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

std::string Digest::sha256_hex(const std::string& data) {
  Digest digest;
  digest.update(data.data(), data.size());
  return digest.hex_final();
}

std::string Digest::file_sha256_hex(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw DigestError("Failed to open file: " + path.string());
  }

  Digest digest;
  std::vector<char> buffer(1024 * 1024);
  std::uintmax_t total = 0;

  while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0) {
    digest.update(buffer.data(), static_cast<std::size_t>(file.gcount()));
    total += static_cast<std::uintmax_t>(file.gcount());
  }
  if (file.bad()) {
    throw DigestError("Failed to read file: " + path.string());
  }

  std::string result = digest.hex_final();
  BOOST_LOG_TRIVIAL(debug) << "Digest: " << path.string() << " (" << total << " bytes) sha256=" << result;
  return result;
}

} // namespace fstore::crypto
