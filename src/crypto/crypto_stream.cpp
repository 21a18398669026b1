#include "crypto/crypto_stream.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <boost/log/trivial.hpp>
#include <cctype>
#include <memory>
#include <string>
#include <stdexcept>

namespace fstore::crypto {

//=================================================
// RAII WRAPPER TO MANAGE CIPHER CONTEXT LIFECYCLE
//=================================================

struct CipherContext {
  std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)> handle{EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free};

  CipherContext() {
    if (!handle) {
      throw InitializationError("Crypto stream: EVP_CIPHER_CTX_new failed");
    }
  }

  EVP_CIPHER_CTX* get() { return handle.get(); }
};

namespace {

[[noreturn]] void fail(bool encrypting, const std::string& what) {
  if (encrypting) {
    throw EncryptionError("Crypto stream: Encryption " + what);
  }
  throw DecryptionError("Crypto stream: Decryption " + what);
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CryptoStream::CryptoStream()
  : context_(std::make_unique<CipherContext>()) {}

CryptoStream::~CryptoStream() = default;

//==============================================
// KEY AND IV HANDLING
//==============================================

std::array<uint8_t, CryptoStream::IV_SIZE> CryptoStream::generate_IV() {
  std::array<uint8_t, IV_SIZE> iv;
  if (RAND_bytes(iv.data(), static_cast<int>(iv.size())) != 1) {
    throw InitializationError("Crypto stream: Failed to generate random IV");
  }
  return iv;
}

std::vector<uint8_t> CryptoStream::key_from_hex(const std::string& hex) {
  if (hex.size() != KEY_SIZE * 2) {
    throw InitializationError("Crypto stream: Key must be " + std::to_string(KEY_SIZE * 2) + " hex characters");
  }

  auto nibble = [](char c) -> uint8_t {
    if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
    throw InitializationError("Crypto stream: Invalid hex character in key");
  };

  std::vector<uint8_t> key(KEY_SIZE);
  for (size_t i = 0; i < KEY_SIZE; ++i) {
    key[i] = static_cast<uint8_t>((nibble(hex[2 * i]) << 4) | nibble(hex[2 * i + 1]));
  }
  return key;
}

void CryptoStream::initialize(const std::vector<uint8_t>& key, const std::vector<uint8_t>& iv) {
  if (key.size() != KEY_SIZE || iv.size() != IV_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Crypto stream: Rejected key/IV of " << key.size() << "/" << iv.size()
                             << " bytes, need " << KEY_SIZE << "/" << IV_SIZE;
    throw InitializationError("Crypto stream: Invalid key or IV size");
  }

  key_ = key;
  iv_ = iv;
  is_initialized_ = true;
}

void CryptoStream::begin(Direction direction) {
  if (!is_initialized_) {
    throw InitializationError("Crypto stream: Key and IV must be set before use");
  }

  EVP_CIPHER_CTX* ctx = context_->get();
  EVP_CIPHER_CTX_reset(ctx);
  int ok = direction == Direction::ENCRYPT
    ? EVP_EncryptInit_ex(ctx, EVP_aes_256_cbc(), nullptr, key_.data(), iv_.data())
    : EVP_DecryptInit_ex(ctx, EVP_aes_256_cbc(), nullptr, key_.data(), iv_.data());
  if (ok != 1) {
    fail(direction == Direction::ENCRYPT, "cipher setup failed");
  }
}

//==============================================
// CIPHER PASSES
//==============================================

void CryptoStream::run_pass(std::istream& input, std::ostream& output, Direction direction) {
  if (!output.good()) {
    throw std::runtime_error("Crypto stream: Output stream is not writable");
  }

  begin(direction);

  std::array<uint8_t, CHUNK_SIZE> chunk;
  std::array<uint8_t, CHUNK_SIZE + EVP_MAX_BLOCK_LENGTH> produced;
  size_t written = 0;

  for (;;) {
    input.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
    std::streamsize got = input.gcount();
    if (got > 0) {
      size_t n = update(chunk.data(), static_cast<size_t>(got), produced.data(), direction);
      emit(output, produced.data(), n);
      written += n;
    }
    if (!input) {
      break;
    }
  }
  if (input.bad()) {
    throw std::runtime_error("Crypto stream: Input stream read failed");
  }

  // PKCS#7 padding is added or stripped here
  size_t tail = finish(produced.data(), direction);
  emit(output, produced.data(), tail);
  written += tail;

  BOOST_LOG_TRIVIAL(trace) << "Crypto stream: " << (direction == Direction::ENCRYPT ? "Sealed " : "Opened ")
                           << written << " bytes";
}

size_t CryptoStream::update(const uint8_t* in, size_t length, uint8_t* out, Direction direction) {
  int n = 0;
  int ok = direction == Direction::ENCRYPT
    ? EVP_EncryptUpdate(context_->get(), out, &n, in, static_cast<int>(length))
    : EVP_DecryptUpdate(context_->get(), out, &n, in, static_cast<int>(length));
  if (ok != 1) {
    fail(direction == Direction::ENCRYPT, "update failed");
  }
  return static_cast<size_t>(n);
}

size_t CryptoStream::finish(uint8_t* out, Direction direction) {
  int n = 0;
  int ok = direction == Direction::ENCRYPT
    ? EVP_EncryptFinal_ex(context_->get(), out, &n)
    : EVP_DecryptFinal_ex(context_->get(), out, &n);
  if (ok != 1) {
    fail(direction == Direction::ENCRYPT, "final block rejected");
  }
  return static_cast<size_t>(n);
}

void CryptoStream::emit(std::ostream& output, const uint8_t* data, size_t length) {
  if (length == 0) {
    return;
  }
  output.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(length));
  if (!output) {
    throw std::runtime_error("Crypto stream: Output stream write failed");
  }
}

//==============================================
// PUBLIC OPERATIONS
//==============================================

std::ostream& CryptoStream::encrypt(std::istream& input, std::ostream& output) {
  run_pass(input, output, Direction::ENCRYPT);
  return output;
}

std::ostream& CryptoStream::decrypt(std::istream& input, std::ostream& output) {
  run_pass(input, output, Direction::DECRYPT);
  return output;
}

} // namespace fstore::crypto
