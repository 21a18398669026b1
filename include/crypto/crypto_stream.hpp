#ifndef FSTORE_CRYPTO_STREAM_HPP
#define FSTORE_CRYPTO_STREAM_HPP

#include <array>
#include <cstdint>
#include <istream>
#include <memory>
#include <ostream>
#include <vector>
#include "crypto_error.hpp"

namespace fstore::crypto {

// Forward declaration for OpenSSL cipher context
struct CipherContext;

// AES-256-CBC over std streams, used to seal frame payloads when the
// session is configured with a shared key.
class CryptoStream {
public:
  static constexpr size_t KEY_SIZE = 32;     // 256 bits for AES-256
  static constexpr size_t IV_SIZE = 16;      // 128 bits for CBC mode
  static constexpr size_t BLOCK_SIZE = 16;   // AES block size

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  CryptoStream();
  ~CryptoStream();

  CryptoStream(const CryptoStream&) = delete;
  CryptoStream& operator=(const CryptoStream&) = delete;

  // Generate a random initialization vector
  static std::array<uint8_t, IV_SIZE> generate_IV();

  // Parses a 64 character hex string into a 32 byte key
  static std::vector<uint8_t> key_from_hex(const std::string& hex);

  
  // ---- INITIALIZATION ----
  void initialize(const std::vector<uint8_t>& key, const std::vector<uint8_t>& iv);

  
  // ---- ENCRYPTION/DECRYPTION OPERATIONS ----
  // Both consume the input stream until EOF
  std::ostream& encrypt(std::istream& input, std::ostream& output);
  std::ostream& decrypt(std::istream& input, std::ostream& output);

  // Size of the ciphertext produced for a plaintext of original_size bytes
  static size_t padded_size(size_t original_size) {
    return (original_size / BLOCK_SIZE + 1) * BLOCK_SIZE;
  }

private:
  // ---- PARAMETERS ----
  std::vector<uint8_t> key_;
  std::vector<uint8_t> iv_;
  std::unique_ptr<CipherContext> context_;
  bool is_initialized_ = false;
  static constexpr size_t CHUNK_SIZE = 16 * 1024;

  
  enum class Direction { ENCRYPT, DECRYPT };

  // ---- CIPHER PASSES ----
  void begin(Direction direction);
  void run_pass(std::istream& input, std::ostream& output, Direction direction);
  // Returns the number of bytes placed in out
  size_t update(const uint8_t* in, size_t length, uint8_t* out, Direction direction);
  size_t finish(uint8_t* out, Direction direction);
  static void emit(std::ostream& output, const uint8_t* data, size_t length);
};
  
} // namespace fstore::crypto

#endif // FSTORE_CRYPTO_STREAM_HPP
