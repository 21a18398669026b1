#ifndef FSTORE_CRYPTO_ERROR_HPP
#define FSTORE_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace fstore::crypto {

// Base for every failure raised while sealing frame payloads or hashing
// file content. A payload that fails to open surfaces as a PROTOCOL
// session error; digest failures fail the transfer as LOCAL_IO.
class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message)
        : std::runtime_error(message) {}
};

// Session key or per-frame IV rejected: wrong length, bad hex in the
// configured key, RNG failure, or use before the key was installed.
class InitializationError : public CryptoError {
public:
    explicit InitializationError(const std::string& message)
        : CryptoError("Key setup failed: " + message) {}
};

// Sealing an outgoing frame payload
class EncryptionError : public CryptoError {
public:
    explicit EncryptionError(const std::string& message)
        : CryptoError("Sealing payload failed: " + message) {}
};

// Opening a received payload. Usually a wrong session key or a frame
// damaged in transit (bad padding).
class DecryptionError : public CryptoError {
public:
    explicit DecryptionError(const std::string& message)
        : CryptoError("Opening payload failed: " + message) {}
};

// SHA-256 content digest: the local file could not be opened or read,
// or the hash context was misused after finalize().
class DigestError : public CryptoError {
public:
    explicit DigestError(const std::string& message)
        : CryptoError("Content digest failed: " + message) {}
};

} // namespace fstore::crypto

#endif // FSTORE_CRYPTO_ERROR_HPP
