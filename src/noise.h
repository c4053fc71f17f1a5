#pragma once

#include <array>
#include <vector>
#include <string>
#include <utility>
#include <cstdint>

namespace filepunch {

// Noise Protocol constants
constexpr size_t NOISE_KEY_SIZE = 32;      // 32 bytes for Curve25519 keys
constexpr size_t NOISE_HASH_SIZE = 32;     // 32 bytes for SHA256
constexpr size_t NOISE_TAG_SIZE = 16;      // 16 bytes for ChaCha20-Poly1305 tag
constexpr size_t NOISE_MAX_MESSAGE_SIZE = 65535;

// Noise key types
using NoiseKey = std::array<uint8_t, NOISE_KEY_SIZE>;
using NoiseHash = std::array<uint8_t, NOISE_HASH_SIZE>;

/**
 * Noise Protocol handshake state enumeration
 */
enum class NoiseHandshakeState {
    UNINITIALIZED,
    WRITE_MESSAGE_1,    // Initiator sends first message
    READ_MESSAGE_1,     // Responder receives first message
    WRITE_MESSAGE_2,    // Responder sends second message
    READ_MESSAGE_2,     // Initiator receives second message
    WRITE_MESSAGE_3,    // Initiator sends third message
    READ_MESSAGE_3,     // Responder receives third message
    COMPLETED,          // Handshake completed successfully
    FAILED              // Handshake failed
};

/**
 * Noise Protocol role enumeration
 */
enum class NoiseRole {
    INITIATOR,          // The peer that initiates the handshake
    RESPONDER           // The peer that responds to the handshake
};

/**
 * Cryptographic primitives for Noise_XX_25519_ChaChaPoly_SHA256, backed by
 * OpenSSL EVP. Every function reports failure through its return value.
 */
class NoiseCrypto {
public:
    // X25519
    static bool generate_keypair(NoiseKey& private_key, NoiseKey& public_key);
    static bool public_key_from_private(const NoiseKey& private_key, NoiseKey& public_key);
    static bool dh(const NoiseKey& private_key, const NoiseKey& public_key, NoiseKey& shared_secret);

    // ChaCha20-Poly1305, nonce encoded as 32 zero bits + 64-bit little-endian counter
    static bool encrypt(const NoiseKey& key, uint64_t nonce,
                        const std::vector<uint8_t>& plaintext,
                        const std::vector<uint8_t>& ad,
                        std::vector<uint8_t>& ciphertext);
    static bool decrypt(const NoiseKey& key, uint64_t nonce,
                        const std::vector<uint8_t>& ciphertext,
                        const std::vector<uint8_t>& ad,
                        std::vector<uint8_t>& plaintext);

    // SHA256 and HMAC-SHA256 based HKDF
    static NoiseHash hash(const std::vector<uint8_t>& data);
    static NoiseHash hmac(const NoiseHash& key, const std::vector<uint8_t>& data);
    static void hkdf(const NoiseHash& chaining_key, const std::vector<uint8_t>& input_key_material,
                     NoiseHash& output1, NoiseHash& output2);

    // Utility functions
    static void secure_memzero(void* ptr, size_t size);
    static bool random_bytes(uint8_t* buffer, size_t size);
};

/**
 * Noise Protocol cipher state for managing encryption/decryption
 */
class NoiseCipherState {
public:
    NoiseCipherState();
    ~NoiseCipherState();
    NoiseCipherState(const NoiseCipherState& other) = default;
    NoiseCipherState& operator=(const NoiseCipherState& other) = default;

    void initialize_key(const NoiseKey& key);
    bool has_key() const { return has_key_; }

    // Without a key both functions pass data through unchanged
    bool encrypt_with_ad(const std::vector<uint8_t>& plaintext,
                         const std::vector<uint8_t>& ad,
                         std::vector<uint8_t>& ciphertext);
    bool decrypt_with_ad(const std::vector<uint8_t>& ciphertext,
                         const std::vector<uint8_t>& ad,
                         std::vector<uint8_t>& plaintext);

    void set_nonce(uint64_t nonce) { nonce_ = nonce; }
    uint64_t get_nonce() const { return nonce_; }

private:
    NoiseKey key_;
    uint64_t nonce_;
    bool has_key_;
};

/**
 * Noise Protocol symmetric state for managing handshake state
 */
class NoiseSymmetricState {
public:
    NoiseSymmetricState();
    ~NoiseSymmetricState();

    void initialize(const std::string& protocol_name);
    void mix_key(const std::vector<uint8_t>& input_key_material);
    void mix_hash(const std::vector<uint8_t>& data);
    bool encrypt_and_hash(const std::vector<uint8_t>& plaintext, std::vector<uint8_t>& ciphertext);
    bool decrypt_and_hash(const std::vector<uint8_t>& ciphertext, std::vector<uint8_t>& plaintext);
    std::pair<NoiseCipherState, NoiseCipherState> split();

    const NoiseHash& get_handshake_hash() const { return h_; }
    bool has_key() const { return cipher_state_.has_key(); }

private:
    NoiseCipherState cipher_state_;
    NoiseHash ck_;  // Chaining key
    NoiseHash h_;   // Handshake hash
};

/**
 * Noise_XX handshake:
 *   -> e
 *   <- e, ee, s, es
 *   -> s, se
 */
class NoiseHandshake {
public:
    NoiseHandshake();
    ~NoiseHandshake();

    // Initialize for either initiator or responder role
    bool initialize(NoiseRole role, const NoiseKey& static_private_key,
                    const std::vector<uint8_t>& prologue = {});

    // Handshake message processing
    bool write_message(const std::vector<uint8_t>& payload, std::vector<uint8_t>& message);
    bool read_message(const std::vector<uint8_t>& message, std::vector<uint8_t>& payload);

    // State queries
    NoiseHandshakeState get_state() const { return state_; }
    NoiseRole get_role() const { return role_; }
    bool is_completed() const { return state_ == NoiseHandshakeState::COMPLETED; }
    bool has_failed() const { return state_ == NoiseHandshakeState::FAILED; }
    bool is_my_turn_to_write() const;

    /**
     * Transport ciphers once completed: first is for sending, second for receiving
     */
    std::pair<NoiseCipherState, NoiseCipherState> get_cipher_states();

    // Get remote static public key (available after handshake)
    const NoiseKey& get_remote_static_public_key() const { return rs_; }
    const NoiseHash& get_handshake_hash() const { return symmetric_state_.get_handshake_hash(); }

private:
    NoiseRole role_;
    NoiseHandshakeState state_;
    NoiseSymmetricState symmetric_state_;

    // Local keys
    NoiseKey s_;       // Local static private key
    NoiseKey s_pub_;   // Local static public key
    NoiseKey e_;       // Local ephemeral private key
    NoiseKey e_pub_;   // Local ephemeral public key

    // Remote keys
    NoiseKey rs_;  // Remote static public key
    NoiseKey re_;  // Remote ephemeral public key

    bool mix_dh(const NoiseKey& private_key, const NoiseKey& public_key);
    void advance_state();
    void fail_handshake();
};

/**
 * Utility functions for Noise Protocol
 */
namespace noise_utils {
    // Key management
    NoiseKey generate_static_keypair();
    std::string key_to_hex(const NoiseKey& key);
    bool hex_to_key(const std::string& hex, NoiseKey& key);

    /**
     * Short printable fingerprint of a static private key's public half
     */
    std::string fingerprint(const NoiseKey& static_private_key);

    // Protocol utilities
    std::string get_protocol_name();
    bool validate_message_size(size_t size);
}

} // namespace filepunch
