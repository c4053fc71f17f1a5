#include "noise.h"
#include "logger.h"
#include <cstring>
#include <iomanip>
#include <sstream>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/crypto.h>

#define LOG_NOISE_DEBUG(message) LOG_DEBUG("noise", message)
#define LOG_NOISE_INFO(message)  LOG_INFO("noise", message)
#define LOG_NOISE_WARN(message)  LOG_WARN("noise", message)
#define LOG_NOISE_ERROR(message) LOG_ERROR("noise", message)

namespace filepunch {

// Noise Protocol constants
constexpr char NOISE_PROTOCOL_NAME[] = "Noise_XX_25519_ChaChaPoly_SHA256";

namespace {

void encode_nonce(uint64_t nonce, uint8_t iv[12]) {
    memset(iv, 0, 12);
    for (int i = 0; i < 8; ++i) {
        iv[4 + i] = static_cast<uint8_t>(nonce >> (8 * i));
    }
}

// Owns an EVP_PKEY / EVP_PKEY_CTX / EVP_CIPHER_CTX for the duration of one call
struct PkeyGuard {
    EVP_PKEY* key;
    explicit PkeyGuard(EVP_PKEY* k) : key(k) {}
    ~PkeyGuard() { EVP_PKEY_free(key); }
};

struct PkeyCtxGuard {
    EVP_PKEY_CTX* ctx;
    explicit PkeyCtxGuard(EVP_PKEY_CTX* c) : ctx(c) {}
    ~PkeyCtxGuard() { EVP_PKEY_CTX_free(ctx); }
};

struct CipherCtxGuard {
    EVP_CIPHER_CTX* ctx;
    CipherCtxGuard() : ctx(EVP_CIPHER_CTX_new()) {}
    ~CipherCtxGuard() { EVP_CIPHER_CTX_free(ctx); }
};

} // anonymous namespace

//=============================================================================
// NoiseCrypto Implementation
//=============================================================================

bool NoiseCrypto::generate_keypair(NoiseKey& private_key, NoiseKey& public_key) {
    if (!random_bytes(private_key.data(), NOISE_KEY_SIZE)) {
        return false;
    }
    return public_key_from_private(private_key, public_key);
}

bool NoiseCrypto::public_key_from_private(const NoiseKey& private_key, NoiseKey& public_key) {
    PkeyGuard pkey(EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr,
                                                private_key.data(), private_key.size()));
    if (!pkey.key) {
        LOG_NOISE_ERROR("Failed to load X25519 private key");
        return false;
    }

    size_t length = public_key.size();
    if (EVP_PKEY_get_raw_public_key(pkey.key, public_key.data(), &length) != 1 ||
        length != NOISE_KEY_SIZE) {
        LOG_NOISE_ERROR("Failed to derive X25519 public key");
        return false;
    }
    return true;
}

bool NoiseCrypto::dh(const NoiseKey& private_key, const NoiseKey& public_key, NoiseKey& shared_secret) {
    PkeyGuard local(EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr,
                                                 private_key.data(), private_key.size()));
    PkeyGuard remote(EVP_PKEY_new_raw_public_key(EVP_PKEY_X25519, nullptr,
                                                 public_key.data(), public_key.size()));
    if (!local.key || !remote.key) {
        return false;
    }

    PkeyCtxGuard ctx(EVP_PKEY_CTX_new(local.key, nullptr));
    if (!ctx.ctx || EVP_PKEY_derive_init(ctx.ctx) != 1 ||
        EVP_PKEY_derive_set_peer(ctx.ctx, remote.key) != 1) {
        return false;
    }

    size_t length = shared_secret.size();
    // Fails for low-order points (all-zero output)
    if (EVP_PKEY_derive(ctx.ctx, shared_secret.data(), &length) != 1 || length != NOISE_KEY_SIZE) {
        LOG_NOISE_WARN("X25519 key agreement failed");
        return false;
    }
    return true;
}

bool NoiseCrypto::encrypt(const NoiseKey& key, uint64_t nonce,
                          const std::vector<uint8_t>& plaintext,
                          const std::vector<uint8_t>& ad,
                          std::vector<uint8_t>& ciphertext) {
    CipherCtxGuard guard;
    if (!guard.ctx) return false;

    uint8_t iv[12];
    encode_nonce(nonce, iv);

    int length = 0;
    if (EVP_EncryptInit_ex(guard.ctx, EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(guard.ctx, EVP_CTRL_AEAD_SET_IVLEN, sizeof(iv), nullptr) != 1 ||
        EVP_EncryptInit_ex(guard.ctx, nullptr, nullptr, key.data(), iv) != 1) {
        return false;
    }

    if (!ad.empty() &&
        EVP_EncryptUpdate(guard.ctx, nullptr, &length, ad.data(), static_cast<int>(ad.size())) != 1) {
        return false;
    }

    std::vector<uint8_t> out(plaintext.size() + NOISE_TAG_SIZE);
    int written = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(guard.ctx, out.data(), &length,
                              plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
            return false;
        }
        written = length;
    }

    if (EVP_EncryptFinal_ex(guard.ctx, out.data() + written, &length) != 1 ||
        EVP_CIPHER_CTX_ctrl(guard.ctx, EVP_CTRL_AEAD_GET_TAG, NOISE_TAG_SIZE,
                            out.data() + plaintext.size()) != 1) {
        return false;
    }

    ciphertext = std::move(out);
    return true;
}

bool NoiseCrypto::decrypt(const NoiseKey& key, uint64_t nonce,
                          const std::vector<uint8_t>& ciphertext,
                          const std::vector<uint8_t>& ad,
                          std::vector<uint8_t>& plaintext) {
    if (ciphertext.size() < NOISE_TAG_SIZE) {
        return false;
    }

    CipherCtxGuard guard;
    if (!guard.ctx) return false;

    uint8_t iv[12];
    encode_nonce(nonce, iv);

    const size_t body_size = ciphertext.size() - NOISE_TAG_SIZE;
    int length = 0;
    if (EVP_DecryptInit_ex(guard.ctx, EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(guard.ctx, EVP_CTRL_AEAD_SET_IVLEN, sizeof(iv), nullptr) != 1 ||
        EVP_DecryptInit_ex(guard.ctx, nullptr, nullptr, key.data(), iv) != 1) {
        return false;
    }

    if (!ad.empty() &&
        EVP_DecryptUpdate(guard.ctx, nullptr, &length, ad.data(), static_cast<int>(ad.size())) != 1) {
        return false;
    }

    std::vector<uint8_t> out(body_size);
    if (body_size > 0 &&
        EVP_DecryptUpdate(guard.ctx, out.data(), &length,
                          ciphertext.data(), static_cast<int>(body_size)) != 1) {
        return false;
    }

    uint8_t tag[NOISE_TAG_SIZE];
    memcpy(tag, ciphertext.data() + body_size, NOISE_TAG_SIZE);
    if (EVP_CIPHER_CTX_ctrl(guard.ctx, EVP_CTRL_AEAD_SET_TAG, NOISE_TAG_SIZE, tag) != 1) {
        return false;
    }

    uint8_t final_block[16];
    if (EVP_DecryptFinal_ex(guard.ctx, final_block, &length) != 1) {
        // Authentication failure
        return false;
    }

    plaintext = std::move(out);
    return true;
}

NoiseHash NoiseCrypto::hash(const std::vector<uint8_t>& data) {
    NoiseHash result{};
    unsigned int length = 0;
    static const uint8_t empty = 0;
    EVP_Digest(data.empty() ? &empty : data.data(), data.size(), result.data(), &length, EVP_sha256(), nullptr);
    return result;
}

NoiseHash NoiseCrypto::hmac(const NoiseHash& key, const std::vector<uint8_t>& data) {
    NoiseHash result{};
    unsigned int length = 0;
    static const uint8_t empty = 0;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         data.empty() ? &empty : data.data(), data.size(), result.data(), &length);
    return result;
}

void NoiseCrypto::hkdf(const NoiseHash& chaining_key, const std::vector<uint8_t>& input_key_material,
                       NoiseHash& output1, NoiseHash& output2) {
    NoiseHash temp_key = hmac(chaining_key, input_key_material);

    output1 = hmac(temp_key, std::vector<uint8_t>{0x01});

    std::vector<uint8_t> second_input(output1.begin(), output1.end());
    second_input.push_back(0x02);
    output2 = hmac(temp_key, second_input);

    secure_memzero(temp_key.data(), temp_key.size());
}

void NoiseCrypto::secure_memzero(void* ptr, size_t size) {
    OPENSSL_cleanse(ptr, size);
}

bool NoiseCrypto::random_bytes(uint8_t* buffer, size_t size) {
    if (RAND_bytes(buffer, static_cast<int>(size)) != 1) {
        LOG_NOISE_ERROR("RAND_bytes failed");
        return false;
    }
    return true;
}

//=============================================================================
// NoiseCipherState Implementation
//=============================================================================

NoiseCipherState::NoiseCipherState() : nonce_(0), has_key_(false) {
    key_.fill(0);
}

NoiseCipherState::~NoiseCipherState() {
    NoiseCrypto::secure_memzero(key_.data(), key_.size());
}

void NoiseCipherState::initialize_key(const NoiseKey& key) {
    key_ = key;
    nonce_ = 0;
    has_key_ = true;
}

bool NoiseCipherState::encrypt_with_ad(const std::vector<uint8_t>& plaintext,
                                       const std::vector<uint8_t>& ad,
                                       std::vector<uint8_t>& ciphertext) {
    if (!has_key_) {
        ciphertext = plaintext;
        return true;
    }

    if (nonce_ == UINT64_MAX) {
        // Reserved nonce value, the key must be abandoned
        return false;
    }

    if (!NoiseCrypto::encrypt(key_, nonce_, plaintext, ad, ciphertext)) {
        return false;
    }
    nonce_++;
    return true;
}

bool NoiseCipherState::decrypt_with_ad(const std::vector<uint8_t>& ciphertext,
                                       const std::vector<uint8_t>& ad,
                                       std::vector<uint8_t>& plaintext) {
    if (!has_key_) {
        plaintext = ciphertext;
        return true;
    }

    if (!NoiseCrypto::decrypt(key_, nonce_, ciphertext, ad, plaintext)) {
        return false;
    }
    nonce_++;
    return true;
}

//=============================================================================
// NoiseSymmetricState Implementation
//=============================================================================

NoiseSymmetricState::NoiseSymmetricState() {
    ck_.fill(0);
    h_.fill(0);
}

NoiseSymmetricState::~NoiseSymmetricState() {
    NoiseCrypto::secure_memzero(ck_.data(), ck_.size());
    NoiseCrypto::secure_memzero(h_.data(), h_.size());
}

void NoiseSymmetricState::initialize(const std::string& protocol_name) {
    if (protocol_name.length() <= NOISE_HASH_SIZE) {
        h_.fill(0);
        std::memcpy(h_.data(), protocol_name.c_str(), protocol_name.length());
    } else {
        h_ = NoiseCrypto::hash(std::vector<uint8_t>(protocol_name.begin(), protocol_name.end()));
    }
    ck_ = h_;
    cipher_state_ = NoiseCipherState();
}

void NoiseSymmetricState::mix_key(const std::vector<uint8_t>& input_key_material) {
    NoiseHash temp_k;
    NoiseCrypto::hkdf(ck_, input_key_material, ck_, temp_k);

    NoiseKey key;
    std::memcpy(key.data(), temp_k.data(), NOISE_KEY_SIZE);
    cipher_state_.initialize_key(key);

    NoiseCrypto::secure_memzero(temp_k.data(), temp_k.size());
    NoiseCrypto::secure_memzero(key.data(), key.size());
}

void NoiseSymmetricState::mix_hash(const std::vector<uint8_t>& data) {
    std::vector<uint8_t> hash_input(h_.begin(), h_.end());
    hash_input.insert(hash_input.end(), data.begin(), data.end());
    h_ = NoiseCrypto::hash(hash_input);
}

bool NoiseSymmetricState::encrypt_and_hash(const std::vector<uint8_t>& plaintext,
                                           std::vector<uint8_t>& ciphertext) {
    if (!cipher_state_.encrypt_with_ad(plaintext, std::vector<uint8_t>(h_.begin(), h_.end()), ciphertext)) {
        return false;
    }
    mix_hash(ciphertext);
    return true;
}

bool NoiseSymmetricState::decrypt_and_hash(const std::vector<uint8_t>& ciphertext,
                                           std::vector<uint8_t>& plaintext) {
    if (!cipher_state_.decrypt_with_ad(ciphertext, std::vector<uint8_t>(h_.begin(), h_.end()), plaintext)) {
        return false;
    }
    mix_hash(ciphertext);
    return true;
}

std::pair<NoiseCipherState, NoiseCipherState> NoiseSymmetricState::split() {
    NoiseHash temp_k1;
    NoiseHash temp_k2;
    NoiseCrypto::hkdf(ck_, {}, temp_k1, temp_k2);

    NoiseCipherState c1, c2;
    NoiseKey key1, key2;
    std::memcpy(key1.data(), temp_k1.data(), NOISE_KEY_SIZE);
    std::memcpy(key2.data(), temp_k2.data(), NOISE_KEY_SIZE);
    c1.initialize_key(key1);
    c2.initialize_key(key2);

    NoiseCrypto::secure_memzero(temp_k1.data(), temp_k1.size());
    NoiseCrypto::secure_memzero(temp_k2.data(), temp_k2.size());
    NoiseCrypto::secure_memzero(key1.data(), key1.size());
    NoiseCrypto::secure_memzero(key2.data(), key2.size());

    return std::make_pair(c1, c2);
}

//=============================================================================
// NoiseHandshake Implementation
//=============================================================================

NoiseHandshake::NoiseHandshake() : role_(NoiseRole::INITIATOR), state_(NoiseHandshakeState::UNINITIALIZED) {
    s_.fill(0);
    s_pub_.fill(0);
    e_.fill(0);
    e_pub_.fill(0);
    rs_.fill(0);
    re_.fill(0);
}

NoiseHandshake::~NoiseHandshake() {
    NoiseCrypto::secure_memzero(s_.data(), s_.size());
    NoiseCrypto::secure_memzero(e_.data(), e_.size());
}

bool NoiseHandshake::initialize(NoiseRole role, const NoiseKey& static_private_key,
                                const std::vector<uint8_t>& prologue) {
    role_ = role;
    s_ = static_private_key;

    if (!NoiseCrypto::public_key_from_private(s_, s_pub_)) {
        fail_handshake();
        return false;
    }

    symmetric_state_.initialize(NOISE_PROTOCOL_NAME);
    symmetric_state_.mix_hash(prologue);

    state_ = role == NoiseRole::INITIATOR ? NoiseHandshakeState::WRITE_MESSAGE_1
                                          : NoiseHandshakeState::READ_MESSAGE_1;

    LOG_NOISE_DEBUG("Initialized Noise handshake as " << (role == NoiseRole::INITIATOR ? "initiator" : "responder"));
    return true;
}

bool NoiseHandshake::is_my_turn_to_write() const {
    return state_ == NoiseHandshakeState::WRITE_MESSAGE_1 ||
           state_ == NoiseHandshakeState::WRITE_MESSAGE_2 ||
           state_ == NoiseHandshakeState::WRITE_MESSAGE_3;
}

bool NoiseHandshake::mix_dh(const NoiseKey& private_key, const NoiseKey& public_key) {
    NoiseKey shared;
    if (!NoiseCrypto::dh(private_key, public_key, shared)) {
        return false;
    }
    symmetric_state_.mix_key(std::vector<uint8_t>(shared.begin(), shared.end()));
    NoiseCrypto::secure_memzero(shared.data(), shared.size());
    return true;
}

bool NoiseHandshake::write_message(const std::vector<uint8_t>& payload, std::vector<uint8_t>& message) {
    message.clear();

    auto write_ephemeral = [&]() {
        if (!NoiseCrypto::generate_keypair(e_, e_pub_)) return false;
        message.insert(message.end(), e_pub_.begin(), e_pub_.end());
        symmetric_state_.mix_hash(std::vector<uint8_t>(e_pub_.begin(), e_pub_.end()));
        return true;
    };

    auto write_encrypted = [&](const std::vector<uint8_t>& plaintext) {
        std::vector<uint8_t> sealed;
        if (!symmetric_state_.encrypt_and_hash(plaintext, sealed)) return false;
        message.insert(message.end(), sealed.begin(), sealed.end());
        return true;
    };

    const std::vector<uint8_t> static_public(s_pub_.begin(), s_pub_.end());

    bool ok = false;
    switch (state_) {
        case NoiseHandshakeState::WRITE_MESSAGE_1:
            // -> e
            ok = write_ephemeral();
            break;

        case NoiseHandshakeState::WRITE_MESSAGE_2:
            // <- e, ee, s, es
            ok = write_ephemeral() &&
                 mix_dh(e_, re_) &&
                 write_encrypted(static_public) &&
                 mix_dh(s_, re_);
            break;

        case NoiseHandshakeState::WRITE_MESSAGE_3:
            // -> s, se
            ok = write_encrypted(static_public) &&
                 mix_dh(s_, re_);
            break;

        default:
            LOG_NOISE_ERROR("Invalid state for write_message: " << static_cast<int>(state_));
            break;
    }

    if (!ok || !write_encrypted(payload)) {
        fail_handshake();
        message.clear();
        return false;
    }

    advance_state();
    LOG_NOISE_DEBUG("Wrote handshake message (" << message.size() << " bytes), new state: " << static_cast<int>(state_));
    return true;
}

bool NoiseHandshake::read_message(const std::vector<uint8_t>& message, std::vector<uint8_t>& payload) {
    size_t offset = 0;
    const size_t encrypted_key_size = NOISE_KEY_SIZE + NOISE_TAG_SIZE;

    auto take = [&](size_t count, std::vector<uint8_t>& out) {
        if (message.size() < offset + count) {
            return false;
        }
        out.assign(message.begin() + offset, message.begin() + offset + count);
        offset += count;
        return true;
    };

    auto read_remote_key = [&](NoiseKey& key) {
        std::vector<uint8_t> raw;
        if (!take(NOISE_KEY_SIZE, raw)) return false;
        std::memcpy(key.data(), raw.data(), NOISE_KEY_SIZE);
        symmetric_state_.mix_hash(raw);
        return true;
    };

    auto read_encrypted_key = [&](NoiseKey& key) {
        std::vector<uint8_t> sealed;
        std::vector<uint8_t> opened;
        if (!take(encrypted_key_size, sealed)) return false;
        if (!symmetric_state_.decrypt_and_hash(sealed, opened) || opened.size() != NOISE_KEY_SIZE) return false;
        std::memcpy(key.data(), opened.data(), NOISE_KEY_SIZE);
        return true;
    };

    bool ok = false;
    switch (state_) {
        case NoiseHandshakeState::READ_MESSAGE_1:
            // -> e
            ok = read_remote_key(re_);
            break;

        case NoiseHandshakeState::READ_MESSAGE_2:
            // <- e, ee, s, es
            ok = read_remote_key(re_) &&
                 mix_dh(e_, re_) &&
                 read_encrypted_key(rs_) &&
                 mix_dh(e_, rs_);
            break;

        case NoiseHandshakeState::READ_MESSAGE_3:
            // -> s, se
            ok = read_encrypted_key(rs_) &&
                 mix_dh(e_, rs_);
            break;

        default:
            LOG_NOISE_ERROR("Invalid state for read_message: " << static_cast<int>(state_));
            break;
    }

    if (ok) {
        std::vector<uint8_t> rest(message.begin() + offset, message.end());
        ok = symmetric_state_.decrypt_and_hash(rest, payload);
    }

    if (!ok) {
        LOG_NOISE_WARN("Rejected handshake message of " << message.size() << " bytes in state " << static_cast<int>(state_));
        fail_handshake();
        return false;
    }

    advance_state();
    LOG_NOISE_DEBUG("Read handshake message, new state: " << static_cast<int>(state_));
    return true;
}

std::pair<NoiseCipherState, NoiseCipherState> NoiseHandshake::get_cipher_states() {
    auto ciphers = symmetric_state_.split();
    if (role_ == NoiseRole::INITIATOR) {
        return ciphers;
    }
    return std::make_pair(ciphers.second, ciphers.first);
}

void NoiseHandshake::advance_state() {
    switch (state_) {
        case NoiseHandshakeState::WRITE_MESSAGE_1: state_ = NoiseHandshakeState::READ_MESSAGE_2; break;
        case NoiseHandshakeState::READ_MESSAGE_1:  state_ = NoiseHandshakeState::WRITE_MESSAGE_2; break;
        case NoiseHandshakeState::WRITE_MESSAGE_2: state_ = NoiseHandshakeState::READ_MESSAGE_3; break;
        case NoiseHandshakeState::READ_MESSAGE_2:  state_ = NoiseHandshakeState::WRITE_MESSAGE_3; break;
        case NoiseHandshakeState::WRITE_MESSAGE_3:
        case NoiseHandshakeState::READ_MESSAGE_3:  state_ = NoiseHandshakeState::COMPLETED; break;
        default: break;
    }

    if (state_ == NoiseHandshakeState::COMPLETED) {
        NoiseCrypto::secure_memzero(e_.data(), e_.size());
    }
}

void NoiseHandshake::fail_handshake() {
    state_ = NoiseHandshakeState::FAILED;
    NoiseCrypto::secure_memzero(e_.data(), e_.size());
}

//=============================================================================
// Utility Functions
//=============================================================================

namespace noise_utils {

NoiseKey generate_static_keypair() {
    NoiseKey private_key{};
    NoiseKey public_key{};
    if (!NoiseCrypto::generate_keypair(private_key, public_key)) {
        LOG_NOISE_ERROR("Failed to generate static keypair");
    }
    return private_key;
}

std::string key_to_hex(const NoiseKey& key) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint8_t byte : key) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

bool hex_to_key(const std::string& hex, NoiseKey& key) {
    if (hex.length() != NOISE_KEY_SIZE * 2 ||
        hex.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos) {
        return false;
    }

    for (size_t i = 0; i < NOISE_KEY_SIZE; ++i) {
        key[i] = static_cast<uint8_t>(std::stoul(hex.substr(i * 2, 2), nullptr, 16));
    }
    return true;
}

std::string fingerprint(const NoiseKey& static_private_key) {
    NoiseKey public_key{};
    if (!NoiseCrypto::public_key_from_private(static_private_key, public_key)) {
        return "";
    }
    return key_to_hex(public_key).substr(0, 16);
}

std::string get_protocol_name() {
    return NOISE_PROTOCOL_NAME;
}

bool validate_message_size(size_t size) {
    return size <= NOISE_MAX_MESSAGE_SIZE;
}

} // namespace noise_utils

} // namespace filepunch
