#include "cohort/crypto/signature.hpp"
#include "cohort/utils/logging.hpp"
#include <sodium.h>
#include <stdexcept>
#include <vector>

namespace cohort {

namespace {

std::string toHex(const unsigned char* data, size_t length) {
    std::string hex(length * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), data, length);
    hex.pop_back();
    return hex;
}

bool fromHex(const std::string& hex, std::vector<unsigned char>& out) {
    size_t written = 0;
    if (sodium_hex2bin(out.data(), out.size(), hex.c_str(), hex.size(),
                       nullptr, &written, nullptr) != 0) {
        return false;
    }
    return written == out.size();
}

} // namespace

void SignatureUtils::ensureInitialized() {
    if (sodium_init() < 0) {
        throw std::runtime_error("Failed to initialize libsodium");
    }
}

std::string SignatureUtils::createSignature(const std::string& message, const std::string& private_key) {
    ensureInitialized();

    if (private_key.length() != crypto_sign_SECRETKEYBYTES * 2) {
        throw std::runtime_error("Invalid private key length");
    }

    std::vector<unsigned char> sk_bytes(crypto_sign_SECRETKEYBYTES);
    if (!fromHex(private_key, sk_bytes)) {
        throw std::runtime_error("Private key is not valid hex");
    }

    std::vector<unsigned char> signature(crypto_sign_BYTES);
    unsigned long long signature_len = 0;
    int rc = crypto_sign_detached(
        signature.data(), &signature_len,
        reinterpret_cast<const unsigned char*>(message.data()), message.size(),
        sk_bytes.data());
    sodium_memzero(sk_bytes.data(), sk_bytes.size());

    if (rc != 0) {
        throw std::runtime_error("Failed to create signature");
    }

    return toHex(signature.data(), signature.size());
}

bool SignatureUtils::verifySignature(const std::string& message, const std::string& signature, const std::string& public_key) {
    if (sodium_init() < 0) {
        COHORT_ERROR("Failed to initialize libsodium for signature verification");
        return false;
    }

    if (public_key.length() != crypto_sign_PUBLICKEYBYTES * 2) {
        COHORT_ERROR("Invalid public key length: " << public_key.length());
        return false;
    }

    if (signature.length() != crypto_sign_BYTES * 2) {
        COHORT_ERROR("Invalid signature length: " << signature.length());
        return false;
    }

    std::vector<unsigned char> pk_bytes(crypto_sign_PUBLICKEYBYTES);
    std::vector<unsigned char> sig_bytes(crypto_sign_BYTES);
    if (!fromHex(public_key, pk_bytes) || !fromHex(signature, sig_bytes)) {
        COHORT_ERROR("Signature or public key is not valid hex");
        return false;
    }

    int result = crypto_sign_verify_detached(
        sig_bytes.data(),
        reinterpret_cast<const unsigned char*>(message.data()), message.size(),
        pk_bytes.data());

    return result == 0;
}

std::pair<std::string, std::string> SignatureUtils::generateKeyPair() {
    ensureInitialized();

    std::vector<unsigned char> pk(crypto_sign_PUBLICKEYBYTES);
    std::vector<unsigned char> sk(crypto_sign_SECRETKEYBYTES);
    crypto_sign_keypair(pk.data(), sk.data());

    auto keypair = std::make_pair(toHex(pk.data(), pk.size()),
                                  toHex(sk.data(), sk.size()));
    sodium_memzero(sk.data(), sk.size());

    COHORT_DEBUG("Generated new Ed25519 keypair");
    return keypair;
}

} // namespace cohort
