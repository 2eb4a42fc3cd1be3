#pragma once
#include <string>
#include <utility>

namespace cohort {

// Ed25519 detached signatures over audit records. Keys and signatures are
// lowercase hex strings.
class SignatureUtils {
public:
    static std::string createSignature(const std::string& message, const std::string& private_key);
    static bool verifySignature(const std::string& message, const std::string& signature, const std::string& public_key);

    // Returns (public_key, private_key)
    static std::pair<std::string, std::string> generateKeyPair();

private:
    static void ensureInitialized();
};

} // namespace cohort
