#pragma once

#include <memory>
#include <string_view>

namespace tokenseal {

class SealParameterSpec;
class Salt;
class DerivedKey;

// PBKDF2 with the HMAC digest of the parameter spec, producing a key sized for its
// cipher.
class KeyDerivator {
public:
    explicit KeyDerivator(const SealParameterSpec& parameterSpec);

    // Uses the iteration count of the parameter spec.
    [[nodiscard]] std::unique_ptr<DerivedKey> derive(
        std::string_view password,
        const Salt& salt) const;

    [[nodiscard]] std::unique_ptr<DerivedKey> derive(
        std::string_view password,
        const Salt& salt,
        int iterations) const;

private:
    const SealParameterSpec& parameterSpec_;
};

}
