/**
 * @file address.cpp
 * @brief Hashed address derivation.
 *
 * SHA-256 comes from OpenSSL's EVP interface. The one-shot EVP_Digest call
 * allocates its own context, so derivation is safe to call concurrently.
 */

#include <wordpack/address.hpp>

#include <openssl/evp.h>

namespace wordpack {

Error digest_slot(const std::uint8_t* bytes, std::size_t num_bytes, Slot& out) noexcept {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(bytes, num_bytes, digest, &digest_len, EVP_sha256(), nullptr) != 1) {
        return Error::AddressDerivation;
    }
    if (digest_len != Slot::NUM_BYTES) {
        return Error::AddressDerivation;
    }
    out.from_bytes(digest, digest_len);
    return Error::Ok;
}

Error HashedScheme::derive(const base_type& key, Layout<address_type>& out) noexcept {
    Slot length_slot;
    Error status = digest_slot(reinterpret_cast<const std::uint8_t*>(key.data()), key.size(),
                               length_slot);
    if (status != Error::Ok) {
        return status;
    }

    std::uint8_t length_bytes[Slot::NUM_BYTES];
    length_slot.to_bytes(length_bytes);
    Slot data_slot;
    status = digest_slot(length_bytes, sizeof(length_bytes), data_slot);
    if (status != Error::Ok) {
        return status;
    }

    out.length_address = length_slot;
    out.data_base = data_slot;
    return Error::Ok;
}

} // namespace wordpack
