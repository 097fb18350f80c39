#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace ncmunpack
{

using bytes_t = std::vector<std::uint8_t>;
using aes_key_t = std::array<std::uint8_t, 16>;

// unwraps the key block
extern const aes_key_t aes_core_key;
// unwraps the metadata block
extern const aes_key_t aes_modify_key;

void xor_bytes(bytes_t& data, std::uint8_t mask) noexcept;

// AES-128-ECB with PKCS#7 padding. Throws error{decrypt_failed} when the
// ciphertext is not block aligned or the padding is bad.
bytes_t aes128_ecb_decrypt(const aes_key_t& key, const std::uint8_t* in, std::size_t in_len);

inline bytes_t aes128_ecb_decrypt(const aes_key_t& key, const bytes_t& in)
{
    return aes128_ecb_decrypt(key, in.data(), in.size());
}

// Strict padded base64 (standard alphabet, no line breaks).
// Throws std::invalid_argument on malformed input.
bytes_t base64_decode(std::string_view in);

} // namespace ncmunpack
