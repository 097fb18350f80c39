#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace ncmunpack
{

using key_box_t = std::array<std::uint8_t, 256>;

// Size of the windows the audio payload is deciphered in.
constexpr std::size_t audio_window_size = 0x8000;

// Scrambles the identity permutation with the raw audio key (RC4 KSA).
// Throws std::invalid_argument for an empty key.
key_box_t build_key_box(const std::uint8_t* key, std::size_t key_len);

inline key_box_t build_key_box(const std::vector<std::uint8_t>& key)
{
    return build_key_box(key.data(), key.size());
}

// Keystream byte for the payload relative position p.
inline std::uint8_t keystream_byte(const key_box_t& box, std::uint64_t p) noexcept
{
    std::size_t j = (p + 1) & 0xff;
    std::size_t k = box[j];
    return box[(k + box[(k + j) & 0xff]) & 0xff];
}

// XORs a window in place; offset is the payload relative position of buf[0].
void apply_keystream(const key_box_t& box, std::uint8_t* buf, std::size_t len, std::uint64_t offset) noexcept;

std::vector<std::uint8_t> decrypt_audio(const std::vector<std::uint8_t>& ciphertext, const key_box_t& box);

} // namespace ncmunpack
