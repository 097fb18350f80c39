#include "keybox.h"

#include <algorithm>
#include <stdexcept>

namespace ncmunpack
{

key_box_t build_key_box(const std::uint8_t* key, std::size_t key_len)
{
    if(key == nullptr || key_len == 0)
        throw std::invalid_argument("[build_key_box]: empty key");

    key_box_t box;
    for(std::size_t i = 0; i < box.size(); ++i)
        box[i] = static_cast<std::uint8_t>(i);

    std::uint8_t last_byte = 0;
    std::size_t key_offset = 0;

    for(std::size_t i = 0; i < box.size(); ++i)
    {
        auto swap = box[i];
        std::uint8_t c = (swap + last_byte + key[key_offset++]) & 0xff;
        if(key_offset >= key_len)
            key_offset = 0;
        box[i] = box[c];
        box[c] = swap;
        last_byte = c;
    }

    return box;
}

void apply_keystream(const key_box_t& box, std::uint8_t* buf, std::size_t len, std::uint64_t offset) noexcept
{
    for(std::size_t i = 0; i < len; ++i)
        buf[i] ^= keystream_byte(box, offset + i);
}

std::vector<std::uint8_t> decrypt_audio(const std::vector<std::uint8_t>& ciphertext, const key_box_t& box)
{
    std::vector<std::uint8_t> plain{ciphertext};
    for(std::size_t pos = 0; pos < plain.size(); pos += audio_window_size)
    {
        auto n = std::min(audio_window_size, plain.size() - pos);
        apply_keystream(box, plain.data() + pos, n, pos);
    }

    return plain;
}

} // namespace ncmunpack
