#include "crypto.h"
#include "error.h"

#include <limits>
#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace ncmunpack
{

const aes_key_t aes_core_key = {0x68, 0x7A, 0x48, 0x52, 0x41, 0x6D, 0x73, 0x6F, 0x35, 0x6B, 0x49, 0x6E, 0x62,
                                0x61, 0x78, 0x57};
const aes_key_t aes_modify_key = {0x23, 0x31, 0x34, 0x6C, 0x6A, 0x6B, 0x5F, 0x21, 0x5C, 0x5D, 0x26, 0x30, 0x55,
                                  0x3C, 0x27, 0x28};

namespace
{

struct cipher_ctx_deleter
{
    void operator()(EVP_CIPHER_CTX* x) const noexcept { EVP_CIPHER_CTX_free(x); }
};

using cipher_ctx_ptr = std::unique_ptr<EVP_CIPHER_CTX, cipher_ctx_deleter>;

bool is_base64_char(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
}

// Caller guarantees is_base64_char(c).
unsigned base64_value(char c) noexcept
{
    if(c >= 'A' && c <= 'Z')
        return static_cast<unsigned>(c - 'A');
    if(c >= 'a' && c <= 'z')
        return static_cast<unsigned>(c - 'a' + 26);
    if(c >= '0' && c <= '9')
        return static_cast<unsigned>(c - '0' + 52);
    return c == '+' ? 62u : 63u;
}

} // namespace

void xor_bytes(bytes_t& data, std::uint8_t mask) noexcept
{
    for(auto& b : data)
        b ^= mask;
}

bytes_t aes128_ecb_decrypt(const aes_key_t& key, const std::uint8_t* in, std::size_t in_len)
{
    if(in_len == 0 || in_len % 16 != 0)
        throw error(failure_t::decrypt_failed, "ciphertext is not block aligned");
    if(in_len > static_cast<std::size_t>(std::numeric_limits<int>::max()))
        throw error(failure_t::decrypt_failed, "ciphertext too long");

    cipher_ctx_ptr x{EVP_CIPHER_CTX_new()};
    if(!x)
        throw error(failure_t::decrypt_failed, "EVP_CIPHER_CTX_new");

    if(!EVP_DecryptInit_ex(x.get(), EVP_aes_128_ecb(), nullptr, key.data(), nullptr))
        throw error(failure_t::decrypt_failed, "EVP_DecryptInit_ex");
    EVP_CIPHER_CTX_set_padding(x.get(), 1);

    bytes_t out(in_len + 16);
    int out_len = 0;
    int temp = 0;

    if(!EVP_DecryptUpdate(x.get(), out.data(), &out_len, in, static_cast<int>(in_len)))
        throw error(failure_t::decrypt_failed, "EVP_DecryptUpdate");

    if(!EVP_DecryptFinal_ex(x.get(), out.data() + out_len, &temp))
        throw error(failure_t::decrypt_failed, "EVP_DecryptFinal_ex");

    out.resize(static_cast<std::size_t>(out_len + temp));
    return out;
}

bytes_t base64_decode(std::string_view in)
{
    if(in.size() % 4 != 0)
        throw std::invalid_argument("base64 length is not a multiple of 4");
    if(in.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()))
        throw std::invalid_argument("base64 input too long");

    std::size_t padding = 0;
    for(std::size_t i = 0; i < in.size(); ++i)
    {
        if(in[i] == '=')
        {
            // only the last two characters may be padding
            if(i + 2 < in.size())
                throw std::invalid_argument("misplaced base64 padding");
            ++padding;
        }
        else if(padding != 0 || !is_base64_char(in[i]))
            throw std::invalid_argument("invalid base64 character");
    }

    if(in.empty())
        return {};

    // the bits of the last symbol that fall past the final byte must be zero
    if(padding != 0)
    {
        unsigned unused_mask = padding == 2 ? 0x0f : 0x03;
        if(base64_value(in[in.size() - padding - 1]) & unused_mask)
            throw std::invalid_argument("non-canonical final base64 symbol");
    }

    bytes_t out(in.size() / 4 * 3);
    auto size = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(in.data()),
                                static_cast<int>(in.size()));
    if(size < 0)
        throw std::invalid_argument("EVP_DecodeBlock");

    // EVP_DecodeBlock emits the padding positions as zero bytes
    out.resize(static_cast<std::size_t>(size) - padding);
    return out;
}

} // namespace ncmunpack
