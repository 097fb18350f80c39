#include "container.h"
#include "error.h"
#include "keybox.h"
#include "utf8.h"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace ncmunpack
{

namespace
{

// "CTENFDAM" read as a native 64-bit integer
constexpr std::uint64_t ncm_magic = 0x4d414446'4e455443;
constexpr std::size_t header_size = 10;
// crc32 of the cover frame + 5 unused bytes
constexpr std::streamoff gap_size = 9;

constexpr std::uint8_t key_mask = 0x64;
constexpr std::uint8_t info_mask = 0x63;
// "163 key(Don't modify):"
constexpr std::size_t info_tag_size = 22;
// "music:"
constexpr std::size_t info_prefix_size = 6;
constexpr std::size_t key_prefix_size = 17;

} // namespace

container::container(std::unique_ptr<std::istream> is) :
    dp_is{std::move(is)}
{
    if(!dp_is)
        throw std::invalid_argument("[container]: null stream");
    prepare();
}

void container::prepare()
{
    char header[header_size]{};
    dp_is->read(header, sizeof(header));
    if(static_cast<std::size_t>(dp_is->gcount()) != sizeof(header))
        throw error(failure_t::invalid_file_type);

    std::uint64_t magic = 0;
    std::memcpy(&magic, header, sizeof(magic));
    if(magic != ncm_magic)
        throw error(failure_t::invalid_file_type);

    auto read_length = [this](section& sec, failure_t on_short) {
        std::uint32_t ulen = 0;
        dp_is->read(reinterpret_cast<char*>(&ulen), sizeof(ulen));
        if(static_cast<std::size_t>(dp_is->gcount()) != sizeof(ulen))
            throw error(on_short);

        auto pos = dp_is->tellg();
        if(pos < 0)
            throw error(failure_t::io_error, "tellg");
        sec.start = static_cast<std::uint64_t>(static_cast<std::streamoff>(pos));
        sec.length = ulen;
    };

    read_length(d_key, failure_t::invalid_key_length);
    dp_is->seekg(static_cast<std::streamoff>(d_key.length), std::ios::cur);

    read_length(d_info, failure_t::invalid_info_length);
    dp_is->seekg(static_cast<std::streamoff>(d_info.length) + gap_size, std::ios::cur);

    // the image itself stays unread until image() or data()
    read_length(d_image, failure_t::invalid_image_length);
}

std::uint64_t container::source_size()
{
    dp_is->clear();
    dp_is->seekg(0, std::ios::end);
    auto end = dp_is->tellg();
    if(!*dp_is || end < 0)
        throw error(failure_t::io_error, "cannot determine source size");
    return static_cast<std::uint64_t>(static_cast<std::streamoff>(end));
}

void container::seek_to(std::uint64_t pos)
{
    dp_is->clear();
    dp_is->seekg(static_cast<std::streamoff>(pos), std::ios::beg);
    if(!*dp_is)
        throw error(failure_t::io_error, "seek failed");
}

bytes_t container::read_section(const section& sec)
{
    auto size = source_size();
    if(sec.start > size || sec.length > size - sec.start)
        throw error(failure_t::io_error, "block runs past the end of the source");

    seek_to(sec.start);
    bytes_t buf(static_cast<std::size_t>(sec.length));
    dp_is->read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
    if(static_cast<std::uint64_t>(dp_is->gcount()) != sec.length)
        throw error(failure_t::io_error, "short read");

    return buf;
}

bytes_t container::key()
{
    auto key_data = read_section(d_key);
    xor_bytes(key_data, key_mask);

    auto de_key_data = aes128_ecb_decrypt(aes_core_key, key_data);
    if(de_key_data.size() < key_prefix_size)
        throw error(failure_t::decrypt_failed, "key block too short");

    return bytes_t(de_key_data.begin() + key_prefix_size, de_key_data.end());
}

std::string container::info_json()
{
    auto modify_data = read_section(d_info);
    xor_bytes(modify_data, info_mask);
    if(modify_data.size() < info_tag_size)
        throw error(failure_t::info_decode_error, "metadata block too short");

    bytes_t data;
    try
    {
        data = base64_decode(std::string_view{reinterpret_cast<const char*>(modify_data.data()) + info_tag_size,
                                              modify_data.size() - info_tag_size});
    }
    catch(const std::invalid_argument& e)
    {
        throw error(failure_t::info_decode_error, e.what());
    }

    bytes_t dedata;
    try
    {
        dedata = aes128_ecb_decrypt(aes_modify_key, data);
    }
    catch(const error& e)
    {
        throw error(failure_t::info_decode_error, e.what());
    }

    if(dedata.size() < info_prefix_size)
        throw error(failure_t::info_decode_error, "metadata too short");
    if(!is_valid_utf8(dedata.data() + info_prefix_size, dedata.size() - info_prefix_size))
        throw error(failure_t::info_decode_error, "metadata is not valid utf-8");

    return std::string(dedata.begin() + info_prefix_size, dedata.end());
}

music_info container::info()
{
    return parse_music_info(info_json());
}

bytes_t container::image()
{
    return read_section(d_image);
}

bytes_t container::data()
{
    auto size = source_size();
    auto start = audio_offset();
    if(start > size)
        throw error(failure_t::io_error, "audio offset past the end of the source");

    auto audio = read_section({start, size - start});

    auto raw_key = key();
    if(raw_key.empty())
        throw error(failure_t::decrypt_failed, "empty audio key");

    return decrypt_audio(audio, build_key_box(raw_key));
}

std::uint64_t container::dump(std::ostream& os)
{
    auto raw_key = key();
    if(raw_key.empty())
        throw error(failure_t::decrypt_failed, "empty audio key");
    auto box = build_key_box(raw_key);

    auto size = source_size();
    auto start = audio_offset();
    if(start > size)
        throw error(failure_t::io_error, "audio offset past the end of the source");
    seek_to(start);

    std::vector<std::uint8_t> buffer(audio_window_size);
    auto pbuf = reinterpret_cast<char*>(buffer.data());
    std::uint64_t pos = 0;
    std::uint64_t remaining = size - start;

    while(remaining > 0)
    {
        auto n = static_cast<std::streamsize>(std::min<std::uint64_t>(remaining, buffer.size()));
        dp_is->read(pbuf, n);
        if(dp_is->gcount() != n)
            throw error(failure_t::io_error, "short read");

        apply_keystream(box, buffer.data(), static_cast<std::size_t>(n), pos);
        os.write(pbuf, n);
        if(!os)
            throw error(failure_t::io_error, "write failed");

        pos += static_cast<std::uint64_t>(n);
        remaining -= static_cast<std::uint64_t>(n);
    }

    os.flush();
    return pos;
}

} // namespace ncmunpack
