#pragma once

#include <cstdint>
#include <fstream>
#include <istream>
#include <memory>
#include <ostream>
#include <string>

#include "crypto.h"
#include "metadata.h"

namespace ncmunpack
{

// Absolute position and size of one block inside the container.
struct section
{
    std::uint64_t start{0};
    std::uint64_t length{0};
};

/*
 * An opened NCM container. The constructor validates the magic and indexes
 * the key, metadata and image blocks; the audio payload runs from the end of
 * the image block to the end of the source.
 *
 * Every accessor seeks the owned stream, so one container must not be used
 * from several threads at once.
 */
class container
{
private:
    std::unique_ptr<std::istream> dp_is;
    section d_key;
    section d_info;
    section d_image;

private:
    void prepare();
    std::uint64_t source_size();
    void seek_to(std::uint64_t pos);
    bytes_t read_section(const section& sec);

public:
    // Throws error{invalid_file_type, invalid_*_length} on a malformed header.
    explicit container(std::unique_ptr<std::istream> is);

    explicit container(std::ifstream&& is) :
        container{std::make_unique<std::ifstream>(std::move(is))}
    {}

    container(const container&) = delete;
    container& operator=(const container&) = delete;
    container(container&&) = default;
    container& operator=(container&&) = default;

    const section& key_section() const noexcept { return d_key; }
    const section& info_section() const noexcept { return d_info; }
    const section& image_section() const noexcept { return d_image; }
    std::uint64_t audio_offset() const noexcept { return d_image.start + d_image.length; }

    // The raw audio key (RC4 key) unwrapped from the key block.
    bytes_t key();

    // Decrypted metadata text with the "music:" tag stripped.
    std::string info_json();

    music_info info();

    // Cover image bytes, verbatim. May be empty.
    bytes_t image();

    // Whole decrypted audio payload.
    bytes_t data();

    // Same bytes as data(), written window by window. Returns the byte count.
    std::uint64_t dump(std::ostream& os);
};

} // namespace ncmunpack
