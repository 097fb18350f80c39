#pragma once

#include <cstdint>
#include <filesystem>
#include <string_view>
#include <vector>

#include "metadata.h"

namespace ncmunpack
{

namespace fs = std::filesystem;

// "image/jpeg", "image/png" or empty when the magic is unknown.
std::string_view detect_mime(const std::uint8_t* data, std::size_t len) noexcept;

// Writes title, album, artists and the front cover into a decrypted
// .flac or .mp3 file. Returns false when TagLib cannot open the file or the
// extension is not supported.
bool write_tag(const music_info& info, const std::vector<std::uint8_t>& cover, const fs::path& audio_path);

} // namespace ncmunpack
