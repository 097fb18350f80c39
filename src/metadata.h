#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ncmunpack
{

struct artist_t
{
    std::string name;
    std::uint64_t id;

    bool operator==(const artist_t& rhs) const { return name == rhs.name && id == rhs.id; }
};

// The record carried by the metadata block, "musicName" etc. on the wire.
struct music_info
{
    std::string name;
    std::uint64_t id;
    // album name as stored by the client
    std::string album;
    std::vector<artist_t> artists;
    std::uint64_t bitrate;
    std::uint64_t duration;
    // "mp3", "flac", ...
    std::string format;
    std::optional<std::uint64_t> mv_id;
    std::optional<std::vector<std::string>> alias;

    bool operator==(const music_info& rhs) const;
    bool operator!=(const music_info& rhs) const { return !(*this == rhs); }
};

// Throws error{info_decode_error} when the text is not JSON or a required
// member is missing or mistyped.
music_info parse_music_info(const std::string& json);

std::vector<std::string> artist_names(const music_info& info);

} // namespace ncmunpack
