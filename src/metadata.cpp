#include "metadata.h"
#include "error.h"

#include <memory>

#include <json/json.h>

namespace ncmunpack
{

namespace
{

const Json::Value& require(const Json::Value& root, const char* key)
{
    if(!root.isMember(key))
        throw error(failure_t::info_decode_error, std::string{"missing field \""} + key + "\"");
    return root[key];
}

std::string as_string(const Json::Value& v, const char* key)
{
    if(!v.isString())
        throw error(failure_t::info_decode_error, std::string{"field \""} + key + "\" is not a string");
    return v.asString();
}

std::uint64_t as_uint64(const Json::Value& v, const char* key)
{
    // integral doubles such as 1.0 or 9.2e5 are not accepted
    if((v.type() != Json::uintValue && v.type() != Json::intValue) || !v.isUInt64())
        throw error(failure_t::info_decode_error, std::string{"field \""} + key + "\" is not an unsigned integer");
    return v.asUInt64();
}

} // namespace

bool music_info::operator==(const music_info& rhs) const
{
    return name == rhs.name && id == rhs.id && album == rhs.album && artists == rhs.artists &&
           bitrate == rhs.bitrate && duration == rhs.duration && format == rhs.format && mv_id == rhs.mv_id &&
           alias == rhs.alias;
}

music_info parse_music_info(const std::string& json)
{
    Json::Value root;
    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    std::unique_ptr<Json::CharReader> json_parser{builder.newCharReader()};
    {
        std::string err;
        if(!json_parser->parse(json.data(), json.data() + json.size(), &root, &err))
            throw error(failure_t::info_decode_error, err);
    }

    if(!root.isObject())
        throw error(failure_t::info_decode_error, "metadata is not an object");

    music_info info;
    info.name = as_string(require(root, "musicName"), "musicName");
    info.id = as_uint64(require(root, "musicId"), "musicId");
    info.album = as_string(require(root, "album"), "album");

    const auto& artists = require(root, "artist");
    if(!artists.isArray())
        throw error(failure_t::info_decode_error, "field \"artist\" is not an array");
    for(const auto& ar : artists)
    {
        if(!ar.isArray() || ar.size() != 2)
            throw error(failure_t::info_decode_error, "artist entry is not a [name, id] pair");
        info.artists.push_back({as_string(ar[0], "artist"), as_uint64(ar[1], "artist")});
    }

    info.bitrate = as_uint64(require(root, "bitrate"), "bitrate");
    info.duration = as_uint64(require(root, "duration"), "duration");
    info.format = as_string(require(root, "format"), "format");

    if(root.isMember("mvId") && !root["mvId"].isNull())
        info.mv_id = as_uint64(root["mvId"], "mvId");

    if(root.isMember("alias") && !root["alias"].isNull())
    {
        const auto& alias = root["alias"];
        if(!alias.isArray())
            throw error(failure_t::info_decode_error, "field \"alias\" is not an array");
        std::vector<std::string> names;
        for(const auto& a : alias)
            names.emplace_back(as_string(a, "alias"));
        info.alias = std::move(names);
    }

    return info;
}

std::vector<std::string> artist_names(const music_info& info)
{
    std::vector<std::string> names;
    names.reserve(info.artists.size());
    for(const auto& ar : info.artists)
        names.emplace_back(ar.name);
    return names;
}

} // namespace ncmunpack
