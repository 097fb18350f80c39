#include "tagger.h"

#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include <taglib/attachedpictureframe.h>
#include <taglib/flacfile.h>
#include <taglib/id3v2tag.h>
#include <taglib/mpegfile.h>
#include <taglib/tpropertymap.h>
#include <taglib/tstringlist.h>

namespace ncmunpack
{

namespace
{

TagLib::ByteVector to_byte_vector(const std::vector<std::uint8_t>& data)
{
    if(data.size() > std::numeric_limits<unsigned int>::max())
        throw std::runtime_error("[write_tag]: img_len is too big");
    return TagLib::ByteVector{reinterpret_cast<const char*>(data.data()), static_cast<unsigned int>(data.size())};
}

TagLib::String utf8(const std::string& s)
{
    return TagLib::String{s, TagLib::String::Type::UTF8};
}

} // namespace

std::string_view detect_mime(const std::uint8_t* data, std::size_t len) noexcept
{
    using raw_data_type = std::vector<std::uint8_t>;
    static const std::vector<std::pair<raw_data_type, std::string_view>> mime_trait_table{
        {{0xff, 0xd8, 0xff}, "image/jpeg"},
        {{0x89, 0x50, 0x4e, 0x47, 0x0d, 0x0a, 0x1a, 0x0a}, "image/png"}
    };

    for(const auto& mt : mime_trait_table)
    {
        if(len < mt.first.size())
            continue;
        if(!std::memcmp(data, mt.first.data(), mt.first.size()))
            return mt.second;
    }

    return {};
}

bool write_tag(const music_info& info, const std::vector<std::uint8_t>& cover, const fs::path& audio_path)
{
    auto img_mime = std::string{detect_mime(cover.data(), cover.size())};
    if(img_mime.empty() && !cover.empty())
        img_mime = "image/jpeg";

    if(auto audio_ext = audio_path.extension(); audio_ext == ".flac")
    {
        TagLib::FLAC::File flac_file{audio_path.c_str()};
        if(!flac_file.isValid())
            return false;
        TagLib::StringList artist_list;
        for(const auto& ar : info.artists)
            artist_list.append(utf8(ar.name));
        TagLib::PropertyMap map;
        map["ARTIST"] = artist_list;
        map["ALBUM"] = utf8(info.album);
        map["TITLE"] = utf8(info.name);
        flac_file.setProperties(map);

        flac_file.removePictures();
        if(!cover.empty())
        {
            auto front_cover = new TagLib::FLAC::Picture; // owned by flac_file
            front_cover->setMimeType(img_mime);
            front_cover->setType(TagLib::FLAC::Picture::Type::FrontCover);
            front_cover->setData(to_byte_vector(cover));
            flac_file.addPicture(front_cover);
        }
        return flac_file.save();
    }
    else if(audio_ext == ".mp3")
    {
        TagLib::MPEG::File mp3_file{audio_path.c_str()};
        if(!mp3_file.isValid())
            return false;
        auto tag = mp3_file.ID3v2Tag(true); // only id3v2 can have a picture frame
        tag->setAlbum(utf8(info.album));
        tag->setTitle(utf8(info.name));

        TagLib::StringList artist_list;
        for(const auto& ar : info.artists)
            artist_list.append(utf8(ar.name));
        tag->setArtist(artist_list.toString("/"));

        if(!cover.empty())
        {
            auto pic_frame = new TagLib::ID3v2::AttachedPictureFrame; // owned by tag
            pic_frame->setMimeType(img_mime);
            pic_frame->setType(TagLib::ID3v2::AttachedPictureFrame::Type::FrontCover);
            pic_frame->setData(to_byte_vector(cover));
            tag->addFrame(pic_frame);
        }
        return mp3_file.save();
    }

    return false;
}

} // namespace ncmunpack
