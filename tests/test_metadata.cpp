#include "metadata.h"
#include "error.h"

#include <string>

#include <gtest/gtest.h>

#include "ncm_builder.h"

using namespace ncmunpack;

namespace
{

failure_t parse_failure(const std::string& json)
{
    try
    {
        parse_music_info(json);
    }
    catch(const error& e)
    {
        return e.code();
    }
    return failure_t::no_error;
}

const std::string minimal{
    R"({"musicName":"a","musicId":1,"album":"b","artist":[["c",2]],"bitrate":320000,"duration":1000,"format":"mp3"})"};

} // namespace

TEST(MusicInfo, ParsesReferenceRecord)
{
    auto info = parse_music_info(test::reference_info_json());

    EXPECT_EQ(info.name, u8"寒鸦少年");
    EXPECT_EQ(info.id, 1305366556u);
    EXPECT_EQ(info.album, u8"寒鸦少年");
    ASSERT_EQ(info.artists.size(), 1u);
    EXPECT_EQ(info.artists[0], (artist_t{u8"华晨宇", 861777}));
    EXPECT_EQ(info.bitrate, 923378u);
    EXPECT_EQ(info.duration, 315146u);
    EXPECT_EQ(info.format, "flac");
    EXPECT_EQ(info.mv_id, std::optional<std::uint64_t>{0});
    ASSERT_TRUE(info.alias.has_value());
    EXPECT_EQ(*info.alias, std::vector<std::string>{u8"电视剧《斗破苍穹》主题曲"});
    EXPECT_EQ(artist_names(info), std::vector<std::string>{u8"华晨宇"});
}

TEST(MusicInfo, OptionalFieldsMayBeAbsent)
{
    auto info = parse_music_info(minimal);
    EXPECT_EQ(info.format, "mp3");
    EXPECT_FALSE(info.mv_id.has_value());
    EXPECT_FALSE(info.alias.has_value());
}

TEST(MusicInfo, NullOptionalFieldsAreAbsent)
{
    auto json = minimal;
    json.insert(json.size() - 1, R"(,"mvId":null,"alias":null)");
    auto info = parse_music_info(json);
    EXPECT_FALSE(info.mv_id.has_value());
    EXPECT_FALSE(info.alias.has_value());
}

TEST(MusicInfo, MultipleArtists)
{
    auto info = parse_music_info(
        R"({"musicName":"a","musicId":1,"album":"b","artist":[["x",1],["y",2]],"bitrate":1,"duration":1,"format":"mp3"})");
    EXPECT_EQ(artist_names(info), (std::vector<std::string>{"x", "y"}));
}

TEST(MusicInfo, MissingRequiredFieldFails)
{
    for(const char* field : {"musicName", "musicId", "album", "artist", "bitrate", "duration", "format"})
    {
        auto json = minimal;
        auto key = std::string{"\""} + field + "\"";
        auto pos = json.find(key);
        ASSERT_NE(pos, std::string::npos);
        json.replace(pos, key.size(), "\"renamed\"");
        EXPECT_EQ(parse_failure(json), failure_t::info_decode_error) << field;
    }
}

TEST(MusicInfo, MistypedFieldFails)
{
    EXPECT_EQ(parse_failure(
                  R"({"musicName":"a","musicId":"1","album":"b","artist":[],"bitrate":1,"duration":1,"format":"mp3"})"),
              failure_t::info_decode_error);
    EXPECT_EQ(parse_failure(
                  R"({"musicName":7,"musicId":1,"album":"b","artist":[],"bitrate":1,"duration":1,"format":"mp3"})"),
              failure_t::info_decode_error);
    EXPECT_EQ(parse_failure(
                  R"({"musicName":"a","musicId":-1,"album":"b","artist":[],"bitrate":1,"duration":1,"format":"mp3"})"),
              failure_t::info_decode_error);
    EXPECT_EQ(parse_failure(
                  R"({"musicName":"a","musicId":1,"album":"b","artist":[["c"]],"bitrate":1,"duration":1,"format":"mp3"})"),
              failure_t::info_decode_error);
    EXPECT_EQ(parse_failure(
                  R"({"musicName":"a","musicId":1,"album":"b","artist":[[3,"c"]],"bitrate":1,"duration":1,"format":"mp3"})"),
              failure_t::info_decode_error);
    EXPECT_EQ(parse_failure(
                  R"({"musicName":"a","musicId":1,"album":"b","artist":[],"bitrate":1,"duration":1,"format":"mp3","mvId":"x"})"),
              failure_t::info_decode_error);
    EXPECT_EQ(parse_failure(
                  R"({"musicName":"a","musicId":1,"album":"b","artist":[],"bitrate":1,"duration":1,"format":"mp3","alias":[1]})"),
              failure_t::info_decode_error);
}

TEST(MusicInfo, FloatingPointIntegerFails)
{
    EXPECT_EQ(parse_failure(
                  R"({"musicName":"a","musicId":1305366556.0,"album":"b","artist":[],"bitrate":1,"duration":1,"format":"mp3"})"),
              failure_t::info_decode_error);
    EXPECT_EQ(parse_failure(
                  R"({"musicName":"a","musicId":1,"album":"b","artist":[],"bitrate":9.2e5,"duration":1,"format":"mp3"})"),
              failure_t::info_decode_error);
    EXPECT_EQ(parse_failure(
                  R"({"musicName":"a","musicId":1,"album":"b","artist":[["c",2.0]],"bitrate":1,"duration":1,"format":"mp3"})"),
              failure_t::info_decode_error);
}

TEST(MusicInfo, NonStrictJsonFails)
{
    // trailing content
    EXPECT_EQ(parse_failure(minimal + " trailing garbage"), failure_t::info_decode_error);
    // comments
    auto commented = minimal;
    commented.insert(1, "/*c*/");
    EXPECT_EQ(parse_failure(commented), failure_t::info_decode_error);
    // duplicate keys
    auto duplicated = minimal;
    duplicated.insert(1, R"("musicId":2,)");
    EXPECT_EQ(parse_failure(duplicated), failure_t::info_decode_error);
}

TEST(MusicInfo, NotJsonFails)
{
    EXPECT_EQ(parse_failure(""), failure_t::info_decode_error);
    EXPECT_EQ(parse_failure("{\"musicName\":"), failure_t::info_decode_error);
    EXPECT_EQ(parse_failure("[1,2,3]"), failure_t::info_decode_error);
}
