#include <gtest/gtest.h>
#include "form_parser.hpp"

using namespace keypub;

TEST(FormParserTest, DecodesFields) {
    auto form = FormParser::parse("public_key=abc%2B%2F%3D&note=hello+world");
    EXPECT_EQ(form.size(), 2u);
    EXPECT_EQ(form.get("public_key"), std::optional<std::string>("abc+/="));
    EXPECT_EQ(form.get("note"), std::optional<std::string>("hello world"));
    EXPECT_FALSE(form.get("missing").has_value());
}

TEST(FormParserTest, EmptyAndValuelessFields) {
    auto form = FormParser::parse("public_key=&note&&");
    EXPECT_EQ(form.get("public_key"), std::optional<std::string>(""));
    EXPECT_EQ(form.get("note"), std::optional<std::string>(""));
    EXPECT_EQ(FormParser::parse("").size(), 0u);
}

TEST(FormParserTest, FirstOccurrenceWins) {
    auto form = FormParser::parse("note=first&note=second");
    EXPECT_EQ(form.get("note"), std::optional<std::string>("first"));
}

TEST(FormParserTest, DecodesUtf8Escapes) {
    auto form = FormParser::parse("note=%E4%B8%AD%E6%96%87");
    EXPECT_EQ(form.get("note"), std::optional<std::string>("\xE4\xB8\xAD\xE6\x96\x87"));
}

TEST(FormParserTest, RejectsBadEscapes) {
    EXPECT_THROW(FormParser::parse("public_key=%ZZ"), FormDecodeError);
    EXPECT_THROW(FormParser::parse("public_key=%4"), FormDecodeError);
    EXPECT_THROW(FormParser::parse("public_key=abc%"), FormDecodeError);
}

TEST(FormParserTest, RejectsInvalidUtf8) {
    EXPECT_THROW(FormParser::parse("note=%FF%FE"), FormDecodeError);
    EXPECT_THROW(FormParser::parse("note=%C0%AF"), FormDecodeError);  // overlong '/'
}

TEST(FormParserTest, ContentTypeMatching) {
    EXPECT_TRUE(FormParser::is_urlencoded("application/x-www-form-urlencoded"));
    EXPECT_TRUE(FormParser::is_urlencoded("Application/X-WWW-Form-Urlencoded; charset=UTF-8"));
    EXPECT_FALSE(FormParser::is_urlencoded("multipart/form-data; boundary=x"));
    EXPECT_FALSE(FormParser::is_urlencoded("application/json"));
    EXPECT_FALSE(FormParser::is_urlencoded(""));
}
