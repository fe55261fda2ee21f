#include <core/error/transfer_error.h>
#include <core/http/multipart_writer.h>
#include <gtest/gtest.h>
#include <set>
#include <vector>

#include "support/multipart_decoder.h"
#include "support/test_utils.h"

using namespace upbeam;
using namespace upbeam::core;
using test::BoundaryFromContentType;
using test::DecodeMultipart;
using test::MakePayload;

namespace {

std::vector<test::DecodedPart> EncodeAndDecode(const std::string& file_name,
                                               const BinaryData& content) {
    MultipartWriter writer;
    writer.CreateFormFile("file", file_name);
    writer.Write(content);
    std::string content_type = writer.FormDataContentType();
    BinaryData body = writer.Close();
    return DecodeMultipart(ToString(body), BoundaryFromContentType(content_type));
}

} // namespace

TEST(MultipartWriterTest, RecoversFileNameAndBytes) {
    BinaryData content = MakePayload(70000);
    auto parts = EncodeAndDecode("report.pdf", content);

    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].name, "file");
    EXPECT_EQ(parts[0].filename, "report.pdf");
    EXPECT_EQ(parts[0].headers["content-type"], "application/octet-stream");
    EXPECT_EQ(parts[0].content, ToString(content));
}

TEST(MultipartWriterTest, EmptyFileProducesEmptyPart) {
    auto parts = EncodeAndDecode("empty.bin", {});

    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].filename, "empty.bin");
    EXPECT_TRUE(parts[0].content.empty());
}

TEST(MultipartWriterTest, BinaryContentIsNotAltered) {
    BinaryData content;
    for (int byte = 0; byte < 256; ++byte) {
        content.push_back(static_cast<std::uint8_t>(byte));
    }
    // CRLF and dashes inside the payload must survive untouched
    for (char c : std::string("\r\n--\r\n\r\n")) {
        content.push_back(static_cast<std::uint8_t>(c));
    }

    auto parts = EncodeAndDecode("blob", content);

    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].content, ToString(content));
}

TEST(MultipartWriterTest, ExactWireLayoutWithFixedBoundary) {
    MultipartWriter writer("XyZ");
    writer.CreateFormFile("file", "a.txt");
    writer.Write(ToBinary("hello"));
    BinaryData body = writer.Close();

    EXPECT_EQ(ToString(body),
              "--XyZ\r\n"
              "Content-Disposition: form-data; name=\"file\"; filename=\"a.txt\"\r\n"
              "Content-Type: application/octet-stream\r\n"
              "\r\n"
              "hello\r\n"
              "--XyZ--\r\n");
    EXPECT_EQ(writer.FormDataContentType(), "multipart/form-data; boundary=XyZ");
}

TEST(MultipartWriterTest, EscapesQuotesAndBackslashes) {
    auto parts = EncodeAndDecode("say \"hi\"\\there.txt", ToBinary("x"));

    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].filename, "say \"hi\"\\there.txt");
    EXPECT_NE(parts[0].headers["content-disposition"].find("filename=\"say \\\"hi\\\"\\\\there.txt\""),
              std::string::npos);
}

TEST(MultipartWriterTest, KeepsNonAsciiFileNames) {
    auto parts = EncodeAndDecode("résumé 日本.txt", ToBinary("x"));

    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].filename, "résumé 日本.txt");
}

TEST(MultipartWriterTest, RejectsLineBreaksInFileName) {
    const std::vector<std::string> names{"evil\r\nX-Injected: 1",
                                         "line\nbreak",
                                         std::string("nul\0byte", 8)};
    for (const auto& name : names) {
        MultipartWriter writer;
        EXPECT_THROW(writer.CreateFormFile("file", name), EncodingError) << name;
    }
}

TEST(MultipartWriterTest, RejectsEmptyFieldName) {
    MultipartWriter writer;
    EXPECT_THROW(writer.CreateFormFile("", "a.txt"), EncodingError);
}

TEST(MultipartWriterTest, RejectsWritesOutsideAPart) {
    MultipartWriter writer;
    EXPECT_THROW(writer.Write(ToBinary("early")), EncodingError);

    writer.CreateFormFile("file", "a.txt");
    writer.Close();
    EXPECT_THROW(writer.Write(ToBinary("late")), EncodingError);
    EXPECT_THROW(writer.Close(), EncodingError);
}

TEST(MultipartWriterTest, MultiplePartsAreDelimited) {
    MultipartWriter writer;
    writer.CreateFormFile("notes", "a.txt");
    writer.Write(ToBinary("nightly"));
    writer.CreateFormFile("file", "b.bin");
    writer.Write(ToBinary("payload"));
    std::string content_type = writer.FormDataContentType();
    BinaryData body = writer.Close();

    auto parts = DecodeMultipart(ToString(body), BoundaryFromContentType(content_type));
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0].name, "notes");
    EXPECT_EQ(parts[0].filename, "a.txt");
    EXPECT_EQ(parts[0].content, "nightly");
    EXPECT_EQ(parts[1].name, "file");
    EXPECT_EQ(parts[1].filename, "b.bin");
    EXPECT_EQ(parts[1].content, "payload");
}

TEST(MultipartWriterTest, BoundaryValidation) {
    EXPECT_THROW(MultipartWriter(""), EncodingError);
    EXPECT_THROW(MultipartWriter(std::string(71, 'a')), EncodingError);
    EXPECT_THROW(MultipartWriter("trailing "), EncodingError);
    EXPECT_THROW(MultipartWriter("semi;colon"), EncodingError);
    EXPECT_NO_THROW(MultipartWriter(std::string(70, 'a')));
}

TEST(MultipartWriterTest, BoundaryWithSpecialsIsQuoted) {
    MultipartWriter writer("a:b=c");
    EXPECT_EQ(writer.FormDataContentType(), "multipart/form-data; boundary=\"a:b=c\"");
    EXPECT_EQ(BoundaryFromContentType(writer.FormDataContentType()), "a:b=c");
}

TEST(MultipartWriterTest, RandomBoundariesAreUniqueAndValid) {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        std::string boundary = MultipartWriter::RandomBoundary();
        EXPECT_LE(boundary.size(), 70u);
        EXPECT_NO_THROW(MultipartWriter{boundary});
        seen.insert(boundary);
    }
    EXPECT_EQ(seen.size(), 100u);
}
