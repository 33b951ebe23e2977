#include <gtest/gtest.h>
#include "multipart.h"
#include <sstream>
#include <tuple>

namespace runbox {
namespace {

class MultipartParserTest : public ::testing::Test {
protected:
    std::string createMultipartData(const std::string& boundary,
                                   const std::vector<std::pair<std::string, std::string>>& fields,
                                   const std::vector<std::tuple<std::string, std::string, std::string, std::string>>& files = {}) {
        std::stringstream data;

        // Add fields
        for (const auto& [name, content] : fields) {
            data << "--" << boundary << "\r\n";
            data << "Content-Disposition: form-data; name=\"" << name << "\"\r\n";
            data << "\r\n";
            data << content << "\r\n";
        }

        // Add files
        for (const auto& [name, filename, content_type, content] : files) {
            data << "--" << boundary << "\r\n";
            data << "Content-Disposition: form-data; name=\"" << name << "\"; filename=\"" << filename << "\"\r\n";
            data << "Content-Type: " << content_type << "\r\n";
            data << "\r\n";
            data << content << "\r\n";
        }

        data << "--" << boundary << "--\r\n";
        return data.str();
    }
};

// ============================================================================
// Parsing
// ============================================================================

TEST_F(MultipartParserTest, ParseSimpleForm) {
    std::string boundary = "----WebKitFormBoundary123";
    std::vector<std::pair<std::string, std::string>> fields = {
        {"field1", "value1"},
        {"field2", "value2"},
        {"field3", "value3"}
    };

    std::string body = createMultipartData(boundary, fields);
    std::string content_type = "multipart/form-data; boundary=" + boundary;

    auto parts = MultipartParser::parse(content_type, body);

    ASSERT_EQ(parts.size(), 3u);
    for (size_t i = 0; i < parts.size(); ++i) {
        EXPECT_EQ(parts[i].name, "field" + std::to_string(i + 1));
        EXPECT_EQ(parts[i].data, "value" + std::to_string(i + 1));
        EXPECT_TRUE(parts[i].filename.empty());
    }
}

TEST_F(MultipartParserTest, ParseFileUpload) {
    std::string boundary = "----Boundary456";
    std::vector<std::pair<std::string, std::string>> fields = {
        {"description", "Quarterly numbers"}
    };
    std::vector<std::tuple<std::string, std::string, std::string, std::string>> files = {
        {"file", "report.csv", "text/csv", "a,b\n1,2\n"}
    };

    std::string body = createMultipartData(boundary, fields, files);
    auto parts = MultipartParser::parse("multipart/form-data; boundary=" + boundary, body);

    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0].name, "description");
    EXPECT_EQ(parts[0].data, "Quarterly numbers");

    EXPECT_EQ(parts[1].name, "file");
    EXPECT_EQ(parts[1].filename, "report.csv");
    EXPECT_EQ(parts[1].headers["Content-Type"], "text/csv");
    EXPECT_EQ(parts[1].data, "a,b\n1,2\n");
}

TEST_F(MultipartParserTest, ParseBinaryData) {
    std::string boundary = "----Binary123";
    std::stringstream data;

    data << "--" << boundary << "\r\n";
    data << "Content-Disposition: form-data; name=\"file\"; filename=\"data.bin\"\r\n";
    data << "Content-Type: application/octet-stream\r\n";
    data << "\r\n";

    // Every byte value, NUL and CR/LF included
    std::string binary_content;
    for (int i = 0; i < 256; i++) {
        binary_content.push_back(static_cast<char>(i));
    }
    data << binary_content << "\r\n";
    data << "--" << boundary << "--\r\n";

    auto parts = MultipartParser::parse("multipart/form-data; boundary=" + boundary, data.str());

    ASSERT_EQ(parts.size(), 1u);
    ASSERT_EQ(parts[0].data.size(), 256u);
    for (int i = 0; i < 256; i++) {
        EXPECT_EQ(static_cast<unsigned char>(parts[0].data[i]), static_cast<unsigned char>(i));
    }
}

TEST_F(MultipartParserTest, BoundaryTextInsideContentIsKept) {
    // Given: File content containing the delimiter text mid-line
    std::string boundary = "XyZ";
    std::string content = "before --XyZ after";
    std::vector<std::tuple<std::string, std::string, std::string, std::string>> files = {
        {"file", "tricky.txt", "text/plain", content}
    };

    std::string body = createMultipartData(boundary, {}, files);
    auto parts = MultipartParser::parse("multipart/form-data; boundary=" + boundary, body);

    // Then: The part is not split at the embedded text
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].data, content);
}

TEST_F(MultipartParserTest, BoundaryWithQuotes) {
    std::string boundary = "----Quoted123";
    std::vector<std::pair<std::string, std::string>> fields = {
        {"test", "value"}
    };

    std::string body = createMultipartData(boundary, fields);
    std::string content_type = "multipart/form-data; boundary=\"" + boundary + "\"";

    auto parts = MultipartParser::parse(content_type, body);

    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].name, "test");
}

TEST_F(MultipartParserTest, InvalidBoundary) {
    std::string data = "Some random data without proper boundary";
    std::string content_type = "multipart/form-data; boundary=----NonexistentBoundary";

    auto parts = MultipartParser::parse(content_type, data);

    EXPECT_TRUE(parts.empty());
}

TEST_F(MultipartParserTest, EmptyBody) {
    auto parts = MultipartParser::parse("multipart/form-data; boundary=----Empty", "");

    EXPECT_TRUE(parts.empty());
}

TEST_F(MultipartParserTest, MissingBoundaryInContentType) {
    std::string body = "--boundary\r\nContent-Disposition: form-data; name=\"test\"\r\n\r\nvalue\r\n--boundary--\r\n";

    auto parts = MultipartParser::parse("multipart/form-data", body);

    EXPECT_TRUE(parts.empty());
}

TEST_F(MultipartParserTest, EmptyField) {
    std::string boundary = "----Empty";
    std::vector<std::pair<std::string, std::string>> fields = {
        {"empty", ""},
        {"nonempty", "value"}
    };

    std::string body = createMultipartData(boundary, fields);
    auto parts = MultipartParser::parse("multipart/form-data; boundary=" + boundary, body);

    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0].name, "empty");
    EXPECT_TRUE(parts[0].data.empty());
    EXPECT_EQ(parts[1].name, "nonempty");
}

TEST_F(MultipartParserTest, LargeContent) {
    std::string boundary = "----Large";
    std::string large_content(1024 * 1024, 'X'); // 1MB

    std::vector<std::tuple<std::string, std::string, std::string, std::string>> files = {
        {"file", "big.txt", "text/plain", large_content}
    };

    std::string body = createMultipartData(boundary, {}, files);
    auto parts = MultipartParser::parse("multipart/form-data; boundary=" + boundary, body);

    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].data.size(), 1024u * 1024u);
    EXPECT_EQ(parts[0].data, large_content);
}

TEST_F(MultipartParserTest, FilenameDoesNotLeakIntoName) {
    // Given: Parameters in an unusual order
    std::string boundary = "----Order";
    std::stringstream data;
    data << "--" << boundary << "\r\n";
    data << "Content-Disposition: form-data; filename=\"photo.png\"; name=\"file\"\r\n";
    data << "\r\n";
    data << "png\r\n";
    data << "--" << boundary << "--\r\n";

    auto parts = MultipartParser::parse("multipart/form-data; boundary=" + boundary, data.str());

    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].name, "file");
    EXPECT_EQ(parts[0].filename, "photo.png");
}

TEST_F(MultipartParserTest, CRLFVariations) {
    std::string boundary = "----CRLF";
    std::stringstream data;

    // Using just \n instead of \r\n
    data << "--" << boundary << "\n";
    data << "Content-Disposition: form-data; name=\"unix\"\n";
    data << "\n";
    data << "unix-style\n";
    data << "--" << boundary << "--\n";

    auto parts = MultipartParser::parse("multipart/form-data; boundary=" + boundary, data.str());

    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].name, "unix");
    EXPECT_EQ(parts[0].data, "unix-style");
}

// ============================================================================
// Helpers
// ============================================================================

TEST_F(MultipartParserTest, FindFieldReturnsFirstMatch) {
    std::string boundary = "----Find";
    std::vector<std::pair<std::string, std::string>> fields = {
        {"note", "first"},
        {"note", "second"}
    };
    std::vector<std::tuple<std::string, std::string, std::string, std::string>> files = {
        {"file", "a.txt", "text/plain", "a"}
    };

    auto parts = MultipartParser::parse("multipart/form-data; boundary=" + boundary,
                                        createMultipartData(boundary, fields, files));

    const MultipartPart* note = MultipartParser::find_field(parts, "note");
    ASSERT_NE(note, nullptr);
    EXPECT_EQ(note->data, "first");

    const MultipartPart* file = MultipartParser::find_field(parts, "file");
    ASSERT_NE(file, nullptr);
    EXPECT_EQ(file->filename, "a.txt");

    EXPECT_EQ(MultipartParser::find_field(parts, "missing"), nullptr);
}

TEST_F(MultipartParserTest, ExtractBoundary) {
    EXPECT_EQ(MultipartParser::extract_boundary("multipart/form-data; boundary=abc"), "abc");
    EXPECT_EQ(MultipartParser::extract_boundary("Multipart/Form-Data; Boundary=\"q r\""), "q r");
    EXPECT_EQ(MultipartParser::extract_boundary("multipart/form-data; boundary=abc; charset=utf-8"), "abc");
    EXPECT_EQ(MultipartParser::extract_boundary("application/json"), "");
    EXPECT_EQ(MultipartParser::extract_boundary("multipart/form-data"), "");
}

} // namespace
} // namespace runbox
