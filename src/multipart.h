#pragma once

#include <string>
#include <vector>
#include <map>

namespace runbox {

// Represents a single part in multipart form data
struct MultipartPart {
    std::map<std::string, std::string> headers;
    std::string name;
    std::string filename;
    std::string data;    // Raw bytes, may contain NULs
};

// Simple multipart/form-data parser
class MultipartParser {
public:
    static std::vector<MultipartPart> parse(
        const std::string& content_type,
        const std::string& body
    );

    // First part whose form field is `name`, or nullptr
    static const MultipartPart* find_field(const std::vector<MultipartPart>& parts,
                                           const std::string& name);

    static std::string extract_boundary(const std::string& content_type);

private:
    static MultipartPart parse_part(const std::string& part_data);
    static std::string disposition_param(const std::string& value, const std::string& param);
};

} // namespace runbox
