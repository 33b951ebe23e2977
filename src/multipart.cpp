#include "multipart.h"
#include <sstream>
#include <algorithm>
#include <cctype>

namespace runbox {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

std::vector<MultipartPart> MultipartParser::parse(
    const std::string& content_type,
    const std::string& body
) {
    std::vector<MultipartPart> parts;

    // Extract boundary from content-type
    std::string boundary = extract_boundary(content_type);
    if (boundary.empty()) return parts;

    std::string delimiter = "--" + boundary;
    std::string end_delimiter = delimiter + "--";

    size_t start = body.find(delimiter);
    if (start == std::string::npos) return parts;
    if (body.compare(start, end_delimiter.length(), end_delimiter) == 0) return parts;

    start += delimiter.length();
    if (body.compare(start, 2, "\r\n") == 0) {
        start += 2;
    } else if (start < body.size() && body[start] == '\n') {
        start += 1;
    }

    // Parts are separated by CRLF followed by the delimiter, so content that
    // happens to contain "--boundary" mid-line is left intact
    std::string separator = "\r\n" + delimiter;

    while (start <= body.size()) {
        size_t end = body.find(separator, start);
        size_t skip = separator.length();
        if (end == std::string::npos) {
            end = body.find("\n" + delimiter, start);
            skip = delimiter.length() + 1;
            if (end == std::string::npos) break;
        }

        MultipartPart part = parse_part(body.substr(start, end - start));
        if (!part.name.empty()) {
            parts.push_back(std::move(part));
        }

        size_t after = end + skip;
        if (body.compare(after, 2, "--") == 0) {
            break;
        }
        start = after;
        if (body.compare(start, 2, "\r\n") == 0) {
            start += 2;
        } else if (start < body.size() && body[start] == '\n') {
            start += 1;
        }
    }

    return parts;
}

const MultipartPart* MultipartParser::find_field(const std::vector<MultipartPart>& parts,
                                                 const std::string& name) {
    for (const auto& part : parts) {
        if (part.name == name) {
            return &part;
        }
    }
    return nullptr;
}

std::string MultipartParser::extract_boundary(const std::string& content_type) {
    std::string lowered = to_lower(content_type);
    if (lowered.find("multipart/") == std::string::npos) return "";

    std::string boundary_prefix = "boundary=";
    size_t pos = lowered.find(boundary_prefix);
    if (pos == std::string::npos) return "";

    pos += boundary_prefix.length();
    size_t end = content_type.find(';', pos);
    if (end == std::string::npos) end = content_type.length();

    std::string boundary = content_type.substr(pos, end - pos);
    while (!boundary.empty() && std::isspace(static_cast<unsigned char>(boundary.back()))) {
        boundary.pop_back();
    }

    // Remove quotes if present
    if (boundary.size() >= 2 && boundary.front() == '"' && boundary.back() == '"') {
        boundary = boundary.substr(1, boundary.length() - 2);
    }

    return boundary;
}

std::string MultipartParser::disposition_param(const std::string& value, const std::string& param) {
    // Match the parameter at a token boundary so "name" never hits "filename"
    std::string needle = param + "=";
    size_t pos = 0;
    while ((pos = value.find(needle, pos)) != std::string::npos) {
        bool at_boundary = pos == 0 || value[pos - 1] == ' ' || value[pos - 1] == ';';
        if (at_boundary) break;
        pos += needle.length();
    }
    if (pos == std::string::npos) return "";

    pos += needle.length();
    if (pos < value.size() && value[pos] == '"') {
        size_t close = value.find('"', pos + 1);
        if (close == std::string::npos) return value.substr(pos + 1);
        return value.substr(pos + 1, close - pos - 1);
    }
    size_t end = value.find(';', pos);
    return value.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
}

MultipartPart MultipartParser::parse_part(const std::string& part_data) {
    MultipartPart part;

    // Find headers end
    size_t headers_end = part_data.find("\r\n\r\n");
    size_t content_start;
    if (headers_end != std::string::npos) {
        content_start = headers_end + 4;
    } else {
        headers_end = part_data.find("\n\n");
        if (headers_end == std::string::npos) return part;
        content_start = headers_end + 2;
    }

    std::string headers_section = part_data.substr(0, headers_end);

    // Parse headers
    std::istringstream headers_stream(headers_section);
    std::string line;
    while (std::getline(headers_stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string key = line.substr(0, colon);
        size_t value_start = line.find_first_not_of(' ', colon + 1);
        std::string value = value_start == std::string::npos ? "" : line.substr(value_start);
        part.headers[key] = value;

        if (to_lower(key) == "content-disposition") {
            part.name = disposition_param(value, "name");
            part.filename = disposition_param(value, "filename");
        }
    }

    part.data = part_data.substr(content_start);
    return part;
}

} // namespace runbox
