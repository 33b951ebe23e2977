#include "file_utils.h"
#include "errors.h"
#include <algorithm>
#include <sstream>
#include <iomanip>
#include <vector>
#include <openssl/rand.h>

namespace runbox {

const std::map<std::string, std::string> FileUtils::mime_type_map_ = {
    // Images
    {".png", "image/png"},
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".gif", "image/gif"},
    {".bmp", "image/bmp"},
    {".webp", "image/webp"},
    {".svg", "image/svg+xml"},
    {".ico", "image/vnd.microsoft.icon"},
    {".tif", "image/tiff"},
    {".tiff", "image/tiff"},

    // Video / audio
    {".mp4", "video/mp4"},
    {".webm", "video/webm"},
    {".avi", "video/x-msvideo"},
    {".mov", "video/quicktime"},
    {".mp3", "audio/mpeg"},
    {".wav", "audio/wav"},
    {".ogg", "audio/ogg"},

    // Data
    {".csv", "text/csv"},
    {".tsv", "text/tab-separated-values"},
    {".json", "application/json"},
    {".xml", "application/xml"},
    {".yaml", "text/yaml"},
    {".yml", "text/yaml"},

    // Text
    {".txt", "text/plain"},
    {".log", "text/plain"},
    {".md", "text/markdown"},
    {".html", "text/html"},
    {".htm", "text/html"},
    {".css", "text/css"},

    // Archives
    {".zip", "application/zip"},
    {".tar", "application/x-tar"},
    {".gz", "application/gzip"},

    // Code
    {".py", "text/x-python"},
    {".js", "application/javascript"},
    {".c", "text/x-c"},
    {".h", "text/x-c"},
    {".cpp", "text/x-c++"},

    // Documents
    {".pdf", "application/pdf"},
    {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
    {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
    {".pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
};

std::string FileUtils::lowercase_extension(const std::string& filename) {
    std::string ext;
    size_t slash_pos = filename.find_last_of('/');
    size_t dot_pos = filename.rfind('.');
    if (dot_pos != std::string::npos &&
        (slash_pos == std::string::npos || dot_pos > slash_pos)) {
        ext = filename.substr(dot_pos);
        std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    }
    return ext;
}

std::string FileUtils::get_mime_type(const std::string& filename) {
    auto it = mime_type_map_.find(lowercase_extension(filename));
    if (it != mime_type_map_.end()) {
        return it->second;
    }
    return "application/octet-stream";
}

std::string FileUtils::format_file_size(size_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit_index < 4) {
        size /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << size << " " << units[unit_index];
    return oss.str();
}

std::string FileUtils::bytes_to_hex(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string FileUtils::random_hex(size_t num_bytes) {
    std::vector<unsigned char> buffer(num_bytes);
    if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
        throw ResourceError("Random generator unavailable");
    }
    return bytes_to_hex(buffer.data(), buffer.size());
}

std::string FileUtils::sanitize_filename(const std::string& filename) {
    // Browsers on Windows may send the full client path
    std::string base = filename;
    size_t sep = base.find_last_of("/\\");
    if (sep != std::string::npos) {
        base = base.substr(sep + 1);
    }

    std::string cleaned;
    cleaned.reserve(base.size());
    for (char c : base) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 32 || uc == 127 || c == '"') {
            continue;
        }
        cleaned += c;
    }

    if (cleaned == "." || cleaned == "..") {
        return "";
    }
    return cleaned;
}

} // namespace runbox
