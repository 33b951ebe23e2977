#pragma once

#include <string>
#include <map>
#include <cstddef>

namespace runbox {

class FileUtils {
public:
    // Get MIME type for file, "application/octet-stream" when unknown
    static std::string get_mime_type(const std::string& filename);

    // Format file size as human-readable string
    static std::string format_file_size(size_t bytes);

    static std::string bytes_to_hex(const unsigned char* data, size_t len);

    // Hex string of `num_bytes` bytes from the OpenSSL CSPRNG.
    // Throws ResourceError if the generator cannot be seeded.
    static std::string random_hex(size_t num_bytes);

    // Reduce a client-supplied name to a safe base name (no directories,
    // no control characters). Returns "" when nothing usable remains.
    static std::string sanitize_filename(const std::string& filename);

private:
    static std::string lowercase_extension(const std::string& filename);

    static const std::map<std::string, std::string> mime_type_map_;
};

} // namespace runbox
