#pragma once

#include <string>
#include <string_view>
#include <filesystem>

// Calculates the SHA256 hash of a file.
// Throws HotpackException if the file cannot be opened.
std::string calculate_sha256(const std::filesystem::path& file_path);

// Decodes the base64 transport encoding used by the content API.
// Embedded line breaks are accepted; anything else malformed throws.
std::string base64_decode(std::string_view encoded);
