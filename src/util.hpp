#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace clawlink {

// Unix epoch milliseconds
uint64_t epoch_millis();

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename so readers never see a partial file.
// private_file = true creates the file with mode 0600.
bool atomic_write_file(const std::string& path, const std::string& content,
                       bool private_file = false);

// Read a whole file. Returns false if it cannot be opened.
bool read_file(const std::string& path, std::string& out);

// Standard base64 (RFC 4648, padded)
std::string base64_encode(const unsigned char* data, size_t len);

// Returns false on malformed input
bool base64_decode(const std::string& in, std::vector<unsigned char>& out);

} // namespace clawlink
