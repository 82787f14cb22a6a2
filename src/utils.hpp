#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> sha256_bytes(const std::string &data);
std::string sha256_hex(const std::string &data);

// Streams the file through SHA-256. nullopt when the file cannot be read.
std::optional<std::string> sha256_file(const std::filesystem::path& file);

// Whole-file helpers; failures are reported, not thrown.
std::optional<std::string> read_file_bytes(const std::filesystem::path& file);
bool write_file_bytes(const std::filesystem::path& file, const std::string& bytes);

// Session ids and generated usernames draw from an alphabet without
// look-alike characters.
inline constexpr const char* kIdAlphabet =
  "ABCDEFGHJKLMNOPQRSTUVWXYZabcdefghkmnopqrsuvwxyz023456789";
std::string random_id(std::size_t length = 16);

std::string encode_base64(const std::string& bytes);
// Throws ProtocolError when the input is not base64.
std::string decode_base64(const std::string& encoded);
