#include "utils.hpp"
#include "errors.hpp"
#include "base64.h"
#include <openssl/sha.h>
#include <array>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <random>
#include <sstream>
#include <system_error>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::vector<unsigned char> sha256_bytes(const std::string &data){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    SHA256((const unsigned char*)data.data(), data.size(), out.data());
    return out;
}

std::string sha256_hex(const std::string &data){
    return hex_from_bytes(sha256_bytes(data));
}

std::optional<std::string> sha256_file(const std::filesystem::path& file) {
    std::ifstream in(file, std::ios::binary);
    if(!in) return std::nullopt;

    SHA256_CTX ctx;
    if(SHA256_Init(&ctx) != 1) return std::nullopt;

    std::array<char, 8192> buffer{};
    while(in) {
        in.read(buffer.data(), buffer.size());
        std::streamsize read = in.gcount();
        if(read > 0) {
            if(SHA256_Update(&ctx, reinterpret_cast<const unsigned char*>(buffer.data()),
                             static_cast<size_t>(read)) != 1) {
                return std::nullopt;
            }
        }
    }
    if(in.bad()) return std::nullopt;

    unsigned char digest[SHA256_DIGEST_LENGTH];
    if(SHA256_Final(digest, &ctx) != 1) return std::nullopt;
    return hex_from_bytes(std::vector<unsigned char>(digest, digest + SHA256_DIGEST_LENGTH));
}

std::optional<std::string> read_file_bytes(const std::filesystem::path& file) {
    std::ifstream in(file, std::ios::binary);
    if(!in) return std::nullopt;
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if(in.bad()) return std::nullopt;
    return bytes;
}

bool write_file_bytes(const std::filesystem::path& file, const std::string& bytes) {
    std::error_code ec;
    if(file.has_parent_path()) {
        std::filesystem::create_directories(file.parent_path(), ec);
        if(ec) return false;
    }
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    if(!out) return false;
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    return static_cast<bool>(out);
}

std::string random_id(std::size_t length) {
    static thread_local std::mt19937 rng{std::random_device{}()};
    const std::string alphabet(kIdAlphabet);
    std::uniform_int_distribution<std::size_t> pick(0, alphabet.size() - 1);
    std::string out;
    out.reserve(length);
    for(std::size_t i = 0; i < length; ++i) out.push_back(alphabet[pick(rng)]);
    return out;
}

std::string encode_base64(const std::string& bytes) {
    return base64_encode(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size());
}

std::string decode_base64(const std::string& encoded) {
    if(encoded.size() % 4 != 0) {
        throw ProtocolError("base64 length " + std::to_string(encoded.size()) + " is not a multiple of 4");
    }
    std::size_t padding = 0;
    for(std::size_t i = 0; i < encoded.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(encoded[i]);
        if(c == '=') {
            if(i + 2 < encoded.size()) throw ProtocolError("base64 padding in the middle of input");
            ++padding;
            continue;
        }
        if(padding > 0) throw ProtocolError("base64 data after padding");
        if(!(std::isalnum(c) || c == '+' || c == '/')) {
            throw ProtocolError("invalid base64 character");
        }
    }
    return base64_decode(encoded);
}
