#include "core/content_hasher.hpp"
#include "logging/logger.hpp"
#include <openssl/sha.h>
#include <fstream>
#include <iomanip>
#include <sstream>

std::optional<std::string> ContentHasher::hash(const std::string &file_path)
{
    Logger::trace("Computing content hash: " + file_path);
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256_CTX sha256;
    if (SHA256_Init(&sha256) != 1)
        return std::nullopt;
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open())
    {
        Logger::debug("Hash unavailable, cannot open: " + file_path);
        return std::nullopt;
    }
    std::vector<char> buffer(CHUNK_SIZE);
    while (file.good())
    {
        file.read(buffer.data(), CHUNK_SIZE);
        std::streamsize bytes_read = file.gcount();
        if (bytes_read > 0)
        {
            if (SHA256_Update(&sha256, buffer.data(), static_cast<size_t>(bytes_read)) != 1)
                return std::nullopt;
        }
    }
    if (file.bad())
    {
        Logger::warn("Read error while hashing: " + file_path);
        return std::nullopt;
    }
    if (SHA256_Final(digest, &sha256) != 1)
        return std::nullopt;
    return toHex(digest, SHA256_DIGEST_LENGTH);
}

std::string ContentHasher::hashBytes(const std::vector<unsigned char> &data)
{
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(data.data(), data.size(), digest);
    return toHex(digest, SHA256_DIGEST_LENGTH);
}

std::string ContentHasher::toHex(const unsigned char *digest, size_t length)
{
    std::stringstream ss;
    for (size_t i = 0; i < length; ++i)
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    return ss.str();
}
