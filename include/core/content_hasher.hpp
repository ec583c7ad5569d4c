#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Content identity for catalog records.
 *
 * Streams the file through SHA-256 in fixed-size chunks. An empty optional
 * means the digest is unavailable (permissions, transient I/O); it never
 * means the file is absent.
 */
class ContentHasher
{
public:
    static constexpr size_t CHUNK_SIZE = 8192;

    static std::optional<std::string> hash(const std::string &file_path);

    // SHA-256 of an in-memory buffer, used for content-addressed frame names
    static std::string hashBytes(const std::vector<unsigned char> &data);

private:
    static std::string toHex(const unsigned char *digest, size_t length);
};
