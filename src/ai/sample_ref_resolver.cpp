#include "ai/sample_ref_resolver.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>
#include <openssl/evp.h>

SampleRefResolver::SampleRefResolver(const PipelineSettings &settings)
    : settings_(settings)
{
}

std::string SampleRefResolver::mimeTypeFor(const std::string &file_path)
{
    std::string ext = FileUtils::getFileExtension(file_path);
    if (ext == "jpg" || ext == "jpeg")
        return "image/jpeg";
    if (ext == "png")
        return "image/png";
    if (ext == "gif")
        return "image/gif";
    if (ext == "webp")
        return "image/webp";
    if (ext == "bmp")
        return "image/bmp";
    return "application/octet-stream";
}

std::string SampleRefResolver::base64Encode(const std::vector<unsigned char> &data)
{
    if (data.empty())
        return "";
    // EVP_EncodeBlock writes 4 bytes per 3 input bytes plus a terminating NUL
    std::string encoded(4 * ((data.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&encoded[0]), data.data(),
                                  static_cast<int>(data.size()));
    encoded.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return encoded;
}

std::string SampleRefResolver::percentEncodeSegment(const std::string &segment)
{
    static const char *HEX = "0123456789ABCDEF";
    std::string out;
    out.reserve(segment.size());
    for (unsigned char c : segment)
    {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
        {
            out.push_back(static_cast<char>(c));
        }
        else
        {
            out.push_back('%');
            out.push_back(HEX[c >> 4]);
            out.push_back(HEX[c & 0x0F]);
        }
    }
    return out;
}

std::string SampleRefResolver::toPublicUrl(const std::string &file_path) const
{
    std::string relative = FileUtils::relativePath(file_path, settings_.getMediaRoot().string());
    std::string url = settings_.public_base_url;
    if (!url.empty() && url.back() != '/')
        url.push_back('/');

    bool first = true;
    for (const auto &part : fs::path(relative))
    {
        std::string segment = part.string();
        if (segment.empty() || segment == "/")
            continue;
        if (!first)
            url.push_back('/');
        url += percentEncodeSegment(segment);
        first = false;
    }
    return url;
}

std::optional<std::string> SampleRefResolver::toDataUri(const std::string &file_path)
{
    std::ifstream in(file_path, std::ios::binary);
    if (!in.is_open())
    {
        Logger::error("Cannot open sample for inlining: " + file_path);
        return std::nullopt;
    }
    std::vector<unsigned char> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad())
    {
        Logger::error("Read error while inlining sample: " + file_path);
        return std::nullopt;
    }
    return "data:" + mimeTypeFor(file_path) + ";base64," + base64Encode(bytes);
}

std::optional<std::string> SampleRefResolver::resolve(const std::string &file_path) const
{
    if (settings_.sample_ref_mode == "data_uri")
        return toDataUri(file_path);
    return toPublicUrl(file_path);
}

std::vector<std::string> SampleRefResolver::resolveAll(const std::vector<std::string> &file_paths,
                                                       std::string &error) const
{
    std::vector<std::string> refs;
    refs.reserve(file_paths.size());
    for (const auto &path : file_paths)
    {
        auto ref = resolve(path);
        if (!ref)
        {
            error = "could not build a reference for sample " + path;
            return {};
        }
        refs.push_back(*ref);
    }
    return refs;
}
