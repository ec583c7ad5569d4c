#include "core/frame_workspace.hpp"
#include "core/content_hasher.hpp"
#include "logging/logger.hpp"
#include <atomic>
#include <fstream>
#include <unistd.h>
#include <opencv2/imgcodecs.hpp>

namespace
{
    std::string makeOwnerToken()
    {
        static std::atomic<uint64_t> counter{0};
        return std::to_string(::getpid()) + ":" + std::to_string(counter.fetch_add(1));
    }
}

std::string FrameWorkspace::leaseName(int64_t record_id)
{
    return "record-" + std::to_string(record_id);
}

std::unique_ptr<FrameWorkspace> FrameWorkspace::acquire(CatalogStore &store, const PipelineSettings &settings,
                                                        int64_t record_id, std::chrono::seconds stale_after)
{
    std::string name = leaseName(record_id);
    std::string owner = makeOwnerToken();
    if (!store.tryAcquireWorkspace(name, owner, stale_after))
    {
        Logger::info("Workspace " + name + " is held by another worker");
        return nullptr;
    }

    fs::path directory = settings.getTempRoot() / name;
    std::error_code ec;
    // Leftovers from a crashed run belong to the lease we now hold
    fs::remove_all(directory, ec);
    fs::create_directories(directory, ec);
    if (ec)
    {
        Logger::error("Could not create workspace " + directory.string() + ": " + ec.message());
        store.releaseWorkspace(name, owner);
        return nullptr;
    }
    Logger::debug("Acquired workspace " + directory.string());
    return std::unique_ptr<FrameWorkspace>(new FrameWorkspace(store, record_id, owner, directory));
}

FrameWorkspace::FrameWorkspace(CatalogStore &store, int64_t record_id, std::string owner, fs::path directory)
    : store_(store), record_id_(record_id), owner_(std::move(owner)), directory_(std::move(directory))
{
}

FrameWorkspace::~FrameWorkspace()
{
    std::error_code ec;
    fs::remove_all(directory_, ec);
    if (ec)
    {
        Logger::warn("Could not remove workspace " + directory_.string() + ": " + ec.message());
    }
    store_.releaseWorkspace(leaseName(record_id_), owner_);
    Logger::debug("Released workspace " + directory_.string());
}

std::optional<std::string> FrameWorkspace::writeFrame(const cv::Mat &frame, int jpeg_quality)
{
    std::vector<unsigned char> encoded;
    try
    {
        if (!cv::imencode(".jpg", frame, encoded, {cv::IMWRITE_JPEG_QUALITY, jpeg_quality}))
        {
            Logger::error("JPEG encoding failed for workspace " + directory_.string());
            return std::nullopt;
        }
    }
    catch (const cv::Exception &e)
    {
        Logger::error("JPEG encoding failed: " + std::string(e.what()));
        return std::nullopt;
    }

    fs::path target = directory_ / (ContentHasher::hashBytes(encoded) + ".jpg");
    if (FileUtils::isRegularFile(target.string()))
        return target.string();

    std::ofstream out(target, std::ios::binary);
    if (!out.is_open())
    {
        Logger::error("Could not write frame " + target.string());
        return std::nullopt;
    }
    out.write(reinterpret_cast<const char *>(encoded.data()), static_cast<std::streamsize>(encoded.size()));
    if (!out.good())
    {
        Logger::error("Short write for frame " + target.string());
        return std::nullopt;
    }
    return target.string();
}
