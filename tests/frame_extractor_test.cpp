#include "core/frame_extractor.hpp"
#include "support/gif_fixture.hpp"
#include "support/in_memory_catalog_store.hpp"
#include "test_base.hpp"
#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>

class FrameExtractorTest : public TestBase
{
protected:
    std::unique_ptr<FrameWorkspace> workspace(int64_t record_id)
    {
        auto ws = FrameWorkspace::acquire(store_, settings_, record_id);
        EXPECT_NE(ws, nullptr);
        return ws;
    }

    // MJPEG AVI through OpenCV's built-in writer, frame i filled with grey level i
    std::string writeVideo(const std::string &relative, int frames, double fps)
    {
        std::string path = pathOf(relative);
        fs::create_directories(fs::path(path).parent_path());
        cv::VideoWriter writer(path, cv::VideoWriter::fourcc('M', 'J', 'P', 'G'), fps, cv::Size(64, 48));
        EXPECT_TRUE(writer.isOpened());
        for (int i = 0; i < frames; ++i)
        {
            writer.write(cv::Mat(48, 64, CV_8UC3, cv::Scalar(i * 5 % 255, 0, 0)));
        }
        writer.release();
        return path;
    }

    InMemoryCatalogStore store_;
};

TEST_F(FrameExtractorTest, EvenlySpacedIndicesForThirtySevenFrames)
{
    auto indices = FrameExtractor::evenlySpacedIndices(37, 10);
    std::vector<int64_t> expected = {0, 3, 7, 11, 14, 18, 22, 25, 29, 33};
    EXPECT_EQ(indices, expected);
}

TEST_F(FrameExtractorTest, EvenlySpacedIndicesShortInput)
{
    EXPECT_EQ(FrameExtractor::evenlySpacedIndices(4, 10), (std::vector<int64_t>{0, 1, 2, 3}));
    EXPECT_TRUE(FrameExtractor::evenlySpacedIndices(0, 10).empty());
    EXPECT_EQ(FrameExtractor::evenlySpacedIndices(10, 10).size(), 10u);
}

TEST_F(FrameExtractorTest, ImagePassesThrough)
{
    FrameExtractor extractor(settings_);
    auto path = writeFile("meme.jpg", "not decoded");
    auto result = extractor.extractImage(ImageMedia{1, path});
    ASSERT_TRUE(result.status.success);
    EXPECT_EQ(result.sample_paths, std::vector<std::string>{path});
}

TEST_F(FrameExtractorTest, MissingImageIsExtractionError)
{
    FrameExtractor extractor(settings_);
    auto result = extractor.extractImage(ImageMedia{1, pathOf("gone.jpg")});
    EXPECT_FALSE(result.status.success);
    EXPECT_EQ(result.status.error_kind, PipelineErrorKind::EXTRACTION);
}

TEST_F(FrameExtractorTest, AlbumKeepsDisplayOrderAndRejectsUnreachableItems)
{
    FrameExtractor extractor(settings_);
    AlbumMedia album{7, pathOf("albums/story"), {}};
    album.items.push_back({7, writeFile("albums/story/a.jpg", "1"), 1, std::nullopt, 1});
    album.items.push_back({7, writeFile("albums/story/b.jpg", "2"), 2, std::nullopt, 1});

    auto result = extractor.extractAlbum(album);
    ASSERT_TRUE(result.status.success);
    ASSERT_EQ(result.sample_paths.size(), 2u);
    EXPECT_EQ(result.sample_paths[0], album.items[0].path);

    album.items.push_back({7, pathOf("albums/story/c.jpg"), 3, std::nullopt, 1});
    result = extractor.extractAlbum(album);
    EXPECT_FALSE(result.status.success);
    EXPECT_NE(result.status.error_message.find("album item 3"), std::string::npos);
}

TEST_F(FrameExtractorTest, GifSamplesTenEvenlySpacedFrames)
{
    FrameExtractor extractor(settings_);
    auto path = writeBytes("anim.gif", makeTinyGif(37));
    auto ws = workspace(3);
    ASSERT_NE(ws, nullptr);

    auto result = extractor.extract(GifMedia{3, path}, *ws, DecodeDeadline::after(std::chrono::seconds(30)));
    ASSERT_TRUE(result.status.success) << result.status.error_message;
    std::vector<int64_t> expected = {0, 3, 7, 11, 14, 18, 22, 25, 29, 33};
    EXPECT_EQ(result.frame_indices, expected);
    ASSERT_EQ(result.sample_paths.size(), 10u);
    for (const auto &sample : result.sample_paths)
    {
        EXPECT_TRUE(FileUtils::isWithin(fs::path(sample), ws->directory()));
        EXPECT_TRUE(fs::exists(sample));
    }
}

TEST_F(FrameExtractorTest, CorruptGifIsExtractionError)
{
    FrameExtractor extractor(settings_);
    auto path = writeFile("broken.gif", "GIF89a but not really");
    auto ws = workspace(4);
    ASSERT_NE(ws, nullptr);
    auto result = extractor.extract(GifMedia{4, path}, *ws, DecodeDeadline::after(std::chrono::seconds(30)));
    EXPECT_FALSE(result.status.success);
    EXPECT_EQ(result.status.error_kind, PipelineErrorKind::EXTRACTION);
}

TEST_F(FrameExtractorTest, ExpiredDeadlineIsTimeout)
{
    FrameExtractor extractor(settings_);
    auto path = writeBytes("anim.gif", makeTinyGif(5));
    auto ws = workspace(5);
    ASSERT_NE(ws, nullptr);
    auto result = extractor.extract(GifMedia{5, path}, *ws, DecodeDeadline::after(std::chrono::milliseconds(0)));
    EXPECT_FALSE(result.status.success);
    EXPECT_EQ(result.status.error_kind, PipelineErrorKind::TIMEOUT);
}

TEST_F(FrameExtractorTest, VideoSampledAtFixedRateWithThumbnail)
{
    FrameExtractor extractor(settings_);
    auto path = writeVideo("clip.avi", 40, 10.0); // 4 seconds
    auto ws = workspace(9);
    ASSERT_NE(ws, nullptr);

    auto result = extractor.extract(VideoMedia{9, path}, *ws, DecodeDeadline::after(std::chrono::seconds(60)));
    ASSERT_TRUE(result.status.success) << result.status.error_message;
    // 2 fps over 4 seconds
    EXPECT_EQ(result.sample_paths.size(), 8u);
    ASSERT_FALSE(result.frame_indices.empty());
    EXPECT_EQ(result.frame_indices.front(), 0);
    ASSERT_TRUE(result.thumbnail_path.has_value());
    EXPECT_EQ(*result.thumbnail_path, extractor.thumbnailPath(9).string());
    EXPECT_TRUE(fs::exists(*result.thumbnail_path));
}

TEST_F(FrameExtractorTest, VideoSampleCountIsCapped)
{
    settings_.video_max_frames = 3;
    FrameExtractor extractor(settings_);
    auto path = writeVideo("long.avi", 60, 10.0);
    auto ws = workspace(10);
    ASSERT_NE(ws, nullptr);
    auto result = extractor.extract(VideoMedia{10, path}, *ws, DecodeDeadline::after(std::chrono::seconds(60)));
    ASSERT_TRUE(result.status.success) << result.status.error_message;
    EXPECT_EQ(result.frame_indices, (std::vector<int64_t>{0, 5, 10}));
}

TEST_F(FrameExtractorTest, WorkspaceIsRemovedAndLeaseReleased)
{
    fs::path directory;
    {
        auto ws = workspace(11);
        ASSERT_NE(ws, nullptr);
        directory = ws->directory();
        EXPECT_TRUE(fs::is_directory(directory));
        EXPECT_TRUE(store_.hasLease(FrameWorkspace::leaseName(11)));
        // A second worker cannot take the same record
        EXPECT_EQ(FrameWorkspace::acquire(store_, settings_, 11), nullptr);
    }
    EXPECT_FALSE(fs::exists(directory));
    EXPECT_FALSE(store_.hasLease(FrameWorkspace::leaseName(11)));
}
