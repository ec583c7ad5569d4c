#include "core/directory_scanner.hpp"
#include "support/in_memory_catalog_store.hpp"
#include "test_base.hpp"

class DirectoryScannerTest : public TestBase
{
protected:
    int nonDuplicateCount()
    {
        int count = 0;
        for (const auto &record : store_.listMedia())
        {
            if (!record.isDuplicate())
                count++;
        }
        return count;
    }

    InMemoryCatalogStore store_;
};

TEST_F(DirectoryScannerTest, RegistersSupportedFilesByType)
{
    writeFile("a.jpg", "image");
    writeFile("b.GIF", "gif");
    writeFile("c.mp4", "video");
    writeFile("notes.txt", "unsupported");

    DirectoryScanner scanner(store_, settings_);
    auto summary = scanner.scan();
    EXPECT_EQ(summary.added, 3);
    EXPECT_EQ(summary.skipped, 1);

    EXPECT_EQ(store_.findMediaByPath(pathOf("a.jpg"))->media_type, MediaType::IMAGE);
    EXPECT_EQ(store_.findMediaByPath(pathOf("b.GIF"))->media_type, MediaType::GIF);
    EXPECT_EQ(store_.findMediaByPath(pathOf("c.mp4"))->media_type, MediaType::VIDEO);
    EXPECT_EQ(store_.findMediaByPath(pathOf("a.jpg"))->status, MediaStatus::NEW);
    EXPECT_TRUE(store_.findMediaByPath(pathOf("a.jpg"))->content_hash.has_value());
}

TEST_F(DirectoryScannerTest, SecondScanAddsNothing)
{
    writeFile("a.jpg", "image a");
    writeFile("sub/b.png", "image b");
    writeFile("albums/story/1.jpg", "panel");

    DirectoryScanner scanner(store_, settings_);
    scanner.scan();
    int after_first = nonDuplicateCount();
    auto second = scanner.scan();
    EXPECT_EQ(second.added, 0);
    EXPECT_EQ(second.duplicates, 0);
    EXPECT_EQ(nonDuplicateCount(), after_first);
    EXPECT_EQ(store_.listMedia().size(), 3u);
}

TEST_F(DirectoryScannerTest, BitIdenticalCopyBecomesDuplicateAuditRecord)
{
    writeFile("meme.jpg", "same bytes");
    writeFile("meme_copy.jpg", "same bytes");

    DirectoryScanner scanner(store_, settings_);
    auto summary = scanner.scan();
    EXPECT_EQ(summary.added, 1);
    EXPECT_EQ(summary.duplicates, 1);

    auto original = store_.findMediaByPath(pathOf("meme.jpg"));
    ASSERT_TRUE(original.has_value());
    EXPECT_EQ(original->status, MediaStatus::NEW);

    std::optional<MediaRecord> copy;
    for (const auto &record : store_.listMedia())
    {
        if (record.path == pathOf("meme_copy.jpg"))
            copy = record;
    }
    ASSERT_TRUE(copy.has_value());
    EXPECT_EQ(copy->status, MediaStatus::ERROR);
    EXPECT_EQ(copy->duplicate_of, original->id);
    EXPECT_NE(copy->error_message->find("#" + std::to_string(original->id)), std::string::npos);
    EXPECT_EQ(copy->error_message->rfind("DuplicateError: ", 0), 0u);

    // Rescanning does not create a second audit record
    auto again = scanner.scan();
    EXPECT_EQ(again.duplicates, 0);
    EXPECT_EQ(store_.listMedia().size(), 2u);
}

TEST_F(DirectoryScannerTest, SystemSubtreeAndArtifactsAreIgnored)
{
    writeFile("_system/thumbnails/1_thumb.jpg", "thumb");
    writeFile("_system/temp/record-1/frame.jpg", "frame");
    writeFile("clip_preview.mp4", "preview");
    writeFile("real.jpg", "real");

    DirectoryScanner scanner(store_, settings_);
    auto summary = scanner.scan();
    EXPECT_EQ(summary.added, 1);
    ASSERT_EQ(store_.listMedia().size(), 1u);
    EXPECT_EQ(store_.listMedia()[0].path, pathOf("real.jpg"));
}

TEST_F(DirectoryScannerTest, AlbumFolderBecomesOneOrderedRecord)
{
    writeFile("albums/story/02.jpg", "second");
    writeFile("albums/story/01.jpg", "first");
    writeFile("albums/story/10.png", "third");
    writeFile("albums/story/readme.txt", "ignored");
    fs::create_directories(pathOf("albums/empty"));

    DirectoryScanner scanner(store_, settings_);
    auto summary = scanner.scan();
    EXPECT_EQ(summary.added, 1);

    auto album = store_.findMediaByPath(pathOf("albums/story"));
    ASSERT_TRUE(album.has_value());
    EXPECT_EQ(album->media_type, MediaType::ALBUM);
    EXPECT_EQ(*album->title, "story");
    EXPECT_FALSE(album->content_hash.has_value());
    EXPECT_EQ(album->size, std::string("second").size() + std::string("first").size() + std::string("third").size());

    auto items = store_.getAlbumItems(album->id);
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0].path, pathOf("albums/story/01.jpg"));
    EXPECT_EQ(items[0].display_order, 1);
    EXPECT_EQ(items[1].path, pathOf("albums/story/02.jpg"));
    EXPECT_EQ(items[2].path, pathOf("albums/story/10.png"));
    EXPECT_EQ(items[2].display_order, 3);

    // Items are not registered as separate records, empty folders wait for content
    EXPECT_FALSE(store_.findMediaByPath(pathOf("albums/story/01.jpg")).has_value());
    EXPECT_FALSE(store_.findMediaByPath(pathOf("albums/empty")).has_value());
}

TEST_F(DirectoryScannerTest, AlbumItemsFollowNumericOrder)
{
    writeFile("albums/comic/10.jpg", "ten");
    writeFile("albums/comic/2.jpg", "two");
    writeFile("albums/comic/1.jpg", "one");

    DirectoryScanner scanner(store_, settings_);
    scanner.scan();

    auto album = store_.findMediaByPath(pathOf("albums/comic"));
    ASSERT_TRUE(album.has_value());
    auto items = store_.getAlbumItems(album->id);
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0].path, pathOf("albums/comic/1.jpg"));
    EXPECT_EQ(items[1].path, pathOf("albums/comic/2.jpg"));
    EXPECT_EQ(items[2].path, pathOf("albums/comic/10.jpg"));
    EXPECT_EQ(items[2].display_order, 3);
}

TEST_F(DirectoryScannerTest, ClassifyPrefersGifOverImageLists)
{
    settings_.image_extensions.push_back("gif");
    DirectoryScanner scanner(store_, settings_);
    EXPECT_EQ(scanner.classify("x.gif"), MediaType::GIF);
    EXPECT_EQ(scanner.classify("x.webm"), MediaType::VIDEO);
    EXPECT_FALSE(scanner.classify("x").has_value());
}
