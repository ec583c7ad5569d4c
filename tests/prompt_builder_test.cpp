#include <gtest/gtest.h>
#include "ai/prompt_builder.hpp"

namespace
{
    Tag makeTag(const std::string &name, const std::string &description)
    {
        Tag tag;
        tag.name = name;
        tag.description = description;
        tag.ai_can_suggest = true;
        return tag;
    }
}

TEST(PromptBuilderTest, SystemPromptNamesTheRole)
{
    EXPECT_NE(PromptBuilder::systemPrompt().find("meme expert"), std::string::npos);
}

TEST(PromptBuilderTest, FramingFollowsMediaKind)
{
    auto image = PromptBuilder::userPrompt(ImageMedia{1, "/m/a.jpg"}, 1, {});
    auto gif = PromptBuilder::userPrompt(GifMedia{2, "/m/a.gif"}, 10, {});
    auto video = PromptBuilder::userPrompt(VideoMedia{3, "/m/a.mp4"}, 20, {});
    auto album = PromptBuilder::userPrompt(AlbumMedia{4, "/m/albums/x", {}}, 3, {});

    EXPECT_EQ(image.rfind("This image is a meme.", 0), 0u);
    EXPECT_NE(gif.find("10 images are frames sampled in order from one animated GIF"), std::string::npos);
    EXPECT_NE(video.find("20 images are frames sampled in order from one video"), std::string::npos);
    EXPECT_NE(album.find("3 images form one meme album"), std::string::npos);

    for (const auto *prompt : {&image, &gif, &video, &album})
    {
        for (const char *key : {"references:", "template:", "caption:", "description:", "meaning:", "tags:"})
            EXPECT_NE(prompt->find(key), std::string::npos) << key;
    }
}

TEST(PromptBuilderTest, TagsInstructionListsSuggestableTags)
{
    std::vector<Tag> tags = {makeTag("pepe", "Pepe the Frog"), makeTag("cats", "")};
    auto instruction = PromptBuilder::tagsInstruction(tags);
    EXPECT_NE(instruction.find("- pepe: Pepe the Frog"), std::string::npos);
    EXPECT_NE(instruction.find("- cats\n"), std::string::npos);

    auto prompt = PromptBuilder::userPrompt(ImageMedia{1, "/m/a.jpg"}, 1, tags);
    EXPECT_NE(prompt.find(instruction), std::string::npos);
}

TEST(PromptBuilderTest, NoTagsNoTagList)
{
    EXPECT_EQ(PromptBuilder::tagsInstruction({}), "");
    auto prompt = PromptBuilder::userPrompt(ImageMedia{1, "/m/a.jpg"}, 1, {});
    EXPECT_EQ(prompt.find("Available tags"), std::string::npos);
}
