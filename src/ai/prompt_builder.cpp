#include "ai/prompt_builder.hpp"
#include <sstream>

namespace
{
    const char *SYSTEM_PROMPT =
        "You're a meme expert. You're very smart and see meanings between the lines. "
        "You know all famous persons and all characters from every show, movie and game. "
        "Use correct meme names (like Pepe, Wojak, etc.) and media references.";

    const char *RESPONSE_SHAPE =
        "Analyze it and return json of the following structure: {"
        "references: \"Analyze the image to see if it features any famous persons or characters from movies, "
        "shows, cartoons or games. If it does, put that information here. If not, omit\", "
        "template: \"If the images features an established meme character or template (such as 'trollface', "
        "'wojak', 'Pepe the Frog', 'Loss'), name it here, otherwise omit\", "
        "caption: \"If the image includes any captions, put them here in the original language, otherwise omit\", "
        "description: \"Describe the image with its captions (if any) in mind\", "
        "meaning: \"Explain what this meme means, using information you determined earlier\", "
        "tags: \"Comma-separated tags that apply to this meme, chosen only from the list below, otherwise omit\"}";

    struct FramingVisitor
    {
        size_t sample_count;

        std::string operator()(const ImageMedia &) const
        {
            return "This image is a meme.";
        }
        std::string operator()(const GifMedia &) const
        {
            return "These " + std::to_string(sample_count) +
                   " images are frames sampled in order from one animated GIF meme. "
                   "Treat them as a single animation; the image in the instructions below means the whole GIF.";
        }
        std::string operator()(const VideoMedia &) const
        {
            return "These " + std::to_string(sample_count) +
                   " images are frames sampled in order from one video meme. "
                   "Treat them as a single clip; the image in the instructions below means the whole video.";
        }
        std::string operator()(const AlbumMedia &) const
        {
            return "These " + std::to_string(sample_count) +
                   " images form one meme album, shown in their intended reading order. "
                   "Analyze them together as a single meme; the image in the instructions below means the whole album.";
        }
    };
}

std::string PromptBuilder::systemPrompt()
{
    return SYSTEM_PROMPT;
}

std::string PromptBuilder::framing(const MediaKind &kind, size_t sample_count)
{
    return std::visit(FramingVisitor{sample_count}, kind);
}

std::string PromptBuilder::tagsInstruction(const std::vector<Tag> &suggestable_tags)
{
    if (suggestable_tags.empty())
        return "";
    std::ostringstream out;
    out << "Available tags (use only these exact names, never invent new ones):\n";
    for (const auto &tag : suggestable_tags)
    {
        out << "- " << tag.name;
        if (!tag.description.empty())
            out << ": " << tag.description;
        out << "\n";
    }
    return out.str();
}

std::string PromptBuilder::userPrompt(const MediaKind &kind, size_t sample_count, const std::vector<Tag> &suggestable_tags)
{
    std::string prompt = framing(kind, sample_count) + " " + RESPONSE_SHAPE;
    std::string tags = tagsInstruction(suggestable_tags);
    if (tags.empty())
    {
        prompt += "\nNo tags are available, omit the tags field.";
    }
    else
    {
        prompt += "\n" + tags;
    }
    return prompt;
}
