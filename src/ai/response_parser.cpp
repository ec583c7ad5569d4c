#include "ai/response_parser.hpp"
#include "core/file_utils.hpp"
#include <cctype>
#include <set>

namespace
{
    const std::string FENCE = "```";

    bool isLanguageTagChar(char c)
    {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '+' || c == '.';
    }

    std::optional<std::string> fieldOf(const nlohmann::json &object, const char *key)
    {
        auto it = object.find(key);
        if (it == object.end())
            return std::nullopt;
        return ResponseParser::normalizeValue(*it);
    }

    void addTagName(const std::string &candidate, std::vector<std::string> &names, std::set<std::string> &seen)
    {
        std::string name = FileUtils::trim(candidate);
        if (name.empty())
            return;
        if (seen.insert(FileUtils::toLower(name)).second)
            names.push_back(name);
    }

    void splitTagString(const std::string &text, std::vector<std::string> &names, std::set<std::string> &seen)
    {
        std::string current;
        for (char c : text)
        {
            if (c == ',' || c == '\n')
            {
                addTagName(current, names, seen);
                current.clear();
            }
            else
            {
                current.push_back(c);
            }
        }
        addTagName(current, names, seen);
    }
}

std::string ResponseParser::stripCodeFence(const std::string &raw)
{
    std::string text = FileUtils::trim(raw);
    if (text.compare(0, FENCE.size(), FENCE) == 0)
    {
        size_t pos = FENCE.size();
        while (pos < text.size() && isLanguageTagChar(text[pos]))
            pos++;
        text = text.substr(pos);
        if (text.size() >= FENCE.size() && text.compare(text.size() - FENCE.size(), FENCE.size(), FENCE) == 0)
            text.resize(text.size() - FENCE.size());
        text = FileUtils::trim(text);
    }
    return text;
}

std::optional<std::string> ResponseParser::normalizeValue(const nlohmann::json &value)
{
    if (value.is_null())
        return std::nullopt;
    if (value.is_string())
        return value.get<std::string>();
    if (value.is_array())
    {
        std::string joined;
        bool first = true;
        for (const auto &element : value)
        {
            if (!first)
                joined += "\n";
            joined += element.is_string() ? element.get<std::string>() : element.dump();
            first = false;
        }
        return joined;
    }
    return value.dump();
}

std::vector<std::string> ResponseParser::parseTagNames(const nlohmann::json &value)
{
    std::vector<std::string> names;
    std::set<std::string> seen;
    if (value.is_string())
    {
        splitTagString(value.get<std::string>(), names, seen);
    }
    else if (value.is_array())
    {
        for (const auto &element : value)
        {
            if (element.is_string())
                addTagName(element.get<std::string>(), names, seen);
        }
    }
    return names;
}

ProcessingResult ResponseParser::parse(const std::string &raw, ParsedAnalysis &out)
{
    std::string text = stripCodeFence(raw);
    if (text.empty())
    {
        return ProcessingResult::Failure(PipelineErrorKind::PARSE, "AI response is empty");
    }

    nlohmann::json document;
    try
    {
        document = nlohmann::json::parse(text);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        return ProcessingResult::Failure(PipelineErrorKind::PARSE, "AI response is not valid JSON: " + std::string(e.what()));
    }
    if (!document.is_object())
    {
        return ProcessingResult::Failure(PipelineErrorKind::PARSE,
                                         "AI response is JSON but not an object (" + std::string(document.type_name()) + ")");
    }

    ParsedAnalysis parsed;
    parsed.fields.references = fieldOf(document, "references");
    parsed.fields.template_text = fieldOf(document, "template");
    parsed.fields.caption = fieldOf(document, "caption");
    parsed.fields.description = fieldOf(document, "description");
    parsed.fields.meaning = fieldOf(document, "meaning");
    auto tags = document.find("tags");
    if (tags != document.end())
        parsed.tag_names = parseTagNames(*tags);

    out = std::move(parsed);
    return ProcessingResult(true);
}
