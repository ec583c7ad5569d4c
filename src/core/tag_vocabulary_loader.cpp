#include "core/tag_vocabulary_loader.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <fstream>
#include <set>
#include <sstream>
#include <yaml-cpp/yaml.h>

TagVocabularyLoader::TagVocabularyLoader(CatalogStore &store)
    : store_(store)
{
}

std::vector<Tag> TagVocabularyLoader::parse(const std::string &yaml_text, std::string &error)
{
    std::vector<Tag> tags;
    try
    {
        YAML::Node root = YAML::Load(yaml_text);
        const YAML::Node &list = root["tags"];
        if (!list || !list.IsSequence())
        {
            error = "document has no 'tags' list";
            return {};
        }
        for (const auto &node : list)
        {
            Tag tag;
            if (node.IsScalar())
            {
                tag.name = FileUtils::trim(node.as<std::string>());
            }
            else
            {
                tag.name = FileUtils::trim(node["name"].as<std::string>(std::string()));
                tag.description = node["description"].as<std::string>(std::string());
                tag.color = node["color"].as<std::string>(std::string());
                tag.parse_from_filename = node["parse_from_filename"].as<bool>(false);
                tag.ai_can_suggest = node["ai_can_suggest"].as<bool>(false);
            }
            if (tag.name.empty())
            {
                Logger::warn("Skipping tag entry without a name");
                continue;
            }
            tags.push_back(tag);
        }
    }
    catch (const YAML::Exception &e)
    {
        error = std::string("invalid tag vocabulary: ") + e.what();
        return {};
    }
    return tags;
}

VocabularyImportResult TagVocabularyLoader::import(const std::vector<Tag> &tags)
{
    VocabularyImportResult result;
    std::set<std::string> known;
    for (const auto &tag : store_.listTags())
        known.insert(FileUtils::toLower(tag.name));

    for (const auto &tag : tags)
    {
        if (!known.insert(FileUtils::toLower(tag.name)).second)
        {
            result.existing++;
            continue;
        }
        auto [status, id] = store_.insertTag(tag);
        if (!status.success)
        {
            result.error_message = "could not insert tag '" + tag.name + "': " + status.error_message;
            Logger::error(result.error_message);
            return result;
        }
        Logger::debug("Inserted tag '" + tag.name + "' as #" + std::to_string(id));
        result.inserted++;
    }
    result.success = true;
    Logger::info("Tag vocabulary: " + std::to_string(result.inserted) + " inserted, " +
                 std::to_string(result.existing) + " already present");
    return result;
}

VocabularyImportResult TagVocabularyLoader::loadString(const std::string &yaml_text)
{
    std::string error;
    auto tags = parse(yaml_text, error);
    if (!error.empty())
    {
        VocabularyImportResult result;
        result.error_message = error;
        Logger::error(error);
        return result;
    }
    return import(tags);
}

VocabularyImportResult TagVocabularyLoader::loadFile(const std::string &file_path)
{
    std::ifstream in(file_path);
    if (!in.is_open())
    {
        VocabularyImportResult result;
        result.error_message = "cannot open " + file_path;
        Logger::error("Tag vocabulary file " + result.error_message);
        return result;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    Logger::info("Importing tag vocabulary from " + file_path);
    return loadString(buffer.str());
}
