#include "core/tag_reconciler.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <map>

TagReconciler::TagReconciler(CatalogStore &store, const PipelineSettings &settings)
    : store_(store), settings_(settings)
{
}

std::string TagReconciler::pathHaystack(const MediaRecord &record) const
{
    fs::path path(record.path);
    std::string name = path.filename().string();
    std::string folder = FileUtils::relativePath(path.parent_path().string(), settings_.getMediaRoot().string());
    if (folder == ".")
        folder.clear();
    // Separated so a match never spans the two parts
    return FileUtils::toLower(name) + "\n" + FileUtils::toLower(folder);
}

std::vector<int64_t> TagReconciler::matchPathTags(const MediaRecord &record, const std::vector<Tag> &tags) const
{
    std::vector<int64_t> matches;
    std::string haystack = pathHaystack(record);
    for (const auto &tag : tags)
    {
        if (!tag.parse_from_filename)
            continue;
        std::string needle = FileUtils::toLower(FileUtils::trim(tag.name));
        if (needle.empty())
            continue;
        if (haystack.find(needle) != std::string::npos)
            matches.push_back(tag.id);
    }
    return matches;
}

int TagReconciler::apply(const MediaRecord &record, const std::vector<int64_t> &tag_ids)
{
    int applied = 0;
    for (int64_t tag_id : tag_ids)
    {
        if (store_.addMemeTagIfAbsent(record.id, tag_id))
            applied++;
    }
    return applied;
}

int TagReconciler::applyPathTags(const MediaRecord &record, const std::vector<Tag> &tags)
{
    int applied = apply(record, matchPathTags(record, tags));
    if (applied > 0)
    {
        Logger::info("Record " + std::to_string(record.id) + ": " + std::to_string(applied) + " tag(s) from path");
    }
    return applied;
}

int TagReconciler::applyPathTags(const MediaRecord &record)
{
    return applyPathTags(record, store_.listTags());
}

int TagReconciler::applyAiTags(const MediaRecord &record, const std::vector<std::string> &names)
{
    if (names.empty())
        return 0;

    std::map<std::string, int64_t> suggestable;
    for (const auto &tag : store_.listTags())
    {
        if (tag.ai_can_suggest)
            suggestable.emplace(FileUtils::toLower(tag.name), tag.id);
    }

    std::vector<int64_t> tag_ids;
    for (const auto &name : names)
    {
        auto it = suggestable.find(FileUtils::toLower(FileUtils::trim(name)));
        if (it == suggestable.end())
        {
            Logger::warn("TagMappingWarning: record " + std::to_string(record.id) + " got unknown tag '" + name +
                         "' from AI, ignored");
            continue;
        }
        tag_ids.push_back(it->second);
    }

    int applied = apply(record, tag_ids);
    if (applied > 0)
    {
        Logger::info("Record " + std::to_string(record.id) + ": " + std::to_string(applied) + " tag(s) from AI");
    }
    return applied;
}

int TagReconciler::applyPathTagsToAll()
{
    auto tags = store_.listTags();
    int applied = 0;
    for (const auto &record : store_.listMedia())
    {
        if (record.isDuplicate())
            continue;
        applied += applyPathTags(record, tags);
    }
    Logger::info("Path tagging applied " + std::to_string(applied) + " new tag(s)");
    return applied;
}
