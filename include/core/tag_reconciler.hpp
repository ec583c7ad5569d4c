#pragma once

#include "core/pipeline_settings.hpp"
#include "database/catalog_store.hpp"
#include <string>
#include <vector>

/**
 * @brief Applies tag associations derived from paths and from AI suggestions.
 *
 * Both passes are idempotent: associations that already exist are skipped and
 * only newly created ones are counted. Neither pass creates tags.
 */
class TagReconciler
{
public:
    TagReconciler(CatalogStore &store, const PipelineSettings &settings);

    /**
     * @brief Path pass for one record
     * @return Number of associations created
     */
    int applyPathTags(const MediaRecord &record);

    /**
     * @brief AI pass for one record; unknown names are logged and ignored
     * @return Number of associations created
     */
    int applyAiTags(const MediaRecord &record, const std::vector<std::string> &names);

    // Path pass over every non-duplicate record
    int applyPathTagsToAll();

    // Ids of parse_from_filename tags whose name occurs in the record's path text
    std::vector<int64_t> matchPathTags(const MediaRecord &record, const std::vector<Tag> &tags) const;

    /**
     * @brief Lower-cased text the path pass searches: the file (or album folder)
     * name and the containing folder relative to the media root
     */
    std::string pathHaystack(const MediaRecord &record) const;

private:
    int applyPathTags(const MediaRecord &record, const std::vector<Tag> &tags);
    int apply(const MediaRecord &record, const std::vector<int64_t> &tag_ids);

    CatalogStore &store_;
    PipelineSettings settings_;
};
