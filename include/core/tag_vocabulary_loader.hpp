#pragma once

#include "database/catalog_store.hpp"
#include <string>
#include <vector>

struct VocabularyImportResult
{
    bool success = false;
    std::string error_message;
    int inserted = 0;
    int existing = 0; // names already in the catalog (case-insensitive)
};

/**
 * @brief Seeds the tag table from a YAML document of the form
 *
 *   tags:
 *     - name: pepe
 *       description: Pepe the Frog
 *       color: "#3a7d44"
 *       parse_from_filename: true
 *       ai_can_suggest: true
 *
 * Tags are only inserted; existing tags are never modified.
 */
class TagVocabularyLoader
{
public:
    explicit TagVocabularyLoader(CatalogStore &store);

    VocabularyImportResult loadFile(const std::string &file_path);
    VocabularyImportResult loadString(const std::string &yaml_text);

    // Parse without touching the catalog
    static std::vector<Tag> parse(const std::string &yaml_text, std::string &error);

private:
    VocabularyImportResult import(const std::vector<Tag> &tags);

    CatalogStore &store_;
};
