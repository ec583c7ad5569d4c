#pragma once

#include "core/file_utils.hpp"
#include "core/pipeline_settings.hpp"
#include "database/catalog_store.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @brief Counts reported by one verification pass
 */
struct VerificationSummary
{
    int ok = 0;
    int hashed = 0;
    int relocated = 0;
    int errored = 0;
    std::vector<int64_t> reachable_ids; // records whose files (or all album items) are present after the pass
};

/**
 * @brief Confirms that catalogued files still exist and recovers moved ones.
 *
 * A missing file with a known content hash is searched for in two phases:
 * first among files with the same base name, then by hashing the whole media
 * tree. The second phase is serialized per verifier and reuses digests
 * computed earlier in the same pass.
 */
class IdentityVerifier
{
public:
    IdentityVerifier(CatalogStore &store, const PipelineSettings &settings);

    /**
     * @brief Verify the given records
     * @param records Records to check; duplicate audit records are skipped
     * @return Summary counts and the ids of reachable records
     */
    VerificationSummary verify(const std::vector<MediaRecord> &records);

    // Verify every record in the catalog
    VerificationSummary verifyAll();

    /**
     * @brief Fast relocation phase: files with the given base name whose content matches
     * @return Path of the first uncatalogued match, else the first one held only by a duplicate row
     */
    std::optional<std::string> findByFilename(const std::string &file_name, const std::string &content_hash,
                                              const std::set<std::string> &excluded = {});

    /**
     * @brief Slow relocation phase: hash every file under the media root until one matches
     */
    std::optional<std::string> findByFullScan(const std::string &content_hash,
                                              const std::set<std::string> &excluded = {});

private:
    enum class FileOutcome
    {
        PRESENT,
        HASHED,
        RELOCATED,
        UNRECOVERABLE
    };

    struct FileCheck
    {
        FileOutcome outcome = FileOutcome::PRESENT;
        std::string path;
        std::optional<std::string> content_hash;
        uint64_t size = 0;
        std::string reason;
    };

    // Matches found by one search phase
    struct CandidateMatch
    {
        std::optional<std::string> unclaimed;  // not catalogued at all
        std::optional<std::string> audit_held; // catalogued only by a duplicate audit row

        std::optional<std::string> best() const { return unclaimed ? unclaimed : audit_held; }
    };

    FileCheck checkFile(const std::string &path, const std::optional<std::string> &content_hash,
                        const std::set<std::string> &excluded);
    bool verifyMedia(const MediaRecord &record, VerificationSummary &summary);
    bool verifyAlbum(const MediaRecord &record, VerificationSummary &summary);

    std::optional<std::string> relocate(const std::string &missing_path, const std::string &content_hash,
                                        const std::set<std::string> &excluded);
    CandidateMatch searchByFilename(const std::string &file_name, const std::string &content_hash,
                                    const std::set<std::string> &excluded);
    CandidateMatch searchByFullScan(const std::string &content_hash, const std::set<std::string> &excluded);
    // Record a content match; returns false once an uncatalogued match ends the walk
    bool offer(const std::string &candidate, CandidateMatch &match);
    std::optional<std::string> cachedHash(const std::string &path);
    bool isCandidate(const std::string &path, const std::set<std::string> &excluded);
    bool isReservedDirectory(const fs::path &dir) const;

    CatalogStore &store_;
    PipelineSettings settings_;

    std::mutex scan_mutex_;
    std::mutex cache_mutex_;
    std::unordered_map<std::string, std::optional<std::string>> pass_hashes_;
};
