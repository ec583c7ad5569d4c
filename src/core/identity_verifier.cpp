#include "core/identity_verifier.hpp"
#include "core/content_hasher.hpp"
#include "core/pipeline_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>

IdentityVerifier::IdentityVerifier(CatalogStore &store, const PipelineSettings &settings)
    : store_(store), settings_(settings)
{
}

VerificationSummary IdentityVerifier::verifyAll()
{
    return verify(store_.listMedia());
}

VerificationSummary IdentityVerifier::verify(const std::vector<MediaRecord> &records)
{
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        pass_hashes_.clear();
    }

    VerificationSummary summary;
    for (const auto &record : records)
    {
        if (record.isDuplicate())
            continue;
        bool reachable = record.isAlbum() ? verifyAlbum(record, summary) : verifyMedia(record, summary);
        if (reachable)
            summary.reachable_ids.push_back(record.id);
    }

    Logger::info("Identity verification: ok=" + std::to_string(summary.ok) +
                 " hashed=" + std::to_string(summary.hashed) +
                 " relocated=" + std::to_string(summary.relocated) +
                 " errored=" + std::to_string(summary.errored));
    return summary;
}

bool IdentityVerifier::verifyMedia(const MediaRecord &record, VerificationSummary &summary)
{
    FileCheck check = checkFile(record.path, record.content_hash, {});
    switch (check.outcome)
    {
    case FileOutcome::PRESENT:
        summary.ok++;
        return true;
    case FileOutcome::HASHED:
    {
        auto result = store_.updateContentHash(record.id, *check.content_hash, check.size);
        if (!result.success)
        {
            Logger::error("Failed to store content hash for #" + std::to_string(record.id) + ": " + result.error_message);
        }
        summary.hashed++;
        return true;
    }
    case FileOutcome::RELOCATED:
    {
        auto result = store_.relocateMedia(record.id, check.path, check.size);
        if (!result.success)
        {
            Logger::error("Failed to relocate #" + std::to_string(record.id) + ": " + result.error_message);
            summary.errored++;
            return false;
        }
        Logger::info("Relocated #" + std::to_string(record.id) + ": " + record.path + " -> " + check.path);
        summary.relocated++;
        return true;
    }
    case FileOutcome::UNRECOVERABLE:
        break;
    }

    std::string message = PipelineErrors::format(PipelineErrorKind::IDENTITY, check.reason);
    Logger::warn("Record #" + std::to_string(record.id) + " unrecoverable: " + check.reason);
    auto result = store_.markError(record.id, message);
    if (!result.success)
    {
        Logger::error("Failed to mark #" + std::to_string(record.id) + " as error: " + result.error_message);
    }
    summary.errored++;
    return false;
}

bool IdentityVerifier::verifyAlbum(const MediaRecord &record, VerificationSummary &summary)
{
    auto items = store_.getAlbumItems(record.id);
    std::set<std::string> taken;
    std::vector<AlbumItem> changed;
    std::set<std::string> relocated_parents;
    bool any_hashed = false;
    bool any_relocated = false;

    for (const auto &item : items)
    {
        FileCheck check = checkFile(item.path, item.content_hash, taken);
        if (check.outcome == FileOutcome::UNRECOVERABLE)
        {
            std::string reason = "album item " + std::to_string(item.display_order) + " (" + item.path + "): " + check.reason;
            Logger::warn("Album #" + std::to_string(record.id) + " unrecoverable: " + reason);
            auto result = store_.markError(record.id, PipelineErrors::format(PipelineErrorKind::IDENTITY, reason));
            if (!result.success)
            {
                Logger::error("Failed to mark album #" + std::to_string(record.id) + " as error: " + result.error_message);
            }
            summary.errored++;
            return false;
        }
        taken.insert(check.path);
        if (check.outcome == FileOutcome::PRESENT)
            continue;

        AlbumItem updated = item;
        updated.path = check.path;
        updated.content_hash = check.content_hash;
        updated.size = check.size;
        changed.push_back(updated);
        if (check.outcome == FileOutcome::RELOCATED)
        {
            any_relocated = true;
            relocated_parents.insert(fs::path(check.path).parent_path().string());
            Logger::info("Relocated album #" + std::to_string(record.id) + " item " +
                         std::to_string(item.display_order) + ": " + item.path + " -> " + check.path);
        }
        else
        {
            any_hashed = true;
        }
    }

    // Only persisted once every item is accounted for
    for (const auto &item : changed)
    {
        auto result = store_.updateAlbumItem(item);
        if (!result.success)
        {
            Logger::error("Failed to update album item: " + result.error_message);
        }
    }

    if (any_relocated && !FileUtils::isValidDirectory(record.path) && relocated_parents.size() == 1)
    {
        bool all_relocated = std::all_of(items.begin(), items.end(), [&](const AlbumItem &item)
                                         { return !FileUtils::isRegularFile(item.path); });
        const std::string &new_folder = *relocated_parents.begin();
        if (all_relocated && !store_.isPathClaimed(new_folder))
        {
            auto result = store_.updateMediaPath(record.id, new_folder);
            if (result.success)
            {
                Logger::info("Album #" + std::to_string(record.id) + " folder followed its items to " + new_folder);
            }
            else
            {
                Logger::error("Failed to move album #" + std::to_string(record.id) + ": " + result.error_message);
            }
        }
    }

    if (any_relocated)
        summary.relocated++;
    else if (any_hashed)
        summary.hashed++;
    else
        summary.ok++;
    return true;
}

IdentityVerifier::FileCheck IdentityVerifier::checkFile(const std::string &path,
                                                        const std::optional<std::string> &content_hash,
                                                        const std::set<std::string> &excluded)
{
    FileCheck check;
    check.path = path;
    check.content_hash = content_hash;

    if (FileUtils::isRegularFile(path))
    {
        check.size = FileUtils::getFileSize(path).value_or(0);
        if (content_hash)
        {
            check.outcome = FileOutcome::PRESENT;
            return check;
        }
        auto digest = ContentHasher::hash(path);
        if (!digest)
        {
            // Present but unreadable right now; leave the hash for a later pass
            Logger::warn("Content hash unavailable for present file: " + path);
            check.outcome = FileOutcome::PRESENT;
            return check;
        }
        check.content_hash = digest;
        check.outcome = FileOutcome::HASHED;
        return check;
    }

    if (!content_hash)
    {
        check.outcome = FileOutcome::UNRECOVERABLE;
        check.reason = "file missing and no content hash recorded, cannot relocate";
        return check;
    }

    auto found = relocate(path, *content_hash, excluded);
    if (!found)
    {
        check.outcome = FileOutcome::UNRECOVERABLE;
        check.reason = "file missing and no file with matching content found under " + settings_.getMediaRoot().string();
        return check;
    }
    check.outcome = FileOutcome::RELOCATED;
    check.path = *found;
    check.size = FileUtils::getFileSize(*found).value_or(0);
    return check;
}

std::optional<std::string> IdentityVerifier::relocate(const std::string &missing_path, const std::string &content_hash,
                                                      const std::set<std::string> &excluded)
{
    std::string file_name = fs::path(missing_path).filename().string();
    CandidateMatch by_name = searchByFilename(file_name, content_hash, excluded);
    if (by_name.unclaimed)
        return by_name.unclaimed;
    Logger::info("No same-name match for " + missing_path + ", falling back to full content scan");
    CandidateMatch by_content = searchByFullScan(content_hash, excluded);
    if (by_content.unclaimed)
        return by_content.unclaimed;

    // Only copies recorded as duplicates are left
    auto held = by_name.audit_held ? by_name.audit_held : by_content.audit_held;
    if (held)
        Logger::info("Relocating " + missing_path + " onto a path recorded as duplicate: " + *held);
    return held;
}

std::optional<std::string> IdentityVerifier::findByFilename(const std::string &file_name, const std::string &content_hash,
                                                            const std::set<std::string> &excluded)
{
    return searchByFilename(file_name, content_hash, excluded).best();
}

std::optional<std::string> IdentityVerifier::findByFullScan(const std::string &content_hash,
                                                            const std::set<std::string> &excluded)
{
    return searchByFullScan(content_hash, excluded).best();
}

bool IdentityVerifier::offer(const std::string &candidate, CandidateMatch &match)
{
    if (!store_.isPathCatalogued(candidate))
    {
        match.unclaimed = candidate;
        return false;
    }
    if (!match.audit_held)
        match.audit_held = candidate;
    return true;
}

IdentityVerifier::CandidateMatch IdentityVerifier::searchByFilename(const std::string &file_name,
                                                                    const std::string &content_hash,
                                                                    const std::set<std::string> &excluded)
{
    CandidateMatch match;
    FileUtils::walkFiles(
        settings_.getMediaRoot().string(),
        [&](const std::string &candidate)
        {
            if (fs::path(candidate).filename().string() != file_name)
                return true;
            if (!isCandidate(candidate, excluded))
                return true;
            auto digest = cachedHash(candidate);
            if (digest && *digest == content_hash)
                return offer(candidate, match);
            return true;
        },
        [this](const fs::path &dir)
        { return isReservedDirectory(dir); });
    return match;
}

IdentityVerifier::CandidateMatch IdentityVerifier::searchByFullScan(const std::string &content_hash,
                                                                    const std::set<std::string> &excluded)
{
    std::lock_guard<std::mutex> scan_lock(scan_mutex_);
    CandidateMatch match;
    size_t hashed = 0;
    FileUtils::walkFiles(
        settings_.getMediaRoot().string(),
        [&](const std::string &candidate)
        {
            if (!isCandidate(candidate, excluded))
                return true;
            auto digest = cachedHash(candidate);
            hashed++;
            if (hashed % static_cast<size_t>(settings_.progress_interval) == 0)
            {
                Logger::info("Full content scan: " + std::to_string(hashed) + " files hashed");
            }
            if (digest && *digest == content_hash)
                return offer(candidate, match);
            return true;
        },
        [this](const fs::path &dir)
        { return isReservedDirectory(dir); });
    auto best = match.best();
    Logger::info("Full content scan finished after " + std::to_string(hashed) + " files" +
                 (best ? ", match: " + *best : ", no match"));
    return match;
}

std::optional<std::string> IdentityVerifier::cachedHash(const std::string &path)
{
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = pass_hashes_.find(path);
        if (it != pass_hashes_.end())
            return it->second;
    }
    auto digest = ContentHasher::hash(path);
    std::lock_guard<std::mutex> lock(cache_mutex_);
    pass_hashes_[path] = digest;
    return digest;
}

bool IdentityVerifier::isCandidate(const std::string &path, const std::set<std::string> &excluded)
{
    if (excluded.count(path) > 0)
        return false;
    return !store_.isPathClaimed(path);
}

bool IdentityVerifier::isReservedDirectory(const fs::path &dir) const
{
    return dir.lexically_normal() == settings_.getSystemRoot().lexically_normal();
}
