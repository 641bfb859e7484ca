#include "sync/Scanner.hpp"
#include "sync/errors.hpp"
#include "crypto/util/hash.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/core.h>
#include <algorithm>

using namespace osync::sync;
using namespace osync::sync::model;
using namespace osync::logging;

Scanner::Scanner(std::vector<std::string> allowedFolders, std::vector<std::string> excludes, const bool useMtimeCache)
    : allowedFolders_(std::move(allowedFolders)),
      excludes_(std::move(excludes)),
      useMtimeCache_(useMtimeCache) {
    std::sort(allowedFolders_.begin(), allowedFolders_.end());
    allowedFolders_.erase(std::unique(allowedFolders_.begin(), allowedFolders_.end()), allowedFolders_.end());
}

Snapshot Scanner::scan(const fs::path& root, const Snapshot* hint) const {
    stats_ = {};
    Snapshot out;

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        LogRegistry::snapshot()->debug("[Scanner] {} does not exist yet, nothing to scan", root.string());
        return out;
    }

    for (const auto& folder : allowedFolders_) scanFolder(root, root / folder, useMtimeCache_ ? hint : nullptr, out);

    LogRegistry::snapshot()->debug("[Scanner] {}: {} files ({} hashed, {} cached, {} skipped)",
                                   root.string(), out.size(), stats_.hashed, stats_.cached, stats_.skipped);
    return out;
}

void Scanner::scanFolder(const fs::path& root, const fs::path& folder, const Snapshot* hint, Snapshot& out) const {
    std::error_code ec;
    const auto folderStatus = fs::symlink_status(folder, ec);
    if (ec || !fs::exists(folderStatus)) return;

    if (fs::is_symlink(folderStatus) || !fs::is_directory(folderStatus)) {
        LogRegistry::snapshot()->warn("[Scanner] Skipping {}: not a plain directory", folder.string());
        ++stats_.skipped;
        return;
    }

    fs::recursive_directory_iterator it(folder, fs::directory_options::none, ec);
    for (const fs::recursive_directory_iterator end{}; !ec && it != end; it.increment(ec)) {
        const fs::directory_entry& entry = *it;

        const auto status = entry.symlink_status(ec);
        if (ec) break;

        if (fs::is_symlink(status)) {
            ++stats_.skipped;
            continue;
        }
        if (fs::is_directory(status)) continue;
        if (!fs::is_regular_file(status)) {
            ++stats_.skipped;
            continue;
        }

        auto rel = relativeKey(root, entry.path());
        if (isExcluded(rel)) {
            ++stats_.skipped;
            continue;
        }

        Fingerprint fp;
        fp.path = std::move(rel);
        fp.size = entry.file_size(ec);
        if (ec) break;
        fp.mtime = mtimeOf(entry.path());

        if (const auto* cached = hint ? hint->find(fp.path) : nullptr;
            cached && !cached->hash.empty() && cached->size == fp.size && cached->mtime == fp.mtime) {
            fp.hash = cached->hash;
            ++stats_.cached;
        } else {
            try {
                fp.hash = crypto::hash::sha256(entry.path());
            } catch (const std::exception& e) {
                throw FilesystemError(e.what(), entry.path().string());
            }
            ++stats_.hashed;
        }

        out.insert(std::move(fp));
    }

    if (ec) {
        const auto where = it == fs::recursive_directory_iterator() ? folder : it->path();
        throw FilesystemError(fmt::format("Failed to scan {}: {}", where.string(), ec.message()), where.string());
    }
}

bool Scanner::isExcluded(const std::string& rel) const {
    const auto anchored = "/" + rel;
    return std::any_of(excludes_.begin(), excludes_.end(), [&](const std::string& pattern) {
        return !pattern.empty() && anchored.find(pattern) != std::string::npos;
    });
}

std::string Scanner::relativeKey(const fs::path& root, const fs::path& file) {
    return file.lexically_relative(root).generic_string();
}

std::int64_t Scanner::mtimeOf(const fs::path& file) {
    std::error_code ec;
    const auto t = fs::last_write_time(file, ec);
    if (ec) throw FilesystemError(fmt::format("Failed to stat {}: {}", file.string(), ec.message()), file.string());
    return static_cast<std::int64_t>(t.time_since_epoch().count());
}
