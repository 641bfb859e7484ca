#include "util/files.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

std::string osync::util::readFileToString(const fs::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw std::runtime_error("Failed to open file: " + path.string());

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::string buffer(static_cast<size_t>(size), '\0');
    if (!in.read(buffer.data(), size))
        throw std::runtime_error("Failed to read file: " + path.string());
    in.close();

    return buffer;
}

void osync::util::writeFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open file for writing: " + path.string());
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out) throw std::runtime_error("Failed to write file: " + path.string());
}

void osync::util::copyFilePreservingMtime(const fs::path& src, const fs::path& dst) {
    if (dst.has_parent_path()) fs::create_directories(dst.parent_path());
    if (fs::is_symlink(fs::symlink_status(dst))) fs::remove(dst);
    fs::copy_file(src, dst, fs::copy_options::overwrite_existing);
    fs::last_write_time(dst, fs::last_write_time(src));
}

void osync::util::requireNoSymlinkParents(const fs::path& root, const std::string& rel) {
    auto dir = root;
    const fs::path relPath(rel);
    for (auto it = relPath.begin(); it != relPath.end() && std::next(it) != relPath.end(); ++it) {
        dir /= *it;
        std::error_code ec;
        if (fs::is_symlink(fs::symlink_status(dir, ec)))
            throw std::runtime_error("Refusing to write through symlinked directory: " + dir.string());
    }
}

void osync::util::removeFileAndPruneParents(const fs::path& root, const std::string& rel) {
    const auto target = root / rel;
    fs::remove(target);

    std::error_code ec;
    for (auto parent = target.parent_path(); parent != root && parent.has_relative_path(); parent = parent.parent_path()) {
        if (!fs::is_directory(parent, ec) || !fs::is_empty(parent, ec)) break;
        if (!fs::remove(parent, ec)) break;
    }
}

std::size_t osync::util::clearDirectory(const fs::path& dir, const std::vector<std::string>& keep) {
    std::vector<fs::path> entries;
    for (const auto& entry : fs::directory_iterator(dir)) {
        const auto name = entry.path().filename().string();
        if (std::find(keep.begin(), keep.end(), name) != keep.end()) continue;
        entries.push_back(entry.path());
    }

    for (const auto& entry : entries) fs::remove_all(entry);
    return entries.size();
}
