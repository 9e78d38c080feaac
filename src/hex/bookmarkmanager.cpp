/*
 * Named offsets within the loaded buffer
 * src/hex/bookmarkmanager.cpp
 */

#include "bookmarkmanager.h"

#include <algorithm>

namespace RomHex {

namespace {

bool bookmarkLess(const Bookmark& a, const Bookmark& b) {
    if (a.offset != b.offset) {
        return a.offset < b.offset;
    }
    return a.id < b.id;
}

}  // namespace

Bookmark BookmarkManager::add(const QString& name,
                              std::uint64_t offset,
                              const QString& description,
                              const QDateTime& createdAt) {
    Bookmark bm;
    bm.id = nextId_++;
    bm.name = name;
    bm.offset = offset;
    bm.createdAt = createdAt;
    bm.description =
        description.isEmpty() ? QStringLiteral("Added at %1").arg(createdAt.toString(QStringLiteral("HH:mm:ss")))
                              : description;

    const auto pos = std::upper_bound(bookmarks_.begin(), bookmarks_.end(), bm, bookmarkLess);
    bookmarks_.insert(pos, bm);
    return bm;
}

bool BookmarkManager::remove(std::uint64_t id) {
    const auto it = locate(id);
    if (it == bookmarks_.end()) {
        return false;
    }
    bookmarks_.erase(it);
    return true;
}

bool BookmarkManager::rename(std::uint64_t id, const QString& name) {
    const auto it = locate(id);
    if (it == bookmarks_.end()) {
        return false;
    }
    it->name = name;
    return true;
}

bool BookmarkManager::setDescription(std::uint64_t id, const QString& description) {
    const auto it = locate(id);
    if (it == bookmarks_.end()) {
        return false;
    }
    it->description = description;
    return true;
}

void BookmarkManager::clear() {
    bookmarks_.clear();
}

std::optional<Bookmark> BookmarkManager::find(std::uint64_t id) const {
    for (const Bookmark& bm : bookmarks_) {
        if (bm.id == id) {
            return bm;
        }
    }
    return std::nullopt;
}

std::vector<Bookmark> BookmarkManager::atOffset(std::uint64_t offset) const {
    std::vector<Bookmark> out;
    for (const Bookmark& bm : bookmarks_) {
        if (bm.offset == offset) {
            out.push_back(bm);
        }
    }
    return out;
}

std::optional<Bookmark> BookmarkManager::next(std::uint64_t cursor) const {
    for (const Bookmark& bm : bookmarks_) {
        if (bm.offset > cursor) {
            return bm;
        }
    }
    return std::nullopt;
}

std::optional<Bookmark> BookmarkManager::previous(std::uint64_t cursor) const {
    for (auto it = bookmarks_.rbegin(); it != bookmarks_.rend(); ++it) {
        if (it->offset < cursor) {
            return *it;
        }
    }
    return std::nullopt;
}

std::vector<Bookmark>::iterator BookmarkManager::locate(std::uint64_t id) {
    return std::find_if(bookmarks_.begin(), bookmarks_.end(), [id](const Bookmark& bm) { return bm.id == id; });
}

}  // namespace RomHex
