/*
 * Named offsets within the loaded buffer
 * src/hex/bookmarkmanager.h
 */

#ifndef ROMHEX_BOOKMARKMANAGER_H
#define ROMHEX_BOOKMARKMANAGER_H

#include <QDateTime>
#include <QString>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace RomHex {

struct Bookmark {
    std::uint64_t id = 0;
    QString name;
    std::uint64_t offset = 0;
    QString description;
    QDateTime createdAt;
};

// Several bookmarks may share one offset; ids tell them apart.
class BookmarkManager {
   public:
    Bookmark add(const QString& name,
                 std::uint64_t offset,
                 const QString& description = QString(),
                 const QDateTime& createdAt = QDateTime::currentDateTime());
    bool remove(std::uint64_t id);
    bool rename(std::uint64_t id, const QString& name);
    bool setDescription(std::uint64_t id, const QString& description);
    void clear();

    std::optional<Bookmark> find(std::uint64_t id) const;
    std::vector<Bookmark> atOffset(std::uint64_t offset) const;
    // Ordered by offset, then by creation order.
    const std::vector<Bookmark>& list() const { return bookmarks_; }
    std::size_t size() const { return bookmarks_.size(); }
    bool isEmpty() const { return bookmarks_.empty(); }

    // Strictly after / before |cursor|; nothing at the boundaries.
    std::optional<Bookmark> next(std::uint64_t cursor) const;
    std::optional<Bookmark> previous(std::uint64_t cursor) const;

   private:
    std::vector<Bookmark>::iterator locate(std::uint64_t id);

    std::vector<Bookmark> bookmarks_;
    std::uint64_t nextId_ = 1;
};

}  // namespace RomHex

#endif  // ROMHEX_BOOKMARKMANAGER_H
