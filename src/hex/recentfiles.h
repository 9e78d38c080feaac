/*
 * Most-recently-used file list
 * src/hex/recentfiles.h
 */

#ifndef ROMHEX_RECENTFILES_H
#define ROMHEX_RECENTFILES_H

#include <QString>
#include <QStringList>

#include "hexerror.h"

namespace RomHex {

class RecentFiles {
   public:
    static constexpr int kDefaultMaxEntries = 10;

    explicit RecentFiles(int maxEntries = kDefaultMaxEntries);

    // <AppConfigLocation>/recent_hex_files.txt
    static QString defaultStorePath();

    // Moves |path| to the front, dropping the oldest entry past the limit.
    void add(const QString& path);
    bool remove(const QString& path);
    void clear() { paths_.clear(); }

    const QStringList& paths() const { return paths_; }
    int maxEntries() const { return maxEntries_; }
    void setMaxEntries(int maxEntries);

    // A missing store is an empty list. Paths that no longer exist are dropped.
    bool load(const QString& storePath, HexError& errorOut);
    bool save(const QString& storePath, HexError& errorOut) const;

   private:
    int maxEntries_;
    QStringList paths_;
};

}  // namespace RomHex

#endif  // ROMHEX_RECENTFILES_H
