/*
 * Byte/text pattern search and replace
 * src/hex/patternmatcher.h
 */

#ifndef ROMHEX_PATTERNMATCHER_H
#define ROMHEX_PATTERNMATCHER_H

#include <QByteArray>
#include <QString>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "hexerror.h"

namespace RomHex {

class UndoEngine;

struct SearchResult {
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
    QString previewText;
};

struct SearchResults {
    std::vector<SearchResult> hits;
    bool truncated = false;
};

class PatternMatcher {
   public:
    enum class QueryKind { Hex, Text };

    struct Query {
        QueryKind kind = QueryKind::Text;
        QByteArray bytes;
    };

    static constexpr std::size_t kDefaultMaxResults = 1000;
    static constexpr int kPreviewBytes = 16;

    explicit PatternMatcher(std::size_t maxResults = kDefaultMaxResults);

    // "FF 00 AB" is hex; anything else is text. A hex-looking query with a bad
    // token is reported through errorOut as InvalidPattern and searched as text.
    static Query parseQuery(const QString& text, HexError& errorOut);
    // Contiguous or whitespace-separated hex pairs. Odd length or non-hex digits fail.
    static bool parseHexBytes(const QString& text, QByteArray& out, HexError& errorOut);
    static QByteArray encodeText(const QString& text);
    static QString previewHex(const QByteArray& data, std::uint64_t offset, int maxBytes = kPreviewBytes);
    static QString toHex(const QByteArray& data);

    // Sliding-window scan, overlapping hits included, capped at maxResults.
    static SearchResults findAll(const QByteArray& data, const QByteArray& needle, std::size_t maxResults);

    const SearchResults& search(const QByteArray& data, const QString& query, HexError& errorOut);
    const SearchResults& searchBytes(const QByteArray& data, const QByteArray& needle);

    std::optional<SearchResult> findNext();
    std::optional<SearchResult> findPrevious();

    // Replaces every current hit of equal length, highest offset first. A hit
    // whose bytes no longer equal the searched needle is left untouched.
    std::size_t replaceAll(UndoEngine& engine, const QByteArray& replacement,
                           std::vector<SearchResult>* replacedOut = nullptr);

    const SearchResults& results() const { return results_; }
    const QByteArray& needle() const { return needle_; }
    int currentIndex() const { return current_; }
    std::size_t maxResults() const { return maxResults_; }
    void setMaxResults(std::size_t maxResults) { maxResults_ = maxResults == 0 ? 1 : maxResults; }
    void clear();

   private:
    std::size_t maxResults_;
    SearchResults results_;
    QByteArray needle_;
    int current_ = -1;
};

}  // namespace RomHex

#endif  // ROMHEX_PATTERNMATCHER_H
