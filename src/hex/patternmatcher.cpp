/*
 * Byte/text pattern search and replace
 * src/hex/patternmatcher.cpp
 */

#include "patternmatcher.h"

#include <QObject>
#include <QRegularExpression>
#include <QStringEncoder>
#include <QStringList>

#include <algorithm>
#include <cstring>

#include "undoengine.h"

namespace RomHex {

namespace {

bool isHexDigit(QChar c) {
    const char16_t u = c.unicode();
    return (u >= '0' && u <= '9') || (u >= 'a' && u <= 'f') || (u >= 'A' && u <= 'F');
}

bool looksLikeHexTokens(const QString& text) {
    bool sawSeparator = false;
    bool sawDigit = false;
    for (const QChar c : text) {
        if (c.isSpace()) {
            sawSeparator = sawSeparator || sawDigit;
            continue;
        }
        if (!isHexDigit(c)) {
            return false;
        }
        sawDigit = true;
    }
    return sawDigit && sawSeparator;
}

}  // namespace

PatternMatcher::PatternMatcher(std::size_t maxResults) : maxResults_(maxResults == 0 ? 1 : maxResults) {}

PatternMatcher::Query PatternMatcher::parseQuery(const QString& text, HexError& errorOut) {
    errorOut.clear();
    Query query;
    const QString trimmed = text.trimmed();

    if (looksLikeHexTokens(trimmed)) {
        static const QRegularExpression kSpaces(QStringLiteral("\\s+"));
        const QStringList tokens = trimmed.split(kSpaces, Qt::SkipEmptyParts);
        QByteArray bytes;
        bytes.reserve(tokens.size());
        bool ok = true;
        for (const QString& token : tokens) {
            bool byteOk = false;
            const int value = token.toInt(&byteOk, 16);
            if (token.size() > 2 || !byteOk) {
                ok = false;
                break;
            }
            bytes.append(static_cast<char>(value));
        }
        if (ok) {
            query.kind = QueryKind::Hex;
            query.bytes = bytes;
            return query;
        }
        errorOut.set(HexError::Kind::InvalidPattern,
                     QObject::tr("\"%1\" is not a valid byte sequence; searching as text.").arg(trimmed));
    }

    query.kind = QueryKind::Text;
    query.bytes = encodeText(text);
    return query;
}

bool PatternMatcher::parseHexBytes(const QString& text, QByteArray& out, HexError& errorOut) {
    errorOut.clear();
    QString cleaned = text;
    cleaned.remove(QLatin1Char(' '));
    cleaned.remove(QLatin1Char('\t'));
    cleaned.remove(QLatin1Char('\n'));
    cleaned.remove(QLatin1Char('\r'));
    cleaned.remove(QLatin1Char('-'));
    if (cleaned.isEmpty()) {
        errorOut.set(HexError::Kind::InvalidPattern, QObject::tr("No hex bytes given."));
        return false;
    }
    if ((cleaned.size() % 2) != 0) {
        errorOut.set(HexError::Kind::InvalidPattern,
                     QObject::tr("Hex input must have an even number of digits (got %1).").arg(cleaned.size()));
        return false;
    }

    QByteArray bytes;
    bytes.resize(cleaned.size() / 2);
    for (qsizetype i = 0; i < cleaned.size(); i += 2) {
        if (!isHexDigit(cleaned.at(i)) || !isHexDigit(cleaned.at(i + 1))) {
            errorOut.set(HexError::Kind::InvalidPattern,
                         QObject::tr("Invalid hex digits \"%1\".").arg(cleaned.mid(i, 2)));
            return false;
        }
        bytes[i / 2] = static_cast<char>(cleaned.mid(i, 2).toInt(nullptr, 16));
    }
    out = bytes;
    return true;
}

QByteArray PatternMatcher::encodeText(const QString& text) {
    QStringEncoder encoder(QStringEncoder::Utf8);
    const QByteArray utf8 = encoder(text);
    if (!encoder.hasError()) {
        return utf8;
    }

    QByteArray ascii;
    ascii.reserve(text.size());
    for (const QChar c : text) {
        ascii.append(c.unicode() < 0x80 ? static_cast<char>(c.unicode()) : '?');
    }
    return ascii;
}

QString PatternMatcher::previewHex(const QByteArray& data, std::uint64_t offset, int maxBytes) {
    if (offset >= static_cast<std::uint64_t>(data.size())) {
        return {};
    }
    return toHex(data.mid(static_cast<qsizetype>(offset), maxBytes));
}

QString PatternMatcher::toHex(const QByteArray& data) {
    return QString::fromLatin1(data.toHex(' ').toUpper());
}

SearchResults PatternMatcher::findAll(const QByteArray& data, const QByteArray& needle, std::size_t maxResults) {
    SearchResults out;
    const auto n = static_cast<std::uint64_t>(data.size());
    const auto m = static_cast<std::uint64_t>(needle.size());
    if (m == 0 || m > n) {
        return out;
    }

    const char* hay = data.constData();
    const char* pat = needle.constData();
    for (std::uint64_t i = 0; i + m <= n; ++i) {
        if (std::memcmp(hay + i, pat, m) != 0) {
            continue;
        }
        if (out.hits.size() >= maxResults) {
            out.truncated = true;
            break;
        }
        SearchResult hit;
        hit.offset = i;
        hit.length = m;
        hit.previewText = previewHex(data, i);
        out.hits.push_back(std::move(hit));
    }
    return out;
}

const SearchResults& PatternMatcher::search(const QByteArray& data, const QString& query, HexError& errorOut) {
    const Query parsed = parseQuery(query, errorOut);
    return searchBytes(data, parsed.bytes);
}

const SearchResults& PatternMatcher::searchBytes(const QByteArray& data, const QByteArray& needle) {
    results_ = findAll(data, needle, maxResults_);
    needle_ = needle;
    current_ = -1;
    return results_;
}

std::optional<SearchResult> PatternMatcher::findNext() {
    if (results_.hits.empty()) {
        return std::nullopt;
    }
    const int count = static_cast<int>(results_.hits.size());
    current_ = (current_ + 1) % count;
    return results_.hits[static_cast<std::size_t>(current_)];
}

std::optional<SearchResult> PatternMatcher::findPrevious() {
    if (results_.hits.empty()) {
        return std::nullopt;
    }
    const int count = static_cast<int>(results_.hits.size());
    current_ = current_ < 0 ? count - 1 : (current_ - 1 + count) % count;
    return results_.hits[static_cast<std::size_t>(current_)];
}

std::size_t PatternMatcher::replaceAll(UndoEngine& engine, const QByteArray& replacement,
                                      std::vector<SearchResult>* replacedOut) {
    std::vector<SearchResult> hits = results_.hits;
    std::sort(hits.begin(), hits.end(),
              [](const SearchResult& a, const SearchResult& b) { return a.offset > b.offset; });

    std::size_t replaced = 0;
    for (const SearchResult& hit : hits) {
        if (hit.length != static_cast<std::uint64_t>(replacement.size())) {
            continue;
        }
        // Edits since the search may have rewritten this hit.
        if (engine.buffer().read(hit.offset, hit.length) != needle_) {
            continue;
        }
        if (engine.modify(hit.offset, replacement)) {
            ++replaced;
            if (replacedOut) {
                replacedOut->push_back(hit);
            }
        }
    }
    clear();
    return replaced;
}

void PatternMatcher::clear() {
    results_ = {};
    needle_.clear();
    current_ = -1;
}

}  // namespace RomHex
