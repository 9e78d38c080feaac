/*
 * Editing session tying the buffer, history and analysis together
 * src/hex/hexsession.cpp
 */

#include "hexsession.h"

#include <QDateTime>
#include <QFileInfo>
#include <QtConcurrent>

#include <algorithm>

#include "exporters.h"

namespace RomHex {

HexSession::HexSession(LogSink& log, const HexSettings& settings, QObject* parent)
    : QObject(parent),
      log_(log),
      settings_(settings),
      undo_(buffer_, static_cast<std::size_t>(settings.undoHistoryLimit())),
      matcher_(static_cast<std::size_t>(settings.maxSearchResults())),
      recent_(settings.maxRecentFiles()),
      littleEndian_(settings.littleEndian()) {}

HexSession::~HexSession() = default;

LoadResult HexSession::readForLoad(const QString& path) {
    LoadResult result;
    result.path = path;
    if (!readFileBytes(path, result.bytes, result.error)) {
        result.bytes.clear();
    }
    return result;
}

bool HexSession::open(const QString& path, HexError& errorOut) {
    errorOut.clear();
    if (!confirmReplace(errorOut) || !gateLargeLoad(path, errorOut)) {
        return false;
    }
    setStatus(tr("Loading %1...").arg(QFileInfo(path).fileName()));
    pendingOpenSerial_ = editSerial_;
    return finishOpen(readForLoad(path), errorOut);
}

bool HexSession::openWithPicker(HexError& errorOut) {
    errorOut.clear();
    if (!picker_) {
        fail(errorOut, HexError::Kind::Cancelled, tr("No file picker available."));
        return false;
    }
    const std::optional<QString> chosen = picker_->pickOpenPath();
    if (!chosen || chosen->isEmpty()) {
        fail(errorOut, HexError::Kind::Cancelled, tr("Open cancelled."));
        return false;
    }
    return open(*chosen, errorOut);
}

bool HexSession::beginOpen(const QString& path, QFuture<LoadResult>& futureOut, HexError& errorOut) {
    errorOut.clear();
    if (!confirmReplace(errorOut) || !gateLargeLoad(path, errorOut)) {
        return false;
    }
    setStatus(tr("Loading %1...").arg(QFileInfo(path).fileName()));
    pendingOpenSerial_ = editSerial_;
    futureOut = QtConcurrent::run([path]() { return HexSession::readForLoad(path); });
    return true;
}

bool HexSession::finishOpen(const LoadResult& result, HexError& errorOut) {
    errorOut.clear();
    const std::optional<std::uint64_t> openedAt = pendingOpenSerial_;
    pendingOpenSerial_.reset();
    if (result.error.isSet()) {
        errorOut = result.error;
        setStatus(result.error.kind == HexError::Kind::FileNotFound ? tr("File not found: %1").arg(result.path)
                                                                     : tr("Error loading file: %1").arg(result.error.message),
                  LogSink::Level::Warning);
        return false;
    }
    // The buffer may have been edited while the read was in flight.
    if (openedAt != editSerial_ && !confirmReplace(errorOut)) {
        return false;
    }
    install(result.path, result.bytes);
    return true;
}

bool HexSession::close(HexError& errorOut) {
    errorOut.clear();
    if (!hasDocument_) {
        return true;
    }
    if (!confirmReplace(errorOut)) {
        return false;
    }
    const bool wasDirty = buffer_.isDirty();
    buffer_.reset(QByteArray());
    undo_.clear();
    matcher_.clear();
    bookmarks_.clear();
    hasDocument_ = false;
    path_.clear();
    cursor_ = 0;
    selectionStart_ = 0;
    selectionLength_ = 0;
    notifyDirty(wasDirty);
    setStatus(tr("Closed"));
    Q_EMIT closed();
    Q_EMIT changed();
    return true;
}

bool HexSession::save(HexError& errorOut) {
    if (!requireDocument(errorOut)) {
        return false;
    }
    if (path_.isEmpty()) {
        return saveAsWithPicker(errorOut);
    }
    return writeTo(path_, errorOut);
}

bool HexSession::saveAs(const QString& path, HexError& errorOut) {
    if (!requireDocument(errorOut)) {
        return false;
    }
    if (!writeTo(path, errorOut)) {
        return false;
    }
    path_ = path;
    rememberRecent(path);
    Q_EMIT changed();
    return true;
}

bool HexSession::saveAsWithPicker(HexError& errorOut) {
    if (!requireDocument(errorOut)) {
        return false;
    }
    if (!picker_) {
        fail(errorOut, HexError::Kind::Cancelled, tr("No file picker available."));
        return false;
    }
    const QString suggested = path_.isEmpty() ? QStringLiteral("untitled.bin") : path_;
    const std::optional<QString> chosen = picker_->pickSavePath(suggested);
    if (!chosen || chosen->isEmpty()) {
        fail(errorOut, HexError::Kind::Cancelled, tr("Save cancelled."));
        return false;
    }
    return saveAs(*chosen, errorOut);
}

bool HexSession::writeByte(std::uint64_t offset, std::uint8_t value) {
    if (!hasDocument_ || !buffer_.contains(offset) || buffer_.at(offset) == value) {
        return false;
    }
    return applyEdit(offset, QByteArray(1, static_cast<char>(value)));
}

bool HexSession::writeBytes(std::uint64_t offset, const QByteArray& data) {
    if (!hasDocument_ || !buffer_.contains(offset) || data.isEmpty()) {
        return false;
    }
    return applyEdit(offset, data);
}

bool HexSession::pasteHex(const QString& text, HexError& errorOut) {
    if (!requireDocument(errorOut)) {
        return false;
    }
    QByteArray bytes;
    if (!PatternMatcher::parseHexBytes(text, bytes, errorOut)) {
        setStatus(errorOut.message, LogSink::Level::Warning);
        return false;
    }
    if (!buffer_.contains(cursor_)) {
        fail(errorOut, HexError::Kind::OutOfRange, tr("Cursor is outside the buffer."));
        return false;
    }
    const auto written = static_cast<qsizetype>(
        std::min<std::uint64_t>(static_cast<std::uint64_t>(bytes.size()), buffer_.size() - cursor_));
    const bool changed = applyEdit(cursor_, bytes.left(written));
    if (written < bytes.size()) {
        setStatus(tr("Pasted %1 of %2 bytes (clipped at end of file)").arg(written).arg(bytes.size()),
                  LogSink::Level::Warning);
    }
    else {
        setStatus(tr("Pasted %1 bytes").arg(written));
    }
    return changed;
}

bool HexSession::fillSelection(std::uint8_t value) {
    if (!hasDocument_ || selectionLength_ == 0) {
        return false;
    }
    const bool changed =
        applyEdit(selectionStart_, QByteArray(static_cast<qsizetype>(selectionLength_), static_cast<char>(value)));
    setStatus(tr("Filled %1 bytes with 0x%2")
                  .arg(selectionLength_)
                  .arg(QStringLiteral("%1").arg(static_cast<uint>(value), 2, 16, QLatin1Char('0')).toUpper()));
    return changed;
}

bool HexSession::zeroSelection() {
    if (!hasDocument_ || selectionLength_ == 0) {
        return false;
    }
    const bool changed = applyEdit(selectionStart_, QByteArray(static_cast<qsizetype>(selectionLength_), '\0'));
    setStatus(tr("Deleted %1 bytes (filled with zeros)").arg(selectionLength_));
    return changed;
}

QString HexSession::selectionAsHex() const {
    if (!hasDocument_ || selectionLength_ == 0) {
        return {};
    }
    return PatternMatcher::toHex(buffer_.read(selectionStart_, selectionLength_));
}

bool HexSession::undo() {
    const bool wasDirty = buffer_.isDirty();
    UndoEngine::Action action;
    if (!undo_.undo(&action)) {
        return false;
    }
    ++editSerial_;
    invalidate(action.offset, static_cast<std::uint64_t>(action.oldData.size()));
    notifyDirty(wasDirty);
    setCursor(action.offset);
    setStatus(tr("Undo: restored %1 byte(s) at 0x%2").arg(action.oldData.size()).arg(action.offset, 8, 16,
                                                                                        QLatin1Char('0')));
    Q_EMIT changed();
    return true;
}

bool HexSession::redo() {
    const bool wasDirty = buffer_.isDirty();
    UndoEngine::Action action;
    if (!undo_.redo(&action)) {
        return false;
    }
    ++editSerial_;
    invalidate(action.offset, static_cast<std::uint64_t>(action.newData.size()));
    notifyDirty(wasDirty);
    setCursor(action.offset);
    setStatus(tr("Redo: reapplied %1 byte(s) at 0x%2").arg(action.newData.size()).arg(action.offset, 8, 16,
                                                                                         QLatin1Char('0')));
    Q_EMIT changed();
    return true;
}

void HexSession::setCursor(std::uint64_t offset) {
    const std::uint64_t size = buffer_.size();
    const std::uint64_t clamped = size == 0 ? 0 : std::min<std::uint64_t>(offset, size - 1);
    if (clamped == cursor_) {
        return;
    }
    cursor_ = clamped;
    Q_EMIT cursorMoved(cursor_);
}

void HexSession::setSelection(std::uint64_t start, std::uint64_t length) {
    const std::uint64_t size = buffer_.size();
    if (start >= size) {
        clearSelection();
        return;
    }
    selectionStart_ = start;
    selectionLength_ = std::min<std::uint64_t>(length, size - start);
}

void HexSession::selectAll() {
    setSelection(0, buffer_.size());
    setStatus(tr("Selected all %1 bytes").arg(buffer_.size()));
}

void HexSession::clearSelection() {
    selectionStart_ = 0;
    selectionLength_ = 0;
}

bool HexSession::goTo(const QString& text) {
    QString trimmed = text.trimmed();
    int base = 10;
    if (trimmed.startsWith(QStringLiteral("0x"), Qt::CaseInsensitive)) {
        base = 16;
        trimmed = trimmed.mid(2);
    }
    bool parseOk = false;
    const std::uint64_t offset = trimmed.toULongLong(&parseOk, base);
    if (!parseOk || !hasDocument_) {
        setStatus(tr("Invalid offset format"), LogSink::Level::Warning);
        return false;
    }
    clearSelection();
    setCursor(offset);
    setStatus(tr("Jumped to offset 0x%1").arg(QStringLiteral("%1").arg(cursor_, 8, 16, QLatin1Char('0')).toUpper()));
    return true;
}

const SearchResults& HexSession::search(const QString& query) {
    HexError fallback;
    const SearchResults& results = matcher_.search(buffer_.bytes(), query, fallback);
    if (fallback.isSet()) {
        setStatus(fallback.message, LogSink::Level::Warning);
    }
    if (results.hits.empty()) {
        setStatus(tr("Pattern not found"));
    }
    else if (results.truncated) {
        setStatus(tr("Found %1 matches (search stopped at the limit)").arg(results.hits.size()));
    }
    else {
        setStatus(tr("Found %1 matches").arg(results.hits.size()));
    }
    Q_EMIT changed();
    return results;
}

std::optional<SearchResult> HexSession::findNext() {
    const std::optional<SearchResult> hit = matcher_.findNext();
    if (hit) {
        setCursor(hit->offset);
        setSelection(hit->offset, hit->length);
        setStatus(tr("Match %1 of %2").arg(matcher_.currentIndex() + 1).arg(matcher_.results().hits.size()));
    }
    return hit;
}

std::optional<SearchResult> HexSession::findPrevious() {
    const std::optional<SearchResult> hit = matcher_.findPrevious();
    if (hit) {
        setCursor(hit->offset);
        setSelection(hit->offset, hit->length);
        setStatus(tr("Match %1 of %2").arg(matcher_.currentIndex() + 1).arg(matcher_.results().hits.size()));
    }
    return hit;
}

std::size_t HexSession::replaceAll(const QString& replacementHex, HexError& errorOut) {
    if (!requireDocument(errorOut)) {
        return 0;
    }
    QByteArray replacement;
    if (!PatternMatcher::parseHexBytes(replacementHex, replacement, errorOut)) {
        setStatus(errorOut.message, LogSink::Level::Warning);
        return 0;
    }

    const bool wasDirty = buffer_.isDirty();
    std::vector<SearchResult> rewritten;
    const std::size_t replaced = matcher_.replaceAll(undo_, replacement, &rewritten);
    for (const SearchResult& hit : rewritten) {
        invalidate(hit.offset, hit.length);
    }
    if (replaced > 0) {
        ++editSerial_;
    }
    notifyDirty(wasDirty);
    setStatus(tr("Replaced %1 occurrences").arg(replaced));
    Q_EMIT changed();
    return replaced;
}

SearchResults HexSession::findKnownPatterns() const {
    return StructureDetector::findKnownPatterns(buffer_.bytes(), static_cast<std::size_t>(settings_.maxSearchResults()));
}

StringScan HexSession::extractStrings() const {
    return StructureDetector::extractStrings(buffer_.bytes(), settings_.minStringLength(),
                                             static_cast<std::size_t>(settings_.maxStringMatches()));
}

FileType HexSession::detectFileType() const {
    return StructureDetector::detectFileType(buffer_.bytes());
}

StructureNode HexSession::analyzeStructure() const {
    return StructureDetector::scanSignatures(buffer_.bytes(), static_cast<std::uint64_t>(settings_.signatureStride()));
}

QFuture<StructureNode> HexSession::analyzeAsync() const {
    // Copy-on-write snapshot; later edits detach the live buffer.
    const QByteArray snapshot = buffer_.bytes();
    const auto stride = static_cast<std::uint64_t>(settings_.signatureStride());
    return QtConcurrent::run([snapshot, stride]() { return StructureDetector::scanSignatures(snapshot, stride); });
}

ChecksumReport HexSession::computeChecksums() const {
    return ChecksumEngine::compute(buffer_.bytes());
}

void HexSession::setLittleEndian(bool little) {
    if (littleEndian_ == little) {
        return;
    }
    littleEndian_ = little;
    Q_EMIT changed();
}

QString HexSession::inspect(int width, DataKind kind) const {
    const QString value =
        DataInspector::decode(buffer_.bytes(), cursor_, width, kind, littleEndian_ ? Endianness::Little : Endianness::Big);
    if (value == DataInspector::unavailable()) {
        log_.debug(tr("%1: cannot decode %2 byte(s) as %3 at 0x%4")
                       .arg(errorKindName(HexError::Kind::DecodeFailure))
                       .arg(width)
                       .arg(dataKindName(kind))
                       .arg(QStringLiteral("%1").arg(cursor_, 8, 16, QLatin1Char('0')).toUpper()));
    }
    return value;
}

InspectorValues HexSession::inspectAll() const {
    return DataInspector::inspectAll(buffer_.bytes(), cursor_, littleEndian_ ? Endianness::Little : Endianness::Big);
}

Bookmark HexSession::addBookmark(const QString& name, const QString& description) {
    const QString label = name.isEmpty() ? tr("Bookmark %1").arg(bookmarks_.size() + 1) : name;
    const Bookmark bm = bookmarks_.add(label, cursor_, description);
    setStatus(tr("Bookmarked 0x%1").arg(QStringLiteral("%1").arg(cursor_, 8, 16, QLatin1Char('0')).toUpper()));
    return bm;
}

bool HexSession::nextBookmark() {
    const std::optional<Bookmark> bm = bookmarks_.next(cursor_);
    if (!bm) {
        return false;
    }
    clearSelection();
    setCursor(bm->offset);
    setStatus(tr("Jumped to bookmark: %1").arg(bm->name));
    return true;
}

bool HexSession::previousBookmark() {
    const std::optional<Bookmark> bm = bookmarks_.previous(cursor_);
    if (!bm) {
        return false;
    }
    clearSelection();
    setCursor(bm->offset);
    setStatus(tr("Jumped to bookmark: %1").arg(bm->name));
    return true;
}

bool HexSession::goToBookmark(std::uint64_t id) {
    const std::optional<Bookmark> bm = bookmarks_.find(id);
    if (!bm) {
        return false;
    }
    clearSelection();
    setCursor(bm->offset);
    setStatus(tr("Jumped to bookmark: %1").arg(bm->name));
    return true;
}

bool HexSession::exportHexDump(const QString& outPath, HexError& errorOut) {
    if (!requireDocument(errorOut)) {
        return false;
    }
    if (!Exporters::exportHexDump(buffer_.bytes(), path_, outPath, QDateTime::currentDateTime(), errorOut)) {
        setStatus(tr("Error exporting: %1").arg(errorOut.message), LogSink::Level::Warning);
        return false;
    }
    setStatus(tr("Exported hex dump to %1").arg(QFileInfo(outPath).fileName()));
    return true;
}

bool HexSession::exportAnalysis(const QString& outPath, HexError& errorOut) {
    if (!requireDocument(errorOut)) {
        return false;
    }
    const ChecksumReport report = computeChecksums();
    const QString label = StructureDetector::fileTypeLabel(detectFileType());
    if (!Exporters::exportAnalysis(report, label, path_, outPath, QDateTime::currentDateTime(), errorOut)) {
        setStatus(tr("Error exporting: %1").arg(errorOut.message), LogSink::Level::Warning);
        return false;
    }
    setStatus(tr("Exported analysis to %1").arg(QFileInfo(outPath).fileName()));
    return true;
}

bool HexSession::exportSelection(const QString& outPath, HexError& errorOut) {
    if (!requireDocument(errorOut)) {
        return false;
    }
    if (!Exporters::exportRange(buffer_.bytes(), selectionStart_, selectionLength_, outPath, errorOut)) {
        setStatus(tr("Error exporting: %1").arg(errorOut.message), LogSink::Level::Warning);
        return false;
    }
    setStatus(tr("Exported %1 bytes").arg(selectionLength_));
    return true;
}

bool HexSession::compareWithFile(const QString& otherPath, CompareResult& resultOut, HexError& errorOut) {
    resultOut = {};
    if (!requireDocument(errorOut)) {
        return false;
    }
    QByteArray other;
    if (!readFileBytes(otherPath, other, errorOut)) {
        setStatus(tr("Error comparing files: %1").arg(errorOut.message), LogSink::Level::Warning);
        return false;
    }

    const QByteArray& mine = buffer_.bytes();
    const qsizetype common = std::min(mine.size(), other.size());
    for (qsizetype i = 0; i < common; ++i) {
        if (mine.at(i) != other.at(i)) {
            resultOut.differences.push_back(static_cast<std::uint64_t>(i));
        }
    }
    resultOut.otherSize = static_cast<std::uint64_t>(other.size());
    resultOut.sizeMismatch = mine.size() != other.size();

    if (resultOut.differences.empty()) {
        setStatus(resultOut.sizeMismatch ? tr("No differences in common area; sizes differ")
                                         : tr("Files are identical"));
    }
    else {
        setCursor(resultOut.differences.front());
        setStatus(tr("Found %1 differences, first at offset 0x%2")
                      .arg(resultOut.differences.size())
                      .arg(QStringLiteral("%1").arg(resultOut.differences.front(), 8, 16, QLatin1Char('0')).toUpper()));
    }
    return true;
}

bool HexSession::applyPatches(const std::vector<HexPatch>& patches, std::size_t& appliedOut, HexError& errorOut) {
    appliedOut = 0;
    if (!requireDocument(errorOut)) {
        return false;
    }

    HexError firstSkip;
    for (const HexPatch& patch : patches) {
        const QString where = QStringLiteral("%1").arg(patch.offset, 8, 16, QLatin1Char('0')).toUpper();
        const auto span = static_cast<std::uint64_t>(std::max(patch.original.size(), patch.replacement.size()));
        if (patch.offset >= buffer_.size() || span > buffer_.size() - patch.offset) {
            const QString message = tr("Patch at offset 0x%1 runs past the end of the file").arg(where);
            log_.warning(message);
            if (!firstSkip.isSet()) {
                firstSkip.set(HexError::Kind::OutOfRange, message);
            }
            continue;
        }
        const QByteArray found = buffer_.read(patch.offset, static_cast<std::uint64_t>(patch.original.size()));
        if (found != patch.original) {
            const QString message = tr("Original bytes don't match at offset 0x%1").arg(where);
            log_.warning(message);
            log_.warning(tr("Expected: %1").arg(PatternMatcher::toHex(patch.original)));
            log_.warning(tr("Found: %1").arg(PatternMatcher::toHex(found)));
            if (!firstSkip.isSet()) {
                firstSkip.set(HexError::Kind::InvalidPattern, message);
            }
            continue;
        }
        applyEdit(patch.offset, patch.replacement);
        log_.info(tr("Applied patch: %1").arg(patch.description.isEmpty() ? QStringLiteral("0x%1").arg(where) : patch.description));
        ++appliedOut;
    }

    setStatus(tr("Applied %1 of %2 patches").arg(appliedOut).arg(patches.size()),
              firstSkip.isSet() ? LogSink::Level::Warning : LogSink::Level::Info);
    if (firstSkip.isSet()) {
        errorOut = firstSkip;
        return false;
    }
    return true;
}

bool HexSession::applyPatchFile(const QString& patchPath, std::size_t& appliedOut, HexError& errorOut) {
    appliedOut = 0;
    if (!requireDocument(errorOut)) {
        return false;
    }
    std::vector<HexPatch> patches;
    if (!PatchFile::load(patchPath, patches, errorOut)) {
        setStatus(tr("Error loading patch file: %1").arg(errorOut.message), LogSink::Level::Warning);
        return false;
    }
    return applyPatches(patches, appliedOut, errorOut);
}

std::vector<HexPatch> HexSession::patchesFromEdits() const {
    std::vector<HexPatch> patches;
    for (const std::uint64_t offset : buffer_.modifiedOffsets()) {
        if (!patches.empty()) {
            HexPatch& last = patches.back();
            if (last.offset + static_cast<std::uint64_t>(last.replacement.size()) == offset) {
                last.original.append(static_cast<char>(buffer_.originalAt(offset)));
                last.replacement.append(static_cast<char>(buffer_.at(offset)));
                continue;
            }
        }
        HexPatch patch;
        patch.offset = offset;
        patch.original = QByteArray(1, static_cast<char>(buffer_.originalAt(offset)));
        patch.replacement = QByteArray(1, static_cast<char>(buffer_.at(offset)));
        patch.description =
            tr("Edit at 0x%1").arg(QStringLiteral("%1").arg(offset, 8, 16, QLatin1Char('0')).toUpper());
        patches.push_back(std::move(patch));
    }
    return patches;
}

bool HexSession::savePatchFile(const QString& patchPath, HexError& errorOut) {
    if (!requireDocument(errorOut)) {
        return false;
    }
    const std::vector<HexPatch> patches = patchesFromEdits();
    if (patches.empty()) {
        fail(errorOut, HexError::Kind::OutOfRange, tr("No modified bytes to write as patches."));
        return false;
    }
    if (!PatchFile::save(patchPath, patches, errorOut)) {
        setStatus(tr("Error saving patch file: %1").arg(errorOut.message), LogSink::Level::Warning);
        return false;
    }
    setStatus(tr("Saved %1 patches to %2").arg(patches.size()).arg(QFileInfo(patchPath).fileName()));
    return true;
}

bool HexSession::loadRecentFiles(HexError& errorOut) {
    errorOut.clear();
    if (recentStore_.isEmpty()) {
        return true;
    }
    if (!recent_.load(recentStore_, errorOut)) {
        log_.warning(tr("Unable to read recent files: %1").arg(errorOut.message));
        return false;
    }
    return true;
}

SessionState HexSession::state() const {
    SessionState s;
    s.path = path_;
    s.size = buffer_.size();
    s.hasDocument = hasDocument_;
    s.dirty = buffer_.isDirty();
    s.cursor = cursor_;
    s.selectionStart = selectionStart_;
    s.selectionLength = selectionLength_;
    s.undoCount = undo_.undoCount();
    s.redoCount = undo_.redoCount();
    s.searchIndex = matcher_.currentIndex();
    s.searchCount = matcher_.results().hits.size();
    s.littleEndian = littleEndian_;
    s.statusMessage = status_;
    return s;
}

bool HexSession::requireDocument(HexError& errorOut) const {
    errorOut.clear();
    if (!hasDocument_) {
        errorOut.set(HexError::Kind::NoDocument, tr("No file is loaded."));
        return false;
    }
    return true;
}

bool HexSession::confirmReplace(HexError& errorOut) {
    if (!hasDocument_ || !buffer_.isDirty()) {
        return true;
    }
    const SaveDecision decision = savePrompt_ ? savePrompt_(path_) : SaveDecision::Cancel;
    switch (decision) {
        case SaveDecision::Save:
            return save(errorOut);
        case SaveDecision::Discard:
            log_.info(tr("Discarding unsaved changes to %1").arg(path_));
            return true;
        case SaveDecision::Cancel:
            break;
    }
    fail(errorOut, HexError::Kind::Cancelled, tr("Unsaved changes; operation cancelled."));
    return false;
}

bool HexSession::gateLargeLoad(const QString& path, HexError& errorOut) {
    std::uint64_t size = 0;
    if (!fileSize(path, size, errorOut)) {
        setStatus(errorOut.kind == HexError::Kind::FileNotFound ? tr("File not found: %1").arg(path)
                                                                 : tr("Error loading file: %1").arg(errorOut.message),
                  LogSink::Level::Warning);
        return false;
    }
    if (size <= settings_.largeFileThresholdBytes()) {
        return true;
    }
    if (confirmLoad_ && confirmLoad_(path, size)) {
        log_.info(tr("Loading large file %1 (%2)").arg(path, Exporters::formatFileSize(size)));
        return true;
    }
    fail(errorOut, HexError::Kind::Cancelled,
         tr("%1 is %2; loading was not confirmed.").arg(QFileInfo(path).fileName(), Exporters::formatFileSize(size)));
    return false;
}

void HexSession::install(const QString& path, const QByteArray& bytes) {
    const bool wasDirty = buffer_.isDirty();
    buffer_.reset(bytes);
    undo_.clear();
    matcher_.clear();
    bookmarks_.clear();
    hasDocument_ = true;
    path_ = path;
    cursor_ = 0;
    clearSelection();
    rememberRecent(path);
    notifyDirty(wasDirty);
    setStatus(tr("Loaded %1 (%2)").arg(QFileInfo(path).fileName(), Exporters::formatFileSize(buffer_.size())));
    Q_EMIT loaded(path);
    Q_EMIT changed();
}

bool HexSession::writeTo(const QString& path, HexError& errorOut) {
    const bool wasDirty = buffer_.isDirty();
    if (!buffer_.save(path, errorOut)) {
        setStatus(tr("Error saving file: %1").arg(errorOut.message), LogSink::Level::Warning);
        return false;
    }
    // Modified markers are gone; every line may need repainting.
    if (!buffer_.isEmpty()) {
        invalidate(0, buffer_.size());
    }
    notifyDirty(wasDirty);
    setStatus(tr("File saved successfully"));
    Q_EMIT saved(path);
    return true;
}

void HexSession::rememberRecent(const QString& path) {
    recent_.add(path);
    if (recentStore_.isEmpty()) {
        return;
    }
    HexError err;
    if (!recent_.save(recentStore_, err)) {
        log_.warning(tr("Unable to store recent files: %1").arg(err.message));
    }
}

bool HexSession::applyEdit(std::uint64_t offset, const QByteArray& data) {
    const bool wasDirty = buffer_.isDirty();
    if (!undo_.modify(offset, data)) {
        return false;
    }
    ++editSerial_;
    invalidate(offset, static_cast<std::uint64_t>(data.size()));
    notifyDirty(wasDirty);
    Q_EMIT changed();
    return true;
}

void HexSession::invalidate(std::uint64_t offset, std::uint64_t length) {
    if (length == 0 || buffer_.isEmpty()) {
        return;
    }
    const auto perLine = static_cast<std::uint64_t>(settings_.bytesPerLine());
    const std::uint64_t last = std::min<std::uint64_t>(offset + length, buffer_.size()) - 1;
    Q_EMIT linesInvalidated(offset / perLine, last / perLine);
}

void HexSession::notifyDirty(bool wasDirty) {
    if (wasDirty != buffer_.isDirty()) {
        Q_EMIT dirtyChanged(buffer_.isDirty());
    }
}

void HexSession::setStatus(const QString& message, LogSink::Level level) {
    status_ = message;
    log_.message(level, message);
    Q_EMIT statusMessage(message);
}

void HexSession::fail(HexError& errorOut, HexError::Kind kind, const QString& message) {
    errorOut.set(kind, message);
    setStatus(message, LogSink::Level::Warning);
}

}  // namespace RomHex
