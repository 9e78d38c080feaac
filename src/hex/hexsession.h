/*
 * Editing session tying the buffer, history and analysis together
 * src/hex/hexsession.h
 */

#ifndef ROMHEX_HEXSESSION_H
#define ROMHEX_HEXSESSION_H

#include <QByteArray>
#include <QFuture>
#include <QObject>
#include <QString>

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

#include "bookmarkmanager.h"
#include "bytebuffer.h"
#include "checksumengine.h"
#include "datainspector.h"
#include "hexerror.h"
#include "hexsettings.h"
#include "logsink.h"
#include "patchfile.h"
#include "patternmatcher.h"
#include "recentfiles.h"
#include "structuredetector.h"
#include "undoengine.h"

namespace RomHex {

// Supplies paths for open/save-as; std::nullopt means the operator cancelled.
class FilePicker {
   public:
    virtual ~FilePicker() = default;
    virtual std::optional<QString> pickOpenPath() = 0;
    virtual std::optional<QString> pickSavePath(const QString& suggestedPath) = 0;
};

struct SessionState {
    QString path;
    std::uint64_t size = 0;
    bool hasDocument = false;
    bool dirty = false;
    std::uint64_t cursor = 0;
    std::uint64_t selectionStart = 0;
    std::uint64_t selectionLength = 0;
    std::size_t undoCount = 0;
    std::size_t redoCount = 0;
    int searchIndex = -1;
    std::size_t searchCount = 0;
    bool littleEndian = true;
    QString statusMessage;
};

struct LoadResult {
    QString path;
    QByteArray bytes;
    HexError error;
};

struct CompareResult {
    std::vector<std::uint64_t> differences;
    std::uint64_t otherSize = 0;
    bool sizeMismatch = false;
};

class HexSession : public QObject {
    Q_OBJECT

   public:
    enum class SaveDecision { Save, Discard, Cancel };

    // Consulted for loads above the large-file threshold.
    using LoadConfirmation = std::function<bool(const QString& path, std::uint64_t size)>;
    // Consulted before a dirty buffer is replaced or closed.
    using SavePrompt = std::function<SaveDecision(const QString& path)>;

    explicit HexSession(LogSink& log, const HexSettings& settings = HexSettings(), QObject* parent = nullptr);
    ~HexSession() override;

    void setLoadConfirmation(LoadConfirmation confirm) { confirmLoad_ = std::move(confirm); }
    void setSavePrompt(SavePrompt prompt) { savePrompt_ = std::move(prompt); }
    void setFilePicker(FilePicker* picker) { picker_ = picker; }
    // Empty disables persistence of the recent-files list.
    void setRecentFilesStore(const QString& storePath) { recentStore_ = storePath; }

    const HexSettings& settings() const { return settings_; }

    // Reads a file on any thread; no session state is touched.
    static LoadResult readForLoad(const QString& path);

    bool open(const QString& path, HexError& errorOut);
    bool openWithPicker(HexError& errorOut);
    // Runs the save prompt and size gate here, then reads off-thread.
    // The caller awaits the future and hands the result to finishOpen().
    bool beginOpen(const QString& path, QFuture<LoadResult>& futureOut, HexError& errorOut);
    bool finishOpen(const LoadResult& result, HexError& errorOut);
    bool close(HexError& errorOut);

    bool save(HexError& errorOut);
    bool saveAs(const QString& path, HexError& errorOut);
    bool saveAsWithPicker(HexError& errorOut);

    bool hasDocument() const { return hasDocument_; }
    QString path() const { return path_; }
    const ByteBuffer& buffer() const { return buffer_; }
    bool isDirty() const { return buffer_.isDirty(); }

    // Editing. All return true only when the buffer changed.
    bool writeByte(std::uint64_t offset, std::uint8_t value);
    bool writeBytes(std::uint64_t offset, const QByteArray& data);
    bool pasteHex(const QString& text, HexError& errorOut);
    bool fillSelection(std::uint8_t value);
    bool zeroSelection();
    QString selectionAsHex() const;

    bool undo();
    bool redo();
    bool canUndo() const { return undo_.canUndo(); }
    bool canRedo() const { return undo_.canRedo(); }

    // Navigation
    std::uint64_t cursor() const { return cursor_; }
    void setCursor(std::uint64_t offset);
    void setSelection(std::uint64_t start, std::uint64_t length);
    void selectAll();
    void clearSelection();
    std::uint64_t selectionStart() const { return selectionStart_; }
    std::uint64_t selectionLength() const { return selectionLength_; }
    // Accepts "0x1F" or "31".
    bool goTo(const QString& text);

    // Search
    const SearchResults& search(const QString& query);
    std::optional<SearchResult> findNext();
    std::optional<SearchResult> findPrevious();
    std::size_t replaceAll(const QString& replacementHex, HexError& errorOut);
    const SearchResults& searchResults() const { return matcher_.results(); }
    SearchResults findKnownPatterns() const;
    StringScan extractStrings() const;

    // Analysis
    FileType detectFileType() const;
    StructureNode analyzeStructure() const;
    QFuture<StructureNode> analyzeAsync() const;
    ChecksumReport computeChecksums() const;

    // Inspector at the cursor
    bool littleEndian() const { return littleEndian_; }
    void setLittleEndian(bool little);
    QString inspect(int width, DataKind kind) const;
    InspectorValues inspectAll() const;

    // Bookmarks
    BookmarkManager& bookmarks() { return bookmarks_; }
    const BookmarkManager& bookmarks() const { return bookmarks_; }
    Bookmark addBookmark(const QString& name, const QString& description = QString());
    bool nextBookmark();
    bool previousBookmark();
    bool goToBookmark(std::uint64_t id);

    // Exports
    bool exportHexDump(const QString& outPath, HexError& errorOut);
    bool exportAnalysis(const QString& outPath, HexError& errorOut);
    bool exportSelection(const QString& outPath, HexError& errorOut);

    bool compareWithFile(const QString& otherPath, CompareResult& resultOut, HexError& errorOut);

    // Patch files. A patch is written only while its original bytes are in
    // place; others are skipped and logged, and the call returns false.
    bool applyPatches(const std::vector<HexPatch>& patches, std::size_t& appliedOut, HexError& errorOut);
    bool applyPatchFile(const QString& patchPath, std::size_t& appliedOut, HexError& errorOut);
    // One patch per contiguous run of modified bytes.
    std::vector<HexPatch> patchesFromEdits() const;
    bool savePatchFile(const QString& patchPath, HexError& errorOut);

    RecentFiles& recentFiles() { return recent_; }
    const RecentFiles& recentFiles() const { return recent_; }
    bool loadRecentFiles(HexError& errorOut);

    SessionState state() const;
    QString lastStatus() const { return status_; }

   Q_SIGNALS:
    void changed();
    void dirtyChanged(bool dirty);
    void linesInvalidated(quint64 firstLine, quint64 lastLine);
    void cursorMoved(quint64 offset);
    void statusMessage(const QString& message);
    void loaded(const QString& path);
    void saved(const QString& path);
    void closed();

   private:
    bool requireDocument(HexError& errorOut) const;
    bool confirmReplace(HexError& errorOut);
    bool gateLargeLoad(const QString& path, HexError& errorOut);
    void install(const QString& path, const QByteArray& bytes);
    bool writeTo(const QString& path, HexError& errorOut);
    void rememberRecent(const QString& path);

    bool applyEdit(std::uint64_t offset, const QByteArray& data);
    void invalidate(std::uint64_t offset, std::uint64_t length);
    void notifyDirty(bool wasDirty);

    void setStatus(const QString& message, LogSink::Level level = LogSink::Level::Info);
    void fail(HexError& errorOut, HexError::Kind kind, const QString& message);

    LogSink& log_;
    HexSettings settings_;
    LoadConfirmation confirmLoad_;
    SavePrompt savePrompt_;
    FilePicker* picker_ = nullptr;
    QString recentStore_;

    ByteBuffer buffer_;
    UndoEngine undo_;
    PatternMatcher matcher_;
    BookmarkManager bookmarks_;
    RecentFiles recent_;

    bool hasDocument_ = false;
    QString path_;
    std::uint64_t cursor_ = 0;
    std::uint64_t selectionStart_ = 0;
    std::uint64_t selectionLength_ = 0;
    bool littleEndian_ = true;
    QString status_;
    // Bumped on every buffer change; lets finishOpen() spot edits made
    // while a background read was running.
    std::uint64_t editSerial_ = 0;
    std::optional<std::uint64_t> pendingOpenSerial_;
};

}  // namespace RomHex

#endif  // ROMHEX_HEXSESSION_H
