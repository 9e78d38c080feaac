/*
 * Tests for patch file parsing, storage and application
 * tests/patchfile_test.cpp
 */

#include <QFile>
#include <QTemporaryDir>
#include <QTest>

#include "../src/hex/hexsession.h"
#include "../src/hex/patchfile.h"

using namespace RomHex;

namespace {

class RecordingLogSink : public LogSink {
   public:
    void message(Level level, const QString& text) override {
        if (level == Level::Warning) {
            warnings << text;
        }
        all << text;
    }

    QStringList all;
    QStringList warnings;
};

QString writeTestFile(QTemporaryDir& dir, const QString& name, const QByteArray& data) {
    const QString path = dir.path() + QLatin1Char('/') + name;
    QFile f(path);
    if (f.open(QIODevice::WriteOnly)) {
        f.write(data);
        f.close();
    }
    return path;
}

QByteArray readBack(const QString& path) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        return {};
    }
    return f.readAll();
}

HexPatch makePatch(std::uint64_t offset, const char* original, const char* replacement, const QString& description) {
    HexPatch patch;
    patch.offset = offset;
    patch.original = QByteArray::fromHex(original);
    patch.replacement = QByteArray::fromHex(replacement);
    patch.description = description;
    return patch;
}

}  // namespace

class PatchFileTest : public QObject {
    Q_OBJECT

   private slots:
    void parseLineReadsAllFields();
    void parseLineKeepsColonsInDescription();
    void parseLineRejectsBadFields();
    void loadSkipsCommentsAndBlankLines();
    void loadReportsMalformedLine();
    void loadMissingFile();
    void saveWritesHeaderAndLines();
    void sessionAppliesMatchingPatches();
    void sessionSkipsMismatchedOriginal();
    void sessionRejectsPatchPastEnd();
    void editsExportAsPatches();
};

void PatchFileTest::parseLineReadsAllFields() {
    HexPatch patch;
    HexError err;
    QVERIFY2(PatchFile::parseLine(QStringLiteral("0x1A0:CA FE:be-ef:fix header"), patch, err), qPrintable(err.message));
    QCOMPARE(patch.offset, std::uint64_t(0x1A0));
    QCOMPARE(patch.original, QByteArray::fromHex("CAFE"));
    QCOMPARE(patch.replacement, QByteArray::fromHex("BEEF"));
    QCOMPARE(patch.description, QStringLiteral("fix header"));

    QVERIFY(PatchFile::parseLine(QStringLiteral("10:00:FF"), patch, err));
    QCOMPARE(patch.offset, std::uint64_t(0x10));
    QVERIFY(patch.description.isEmpty());
}

void PatchFileTest::parseLineKeepsColonsInDescription() {
    HexPatch patch;
    HexError err;
    QVERIFY(PatchFile::parseLine(QStringLiteral("0x0:00:01:boot: skip check"), patch, err));
    QCOMPARE(patch.description, QStringLiteral("boot: skip check"));
}

void PatchFileTest::parseLineRejectsBadFields() {
    HexPatch patch;
    HexError err;
    QVERIFY(!PatchFile::parseLine(QStringLiteral("0x10:CAFE"), patch, err));
    QCOMPARE(err.kind, HexError::Kind::InvalidPattern);
    QVERIFY(!PatchFile::parseLine(QStringLiteral("0xZZ:CAFE:BEEF"), patch, err));
    QCOMPARE(err.kind, HexError::Kind::InvalidPattern);
    QVERIFY(!PatchFile::parseLine(QStringLiteral("0x10:CAF:BEEF"), patch, err));
    QCOMPARE(err.kind, HexError::Kind::InvalidPattern);
    QVERIFY(!PatchFile::parseLine(QStringLiteral("0x10:CAFE:"), patch, err));
    QCOMPARE(err.kind, HexError::Kind::InvalidPattern);
}

void PatchFileTest::loadSkipsCommentsAndBlankLines() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = writeTestFile(dir, QStringLiteral("fix.patch"),
                                       QByteArrayLiteral("# Hex Patch File\n"
                                                         "// vendor notes\n"
                                                         "\n"
                                                         "0x10:CAFE:BEEF:first\r\n"
                                                         "   \n"
                                                         "0x20:00:FF:second\n"));

    std::vector<HexPatch> patches;
    HexError err;
    QVERIFY2(PatchFile::load(path, patches, err), qPrintable(err.message));
    QCOMPARE(patches.size(), std::size_t(2));
    QCOMPARE(patches.at(0).offset, std::uint64_t(0x10));
    QCOMPARE(patches.at(0).description, QStringLiteral("first"));
    QCOMPARE(patches.at(1).replacement, QByteArray::fromHex("FF"));
}

void PatchFileTest::loadReportsMalformedLine() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path =
        writeTestFile(dir, QStringLiteral("bad.patch"), QByteArrayLiteral("# header\n0x10:CAFE:BEEF:ok\nnonsense\n"));

    std::vector<HexPatch> patches;
    patches.push_back(makePatch(0, "00", "01", QString()));
    HexError err;
    QVERIFY(!PatchFile::load(path, patches, err));
    QCOMPARE(err.kind, HexError::Kind::InvalidPattern);
    QVERIFY(err.message.contains(QStringLiteral("line 3")));
    // Output is left alone on failure.
    QCOMPARE(patches.size(), std::size_t(1));
}

void PatchFileTest::loadMissingFile() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    std::vector<HexPatch> patches;
    HexError err;
    QVERIFY(!PatchFile::load(dir.path() + QStringLiteral("/missing.patch"), patches, err));
    QCOMPARE(err.kind, HexError::Kind::FileNotFound);
}

void PatchFileTest::saveWritesHeaderAndLines() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.path() + QStringLiteral("/out.patch");

    const std::vector<HexPatch> patches = {makePatch(0x1a0, "cafe", "beef", QStringLiteral("fix header")),
                                           makePatch(0x8, "00", "7f", QString())};
    HexError err;
    QVERIFY2(PatchFile::save(path, patches, err), qPrintable(err.message));
    QCOMPARE(readBack(path), QByteArrayLiteral("# Hex Patch File\n"
                                               "# Format: OFFSET:ORIGINAL:NEW:DESCRIPTION\n"
                                               "\n"
                                               "0x1A0:CAFE:BEEF:fix header\n"
                                               "0x8:00:7F:\n"));

    std::vector<HexPatch> loaded;
    QVERIFY(PatchFile::load(path, loaded, err));
    QCOMPARE(loaded.size(), std::size_t(2));
    QCOMPARE(loaded.at(0).replacement, QByteArray::fromHex("BEEF"));
}

void PatchFileTest::sessionAppliesMatchingPatches() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QByteArray data(64, '\0');
    data.replace(0x10, 2, QByteArray::fromHex("CAFE"));
    const QString image = writeTestFile(dir, QStringLiteral("image.bin"), data);
    const QString patchPath =
        writeTestFile(dir, QStringLiteral("fix.patch"), QByteArrayLiteral("0x10:CAFE:BEEF:swap magic\n0x20:00:01:\n"));

    RecordingLogSink log;
    HexSession session(log);
    HexError err;
    QVERIFY(session.open(image, err));

    std::size_t applied = 0;
    QVERIFY2(session.applyPatchFile(patchPath, applied, err), qPrintable(err.message));
    QCOMPARE(applied, std::size_t(2));
    QCOMPARE(session.buffer().read(0x10, 2), QByteArray::fromHex("BEEF"));
    QCOMPARE(session.buffer().at(0x20), std::uint8_t(0x01));
    QVERIFY(session.isDirty());
    QVERIFY(log.all.contains(QStringLiteral("Applied patch: swap magic")));
    QCOMPARE(session.lastStatus(), QStringLiteral("Applied 2 of 2 patches"));

    // Each patch is its own undo step.
    QCOMPARE(session.state().undoCount, std::size_t(2));
    QVERIFY(session.undo());
    QVERIFY(session.undo());
    QCOMPARE(session.buffer().bytes(), data);
}

void PatchFileTest::sessionSkipsMismatchedOriginal() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString image = writeTestFile(dir, QStringLiteral("image.bin"), QByteArray(64, '\0'));

    RecordingLogSink log;
    HexSession session(log);
    HexError err;
    QVERIFY(session.open(image, err));

    const std::vector<HexPatch> patches = {makePatch(0x10, "CAFE", "BEEF", QStringLiteral("wrong image")),
                                           makePatch(0x20, "00", "01", QStringLiteral("good"))};
    std::size_t applied = 0;
    QVERIFY(!session.applyPatches(patches, applied, err));
    QCOMPARE(err.kind, HexError::Kind::InvalidPattern);
    QCOMPARE(applied, std::size_t(1));
    QCOMPARE(session.buffer().read(0x10, 2), QByteArray::fromHex("0000"));
    QCOMPARE(session.buffer().at(0x20), std::uint8_t(0x01));
    QVERIFY(log.warnings.contains(QStringLiteral("Original bytes don't match at offset 0x00000010")));
    QVERIFY(log.warnings.contains(QStringLiteral("Expected: CA FE")));
    QVERIFY(log.warnings.contains(QStringLiteral("Found: 00 00")));
    QCOMPARE(session.lastStatus(), QStringLiteral("Applied 1 of 2 patches"));
}

void PatchFileTest::sessionRejectsPatchPastEnd() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString image = writeTestFile(dir, QStringLiteral("image.bin"), QByteArray(8, '\0'));

    NullLogSink log;
    HexSession session(log);
    HexError err;
    std::size_t applied = 0;
    QVERIFY(!session.applyPatches({makePatch(0, "00", "01", QString())}, applied, err));
    QCOMPARE(err.kind, HexError::Kind::NoDocument);

    QVERIFY(session.open(image, err));
    QVERIFY(!session.applyPatches({makePatch(7, "0000", "FFFF", QString())}, applied, err));
    QCOMPARE(err.kind, HexError::Kind::OutOfRange);
    QCOMPARE(applied, std::size_t(0));
    QVERIFY(!session.isDirty());
    QCOMPARE(session.buffer().size(), std::uint64_t(8));
}

void PatchFileTest::editsExportAsPatches() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QByteArray data(32, '\x11');
    const QString image = writeTestFile(dir, QStringLiteral("image.bin"), data);
    const QString patchPath = dir.path() + QStringLiteral("/edits.patch");

    NullLogSink log;
    HexSession session(log);
    HexError err;
    QVERIFY(session.open(image, err));
    QVERIFY(!session.savePatchFile(patchPath, err));
    QCOMPARE(err.kind, HexError::Kind::OutOfRange);

    QVERIFY(session.writeBytes(4, QByteArray::fromHex("AABB")));
    QVERIFY(session.writeByte(6, 0xCC));
    QVERIFY(session.writeByte(20, 0xDD));

    const std::vector<HexPatch> patches = session.patchesFromEdits();
    QCOMPARE(patches.size(), std::size_t(2));
    QCOMPARE(patches.at(0).offset, std::uint64_t(4));
    QCOMPARE(patches.at(0).original, QByteArray::fromHex("111111"));
    QCOMPARE(patches.at(0).replacement, QByteArray::fromHex("AABBCC"));
    QCOMPARE(patches.at(1).offset, std::uint64_t(20));

    QVERIFY2(session.savePatchFile(patchPath, err), qPrintable(err.message));

    // Replaying the stored patches on the untouched image reproduces the edits.
    HexSession replay(log);
    QVERIFY(replay.open(image, err));
    std::size_t applied = 0;
    QVERIFY2(replay.applyPatchFile(patchPath, applied, err), qPrintable(err.message));
    QCOMPARE(applied, std::size_t(2));
    QCOMPARE(replay.buffer().bytes(), session.buffer().bytes());
}

QTEST_MAIN(PatchFileTest)
#include "patchfile_test.moc"
