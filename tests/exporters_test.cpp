/*
 * Tests for hex dump, analysis and range exports
 * tests/exporters_test.cpp
 */

#include <QFile>
#include <QTemporaryDir>
#include <QTest>

#include "../src/hex/exporters.h"

using namespace RomHex;

namespace {

QByteArray readBack(const QString& path) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        return {};
    }
    return f.readAll();
}

const QDateTime kGeneratedAt(QDate(2024, 1, 2), QTime(3, 4, 5));

}  // namespace

class ExportersTest : public QObject {
    Q_OBJECT

   private slots:
    void fileSizeUnits();
    void fullDumpLine();
    void shortDumpLineIsPadded();
    void hexDumpFileLayout();
    void emptyBufferDumpIsHeaderOnly();
    void analysisReportLayout();
    void rangeExportIsClamped();
    void emptyRangeIsRejected();
    void unwritableTargetFails();
};

void ExportersTest::fileSizeUnits() {
    QCOMPARE(Exporters::formatFileSize(0), QStringLiteral("0.00 B"));
    QCOMPARE(Exporters::formatFileSize(1023), QStringLiteral("1023.00 B"));
    QCOMPARE(Exporters::formatFileSize(1536), QStringLiteral("1.50 KB"));
    QCOMPARE(Exporters::formatFileSize(64ull * 1024 * 1024), QStringLiteral("64.00 MB"));
}

void ExportersTest::fullDumpLine() {
    QByteArray data = QByteArrayLiteral("ANDROID!");
    data.append(QByteArray::fromHex("000102037F80FF20"));
    QCOMPARE(Exporters::formatHexDumpLine(data, 0),
             QStringLiteral("00000000   41 4E 44 52 4F 49 44 21 00 01 02 03 7F 80 FF 20  ANDROID!....... "));
}

void ExportersTest::shortDumpLineIsPadded() {
    QByteArray data(18, 'a');
    const QString line = Exporters::formatHexDumpLine(data, 16);
    QCOMPARE(line, QStringLiteral("00000010   61 61 ") + QString(14 * 3, QLatin1Char(' ')) + QStringLiteral(" aa"));
}

void ExportersTest::hexDumpFileLayout() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString out = dir.path() + QStringLiteral("/dump.txt");
    const QByteArray data(20, 'Z');

    HexError err;
    QVERIFY2(Exporters::exportHexDump(data, QStringLiteral("/tmp/boot.img"), out, kGeneratedAt, err),
             qPrintable(err.message));

    const QList<QByteArray> lines = readBack(out).split('\n');
    QCOMPARE(lines[0], QByteArrayLiteral("Hex Dump of: /tmp/boot.img"));
    QCOMPARE(lines[1], QByteArrayLiteral("Size: 20.00 B"));
    QVERIFY(lines[2].startsWith("Generated: 2024-01-02T03:04:05"));
    QCOMPARE(lines[3], QByteArray(80, '='));
    QCOMPARE(lines[4], QByteArray());
    QVERIFY(lines[5].startsWith("Offset     00 01"));
    QCOMPARE(lines[6], QByteArray(80, '-'));
    QVERIFY(lines[7].startsWith("00000000   5A 5A"));
    QVERIFY(lines[8].startsWith("00000010   5A 5A 5A 5A    "));
    QCOMPARE(lines.size(), 10);
    QVERIFY(lines[9].isEmpty());
}

void ExportersTest::emptyBufferDumpIsHeaderOnly() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString out = dir.path() + QStringLiteral("/dump.txt");

    HexError err;
    QVERIFY(Exporters::exportHexDump(QByteArray(), QStringLiteral("empty.bin"), out, kGeneratedAt, err));
    QCOMPARE(readBack(out), Exporters::hexDumpHeader(QStringLiteral("empty.bin"), 0, kGeneratedAt).toUtf8());
}

void ExportersTest::analysisReportLayout() {
    const ChecksumReport report = ChecksumEngine::compute(QByteArrayLiteral("abc"));
    const QString text = Exporters::analysisReport(report, QStringLiteral("Text File"), QStringLiteral("a.txt"),
                                                   kGeneratedAt);
    const QStringList lines = text.split(QLatin1Char('\n'));

    QCOMPARE(lines[0], QStringLiteral("File Analysis Report"));
    QCOMPARE(lines[1], QString(60, QLatin1Char('=')));
    QCOMPARE(lines[2], QStringLiteral("File: a.txt"));
    QCOMPARE(lines[3], QStringLiteral("Size: 3.00 B (3 bytes)"));
    QVERIFY(lines.contains(QStringLiteral("  CRC32:  352441C2")));
    QVERIFY(lines.contains(QStringLiteral("  MD5:    900150983CD24FB0D6963F7D28E17F72")));
    QVERIFY(lines.contains(QStringLiteral("File Type: Text File")));
    QVERIFY(lines.contains(QStringLiteral("Byte Distribution:")));
    QVERIFY(lines.contains(QStringLiteral("  0x61:          1 (33.33%)")));
}

void ExportersTest::rangeExportIsClamped() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString out = dir.path() + QStringLiteral("/range.bin");

    HexError err;
    QVERIFY(Exporters::exportRange(QByteArrayLiteral("0123456789"), 6, 100, out, err));
    QCOMPARE(readBack(out), QByteArrayLiteral("6789"));
}

void ExportersTest::emptyRangeIsRejected() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString out = dir.path() + QStringLiteral("/range.bin");

    HexError err;
    QVERIFY(!Exporters::exportRange(QByteArrayLiteral("0123"), 0, 0, out, err));
    QCOMPARE(err.kind, HexError::Kind::OutOfRange);
    QVERIFY(!Exporters::exportRange(QByteArrayLiteral("0123"), 4, 2, out, err));
    QCOMPARE(err.kind, HexError::Kind::OutOfRange);
    QVERIFY(!QFile::exists(out));
}

void ExportersTest::unwritableTargetFails() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    // The target is an existing directory.
    HexError err;
    QVERIFY(!Exporters::exportHexDump(QByteArrayLiteral("x"), QStringLiteral("x"), dir.path(), kGeneratedAt, err));
    QCOMPARE(err.kind, HexError::Kind::IOFailure);
}

QTEST_MAIN(ExportersTest)
#include "exporters_test.moc"
