/*
 * Tests for the bounded undo/redo history
 * tests/undoengine_test.cpp
 */

#include <QTest>

#include "../src/hex/bytebuffer.h"
#include "../src/hex/undoengine.h"

using namespace RomHex;

class UndoEngineTest : public QObject {
    Q_OBJECT

   private slots:
    void unchangedWriteRecordsNothing();
    void undoRedoRestoresExactBytes();
    void newEditClearsRedo();
    void historyEvictsOldest();
    void shrinkingCapacityEvicts();
    void writesAreClampedAtEnd();
    void emptyStacksAreNoOps();
};

void UndoEngineTest::unchangedWriteRecordsNothing() {
    ByteBuffer buffer(QByteArray(4, '\x7F'));
    UndoEngine engine(buffer);

    QVERIFY(!engine.modify(1, QByteArray(1, '\x7F')));
    QVERIFY(!engine.modify(4, QByteArray(1, '\x01')));
    QCOMPARE(engine.undoCount(), std::size_t(0));
    QVERIFY(!buffer.isDirty());
}

void UndoEngineTest::undoRedoRestoresExactBytes() {
    ByteBuffer buffer(QByteArray::fromHex("00112233445566778899"));
    UndoEngine engine(buffer);

    QVERIFY(engine.modify(2, QByteArray::fromHex("AABBCC")));
    const QByteArray afterEdit = buffer.bytes();
    QCOMPARE(afterEdit, QByteArray::fromHex("0011AABBCC5566778899"));

    UndoEngine::Action applied;
    QVERIFY(engine.undo(&applied));
    QCOMPARE(applied.offset, std::uint64_t(2));
    QCOMPARE(buffer.bytes(), QByteArray::fromHex("00112233445566778899"));
    QVERIFY(buffer.modifiedOffsets().empty());

    QVERIFY(engine.redo());
    QCOMPARE(buffer.bytes(), afterEdit);
    QCOMPARE(buffer.modifiedOffsets().size(), std::size_t(3));
}

void UndoEngineTest::newEditClearsRedo() {
    ByteBuffer buffer(QByteArray(16, '\0'));
    UndoEngine engine(buffer);

    QVERIFY(engine.modify(0, QByteArray(1, '\x01')));
    QVERIFY(engine.modify(1, QByteArray(1, '\x02')));
    QVERIFY(engine.undo());
    QVERIFY(engine.canRedo());

    QVERIFY(engine.modify(5, QByteArray(1, '\x03')));
    QVERIFY(!engine.canRedo());
    QVERIFY(!engine.redo());
    QCOMPARE(buffer.at(1), std::uint8_t(0));
}

void UndoEngineTest::historyEvictsOldest() {
    ByteBuffer buffer(QByteArray(256, '\0'));
    UndoEngine engine(buffer, 100);

    for (int i = 0; i < 101; ++i) {
        QVERIFY(engine.modify(static_cast<std::uint64_t>(i), QByteArray(1, '\xFF')));
    }
    QCOMPARE(engine.undoCount(), std::size_t(100));

    int undone = 0;
    for (int i = 0; i < 101; ++i) {
        if (engine.undo()) {
            ++undone;
        }
    }
    QCOMPARE(undone, 100);
    // The first edit fell out of the history and stays applied.
    QCOMPARE(buffer.at(0), std::uint8_t(0xFF));
    QCOMPARE(buffer.at(1), std::uint8_t(0));
    QCOMPARE(buffer.at(100), std::uint8_t(0));
}

void UndoEngineTest::shrinkingCapacityEvicts() {
    ByteBuffer buffer(QByteArray(8, '\0'));
    UndoEngine engine(buffer, 10);
    for (int i = 0; i < 6; ++i) {
        QVERIFY(engine.modify(static_cast<std::uint64_t>(i), QByteArray(1, '\x01')));
    }
    engine.setCapacity(2);
    QCOMPARE(engine.undoCount(), std::size_t(2));
    QVERIFY(engine.undo());
    QCOMPARE(buffer.at(5), std::uint8_t(0));
}

void UndoEngineTest::writesAreClampedAtEnd() {
    ByteBuffer buffer(QByteArray(4, '\0'));
    UndoEngine engine(buffer);

    QVERIFY(engine.modify(2, QByteArray::fromHex("01020304")));
    QCOMPARE(buffer.size(), std::uint64_t(4));
    QCOMPARE(buffer.bytes(), QByteArray::fromHex("00000102"));

    UndoEngine::Action applied;
    QVERIFY(engine.undo(&applied));
    QCOMPARE(applied.newData, QByteArray::fromHex("0102"));
    QCOMPARE(buffer.bytes(), QByteArray(4, '\0'));
}

void UndoEngineTest::emptyStacksAreNoOps() {
    ByteBuffer buffer(QByteArray(4, '\0'));
    UndoEngine engine(buffer);
    QVERIFY(!engine.undo());
    QVERIFY(!engine.redo());
    QVERIFY(!buffer.isDirty());
}

QTEST_MAIN(UndoEngineTest)
#include "undoengine_test.moc"
