/*
 * Bounded undo/redo history over a ByteBuffer
 * src/hex/undoengine.h
 */

#ifndef ROMHEX_UNDOENGINE_H
#define ROMHEX_UNDOENGINE_H

#include <QByteArray>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <vector>

#include "bytebuffer.h"

namespace RomHex {

class UndoEngine {
   public:
    enum class ActionKind { Modify };

    struct Action {
        ActionKind kind = ActionKind::Modify;
        std::uint64_t offset = 0;
        QByteArray oldData;
        QByteArray newData;
    };

    static constexpr std::size_t kDefaultCapacity = 100;

    explicit UndoEngine(ByteBuffer& buffer, std::size_t capacity = kDefaultCapacity);

    // Overwrites bytes at offset, clamped to the buffer end. Returns false
    // without recording anything when the range is empty or nothing changes.
    bool modify(std::uint64_t offset, const QByteArray& newData);

    // Both return the applied action; false when there is nothing to do.
    bool undo(Action* applied = nullptr);
    bool redo(Action* applied = nullptr);

    bool canUndo() const { return !undoStack_.empty(); }
    bool canRedo() const { return !redoStack_.empty(); }
    std::size_t undoCount() const { return undoStack_.size(); }
    std::size_t redoCount() const { return redoStack_.size(); }

    const ByteBuffer& buffer() const { return buffer_; }

    std::size_t capacity() const { return capacity_; }
    void setCapacity(std::size_t capacity);

    void clear();

   private:
    void pushUndo(const Action& action);

    ByteBuffer& buffer_;
    std::size_t capacity_;
    std::deque<Action> undoStack_;
    std::vector<Action> redoStack_;
};

}  // namespace RomHex

#endif  // ROMHEX_UNDOENGINE_H
