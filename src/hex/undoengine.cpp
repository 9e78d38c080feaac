/*
 * Bounded undo/redo history over a ByteBuffer
 * src/hex/undoengine.cpp
 */

#include "undoengine.h"

namespace RomHex {

UndoEngine::UndoEngine(ByteBuffer& buffer, std::size_t capacity)
    : buffer_(buffer), capacity_(capacity == 0 ? 1 : capacity) {}

bool UndoEngine::modify(std::uint64_t offset, const QByteArray& newData) {
    if (newData.isEmpty() || !buffer_.contains(offset)) {
        return false;
    }

    Action action;
    action.offset = offset;
    action.oldData = buffer_.read(offset, static_cast<std::uint64_t>(newData.size()));
    action.newData = newData.left(action.oldData.size());
    if (action.oldData == action.newData) {
        return false;
    }

    buffer_.store(action.offset, action.newData);
    pushUndo(action);
    redoStack_.clear();
    return true;
}

bool UndoEngine::undo(Action* applied) {
    if (undoStack_.empty()) {
        return false;
    }
    Action action = undoStack_.back();
    undoStack_.pop_back();
    buffer_.store(action.offset, action.oldData);
    if (applied) {
        *applied = action;
    }
    redoStack_.push_back(std::move(action));
    return true;
}

bool UndoEngine::redo(Action* applied) {
    if (redoStack_.empty()) {
        return false;
    }
    Action action = redoStack_.back();
    redoStack_.pop_back();
    buffer_.store(action.offset, action.newData);
    if (applied) {
        *applied = action;
    }
    pushUndo(action);
    return true;
}

void UndoEngine::setCapacity(std::size_t capacity) {
    capacity_ = capacity == 0 ? 1 : capacity;
    while (undoStack_.size() > capacity_) {
        undoStack_.pop_front();
    }
}

void UndoEngine::clear() {
    undoStack_.clear();
    redoStack_.clear();
}

void UndoEngine::pushUndo(const Action& action) {
    undoStack_.push_back(action);
    // Oldest history goes first; the edit itself stays applied.
    while (undoStack_.size() > capacity_) {
        undoStack_.pop_front();
    }
}

}  // namespace RomHex
