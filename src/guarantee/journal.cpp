// REVGUARD - Unit of Work Journal
// Copyright (c) 2024 REVGUARD Developers
// MIT License

#include "revguard/guarantee/journal.h"

namespace revguard {
namespace guarantee {

// ============================================================================
// Journal
// ============================================================================

void Journal::Record(UndoAction undo) {
    if (depth_ == 0) {
        return;
    }
    undo_.push_back(std::move(undo));
}

void Journal::RollbackTo(size_t mark) noexcept {
    while (undo_.size() > mark) {
        UndoAction action = std::move(undo_.back());
        undo_.pop_back();
        action();
    }
}

// ============================================================================
// Journal::Scope
// ============================================================================

Journal::Scope::Scope(Journal& journal)
    : journal_(journal)
    , mark_(journal.undo_.size())
    , outermost_(journal.depth_ == 0) {
    ++journal_.depth_;
}

Journal::Scope::~Scope() {
    if (!committed_) {
        journal_.RollbackTo(mark_);
    }
    --journal_.depth_;
}

void Journal::Scope::Commit() {
    if (committed_) {
        return;
    }
    committed_ = true;
    if (outermost_) {
        journal_.undo_.clear();
    }
}

// ============================================================================
// ReentrancyGuard
// ============================================================================

ReentrancyGuard::ReentrancyGuard(bool& entered, const char* component)
    : entered_(entered) {
    if (entered_) {
        throw StateError(std::string("re-entrant call into ") + component);
    }
    entered_ = true;
}

ReentrancyGuard::~ReentrancyGuard() {
    entered_ = false;
}

} // namespace guarantee
} // namespace revguard
