// REVGUARD - Unit of Work Journal
// Copyright (c) 2024 REVGUARD Developers
// MIT License
//
// Every public mutating operation of the pool, the engine and the reference
// collaborators runs inside a Journal::Scope. State changes register an undo
// action; when a scope unwinds without Commit() the actions recorded since it
// opened are replayed in reverse. Only the outermost scope discards the log on
// commit, so a failure anywhere in an engine -> pool -> asset -> vault chain
// restores every participant.

#ifndef REVGUARD_GUARANTEE_JOURNAL_H
#define REVGUARD_GUARANTEE_JOURNAL_H

#include "revguard/guarantee/errors.h"

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace revguard {
namespace guarantee {

class Journal {
public:
    using UndoAction = std::function<void()>;

    Journal() = default;
    ~Journal() = default;

    Journal(const Journal&) = delete;
    Journal& operator=(const Journal&) = delete;

    /**
     * RAII unit of work. Destroying an uncommitted scope rolls back to the
     * point where it was opened.
     */
    class Scope {
    public:
        explicit Scope(Journal& journal);
        ~Scope();

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

        /// Keep the changes; the outermost commit makes them permanent
        void Commit();

        bool IsOutermost() const { return outermost_; }

    private:
        Journal& journal_;
        size_t mark_;
        bool outermost_;
        bool committed_{false};
    };

    /// Register an undo action. Outside any scope changes are permanent and
    /// the action is dropped.
    void Record(UndoAction undo);

    /// Journal an assignment to a field that outlives the scope
    template<typename T, typename U>
    void Assign(T& field, U&& value) {
        Record([&field, old = field]() { field = old; });
        field = std::forward<U>(value);
    }

    /// Journal the current value (or absence) of a map entry before mutating it
    template<typename K, typename V, typename C>
    void SaveEntry(std::map<K, V, C>& map, const K& key) {
        auto it = map.find(key);
        std::optional<V> prior;
        if (it != map.end()) {
            prior = it->second;
        }
        Record([&map, key, prior]() {
            if (prior) {
                map[key] = *prior;
            } else {
                map.erase(key);
            }
        });
    }

    bool InScope() const { return depth_ > 0; }

    size_t Depth() const { return depth_; }

    /// Undo actions waiting for the outermost commit
    size_t PendingCount() const { return undo_.size(); }

private:
    void RollbackTo(size_t mark) noexcept;

    std::vector<UndoAction> undo_;
    size_t depth_{0};
};

/**
 * Rejects a call into a component that is already executing one of its own
 * operations (for example from a collaborator callback).
 */
class ReentrancyGuard {
public:
    ReentrancyGuard(bool& entered, const char* component);
    ~ReentrancyGuard();

    ReentrancyGuard(const ReentrancyGuard&) = delete;
    ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;

private:
    bool& entered_;
};

} // namespace guarantee
} // namespace revguard

#endif // REVGUARD_GUARANTEE_JOURNAL_H
