#ifndef PLEDGE_JOURNAL_HPP
#define PLEDGE_JOURNAL_HPP

#include <functional>
#include <vector>

namespace pledge {

// =============================================================================
// Journal - all-or-nothing call scope
//
// Every mutating entry point records an undo action for each effect it applies
// and queues its events as commit actions. If the scope ends without commit()
// the undo actions run in reverse order and the events are dropped. A journal
// opened with a parent hands both lists to the parent on commit, so a
// multi-component call (e.g. liquidation) commits or unwinds as one unit.
//
// Undo actions must not throw: an uncommitted journal unwinds from its
// destructor. Reversals of host transfers are registered with on_compensate;
// the host may refuse them, so entry points that can fail after a transfer
// call rollback() themselves and report ROLLBACK_INCOMPLETE when it returns
// false. The destructor can only log such a failure.
// =============================================================================

class Journal {
public:
    using Action = std::function<void()>;
    using Compensation = std::function<bool()>;  // false when the reversal was refused

    Journal() = default;
    explicit Journal(Journal* parent) : parent_(parent) {}
    ~Journal();

    // Non-copyable
    Journal(const Journal&) = delete;
    Journal& operator=(const Journal&) = delete;

    void on_rollback(Action undo);
    void on_compensate(Compensation undo);
    void on_commit(Action action);

    // Seal the scope. Top-level journals run their commit actions here.
    void commit();

    // Unwind now, in reverse order. Returns false if any compensation was
    // refused; the remaining undo actions still run. No-op once committed.
    bool rollback();

    bool committed() const { return committed_; }
    size_t pending_undo() const { return undo_.size(); }

private:
    Journal* parent_ = nullptr;
    std::vector<Compensation> undo_;
    std::vector<Action> commit_;
    bool committed_ = false;
};

// =============================================================================
// EntryGuard - per-component reentrancy lock (RAII)
// =============================================================================

class EntryGuard {
public:
    explicit EntryGuard(bool& entered) : entered_(entered), acquired_(!entered) {
        if (acquired_) entered_ = true;
    }

    ~EntryGuard() {
        if (acquired_) entered_ = false;
    }

    EntryGuard(const EntryGuard&) = delete;
    EntryGuard& operator=(const EntryGuard&) = delete;

    bool acquired() const { return acquired_; }

private:
    bool& entered_;
    bool acquired_;
};

} // namespace pledge

#endif // PLEDGE_JOURNAL_HPP
