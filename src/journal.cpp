// =============================================================================
// journal.cpp - Call-scope rollback and deferred commit actions
// =============================================================================

#include "pledge/journal.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace pledge {

Journal::~Journal() {
    if (!committed_ && !rollback()) {
        spdlog::critical("journal: rollback left refused compensations behind");
    }
}

void Journal::on_rollback(Action undo) {
    undo_.push_back([undo = std::move(undo)] {
        undo();
        return true;
    });
}

void Journal::on_compensate(Compensation undo) {
    undo_.push_back(std::move(undo));
}

void Journal::on_commit(Action action) {
    commit_.push_back(std::move(action));
}

void Journal::commit() {
    if (committed_) return;
    committed_ = true;

    if (parent_) {
        for (auto& undo : undo_) {
            parent_->on_compensate(std::move(undo));
        }
        for (auto& action : commit_) {
            parent_->on_commit(std::move(action));
        }
    } else {
        for (auto& action : commit_) {
            action();
        }
    }

    undo_.clear();
    commit_.clear();
}

bool Journal::rollback() {
    if (committed_) return true;

    bool complete = true;
    for (auto it = undo_.rbegin(); it != undo_.rend(); ++it) {
        if (!(*it)()) complete = false;
    }
    undo_.clear();
    commit_.clear();
    return complete;
}

} // namespace pledge
