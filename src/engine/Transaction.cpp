#include "auditlog/Transaction.hpp"

#include <iostream>
#include <stdexcept>

namespace auditlog {

TransactionScope::TransactionScope(TransactionScope* parent) : parent_(parent) {
    if (parent_ && !parent_->isOpen()) {
        throw std::logic_error("TransactionScope: parent transaction is not open");
    }
}

TransactionScope::~TransactionScope() {
    if (isOpen()) rollback();
}

bool TransactionScope::isOpen() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return open_;
}

void TransactionScope::onCommit(std::function<void()> callback) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!open_) {
        throw std::logic_error("TransactionScope: onCommit after the transaction ended");
    }
    callbacks_.push_back(std::move(callback));
}

void TransactionScope::adopt(std::vector<std::function<void()>> callbacks) {
    std::lock_guard<std::mutex> lk(mutex_);
    for (auto& cb : callbacks) {
        callbacks_.push_back(std::move(cb));
    }
}

void TransactionScope::commit() {
    std::vector<std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!open_) throw std::logic_error("TransactionScope: commit on a closed transaction");
        open_ = false;
        callbacks.swap(callbacks_);
    }

    if (parent_) {
        parent_->adopt(std::move(callbacks));
        return;
    }
    for (auto& cb : callbacks) {
        try {
            cb();
        } catch (const std::exception& e) {
            std::cerr << "TransactionScope: commit callback failed: " << e.what() << "\n";
        }
    }
}

void TransactionScope::rollback() {
    std::lock_guard<std::mutex> lk(mutex_);
    open_ = false;
    callbacks_.clear();
}

std::size_t TransactionScope::pendingCallbacks() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return callbacks_.size();
}

} // namespace auditlog
