#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <vector>
#include "auditlog/Capabilities.hpp"

namespace auditlog {

// What the recorder needs from the persistence layer's current transaction.
class Transaction {
public:
    virtual ~Transaction() = default;
    virtual bool isOpen() const = 0;
    // Run callback after a successful commit; never run it on rollback.
    virtual void onCommit(std::function<void()> callback) = 0;
};

// In-memory transaction scope with commit hooks.
//
// Callbacks run in registration order when the outermost scope commits.
// A nested scope hands its callbacks to its parent on commit and drops
// only its own on rollback. Destruction without commit() rolls back.
// Callbacks registered by a Recorder are safe to run after that recorder
// is destroyed; they drop their entry instead.
class TransactionScope : public Transaction {
public:
    explicit TransactionScope(TransactionScope* parent = nullptr);
    ~TransactionScope() override;

    TransactionScope(const TransactionScope&) = delete;
    TransactionScope& operator=(const TransactionScope&) = delete;

    bool isOpen() const override;
    void onCommit(std::function<void()> callback) override;

    void commit();
    void rollback();

    std::size_t pendingCallbacks() const;

private:
    TransactionScope* parent_;
    bool open_ = true;
    std::vector<std::function<void()>> callbacks_;
    mutable std::mutex mutex_;

    void adopt(std::vector<std::function<void()>> callbacks);
};

// Request-scoped state threaded through producers into the recorder.
struct RecordingContext {
    std::shared_ptr<const Actor> actor;   // ambient actor for the request, if any
    Transaction* transaction = nullptr;   // enclosing transaction, if any
};

} // namespace auditlog
