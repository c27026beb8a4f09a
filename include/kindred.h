// @include/kindred.h
#pragma once

#include "types.h"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class Datastore;

enum class TransactionPhase {
    OPEN,                   // Accepting operations
    COMMITTING,             // Queued operations being applied one by one
    COMMITTED,              // Every queued operation applied
    PARTIALLY_COMMITTED,    // Commit stopped at a failed operation; earlier ones stay applied
    ROLLED_BACK
};

/**
 * @brief Emulated transaction over a single entity group.
 *
 * The backend has no multi-document transactions, so puts and removes are
 * only queued while OPEN and then applied sequentially on commit, without
 * atomicity or isolation. Gets read through to the backend immediately.
 * The entity group is fixed by the root passed to beginTransaction or by
 * the first key touched; a key from another group raises CrossGroupError.
 */
class Transaction {
private:
    struct PendingOperation {
        enum class Type { PUT, REMOVE };
        Type type;
        Entity entity;  // PUT
        Key key;        // REMOVE, or the entity key for PUT
    };

    TxnId id_;
    Datastore& store_;
    std::optional<Key> group_;
    std::vector<PendingOperation> pending_;
    TransactionPhase phase_ = TransactionPhase::OPEN;
    mutable std::mutex phase_mutex_;

    void requireOpen(const char* operation) const;   // phase_mutex_ held
    void bindGroup(const Key& key);                  // phase_mutex_ held

public:
    Transaction(TxnId id, Datastore& store, std::optional<Key> group_root = std::nullopt);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    TxnId getId() const { return id_; }
    TransactionPhase getPhase() const {
        std::lock_guard<std::mutex> lock(phase_mutex_);
        return phase_;
    }
    bool canModify() const { return getPhase() == TransactionPhase::OPEN; }
    std::optional<Key> entityGroup() const {
        std::lock_guard<std::mutex> lock(phase_mutex_);
        return group_;
    }
    size_t pendingOperations() const {
        std::lock_guard<std::mutex> lock(phase_mutex_);
        return pending_.size();
    }

    // Queues a put. An incomplete key gets its id now; the completed key is returned.
    Key put(Entity entity);
    std::optional<Entity> get(const Key& key);
    void remove(const Key& key);

    // Reports a NON_ATOMIC_COMMIT warning on every commit, empty ones included.
    // Throws storage::PartialCommitError at the first failed operation.
    void commit();
    void rollback();

    friend class Datastore;
};
