// @src/kindred_impl.cpp
#include "../include/kindred.h"
#include "../include/datastore.h"
#include "../include/entity_codec.h"
#include "../include/key_codec.h"
#include "../include/debug_utils.h"
#include "../include/storage_error/storage_error.h"

#include <magic_enum.hpp>

// --- Transaction Method Implementations ---

Transaction::Transaction(TxnId id, Datastore& store, std::optional<Key> group_root)
    : id_(id), store_(store), phase_(TransactionPhase::OPEN) {
    if (group_root) {
        engine::datastore::KeyCodec::validate(*group_root, true);
        group_ = group_root->root();
    }
    LOG_TRACE("[Transaction Ctor] Created TxnID ", id_, group_ ? ", group " + group_->toString() : std::string());
}

Transaction::~Transaction() {
    TransactionPhase current_phase;
    size_t discarded;
    {
        std::lock_guard<std::mutex> lock(phase_mutex_);
        current_phase = phase_;
        discarded = pending_.size();
    }
    if (current_phase == TransactionPhase::OPEN && discarded > 0) {
        LOG_WARN("[Transaction Dtor] TxnID ", id_, " destroyed while OPEN; discarding ", discarded,
                 " queued operation(s).");
    }
}

void Transaction::requireOpen(const char* operation) const {
    if (phase_ != TransactionPhase::OPEN) {
        throw storage::StorageError(storage::ErrorCode::TRANSACTION_NOT_ACTIVE, "Transaction is not open")
            .withDetails(std::string(operation) + " on transaction " + std::to_string(id_) + " in phase " +
                         std::string(magic_enum::enum_name(phase_)))
            .withContext("key", group_ ? group_->toString() : std::string("<unbound>"));
    }
}

void Transaction::bindGroup(const Key& key) {
    Key root = key.root();
    if (!group_) {
        group_ = root;
        LOG_TRACE("[Transaction] TxnID ", id_, " bound to entity group ", root.toString());
        return;
    }
    if (root != *group_) {
        throw storage::CrossGroupError(key.toString(), group_->toString());
    }
}

Key Transaction::put(Entity entity) {
    {
        std::lock_guard<std::mutex> lock(phase_mutex_);
        requireOpen("put");
        // An incomplete root key starts a new group, which only an unbound transaction can join.
        if (group_ && entity.key.path.size() == 1 && !entity.key.isComplete()) {
            throw storage::CrossGroupError(entity.key.toString(), group_->toString());
        }
        if (entity.key.parent()) {
            bindGroup(entity.key);
        }
    }

    engine::datastore::KeyCodec::validate(entity.key, false);
    if (!entity.key.isComplete()) {
        entity.key = store_.completeKey(entity.key);
    }
    // Encode now so unsupported values fail at the call that introduced them.
    engine::datastore::EntityCodec::entityToDocument(entity);

    std::lock_guard<std::mutex> lock(phase_mutex_);
    requireOpen("put");
    bindGroup(entity.key);
    Key completed = entity.key;
    PendingOperation op{PendingOperation::Type::PUT, std::move(entity), completed};
    pending_.push_back(std::move(op));
    LOG_TRACE("[Transaction Put] TxnID ", id_, " queued put of ", completed.toString());
    return completed;
}

std::optional<Entity> Transaction::get(const Key& key) {
    {
        std::lock_guard<std::mutex> lock(phase_mutex_);
        requireOpen("get");
        engine::datastore::KeyCodec::validate(key, true);
        bindGroup(key);
    }
    return store_.readEntity(key);
}

void Transaction::remove(const Key& key) {
    std::lock_guard<std::mutex> lock(phase_mutex_);
    requireOpen("remove");
    engine::datastore::KeyCodec::validate(key, true);
    bindGroup(key);
    pending_.push_back(PendingOperation{PendingOperation::Type::REMOVE, Entity(), key});
    LOG_TRACE("[Transaction Remove] TxnID ", id_, " queued remove of ", key.toString());
}

void Transaction::commit() {
    std::vector<PendingOperation> operations;
    std::string group_text;
    {
        std::lock_guard<std::mutex> lock(phase_mutex_);
        requireOpen("commit");
        phase_ = TransactionPhase::COMMITTING;
        operations.swap(pending_);
        group_text = group_ ? group_->toString() : std::string("<unbound>");
    }

    storage::StorageError warning(storage::ErrorCode::NON_ATOMIC_COMMIT,
                                  "Committing transaction without transactional guarantees");
    warning.withDetails("Transaction " + std::to_string(id_) + " applies " + std::to_string(operations.size()) +
                        " operation(s) sequentially with no atomicity or isolation");
    warning.withContext("key", group_text);
    store_.errorContext().reportError(warning);

    for (size_t i = 0; i < operations.size(); ++i) {
        const auto& op = operations[i];
        try {
            if (op.type == PendingOperation::Type::PUT) {
                store_.writeEntity(op.entity);
            } else {
                store_.deleteEntity(op.key);
            }
        } catch (const std::exception& e) {
            {
                std::lock_guard<std::mutex> lock(phase_mutex_);
                phase_ = TransactionPhase::PARTIALLY_COMMITTED;
            }
            LOG_ERROR("[Transaction Commit] TxnID ", id_, " stopped at operation ", i, " of ", operations.size(),
                      " (", op.key.toString(), "): ", e.what());
            throw storage::PartialCommitError(i, operations.size(), op.key.toString(), e.what());
        }
    }

    std::lock_guard<std::mutex> lock(phase_mutex_);
    phase_ = TransactionPhase::COMMITTED;
    LOG_TRACE("[Transaction Commit] TxnID ", id_, " committed ", operations.size(), " operation(s)");
}

void Transaction::rollback() {
    std::lock_guard<std::mutex> lock(phase_mutex_);
    requireOpen("rollback");
    pending_.clear();
    phase_ = TransactionPhase::ROLLED_BACK;
    LOG_TRACE("[Transaction Rollback] TxnID ", id_, " rolled back");
}
