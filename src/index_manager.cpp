// @src/index_manager.cpp
#include "../include/index_manager.h"
#include "../include/entity_codec.h"
#include "../include/key_codec.h"
#include "../include/debug_utils.h"
#include "../include/storage_error/storage_error.h"

#include <magic_enum.hpp>
#include <algorithm>
#include <fstream>
#include <mutex>

using json = nlohmann::json;

NLOHMANN_JSON_SERIALIZE_ENUM(IndexSortOrder, {
    {IndexSortOrder::ASCENDING, "asc"},
    {IndexSortOrder::DESCENDING, "desc"},
})

void to_json(json& j, const IndexField& f) {
    j = json{{"name", f.name}, {"direction", f.order}};
}

void from_json(const json& j, IndexField& f) {
    j.at("name").get_to(f.name);
    const std::string direction = j.value("direction", std::string("asc"));
    if (direction != "asc" && direction != "desc") {
        throw storage::StorageError(storage::ErrorCode::INDEX_DECLARATION_ERROR, "Unknown sort direction")
            .withDetails("'" + direction + "' for property '" + f.name + "'; expected asc or desc");
    }
    f.order = direction == "desc" ? IndexSortOrder::DESCENDING : IndexSortOrder::ASCENDING;
}

void to_json(json& j, const IndexDescriptor& d) {
    j = json{{"kind", d.kind}, {"ancestor", d.ancestor}, {"properties", d.properties}};
}

void from_json(const json& j, IndexDescriptor& d) {
    j.at("kind").get_to(d.kind);
    d.ancestor = j.value("ancestor", false);
    j.at("properties").get_to(d.properties);
}

// --- IndexManager ---

IndexManager::IndexManager(std::shared_ptr<engine::backend::DocumentBackend> backend,
                           std::shared_ptr<engine::datastore::IdAllocator> id_allocator, bool strict)
    : backend_(std::move(backend)), id_allocator_(std::move(id_allocator)), strict_(strict) {
    if (!backend_ || !id_allocator_) {
        throw storage::StorageError(storage::ErrorCode::INTERNAL_ERROR, "IndexManager requires a backend and id allocator");
    }
}

void IndexManager::validateDescriptor(const IndexDescriptor& descriptor) {
    auto fail = [&descriptor](const std::string& reason) {
        return storage::StorageError(storage::ErrorCode::INDEX_DECLARATION_ERROR, "Invalid index descriptor")
            .withDetails(reason)
            .withContext("kind", descriptor.kind);
    };
    if (descriptor.kind.empty() || engine::datastore::KeyCodec::isReservedKind(descriptor.kind)) {
        throw fail("kind must be a non-reserved, non-empty name");
    }
    if (descriptor.properties.empty()) {
        throw fail("composite index needs at least one property");
    }
    for (const auto& field : descriptor.properties) {
        if (field.name.empty()) throw fail("property names must be non-empty");
    }
}

engine::backend::BackendIndexSpec IndexManager::toBackendSpec(const IndexDescriptor& descriptor) {
    // Ancestor queries are prefix scans on the id, so the physical index ignores the flag.
    engine::backend::BackendIndexSpec spec;
    spec.name = descriptor.physicalName();
    for (const auto& field : descriptor.properties) {
        spec.fields.push_back({engine::datastore::EntityCodec::fieldPath(field.name), field.order});
    }
    return spec;
}

std::optional<int64_t> IndexManager::findByShape(const IndexDescriptor& descriptor) const {
    for (const auto& [id, index] : indexes_) {
        if (index.descriptor.sameShape(descriptor) && index.state != IndexState::DELETED) return id;
    }
    return std::nullopt;
}

int64_t IndexManager::registerIndex(const IndexDescriptor& descriptor, IndexState state) {
    int64_t id = id_allocator_->allocate(INDEX_ID_KIND);
    CompositeIndex index;
    index.id = id;
    index.descriptor = descriptor;
    index.state = state;
    indexes_[id] = index;
    return id;
}

// --- Declarations ---

void IndexManager::declareIndex(const IndexDescriptor& descriptor) {
    validateDescriptor(descriptor);
    std::unique_lock<std::shared_mutex> lock(mutex_);
    bool known = std::any_of(declared_.begin(), declared_.end(),
                             [&descriptor](const IndexDescriptor& d) { return d == descriptor; });
    if (!known) declared_.push_back(descriptor);
}

std::vector<IndexDescriptor> IndexManager::parseDeclarations(const json& document) {
    if (!document.is_object() || !document.contains("indexes") || !document["indexes"].is_array()) {
        throw storage::StorageError(storage::ErrorCode::INDEX_DECLARATION_ERROR, "Invalid index declarations")
            .withDetails("expected an object with an \"indexes\" array");
    }
    std::vector<IndexDescriptor> descriptors;
    try {
        for (const auto& j_def : document["indexes"]) {
            descriptors.push_back(j_def.get<IndexDescriptor>());
        }
    } catch (const json::exception& e) {
        throw storage::StorageError(storage::ErrorCode::INDEX_DECLARATION_ERROR, "Invalid index declaration")
            .withDetails(e.what());
    }
    for (const auto& d : descriptors) {
        validateDescriptor(d);
    }
    return descriptors;
}

size_t IndexManager::loadDeclarations(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw storage::StorageError(storage::ErrorCode::INDEX_DECLARATION_ERROR, "Cannot open index declarations")
            .withFilePath(path);
    }
    json document = json::parse(file, nullptr, false);
    if (document.is_discarded()) {
        throw storage::StorageError(storage::ErrorCode::INDEX_DECLARATION_ERROR, "Index declarations are not valid JSON")
            .withFilePath(path);
    }
    auto descriptors = parseDeclarations(document);
    for (const auto& d : descriptors) {
        declareIndex(d);
    }
    LOG_INFO("[IndexManager] Loaded ", descriptors.size(), " index declarations from ", path);
    return descriptors.size();
}

std::vector<IndexDescriptor> IndexManager::declaredIndexes() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return declared_;
}

size_t IndexManager::reconcile() {
    if (!strict_) {
        LOG_DEBUG(1, "[IndexManager] Strict index checking off; skipping reconciliation");
        return 0;
    }
    size_t created = 0;
    const auto declared = declaredIndexes();
    for (const auto& descriptor : declared) {
        if (ensureIndex(descriptor) == CreateIndexResult::CREATED) ++created;
    }
    LOG_INFO("[IndexManager] Reconciled ", declared.size(), " declared indexes, created ", created);
    return created;
}

bool IndexManager::buildPhysicalIndex(const IndexDescriptor& descriptor) {
    const std::string collection = engine::datastore::EntityCodec::collectionForKind(descriptor.kind);
    const auto spec = toBackendSpec(descriptor);
    const auto physical = backend_->listIndexes(collection);
    bool present = std::any_of(physical.begin(), physical.end(),
                               [&spec](const engine::backend::BackendIndexSpec& s) { return s.name == spec.name; });
    if (present) return false;
    LOG_INFO("[IndexManager] Creating index ", descriptor.toString());
    backend_->createIndex(collection, spec);
    return true;
}

bool IndexManager::adoptPhysicalIndex(const IndexDescriptor& descriptor) {
    const std::string name = descriptor.physicalName();
    const auto physical = backend_->listIndexes(engine::datastore::EntityCodec::collectionForKind(descriptor.kind));
    bool present = std::any_of(physical.begin(), physical.end(),
                               [&name](const engine::backend::BackendIndexSpec& s) { return s.name == name; });
    if (!present) return false;

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (auto existing = findByShape(descriptor)) {
        return indexes_.at(*existing).state == IndexState::READ_WRITE;
    }
    int64_t id = registerIndex(descriptor, IndexState::READ_WRITE);
    LOG_INFO("[IndexManager] Found backend index '", name, "', registered as index ", id);
    return true;
}

CreateIndexResult IndexManager::ensureIndex(const IndexDescriptor& descriptor) {
    if (!strict_) {
        return CreateIndexResult::SKIPPED;
    }
    validateDescriptor(descriptor);

    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto existing = findByShape(descriptor);
        if (existing && indexes_.at(*existing).state == IndexState::READ_WRITE) {
            return CreateIndexResult::ALREADY_EXISTS;
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    // Re-check after acquiring the exclusive lock.
    auto existing = findByShape(descriptor);
    if (existing && indexes_.at(*existing).state == IndexState::READ_WRITE) {
        return CreateIndexResult::ALREADY_EXISTS;
    }
    if (existing && indexes_.at(*existing).state == IndexState::ERROR) {
        // A failed build is retired and replaced by a fresh index.
        transition(indexes_.at(*existing), IndexState::DELETED);
        existing.reset();
    }

    bool created = false;
    try {
        created = buildPhysicalIndex(descriptor);
    } catch (const storage::StorageError& e) {
        if (existing) transition(indexes_.at(*existing), IndexState::ERROR);
        LOG_ERROR("[IndexManager] Building ", descriptor.toString(), " failed: ", e.what());
        throw;
    }

    if (existing) {
        transition(indexes_.at(*existing), IndexState::READ_WRITE);
    } else {
        registerIndex(descriptor, IndexState::READ_WRITE);
    }
    return created ? CreateIndexResult::CREATED : CreateIndexResult::ALREADY_EXISTS;
}

void IndexManager::requireIndex(const IndexDescriptor& required, const std::string& query_text) {
    if (!strict_) return;
    bool registered = false;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto existing = findByShape(required);
        if (existing && indexes_.at(*existing).state == IndexState::READ_WRITE) {
            return;
        }
        registered = existing.has_value();
    }
    if (!registered && adoptPhysicalIndex(required)) {
        return;
    }
    storage::IndexMissingError err(query_text, required.toString());
    err.withContext("kind", required.kind);
    throw err;
}

bool IndexManager::hasIndex(const IndexDescriptor& descriptor) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& d : declared_) {
            if (d.sameShape(descriptor)) return true;
        }
        auto existing = findByShape(descriptor);
        if (existing) {
            return indexes_.at(*existing).state == IndexState::READ_WRITE;
        }
    }
    return adoptPhysicalIndex(descriptor);
}

// --- Administration ---

int64_t IndexManager::createIndex(const IndexDescriptor& descriptor, IndexState initial_state) {
    validateDescriptor(descriptor);
    if (initial_state != IndexState::READ_WRITE && initial_state != IndexState::WRITE_ONLY) {
        throw storage::StorageError(storage::ErrorCode::INDEX_STATE_TRANSITION, "New indexes start WRITE_ONLY or READ_WRITE")
            .withDetails(std::string(magic_enum::enum_name(initial_state)))
            .withContext("kind", descriptor.kind);
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (auto existing = findByShape(descriptor)) {
        throw storage::StorageError(storage::ErrorCode::INDEX_ALREADY_EXISTS, "Index already exists")
            .withDetails(descriptor.toString() + " is registered as index " + std::to_string(*existing))
            .withContext("kind", descriptor.kind);
    }

    int64_t id = registerIndex(descriptor, IndexState::WRITE_ONLY);
    try {
        buildPhysicalIndex(descriptor);
    } catch (const storage::StorageError& e) {
        transition(indexes_.at(id), IndexState::ERROR);
        LOG_ERROR("[IndexManager] Building index ", id, " ", descriptor.toString(), " failed: ", e.what());
        throw;
    }
    // Built synchronously; WRITE_ONLY callers promote it themselves.
    if (initial_state == IndexState::READ_WRITE) {
        transition(indexes_.at(id), IndexState::READ_WRITE);
    }
    return id;
}

std::vector<CompositeIndex> IndexManager::listIndexes(const std::optional<std::string>& kind) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<CompositeIndex> result;
    for (const auto& [id, index] : indexes_) {
        (void)id;
        if (!kind || index.descriptor.kind == *kind) result.push_back(index);
    }
    return result;
}

std::optional<CompositeIndex> IndexManager::getIndex(int64_t id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = indexes_.find(id);
    if (it == indexes_.end()) return std::nullopt;
    return it->second;
}

bool IndexManager::isAllowedTransition(IndexState from, IndexState to) {
    switch (from) {
        case IndexState::WRITE_ONLY:
            return to == IndexState::READ_WRITE || to == IndexState::DELETED || to == IndexState::ERROR;
        case IndexState::READ_WRITE:
        case IndexState::ERROR:
            return to == IndexState::DELETED;
        case IndexState::DELETED:
            return to == IndexState::ERROR;
    }
    return false;
}

void IndexManager::transition(CompositeIndex& index, IndexState new_state) {
    if (!isAllowedTransition(index.state, new_state)) {
        throw storage::StorageError(storage::ErrorCode::INDEX_STATE_TRANSITION, "Index state transition not allowed")
            .withDetails(std::string(magic_enum::enum_name(index.state)) + " -> " +
                         std::string(magic_enum::enum_name(new_state)))
            .withContext("kind", index.descriptor.kind);
    }
    // A retired index may share its physical index with a newer one of the same shape.
    bool shared = std::any_of(indexes_.begin(), indexes_.end(), [&index](const auto& entry) {
        return entry.first != index.id && entry.second.state != IndexState::DELETED &&
               entry.second.descriptor.sameShape(index.descriptor);
    });
    if (new_state == IndexState::DELETED && !shared) {
        backend_->dropIndex(engine::datastore::EntityCodec::collectionForKind(index.descriptor.kind),
                            index.descriptor.physicalName());
    }
    LOG_DEBUG(1, "[IndexManager] Index ", index.id, " ", magic_enum::enum_name(index.state), " -> ",
              magic_enum::enum_name(new_state));
    index.state = new_state;
}

void IndexManager::updateIndexState(int64_t id, IndexState new_state) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = indexes_.find(id);
    if (it == indexes_.end()) {
        throw storage::StorageError(storage::ErrorCode::INDEX_NOT_FOUND, "No index with id " + std::to_string(id));
    }
    transition(it->second, new_state);
}

bool IndexManager::deleteIndex(int64_t id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = indexes_.find(id);
    if (it == indexes_.end()) return false;
    const IndexDescriptor descriptor = it->second.descriptor;
    const bool physical = it->second.state != IndexState::DELETED;
    indexes_.erase(it);
    if (physical) {
        backend_->dropIndex(engine::datastore::EntityCodec::collectionForKind(descriptor.kind), descriptor.physicalName());
    }
    LOG_INFO("[IndexManager] Deleted index ", id, " ", descriptor.toString());
    return true;
}
