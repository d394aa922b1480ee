#include "data/OwnerRegistry.hpp"
#include "utils/EnvFile.hpp"
#include "utils/Logger.hpp"

namespace Yturl {

// EnvFileOwnerStore implementation

EnvFileOwnerStore::EnvFileOwnerStore(std::string path)
    : path(std::move(path)) {
}

bool EnvFileOwnerStore::save(int64_t ownerId) {
    EnvFile envFile(path);
    if (!envFile.load()) {
        LOG_BOT_WARN("Env file {} not readable, creating it", path);
    }

    envFile.set(OwnerKey, std::to_string(ownerId));
    if (!envFile.save()) {
        LOG_BOT_ERROR("Cannot write owner to {}", path);
        return false;
    }

    LOG_BOT_INFO("Saved owner {} to {}", ownerId, path);
    return true;
}

// OwnerRegistry implementation

OwnerRegistry::OwnerRegistry(std::shared_ptr<OwnerStore> store, std::optional<int64_t> initialOwner)
    : store(std::move(store))
    , owner(initialOwner) {
    if (owner) {
        LOG_BOT_INFO("Owner set: {}", *owner);
    }
}

bool OwnerRegistry::tryClaim(int64_t userId) {
    std::lock_guard<std::mutex> lock(mutex);
    if (owner) {
        return false;
    }

    owner = userId;
    LOG_BOT_INFO("Owner registered: {}", userId);

    // Best effort: the in-memory claim stands even if persisting fails
    if (store && !store->save(userId)) {
        LOG_BOT_ERROR("Owner {} claimed but not persisted", userId);
    }
    return true;
}

std::optional<int64_t> OwnerRegistry::currentOwner() const {
    std::lock_guard<std::mutex> lock(mutex);
    return owner;
}

bool OwnerRegistry::isAuthorized(int64_t userId) {
    if (tryClaim(userId)) {
        return true;
    }
    return currentOwner() == userId;
}

} // namespace Yturl
