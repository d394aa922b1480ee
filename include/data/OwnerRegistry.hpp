#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace Yturl {

/**
 * Durable storage for the claimed owner id
 */
class OwnerStore {
public:
    virtual ~OwnerStore() = default;

    virtual bool save(int64_t ownerId) = 0;
};

/**
 * Writes TELEGRAM_OWNER=<id> into an env-style file
 */
class EnvFileOwnerStore : public OwnerStore {
public:
    static constexpr const char* OwnerKey = "TELEGRAM_OWNER";

    explicit EnvFileOwnerStore(std::string path);

    bool save(int64_t ownerId) override;

private:
    std::string path;
};

/**
 * Single-owner registry for the bot
 *
 * The first user to contact an unclaimed bot becomes its owner. Only the
 * compare-and-set is guarded; handling of the message itself is not.
 */
class OwnerRegistry {
public:
    OwnerRegistry(std::shared_ptr<OwnerStore> store, std::optional<int64_t> initialOwner = std::nullopt);

    // True only for the call that claimed ownership
    bool tryClaim(int64_t userId);

    std::optional<int64_t> currentOwner() const;

    // Claims an unclaimed registry, otherwise compares against the owner
    bool isAuthorized(int64_t userId);

private:
    std::shared_ptr<OwnerStore> store;
    std::optional<int64_t> owner;
    mutable std::mutex mutex;
};

} // namespace Yturl
