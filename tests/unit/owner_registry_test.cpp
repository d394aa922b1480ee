#include "data/OwnerRegistry.hpp"
#include "utils/EnvFile.hpp"
#include "TestSupport.hpp"

#include <atomic>
#include <cassert>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>

namespace {

using Yturl::EnvFile;
using Yturl::EnvFileOwnerStore;
using Yturl::OwnerRegistry;
using YturlTest::MemoryOwnerStore;
using YturlTest::TempDir;

std::string ReadAll(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void TestFirstClaimWinsAndPersists() {
    auto store = std::make_shared<MemoryOwnerStore>();
    OwnerRegistry registry(store);

    assert(!registry.currentOwner());
    assert(registry.isAuthorized(111));
    assert(registry.currentOwner() == 111);

    assert(!registry.isAuthorized(222));
    assert(!registry.tryClaim(222));
    assert(registry.isAuthorized(111));

    assert(store->savedIds() == std::vector<int64_t>{111});
}

void TestPreconfiguredOwnerIsNeverReclaimed() {
    auto store = std::make_shared<MemoryOwnerStore>();
    OwnerRegistry registry(store, 42);

    assert(!registry.isAuthorized(7));
    assert(registry.isAuthorized(42));
    assert(store->savedIds().empty());
}

void TestFailedPersistenceKeepsClaim() {
    auto store = std::make_shared<MemoryOwnerStore>();
    store->failSaves = true;
    OwnerRegistry registry(store);

    assert(registry.tryClaim(5));
    assert(registry.currentOwner() == 5);
    assert(!registry.isAuthorized(6));
}

void TestConcurrentClaimsHaveOneWinner() {
    auto store = std::make_shared<MemoryOwnerStore>();
    OwnerRegistry registry(store);

    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int64_t id = 1; id <= 16; ++id) {
        threads.emplace_back([&registry, &winners, id] {
            if (registry.tryClaim(id)) ++winners;
        });
    }
    for (auto& t : threads) t.join();

    assert(winners == 1);
    assert(store->savedIds().size() == 1);
    assert(registry.currentOwner() == store->savedIds().front());
}

void TestEnvFileRewritesInPlace() {
    TempDir dir;
    std::string path = dir.file(".env");
    {
        std::ofstream out(path);
        out << "TELEGRAM_BOT=token\nTELEGRAM_OWNER=1\n# comment\n";
    }

    EnvFileOwnerStore store(path);
    assert(store.save(987654321));
    assert(ReadAll(path) == "TELEGRAM_BOT=token\nTELEGRAM_OWNER=987654321\n# comment\n");

    EnvFile env(path);
    assert(env.load());
    assert(env.get("TELEGRAM_OWNER") == std::string("987654321"));
    assert(env.get("TELEGRAM_BOT") == std::string("token"));
    assert(!env.get("MISSING"));
}

void TestEnvFileAppendsAndCreates() {
    TempDir dir;
    std::string path = dir.file(".env");
    {
        std::ofstream out(path);
        out << "TELEGRAM_BOT=token\n\n";
    }

    EnvFileOwnerStore store(path);
    assert(store.save(12));
    assert(ReadAll(path) == "TELEGRAM_BOT=token\nTELEGRAM_OWNER=12\n");

    std::string fresh = dir.file("new.env");
    EnvFileOwnerStore freshStore(fresh);
    assert(freshStore.save(34));
    assert(ReadAll(fresh) == "TELEGRAM_OWNER=34\n");

    EnvFileOwnerStore unwritable(dir.file("missing-dir/.env"));
    assert(!unwritable.save(1));
}

void TestEnvFileStripsQuotes() {
    TempDir dir;
    std::string path = dir.file(".env");
    {
        std::ofstream out(path);
        out << "A=\"quoted\"\nB='single'\nC=\"\n";
    }

    EnvFile env(path);
    assert(env.load());
    assert(*env.get("A") == "quoted");
    assert(*env.get("B") == "single");
    assert(*env.get("C") == "\"");

    EnvFile missing(dir.file("nope"));
    assert(!missing.load());
}

} // namespace

int main() {
    TestFirstClaimWinsAndPersists();
    TestPreconfiguredOwnerIsNeverReclaimed();
    TestFailedPersistenceKeepsClaim();
    TestConcurrentClaimsHaveOneWinner();
    TestEnvFileRewritesInPlace();
    TestEnvFileAppendsAndCreates();
    TestEnvFileStripsQuotes();

    std::cout << "owner_registry_test: pass\n";
    return 0;
}
