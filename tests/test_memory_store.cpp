#include <catch2/catch_test_macros.hpp>
#include "arbiter/memory_store.hpp"
#include <future>

using namespace arbiter;
using namespace std::chrono_literals;

TEST_CASE("Writes are invisible until commit", "[storage]")
{
    MemoryStore store;
    auto txn = store.begin();
    REQUIRE(txn->put("k/1", "one").has_value());

    // read-your-writes inside the transaction
    auto own = txn->get("k/1");
    REQUIRE(own.has_value());
    REQUIRE(*own == std::optional<std::string>("one"));

    REQUIRE_FALSE(store.get("k/1")->has_value());
    REQUIRE(txn->commit().has_value());
    REQUIRE(*store.get("k/1") == std::optional<std::string>("one"));
}

TEST_CASE("Destroying an uncommitted transaction rolls it back", "[storage]")
{
    MemoryStore store;
    {
        auto txn = store.begin();
        REQUIRE(txn->put("k/1", "one").has_value());
    }
    REQUIRE_FALSE(store.get("k/1")->has_value());

    // the key lock was released with the rollback
    auto next = store.begin();
    REQUIRE(next->get_for_update("k/1").has_value());
}

TEST_CASE("Prefix scans merge pending writes in key order", "[storage]")
{
    MemoryStore store;
    {
        auto seed = store.begin();
        REQUIRE(seed->put("p/b", "2").has_value());
        REQUIRE(seed->put("p/c", "3").has_value());
        REQUIRE(seed->put("q/a", "x").has_value());
        REQUIRE(seed->commit().has_value());
    }

    auto txn = store.begin();
    REQUIRE(txn->put("p/a", "1").has_value());
    REQUIRE(txn->erase("p/c").has_value());

    auto rows = txn->scan_prefix("p/");
    REQUIRE(rows.has_value());
    REQUIRE(rows->size() == 2);
    REQUIRE((*rows)[0] == KeyValue{"p/a", "1"});
    REQUIRE((*rows)[1] == KeyValue{"p/b", "2"});

    auto committed = store.scan_prefix("p/");
    REQUIRE(committed->size() == 2);
    REQUIRE((*committed)[1].first == "p/c");
}

TEST_CASE("A held key lock times out as Busy", "[storage]")
{
    MemoryStore store(50ms);
    auto holder = store.begin();
    REQUIRE(holder->get_for_update("head").has_value());

    auto contender = std::async(std::launch::async, [&store]
                                {
        auto txn = store.begin();
        return txn->get_for_update("head"); });
    auto result = contender.get();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ErrorCode::Busy);
    REQUIRE(result.error().is_retryable());

    holder->rollback();
    auto after = std::async(std::launch::async, [&store]
                            {
        auto txn = store.begin();
        return txn->get_for_update("head"); });
    REQUIRE(after.get().has_value());
}

TEST_CASE("A finished transaction refuses further use", "[storage]")
{
    MemoryStore store;
    auto txn = store.begin();
    REQUIRE(txn->commit().has_value());
    REQUIRE_FALSE(txn->put("k", "v").has_value());
    REQUIRE_FALSE(txn->commit().has_value());
}

TEST_CASE("run_transaction retries contention only", "[storage]")
{
    MemoryStore store;

    SECTION("Busy attempts are retried until success")
    {
        int attempts = 0;
        auto result = run_transaction(store, 3, [&](StoreTransaction &txn) -> Result<int>
                                      {
            ++attempts;
            if (attempts < 3)
                return std::unexpected(ArbiterError::busy("contended"));
            if (auto res = txn.put("k", "v"); !res)
                return std::unexpected(res.error());
            return attempts; });
        REQUIRE(result.has_value());
        REQUIRE(*result == 3);
        REQUIRE(*store.get("k") == std::optional<std::string>("v"));
    }

    SECTION("retries are bounded")
    {
        int attempts = 0;
        auto result = run_transaction(store, 2, [&](StoreTransaction &) -> Result<int>
                                      {
            ++attempts;
            return std::unexpected(ArbiterError::busy("contended")); });
        REQUIRE_FALSE(result.has_value());
        REQUIRE(attempts == 3);
    }

    SECTION("other errors are returned at once and nothing is written")
    {
        int attempts = 0;
        auto result = run_transaction(store, 3, [&](StoreTransaction &txn) -> Result<int>
                                      {
            ++attempts;
            if (auto res = txn.put("k", "v"); !res)
                return std::unexpected(res.error());
            return std::unexpected(ArbiterError::validation("bad")); });
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::ValidationError);
        REQUIRE(attempts == 1);
        REQUIRE_FALSE(store.get("k")->has_value());
    }
}

TEST_CASE("Key layout keeps sequences in numeric order", "[storage]")
{
    REQUIRE(keys::sequence(7) == "00000000000000000007");
    REQUIRE(keys::ledger_entry("a1", 2) < keys::ledger_entry("a1", 10));
    REQUIRE(keys::ledger_entry("a1", 1).starts_with(keys::ledger_prefix("a1")));
    REQUIRE_FALSE(keys::ledger_entry("a10", 1).starts_with(keys::ledger_prefix("a1")));

    REQUIRE(keys::validate_id("assessment_id", "asm-1").has_value());
    REQUIRE_FALSE(keys::validate_id("assessment_id", "").has_value());
    REQUIRE_FALSE(keys::validate_id("assessment_id", "a/b").has_value());
    REQUIRE_FALSE(keys::validate_id("assessment_id", std::string(200, 'x')).has_value());
    REQUIRE(keys::validate_id("assessment_id", "\xC3\xA9").has_value());
    auto not_utf8 = keys::validate_id("assessment_id", "asm-\xFF");
    REQUIRE_FALSE(not_utf8.has_value());
    REQUIRE(not_utf8.error().code == ErrorCode::ValidationError);
}
