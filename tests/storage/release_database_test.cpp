/**
 * @file release_database_test.cpp
 * @brief Tests for connection opening, probing and transaction modes
 */

#include <relvault/storage/release_database.hpp>

#include "fixtures/temp_database.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>

using namespace relvault;
using namespace relvault::storage;

TEST_CASE("probe never creates the store", "[storage][database]") {
    test::temp_database tmp;
    const auto path = tmp.config().path;
    REQUIRE_FALSE(std::filesystem::exists(path));

    auto missing = release_database::probe(tmp.config());
    REQUIRE(missing.is_err());
    CHECK(missing.error().code == error_codes::unavailable);
    CHECK_FALSE(std::filesystem::exists(path));

    auto db = tmp.open();
    db.reset();

    CHECK(release_database::probe(tmp.config()).is_ok());
}

TEST_CASE("probe rejects a file that is not a database", "[storage][database]") {
    test::temp_database tmp;
    {
        std::ofstream junk(tmp.config().path);
        junk << "this is not an sqlite database, just some text padding it out";
    }
    auto probed = release_database::probe(tmp.config());
    REQUIRE(probed.is_err());
    CHECK(probed.error().code == error_codes::unavailable);
}

TEST_CASE("open_existing leaves a missing store alone", "[storage][database]") {
    test::temp_database tmp;

    auto missing = release_database::open_existing(tmp.config());
    REQUIRE(missing.is_err());
    CHECK(missing.error().code == error_codes::unavailable);
    CHECK_FALSE(std::filesystem::exists(tmp.config().path));

    auto created = tmp.open();
    created.reset();

    auto existing = release_database::open_existing(tmp.config());
    REQUIRE(existing.is_ok());
    CHECK(existing.value()->execute("SELECT count(*) FROM key_links;").is_ok());
}

TEST_CASE("Deferred transactions coexist with a writer", "[storage][database]") {
    test::temp_database tmp;
    auto writer = tmp.open();
    REQUIRE(writer->begin().is_ok());
    REQUIRE(writer->execute("INSERT INTO committees(name) VALUES ('tooling');").is_ok());

    auto config = tmp.config();
    config.busy_timeout = std::chrono::milliseconds(100);
    auto other = release_database::open_existing(config);
    REQUIRE(other.is_ok());

    SECTION("a second immediate transaction is refused") {
        auto begun = other.value()->begin(transaction_mode::immediate);
        REQUIRE(begun.is_err());
        CHECK(begun.error().code == error_codes::unavailable);
        CHECK_FALSE(other.value()->in_transaction());
    }

    SECTION("a deferred transaction can read") {
        REQUIRE(other.value()->begin(transaction_mode::deferred).is_ok());
        CHECK(other.value()->in_transaction());
        CHECK(other.value()->execute("SELECT count(*) FROM committees;").is_ok());
        REQUIRE(other.value()->rollback().is_ok());
    }

    REQUIRE(writer->commit().is_ok());
}

TEST_CASE("begin refuses a nested transaction", "[storage][database]") {
    test::temp_database tmp;
    auto db = tmp.open();
    REQUIRE(db->begin(transaction_mode::deferred).is_ok());
    auto nested = db->begin();
    REQUIRE(nested.is_err());
    CHECK(nested.error().code == error_codes::database_error);
    REQUIRE(db->rollback().is_ok());
    CHECK_FALSE(db->in_transaction());
}
