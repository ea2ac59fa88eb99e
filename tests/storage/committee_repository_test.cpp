/**
 * @file committee_repository_test.cpp
 * @brief Unit tests for committee_repository and the directory loader
 */

#include <relvault/storage/committee_repository.hpp>
#include <relvault/storage/directory_loader.hpp>

#include "fixtures/temp_database.hpp"

#include <catch2/catch_test_macros.hpp>

#include <fstream>

using namespace relvault;
using namespace relvault::storage;
using relvault::security::privilege_level;

namespace {

constexpr std::string_view directory_json = R"({
  "principals": [
    {"uid": "alice"},
    {"uid": "root", "admin": true},
    {"uid": "gone", "active": false},
    {"uid": "guest", "committer": false}
  ],
  "committees": [
    {"name": "tooling", "display_name": "Tooling",
     "members": ["alice", "gone"], "committers": ["bob"]},
    {"name": "httpd"}
  ]
})";

}  // namespace

TEST_CASE("committee_repository principals and roles", "[storage][directory]") {
    test::temp_database tmp;
    auto db = tmp.open();
    committee_repository directory(db->native_handle());

    REQUIRE(directory.upsert_principal({"alice", true, false, true}).is_ok());
    REQUIRE(directory.upsert_committee({"tooling", "Tooling"}).is_ok());

    SECTION("upsert updates in place") {
        REQUIRE(directory.upsert_principal({"alice", true, true, true}).is_ok());
        auto found = directory.find_principal("alice");
        REQUIRE(found.is_ok());
        REQUIRE(found.value().has_value());
        CHECK(found.value()->is_admin);
        CHECK(directory.is_administrator("alice"));
    }

    SECTION("roles") {
        REQUIRE(directory.add_role("tooling", "alice", committee_role::member).is_ok());
        CHECK(directory.has_role("tooling", "alice", committee_role::member).value());
        CHECK_FALSE(directory.has_role("tooling", "alice", committee_role::committer).value());

        REQUIRE(directory.remove_role("tooling", "alice", committee_role::member).is_ok());
        CHECK_FALSE(directory.has_role("tooling", "alice", committee_role::member).value());
    }

    SECTION("committees are listed by name") {
        REQUIRE(directory.upsert_committee({"airflow", "Airflow"}).is_ok());
        auto listed = directory.list_committees();
        REQUIRE(listed.is_ok());
        REQUIRE(listed.value().size() == 2);
        CHECK(listed.value()[0].name == "airflow");
        CHECK(listed.value()[1].name == "tooling");

        auto found = directory.find_committee("tooling");
        REQUIRE(found.is_ok());
        REQUIRE(found.value().has_value());
        CHECK(found.value()->display_name == "Tooling");
        CHECK_FALSE(directory.find_committee("nope").value().has_value());
    }

    SECTION("unknown accounts are not signed in") {
        CHECK(directory.is_signed_in("alice"));
        CHECK_FALSE(directory.is_signed_in("mallory"));
        CHECK_FALSE(directory.is_administrator("mallory"));
    }
}

TEST_CASE("Privilege derivation", "[storage][directory]") {
    test::temp_database tmp;
    auto db = tmp.open();
    auto loaded = load_directory(*db, directory_json);
    REQUIRE(loaded.is_ok());

    committee_repository directory(db->native_handle());
    auto level = [&](std::string_view uid, std::optional<std::string_view> committee) {
        auto result = directory.privilege_for(uid, committee);
        REQUIRE(result.is_ok());
        return result.value();
    };

    CHECK(level("alice", std::nullopt) == privilege_level::foundation_committer);
    CHECK(level("alice", "tooling") == privilege_level::committee_member);
    CHECK(level("alice", "httpd") == privilege_level::foundation_committer);
    CHECK(level("bob", "tooling") == privilege_level::committee_participant);
    CHECK(level("guest", std::nullopt) == privilege_level::general_public);
    CHECK(level("gone", "tooling") == privilege_level::general_public);
    CHECK(level("mallory", "tooling") == privilege_level::general_public);
    CHECK(level("alice", "no-such-committee") == privilege_level::foundation_committer);
}

TEST_CASE("Directory loader", "[storage][directory]") {
    test::temp_database tmp;
    auto db = tmp.open();

    SECTION("counts what it wrote, including implied principals") {
        auto loaded = load_directory(*db, directory_json);
        REQUIRE(loaded.is_ok());
        CHECK(loaded.value().principals == 5);
        CHECK(loaded.value().committees == 2);
        CHECK(loaded.value().roles == 3);

        committee_repository directory(db->native_handle());
        CHECK(directory.is_signed_in("bob"));
        CHECK(directory.is_administrator("root"));
        CHECK_FALSE(directory.is_signed_in("gone"));
        CHECK(directory.find_committee("httpd").value()->display_name == "httpd");
    }

    SECTION("loading twice is idempotent") {
        REQUIRE(load_directory(*db, directory_json).is_ok());
        REQUIRE(load_directory(*db, directory_json).is_ok());
        committee_repository directory(db->native_handle());
        CHECK(directory.list_committees().value().size() == 2);
    }

    SECTION("invalid documents are rejected without writing") {
        for (std::string_view bad : {"not json", "[1, 2]",
                                     R"({"principals": [{"admin": true}]})"}) {
            auto loaded = load_directory(*db, bad);
            REQUIRE(loaded.is_err());
            CHECK(loaded.error().code == error_codes::invalid_document);
        }
        committee_repository directory(db->native_handle());
        CHECK(directory.list_committees().value().empty());
    }

    SECTION("from a file") {
        auto path = tmp.keys_dir().parent_path() / "directory.json";
        {
            std::ofstream out(path);
            out << directory_json;
        }
        auto loaded = load_directory_file(*db, path);
        REQUIRE(loaded.is_ok());
        CHECK(loaded.value().committees == 2);

        auto missing = load_directory_file(*db, path.parent_path() / "missing.json");
        REQUIRE(missing.is_err());
        CHECK(missing.error().code == error_codes::invalid_document);
    }
}
