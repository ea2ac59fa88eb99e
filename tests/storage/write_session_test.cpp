/**
 * @file write_session_test.cpp
 * @brief Tests for storage sessions and the capabilities they grant
 */

#include <relvault/storage/directory_loader.hpp>
#include <relvault/storage/read_session.hpp>
#include <relvault/storage/write_session.hpp>

#include "fixtures/temp_database.hpp"
#include "fixtures/test_keys.hpp"
#include "mocks/test_clock.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace relvault;
using namespace relvault::storage;
using relvault::keys::key_status;
using relvault::security::principal;
using relvault::security::privilege_level;

namespace {

constexpr std::string_view directory_json = R"({
  "principals": [
    {"uid": "alice"},
    {"uid": "bob"},
    {"uid": "carol"},
    {"uid": "guest", "committer": false}
  ],
  "committees": [
    {"name": "tooling", "members": ["alice"], "committers": ["bob"]},
    {"name": "httpd", "members": ["alice"]}
  ]
})";

auto read_file_contents(const std::filesystem::path& path) -> std::string {
    std::ifstream file(path);
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

auto count_files(const std::filesystem::path& dir) -> std::size_t {
    if (!std::filesystem::exists(dir)) {
        return 0;
    }
    std::size_t n = 0;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(dir)) {
        if (entry.is_regular_file()) {
            ++n;
        }
    }
    return n;
}

struct session_fixture {
    test::temp_database tmp;
    std::shared_ptr<test::test_clock> clock = std::make_shared<test::test_clock>();
    std::shared_ptr<security::token_service> tokens;
    std::vector<storage_write_record> audited;
    std::shared_ptr<const storage_context> context;

    session_fixture() {
        auto secret = security::signing_secret::generate();
        REQUIRE(secret.is_ok());
        tokens = std::make_shared<security::token_service>(
            std::move(secret.value()), security::token_config{}, clock);

        auto db = tmp.open();
        REQUIRE(load_directory(*db, directory_json).is_ok());

        context = std::make_shared<storage_context>(
            tmp.config(), tmp.keys_dir(), tokens, clock,
            [this](const storage_write_record& record) {
                audited.push_back(record);
            });
    }

    auto open(const std::string& uid) -> write_session {
        auto session = write_session::open(context, principal(uid));
        REQUIRE(session.is_ok());
        return std::move(session.value());
    }

    /// Whether a key is stored, as seen by a fresh session
    auto is_stored(const std::string& fingerprint) -> bool {
        auto session = open("anyone");
        auto reader = session.as_general_public();
        REQUIRE(reader.is_ok());
        auto found = reader.value().find_key(fingerprint);
        REQUIRE(found.ok());
        return found.value().has_value();
    }

    auto keys_file(const std::string& committee) const -> std::filesystem::path {
        return tmp.keys_dir() / committee / "KEYS";
    }

    auto audited_operations() const -> std::vector<std::string> {
        std::vector<std::string> ops;
        for (const auto& record : audited) {
            ops.push_back(record.operation);
        }
        return ops;
    }
};

}  // namespace

// =============================================================================
// Opening
// =============================================================================

TEST_CASE("Sessions report an unavailable backing store", "[storage][session]") {
    auto missing = write_session::open(nullptr, principal("alice"));
    REQUIRE(missing.is_err());
    CHECK(missing.error().code == error_codes::unavailable);

    session_fixture f;
    auto bad_path = std::make_shared<storage_context>(
        database_config{f.tmp.keys_dir() / "no" / "such" / "dir" / "x.db"},
        f.tmp.keys_dir(), f.tokens, f.clock);
    auto session = write_session::open(bad_path, principal("alice"));
    REQUIRE(session.is_err());
    CHECK(session.error().code == error_codes::unavailable);
}

// =============================================================================
// Read sessions
// =============================================================================

template <typename S>
concept committable = requires(S& s) { s.commit(); };

template <typename S>
concept grants_committer = requires(S& s) { s.as_foundation_committer(); };

static_assert(!committable<read_session>);
static_assert(!grants_committer<read_session>);

TEST_CASE("Read sessions do not wait for an open writer", "[storage][session][read]") {
    session_fixture f;
    auto committed = test::make_apache_key("alice", "committed");
    auto pending = test::make_apache_key("alice", "pending");
    {
        auto session = f.open("alice");
        REQUIRE(session.as_foundation_committer().value().ensure_user_key(committed.armored).ok());
        REQUIRE(session.commit().is_ok());
    }

    auto writer = f.open("alice");
    REQUIRE(writer.as_foundation_committer().value().ensure_user_key(pending.armored).ok());

    database_config impatient = f.tmp.config();
    impatient.busy_timeout = std::chrono::milliseconds(100);
    auto read_context = std::make_shared<storage_context>(
        impatient, f.tmp.keys_dir(), f.tokens, f.clock);

    SECTION("a second writer times out") {
        auto blocked = write_session::open(read_context, principal("bob"));
        REQUIRE(blocked.is_err());
        CHECK(blocked.error().code == error_codes::unavailable);
    }

    SECTION("a reader sees the last committed state") {
        auto reader = read_session::open(read_context, principal(""));
        REQUIRE(reader.is_ok());
        auto pub = reader.value().as_general_public();
        REQUIRE(pub.is_ok());

        auto found = pub.value().find_key(committed.fingerprint);
        REQUIRE(found.ok());
        CHECK(found.value().has_value());

        auto unseen = pub.value().find_key(pending.fingerprint);
        REQUIRE(unseen.ok());
        CHECK_FALSE(unseen.value().has_value());

        reader.value().close();
        CHECK_FALSE(reader.value().is_open());
        auto closed = pub.value().find_key(committed.fingerprint);
        REQUIRE(closed.failed());
        CHECK(closed.cause()->code == error_codes::session_closed);
    }

    REQUIRE(writer.commit().is_ok());
    CHECK(f.is_stored(pending.fingerprint));
}

TEST_CASE("Read sessions never create the store", "[storage][session][read]") {
    session_fixture f;
    const auto missing = f.tmp.keys_dir() / "absent.db";
    auto context = std::make_shared<storage_context>(
        database_config{missing}, f.tmp.keys_dir(), f.tokens, f.clock);

    auto reader = read_session::open(context, principal(""));
    REQUIRE(reader.is_err());
    CHECK(reader.error().code == error_codes::unavailable);
    CHECK_FALSE(std::filesystem::exists(missing));

    auto no_context = read_session::open(nullptr, principal(""));
    REQUIRE(no_context.is_err());
    CHECK(no_context.error().code == error_codes::unavailable);
}

// =============================================================================
// Capability grants
// =============================================================================

TEST_CASE("Capabilities follow the caller's privilege", "[storage][session]") {
    session_fixture f;

    SECTION("anyone may act as general public") {
        auto session = f.open("mallory");
        auto reader = session.as_general_public();
        REQUIRE(reader.is_ok());
        CHECK(reader.value().caller().uid() == "mallory");
        CHECK(session.commit().is_ok());
    }

    SECTION("committee members hold every level") {
        auto session = f.open("alice");
        CHECK(session.as_foundation_committer().is_ok());
        CHECK(session.as_committee_participant("tooling").is_ok());
        auto member = session.as_committee_member("tooling");
        REQUIRE(member.is_ok());
        CHECK(member.value().committee() == "tooling");
        CHECK(session.privilege("tooling").value() == privilege_level::committee_member);
        CHECK(session.privilege().value() == privilege_level::foundation_committer);
    }

    SECTION("committee committers are participants only") {
        auto session = f.open("bob");
        CHECK(session.as_committee_participant("tooling").is_ok());

        auto member = session.as_committee_member("tooling");
        REQUIRE(member.is_err());
        CHECK(member.error().code == error_codes::insufficient_privilege);
        CHECK(member.error().message == "bob lacks CommitteeMember in tooling");
    }

    SECTION("non-committers cannot act as committers") {
        auto session = f.open("guest");
        auto committer = session.as_foundation_committer();
        REQUIRE(committer.is_err());
        CHECK(committer.error().code == error_codes::insufficient_privilege);
    }

    SECTION("unknown committees grant nothing above the base level") {
        auto session = f.open("alice");
        auto member = session.as_committee_member("no-such-committee");
        REQUIRE(member.is_err());
        CHECK(member.error().code == error_codes::insufficient_privilege);
    }
}

TEST_CASE("A denied grant aborts the session", "[storage][session]") {
    session_fixture f;
    auto key = test::make_apache_key("alice", "abort-key");

    auto session = f.open("alice");
    auto committer = session.as_foundation_committer();
    REQUIRE(committer.is_ok());
    REQUIRE(committer.value().ensure_user_key(key.armored).ok());

    auto denied = session.as_committee_member("no-such-committee");
    REQUIRE(denied.is_err());
    REQUIRE(session.fault().has_value());
    CHECK(session.fault()->code == error_codes::insufficient_privilege);

    SECTION("later operations fail") {
        auto again = committer.value().ensure_user_key(key.armored);
        REQUIRE(again.failed());
        CHECK(again.cause()->code == error_codes::session_aborted);
    }

    SECTION("commit rolls back and reports the cause") {
        auto committed = session.commit();
        REQUIRE(committed.is_err());
        CHECK(committed.error().code == error_codes::insufficient_privilege);
        CHECK_FALSE(session.is_open());
        CHECK_FALSE(f.is_stored(key.fingerprint));
        CHECK(f.audited.empty());
    }
}

TEST_CASE("try_as_committee_member does not abort", "[storage][session]") {
    session_fixture f;
    auto session = f.open("bob");
    CHECK_FALSE(session.try_as_committee_member("tooling").has_value());
    CHECK_FALSE(session.fault().has_value());
    CHECK(session.commit().is_ok());
}

TEST_CASE("Capabilities of a finished session are unusable", "[storage][session]") {
    session_fixture f;
    auto session = f.open("alice");
    auto member = session.as_committee_member("tooling");
    REQUIRE(member.is_ok());
    REQUIRE(session.commit().is_ok());

    auto keys = member.value().committee_keys("tooling");
    REQUIRE(keys.failed());
    CHECK(keys.cause()->code == error_codes::session_closed);

    auto regenerated = member.value().autogenerate_keys_file();
    REQUIRE(regenerated.failed());
    CHECK(regenerated.cause()->code == error_codes::session_closed);

    auto committed = session.commit();
    REQUIRE(committed.is_err());
    CHECK(committed.error().code == error_codes::session_closed);
}

// =============================================================================
// Committer operations
// =============================================================================

TEST_CASE("ensure_user_key stores the caller's key", "[storage][session][keys]") {
    session_fixture f;
    auto key = test::make_apache_key("alice", "user-key");

    SECTION("inserted, then parsed on a second call") {
        {
            auto session = f.open("alice");
            auto committer = session.as_foundation_committer();
            REQUIRE(committer.is_ok());
            auto imported = committer.value().ensure_user_key(key.armored);
            REQUIRE(imported.ok());
            CHECK_FALSE(imported.has_warning());
            CHECK(imported.value().status == key_status::inserted);
            CHECK(imported.value().key.apache_uid == "alice");
            CHECK(imported.value().key.stored_at == f.clock->now());
            REQUIRE(session.commit().is_ok());
        }
        CHECK(f.is_stored(key.fingerprint));
        REQUIRE(f.audited.size() == 1);
        CHECK(f.audited[0].operation == "keys.ensure_user_key");
        CHECK(f.audited[0].asf_uid == "alice");
        CHECK(f.audited[0].target == key.fingerprint);
        CHECK(f.audited[0].privilege == privilege_level::foundation_committer);

        auto session = f.open("alice");
        auto again = session.as_foundation_committer().value().ensure_user_key(key.armored);
        REQUIRE(again.ok());
        CHECK(again.value().status == key_status::parsed);
    }

    SECTION("a key without the caller's address is stored with a warning") {
        auto foreign = test::make_test_key("foreign", {"Someone <someone@example.com>"});
        auto session = f.open("alice");
        auto imported = session.as_foundation_committer().value().ensure_user_key(foreign.armored);
        REQUIRE(imported.ok());
        REQUIRE(imported.has_warning());
        CHECK(imported.cause()->code == error_codes::key_uid_mismatch);
        REQUIRE(session.commit().is_ok());
        CHECK(f.is_stored(foreign.fingerprint));
    }

    SECTION("a key registered to someone else is rejected") {
        {
            auto session = f.open("alice");
            REQUIRE(session.as_foundation_committer().value().ensure_user_key(key.armored).ok());
            REQUIRE(session.commit().is_ok());
        }
        auto session = f.open("bob");
        auto imported = session.as_foundation_committer().value().ensure_user_key(key.armored);
        REQUIRE(imported.failed());
        CHECK(imported.cause()->code == error_codes::key_owner_mismatch);
    }

    SECTION("malformed input") {
        auto session = f.open("alice");
        auto imported = session.as_foundation_committer().value().ensure_user_key(
            test::malformed_block);
        REQUIRE(imported.failed());
        CHECK(imported.cause()->code == error_codes::key_parse_error);
    }
}

TEST_CASE("find_key ignores spaces and case", "[storage][session][keys]") {
    session_fixture f;
    auto key = test::make_apache_key("alice", "lookup-key");
    {
        auto session = f.open("alice");
        REQUIRE(session.as_foundation_committer().value().ensure_user_key(key.armored).ok());
        REQUIRE(session.commit().is_ok());
    }

    std::string spaced;
    for (std::size_t i = 0; i < key.fingerprint.size(); ++i) {
        if (i > 0 && i % 4 == 0) {
            spaced.push_back(' ');
        }
        spaced.push_back(static_cast<char>(
            std::toupper(static_cast<unsigned char>(key.fingerprint[i]))));
    }

    auto session = f.open("anyone");
    auto found = session.as_general_public().value().find_key(spaced);
    REQUIRE(found.ok());
    REQUIRE(found.value().has_value());
    CHECK(found.value()->fingerprint == key.fingerprint);

    auto invalid = session.as_general_public().value().find_key("xyz");
    REQUIRE(invalid.failed());
    CHECK(invalid.cause()->code == error_codes::not_found);
}

TEST_CASE("delete_key", "[storage][session][keys]") {
    session_fixture f;
    auto key = test::make_apache_key("alice", "delete-key");
    {
        auto session = f.open("alice");
        auto participant = session.as_committee_participant("tooling");
        REQUIRE(participant.is_ok());
        REQUIRE(participant.value().ensure_user_key(key.armored).ok());
        REQUIRE(participant.value().associate_fingerprint(key.fingerprint).ok());
        REQUIRE(session.commit().is_ok());
    }
    REQUIRE(read_file_contents(f.keys_file("tooling")).find(key.armored) != std::string::npos);

    SECTION("only the owner may delete") {
        auto session = f.open("bob");
        auto deleted = session.as_foundation_committer().value().delete_key(key.fingerprint);
        REQUIRE(deleted.failed());
        CHECK(deleted.cause()->code == error_codes::forbidden);
    }

    SECTION("deleting regenerates every linked committee") {
        {
            auto session = f.open("alice");
            auto deleted = session.as_foundation_committer().value().delete_key(key.fingerprint);
            REQUIRE(deleted.ok());
            REQUIRE(deleted.value().regenerated.size() == 1);
            CHECK(deleted.value().regenerated.find("tooling")->ok());
            REQUIRE(session.commit().is_ok());
        }
        CHECK_FALSE(f.is_stored(key.fingerprint));
        CHECK(read_file_contents(f.keys_file("tooling")).find(key.armored) == std::string::npos);
    }

    SECTION("unknown key") {
        auto session = f.open("alice");
        auto deleted = session.as_foundation_committer().value().delete_key(
            std::string(40, '0'));
        REQUIRE(deleted.failed());
        CHECK(deleted.cause()->code == error_codes::not_found);
    }
}

// =============================================================================
// Participant operations
// =============================================================================

TEST_CASE("associate_fingerprint links the caller's key", "[storage][session][keys]") {
    session_fixture f;
    auto key = test::make_apache_key("bob", "bob-key");

    auto session = f.open("bob");
    auto participant = session.as_committee_participant("tooling");
    REQUIRE(participant.is_ok());

    SECTION("key must be stored first") {
        auto linked = participant.value().associate_fingerprint(key.fingerprint);
        REQUIRE(linked.failed());
        CHECK(linked.cause()->code == error_codes::not_found);
    }

    SECTION("linking is reported once") {
        REQUIRE(participant.value().ensure_user_key(key.armored).ok());

        auto linked = participant.value().associate_fingerprint(key.fingerprint);
        REQUIRE(linked.ok());
        CHECK(linked.value().status == key_status::linked);
        REQUIRE(linked.value().keys_file.ok());
        CHECK(linked.value().keys_file.value() == f.keys_file("tooling"));

        auto again = participant.value().associate_fingerprint(key.fingerprint);
        REQUIRE(again.ok());
        CHECK(again.value().status == key_status::parsed);

        REQUIRE(session.commit().is_ok());
        CHECK(f.audited_operations() ==
              std::vector<std::string>{"keys.ensure_user_key",
                                       "keys.associate_fingerprint",
                                       "keys.write_keys_file",
                                       "keys.write_keys_file"});
        CHECK(f.audited[1].target == "tooling:" + key.fingerprint);
        CHECK(f.audited[1].privilege == privilege_level::committee_participant);
    }
}

// =============================================================================
// Member operations
// =============================================================================

TEST_CASE("ensure_stored imports a key listing", "[storage][session][keys]") {
    session_fixture f;
    auto existing = test::make_apache_key("alice", "existing");
    auto fresh = test::make_apache_key("bob", "fresh");
    {
        auto session = f.open("alice");
        auto participant = session.as_committee_participant("tooling");
        REQUIRE(participant.is_ok());
        REQUIRE(participant.value().ensure_user_key(existing.armored).ok());
        REQUIRE(participant.value().associate_fingerprint(existing.fingerprint).ok());
        REQUIRE(session.commit().is_ok());
    }
    f.audited.clear();

    const auto listing = "pub rsa2048\n" + fresh.armored + "\n" + existing.armored +
                         "\n" + std::string(test::malformed_block);

    auto session = f.open("alice");
    auto member = session.as_committee_member("tooling");
    REQUIRE(member.is_ok());
    auto batch = member.value().ensure_stored(listing);

    REQUIRE(batch.keys.size() == 3);
    CHECK(batch.keys.result_count() == 2);
    CHECK(batch.keys.exception_count() == 1);

    const auto* inserted = batch.keys.find(fresh.fingerprint);
    REQUIRE(inserted != nullptr);
    REQUIRE(inserted->ok());
    CHECK(inserted->value().status == key_status::inserted_and_linked);
    CHECK(inserted->value().key.apache_uid == "bob");

    const auto* unchanged = batch.keys.find(existing.fingerprint);
    REQUIRE(unchanged != nullptr);
    REQUIRE(unchanged->ok());
    CHECK(unchanged->value().status == key_status::parsed);
    CHECK(unchanged->value().key.apache_uid == "alice");

    const auto* malformed = batch.keys.find("block-3");
    REQUIRE(malformed != nullptr);
    REQUIRE(malformed->failed());
    CHECK(malformed->cause()->code == error_codes::key_parse_error);

    REQUIRE(batch.keys_file.ok());
    auto before_commit = read_file_contents(f.keys_file("tooling"));
    CHECK(before_commit.find("# Keys: 1\n") != std::string::npos);
    CHECK(before_commit.find(fresh.armored) == std::string::npos);

    REQUIRE(session.commit().is_ok());

    auto text = read_file_contents(f.keys_file("tooling"));
    CHECK(text.find("# Keys: 2\n") != std::string::npos);
    CHECK(text.find(fresh.armored) != std::string::npos);
    CHECK(text.find(existing.armored) != std::string::npos);

    CHECK(f.audited_operations() ==
          std::vector<std::string>{"keys.ensure_stored",
                                   "keys.associate_fingerprint",
                                   "keys.write_keys_file"});
    CHECK(f.audited[1].target == "tooling:" + fresh.fingerprint);
    for (const auto& record : f.audited) {
        CHECK(record.privilege == privilege_level::committee_member);
    }
}

TEST_CASE("Importing the same listing twice changes nothing", "[storage][session][keys]") {
    session_fixture f;
    auto key = test::make_apache_key("carol", "idempotent");

    for (int round = 0; round < 2; ++round) {
        auto session = f.open("alice");
        auto batch = session.as_committee_member("tooling").value().ensure_stored(key.armored);
        REQUIRE(batch.keys.size() == 1);
        REQUIRE(batch.keys.entries()[0].item.ok());
        CHECK(batch.keys.entries()[0].item.value().status ==
              (round == 0 ? key_status::inserted_and_linked : key_status::parsed));
        REQUIRE(session.commit().is_ok());
    }
}

TEST_CASE("KEYS files follow the session outcome", "[storage][session][keys]") {
    session_fixture f;
    auto key = test::make_apache_key("alice", "keys-file");

    SECTION("rollback discards staged files") {
        auto session = f.open("alice");
        auto batch = session.as_committee_member("tooling").value().ensure_stored(key.armored);
        REQUIRE(batch.keys_file.ok());
        CHECK(count_files(f.tmp.keys_dir()) == 1);

        session.rollback();
        CHECK_FALSE(session.is_open());
        CHECK(count_files(f.tmp.keys_dir()) == 0);
        CHECK_FALSE(f.is_stored(key.fingerprint));
        CHECK(f.audited.empty());
    }

    SECTION("dropping an open session rolls back") {
        {
            auto session = f.open("alice");
            auto produced = session.as_committee_member("tooling").value().autogenerate_keys_file();
            REQUIRE(produced.ok());
        }
        CHECK(count_files(f.tmp.keys_dir()) == 0);
    }

    SECTION("regenerating twice stages a single file") {
        auto session = f.open("alice");
        auto member = session.as_committee_member("tooling");
        REQUIRE(member.is_ok());
        REQUIRE(member.value().autogenerate_keys_file().ok());
        REQUIRE(member.value().autogenerate_keys_file().ok());
        CHECK(count_files(f.tmp.keys_dir()) == 1);
        REQUIRE(session.commit().is_ok());
        CHECK(count_files(f.tmp.keys_dir()) == 1);
        CHECK(std::filesystem::exists(f.keys_file("tooling")));
    }
}

TEST_CASE("remove_association and delete_committee_keys", "[storage][session][keys]") {
    session_fixture f;
    auto shared = test::make_apache_key("alice", "shared");
    auto only_tooling = test::make_apache_key("bob", "only-tooling");
    {
        auto session = f.open("alice");
        auto tooling = session.as_committee_member("tooling");
        REQUIRE(tooling.is_ok());
        auto batch = tooling.value().ensure_stored(shared.armored + only_tooling.armored);
        REQUIRE(batch.keys.result_count() == 2);

        auto httpd = session.as_committee_member("httpd");
        REQUIRE(httpd.is_ok());
        REQUIRE(httpd.value().ensure_stored(shared.armored).keys.result_count() == 1);
        REQUIRE(session.commit().is_ok());
    }

    SECTION("remove_association") {
        auto session = f.open("alice");
        auto member = session.as_committee_member("tooling");
        REQUIRE(member.is_ok());

        auto removed = member.value().remove_association(only_tooling.fingerprint);
        REQUIRE(removed.ok());
        CHECK(removed.value() == f.keys_file("tooling"));

        auto again = member.value().remove_association(only_tooling.fingerprint);
        REQUIRE(again.failed());
        CHECK(again.cause()->code == error_codes::not_found);

        REQUIRE(session.commit().is_ok());
        CHECK(f.is_stored(only_tooling.fingerprint));
        CHECK(read_file_contents(f.keys_file("tooling")).find(only_tooling.armored) ==
              std::string::npos);
    }

    SECTION("delete_committee_keys removes orphaned keys only") {
        auto session = f.open("alice");
        auto member = session.as_committee_member("tooling");
        REQUIRE(member.is_ok());

        auto removal = member.value().delete_committee_keys();
        REQUIRE(removal.ok());
        CHECK(removal.value().links_removed == 2);
        CHECK(removal.value().keys_deleted == 1);
        REQUIRE(session.commit().is_ok());

        CHECK(f.is_stored(shared.fingerprint));
        CHECK_FALSE(f.is_stored(only_tooling.fingerprint));
        CHECK(read_file_contents(f.keys_file("tooling")).find("# Keys: 0\n") !=
              std::string::npos);
    }
}

TEST_CASE("regenerate_all_keys_files covers the caller's committees", "[storage][session]") {
    session_fixture f;

    SECTION("member of every committee") {
        auto session = f.open("alice");
        auto regenerated = session.regenerate_all_keys_files();
        REQUIRE(regenerated.size() == 2);
        CHECK(regenerated.result_count() == 2);
        CHECK(regenerated.find("httpd") != nullptr);
        CHECK(regenerated.find("tooling") != nullptr);
        REQUIRE(session.commit().is_ok());
        CHECK(std::filesystem::exists(f.keys_file("httpd")));
        CHECK(std::filesystem::exists(f.keys_file("tooling")));
    }

    SECTION("member of none") {
        auto session = f.open("bob");
        CHECK(session.regenerate_all_keys_files().empty());
        CHECK(session.commit().is_ok());
    }
}

// =============================================================================
// Scoped execution
// =============================================================================

TEST_CASE("write_session::run commits or rolls back", "[storage][session]") {
    session_fixture f;
    auto key = test::make_apache_key("alice", "run-key");

    SECTION("commits a successful body") {
        auto result = write_session::run(
            f.context, principal("alice"), [&](write_session& s) -> Result<std::string> {
                auto committer = s.as_foundation_committer();
                if (committer.is_err()) {
                    return Result<std::string>(committer.error());
                }
                auto imported = committer.value().ensure_user_key(key.armored);
                if (imported.failed()) {
                    return Result<std::string>(*imported.cause());
                }
                return Result<std::string>(imported.value().key.fingerprint);
            });
        REQUIRE(result.is_ok());
        CHECK(result.value() == key.fingerprint);
        CHECK(f.is_stored(key.fingerprint));
        CHECK(f.audited.size() == 1);
    }

    SECTION("rolls back when the body returns an error") {
        auto result = write_session::run(
            f.context, principal("alice"), [&](write_session& s) -> Result<int> {
                auto imported =
                    s.as_foundation_committer().value().ensure_user_key(key.armored);
                REQUIRE(imported.ok());
                return relvault_error<int>(error_codes::forbidden, "stop");
            });
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::forbidden);
        CHECK_FALSE(f.is_stored(key.fingerprint));
        CHECK(f.audited.empty());
    }

    SECTION("rolls back and rethrows when the body raises") {
        auto body = [&](write_session& s) -> Result<int> {
            auto imported = s.as_foundation_committer().value().ensure_user_key(key.armored);
            REQUIRE(imported.ok());
            throw std::runtime_error("boom");
        };
        CHECK_THROWS_AS(write_session::run(f.context, principal("alice"), body),
                        std::runtime_error);
        CHECK_FALSE(f.is_stored(key.fingerprint));
    }

    SECTION("reports the fault of an aborted body") {
        auto result = write_session::run(
            f.context, principal("bob"), [&](write_session& s) -> Result<int> {
                (void)s.as_committee_member("tooling");
                return Result<int>(1);
            });
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::insufficient_privilege);
    }

    SECTION("explicit abort") {
        auto session = f.open("alice");
        REQUIRE(session.as_foundation_committer().value().ensure_user_key(key.armored).ok());
        session.abort(error_info{error_codes::database_error, "caller gave up", "test"});
        auto committed = session.commit();
        REQUIRE(committed.is_err());
        CHECK(committed.error().message == "caller gave up");
        CHECK_FALSE(f.is_stored(key.fingerprint));
    }
}

TEST_CASE("A fault on the third write rolls back the first two", "[storage][session]") {
    session_fixture f;
    auto first = test::make_apache_key("alice", "first-write");
    auto second = test::make_apache_key("alice", "second-write");
    auto foreign = test::make_apache_key("bob", "foreign");
    {
        auto session = f.open("bob");
        REQUIRE(session.as_foundation_committer().value().ensure_user_key(foreign.armored).ok());
        REQUIRE(session.commit().is_ok());
    }
    f.audited.clear();

    auto result = write_session::run(
        f.context, principal("alice"), [&](write_session& s) -> Result<int> {
            auto committer = s.as_foundation_committer();
            if (committer.is_err()) {
                return Result<int>(committer.error());
            }
            auto one = committer.value().ensure_user_key(first.armored);
            REQUIRE(one.ok());
            CHECK(one.value().status == key_status::inserted);
            auto two = committer.value().ensure_user_key(second.armored);
            REQUIRE(two.ok());
            CHECK(two.value().status == key_status::inserted);

            auto three = committer.value().delete_key(foreign.fingerprint);
            if (three.failed()) {
                return Result<int>(*three.cause());
            }
            return Result<int>(3);
        });

    REQUIRE(result.is_err());
    CHECK(result.error().code == error_codes::forbidden);
    CHECK_FALSE(f.is_stored(first.fingerprint));
    CHECK_FALSE(f.is_stored(second.fingerprint));
    CHECK(f.is_stored(foreign.fingerprint));
    CHECK(f.audited.empty());
}

// =============================================================================
// Tokens
// =============================================================================

TEST_CASE("Personal access tokens through the committer capability", "[storage][session][tokens]") {
    session_fixture f;

    security::issued_pat pat;
    {
        auto session = f.open("alice");
        auto committer = session.as_foundation_committer();
        REQUIRE(committer.is_ok());
        auto issued = committer.value().issue_pat("release-ci");
        REQUIRE(issued.is_ok());
        pat = issued.value();

        auto listed = committer.value().list_pats();
        REQUIRE(listed.is_ok());
        REQUIRE(listed.value().size() == 1);
        CHECK(listed.value()[0].label == "release-ci");
        REQUIRE(session.commit().is_ok());
    }
    REQUIRE(f.audited.size() == 1);
    CHECK(f.audited[0].operation == "tokens.issue_pat");
    CHECK(f.audited[0].target == std::to_string(pat.token.id));

    SECTION("exchange for a session token") {
        auto session = f.open("alice");
        auto jwt = session.exchange_pat(pat.plaintext);
        REQUIRE(jwt.is_ok());
        REQUIRE(session.commit().is_ok());

        auto verified = f.tokens->verify_jwt(jwt.value().encoded);
        REQUIRE(verified.is_ok());
        CHECK(verified.value().uid() == "alice");
    }

    SECTION("a rejected exchange aborts the session") {
        auto session = f.open("bob");
        auto jwt = session.exchange_pat(pat.plaintext);
        REQUIRE(jwt.is_err());
        CHECK(jwt.error().code == error_codes::invalid_credential);
        REQUIRE(session.fault().has_value());
        CHECK(session.commit().is_err());
    }

    SECTION("revocation is limited to the owner") {
        {
            auto session = f.open("bob");
            auto revoked = session.as_foundation_committer().value().revoke_pat(pat.token.id);
            REQUIRE(revoked.is_err());
            CHECK(revoked.error().code == error_codes::forbidden);
        }
        {
            auto session = f.open("alice");
            auto revoked = session.as_foundation_committer().value().revoke_pat(pat.token.id);
            REQUIRE(revoked.is_ok());
            REQUIRE(session.commit().is_ok());
        }
        auto session = f.open("alice");
        auto jwt = session.exchange_pat(pat.plaintext);
        REQUIRE(jwt.is_err());
        CHECK(jwt.error().code == error_codes::token_revoked);
    }
}

TEST_CASE("Audit hook failures do not undo a commit", "[storage][session]") {
    session_fixture f;
    auto throwing = std::make_shared<storage_context>(
        f.tmp.config(), f.tmp.keys_dir(), f.tokens, f.clock,
        [](const storage_write_record&) { throw std::runtime_error("audit sink down"); });
    auto key = test::make_apache_key("alice", "audit-key");

    auto session = write_session::open(throwing, principal("alice"));
    REQUIRE(session.is_ok());
    REQUIRE(session.value().as_foundation_committer().value().ensure_user_key(key.armored).ok());
    CHECK(session.value().commit().is_ok());
    CHECK(f.is_stored(key.fingerprint));
}
