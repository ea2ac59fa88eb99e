/**
 * @file directory_loader.cpp
 * @brief JSON seeding of the principal and committee directory
 */

#include "relvault/storage/directory_loader.hpp"

#include <relvault/integration/logger_adapter.hpp>
#include <relvault/storage/committee_repository.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace relvault::storage {

using integration::logger_adapter;
using json = nlohmann::json;

namespace {

constexpr const char* module_name = "directory_loader";

struct role_entry {
    std::string committee;
    std::string uid;
    committee_role role;
};

struct directory_document {
    std::vector<principal_record> principals;
    std::vector<committee_record> committees;
    std::vector<role_entry> roles;
};

auto invalid(const std::string& message) -> Result<directory_load_summary> {
    return relvault_error<directory_load_summary>(error_codes::invalid_document,
                                                  message, module_name);
}

void collect_roles(const json& committee, const char* field,
                   committee_role role, const std::string& name,
                   std::vector<role_entry>& out) {
    if (!committee.contains(field)) {
        return;
    }
    for (const auto& uid : committee.at(field)) {
        out.push_back(role_entry{name, uid.get<std::string>(), role});
    }
}

/// @throws json::exception on type errors
auto read_document(const json& doc) -> directory_document {
    directory_document parsed;

    if (doc.contains("principals")) {
        for (const auto& p : doc.at("principals")) {
            principal_record record;
            record.asf_uid = p.at("uid").get<std::string>();
            record.is_committer = p.value("committer", true);
            record.is_admin = p.value("admin", false);
            record.active = p.value("active", true);
            parsed.principals.push_back(std::move(record));
        }
    }

    if (doc.contains("committees")) {
        for (const auto& c : doc.at("committees")) {
            committee_record record;
            record.name = c.at("name").get<std::string>();
            record.display_name = c.value("display_name", record.name);
            collect_roles(c, "members", committee_role::member, record.name,
                          parsed.roles);
            collect_roles(c, "committers", committee_role::committer,
                          record.name, parsed.roles);
            parsed.committees.push_back(std::move(record));
        }
    }
    return parsed;
}

auto write_document(committee_repository& directory,
                    const directory_document& doc)
    -> Result<directory_load_summary> {
    directory_load_summary summary;
    for (const auto& principal : doc.principals) {
        auto written = directory.upsert_principal(principal);
        if (written.is_err()) {
            return Result<directory_load_summary>(written.error());
        }
        ++summary.principals;
    }
    for (const auto& committee : doc.committees) {
        auto written = directory.upsert_committee(committee);
        if (written.is_err()) {
            return Result<directory_load_summary>(written.error());
        }
        ++summary.committees;
    }
    for (const auto& role : doc.roles) {
        auto known = directory.find_principal(role.uid);
        if (known.is_err()) {
            return Result<directory_load_summary>(known.error());
        }
        if (!known.value()) {
            principal_record implied;
            implied.asf_uid = role.uid;
            auto written = directory.upsert_principal(implied);
            if (written.is_err()) {
                return Result<directory_load_summary>(written.error());
            }
            ++summary.principals;
        }
        auto added = directory.add_role(role.committee, role.uid, role.role);
        if (added.is_err()) {
            return Result<directory_load_summary>(added.error());
        }
        ++summary.roles;
    }
    return summary;
}

}  // namespace

auto load_directory(release_database& db, std::string_view json_text)
    -> Result<directory_load_summary> {
    auto doc = json::parse(json_text.begin(), json_text.end(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return invalid("Directory document is not a JSON object");
    }

    directory_document parsed;
    try {
        parsed = read_document(doc);
    } catch (const json::exception& e) {
        return invalid(std::string("Invalid directory document: ") + e.what());
    }

    auto begun = db.begin();
    if (begun.is_err()) {
        return Result<directory_load_summary>(begun.error());
    }

    committee_repository directory(db.native_handle());
    auto written = write_document(directory, parsed);
    if (written.is_err()) {
        auto rolled_back = db.rollback();
        if (rolled_back.is_err()) {
            logger_adapter::error("Directory rollback failed: {}",
                                  rolled_back.error().message);
        }
        return written;
    }

    auto committed = db.commit();
    if (committed.is_err()) {
        return Result<directory_load_summary>(committed.error());
    }

    logger_adapter::info(
        "Loaded directory: {} principals, {} committees, {} roles",
        written.value().principals, written.value().committees,
        written.value().roles);
    return written;
}

auto load_directory_file(release_database& db,
                         const std::filesystem::path& path)
    -> Result<directory_load_summary> {
    std::ifstream in(path);
    if (!in) {
        return invalid("Cannot read directory file: " + path.string());
    }
    std::ostringstream content;
    content << in.rdbuf();
    return load_directory(db, content.str());
}

}  // namespace relvault::storage
