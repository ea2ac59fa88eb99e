/**
 * @file key_endpoints.cpp
 * @brief Signing key API endpoints implementation
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

// IMPORTANT: Include Crow FIRST before any relvault headers to avoid forward
// declaration conflicts
#include "crow.h"

#include "endpoint_support.hpp"

#include "relvault/web/endpoints/key_endpoints.hpp"

#include <relvault/keys/openpgp.hpp>
#include <relvault/keys/public_signing_key.hpp>
#include <relvault/storage/read_session.hpp>
#include <relvault/storage/write_session.hpp>

#include <chrono>
#include <ctime>
#include <optional>
#include <sstream>

namespace relvault::web::endpoints {

namespace {

/**
 * @brief Format a time point as an ISO 8601 UTC timestamp
 */
std::string format_utc(std::chrono::system_clock::time_point tp) {
  auto time = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&time, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

/**
 * @brief Convert public_signing_key to JSON string (armored text omitted)
 */
std::string key_to_json(const keys::public_signing_key &key) {
  std::ostringstream oss;
  oss << R"({"fingerprint":")" << key.fingerprint << R"(","key_id":")"
      << key.key_id() << R"(","algorithm":")"
      << json_escape(keys::algorithm_name(key.algorithm, key.length))
      << R"(","length":)" << key.length << R"(,"created":")"
      << format_utc(key.created) << R"(","apache_uid":")"
      << json_escape(key.apache_uid) << R"(","primary_declared_uid":)";
  if (key.primary_declared_uid) {
    oss << '"' << json_escape(*key.primary_declared_uid) << '"';
  } else {
    oss << "null";
  }
  oss << "}";
  return oss.str();
}

/**
 * @brief Success value or failure message of a KEYS file regeneration
 */
std::string keys_file_to_json(const outcome<std::filesystem::path> &file) {
  std::ostringstream oss;
  if (file.failed()) {
    oss << R"({"error":")" << json_escape(file.cause()->message) << R"("})";
  } else {
    oss << R"({"path":")" << json_escape(file.value().string()) << '"';
    if (file.has_warning()) {
      oss << R"(,"warning":")" << json_escape(file.cause()->message) << '"';
    }
    oss << "}";
  }
  return oss.str();
}

/**
 * @brief Per-item report of a bulk import
 */
std::string import_batch_to_json(const keys::key_import_batch &batch) {
  std::ostringstream oss;
  oss << R"({"results":[)";
  bool first = true;
  for (const auto &entry : batch.keys) {
    if (!first) {
      oss << ",";
    }
    first = false;
    oss << R"({"key":")" << json_escape(entry.key) << '"';
    if (entry.item.failed()) {
      const auto cause = *entry.item.cause();
      oss << R"(,"error":{"code":")" << error_code_name(cause.code)
          << R"(","message":")" << json_escape(cause.message) << R"("})";
    } else {
      oss << R"(,"status":")" << keys::to_string(entry.item.value().status)
          << R"(","apache_uid":")"
          << json_escape(entry.item.value().key.apache_uid) << '"';
    }
    oss << "}";
  }
  oss << R"(],"succeeded":)" << batch.keys.result_count()
      << R"(,"failed":)" << batch.keys.exception_count()
      << R"(,"keys_file":)" << keys_file_to_json(batch.keys_file) << "}";
  return oss.str();
}

/**
 * @brief Parse a JSON object body
 */
std::optional<crow::json::rvalue> parse_body(const crow::request &req) {
  auto body = crow::json::load(req.body);
  if (!body || body.t() != crow::json::type::Object) {
    return std::nullopt;
  }
  return body;
}

crow::response invalid_body(const rest_server_context &ctx,
                            std::string_view message) {
  return detail::error_response(ctx, http_status::bad_request,
                                "INVALID_REQUEST", message);
}

} // namespace

void register_key_endpoints_impl(crow::SimpleApp &app,
                                 std::shared_ptr<rest_server_context> ctx) {

  // POST /api/keys/add - Store one of the caller's own keys
  CROW_ROUTE(app, "/api/keys/add")
      .methods(crow::HTTPMethod::POST)([ctx](const crow::request &req) {
        if (auto too_large = detail::check_body_size(*ctx, req)) {
          return std::move(*too_large);
        }
        auto who = detail::authenticate(*ctx, req);
        if (who.is_err()) {
          return detail::error_response(*ctx, who.error());
        }
        auto body = parse_body(req);
        if (!body) {
          return invalid_body(*ctx, "Invalid JSON body");
        }
        auto armored = detail::string_field(*body, "key");
        if (!armored) {
          return invalid_body(*ctx, "key is required");
        }
        auto committee = detail::string_field(*body, "committee");

        auto result = storage::write_session::run(
            ctx->storage, who.value(),
            [&](storage::write_session &session) -> Result<std::string> {
              auto committer = session.as_foundation_committer();
              if (committer.is_err()) {
                return Result<std::string>(committer.error());
              }
              auto imported = committer.value().ensure_user_key(*armored);
              if (imported.failed()) {
                return Result<std::string>(*imported.cause());
              }
              const auto &import = imported.value();

              std::ostringstream oss;
              oss << R"({"key":)" << key_to_json(import.key)
                  << R"(,"status":")" << keys::to_string(import.status)
                  << '"';
              if (imported.has_warning()) {
                oss << R"(,"warning":")"
                    << json_escape(imported.cause()->message) << '"';
              }

              if (committee) {
                auto participant = session.as_committee_participant(*committee);
                if (participant.is_err()) {
                  return Result<std::string>(participant.error());
                }
                auto associated = participant.value().associate_fingerprint(
                    import.key.fingerprint);
                if (associated.failed()) {
                  return Result<std::string>(*associated.cause());
                }
                oss << R"(,"committee":")" << json_escape(*committee)
                    << R"(","association":")"
                    << keys::to_string(associated.value().status)
                    << R"(","keys_file":)"
                    << keys_file_to_json(associated.value().keys_file);
              }
              oss << "}";
              return oss.str();
            });

        if (result.is_err()) {
          return detail::error_response(*ctx, result.error());
        }
        return detail::json_response(*ctx, http_status::created,
                                     result.value());
      });

  // POST /api/keys/import - Bulk import a key-listing file for a committee
  CROW_ROUTE(app, "/api/keys/import")
      .methods(crow::HTTPMethod::POST)([ctx](const crow::request &req) {
        if (auto too_large = detail::check_body_size(*ctx, req)) {
          return std::move(*too_large);
        }
        auto who = detail::authenticate(*ctx, req);
        if (who.is_err()) {
          return detail::error_response(*ctx, who.error());
        }
        auto body = parse_body(req);
        if (!body) {
          return invalid_body(*ctx, "Invalid JSON body");
        }
        auto committee = detail::string_field(*body, "committee");
        auto keys_text = detail::string_field(*body, "keys");
        if (!committee || !keys_text) {
          return invalid_body(*ctx, "committee and keys are required");
        }

        auto result = storage::write_session::run(
            ctx->storage, who.value(),
            [&](storage::write_session &session) -> Result<std::string> {
              auto member = session.as_committee_member(*committee);
              if (member.is_err()) {
                return Result<std::string>(member.error());
              }
              return import_batch_to_json(
                  member.value().ensure_stored(*keys_text));
            });

        if (result.is_err()) {
          return detail::error_response(*ctx, result.error());
        }
        return detail::json_response(*ctx, http_status::ok, result.value());
      });

  // POST /api/keys/regenerate - Rewrite KEYS files
  CROW_ROUTE(app, "/api/keys/regenerate")
      .methods(crow::HTTPMethod::POST)([ctx](const crow::request &req) {
        auto who = detail::authenticate(*ctx, req);
        if (who.is_err()) {
          return detail::error_response(*ctx, who.error());
        }
        std::optional<std::string> committee;
        if (!req.body.empty()) {
          auto body = parse_body(req);
          if (!body) {
            return invalid_body(*ctx, "Invalid JSON body");
          }
          committee = detail::string_field(*body, "committee");
        }

        auto result = storage::write_session::run(
            ctx->storage, who.value(),
            [&](storage::write_session &session) -> Result<std::string> {
              std::ostringstream oss;
              if (committee) {
                auto member = session.as_committee_member(*committee);
                if (member.is_err()) {
                  return Result<std::string>(member.error());
                }
                auto file = member.value().autogenerate_keys_file();
                if (file.failed()) {
                  return Result<std::string>(*file.cause());
                }
                oss << R"({")" << json_escape(*committee)
                    << R"(":)" << keys_file_to_json(file) << "}";
                return oss.str();
              }

              auto files = session.regenerate_all_keys_files();
              oss << "{";
              bool first = true;
              for (const auto &entry : files) {
                if (!first) {
                  oss << ",";
                }
                first = false;
                oss << '"' << json_escape(entry.key)
                    << R"(":)" << keys_file_to_json(entry.item);
              }
              oss << "}";
              return oss.str();
            });

        if (result.is_err()) {
          return detail::error_response(*ctx, result.error());
        }
        return detail::json_response(*ctx, http_status::ok, result.value());
      });

  // GET /api/keys/<fingerprint> - Public key lookup
  CROW_ROUTE(app, "/api/keys/<string>")
      .methods(crow::HTTPMethod::GET)([ctx](const crow::request & /*req*/,
                                            std::string fingerprint) {
        auto session = storage::read_session::open(ctx->storage,
                                                   security::principal(""));
        if (session.is_err()) {
          return detail::error_response(*ctx, session.error());
        }
        auto reader = session.value().as_general_public();
        if (reader.is_err()) {
          return detail::error_response(*ctx, reader.error());
        }
        auto found = reader.value().find_key(fingerprint);
        session.value().close();

        if (found.failed()) {
          return detail::error_response(*ctx, *found.cause());
        }
        if (!found.value()) {
          return detail::error_response(*ctx, http_status::not_found,
                                        "NotFound", "Key not found");
        }

        std::ostringstream oss;
        oss << R"({"key":)" << key_to_json(*found.value())
            << R"(,"ascii_armored_key":")"
            << json_escape(found.value()->ascii_armored_key) << R"("})";
        return detail::json_response(*ctx, http_status::ok, oss.str());
      });
}

} // namespace relvault::web::endpoints
