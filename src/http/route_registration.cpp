#include "chunkshare/http/route_registration.h"

#include <filesystem>
#include <optional>
#include <sstream>
#include <string>

#include <Poco/Dynamic/Var.h>
#include <Poco/JSON/Array.h>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>
#include <Poco/NumberParser.h>

#include "chunkshare/core/time.h"
#include "chunkshare/http/responses.h"
#include "chunkshare/observability/metrics.h"

namespace chunkshare::http {
namespace {

namespace beast_http = boost::beast::http;

core::Error NotFound(const std::string& what) {
    return core::Error{core::ErrorCode::kNotFound, what + " not found"};
}

bool CanAccess(const RequestContext& ctx, const std::string& owner_id) {
    return ctx.principal && (ctx.principal->is_admin || ctx.principal->id == owner_id);
}

core::Result<Poco::JSON::Object::Ptr> ParseBody(const HttpRequest& req) {
    if (req.body().empty()) {
        return Poco::JSON::Object::Ptr(new Poco::JSON::Object());
    }
    try {
        Poco::JSON::Parser parser;
        auto result = parser.parse(req.body());
        auto obj = result.extract<Poco::JSON::Object::Ptr>();
        if (!obj) {
            return core::Error{core::ErrorCode::kInvalidArgument, "body must be a JSON object"};
        }
        return obj;
    } catch (const std::exception& ex) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           std::string("invalid JSON body: ") + ex.what()};
    }
}

std::optional<std::string> HeaderValue(const HttpRequest& req, const std::string& name) {
    auto it = req.find(name);
    if (it == req.end()) {
        return std::nullopt;
    }
    return std::string(it->value());
}

core::Result<metadata::UploadSession> LoadOwnedSession(const AppServices& services,
                                                       const RequestContext& ctx,
                                                       const std::string& session_id) {
    auto session = services.repository->GetUploadSession(session_id);
    if (!session.ok()) {
        return session.error();
    }
    if (!CanAccess(ctx, session.value().owner_id)) {
        return NotFound("upload session");
    }
    return session;
}

core::Result<metadata::StoredFile> LoadOwnedFile(const AppServices& services,
                                                 const RequestContext& ctx,
                                                 const std::string& file_id) {
    auto file = services.files->GetFile(file_id);
    if (!file.ok()) {
        return file.error();
    }
    if (!CanAccess(ctx, file.value().owner_id)) {
        return NotFound("file");
    }
    return file;
}

Poco::JSON::Array::Ptr IndexArray(const std::vector<int>& indexes) {
    Poco::JSON::Array::Ptr arr = new Poco::JSON::Array();
    for (int index : indexes) {
        arr->add(index);
    }
    return arr;
}

Poco::Dynamic::Var OptionalJson(const std::optional<std::string>& value) {
    if (!value) {
        return Poco::Dynamic::Var();
    }
    return *value;
}

Poco::JSON::Object::Ptr LinkJson(const metadata::DownloadLink& link) {
    Poco::JSON::Object::Ptr item = new Poco::JSON::Object();
    item->set("id", link.id);
    item->set("url", "/d/" + link.file_id + "?token=" + link.token);
    item->set("expires_at", OptionalJson(link.expires_at));
    item->set("download_count", static_cast<Poco::Int64>(link.download_count));
    item->set("never_expires", link.never_expires());
    item->set("one_time", link.one_time);
    item->set("is_enabled", link.is_enabled);
    item->set("require_download_page", link.require_landing_page);
    item->set("has_password", link.password_hash.has_value());
    if (link.short_code) {
        item->set("short_url", "/s/" + *link.short_code);
    } else {
        item->set("short_url", Poco::Dynamic::Var());
    }
    item->set("created_at", link.created_at);
    return item;
}

Poco::JSON::Object::Ptr FileJson(const metadata::StoredFile& file,
                                 const std::vector<metadata::DownloadLink>& links) {
    Poco::JSON::Object::Ptr item = new Poco::JSON::Object();
    item->set("id", file.id);
    item->set("filename", file.filename);
    item->set("size", static_cast<Poco::UInt64>(file.size_bytes));
    item->set("mime_type", file.mime_type);
    item->set("sha256", file.sha256);
    item->set("status", metadata::ToString(file.status));
    item->set("owner_id", file.owner_id);
    item->set("created_at", file.created_at);
    item->set("completed_at", OptionalJson(file.completed_at));
    Poco::JSON::Array::Ptr arr = new Poco::JSON::Array();
    for (const auto& link : links) {
        arr->add(LinkJson(link));
    }
    item->set("links", arr);
    return item;
}

core::Result<upload::CreateSessionRequest> ParseCreateSession(const Poco::JSON::Object& obj) {
    try {
        upload::CreateSessionRequest request;
        request.filename = obj.optValue<std::string>("filename", "");
        request.size_bytes = obj.optValue<Poco::UInt64>("size", 0);
        request.mime_type = obj.optValue<std::string>("mime_type", "");
        request.chunk_size = obj.optValue<Poco::UInt64>("chunk_size", 0);
        request.total_chunks = obj.optValue<int>("total_chunks", 0);
        request.file_sha256 = obj.optValue<std::string>("file_sha256", "");
        return request;
    } catch (const std::exception& ex) {
        return core::Error{core::ErrorCode::kInvalidArgument, ex.what()};
    }
}

core::Result<links::LinkOptions> ParseLinkOptions(const Poco::JSON::Object& obj) {
    links::LinkOptions options;
    try {
        const bool no_expiry = obj.optValue<bool>("no_expiry", false);
        const bool has_at = obj.has("expires_at") && !obj.isNull("expires_at");
        const bool has_minutes =
            obj.has("expires_in_minutes") && !obj.isNull("expires_in_minutes");
        if (static_cast<int>(no_expiry) + static_cast<int>(has_at) +
                static_cast<int>(has_minutes) > 1) {
            return core::Error{core::ErrorCode::kInvalidExpiry,
                               "choose one of expires_at, expires_in_minutes, no_expiry"};
        }
        if (no_expiry) {
            options.expiry.kind = links::LinkExpiry::Kind::kNever;
        } else if (has_minutes) {
            options.expiry.kind = links::LinkExpiry::Kind::kAfterMinutes;
            options.expiry.minutes = obj.getValue<int>("expires_in_minutes");
        } else if (has_at) {
            auto raw = obj.get("expires_at");
            options.expiry.kind = links::LinkExpiry::Kind::kAt;
            if (raw.isString()) {
                auto parsed = core::ParseTimestamp(raw.toString());
                if (!parsed) {
                    return core::Error{core::ErrorCode::kInvalidExpiry,
                                       "expires_at is not a valid timestamp"};
                }
                options.expiry.at_epoch_seconds = *parsed;
            } else {
                options.expiry.at_epoch_seconds = raw.convert<Poco::Int64>();
            }
        }
        options.one_time = obj.optValue<bool>("one_time", false);
        options.require_landing_page = obj.optValue<bool>("require_download_page", false);
        options.with_short_code = obj.optValue<bool>("create_short_link", false);
        if (obj.has("password") && !obj.isNull("password")) {
            options.password = obj.getValue<std::string>("password");
        }
        return options;
    } catch (const std::exception& ex) {
        return core::Error{core::ErrorCode::kInvalidArgument, ex.what()};
    }
}

}  // namespace

void RegisterDefaultRoutes(Router& router, const AppServices& services) {
    router.Add("GET", "/healthz",
               [](const RequestContext& ctx, const HttpRequest& req,
                  const RouteParams&) -> core::Result<HttpResponse> {
                   Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
                   root->set("status", "ok");
                   root->set("request_id", ctx.request_id);
                   return JsonOk(req.version(), root);
               });

    router.Add("GET", "/readyz",
               [storage = services.config.storage](
                   const RequestContext& ctx, const HttpRequest& req,
                   const RouteParams&) -> core::Result<HttpResponse> {
                   std::error_code ec;
                   const bool ready = std::filesystem::is_directory(storage.tmp_dir, ec) &&
                                      std::filesystem::is_directory(storage.files_dir, ec);
                   Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
                   root->set("status", ready ? "ready" : "not_ready");
                   root->set("request_id", ctx.request_id);
                   return JsonOk(req.version(), root,
                                 ready ? beast_http::status::ok
                                       : beast_http::status::service_unavailable);
               });

    router.Add("GET", "/metrics",
               [](const RequestContext&, const HttpRequest& req,
                  const RouteParams&) -> core::Result<HttpResponse> {
                   HttpResponse response{beast_http::status::ok, req.version()};
                   response.set(beast_http::field::content_type, "text/plain; version=0.0.4");
                   response.body() = observability::RenderMetrics();
                   response.prepare_payload();
                   return response;
               });

    router.Add("POST", "/v1/upload/sessions",
               [services](const RequestContext& ctx, const HttpRequest& req,
                          const RouteParams&) -> core::Result<HttpResponse> {
                   auto body = ParseBody(req);
                   if (!body.ok()) {
                       return body.error();
                   }
                   auto request = ParseCreateSession(*body.value());
                   if (!request.ok()) {
                       return request.error();
                   }
                   auto session = services.sessions->CreateSession(*ctx.principal, request.value());
                   if (!session.ok()) {
                       return session.error();
                   }
                   Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
                   root->set("upload_session_id", session.value().id);
                   root->set("accepted_chunk_size",
                             static_cast<Poco::UInt64>(session.value().chunk_size));
                   root->set("total_chunks", session.value().total_chunks);
                   root->set("status", metadata::ToString(session.value().status));
                   root->set("expires_at", session.value().expires_at);
                   return JsonOk(req.version(), root, beast_http::status::created);
               });

    router.Add("GET", "/v1/upload/sessions/{id}",
               [services](const RequestContext& ctx, const HttpRequest& req,
                          const RouteParams& params) -> core::Result<HttpResponse> {
                   auto owned = LoadOwnedSession(services, ctx, params.at("id"));
                   if (!owned.ok()) {
                       return owned.error();
                   }
                   auto status = services.sessions->GetStatus(owned.value().id);
                   if (!status.ok()) {
                       return status.error();
                   }
                   const auto& view = status.value();
                   Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
                   root->set("upload_session_id", view.session.id);
                   root->set("status", metadata::ToString(view.session.status));
                   root->set("total_chunks", view.session.total_chunks);
                   root->set("received", IndexArray(view.received));
                   root->set("missing", IndexArray(view.missing));
                   root->set("expires_at", view.session.expires_at);
                   return JsonOk(req.version(), root);
               });

    router.Add("PUT", "/v1/upload/sessions/{id}/chunks/{index}",
               [services](const RequestContext& ctx, const HttpRequest& req,
                          const RouteParams& params) -> core::Result<HttpResponse> {
                   int index = -1;
                   if (!Poco::NumberParser::tryParse(params.at("index"), index) || index < 0) {
                       return core::Error{core::ErrorCode::kInvalidIndex, "invalid chunk index"};
                   }
                   auto owned = LoadOwnedSession(services, ctx, params.at("id"));
                   if (!owned.ok()) {
                       return owned.error();
                   }

                   upload::ChunkExpectations expectations;
                   if (auto size = HeaderValue(req, "X-Chunk-Size")) {
                       Poco::UInt64 declared = 0;
                       if (!Poco::NumberParser::tryParseUnsigned64(*size, declared)) {
                           return core::Error{core::ErrorCode::kInvalidArgument,
                                              "invalid X-Chunk-Size"};
                       }
                       expectations.size_bytes = declared;
                   }
                   if (auto checksum = HeaderValue(req, "X-Chunk-Checksum")) {
                       if (!upload::SessionManager::IsValidDigest(*checksum)) {
                           return core::Error{core::ErrorCode::kInvalidArgument,
                                              "X-Chunk-Checksum must be 64 hex characters"};
                       }
                       expectations.sha256 = *checksum;
                   }

                   std::istringstream body(req.body());
                   auto receipt = services.sessions->AcceptChunk(owned.value().id, index, body,
                                                                 expectations);
                   if (!receipt.ok()) {
                       return receipt.error();
                   }
                   Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
                   root->set("received", receipt.value().index);
                   root->set("size", static_cast<Poco::UInt64>(receipt.value().size_bytes));
                   root->set("sha256", receipt.value().sha256);
                   root->set("already_received", receipt.value().already_recorded);
                   return JsonOk(req.version(), root);
               });

    router.Add("POST", "/v1/upload/sessions/{id}/finalize",
               [services](const RequestContext& ctx, const HttpRequest& req,
                          const RouteParams& params) -> core::Result<HttpResponse> {
                   auto owned = LoadOwnedSession(services, ctx, params.at("id"));
                   if (!owned.ok()) {
                       return owned.error();
                   }
                   auto body = ParseBody(req);
                   if (!body.ok()) {
                       return body.error();
                   }
                   const auto declared = body.value()->optValue<std::string>("file_sha256", "");
                   if (!upload::SessionManager::IsValidDigest(declared)) {
                       return core::Error{core::ErrorCode::kInvalidArgument,
                                          "file_sha256 must be 64 hex characters"};
                   }
                   auto ticket = services.sessions->RequestFinalize(owned.value().id, declared);
                   if (!ticket.ok()) {
                       return ticket.error();
                   }
                   Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
                   root->set("upload_session_id", ticket.value().session_id);
                   root->set("file_id", ticket.value().file_id);
                   root->set("status", metadata::ToString(ticket.value().status));
                   return JsonOk(req.version(), root, beast_http::status::accepted);
               });

    router.Add("GET", "/v1/files",
               [services](const RequestContext& ctx, const HttpRequest& req,
                          const RouteParams&) -> core::Result<HttpResponse> {
                   const auto target = std::string(req.target());
                   std::optional<std::string> owner;
                   if (HasQueryParam(target, "owner_id")) {
                       owner = GetQueryParam(target, "owner_id");
                   }
                   if (!ctx.principal->is_admin) {
                       if (owner && *owner != ctx.principal->id) {
                           return core::Error{core::ErrorCode::kForbidden,
                                              "cannot list another owner's files"};
                       }
                       owner = ctx.principal->id;
                   }
                   auto listed = services.files->ListFiles(owner);
                   if (!listed.ok()) {
                       return listed.error();
                   }
                   Poco::JSON::Array::Ptr arr = new Poco::JSON::Array();
                   for (const auto& file : listed.value()) {
                       auto links = services.repository->ListDownloadLinks(file.id);
                       if (!links.ok()) {
                           return links.error();
                       }
                       arr->add(FileJson(file, links.value()));
                   }
                   Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
                   root->set("files", arr);
                   return JsonOk(req.version(), root);
               });

    router.Add("GET", "/v1/files/{id}",
               [services](const RequestContext& ctx, const HttpRequest& req,
                          const RouteParams& params) -> core::Result<HttpResponse> {
                   auto file = LoadOwnedFile(services, ctx, params.at("id"));
                   if (!file.ok()) {
                       return file.error();
                   }
                   auto links = services.links->ListLinks(file.value().id);
                   if (!links.ok()) {
                       return links.error();
                   }
                   return JsonOk(req.version(), FileJson(file.value(), links.value()));
               });

    router.Add("DELETE", "/v1/files/{id}",
               [services](const RequestContext& ctx, const HttpRequest& req,
                          const RouteParams& params) -> core::Result<HttpResponse> {
                   auto file = LoadOwnedFile(services, ctx, params.at("id"));
                   if (!file.ok()) {
                       return file.error();
                   }
                   auto deleted = services.files->DeleteFile(file.value().id);
                   if (!deleted.ok()) {
                       return deleted.error();
                   }
                   return NoContent(req.version());
               });

    router.Add("GET", "/v1/files/{id}/links",
               [services](const RequestContext& ctx, const HttpRequest& req,
                          const RouteParams& params) -> core::Result<HttpResponse> {
                   auto file = LoadOwnedFile(services, ctx, params.at("id"));
                   if (!file.ok()) {
                       return file.error();
                   }
                   auto links = services.links->ListLinks(file.value().id);
                   if (!links.ok()) {
                       return links.error();
                   }
                   Poco::JSON::Array::Ptr arr = new Poco::JSON::Array();
                   for (const auto& link : links.value()) {
                       arr->add(LinkJson(link));
                   }
                   Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
                   root->set("links", arr);
                   return JsonOk(req.version(), root);
               });

    router.Add("POST", "/v1/files/{id}/links",
               [services](const RequestContext& ctx, const HttpRequest& req,
                          const RouteParams& params) -> core::Result<HttpResponse> {
                   auto file = LoadOwnedFile(services, ctx, params.at("id"));
                   if (!file.ok()) {
                       return file.error();
                   }
                   auto body = ParseBody(req);
                   if (!body.ok()) {
                       return body.error();
                   }
                   auto options = ParseLinkOptions(*body.value());
                   if (!options.ok()) {
                       return options.error();
                   }
                   auto issued = services.links->IssueLink(file.value().id, options.value());
                   if (!issued.ok()) {
                       return issued.error();
                   }
                   auto root = LinkJson(issued.value().link);
                   root->set("token", issued.value().token);
                   return JsonOk(req.version(), root, beast_http::status::created);
               });

    router.Add("DELETE", "/v1/files/{id}/links/{link_id}",
               [services](const RequestContext& ctx, const HttpRequest& req,
                          const RouteParams& params) -> core::Result<HttpResponse> {
                   auto file = LoadOwnedFile(services, ctx, params.at("id"));
                   if (!file.ok()) {
                       return file.error();
                   }
                   auto revoked = services.links->RevokeLink(file.value().id, params.at("link_id"));
                   if (!revoked.ok()) {
                       return revoked.error();
                   }
                   return NoContent(req.version());
               });
}

}  // namespace chunkshare::http
