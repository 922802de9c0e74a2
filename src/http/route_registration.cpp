#include "tidelink/http/route_registration.h"

#include <algorithm>
#include <optional>
#include <sstream>
#include <string>

#include <Poco/Exception.h>
#include <Poco/JSON/Array.h>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>

#include "tidelink/core/ids.h"
#include "tidelink/core/time.h"
#include "tidelink/http/responses.h"
#include "tidelink/metadata/metadata_store.h"
#include "tidelink/observability/metrics.h"

namespace tidelink::http {
namespace {

namespace bhttp = boost::beast::http;

constexpr int kSecondsPerDay = 86400;

std::string Stringify(const Poco::JSON::Object::Ptr& object) {
    std::stringstream ss;
    object->stringify(ss);
    return ss.str();
}

bool IsGone(const metadata::Transfer& transfer) {
    return transfer.status == metadata::kTransferDeleted ||
           core::IsPastIso8601(transfer.expires_at);
}

/// Loads a transfer and maps missing/expired to the response the caller should send.
std::optional<HttpResponse> LoadLiveTransfer(metadata::MetadataStore& store,
                                             const std::string& id, const RequestContext& ctx,
                                             int version, metadata::Transfer* out) {
    auto transfer = store.GetTransfer(id);
    if (!transfer.ok()) {
        return ErrorResponse(version, transfer.error(), ctx.request_id);
    }
    if (IsGone(transfer.value())) {
        return JsonError(version, "GONE", "transfer has expired", ctx.request_id,
                         bhttp::status::gone);
    }
    *out = transfer.value();
    return std::nullopt;
}

}  // namespace

void RegisterDefaultRoutes(Router& router, std::shared_ptr<metadata::MetadataStore> metadata,
                           const core::Config& config) {
    router.Add("GET", "/healthz",
               [](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   return JsonOk(req.version(),
                                 "{\"status\":\"ok\",\"request_id\":\"" + ctx.request_id + "\"}");
               });

    router.Add("GET", "/readyz",
               [](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   return JsonOk(req.version(),
                                 "{\"status\":\"ready\",\"request_id\":\"" + ctx.request_id + "\"}");
               });

    router.Add("GET", "/metrics",
               [](const RequestContext&, const HttpRequest& req, const RouteParams&) {
                   HttpResponse response{bhttp::status::ok, req.version()};
                   response.set(bhttp::field::content_type, "text/plain");
                   response.body() = observability::RenderMetrics();
                   response.prepare_payload();
                   return response;
               });

    router.Add("POST", "/v1/transfers",
               [metadata, server = config.server, transfers = config.transfers](
                   const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   metadata::Transfer transfer;
                   int days = transfers.default_expiry_days;
                   if (!req.body().empty()) {
                       try {
                           Poco::JSON::Parser parser;
                           auto obj = parser.parse(req.body()).extract<Poco::JSON::Object::Ptr>();
                           transfer.title = obj->optValue<std::string>("title", "");
                           transfer.message = obj->optValue<std::string>("message", "");
                           days = obj->optValue<int>("expires_in_days", days);
                       } catch (const Poco::Exception& ex) {
                           return JsonError(req.version(), "INVALID_JSON", ex.displayText(),
                                            ctx.request_id, bhttp::status::bad_request);
                       }
                   }
                   days = std::clamp(days, 1, transfers.max_expiry_days);

                   transfer.id = core::GenerateTransferId();
                   transfer.expires_at = core::NowIso8601WithOffsetSeconds(days * kSecondsPerDay);
                   auto created = metadata->CreateTransfer(transfer);
                   if (!created.ok()) {
                       return ErrorResponse(req.version(), created.error(), ctx.request_id);
                   }

                   const auto& t = created.value();
                   Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
                   root->set("id", t.id);
                   root->set("title", t.title);
                   root->set("message", t.message);
                   root->set("status", t.status);
                   root->set("expires_at", t.expires_at);
                   root->set("download_url", PublicBaseUrl(server, req) + "/v1/transfers/" + t.id);
                   return JsonOk(req.version(), Stringify(root), bhttp::status::created);
               });

    router.Add("GET", "/v1/transfers/{id}",
               [metadata, server = config.server](const RequestContext& ctx,
                                                  const HttpRequest& req,
                                                  const RouteParams& params) {
                   metadata::Transfer transfer;
                   if (auto failed = LoadLiveTransfer(*metadata, params.at("id"), ctx,
                                                      req.version(), &transfer)) {
                       return *failed;
                   }
                   auto files = metadata->ListFiles(transfer.id, true);
                   if (!files.ok()) {
                       return ErrorResponse(req.version(), files.error(), ctx.request_id);
                   }

                   const auto base = PublicBaseUrl(server, req) + "/v1/transfers/" + transfer.id;
                   Poco::JSON::Array::Ptr arr = new Poco::JSON::Array();
                   for (const auto& file : files.value()) {
                       Poco::JSON::Object::Ptr item = new Poco::JSON::Object();
                       item->set("id", file.id);
                       item->set("original_name", file.original_name);
                       item->set("size", static_cast<Poco::UInt64>(file.size));
                       item->set("mime_type", file.mime_type);
                       item->set("download_url", base + "/files/" + file.id);
                       arr->add(item);
                   }
                   Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
                   root->set("id", transfer.id);
                   root->set("title", transfer.title);
                   root->set("message", transfer.message);
                   root->set("status", transfer.status);
                   root->set("expires_at", transfer.expires_at);
                   root->set("created_at", transfer.created_at);
                   root->set("download_count", transfer.download_count);
                   root->set("total_size", static_cast<Poco::UInt64>(transfer.total_size));
                   root->set("files", arr);
                   return JsonOk(req.version(), Stringify(root));
               });

    router.Add("POST", "/v1/transfers/{id}/complete",
               [metadata, server = config.server](const RequestContext& ctx,
                                                  const HttpRequest& req,
                                                  const RouteParams& params) {
                   metadata::Transfer transfer;
                   if (auto failed = LoadLiveTransfer(*metadata, params.at("id"), ctx,
                                                      req.version(), &transfer)) {
                       return *failed;
                   }
                   auto completed = metadata->CompleteTransfer(transfer.id);
                   if (!completed.ok()) {
                       return ErrorResponse(req.version(), completed.error(), ctx.request_id);
                   }
                   auto files = metadata->ListFiles(transfer.id, true);
                   if (!files.ok()) {
                       return ErrorResponse(req.version(), files.error(), ctx.request_id);
                   }

                   Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
                   root->set("id", completed.value().id);
                   root->set("download_url",
                             PublicBaseUrl(server, req) + "/v1/transfers/" + transfer.id);
                   root->set("file_count", static_cast<int>(files.value().size()));
                   root->set("total_size",
                             static_cast<Poco::UInt64>(completed.value().total_size));
                   root->set("expires_at", completed.value().expires_at);
                   return JsonOk(req.version(), Stringify(root));
               });
}

}  // namespace tidelink::http
