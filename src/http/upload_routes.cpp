#include "tidelink/http/upload_routes.h"

#include <string>

#include "tidelink/http/responses.h"
#include "tidelink/http/tus_protocol.h"

namespace tidelink::http {
namespace {

namespace bhttp = boost::beast::http;

HttpResponse Empty(int version, bhttp::status status, std::uint64_t max_size) {
    HttpResponse response{status, version};
    tus::ApplyProtocolHeaders(response, max_size);
    response.prepare_payload();
    return response;
}

HttpResponse TusError(int version, const core::Error& error, const RequestContext& ctx,
                      std::uint64_t max_size) {
    auto response = ErrorResponse(version, error, ctx.request_id);
    tus::ApplyProtocolHeaders(response, max_size);
    return response;
}

}  // namespace

void RegisterUploadRoutes(Router& router, std::shared_ptr<upload::UploadSessionManager> uploads,
                          const core::Config& config) {
    const auto max_size = uploads->max_size_bytes();

    router.Use([max_size](const RequestContext& ctx, const HttpRequest& req,
                          const RouteParams&) -> std::optional<HttpResponse> {
        if (req.method() == bhttp::verb::options ||
            !tus::IsUploadPath(std::string(req.target()))) {
            return std::nullopt;
        }
        auto it = req.find(tus::kHeaderResumable);
        if (it == req.end() || std::string(it->value()) == tus::kVersion) {
            return std::nullopt;
        }
        auto response = JsonError(req.version(), "UNSUPPORTED_VERSION",
                                  "unsupported Tus-Resumable version", ctx.request_id,
                                  bhttp::status::precondition_failed);
        tus::ApplyProtocolHeaders(response, max_size);
        return response;
    });

    auto discovery = [max_size](const RequestContext&, const HttpRequest& req,
                                const RouteParams&) -> core::Result<HttpResponse> {
        return Empty(req.version(), bhttp::status::no_content, max_size);
    };
    router.Add("OPTIONS", "/files", discovery);
    router.Add("OPTIONS", "/files/{id}", discovery);

    router.Add("POST", "/files",
               [uploads, max_size, server = config.server](
                   const RequestContext& ctx, const HttpRequest& req,
                   const RouteParams&) -> core::Result<HttpResponse> {
                   if (req.find("Upload-Defer-Length") != req.end()) {
                       return TusError(req.version(),
                                       core::Error{core::ErrorCode::kInvalidArgument,
                                                   "deferred length is not supported"},
                                       ctx, max_size);
                   }
                   auto length = tus::ParseUnsignedHeader(
                       std::string(req[tus::kHeaderUploadLength]), tus::kHeaderUploadLength);
                   if (!length.ok()) {
                       return TusError(req.version(), length.error(), ctx, max_size);
                   }
                   auto metadata = tus::ParseUploadMetadata(
                       std::string(req[tus::kHeaderUploadMetadata]));
                   if (!metadata.ok()) {
                       return TusError(req.version(), metadata.error(), ctx, max_size);
                   }

                   auto created =
                       uploads->CreateSession(length.value(), metadata.value(), req.body());
                   if (!created.ok()) {
                       return TusError(req.version(), created.error(), ctx, max_size);
                   }

                   auto response = Empty(req.version(), bhttp::status::created, max_size);
                   response.set(bhttp::field::location,
                                PublicBaseUrl(server, req) + "/files/" + created.value().id);
                   response.set(tus::kHeaderUploadOffset,
                                std::to_string(created.value().offset));
                   return response;
               });

    router.Add("PATCH", "/files/{id}",
               [uploads, max_size](const RequestContext& ctx, const HttpRequest& req,
                                   const RouteParams& params) -> core::Result<HttpResponse> {
                   const std::string content_type(req[bhttp::field::content_type]);
                   if (!content_type.empty() && content_type != tus::kChunkContentType) {
                       auto response = JsonError(req.version(), "UNSUPPORTED_MEDIA_TYPE",
                                                 "chunks must be sent as " +
                                                     std::string(tus::kChunkContentType),
                                                 ctx.request_id,
                                                 bhttp::status::unsupported_media_type);
                       tus::ApplyProtocolHeaders(response, max_size);
                       return response;
                   }
                   auto offset = tus::ParseUnsignedHeader(
                       std::string(req[tus::kHeaderUploadOffset]), tus::kHeaderUploadOffset);
                   if (!offset.ok()) {
                       return TusError(req.version(), offset.error(), ctx, max_size);
                   }

                   auto appended = uploads->AppendChunk(params.at("id"), offset.value(),
                                                        req.body());
                   if (!appended.ok()) {
                       return TusError(req.version(), appended.error(), ctx, max_size);
                   }
                   auto response = Empty(req.version(), bhttp::status::no_content, max_size);
                   response.set(tus::kHeaderUploadOffset,
                                std::to_string(appended.value().offset));
                   return response;
               });

    router.Add("HEAD", "/files/{id}",
               [uploads, max_size](const RequestContext&, const HttpRequest& req,
                                   const RouteParams& params) -> core::Result<HttpResponse> {
                   auto status = uploads->GetStatus(params.at("id"));
                   if (!status.ok()) {
                       // HEAD responses carry no body.
                       auto response = Empty(req.version(), StatusFor(status.error().code),
                                             max_size);
                       response.set(bhttp::field::cache_control, "no-store");
                       return response;
                   }
                   auto response = Empty(req.version(), bhttp::status::ok, max_size);
                   response.set(bhttp::field::cache_control, "no-store");
                   response.set(tus::kHeaderUploadOffset, std::to_string(status.value().offset));
                   response.set(tus::kHeaderUploadLength,
                                std::to_string(status.value().declared_size));
                   if (!status.value().metadata.empty()) {
                       response.set(tus::kHeaderUploadMetadata,
                                    tus::EncodeUploadMetadata(status.value().metadata));
                   }
                   return response;
               });

    router.Add("DELETE", "/files/{id}",
               [uploads, max_size](const RequestContext& ctx, const HttpRequest& req,
                                   const RouteParams& params) -> core::Result<HttpResponse> {
                   auto cancelled = uploads->CancelSession(params.at("id"));
                   if (!cancelled.ok()) {
                       return TusError(req.version(), cancelled.error(), ctx, max_size);
                   }
                   return Empty(req.version(), bhttp::status::no_content, max_size);
               });
}

}  // namespace tidelink::http
