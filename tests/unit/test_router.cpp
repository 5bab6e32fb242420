#include <string>

#include <gtest/gtest.h>

#include "chunkshare/http/responses.h"
#include "chunkshare/http/router.h"
#include "chunkshare/observability/metrics.h"

namespace beast_http = boost::beast::http;
using chunkshare::http::HttpRequest;
using chunkshare::http::HttpResponse;
using chunkshare::http::RequestContext;
using chunkshare::http::RouteParams;
using chunkshare::http::Router;

namespace {

HttpRequest MakeRequest(beast_http::verb method, const std::string& target) {
    HttpRequest request{method, target, 11};
    request.prepare_payload();
    return request;
}

}  // namespace

TEST(Router, MatchExtractsTemplateParameters) {
    RouteParams params;
    EXPECT_TRUE(Router::Match("/v1/files/{id}/links/{link_id}", "/v1/files/f1/links/l2", &params));
    EXPECT_EQ(params["id"], "f1");
    EXPECT_EQ(params["link_id"], "l2");

    EXPECT_FALSE(Router::Match("/v1/files/{id}", "/v1/files/f1/links", nullptr));
    EXPECT_FALSE(Router::Match("/v1/files/{id}", "/v1/sessions/f1", nullptr));
}

TEST(Router, DispatchesByMethodAndPath) {
    Router router;
    router.Add("GET", "/v1/files/{id}",
               [](const RequestContext&, const HttpRequest& req,
                  const RouteParams& params) -> chunkshare::core::Result<HttpResponse> {
                   return chunkshare::http::JsonOk(req.version(),
                                                   "{\"id\":\"" + params.at("id") + "\"}");
               });

    RequestContext ctx;
    ctx.request_id = "req-1";

    auto ok = router.Route(ctx, MakeRequest(beast_http::verb::get, "/v1/files/abc?x=1"));
    ASSERT_TRUE(ok.ok());
    EXPECT_EQ(ok.value().result(), beast_http::status::ok);
    EXPECT_EQ(ok.value().body(), "{\"id\":\"abc\"}");

    auto wrong_method = router.Route(ctx, MakeRequest(beast_http::verb::post, "/v1/files/abc"));
    ASSERT_TRUE(wrong_method.ok());
    EXPECT_EQ(wrong_method.value().result(), beast_http::status::method_not_allowed);
    EXPECT_EQ(wrong_method.value()[beast_http::field::allow], "GET");

    auto missing = router.Route(ctx, MakeRequest(beast_http::verb::get, "/v1/nothing"));
    ASSERT_TRUE(missing.ok());
    EXPECT_EQ(missing.value().result(), beast_http::status::not_found);
    EXPECT_NE(missing.value().body().find("req-1"), std::string::npos);
}

TEST(Responses, ErrorCodesMapToStatusClasses) {
    using chunkshare::core::ErrorCode;
    using chunkshare::http::StatusFor;
    EXPECT_EQ(StatusFor(ErrorCode::kInvalidIndex), beast_http::status::bad_request);
    EXPECT_EQ(StatusFor(ErrorCode::kPasswordRequired), beast_http::status::unauthorized);
    EXPECT_EQ(StatusFor(ErrorCode::kQuotaExceeded), beast_http::status::forbidden);
    EXPECT_EQ(StatusFor(ErrorCode::kLinkNotFound), beast_http::status::not_found);
    EXPECT_EQ(StatusFor(ErrorCode::kChecksumConflict), beast_http::status::conflict);
    EXPECT_EQ(StatusFor(ErrorCode::kIncompleteUpload), beast_http::status::conflict);
    EXPECT_EQ(StatusFor(ErrorCode::kLinkExhausted), beast_http::status::gone);
    EXPECT_EQ(StatusFor(ErrorCode::kPayloadTooLarge), beast_http::status::payload_too_large);
    EXPECT_EQ(StatusFor(ErrorCode::kDigestMismatch), beast_http::status::unprocessable_entity);
    EXPECT_EQ(StatusFor(ErrorCode::kDbError), beast_http::status::internal_server_error);

    EXPECT_STREQ(chunkshare::core::ErrorCodeName(ErrorCode::kLinkExhausted), "LINK_EXHAUSTED");
    EXPECT_STREQ(chunkshare::core::ErrorCodeName(ErrorCode::kChecksumConflict),
                 "CHECKSUM_CONFLICT");
}

TEST(Responses, ErrorEnvelopeEscapesMessages) {
    auto response = chunkshare::http::ErrorResponse(
        11, chunkshare::core::Error{chunkshare::core::ErrorCode::kInvalidArgument, "bad \"name\""},
        "req-9");
    EXPECT_EQ(response.result(), beast_http::status::bad_request);
    EXPECT_NE(response.body().find("\"code\":\"INVALID_ARGUMENT\""), std::string::npos);
    EXPECT_NE(response.body().find("bad \\\"name\\\""), std::string::npos);
    EXPECT_NE(response.body().find("\"request_id\":\"req-9\""), std::string::npos);
}

TEST(Responses, QueryParametersAreDecoded) {
    const std::string target = "/d/f1?token=a.b.c&password=p%40ss+word&flag";
    EXPECT_EQ(chunkshare::http::StripQuery(target), "/d/f1");
    EXPECT_EQ(chunkshare::http::GetQueryParam(target, "token"), "a.b.c");
    EXPECT_EQ(chunkshare::http::GetQueryParam(target, "password"), "p@ss word");
    EXPECT_TRUE(chunkshare::http::HasQueryParam(target, "flag"));
    EXPECT_FALSE(chunkshare::http::HasQueryParam(target, "missing"));
    EXPECT_EQ(chunkshare::http::GetQueryParam(target, "missing"), "");
}

TEST(Responses, ParseRangeHandlesBoundsAndSuffixes) {
    auto full = chunkshare::http::ParseRange("bytes=0-4", 12);
    ASSERT_TRUE(full);
    EXPECT_EQ(full->start, 0u);
    EXPECT_EQ(full->end, 4u);

    auto open = chunkshare::http::ParseRange("bytes=8-", 12);
    ASSERT_TRUE(open);
    EXPECT_EQ(open->end, 11u);

    auto clamped = chunkshare::http::ParseRange("bytes=4-100", 12);
    ASSERT_TRUE(clamped);
    EXPECT_EQ(clamped->end, 11u);

    auto suffix = chunkshare::http::ParseRange("bytes=-4", 12);
    ASSERT_TRUE(suffix);
    EXPECT_EQ(suffix->start, 8u);
    EXPECT_EQ(suffix->end, 11u);

    EXPECT_FALSE(chunkshare::http::ParseRange("bytes=12-", 12));
    EXPECT_FALSE(chunkshare::http::ParseRange("bytes=5-2", 12));
    EXPECT_FALSE(chunkshare::http::ParseRange("bytes=x-2", 12));
    EXPECT_FALSE(chunkshare::http::ParseRange("bytes=0-1,4-5", 12));
    EXPECT_FALSE(chunkshare::http::ParseRange("items=0-1", 12));
}

TEST(Metrics, CountsRequestsByClass) {
    chunkshare::observability::RecordRequest(200, 3);
    chunkshare::observability::RecordRequest(404, 1);
    chunkshare::observability::RecordDownload();
    const auto text = chunkshare::observability::RenderMetrics();
    EXPECT_NE(text.find("# TYPE chunkshare_http_requests_total counter"), std::string::npos);
    EXPECT_NE(text.find("chunkshare_up 1\n"), std::string::npos);
    EXPECT_EQ(text.find("chunkshare_http_requests_total 0\n"), std::string::npos);
    EXPECT_EQ(text.find("chunkshare_downloads_total 0\n"), std::string::npos);
}
