#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/beast/http.hpp>

#include "chunkshare/core/result.h"
#include "chunkshare/http/request_context.h"

namespace chunkshare::http {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;
using RouteParams = std::unordered_map<std::string, std::string>;
using Handler = std::function<core::Result<HttpResponse>(const RequestContext&, const HttpRequest&, const RouteParams&)>;

/// @brief Route table matching `{name}` path segments; 405 responses carry an Allow header.
class Router {
public:
    void Add(const std::string& method, const std::string& pattern, Handler handler);
    core::Result<HttpResponse> Route(const RequestContext& ctx, const HttpRequest& request) const;

    static bool Match(const std::string& pattern, const std::string& path, RouteParams* out_params);

private:
    struct RouteEntry {
        std::string method;
        std::vector<std::string> segments;
        Handler handler;
    };

    static std::vector<std::string> SplitPath(const std::string& path);
    static bool MatchSegments(const std::vector<std::string>& pattern,
                              const std::vector<std::string>& path, RouteParams* out_params);

    std::vector<RouteEntry> routes_;
};

}  // namespace chunkshare::http
