#include "chunkshare/http/router.h"

#include <sstream>

#include "chunkshare/http/responses.h"

namespace chunkshare::http {

void Router::Add(const std::string& method, const std::string& pattern, Handler handler) {
    routes_.push_back(RouteEntry{method, SplitPath(pattern), std::move(handler)});
}

core::Result<HttpResponse> Router::Route(const RequestContext& ctx,
                                        const HttpRequest& request) const {
    const auto path = SplitPath(StripQuery(std::string(request.target())));

    std::string allowed;
    for (const auto& route : routes_) {
        RouteParams params;
        if (!MatchSegments(route.segments, path, &params)) {
            continue;
        }
        if (route.method != request.method_string()) {
            allowed += allowed.empty() ? route.method : ", " + route.method;
            continue;
        }
        return route.handler(ctx, request, params);
    }

    if (!allowed.empty()) {
        auto response = JsonError(request.version(), "METHOD_NOT_ALLOWED", "method not allowed",
                                  ctx.request_id, boost::beast::http::status::method_not_allowed);
        response.set(boost::beast::http::field::allow, allowed);
        return response;
    }
    return JsonError(request.version(), "NOT_FOUND", "route not found", ctx.request_id,
                     boost::beast::http::status::not_found);
}

std::vector<std::string> Router::SplitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::stringstream ss(path);
    std::string item;
    while (std::getline(ss, item, '/')) {
        if (!item.empty()) {
            parts.push_back(item);
        }
    }
    return parts;
}

bool Router::Match(const std::string& pattern, const std::string& path, RouteParams* out_params) {
    return MatchSegments(SplitPath(pattern), SplitPath(path), out_params);
}

bool Router::MatchSegments(const std::vector<std::string>& pattern_parts,
                           const std::vector<std::string>& path_parts, RouteParams* out_params) {
    if (pattern_parts.size() != path_parts.size()) {
        return false;
    }

    for (size_t i = 0; i < pattern_parts.size(); ++i) {
        const auto& p = pattern_parts[i];
        const auto& v = path_parts[i];
        if (p.size() >= 2 && p.front() == '{' && p.back() == '}') {
            if (out_params) {
                (*out_params)[p.substr(1, p.size() - 2)] = v;
            }
        } else if (p != v) {
            return false;
        }
    }
    return true;
}

}  // namespace chunkshare::http
