#pragma once

#include "scoring/HttpTransport.hpp"

namespace scoring {

// One easy handle per request, so concurrent callers never share curl state.
// curl_global_init must have run before the first Post.
class CurlHttpTransport final : public IHttpTransport {
public:
    HttpResponse Post(const HttpRequest& request) override;
};

class CurlGlobalScope {
public:
    CurlGlobalScope();
    ~CurlGlobalScope();

    CurlGlobalScope(const CurlGlobalScope&) = delete;
    CurlGlobalScope& operator=(const CurlGlobalScope&) = delete;
};

} // namespace scoring
