#include "httplib_transport.hpp"

#include <httplib.h>

#include "utils/logger.hpp"
#include "utils/regular.hpp"

HttplibTransport::HttplibTransport(std::chrono::seconds connect_timeout, std::chrono::seconds read_timeout, std::string user_agent)
    : mConnectTimeout(connect_timeout),
      mReadTimeout(read_timeout),
      mUserAgent(std::move(user_agent)) {}

Result<HttpResponse> HttplibTransport::post(const std::string& url,
                                            const HttpHeaders& headers,
                                            const std::string& body,
                                            const std::string& content_type) {
    auto parts = Regular::parseUrl(url);
    if (!parts || (parts->scheme != "http" && parts->scheme != "https")) {
        return Error{ErrorKind::NetworkFailure, "Unsupported URL: " + url};
    }

    httplib::Client cli(parts->origin());
    cli.set_connection_timeout(mConnectTimeout);
    cli.set_read_timeout(mReadTimeout);
    cli.set_write_timeout(mReadTimeout);

    httplib::Headers request_headers(headers.begin(), headers.end());
    if (!mUserAgent.empty() && request_headers.find("User-Agent") == request_headers.end()) {
        request_headers.emplace("User-Agent", mUserAgent);
    }

    auto res = cli.Post(parts->target, request_headers, body, content_type);
    if (!res) {
        return Error{ErrorKind::NetworkFailure, "POST " + parts->host + parts->target + " failed: " + httplib::to_string(res.error())};
    }

    LOG_DEBUG("POST " + parts->host + parts->target + " -> " + std::to_string(res->status));
    return HttpResponse{res->status, res->body};
}
