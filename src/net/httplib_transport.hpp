#pragma once
#include <chrono>

#include "net/http_transport.hpp"
#include "xblchat_export.hpp"

class XBLCHAT_API HttplibTransport : public HttpTransport {
public:
    HttplibTransport(std::chrono::seconds connect_timeout, std::chrono::seconds read_timeout, std::string user_agent);

    Result<HttpResponse> post(const std::string& url,
                              const HttpHeaders& headers,
                              const std::string& body,
                              const std::string& content_type) override;

private:
    std::chrono::seconds mConnectTimeout;
    std::chrono::seconds mReadTimeout;
    std::string          mUserAgent;
};
