#pragma once
#include <map>
#include <string>

#include "utils/result.hpp"

using HttpHeaders = std::multimap<std::string, std::string>;

struct HttpResponse {
    int         status = 0;
    std::string body;
};

/**
 * 单次请求/响应的 HTTP 调用。任何状态码都作为 HttpResponse 返回，
 * 只有连接、TLS、超时等传输层失败才返回 NetworkFailure。
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual Result<HttpResponse> post(const std::string& url,
                                      const HttpHeaders& headers,
                                      const std::string& body,
                                      const std::string& content_type) = 0;
};
