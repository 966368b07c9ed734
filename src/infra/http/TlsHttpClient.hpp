#pragma once

#include <string>

namespace infra::http {

struct HttpResponse {
    unsigned status = 0U;
    std::string body;
    std::string retry_after_header;
    std::string final_host;
    std::string final_target;
};

// Performs an HTTPS GET, following same-scheme redirects. Throws std::runtime_error on
// network or TLS errors; HTTP error statuses are returned to the caller.
HttpResponse https_get(const std::string& host, const std::string& target, int timeout_sec = 30);

// GET seam for provider adapters. Tests substitute a scripted transport.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse get(const std::string& host, const std::string& target, int timeout_sec) = 0;
};

class TlsHttpTransport final : public HttpTransport {
public:
    HttpResponse get(const std::string& host, const std::string& target, int timeout_sec) override;

    static TlsHttpTransport& instance();
};

}  // namespace infra::http
