#pragma once

#include <string>
#include <vector>

struct HttpResponse {
    long status = 0;
    std::string body;
};

// Thin libcurl wrapper. Header stays curl-free.
class HttpClient {
public:
    enum class Transport {
        Ok,             // a response arrived (any status)
        Unreachable,    // DNS / connect failure
        Timeout,
        Failed
    };

    // Call once per process before any request, and cleanup() at exit.
    static bool globalInit();
    static void globalCleanup();

    static Transport request(const std::string& method,
        const std::string& url,
        const std::string& body,
        const std::vector<std::string>& headers,
        long timeoutSec,
        HttpResponse& out,
        std::string& err);

    static std::string urlEncode(const std::string& s);
};
