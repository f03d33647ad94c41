#pragma once

#include <map>
#include <string>

namespace dock_dash {

struct HttpResponse {
    int status = 0;
    std::map<std::string, std::string> headers; // lower-case names
    std::string body;                            // de-chunked

    bool ok() const
    {
        return status >= 200 && status < 300;
    }
};

/**
 * @brief Minimal HTTP/1.1 client over a Unix domain socket
 *
 * Every request opens its own connection and reads until the daemon closes it,
 * so one instance can serve concurrent callers. Socket failures throw
 * ContainerError(RUNTIME_UNAVAILABLE); a malformed reply throws
 * ContainerError(RUNTIME_RESPONSE_INVALID).
 */
class UnixHttpClient {
public:
    explicit UnixHttpClient(std::string socket_path);

    HttpResponse get(const std::string& target) const;
    HttpResponse post(const std::string& target, const std::string& body = "") const;

    const std::string& getSocketPath() const
    {
        return socket_path_;
    }

private:
    HttpResponse request(const std::string& method,
                         const std::string& target,
                         const std::string& body) const;

    std::string socket_path_;
};

// Parses a complete HTTP/1.1 reply
HttpResponse parseHttpResponse(const std::string& raw);

std::string decodeChunkedBody(const std::string& body);

// Percent-encodes a path segment
std::string urlEncode(const std::string& text);

} // namespace dock_dash
