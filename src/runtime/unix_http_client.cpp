#include <sys/socket.h>
#include <sys/types.h>
#include <sys/un.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <dock-dash/core/error.hpp>
#include <dock-dash/runtime/unix_http_client.hpp>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace dock_dash {

namespace {

constexpr size_t READ_BUFFER_SIZE = 8192;

// Closes the socket on every exit path
class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard()
    {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    int get() const
    {
        return fd_;
    }

private:
    int fd_;
};

ContainerError socketError(const std::string& what, const std::string& socket_path)
{
    return makeSystemError(ErrorCode::RUNTIME_UNAVAILABLE,
                           std::system_error(errno, std::generic_category(), what + " " + socket_path));
}

std::string toLower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trimSpaces(const std::string& text)
{
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    return text.substr(first, text.find_last_not_of(" \t\r") - first + 1);
}

void writeAll(int fd, const std::string& data, const std::string& socket_path)
{
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::send(fd, data.data() + written, data.size() - written, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw socketError("Failed to write to", socket_path);
        }
        written += static_cast<size_t>(n);
    }
}

std::string readAll(int fd, const std::string& socket_path)
{
    std::string data;
    char buffer[READ_BUFFER_SIZE];
    while (true) {
        ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw socketError("Failed to read from", socket_path);
        }
        if (n == 0) {
            break;
        }
        data.append(buffer, static_cast<size_t>(n));
    }
    return data;
}

} // namespace

UnixHttpClient::UnixHttpClient(std::string socket_path) : socket_path_(std::move(socket_path)) {}

HttpResponse UnixHttpClient::get(const std::string& target) const
{
    return request("GET", target, "");
}

HttpResponse UnixHttpClient::post(const std::string& target, const std::string& body) const
{
    return request("POST", target, body);
}

HttpResponse UnixHttpClient::request(const std::string& method,
                                     const std::string& target,
                                     const std::string& body) const
{
    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (socket_path_.size() >= sizeof(addr.sun_path)) {
        throw ContainerError(ErrorCode::CONFIG_INVALID, "Socket path too long: " + socket_path_);
    }
    std::strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    SocketGuard sock(::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (sock.get() < 0) {
        throw socketError("Failed to create socket for", socket_path_);
    }
    if (::connect(sock.get(), reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        throw socketError("Failed to connect to", socket_path_);
    }

    std::ostringstream request;
    request << method << " " << target << " HTTP/1.1\r\n";
    request << "Host: docker\r\n";
    request << "User-Agent: dock-dash\r\n";
    request << "Connection: close\r\n";
    if (method == "POST") {
        request << "Content-Type: application/json\r\n";
        request << "Content-Length: " << body.size() << "\r\n";
    }
    request << "\r\n" << body;

    writeAll(sock.get(), request.str(), socket_path_);
    return parseHttpResponse(readAll(sock.get(), socket_path_));
}

HttpResponse parseHttpResponse(const std::string& raw)
{
    const auto header_end = raw.find("\r\n\r\n");
    if (header_end == std::string::npos) {
        throw ContainerError(ErrorCode::RUNTIME_RESPONSE_INVALID, "Incomplete HTTP response");
    }

    HttpResponse response;
    std::istringstream head(raw.substr(0, header_end));
    std::string status_line;
    std::getline(head, status_line);

    std::istringstream status_stream(status_line);
    std::string version;
    status_stream >> version >> response.status;
    if (version.rfind("HTTP/", 0) != 0 || status_stream.fail()) {
        throw ContainerError(ErrorCode::RUNTIME_RESPONSE_INVALID,
                             "Malformed status line: " + trimSpaces(status_line));
    }

    std::string line;
    while (std::getline(head, line)) {
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        response.headers[toLower(trimSpaces(line.substr(0, colon)))] =
            trimSpaces(line.substr(colon + 1));
    }

    response.body = raw.substr(header_end + 4);

    auto encoding = response.headers.find("transfer-encoding");
    if (encoding != response.headers.end()
        && toLower(encoding->second).find("chunked") != std::string::npos) {
        response.body = decodeChunkedBody(response.body);
    }
    return response;
}

std::string decodeChunkedBody(const std::string& body)
{
    std::string decoded;
    size_t pos = 0;

    while (pos < body.size()) {
        const auto line_end = body.find("\r\n", pos);
        if (line_end == std::string::npos) {
            throw ContainerError(ErrorCode::RUNTIME_RESPONSE_INVALID, "Truncated chunk header");
        }

        // Chunk extensions after ';' are ignored
        std::string size_text = body.substr(pos, line_end - pos);
        size_text = trimSpaces(size_text.substr(0, size_text.find(';')));

        size_t chunk_size = 0;
        try {
            chunk_size = std::stoul(size_text, nullptr, 16);
        }
        catch (const std::logic_error&) {
            throw ContainerError(ErrorCode::RUNTIME_RESPONSE_INVALID,
                                 "Invalid chunk size: " + size_text);
        }

        pos = line_end + 2;
        if (chunk_size == 0) {
            break;
        }
        if (chunk_size > body.size() - pos) {
            throw ContainerError(ErrorCode::RUNTIME_RESPONSE_INVALID, "Truncated chunk body");
        }
        decoded.append(body, pos, chunk_size);
        pos += chunk_size + 2;
    }
    return decoded;
}

std::string urlEncode(const std::string& text)
{
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        }
        else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return encoded.str();
}

} // namespace dock_dash
