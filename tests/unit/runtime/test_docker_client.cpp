#include <gtest/gtest.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <algorithm>
#include <atomic>
#include <cstring>
#include <dock-dash/core/error.hpp>
#include <dock-dash/core/logger.hpp>
#include <dock-dash/metrics/metrics_calculator.hpp>
#include <dock-dash/runtime/docker_client.hpp>
#include <dock-dash/runtime/unix_http_client.hpp>
#include <filesystem>
#include <functional>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace dock_dash;

namespace {

std::string httpReply(int status, const std::string& reason, const std::string& body)
{
    return "HTTP/1.1 " + std::to_string(status) + " " + reason
           + "\r\nContent-Type: application/json\r\nContent-Length: " + std::to_string(body.size())
           + "\r\n\r\n" + body;
}

std::string logFrame(char stream, const std::string& payload)
{
    std::string frame(8, '\0');
    frame[0] = stream;
    const auto size = static_cast<uint32_t>(payload.size());
    frame[4] = static_cast<char>((size >> 24) & 0xff);
    frame[5] = static_cast<char>((size >> 16) & 0xff);
    frame[6] = static_cast<char>((size >> 8) & 0xff);
    frame[7] = static_cast<char>(size & 0xff);
    return frame + payload;
}

/**
 * Daemon stand-in on a Unix socket: answers each connection with the reply the
 * handler picks for its request line, then closes it.
 */
class FakeDaemon {
public:
    using Handler = std::function<std::string(const std::string& request_line)>;

    FakeDaemon(std::string path, Handler handler)
        : path_(std::move(path)), handler_(std::move(handler))
    {
        ::unlink(path_.c_str());
        listen_fd_ = ::socket(AF_UNIX, SOCK_STREAM, 0);

        struct sockaddr_un addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, path_.c_str(), sizeof(addr.sun_path) - 1);
        ready_ = listen_fd_ >= 0
                 && ::bind(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0
                 && ::listen(listen_fd_, 8) == 0;

        if (ready_) {
            thread_ = std::thread([this]() { serve(); });
        }
    }

    ~FakeDaemon()
    {
        stopping_ = true;
        if (listen_fd_ >= 0) {
            ::shutdown(listen_fd_, SHUT_RDWR);
            ::close(listen_fd_);
        }
        if (thread_.joinable()) {
            thread_.join();
        }
        ::unlink(path_.c_str());
    }

    bool ready() const
    {
        return ready_;
    }

    std::vector<std::string> requests() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    void serve()
    {
        while (!stopping_) {
            int client = ::accept(listen_fd_, nullptr, nullptr);
            if (client < 0) {
                return;
            }

            std::string request;
            char buffer[1024];
            while (request.find("\r\n\r\n") == std::string::npos) {
                ssize_t n = ::recv(client, buffer, sizeof(buffer), 0);
                if (n <= 0) {
                    break;
                }
                request.append(buffer, static_cast<size_t>(n));
            }

            const std::string request_line = request.substr(0, request.find("\r\n"));
            {
                std::lock_guard<std::mutex> lock(mutex_);
                requests_.push_back(request_line);
            }

            const std::string reply = handler_(request_line);
            size_t sent = 0;
            while (sent < reply.size()) {
                ssize_t n = ::send(client, reply.data() + sent, reply.size() - sent, MSG_NOSIGNAL);
                if (n <= 0) {
                    break;
                }
                sent += static_cast<size_t>(n);
            }
            ::close(client);
        }
    }

    std::string path_;
    Handler handler_;
    int listen_fd_ = -1;
    bool ready_ = false;
    std::atomic<bool> stopping_{false};
    std::thread thread_;
    mutable std::mutex mutex_;
    std::vector<std::string> requests_;
};

const char* CONTAINER_LIST = R"([
    {"Id": "4f1c2a9be0d1aaaa", "Names": ["/web"], "State": "running",
     "Ports": [{"PrivatePort": 80, "Type": "tcp"}, {"PrivatePort": 80, "PublicPort": 8080, "Type": "tcp"}]},
    {"Id": "9a8b7c6d5e4f3210", "Names": [], "State": "exited", "Ports": []}
])";

const char* WEB_INSPECT = R"({
    "Id": "4f1c2a9be0d1aaaa",
    "Name": "/web",
    "State": {"Status": "running", "Running": true},
    "NetworkSettings": {"Ports": {"443/tcp": null, "80/tcp": [{"HostIp": "0.0.0.0", "HostPort": "8080"}]}}
})";

const char* WEB_STATS = R"({
    "cpu_stats": {"cpu_usage": {"total_usage": 1500000000, "percpu_usage": [1, 2]},
                  "system_cpu_usage": 20000000000, "online_cpus": 2},
    "precpu_stats": {"cpu_usage": {"total_usage": 1000000000}, "system_cpu_usage": 19000000000},
    "memory_stats": {"usage": 104857600}
})";

} // namespace

class HttpParsingTest : public ::testing::Test {};

TEST_F(HttpParsingTest, ParsesStatusHeadersAndBody)
{
    auto response = parseHttpResponse(
        "HTTP/1.1 404 Not Found\r\nContent-Type: application/json\r\nApi-Version: 1.41\r\n\r\n"
        "{\"message\":\"No such container: ghost\"}");

    EXPECT_EQ(response.status, 404);
    EXPECT_FALSE(response.ok());
    EXPECT_EQ(response.headers.at("content-type"), "application/json");
    EXPECT_EQ(response.headers.at("api-version"), "1.41");
    EXPECT_EQ(docker_api::errorMessage(response), "No such container: ghost");
}

TEST_F(HttpParsingTest, DecodesChunkedBody)
{
    auto response = parseHttpResponse("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                                      "5\r\nhello\r\n7;ext=1\r\n, world\r\n0\r\n\r\n");

    EXPECT_TRUE(response.ok());
    EXPECT_EQ(response.body, "hello, world");
}

TEST_F(HttpParsingTest, MalformedRepliesAreRejected)
{
    try {
        parseHttpResponse("HTTP/1.1 200 OK\r\nContent-Length: 4\r\n");
        FAIL() << "expected RUNTIME_RESPONSE_INVALID";
    }
    catch (const ContainerError& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::RUNTIME_RESPONSE_INVALID);
    }

    EXPECT_THROW(parseHttpResponse("SSH-2.0-OpenSSH\r\n\r\n"), ContainerError);
    EXPECT_THROW(decodeChunkedBody("zz\r\nabc\r\n"), ContainerError);
    EXPECT_THROW(decodeChunkedBody("10\r\nshort\r\n"), ContainerError);
}

TEST_F(HttpParsingTest, OversizedChunkLengthIsRejected)
{
    try {
        decodeChunkedBody("ffffffffffffffff\r\nabc\r\n0\r\n\r\n");
        FAIL() << "expected RUNTIME_RESPONSE_INVALID";
    }
    catch (const ContainerError& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::RUNTIME_RESPONSE_INVALID);
    }
}

TEST_F(HttpParsingTest, HeaderNamesAreCaseInsensitive)
{
    auto response = parseHttpResponse("HTTP/1.1 200 OK\r\nCONTENT-LENGTH: 2\r\n\r\nOK");

    EXPECT_EQ(response.headers.count("content-length"), 1u);
    EXPECT_EQ(response.body, "OK");
}

TEST_F(HttpParsingTest, ErrorMessageFallsBackToStatus)
{
    HttpResponse response;
    response.status = 500;
    response.body = "<html>gateway</html>";

    EXPECT_EQ(docker_api::errorMessage(response), "HTTP 500");
}

TEST_F(HttpParsingTest, UrlEncodeEscapesReservedCharacters)
{
    EXPECT_EQ(urlEncode("web_1.prod-a~b"), "web_1.prod-a~b");
    EXPECT_EQ(urlEncode("a/b c"), "a%2Fb%20c");
    EXPECT_EQ(urlEncode("x?y=1"), "x%3Fy%3D1");
}

class DockerApiParsingTest : public ::testing::Test {};

TEST_F(DockerApiParsingTest, ContainerListUsesFirstNameAndPublishedPort)
{
    auto containers = docker_api::parseContainerList(nlohmann::json::parse(CONTAINER_LIST));

    ASSERT_EQ(containers.size(), 2u);
    EXPECT_EQ(containers[0].id, "4f1c2a9be0d1aaaa");
    EXPECT_EQ(containers[0].name, "web");
    EXPECT_EQ(containers[0].status, "running");
    EXPECT_TRUE(containers[0].isRunning());
    EXPECT_EQ(containers[0].host_port, std::optional<std::string>("8080"));

    EXPECT_EQ(containers[1].name, "9a8b7c6d5e4f");
    EXPECT_FALSE(containers[1].isRunning());
    EXPECT_FALSE(containers[1].host_port.has_value());
}

TEST_F(DockerApiParsingTest, ContainerListMustBeAnArray)
{
    EXPECT_THROW(docker_api::parseContainerList(nlohmann::json::object()), ContainerError);
}

TEST_F(DockerApiParsingTest, InspectSkipsUnpublishedPorts)
{
    auto handle = docker_api::parseInspect(nlohmann::json::parse(WEB_INSPECT));

    EXPECT_EQ(handle.name, "web");
    EXPECT_EQ(handle.status, "running");
    EXPECT_EQ(handle.host_port, std::optional<std::string>("8080"));

    EXPECT_THROW(docker_api::parseInspect(nlohmann::json::parse(R"({"Name": "/web"})")),
                 ContainerError);
}

TEST_F(DockerApiParsingTest, StatsCountersAreRead)
{
    auto raw = docker_api::parseStats(nlohmann::json::parse(WEB_STATS));

    EXPECT_EQ(raw.cpu.total_usage, std::optional<uint64_t>(1500000000));
    EXPECT_EQ(raw.cpu.system_usage, std::optional<uint64_t>(20000000000ULL));
    EXPECT_EQ(raw.cpu.online_cpus, std::optional<uint32_t>(2));
    EXPECT_EQ(raw.cpu.percpu_count, 2u);
    EXPECT_EQ(raw.precpu.total_usage, std::optional<uint64_t>(1000000000));
    EXPECT_FALSE(raw.precpu.online_cpus.has_value());
    EXPECT_EQ(raw.memory_usage, std::optional<uint64_t>(104857600));
}

TEST_F(DockerApiParsingTest, UnreportedMemoryUsageReadsAsZero)
{
    auto raw = docker_api::parseStats(
        nlohmann::json::parse(R"({"cpu_stats": {"cpu_usage": {}}, "memory_stats": {}})"));

    EXPECT_FALSE(raw.cpu.total_usage.has_value());
    EXPECT_FALSE(raw.cpu.system_usage.has_value());
    EXPECT_EQ(raw.memory_usage, std::optional<uint64_t>(0));
    EXPECT_EQ(memMb(raw), std::optional<double>(0.0));

    auto bare = docker_api::parseStats(nlohmann::json::parse(R"({"read": "0001-01-01T00:00:00Z"})"));
    EXPECT_EQ(bare.memory_usage, std::optional<uint64_t>(0));
}

TEST_F(DockerApiParsingTest, MalformedMemoryUsageHasNoReading)
{
    auto raw = docker_api::parseStats(nlohmann::json::parse(R"({"memory_stats": {"usage": "lots"}})"));

    EXPECT_FALSE(raw.memory_usage.has_value());
    EXPECT_FALSE(memMb(raw).has_value());
}

TEST_F(DockerApiParsingTest, LogFramesAreDemultiplexed)
{
    const std::string raw = logFrame(1, "GET / 200\n") + logFrame(2, "warn: slow\n");

    EXPECT_EQ(docker_api::demultiplexLogs(raw), "GET / 200\nwarn: slow\n");
    EXPECT_EQ(docker_api::demultiplexLogs("plain tty output\n"), "plain tty output\n");
    EXPECT_EQ(docker_api::demultiplexLogs(""), "");
}

TEST_F(DockerApiParsingTest, ActionNames)
{
    EXPECT_EQ(parseContainerAction("restart"), std::optional<ContainerAction>(ContainerAction::RESTART));
    EXPECT_FALSE(parseContainerAction("pause").has_value());
    EXPECT_EQ(containerActionToString(ContainerAction::STOP), "stop");
}

class DockerClientTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        Logger::getInstance("runtime")->setConsoleSinkEnabled(false);
        socket_path_ = (std::filesystem::temp_directory_path()
                        / ("dock-dash-test-" + std::to_string(::getpid()) + ".sock"))
                           .string();
    }

    void TearDown() override
    {
        Logger::resetInstance("runtime");
    }

    static std::string route(const std::string& request_line)
    {
        if (request_line.rfind("GET /v1.41/containers/json?all=1 ", 0) == 0) {
            return httpReply(200, "OK", CONTAINER_LIST);
        }
        if (request_line.rfind("GET /v1.41/containers/web/json ", 0) == 0
            || request_line.rfind("GET /v1.41/containers/4f1c2a9be0d1aaaa/json ", 0) == 0) {
            return httpReply(200, "OK", WEB_INSPECT);
        }
        if (request_line.rfind("GET /v1.41/containers/4f1c2a9be0d1aaaa/stats?stream=false ", 0)
            == 0) {
            return "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                   + [] {
                         std::string body = WEB_STATS;
                         std::ostringstream chunk;
                         chunk << std::hex << body.size() << "\r\n" << body << "\r\n0\r\n\r\n";
                         return chunk.str();
                     }();
        }
        if (request_line.rfind("GET /v1.41/containers/4f1c2a9be0d1aaaa/logs?", 0) == 0) {
            const std::string body = logFrame(1, "ready\n");
            return "HTTP/1.1 200 OK\r\nContent-Length: " + std::to_string(body.size()) + "\r\n\r\n"
                   + body;
        }
        if (request_line.rfind("POST /v1.41/containers/4f1c2a9be0d1aaaa/start ", 0) == 0) {
            return "HTTP/1.1 304 Not Modified\r\nContent-Length: 0\r\n\r\n";
        }
        if (request_line.rfind("POST /v1.41/containers/4f1c2a9be0d1aaaa/stop ", 0) == 0) {
            return httpReply(500, "Internal Server Error", R"({"message":"permission denied"})");
        }
        if (request_line.rfind("POST /v1.41/containers/4f1c2a9be0d1aaaa/restart ", 0) == 0) {
            return "HTTP/1.1 204 No Content\r\nContent-Length: 0\r\n\r\n";
        }
        if (request_line.rfind("GET /_ping ", 0) == 0) {
            return "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nOK";
        }
        return httpReply(404, "Not Found", R"({"message":"No such container"})");
    }

    std::string socket_path_;
};

TEST_F(DockerClientTest, TalksToDaemonOverUnixSocket)
{
    FakeDaemon daemon(socket_path_, &DockerClientTest::route);
    ASSERT_TRUE(daemon.ready());
    DockerClient client(socket_path_);

    EXPECT_TRUE(client.ping());

    auto containers = client.listContainers(true);
    ASSERT_EQ(containers.size(), 2u);
    EXPECT_EQ(containers[0].name, "web");

    auto web = client.getContainer("web");
    EXPECT_EQ(web.id, "4f1c2a9be0d1aaaa");

    auto stats = client.fetchStats(web);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->memory_usage, std::optional<uint64_t>(104857600));

    EXPECT_EQ(client.fetchLogs(web, 200), "ready\n");
    EXPECT_NE(client.inspect(web).find("\"Name\": \"/web\""), std::string::npos);

    EXPECT_NO_THROW(client.performAction(web, ContainerAction::START));
    EXPECT_NO_THROW(client.performAction(web, ContainerAction::RESTART));

    auto requests = daemon.requests();
    EXPECT_NE(std::find(requests.begin(), requests.end(),
                        "GET /v1.41/containers/4f1c2a9be0d1aaaa/logs?stdout=1&stderr=1&tail=200 HTTP/1.1"),
              requests.end());
}

TEST_F(DockerClientTest, DaemonErrorsMapToErrorCodes)
{
    FakeDaemon daemon(socket_path_, &DockerClientTest::route);
    ASSERT_TRUE(daemon.ready());
    DockerClient client(socket_path_);

    try {
        client.getContainer("ghost");
        FAIL() << "expected CONTAINER_NOT_FOUND";
    }
    catch (const ContainerError& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::CONTAINER_NOT_FOUND);
    }

    auto web = client.getContainer("web");
    try {
        client.performAction(web, ContainerAction::STOP);
        FAIL() << "expected CONTAINER_STOP_FAILED";
    }
    catch (const ContainerError& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::CONTAINER_STOP_FAILED);
        EXPECT_NE(e.getMessage().find("permission denied"), std::string::npos);
    }

    ContainerHandle gone{"deadbeef", "gone", "running", std::nullopt};
    try {
        client.fetchStats(gone);
        FAIL() << "expected STATS_UNAVAILABLE";
    }
    catch (const ContainerError& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::STATS_UNAVAILABLE);
        EXPECT_NE(e.getMessage().find("gone"), std::string::npos);
    }
}

TEST_F(DockerClientTest, EmptyStatsDocumentIsNoSample)
{
    FakeDaemon daemon(socket_path_, [](const std::string& request_line) {
        if (request_line.rfind("GET /v1.41/containers/9a8b7c6d5e4f3210/stats", 0) == 0) {
            return httpReply(200, "OK", "{}");
        }
        return httpReply(404, "Not Found", R"({"message":"No such container"})");
    });
    ASSERT_TRUE(daemon.ready());
    DockerClient client(socket_path_);

    ContainerHandle batch{"9a8b7c6d5e4f3210", "batch", "running", std::nullopt};
    EXPECT_FALSE(client.fetchStats(batch).has_value());
}

TEST_F(DockerClientTest, MissingSocketIsRuntimeUnavailable)
{
    DockerClient client(socket_path_ + ".absent");

    EXPECT_FALSE(client.ping());
    try {
        client.listContainers(true);
        FAIL() << "expected RUNTIME_UNAVAILABLE";
    }
    catch (const ContainerError& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::RUNTIME_UNAVAILABLE);
        EXPECT_EQ(httpStatusFor(e.getErrorCode()), 503);
    }

    ContainerHandle web{"4f1c2a9be0d1aaaa", "web", "running", std::nullopt};
    try {
        client.fetchStats(web);
        FAIL() << "expected STATS_UNAVAILABLE";
    }
    catch (const ContainerError& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::STATS_UNAVAILABLE);
    }
}
