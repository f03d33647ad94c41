#pragma once

#include <dock-dash/runtime/runtime_client.hpp>
#include <dock-dash/runtime/unix_http_client.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace dock_dash {

/**
 * @brief RuntimeClient backed by the Docker Engine API on a Unix socket
 */
class DockerClient : public RuntimeClient {
public:
    explicit DockerClient(const std::string& socket_path);
    ~DockerClient() override = default;

    DockerClient(const DockerClient&) = delete;
    DockerClient& operator=(const DockerClient&) = delete;

    std::vector<ContainerHandle> listContainers(bool all) override;
    ContainerHandle getContainer(const std::string& name) override;
    std::optional<RawStats> fetchStats(const ContainerHandle& handle) override;
    void performAction(const ContainerHandle& handle, ContainerAction action) override;
    std::string fetchLogs(const ContainerHandle& handle, int tail) override;
    std::string inspect(const ContainerHandle& handle) override;

    // True when the daemon answers /_ping
    bool ping();

private:
    nlohmann::json getJson(const std::string& target, const std::string& subject);

    UnixHttpClient http_;
};

namespace docker_api {

// Decoders for Engine API documents; missing or mistyped fields are left empty
std::vector<ContainerHandle> parseContainerList(const nlohmann::json& list);
ContainerHandle parseInspect(const nlohmann::json& inspect);
RawStats parseStats(const nlohmann::json& stats);

// Strips the 8-byte stream headers of a non-TTY log stream
std::string demultiplexLogs(const std::string& raw);

// Daemon error message of a failed request, falling back to the status code
std::string errorMessage(const HttpResponse& response);

} // namespace docker_api

} // namespace dock_dash
