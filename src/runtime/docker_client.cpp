#include <algorithm>
#include <cctype>
#include <dock-dash/core/error.hpp>
#include <dock-dash/core/logger.hpp>
#include <dock-dash/runtime/docker_client.hpp>

namespace dock_dash {

namespace {

constexpr const char* API_PREFIX = "/v1.41";
constexpr size_t LOG_FRAME_HEADER_SIZE = 8;

Logger* logger()
{
    return Logger::getInstance("runtime");
}

const nlohmann::json* child(const nlohmann::json& object, const char* key)
{
    if (!object.is_object()) {
        return nullptr;
    }
    auto it = object.find(key);
    return it == object.end() ? nullptr : &*it;
}

std::optional<uint64_t> readCounter(const nlohmann::json& object, const char* key)
{
    const nlohmann::json* value = child(object, key);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (value->is_number_unsigned()) {
        return value->get<uint64_t>();
    }
    if (value->is_number_integer() && value->get<int64_t>() >= 0) {
        return static_cast<uint64_t>(value->get<int64_t>());
    }
    if (value->is_number_float() && value->get<double>() >= 0.0) {
        return static_cast<uint64_t>(value->get<double>());
    }
    return std::nullopt;
}

std::string readString(const nlohmann::json& object, const char* key)
{
    const nlohmann::json* value = child(object, key);
    return (value != nullptr && value->is_string()) ? value->get<std::string>() : std::string();
}

std::string stripSlash(std::string name)
{
    if (!name.empty() && name.front() == '/') {
        name.erase(0, 1);
    }
    return name;
}

CpuCounters parseCpuCounters(const nlohmann::json& cpu_stats)
{
    CpuCounters counters;
    counters.system_usage = readCounter(cpu_stats, "system_cpu_usage");

    if (auto online = readCounter(cpu_stats, "online_cpus")) {
        counters.online_cpus = static_cast<uint32_t>(*online);
    }

    if (const nlohmann::json* usage = child(cpu_stats, "cpu_usage")) {
        counters.total_usage = readCounter(*usage, "total_usage");
        const nlohmann::json* percpu = child(*usage, "percpu_usage");
        if (percpu != nullptr && percpu->is_array()) {
            counters.percpu_count = percpu->size();
        }
    }
    return counters;
}

// First published host port in inspect form: {"80/tcp": [{"HostPort": "8080"}]}
std::optional<std::string> firstInspectPort(const nlohmann::json& inspect)
{
    const nlohmann::json* settings = child(inspect, "NetworkSettings");
    const nlohmann::json* ports = settings ? child(*settings, "Ports") : nullptr;
    if (ports == nullptr || !ports->is_object()) {
        return std::nullopt;
    }
    for (const auto& [port, mappings] : ports->items()) {
        if (!mappings.is_array() || mappings.empty()) {
            continue;
        }
        std::string host_port = readString(mappings.front(), "HostPort");
        if (!host_port.empty()) {
            return host_port;
        }
    }
    return std::nullopt;
}

// First published host port in list form: [{"PrivatePort": 80, "PublicPort": 8080}]
std::optional<std::string> firstListPort(const nlohmann::json& summary)
{
    const nlohmann::json* ports = child(summary, "Ports");
    if (ports == nullptr || !ports->is_array()) {
        return std::nullopt;
    }
    for (const auto& port : *ports) {
        if (auto public_port = readCounter(port, "PublicPort"); public_port && *public_port > 0) {
            return std::to_string(*public_port);
        }
    }
    return std::nullopt;
}

nlohmann::json parseBody(const HttpResponse& response, const std::string& subject)
{
    auto parsed = nlohmann::json::parse(response.body, nullptr, false);
    if (parsed.is_discarded()) {
        throw ContainerError(ErrorCode::RUNTIME_RESPONSE_INVALID,
                             "Malformed JSON from runtime for " + subject);
    }
    return parsed;
}

ErrorCode actionFailureCode(ContainerAction action)
{
    switch (action) {
        case ContainerAction::START:
            return ErrorCode::CONTAINER_START_FAILED;
        case ContainerAction::STOP:
            return ErrorCode::CONTAINER_STOP_FAILED;
        case ContainerAction::RESTART:
        default:
            return ErrorCode::CONTAINER_RESTART_FAILED;
    }
}

} // namespace

std::string containerActionToString(ContainerAction action)
{
    switch (action) {
        case ContainerAction::START:
            return "start";
        case ContainerAction::STOP:
            return "stop";
        case ContainerAction::RESTART:
            return "restart";
        default:
            return "unknown";
    }
}

std::optional<ContainerAction> parseContainerAction(const std::string& text)
{
    if (text == "start")
        return ContainerAction::START;
    if (text == "stop")
        return ContainerAction::STOP;
    if (text == "restart")
        return ContainerAction::RESTART;
    return std::nullopt;
}

DockerClient::DockerClient(const std::string& socket_path) : http_(socket_path) {}

nlohmann::json DockerClient::getJson(const std::string& target, const std::string& subject)
{
    HttpResponse response = http_.get(std::string(API_PREFIX) + target);
    if (response.status == 404) {
        throw ContainerError(ErrorCode::CONTAINER_NOT_FOUND, subject);
    }
    if (!response.ok()) {
        throw ContainerError(ErrorCode::RUNTIME_REQUEST_FAILED,
                             subject + ": " + docker_api::errorMessage(response));
    }
    return parseBody(response, subject);
}

bool DockerClient::ping()
{
    try {
        return http_.get("/_ping").ok();
    }
    catch (const ContainerError& e) {
        logger()->warning("Runtime ping failed: {}", e.what());
        return false;
    }
}

std::vector<ContainerHandle> DockerClient::listContainers(bool all)
{
    auto list = getJson(std::string("/containers/json?all=") + (all ? "1" : "0"), "container list");
    auto containers = docker_api::parseContainerList(list);
    logger()->debug("Runtime reported {} containers", containers.size());
    return containers;
}

ContainerHandle DockerClient::getContainer(const std::string& name)
{
    if (name.empty()) {
        throw ContainerError(ErrorCode::CONTAINER_NOT_FOUND, "empty container name");
    }
    return docker_api::parseInspect(getJson("/containers/" + urlEncode(name) + "/json", name));
}

std::optional<RawStats> DockerClient::fetchStats(const ContainerHandle& handle)
{
    nlohmann::json stats;
    try {
        stats = getJson("/containers/" + urlEncode(handle.id) + "/stats?stream=false", handle.name);
    }
    catch (const ContainerError& e) {
        throw ContainerError(ErrorCode::STATS_UNAVAILABLE, handle.name + ": " + e.getMessage());
    }

    // The daemon answers {} for a container that stopped between list and stats
    if (!stats.is_object() || stats.empty()) {
        return std::nullopt;
    }
    return docker_api::parseStats(stats);
}

void DockerClient::performAction(const ContainerHandle& handle, ContainerAction action)
{
    const std::string verb = containerActionToString(action);
    HttpResponse response =
        http_.post(std::string(API_PREFIX) + "/containers/" + urlEncode(handle.id) + "/" + verb);

    // 304: already in the requested state
    if (response.ok() || response.status == 304) {
        logger()->info("Container {} {} accepted by runtime", handle.name, verb);
        return;
    }
    if (response.status == 404) {
        throw ContainerError(ErrorCode::CONTAINER_NOT_FOUND, handle.name);
    }
    throw ContainerError(actionFailureCode(action),
                         handle.name + ": " + docker_api::errorMessage(response));
}

std::string DockerClient::fetchLogs(const ContainerHandle& handle, int tail)
{
    HttpResponse response = http_.get(std::string(API_PREFIX) + "/containers/"
                                      + urlEncode(handle.id) + "/logs?stdout=1&stderr=1&tail="
                                      + std::to_string(tail));
    if (response.status == 404) {
        throw ContainerError(ErrorCode::CONTAINER_NOT_FOUND, handle.name);
    }
    if (!response.ok()) {
        throw ContainerError(ErrorCode::LOGS_UNAVAILABLE,
                             handle.name + ": " + docker_api::errorMessage(response));
    }
    return docker_api::demultiplexLogs(response.body);
}

std::string DockerClient::inspect(const ContainerHandle& handle)
{
    return getJson("/containers/" + urlEncode(handle.id) + "/json", handle.name).dump(2);
}

namespace docker_api {

std::vector<ContainerHandle> parseContainerList(const nlohmann::json& list)
{
    if (!list.is_array()) {
        throw ContainerError(ErrorCode::RUNTIME_RESPONSE_INVALID, "container list is not an array");
    }

    std::vector<ContainerHandle> containers;
    containers.reserve(list.size());
    for (const auto& summary : list) {
        ContainerHandle handle;
        handle.id = readString(summary, "Id");
        handle.status = readString(summary, "State");

        const nlohmann::json* names = child(summary, "Names");
        if (names != nullptr && names->is_array() && !names->empty() && names->front().is_string()) {
            handle.name = stripSlash(names->front().get<std::string>());
        }
        if (handle.name.empty()) {
            handle.name = handle.id.substr(0, 12);
        }

        handle.host_port = firstListPort(summary);
        containers.push_back(std::move(handle));
    }
    return containers;
}

ContainerHandle parseInspect(const nlohmann::json& inspect)
{
    ContainerHandle handle;
    handle.id = readString(inspect, "Id");
    handle.name = stripSlash(readString(inspect, "Name"));
    if (const nlohmann::json* state = child(inspect, "State")) {
        handle.status = readString(*state, "Status");
    }
    handle.host_port = firstInspectPort(inspect);

    if (handle.id.empty()) {
        throw ContainerError(ErrorCode::RUNTIME_RESPONSE_INVALID, "inspect document without Id");
    }
    return handle;
}

RawStats parseStats(const nlohmann::json& stats)
{
    RawStats raw;
    if (const nlohmann::json* cpu = child(stats, "cpu_stats")) {
        raw.cpu = parseCpuCounters(*cpu);
    }
    if (const nlohmann::json* precpu = child(stats, "precpu_stats")) {
        raw.precpu = parseCpuCounters(*precpu);
    }

    // An unreported usage counts as 0 bytes; one that is not a byte count stays empty
    raw.memory_usage = 0;
    const nlohmann::json* memory = child(stats, "memory_stats");
    if (memory != nullptr && child(*memory, "usage") != nullptr) {
        raw.memory_usage = readCounter(*memory, "usage");
    }
    return raw;
}

std::string demultiplexLogs(const std::string& raw)
{
    // Frame header: stream type (0, 1 or 2), three zero bytes, big-endian payload size
    auto is_frame_header = [&raw](size_t pos) {
        if (pos + LOG_FRAME_HEADER_SIZE > raw.size()) {
            return false;
        }
        const auto stream_type = static_cast<unsigned char>(raw[pos]);
        return stream_type <= 2 && raw[pos + 1] == '\0' && raw[pos + 2] == '\0'
               && raw[pos + 3] == '\0';
    };

    if (!is_frame_header(0)) {
        return raw; // TTY containers write an unframed stream
    }

    std::string text;
    size_t pos = 0;
    while (is_frame_header(pos)) {
        uint32_t size = 0;
        for (size_t i = 4; i < LOG_FRAME_HEADER_SIZE; ++i) {
            size = (size << 8) | static_cast<unsigned char>(raw[pos + i]);
        }
        pos += LOG_FRAME_HEADER_SIZE;
        const size_t available = std::min<size_t>(size, raw.size() - pos);
        text.append(raw, pos, available);
        pos += available;
    }
    return text;
}

std::string errorMessage(const HttpResponse& response)
{
    auto body = nlohmann::json::parse(response.body, nullptr, false);
    if (!body.is_discarded()) {
        std::string message = readString(body, "message");
        if (!message.empty()) {
            return message;
        }
    }
    return "HTTP " + std::to_string(response.status);
}

} // namespace docker_api

} // namespace dock_dash
