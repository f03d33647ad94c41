#include <csignal>
#include <dock-dash/cache/stats_cache.hpp>
#include <dock-dash/core/error.hpp>
#include <dock-dash/core/logger.hpp>
#include <dock-dash/core/settings.hpp>
#include <dock-dash/runtime/docker_client.hpp>
#include <dock-dash/service/action_service.hpp>
#include <dock-dash/service/container_service.hpp>
#include <dock-dash/stream/snapshot_cache.hpp>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace dock_dash;

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void handleSignal(int)
{
    g_interrupted = 1;
}

void printUsage(const char* program)
{
    std::cerr << "Usage: " << program << " [--config FILE] <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  list [--no-metrics]          List containers with status and metrics\n"
              << "  metrics [NAME...]            CPU and memory for the named containers\n"
              << "  action NAME start|stop|restart\n"
              << "  logs NAME [TAIL]             Tail a container's logs\n"
              << "  inspect NAME                 Raw inspect document\n"
              << "  exec NAME                    Shell commands that open a session in NAME\n"
              << "  watch                        Print every snapshot broadcast until Ctrl-C\n";
}

std::string formatOptional(const std::optional<double>& value, int precision)
{
    if (!value) {
        return "-";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << *value;
    return oss.str();
}

void printTable(const std::vector<ContainerSummary>& containers)
{
    std::cout << std::left << std::setw(32) << "NAME" << std::setw(12) << "STATUS" << std::setw(8)
              << "CPU %" << std::setw(10) << "MEM MB" << "LINK\n";
    for (const auto& c : containers) {
        std::cout << std::left << std::setw(32) << c.name << std::setw(12) << c.status
                  << std::setw(8) << formatOptional(c.cpu, 1) << std::setw(10)
                  << formatOptional(c.mem_mb, 0) << c.link.value_or("") << "\n";
    }
    std::cout.flush();
}

// Renders each broadcast on the terminal
class ConsoleSubscriber : public Subscriber {
public:
    void send(const std::string& payload) override
    {
        auto message = nlohmann::json::parse(payload);
        std::vector<ContainerSummary> containers;
        for (const auto& row : message.at("containers")) {
            ContainerSummary summary;
            summary.name = row.at("name").get<std::string>();
            summary.status = row.at("status").get<std::string>();
            if (!row.at("link").is_null())
                summary.link = row.at("link").get<std::string>();
            if (!row.at("cpu").is_null())
                summary.cpu = row.at("cpu").get<double>();
            if (!row.at("mem_mb").is_null())
                summary.mem_mb = row.at("mem_mb").get<double>();
            containers.push_back(std::move(summary));
        }

        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "\n--- " << containers.size() << " containers ---\n";
        printTable(containers);
        if (!std::cout) {
            throw ContainerError(ErrorCode::SUBSCRIBER_SEND_FAILED, "standard output closed");
        }
    }

    std::string describe() const override
    {
        return "console";
    }

private:
    std::mutex mutex_;
};

int runWatch(SnapshotCache& cache)
{
    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    auto console = std::make_shared<ConsoleSubscriber>();
    cache.registerSubscriber(console);
    while (!g_interrupted) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    cache.unregisterSubscriber(console);
    return 0;
}

// Command output owns stdout; log lines go to stderr
void routeLogsToStderr()
{
    for (const char* name : {"runtime", "stats", "stream", "actions"}) {
        auto* logger = Logger::getInstance(name);
        logger->setConsoleSinkEnabled(false);
        logger->addSink([](const LogMessage& message) {
            std::cerr << "[" << toString(message.level) << "] " << message.logger_name << ": "
                      << message.message << std::endl;
        });
    }
}

int exitCodeFor(const ContainerError& e)
{
    switch (httpStatusFor(e.getErrorCode())) {
        case 400:
            return 2;
        case 404:
            return 3;
        case 503:
            return 4;
        default:
            return 1;
    }
}

} // namespace

int main(int argc, char* argv[])
{
    std::vector<std::string> args(argv + 1, argv + argc);

    std::string config_file;
    if (args.size() >= 2 && args[0] == "--config") {
        config_file = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }
    if (args.empty() || args[0] == "--help" || args[0] == "-h") {
        printUsage(argv[0]);
        return args.empty() ? 2 : 0;
    }

    try {
        const auto settings = DashboardSettings::load(config_file);
        Logger::setGlobalLevel(settings.log_level);
        routeLogsToStderr();

        DockerClient client(settings.socketPath());
        if (!client.ping()) {
            throw ContainerError(ErrorCode::RUNTIME_UNAVAILABLE,
                                 "Docker daemon not reachable at " + settings.socketPath());
        }
        StatsCache stats(client);
        ContainerService containers(client, stats, settings);
        ActionService actions(client, settings.actionDelay());
        SnapshotCache cache(containers, settings.refreshInterval());

        const std::string& command = args[0];
        if (command == "list") {
            const bool include_metrics = !(args.size() > 1 && args[1] == "--no-metrics");
            printTable(include_metrics ? cache.getSnapshot()
                                       : containers.listContainerSummaries(false));
        }
        else if (command == "metrics") {
            std::vector<std::string> names(args.begin() + 1, args.end());
            nlohmann::json metrics = containers.getContainersMetrics(names);
            std::cout << metrics.dump(2) << std::endl;
        }
        else if (command == "action" && args.size() == 3) {
            actions.performAction(args[1], args[2]);
            cache.poke();
            std::cout << nlohmann::json{{"ok", true}}.dump() << std::endl;
        }
        else if (command == "logs" && args.size() >= 2) {
            int tail = settings.log_default_tail;
            if (args.size() > 2) {
                try {
                    tail = std::stoi(args[2]);
                }
                catch (const std::logic_error&) {
                    std::cerr << "Invalid tail: " << args[2] << std::endl;
                    return 2;
                }
            }
            std::cout << containers.getContainerLogs(args[1], tail);
            std::cout.flush();
        }
        else if (command == "inspect" && args.size() == 2) {
            std::cout << containers.getContainerInspect(args[1]) << std::endl;
        }
        else if (command == "exec" && args.size() == 2) {
            for (const auto& exec : containers.buildExecCommands(args[1])) {
                std::cout << exec.command << std::endl;
            }
        }
        else if (command == "watch") {
            return runWatch(cache);
        }
        else {
            printUsage(argv[0]);
            return 2;
        }
    }
    catch (const ContainerError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return exitCodeFor(e);
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
