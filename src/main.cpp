#include <getopt.h>
#include <chrono>
#include <cstdlib>
#include <dtop/core/config.hpp>
#include <dtop/core/error.hpp>
#include <dtop/core/event.hpp>
#include <dtop/core/logger.hpp>
#include <dtop/core/task.hpp>
#include <dtop/docker/curl.hpp>
#include <dtop/docker/http_docker_client.hpp>
#include <dtop/engine/app_state.hpp>
#include <dtop/engine/event_loop.hpp>
#include <dtop/engine/host_connector.hpp>
#include <dtop/ui/keyboard.hpp>
#include <dtop/ui/screen.hpp>
#include <dtop/ui/terminal_ui.hpp>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

constexpr std::chrono::milliseconds SHUTDOWN_GRACE{3000};

struct CommandLine {
    std::vector<std::string> hosts;
    std::optional<std::filesystem::path> config_file;
    std::optional<std::filesystem::path> log_file;
    std::optional<std::string> log_level;
    bool help = false;
};

void printUsage(const char* program)
{
    std::cout << "Usage: " << program << " [options]\n"
              << "\n"
              << "Options:\n"
              << "  -H, --host SPEC       Docker host to monitor (repeatable)\n"
              << "                        local | unix:///path | ssh://[user@]host[:port] |\n"
              << "                        tcp://host:port | tls://host:port\n"
              << "  -c, --config FILE     Configuration file (default: " << dtop::defaultConfigPath().string()
              << ")\n"
              << "      --log-file FILE   Diagnostic log file (default: " << dtop::defaultLogPath().string()
              << ")\n"
              << "      --log-level LEVEL trace, debug, info, warning, error or critical\n"
              << "  -h, --help            Show this help\n";
}

CommandLine parseCommandLine(int argc, char* argv[])
{
    enum { OPT_LOG_FILE = 256, OPT_LOG_LEVEL };
    static const option long_options[] = {
        {"host", required_argument, nullptr, 'H'},
        {"config", required_argument, nullptr, 'c'},
        {"log-file", required_argument, nullptr, OPT_LOG_FILE},
        {"log-level", required_argument, nullptr, OPT_LOG_LEVEL},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    CommandLine cmd;
    int opt;
    while ((opt = getopt_long(argc, argv, "H:c:h", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'H':
                cmd.hosts.emplace_back(optarg);
                break;
            case 'c':
                cmd.config_file = optarg;
                break;
            case OPT_LOG_FILE:
                cmd.log_file = optarg;
                break;
            case OPT_LOG_LEVEL:
                cmd.log_level = optarg;
                break;
            case 'h':
                cmd.help = true;
                break;
            default:
                throw dtop::DtopError(dtop::ErrorCode::CONFIG_INVALID, "Unknown option, see --help");
        }
    }
    if (optind < argc) {
        throw dtop::DtopError(dtop::ErrorCode::CONFIG_INVALID,
                              std::string("Unexpected argument: ") + argv[optind]);
    }
    return cmd;
}

dtop::Settings loadSettings(const CommandLine& cmd)
{
    dtop::ConfigManager file_config;
    if (cmd.config_file) {
        file_config.loadFromJsonFile(*cmd.config_file);
    }
    else if (std::filesystem::exists(dtop::defaultConfigPath())) {
        file_config.loadFromJsonFile(dtop::defaultConfigPath());
    }

    dtop::ConfigManager overrides;
    if (const char* env_level = std::getenv("DTOP_LOG")) {
        overrides.set<std::string>("log.level", env_level);
    }
    if (cmd.log_level) {
        overrides.set<std::string>("log.level", *cmd.log_level);
    }
    if (cmd.log_file) {
        overrides.set<std::string>("log.file", cmd.log_file->string());
    }
    if (!cmd.hosts.empty()) {
        std::vector<dtop::HostEntry> hosts;
        for (const auto& spec : cmd.hosts) {
            hosts.push_back(dtop::HostEntry{spec, std::nullopt});
        }
        overrides.setHosts(std::move(hosts));
    }

    dtop::ConfigManager config;
    config.addLayer("file", file_config);
    config.addLayer("overrides", overrides);
    return dtop::Settings::fromConfig(config.expandEnvironmentVariables());
}

void setupLogging(const dtop::Settings& settings)
{
    auto* logger = dtop::Logger::getInstance();
    logger->setLevel(dtop::logLevelFromString(settings.log_level));
    logger->setFileSink(settings.log_file);
    // The terminal belongs to the dashboard
    logger->setConsoleSinkEnabled(false);
}

int runDashboard(const dtop::Settings& settings)
{
    auto* logger = dtop::Logger::getInstance();
    auto [sender, receiver] = dtop::makeEventChannel(settings.channel_capacity);

    dtop::docker::ClientOptions client_options;
    client_options.cert_path = settings.docker_cert_path;

    dtop::engine::HostConnector connector(
        settings.hosts, sender,
        [client_options](const dtop::docker::HostSpec& spec) {
            return dtop::docker::makeDockerClient(spec, client_options);
        },
        settings.ping_timeout);
    connector.start();

    std::cerr << "Connecting to " << settings.hosts.size() << " host(s)..." << std::endl;
    dtop::HostId first = connector.waitForFirst(settings.startup_timeout);
    logger->info("First host connected: {}", first);

    dtop::ui::Screen screen;
    dtop::engine::RuntimeServices services(sender, settings.log_batch_size);

    dtop::engine::AppOptions options;
    options.log_batch_size = settings.log_batch_size;
    options.ssh_session = dtop::engine::detectSshSession();
    dtop::engine::AppState state(services, options);

    dtop::ui::KeyboardReader keyboard(screen, sender);
    dtop::ui::TerminalUi ui(screen, sender, &keyboard);
    keyboard.start();

    dtop::engine::EventLoop loop(receiver, state, ui, settings.tick);
    loop.run();

    // Unblock producers waiting on a full channel before joining the reader
    receiver.close();
    keyboard.stop();
    screen.restore();
    return 0;
}

// Background tasks log through the static logger, so they must be gone before static teardown
int finish(int status)
{
    if (!dtop::Task::waitForAll(SHUTDOWN_GRACE)) {
        auto* logger = dtop::Logger::getInstance();
        logger->warning("{} background task(s) still running at exit", dtop::Task::runningCount());
        logger->flush();
        std::quick_exit(status);
    }
    return status;
}

int reportFailure(const dtop::DtopError& e)
{
    dtop::Logger::getInstance()->critical("{}", e.what());
    std::cerr << "dtop: " << e.what() << std::endl;
    return 1;
}

} // namespace

int main(int argc, char* argv[])
{
    try {
        CommandLine cmd = parseCommandLine(argc, argv);
        if (cmd.help) {
            printUsage(argv[0]);
            return 0;
        }

        dtop::Settings settings = loadSettings(cmd);
        setupLogging(settings);
        dtop::Logger::getInstance()->info("dtop starting with {} host(s)", settings.hosts.size());

        // Background tasks use curl, so they finish while it is still initialised
        dtop::docker::CurlGlobal curl_global;
        try {
            return finish(runDashboard(settings));
        }
        catch (const dtop::DtopError& e) {
            return finish(reportFailure(e));
        }
    }
    catch (const dtop::DtopError& e) {
        return reportFailure(e);
    }
}
