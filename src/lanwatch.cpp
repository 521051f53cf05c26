#include <lanwatch/orchestrator.hpp>
#include <lanwatch/report.hpp>
#include <lanwatch/sysinfo.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <chrono>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <limits>

CancelRelay g_relay;

static void signal_handler(int) {
    g_relay.deliver();
}

void init_signal_handler() {
    struct sigaction handler_info{};
    handler_info.sa_handler = signal_handler;
    if (sigemptyset(&handler_info.sa_mask) != 0) {
        spdlog::error("error setting up signal handler: {}", strerror(errno));
        std::exit(1);
    }
    handler_info.sa_flags = 0;
    if (sigaction(SIGINT, &handler_info, nullptr) != 0) {
        spdlog::error("error setting up signal handler: {}", strerror(errno));
        std::exit(1);
    }
}

static Collaborators system_collaborators(const Config& config) {
    Collaborators ret;
    ret.privilege_gate = is_elevated;
    if (config.ifconfig_file.empty()) {
        ret.config_text = interface_config_text;
    } else {
        ret.config_text = [path = config.ifconfig_file] { return read_text_file(path); };
    }
    ret.prober = std::make_unique<PcapProber>(config);
    ret.lookup = std::make_shared<DnsLookup>();
    if (config.ble) {
        ret.ble = std::make_unique<HciBleScanner>(config);
    }
    return ret;
}

static int scan(const Config& config) {
    ScanOrchestrator orchestrator{config, system_collaborators(config)};
    if (!g_relay.attach(orchestrator)) {
        std::fputs("\n[!] Scan interrupted by user.\n", stdout);
        return 130;
    }
    auto outcome = orchestrator.run_scan();
    g_relay.detach();
    if (!orchestrator.wait_for_lookups(std::chrono::seconds(1))) {
        spdlog::debug("exiting with hostname lookups still running");
    }

    if (auto failure = std::get_if<ScanFailure>(&outcome)) {
        if (failure->error == ScanError::cancelled) {
            std::fputs("\n[!] Scan interrupted by user.\n", stdout);
            return 130;
        }
        std::fprintf(stderr, "[ERROR] %s\n", failure->reason.c_str());
        if (failure->error == ScanError::not_elevated) {
            std::fputs("[INFO] Re-run lanwatch as root.\n", stderr);
        }
        return 1;
    }

    const auto& snapshot = std::get<ResultSnapshot>(outcome);
    std::fputs(render_report(snapshot).c_str(), stdout);
    std::fflush(stdout);
    return 0;
}

int lanwatch(int argc, const char* const* argv) {
    Config config;
    std::string log_level{"info"};
    std::string log_file;
    bool no_ble = false;

    CLI::App app("LAN Watch: discover wired, Wi-Fi and Bluetooth LE devices nearby");
    app.add_option("-l,--log-level", log_level, "Logging level: trace, debug, info, warning, error, off")->capture_default_str();
    app.add_option("--log-file", log_file, "File to write logs to (stderr if not specified)");
    app.add_option("-i,--interface", config.iface, "Interface to probe from (defaults to the one inside the detected range)");
    app.add_option("--ifconfig-file", config.ifconfig_file, "Read interface configuration text (ipconfig or `ip addr` output) from a file")->check(CLI::ExistingFile);
    app.add_option("-r,--range", config.range, "Network range to probe in CIDR notation, skips range detection");
    app.add_option("--probe-timeout", config.probe_timeout, "Seconds to wait for ARP replies")->capture_default_str()->check(CLI::PositiveNumber);
    app.add_option("--lookup-timeout", config.lookup_timeout, "Seconds allowed for each reverse hostname lookup")->capture_default_str()->check(CLI::PositiveNumber);
    app.add_option("--lookup-workers", config.lookup_workers, "Maximum number of concurrent hostname lookups")->capture_default_str()->check(CLI::Range(1, 1024));
    app.add_option("--ble-timeout", config.ble_timeout, "Seconds to listen for Bluetooth LE advertisements")->capture_default_str()->check(CLI::PositiveNumber);
    app.add_option("--hci", config.hci_dev, "Bluetooth adapter index (first available if not specified)")->check(CLI::Range(0, std::numeric_limits<int>::max()));
    app.add_flag("--no-ble", no_ble, "Skip the Bluetooth LE scan");
    app.add_flag("--sequential", config.sequential, "Run the Bluetooth LE scan after the network scan instead of alongside it");

    CLI11_PARSE(app, argc, argv);

    config.ble = !no_ble;

    spdlog::init_thread_pool(8192, 1);
    auto lvl = spdlog::level::info;
    if (log_level == "trace") {
        lvl = spdlog::level::trace;
    } else if (log_level == "debug") {
        lvl = spdlog::level::debug;
    } else if (log_level == "info") {
        lvl = spdlog::level::info;
    } else if (log_level == "warning") {
        lvl = spdlog::level::warn;
    } else if (log_level == "error") {
        lvl = spdlog::level::err;
    } else if (log_level == "off") {
        lvl = spdlog::level::off;
    }
    if (app.count("--log-file") > 0) {
        auto logger = spdlog::create_async<spdlog::sinks::basic_file_sink_mt>("logfile", log_file);
        logger->set_level(lvl);
        spdlog::set_default_logger(std::move(logger));
    } else {
        auto logger = spdlog::create_async<spdlog::sinks::stderr_color_sink_mt>("console");
        logger->set_level(lvl);
        spdlog::set_default_logger(std::move(logger));
    }

    init_signal_handler();
    auto rc = scan(config);
    spdlog::shutdown();
    return rc;
}

int main(int argc, char** argv) {
    try {
        return lanwatch(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
    }
    return 1;
}
