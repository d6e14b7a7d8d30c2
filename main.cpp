// Engine
#include "sync/Engine.hpp"
#include "sync/EventBus.hpp"

// Protocols
#include "protocols/Error.hpp"
#include "protocols/FTPClient.hpp"

// Misc
#include "config/Config.hpp"
#include "log/Registry.hpp"

// Libraries
#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>
#include <thread>

using namespace ferry::config;
using namespace ferry::sync;
using namespace ferry::sync::model;
using ferry::log::Registry;

namespace {
std::atomic shouldExit = false;
std::atomic reopenLogs = false;

void signalHandler(const int signum) {
    if (signum == SIGHUP) reopenLogs = true;
    else shouldExit = true;
}

constexpr auto DEFAULT_CONFIG_PATH = "/etc/ferry/config.yaml";

void usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [--once | --test-ftp] [config.yaml]\n"
              << "  --once      run a single pass, then exit\n"
              << "  --test-ftp  connect to the configured FTP server, list its root and exit\n"
              << "  default config: " << DEFAULT_CONFIG_PATH << "\n";
}

int testFtp(const Config& cfg) {
    try {
        ferry::protocols::FTPClient client(cfg.ftp, {});
        const auto entries = client.testConnection();
        std::cout << "[✓] Connected to " << cfg.ftp.host << ":" << cfg.ftp.port << ", "
                  << entries.size() << " entries in the remote root\n";
        for (const auto& e : entries) std::cout << "    " << e << "\n";
        return EXIT_SUCCESS;
    } catch (const ferry::protocols::TransferError& e) {
        std::cerr << "[-] FTP connection test failed: " << e.what() << ". " << ferry::protocols::hint(e.kind()) << "\n";
        return EXIT_FAILURE;
    }
}
}

int main(const int argc, char** argv) {
    std::string configPath = DEFAULT_CONFIG_PATH;
    bool once = false;
    bool ftpCheck = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--once") == 0) once = true;
        else if (std::strcmp(argv[i], "--test-ftp") == 0) ftpCheck = true;
        else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            usage(argv[0]);
            return EXIT_SUCCESS;
        } else configPath = argv[i];
    }

    Config cfg;
    try {
        cfg = loadConfig(configPath);
        if (once) cfg.upload.mode = RunMode::Once;
        Registry::init(cfg.paths.log_dir, cfg.logging);
    } catch (const std::exception& e) {
        std::cerr << "[-] Failed to initialize Ferry: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    if (ftpCheck) {
        const auto rc = testFtp(cfg);
        Registry::shutdown();
        return rc;
    }

    int rc = EXIT_SUCCESS;
    try {
        Registry::ferry()->info("[*] Starting Ferry with {}", configPath);

        // Engine and bus go away before the log registry does.
        {
            EventBus bus;
            bus.on<UploadError>([](const UploadError& e) {
                Registry::ferry()->error("[-] {}: {}", e.file, e.message);
            });
            bus.on<DiskWarning>([](const DiskWarning& w) {
                Registry::ferry()->warn("[!] Free disk space below {}%", w.threshold);
            });

            Engine engine(cfg, bus);
            engine.start();

            std::signal(SIGINT, signalHandler);
            std::signal(SIGTERM, signalHandler);
            std::signal(SIGHUP, signalHandler);

            Registry::ferry()->info("[✓] Ferry started ({} mode).", to_string(cfg.upload.mode));

            while (!shouldExit && !engine.wait(std::chrono::seconds(1))) {
                if (reopenLogs.exchange(false)) {
                    Registry::reopenMainLog();
                    Registry::ferry()->info("[*] Log file reopened.");
                }
            }

            if (shouldExit) {
                Registry::ferry()->info("[!] Signal received. Shutting down gracefully...");
                engine.stop(true);
            } else {
                engine.stop();
            }

            const auto s = engine.stats();
            Registry::ferry()->info("[✓] Ferry shut down cleanly ({} uploaded, {} skipped, {} failed).",
                                    s.uploaded, s.skipped, s.failed);
            if (s.failed > 0) rc = EXIT_FAILURE;
        }
    } catch (const std::exception& e) {
        Registry::ferry()->error("[-] Ferry failed: {}", e.what());
        rc = EXIT_FAILURE;
    }

    Registry::shutdown();
    return rc;
}
