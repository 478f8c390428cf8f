#include "proxypool/core/config.hpp"
#include "proxypool/core/logging.hpp"
#include "proxypool/dispatch/dispatcher.hpp"
#include "proxypool/probe/key_prober.hpp"
#include "proxypool/rotation/credential_rotator.hpp"
#include "proxypool/server/proxy_server.hpp"
#include "proxypool/upstream/http_upstream_client.hpp"

#include <spdlog/spdlog.h>

#include <pthread.h>
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <iostream>
#include <thread>

using namespace proxypool;

namespace {

sigset_t shutdown_signals() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    return set;
}

core::Result<core::Config, core::Error> load_config(int argc, char* argv[]) {
    core::fs::path path;
    if (argc > 1) {
        path = argv[1];
    } else if (const char* env = std::getenv("PROXYPOOL_CONFIG")) {
        path = core::expand_path(env);
    } else {
        path = core::Config::default_path();
    }

    std::error_code ec;
    if (!core::fs::exists(path, ec)) {
        if (argc > 1) {
            return core::Result<core::Config, core::Error>::err(
                core::ErrorCode::ConfigNotFound, "Configuration file not found", path.string());
        }
        return core::Config::from_environment();
    }
    return core::Config::load(path);
}

}  // namespace

int main(int argc, char* argv[]) {
    // Block shutdown signals in every thread; a dedicated waiter handles them
    sigset_t signals = shutdown_signals();
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    auto config_result = load_config(argc, argv);
    if (config_result.is_err()) {
        std::cerr << "proxypool: " << config_result.error().to_string() << std::endl;
        return 1;
    }
    core::Config config = std::move(config_result).value();

    auto logging = core::init_logging(config.observability);
    if (logging.is_err()) {
        std::cerr << "proxypool: " << logging.error().to_string() << std::endl;
        return 1;
    }

    auto rotator_result = rotation::CredentialModelRotator::create(config.upstream.api_keys,
                                                                   config.upstream.models);
    if (rotator_result.is_err()) {
        spdlog::critical("{}", rotator_result.error().to_string());
        return 1;
    }
    auto rotator = std::move(rotator_result).value();

    std::shared_ptr<probe::KeyProber> prober;
    if (config.probe.enabled) {
        prober = std::make_shared<probe::KeyProber>(config.probe,
                                                    probe::KeyProber::http_transport(config.upstream));
        auto report = probe::run_probe(*prober, *rotator, config.probe);
        if (report.is_err()) {
            spdlog::error("Credential probe failed: {}", report.error().to_string());
        }
    }

    dispatch::Dispatcher dispatcher(*rotator,
                                    upstream::HttpUpstreamClient::factory(config.upstream),
                                    dispatch::DispatcherOptions::from_config(config.upstream));

    server::ProxyServer proxy(config, *rotator, dispatcher, prober);

    std::atomic<bool> exiting{false};
    std::thread signal_waiter([&proxy, &exiting, signals]() {
        int signum = 0;
        sigwait(&signals, &signum);
        if (!exiting) {
            spdlog::info("Received signal {}", signum);
            proxy.stop();
        }
    });

    auto started = proxy.start();

    // Wake the waiter if the server stopped on its own
    exiting = true;
    pthread_kill(signal_waiter.native_handle(), SIGTERM);
    signal_waiter.join();

    if (started.is_err()) {
        spdlog::critical("{}", started.error().to_string());
        return 1;
    }

    spdlog::info("Stopped");
    return 0;
}
