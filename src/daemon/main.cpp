/**
 * @file main.cpp
 * @brief tiersyncd - mirror a local folder into the renter's staging tier
 *
 * Operations:
 * - Upload every file under the folder that the store does not hold yet
 * - Watch the folder and upload, re-upload or delete as files change
 * - Rename staging directories into production once fully repaired
 *
 * Runs until SIGINT or SIGTERM, then shuts the folder down and prints the
 * session statistics.
 */

#include "tiersync/core/config.hpp"
#include "tiersync/events/components.hpp"
#include "tiersync/events/event_bus.hpp"
#include "tiersync/remote/renter_client.hpp"
#include "tiersync/sync/sync_folder.hpp"
#include "tiersync/watch/inotify_watcher.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <iostream>

namespace asio = boost::asio;

using tiersync::events::EventBus;
using tiersync::events::LoggerComponent;
using tiersync::events::MetricsComponent;

namespace {

constexpr int kExitRuntimeError = 1;
constexpr int kExitConfigError = 2;

int exit_code_for(const tiersync::Error& error) {
    return error.kind == tiersync::ErrorKind::Config ? kExitConfigError : kExitRuntimeError;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    auto command_line = tiersync::parse_command_line(argc, argv);
    if (command_line.is_error()) {
        spdlog::error("{}", command_line.error().message);
        std::cerr << tiersync::usage();
        return kExitConfigError;
    }
    if (command_line.value().show_help) {
        std::cout << tiersync::usage();
        return 0;
    }

    const auto& config = command_line.value().config;
    auto valid = config.validate();
    if (valid.is_error()) {
        spdlog::error("{}", valid.error().message);
        std::cerr << tiersync::usage();
        return kExitConfigError;
    }
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    spdlog::info("════════════════════════════════════════════");
    spdlog::info("tiersyncd");
    spdlog::info("  root:        {}", config.root.string());
    spdlog::info("  api:         {}", config.api_address);
    spdlog::info("  staging:     {}", config.staging_prefix);
    spdlog::info("  production:  {}", config.production_prefix);
    spdlog::info("  fingerprint: {}", tiersync::to_string(config.fingerprint));
    if (config.dry_run) {
        spdlog::info("  dry run: no remote changes will be made");
    }
    if (config.archive) {
        spdlog::info("  archive mode: old remote copies are kept");
    }
    spdlog::info("════════════════════════════════════════════");

    EventBus bus;
    LoggerComponent logger(bus);
    MetricsComponent metrics(bus);

    tiersync::remote::RenterClient::Options options;
    options.address = config.api_address;
    options.password = config.api_password;
    options.user_agent = config.user_agent;
    options.timeout = config.remote_timeout;

    auto client = tiersync::remote::RenterClient::create(options);
    if (client.is_error()) {
        spdlog::error("Failed to create renter client: {}", client.error().message);
        return exit_code_for(client.error());
    }

    auto watcher = tiersync::watch::InotifyWatcher::create();
    if (watcher.is_error()) {
        spdlog::error("Failed to start watcher: {}", watcher.error().message);
        return kExitRuntimeError;
    }

    auto folder = tiersync::sync::SyncFolder::open(
        config, *client.value(), std::move(watcher.value()), bus);
    if (folder.is_error()) {
        spdlog::error("Startup failed ({}): {}",
            tiersync::to_string(folder.error().kind), folder.error().message);
        return exit_code_for(folder.error());
    }

    // Block until SIGINT/SIGTERM
    asio::io_context io_context;
    asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& ec, int signal_number) {
        if (!ec) {
            spdlog::info("Caught signal {}, exiting...", signal_number);
        }
    });
    io_context.run();

    folder.value()->close();
    metrics.print_stats();
    spdlog::info("Done");
    return 0;
}
