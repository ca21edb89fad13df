#include <geoserve/db/active_slot.h>
#include <geoserve/server/config.h>
#include <geoserve/server/http_server.h>
#include <geoserve/server/router.h>
#include <geoserve/service/lookup_service.h>
#include <geoserve/update/fetcher.h>
#include <geoserve/update/scheduler.h>
#include <geoserve/util/logger.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

// Signal handling follows the usual pattern: the handler only flips an
// atomic flag, and the main thread notices it and shuts components down.

using namespace std::chrono_literals;

static std::atomic_bool g_terminate{false};

static void SignalHandler(int /*signum*/)
{
    g_terminate.store(true);
}

static void InstallSignalHandlers()
{
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = SignalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;

    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    // Ignore SIGPIPE so a vanished client cannot kill the process.
    std::signal(SIGPIPE, SIG_IGN);
}

int main(int argc, char **argv)
{
    namespace gs = geoserve;

    auto cl = gs::server::ParseCommandLine(argc, argv);
    if (!cl.ok())
    {
        std::cerr << cl.status().msg << "\n"
                  << gs::server::UsageText(argv[0]);
        return 2;
    }
    if (cl.value().help)
    {
        std::cout << gs::server::UsageText(argv[0]);
        return 0;
    }

    gs::server::ServerConfig cfg;
    if (cl.value().config_path)
    {
        gs::Status st = gs::server::LoadConfigFile(*cl.value().config_path, &cfg);
        if (!st.ok())
        {
            std::cerr << "[fatal] " << st.ToString() << "\n";
            return 2;
        }
    }
    gs::server::ApplyEnvOverrides(&cfg, gs::server::ProcessEnv);
    gs::server::ApplyCommandLine(&cfg, cl.value());

    gs::Status st = gs::server::ValidateConfig(cfg);
    if (!st.ok())
    {
        std::cerr << "[fatal] invalid configuration: " << st.msg << "\n";
        return 2;
    }
    auto bind = gs::server::ParseBindAddress(cfg.bind);

    gs::Logger logger;
    if (!cfg.log_path.empty())
        logger.SetFile(cfg.log_path);
    logger.SetLevel(gs::ParseLogLevel(cfg.log_level).value_or(gs::LogLevel::info));

    InstallSignalHandlers();

    std::cout << R"(
   __ _  ___  ___  ___  ___ _ ____   _____
  / _` |/ _ \/ _ \/ __|/ _ \ '__\ \ / / _ \
 | (_| |  __/ (_) \__ \  __/ |   \ V /  __/
  \__, |\___|\___/|___/\___|_|    \_/ \___|
  |___/
 :: IP geolocation lookup service ::
)" << std::endl;

    logger.Info("server.init", "starting geoserve bind=" + cfg.bind + " data_dir=" + cfg.data_dir);

    gs::db::ActiveSlot slot;

    gs::update::CurlFetcherOptions fetch_opt;
    fetch_opt.timeout_ms = static_cast<long>(cfg.download_timeout_sec * 1000);
    gs::update::UpdateScheduler scheduler(gs::server::MakeSchedulerOptions(cfg),
                                          cfg.data_dir,
                                          &slot,
                                          std::make_unique<gs::update::CurlFetcher>(fetch_opt),
                                          &logger);

    // Bootstrap can spend minutes in download retries, so it runs off the
    // main thread and a signal cancels it.
    std::atomic_bool boot_done{false};
    gs::Status boot_status;
    std::thread boot_thread([&]()
                            {
        boot_status = scheduler.Bootstrap();
        boot_done.store(true); });

    while (!boot_done.load() && !g_terminate.load())
        std::this_thread::sleep_for(200ms);
    if (!boot_done.load())
        scheduler.Stop();
    boot_thread.join();

    if (g_terminate.load())
    {
        logger.Info("server.shutdown", "interrupted during bootstrap");
        return 0;
    }
    if (!boot_status.ok())
    {
        logger.Error("bootstrap.fatal", "no database available: " + boot_status.ToString());
        return 1;
    }

    gs::service::LookupService lookup(&slot, cfg.language, &logger);
    gs::server::AccessPolicy policy{cfg.allowed_hosts, cfg.api_key};
    gs::server::Router router(&lookup, policy, &logger);
    gs::server::HttpServer server(bind.value(), cfg.max_connections, &router, &logger);

    st = server.Listen();
    if (!st.ok())
    {
        logger.Error("server.listen", st.ToString());
        return 1;
    }

    scheduler.Start();
    std::thread server_thread([&server]()
                              { server.Run(); });

    while (!g_terminate.load())
        std::this_thread::sleep_for(200ms);

    logger.Info("server.shutdown", "shutdown signal received, stopping");
    server.Stop();
    if (server_thread.joinable())
        server_thread.join();
    scheduler.Stop();

    logger.Info("server.shutdown", "stopped");
    return 0;
}
