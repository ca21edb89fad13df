#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <geoserve/core/status.h>
#include <geoserve/update/scheduler.h>

namespace geoserve::server
{
    struct ServerConfig
    {
        std::string bind{"0.0.0.0:80"};
        std::string data_dir{"/data"};

        std::string source_url{update::kDefaultSourceUrl};
        std::uint64_t update_interval_sec{86400};
        std::uint64_t download_timeout_sec{300};
        std::size_t retain_count{3};

        std::uint64_t min_file_size{1024 * 1024};
        double min_size_ratio{0.5};

        std::uint32_t bootstrap_attempts{5};
        std::uint64_t bootstrap_backoff_ms{2000};
        std::uint64_t bootstrap_backoff_max_ms{60000};

        std::string language{"en"};
        std::vector<std::string> allowed_hosts{"localhost", "127.0.0.1"};
        // Empty disables the API key check.
        std::string api_key{};

        std::string log_path{};
        std::string log_level{"info"};

        std::size_t max_connections{100};
    };

    struct BindAddress
    {
        std::string host;
        std::uint16_t port{0};
    };

    // "host:port", "[v6]:port" or ":port".
    Result<BindAddress> ParseBindAddress(std::string_view text);

    // Comma separated, trimmed, lower-cased; empty items dropped.
    std::vector<std::string> SplitHostList(std::string_view text);

    Status ApplyConfigValue(ServerConfig *cfg, std::string_view key, std::string_view value);

    // `key: value` lines, '#' comments, optionally quoted values. Applied on
    // top of whatever `cfg` already holds.
    Status LoadConfigFile(const std::string &path, ServerConfig *cfg);

    using EnvLookup = std::function<std::optional<std::string>(const char *name)>;

    // ALLOWED_HOSTS, API_KEY and GEOSERVE_LOG_LEVEL.
    void ApplyEnvOverrides(ServerConfig *cfg, const EnvLookup &env);
    std::optional<std::string> ProcessEnv(const char *name);

    Status ValidateConfig(const ServerConfig &cfg);

    struct CommandLine
    {
        std::optional<std::string> config_path;
        std::optional<std::string> bind;
        std::optional<std::string> data_dir;
        std::optional<std::string> log_level;
        bool help{false};
    };

    Result<CommandLine> ParseCommandLine(int argc, const char *const *argv);
    void ApplyCommandLine(ServerConfig *cfg, const CommandLine &cl);
    std::string UsageText(std::string_view argv0);

    update::SchedulerOptions MakeSchedulerOptions(const ServerConfig &cfg);
} // namespace geoserve::server
