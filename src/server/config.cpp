#include <geoserve/server/config.h>
#include <geoserve/util/logger.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <fstream>

namespace geoserve::server
{
    static std::string Trim(std::string_view s)
    {
        std::size_t a = 0;
        while (a < s.size() && (s[a] == ' ' || s[a] == '\t'))
            ++a;
        std::size_t b = s.size();
        while (b > a && (s[b - 1] == ' ' || s[b - 1] == '\t' || s[b - 1] == '\r'))
            --b;
        return std::string(s.substr(a, b - a));
    }

    static std::string Lower(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    template <typename T>
    static Status ParseUnsigned(std::string_view key, std::string_view val, T *out)
    {
        T v{};
        auto [ptr, ec] = std::from_chars(val.data(), val.data() + val.size(), v);
        if (ec != std::errc() || ptr != val.data() + val.size() || val.empty())
            return Status::Invalid(std::string(key) + ": expected an unsigned integer, got '" + std::string(val) + "'");
        *out = v;
        return Status::Ok();
    }

    static Status ParseDouble(std::string_view key, std::string_view val, double *out)
    {
        double v = 0.0;
        auto [ptr, ec] = std::from_chars(val.data(), val.data() + val.size(), v);
        if (ec != std::errc() || ptr != val.data() + val.size() || val.empty())
            return Status::Invalid(std::string(key) + ": expected a number, got '" + std::string(val) + "'");
        *out = v;
        return Status::Ok();
    }

    Result<BindAddress> ParseBindAddress(std::string_view text)
    {
        BindAddress out;
        std::string_view port_text;

        if (!text.empty() && text.front() == '[')
        {
            auto close = text.find(']');
            if (close == std::string_view::npos || close + 1 >= text.size() || text[close + 1] != ':')
                return Status::Invalid("bad bind address: " + std::string(text));
            out.host = std::string(text.substr(1, close - 1));
            port_text = text.substr(close + 2);
        }
        else
        {
            auto colon = text.rfind(':');
            if (colon == std::string_view::npos)
                return Status::Invalid("bind address needs a port: " + std::string(text));
            out.host = std::string(text.substr(0, colon));
            port_text = text.substr(colon + 1);
            if (out.host.find(':') != std::string::npos)
                return Status::Invalid("IPv6 bind address must be bracketed: " + std::string(text));
        }

        if (out.host.empty())
            out.host = "0.0.0.0";

        std::uint32_t port = 0;
        Status st = ParseUnsigned("bind port", port_text, &port);
        if (!st.ok())
            return st;
        if (port == 0 || port > 65535)
            return Status::Invalid("bind port out of range: " + std::string(port_text));
        out.port = static_cast<std::uint16_t>(port);
        return out;
    }

    std::vector<std::string> SplitHostList(std::string_view text)
    {
        std::vector<std::string> out;
        std::size_t start = 0;
        while (start <= text.size())
        {
            auto comma = text.find(',', start);
            if (comma == std::string_view::npos)
                comma = text.size();
            std::string item = Lower(Trim(text.substr(start, comma - start)));
            if (!item.empty())
                out.push_back(std::move(item));
            start = comma + 1;
        }
        return out;
    }

    Status ApplyConfigValue(ServerConfig *cfg, std::string_view key, std::string_view val)
    {
        if (key == "bind")
            cfg->bind = std::string(val);
        else if (key == "data_dir")
            cfg->data_dir = std::string(val);
        else if (key == "source_url")
            cfg->source_url = std::string(val);
        else if (key == "update_interval_sec")
            return ParseUnsigned(key, val, &cfg->update_interval_sec);
        else if (key == "download_timeout_sec")
            return ParseUnsigned(key, val, &cfg->download_timeout_sec);
        else if (key == "retain_count")
            return ParseUnsigned(key, val, &cfg->retain_count);
        else if (key == "min_file_size")
            return ParseUnsigned(key, val, &cfg->min_file_size);
        else if (key == "min_size_ratio")
            return ParseDouble(key, val, &cfg->min_size_ratio);
        else if (key == "bootstrap_attempts")
            return ParseUnsigned(key, val, &cfg->bootstrap_attempts);
        else if (key == "bootstrap_backoff_ms")
            return ParseUnsigned(key, val, &cfg->bootstrap_backoff_ms);
        else if (key == "bootstrap_backoff_max_ms")
            return ParseUnsigned(key, val, &cfg->bootstrap_backoff_max_ms);
        else if (key == "language")
            cfg->language = std::string(val);
        else if (key == "allowed_hosts")
            cfg->allowed_hosts = SplitHostList(val);
        else if (key == "api_key")
            cfg->api_key = std::string(val);
        else if (key == "log_path")
            cfg->log_path = std::string(val);
        else if (key == "log_level")
            cfg->log_level = std::string(val);
        else if (key == "max_connections")
            return ParseUnsigned(key, val, &cfg->max_connections);
        else
            return Status::Invalid("unknown config key: " + std::string(key));
        return Status::Ok();
    }

    Status LoadConfigFile(const std::string &path, ServerConfig *cfg)
    {
        std::ifstream in(path);
        if (!in)
            return Status::NotFound("cannot open config file " + path);

        std::string line;
        std::size_t lineno = 0;
        while (std::getline(in, line))
        {
            ++lineno;
            line = Trim(line);
            if (line.empty() || line[0] == '#')
                continue;

            auto pos = line.find(':');
            if (pos == std::string::npos)
                return Status::Invalid(path + ":" + std::to_string(lineno) + ": expected 'key: value'");

            std::string key = Trim(std::string_view(line).substr(0, pos));
            std::string val = Trim(std::string_view(line).substr(pos + 1));

            if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
                val = val.substr(1, val.size() - 2);

            Status st = ApplyConfigValue(cfg, key, val);
            if (!st.ok())
                return Status::Invalid(path + ":" + std::to_string(lineno) + ": " + st.msg);
        }
        return Status::Ok();
    }

    std::optional<std::string> ProcessEnv(const char *name)
    {
        const char *v = std::getenv(name);
        if (v == nullptr)
            return std::nullopt;
        return std::string(v);
    }

    void ApplyEnvOverrides(ServerConfig *cfg, const EnvLookup &env)
    {
        if (auto v = env("ALLOWED_HOSTS"))
            cfg->allowed_hosts = SplitHostList(*v);
        if (auto v = env("API_KEY"))
            cfg->api_key = *v;
        if (auto v = env("GEOSERVE_LOG_LEVEL"))
            cfg->log_level = *v;
    }

    Status ValidateConfig(const ServerConfig &cfg)
    {
        auto bind = ParseBindAddress(cfg.bind);
        if (!bind.ok())
            return bind.status();
        if (cfg.data_dir.empty())
            return Status::Invalid("data_dir must not be empty");
        if (cfg.source_url.empty())
            return Status::Invalid("source_url must not be empty");
        if (cfg.update_interval_sec == 0)
            return Status::Invalid("update_interval_sec must be positive");
        if (cfg.download_timeout_sec == 0)
            return Status::Invalid("download_timeout_sec must be positive");
        if (cfg.retain_count < 1)
            return Status::Invalid("retain_count must be at least 1");
        if (!(cfg.min_size_ratio >= 0.0 && cfg.min_size_ratio <= 1.0))
            return Status::Invalid("min_size_ratio must be within [0, 1]");
        if (cfg.bootstrap_attempts < 1)
            return Status::Invalid("bootstrap_attempts must be at least 1");
        if (cfg.max_connections < 1)
            return Status::Invalid("max_connections must be at least 1");
        if (cfg.language.empty())
            return Status::Invalid("language must not be empty");
        if (!ParseLogLevel(cfg.log_level))
            return Status::Invalid("unknown log_level: " + cfg.log_level);
        return Status::Ok();
    }

    Result<CommandLine> ParseCommandLine(int argc, const char *const *argv)
    {
        CommandLine cl;
        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            auto next = [&](std::optional<std::string> *slot) -> Status
            {
                if (i + 1 >= argc)
                    return Status::Invalid(arg + " needs a value");
                *slot = argv[++i];
                return Status::Ok();
            };

            Status st;
            if (arg == "--help" || arg == "-h")
                cl.help = true;
            else if (arg == "--config" || arg == "-c")
                st = next(&cl.config_path);
            else if (arg == "--bind")
                st = next(&cl.bind);
            else if (arg == "--data-dir")
                st = next(&cl.data_dir);
            else if (arg == "--log-level")
                st = next(&cl.log_level);
            else
                st = Status::Invalid("unknown argument: " + arg);
            if (!st.ok())
                return st;
        }
        return cl;
    }

    void ApplyCommandLine(ServerConfig *cfg, const CommandLine &cl)
    {
        if (cl.bind)
            cfg->bind = *cl.bind;
        if (cl.data_dir)
            cfg->data_dir = *cl.data_dir;
        if (cl.log_level)
            cfg->log_level = *cl.log_level;
    }

    std::string UsageText(std::string_view argv0)
    {
        return "usage: " + std::string(argv0) +
               " [--config FILE] [--bind HOST:PORT] [--data-dir DIR] [--log-level LEVEL]\n"
               "\n"
               "  -c, --config FILE    key: value configuration file\n"
               "      --bind ADDR      listen address (default 0.0.0.0:80)\n"
               "      --data-dir DIR   database directory (default /data)\n"
               "      --log-level LVL  debug, info, warn or error\n"
               "  -h, --help           show this text\n"
               "\n"
               "environment: ALLOWED_HOSTS, API_KEY, GEOSERVE_LOG_LEVEL\n";
    }

    update::SchedulerOptions MakeSchedulerOptions(const ServerConfig &cfg)
    {
        update::SchedulerOptions opt;
        opt.source_url = cfg.source_url;
        opt.update_interval = std::chrono::seconds(cfg.update_interval_sec);
        opt.bootstrap_attempts = cfg.bootstrap_attempts;
        opt.bootstrap_backoff = std::chrono::milliseconds(cfg.bootstrap_backoff_ms);
        opt.bootstrap_backoff_max = std::chrono::milliseconds(cfg.bootstrap_backoff_max_ms);
        opt.retain_count = cfg.retain_count;
        opt.validator.min_file_size = cfg.min_file_size;
        opt.validator.min_size_ratio = cfg.min_size_ratio;
        return opt;
    }
} // namespace geoserve::server
