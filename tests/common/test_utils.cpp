#include "common/test_utils.h"

#include <zlib.h>

#include <algorithm>
#include <atomic>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace geoserve::test
{
    namespace
    {
        std::atomic<std::uint64_t> g_temp_counter{0};
    }

    TempDir::TempDir()
    {
        auto base = std::filesystem::temp_directory_path();
        std::ostringstream ss;
        ss << "geoserve_test_" << std::this_thread::get_id() << "_" << g_temp_counter.fetch_add(1);
        path_ = base / ss.str();
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    TempDir::~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    void WriteFile(const std::string &path, const std::vector<std::uint8_t> &bytes)
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!out)
            throw std::runtime_error("write failed: " + path);
    }

    std::vector<std::uint8_t> ReadFile(const std::string &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    void WriteGzipFile(const std::string &path, const std::vector<std::uint8_t> &bytes)
    {
        gzFile f = gzopen(path.c_str(), "wb");
        if (f == nullptr)
            throw std::runtime_error("gzopen failed: " + path);
        const int n = gzwrite(f, bytes.data(), static_cast<unsigned>(bytes.size()));
        const int rc = gzclose(f);
        if (n != static_cast<int>(bytes.size()) || rc != Z_OK)
            throw std::runtime_error("gzwrite failed: " + path);
    }

    std::vector<std::string> ListDir(const std::string &dir)
    {
        std::vector<std::string> names;
        for (const auto &e : std::filesystem::directory_iterator(dir))
            names.push_back(e.path().filename().string());
        std::sort(names.begin(), names.end());
        return names;
    }
}
