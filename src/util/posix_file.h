#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <geoserve/core/status.h>

namespace geoserve::util
{

    class PosixFile
    {
    public:
        PosixFile() = default;
        ~PosixFile();

        PosixFile(const PosixFile &) = delete;
        PosixFile &operator=(const PosixFile &) = delete;
        PosixFile(PosixFile &&other) noexcept;
        PosixFile &operator=(PosixFile &&other) noexcept;

        static geoserve::Status OpenRead(const std::string &path, PosixFile *out);
        static geoserve::Status CreateTrunc(const std::string &path, PosixFile *out);

        geoserve::Status PWrite(std::uint64_t off, const void *data, std::size_t n);
        geoserve::Status ReadAt(std::uint64_t off, void *data, std::size_t n, std::size_t *out_read);

        geoserve::Status Size(std::uint64_t *out) const;

        geoserve::Status SyncData();
        geoserve::Status Close();

        // Maps the entire file into memory (Read Only).
        // If successful, data/size are valid until PosixFile is closed/destroyed.
        geoserve::Status Map(const void **out_data, std::size_t *out_size);

        int fd() const noexcept { return fd_; }

    private:
        explicit PosixFile(int fd) : fd_(fd) {}
        void Unmap() noexcept;

        int fd_ = -1;
        void *map_addr_ = nullptr;
        std::size_t map_size_ = 0;
    };

    geoserve::Status FsyncDir(const std::string &dir_path);

} // namespace geoserve::util
