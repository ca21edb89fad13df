#include "util/posix_file.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace geoserve::util
{

    static geoserve::Status Err(std::string_view what)
    {
        return geoserve::Status::Io(std::string(what) + ": " + std::strerror(errno));
    }

    PosixFile::PosixFile(PosixFile &&other) noexcept
        : fd_(other.fd_), map_addr_(other.map_addr_), map_size_(other.map_size_)
    {
        other.fd_ = -1;
        other.map_addr_ = nullptr;
        other.map_size_ = 0;
    }

    PosixFile &PosixFile::operator=(PosixFile &&other) noexcept
    {
        if (this != &other)
        {
            (void)Close();
            fd_ = other.fd_;
            map_addr_ = other.map_addr_;
            map_size_ = other.map_size_;
            other.fd_ = -1;
            other.map_addr_ = nullptr;
            other.map_size_ = 0;
        }
        return *this;
    }

    PosixFile::~PosixFile() { (void)Close(); }

    geoserve::Status PosixFile::OpenRead(const std::string &path, PosixFile *out)
    {
        int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0)
            return Err("open " + path);
        *out = PosixFile(fd);
        return geoserve::Status::Ok();
    }

    geoserve::Status PosixFile::CreateTrunc(const std::string &path, PosixFile *out)
    {
        int fd = ::open(path.c_str(), O_CREAT | O_RDWR | O_TRUNC | O_CLOEXEC, 0644);
        if (fd < 0)
            return Err("open " + path);
        *out = PosixFile(fd);
        return geoserve::Status::Ok();
    }

    geoserve::Status PosixFile::PWrite(std::uint64_t off, const void *data, std::size_t n)
    {
        const std::uint8_t *p = static_cast<const std::uint8_t *>(data);
        std::size_t done = 0;
        while (done < n)
        {
            ssize_t w = ::pwrite(fd_, p + done, n - done, static_cast<off_t>(off + done));
            if (w < 0)
            {
                if (errno == EINTR)
                    continue;
                return Err("pwrite");
            }
            done += static_cast<std::size_t>(w);
        }
        return geoserve::Status::Ok();
    }

    geoserve::Status PosixFile::ReadAt(std::uint64_t off, void *data, std::size_t n, std::size_t *out_read)
    {
        std::uint8_t *p = static_cast<std::uint8_t *>(data);
        std::size_t done = 0;
        while (done < n)
        {
            ssize_t r = ::pread(fd_, p + done, n - done, static_cast<off_t>(off + done));
            if (r < 0)
            {
                if (errno == EINTR)
                    continue;
                return Err("pread");
            }
            if (r == 0)
                break;
            done += static_cast<std::size_t>(r);
        }
        *out_read = done;
        return geoserve::Status::Ok();
    }

    geoserve::Status PosixFile::Size(std::uint64_t *out) const
    {
        struct stat st;
        if (::fstat(fd_, &st) != 0)
            return Err("fstat");
        *out = static_cast<std::uint64_t>(st.st_size);
        return geoserve::Status::Ok();
    }

    geoserve::Status PosixFile::SyncData()
    {
        if (::fdatasync(fd_) != 0)
            return Err("fdatasync");
        return geoserve::Status::Ok();
    }

    geoserve::Status PosixFile::Map(const void **out_data, std::size_t *out_size)
    {
        if (map_addr_)
        {
            *out_data = map_addr_;
            *out_size = map_size_;
            return geoserve::Status::Ok();
        }

        std::uint64_t size = 0;
        auto st = Size(&size);
        if (!st.ok())
            return st;
        if (size == 0)
            return geoserve::Status::Invalid("cannot map an empty file");

        void *addr = ::mmap(nullptr, static_cast<std::size_t>(size), PROT_READ, MAP_PRIVATE, fd_, 0);
        if (addr == MAP_FAILED)
            return Err("mmap");
        map_addr_ = addr;
        map_size_ = static_cast<std::size_t>(size);

        *out_data = map_addr_;
        *out_size = map_size_;
        return geoserve::Status::Ok();
    }

    void PosixFile::Unmap() noexcept
    {
        if (map_addr_)
        {
            ::munmap(map_addr_, map_size_);
            map_addr_ = nullptr;
            map_size_ = 0;
        }
    }

    geoserve::Status PosixFile::Close()
    {
        Unmap();
        if (fd_ >= 0)
        {
            int r;
            do
            {
                r = ::close(fd_);
            } while (r != 0 && errno == EINTR);
            fd_ = -1;
            if (r != 0)
                return Err("close");
        }
        return geoserve::Status::Ok();
    }

    geoserve::Status FsyncDir(const std::string &dir_path)
    {
        int fd = ::open(dir_path.c_str(), O_DIRECTORY | O_RDONLY | O_CLOEXEC);
        if (fd < 0)
            return Err("open dir");
        int r;
        do
        {
            r = ::fsync(fd);
        } while (r != 0 && errno == EINTR);
        int saved = errno;
        ::close(fd);
        errno = saved;
        if (r != 0)
            return Err("fsync dir");
        return geoserve::Status::Ok();
    }

} // namespace geoserve::util
