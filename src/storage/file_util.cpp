#include <geoserve/storage/file_util.h>

#include "util/posix_file.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <unistd.h>

namespace geoserve::storage
{
    Status EnsureDirExists(const std::string &path)
    {
        std::error_code ec;
        if (std::filesystem::exists(path, ec))
        {
            if (std::filesystem::is_directory(path, ec))
                return Status::Ok();
            return Status::Io(path + " exists and is not a directory");
        }
        if (!std::filesystem::create_directories(path, ec) && ec)
            return Status::Io("create_directories " + path + ": " + ec.message());
        return Status::Ok();
    }

    Result<std::uint64_t> FileSize(const std::string &path)
    {
        std::error_code ec;
        auto n = std::filesystem::file_size(path, ec);
        if (ec)
            return Status::Io("file_size " + path + ": " + ec.message());
        return static_cast<std::uint64_t>(n);
    }

    Status FsyncParentDir(const std::string &path)
    {
        std::filesystem::path p(path);
        std::string dir = p.has_parent_path() ? p.parent_path().string() : std::string(".");
        return util::FsyncDir(dir);
    }

    Status AtomicRename(const std::string &tmp_path, const std::string &final_path)
    {
        if (::rename(tmp_path.c_str(), final_path.c_str()) != 0)
            return Status::FromErrno(GeoErrc::IoError, "rename " + tmp_path + " -> " + final_path);
        return FsyncParentDir(final_path);
    }

    Status AtomicSymlink(const std::string &target, const std::string &link_path)
    {
        const std::string tmp = link_path + ".tmp";
        ::unlink(tmp.c_str());
        if (::symlink(target.c_str(), tmp.c_str()) != 0)
            return Status::FromErrno(GeoErrc::IoError, "symlink " + tmp);
        if (::rename(tmp.c_str(), link_path.c_str()) != 0)
        {
            Status st = Status::FromErrno(GeoErrc::IoError, "rename " + tmp + " -> " + link_path);
            ::unlink(tmp.c_str());
            return st;
        }
        return FsyncParentDir(link_path);
    }

    bool RemoveIfExists(const std::string &path)
    {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        return !ec;
    }
}
