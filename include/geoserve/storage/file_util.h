#pragma once
#include <cstdint>
#include <string>

#include <geoserve/core/status.h>

namespace geoserve::storage
{
    Status EnsureDirExists(const std::string &path);

    Result<std::uint64_t> FileSize(const std::string &path);

    Status FsyncParentDir(const std::string &path);

    // rename(2) followed by an fsync of the destination directory.
    Status AtomicRename(const std::string &tmp_path, const std::string &final_path);

    // Points `link_path` at `target` by creating `link_path + ".tmp"` and
    // renaming it over the old link, so readers see either link, never none.
    Status AtomicSymlink(const std::string &target, const std::string &link_path);

    // Best-effort unlink; a missing file is not an error.
    bool RemoveIfExists(const std::string &path);
}
