#include <geoserve/update/gzip.h>

#include <geoserve/storage/file_util.h>
#include "util/posix_file.h"

#include <zlib.h>

#include <array>
#include <cstdint>

namespace geoserve::update
{
    namespace
    {
        constexpr std::size_t kChunk = 1 << 16;

        struct GzFile
        {
            gzFile f = nullptr;
            ~GzFile()
            {
                if (f)
                    gzclose(f);
            }
        };

        Status InflateInto(const std::string &src, util::PosixFile &out)
        {
            GzFile in;
            in.f = gzopen(src.c_str(), "rb");
            if (in.f == nullptr)
                return Status::Io("gzopen " + src + " failed");
            gzbuffer(in.f, kChunk);

            std::array<std::uint8_t, kChunk> buf{};
            std::uint64_t off = 0;
            for (;;)
            {
                const int n = gzread(in.f, buf.data(), static_cast<unsigned>(buf.size()));
                if (n < 0)
                {
                    int errnum = 0;
                    const char *what = gzerror(in.f, &errnum);
                    return Status::Corrupt("inflate " + src + ": " + (what ? what : "unknown error"));
                }
                if (n == 0)
                {
                    // A truncated stream ends like a clean one; only gzerror tells.
                    int errnum = Z_OK;
                    const char *what = gzerror(in.f, &errnum);
                    if (errnum != Z_OK)
                        return Status::Corrupt("inflate " + src + ": " + (what ? what : "truncated stream"));
                    break;
                }
                Status st = out.PWrite(off, buf.data(), static_cast<std::size_t>(n));
                if (!st.ok())
                    return st;
                off += static_cast<std::uint64_t>(n);
            }
            if (off == 0)
                return Status::Corrupt("inflate " + src + ": empty payload");
            return out.SyncData();
        }
    } // namespace

    bool LooksGzip(const std::string &path)
    {
        util::PosixFile f;
        if (!util::PosixFile::OpenRead(path, &f).ok())
            return false;
        std::uint8_t magic[2] = {0, 0};
        std::size_t got = 0;
        if (!f.ReadAt(0, magic, sizeof(magic), &got).ok() || got != sizeof(magic))
            return false;
        return magic[0] == 0x1f && magic[1] == 0x8b;
    }

    Status InflateGzipFile(const std::string &src, const std::string &dst)
    {
        util::PosixFile out;
        Status st = util::PosixFile::CreateTrunc(dst, &out);
        if (!st.ok())
            return st;

        st = InflateInto(src, out);
        Status closed = out.Close();
        if (st.ok())
            st = closed;
        if (!st.ok())
            storage::RemoveIfExists(dst);
        return st;
    }
} // namespace geoserve::update
