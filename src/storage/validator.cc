#include <geoserve/storage/validator.h>

#include <geoserve/db/generation.h>
#include <geoserve/net/ip_address.h>
#include <geoserve/storage/file_util.h>

namespace geoserve::storage
{
    Status Validator::CheckSize(std::uint64_t size, std::optional<std::uint64_t> active_size) const
    {
        if (size == 0)
            return Status::Invalid("candidate file is empty");
        if (size < opt_.min_file_size)
            return Status::Invalid("candidate file too small: " + std::to_string(size) +
                                   " bytes (minimum " + std::to_string(opt_.min_file_size) + ")");
        if (active_size && *active_size > 0)
        {
            const double floor = static_cast<double>(*active_size) * opt_.min_size_ratio;
            if (static_cast<double>(size) < floor)
                return Status::Invalid("candidate file is " + std::to_string(size) +
                                       " bytes, less than " + std::to_string(opt_.min_size_ratio) +
                                       " of the active generation (" + std::to_string(*active_size) + " bytes)");
        }
        return Status::Ok();
    }

    Result<format::Metadata> Validator::Inspect(const std::string &path, std::optional<std::uint64_t> active_size) const
    {
        auto size = FileSize(path);
        if (!size.ok())
            return size.status();

        Status st = CheckSize(size.value(), active_size);
        if (!st.ok())
            return st;

        auto gen = db::Generation::Open(path);
        if (!gen.ok())
            return gen.status();
        const auto &handle = gen.value();

        for (const auto &text : opt_.probe_addresses)
        {
            auto ip = net::IpAddress::Parse(text);
            if (!ip.ok())
                continue;
            auto match = handle->Find(ip.value());
            if (!match.ok())
                return Status::Corrupt("probe " + text + ": " + match.status().msg);
            if (!match.value().found)
                continue;
            auto record = handle->DecodeRecord(match.value().data_offset);
            if (!record.ok())
                return Status::Corrupt("probe " + text + ": " + record.status().msg);
        }

        return handle->metadata();
    }

    Result<format::Metadata> Validator::Validate(const std::string &path, std::optional<std::uint64_t> active_size) const
    {
        auto md = Inspect(path, active_size);
        if (md.ok())
        {
            if (log_)
                log_->Info("validate.accept", path + " build_epoch=" + std::to_string(md.value().build_epoch) +
                                                  " nodes=" + std::to_string(md.value().node_count) +
                                                  " record_size=" + std::to_string(md.value().record_size));
            return md;
        }

        if (log_)
            log_->Warn("validate.reject", path + ": " + md.status().ToString());
        if (!RemoveIfExists(path) && log_)
            log_->Warn("validate.reject", "could not remove rejected candidate " + path);
        return md;
    }
} // namespace geoserve::storage
