#include <geoserve/db/generation.h>

#include <geoserve/format/decoder.h>

#include "util/posix_file.h"

#include <unistd.h>

namespace geoserve::db
{
    Result<GenerationHandle> Generation::Open(const std::string &path)
    {
        std::shared_ptr<Generation> gen(new Generation());
        gen->path_ = path;
        gen->file_ = std::make_unique<util::PosixFile>();

        Status st = util::PosixFile::OpenRead(path, gen->file_.get());
        if (!st.ok())
            return st;

        const void *data = nullptr;
        std::size_t size = 0;
        st = gen->file_->Map(&data, &size);
        if (!st.ok())
            return st;
        gen->bytes_ = std::span<const std::uint8_t>(static_cast<const std::uint8_t *>(data), size);

        st = gen->Init();
        if (!st.ok())
            return Status{st.code, path + ": " + st.msg};
        return GenerationHandle(std::move(gen));
    }

    Result<GenerationHandle> Generation::FromBuffer(std::vector<std::uint8_t> bytes, std::string label)
    {
        std::shared_ptr<Generation> gen(new Generation());
        gen->path_ = std::move(label);
        gen->owned_ = std::move(bytes);
        gen->bytes_ = gen->owned_;

        Status st = gen->Init();
        if (!st.ok())
            return st;
        return GenerationHandle(std::move(gen));
    }

    Status Generation::Init()
    {
        auto md = format::ReadMetadata(bytes_);
        if (!md.ok())
            return md.status();
        meta_ = md.move_value();
        tree_.emplace(bytes_, meta_);
        return Status::Ok();
    }

    Generation::~Generation()
    {
        tree_.reset();
        if (file_)
            (void)file_->Close();
        if (retire_on_release_.load(std::memory_order_acquire) && file_)
            ::unlink(path_.c_str());
    }

    void Generation::RetireFileOnRelease() const noexcept
    {
        retire_on_release_.store(true, std::memory_order_release);
    }

    Result<format::TreeMatch> Generation::Find(const net::IpAddress &ip) const
    {
        return tree_->Find(ip);
    }

    Result<format::DataValue> Generation::DecodeRecord(std::size_t data_offset) const
    {
        format::Decoder decoder(bytes_.subspan(meta_.data_section_offset, meta_.data_section_size));
        return decoder.Decode(data_offset);
    }

    Result<std::optional<LookupResult>> Generation::Lookup(const net::IpAddress &ip,
                                                           std::string ip_text,
                                                           std::string_view language) const
    {
        auto match = Find(ip);
        if (!match.ok())
            return match.status();
        if (!match.value().found)
            return std::optional<LookupResult>{};

        auto record = DecodeRecord(match.value().data_offset);
        if (!record.ok())
            return record.status();
        if (!record.value().AsMap())
            return Status::Corrupt("record at data offset " + std::to_string(match.value().data_offset) +
                                   " is not a map");

        return std::optional<LookupResult>(ProjectCityRecord(record.value(), std::move(ip_text), language));
    }
} // namespace geoserve::db
