#pragma once

#include <cerrno>
#include <cstring>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <optional>

namespace geoserve
{
    enum class GeoErrc : std::uint8_t
    {
        Ok = 0,
        InvalidArgument = 1,
        NotFound = 2,
        AlreadyExists = 3,
        Corruption = 4,
        IoError = 5,
        Timeout = 6,
        Cancelled = 7,
        Unavailable = 8,
        Busy = 9,
        Internal = 10
    };

    const char *ErrcName(GeoErrc code) noexcept;

    struct Status
    {
        GeoErrc code{GeoErrc::Ok};
        std::string msg{};

        constexpr bool ok() const { return code == GeoErrc::Ok; }

        static Status Ok() { return {}; }

        static Status FromErrno(GeoErrc code, std::string_view what)
        {
            Status s;
            s.code = code;
            s.msg = std::string(what) + ": " + std::string(std::strerror(errno));
            return s;
        }

        static Status Invalid(std::string msg)
        {
            return {GeoErrc::InvalidArgument, std::move(msg)};
        }

        static Status NotFound(std::string msg)
        {
            return {GeoErrc::NotFound, std::move(msg)};
        }

        static Status Exists(std::string msg)
        {
            return {GeoErrc::AlreadyExists, std::move(msg)};
        }

        static Status Io(std::string msg)
        {
            return {GeoErrc::IoError, std::move(msg)};
        }

        static Status Corrupt(std::string msg)
        {
            return {GeoErrc::Corruption, std::move(msg)};
        }

        static Status TimedOut(std::string msg)
        {
            return {GeoErrc::Timeout, std::move(msg)};
        }

        static Status Cancelled(std::string msg)
        {
            return {GeoErrc::Cancelled, std::move(msg)};
        }

        static Status Unavailable(std::string msg)
        {
            return {GeoErrc::Unavailable, std::move(msg)};
        }

        static Status Busy(std::string msg)
        {
            return {GeoErrc::Busy, std::move(msg)};
        }

        static Status Internal(std::string msg)
        {
            return {GeoErrc::Internal, std::move(msg)};
        }

        std::string ToString() const;
    };

    template <typename T>
    class Result
    {
    public:
        Result() : status_(Status::Ok()) {}
        Result(Status s) : status_(std::move(s)) {}
        Result(T value) : status_(Status::Ok()), value_(std::move(value)) {}

        bool ok() const { return status_.ok(); }
        const Status &status() const { return status_; }

        T &value()
        {
            return *value_;
        }

        const T &value() const
        {
            return *value_;
        }

        T &&move_value()
        {
            return std::move(*value_);
        }

    private:
        Status status_{};
        std::optional<T> value_{};
    };

    template <>
    class Result<void>
    {
    public:
        Result() : status_(Status::Ok()) {}
        Result(Status s) : status_(std::move(s)) {}

        bool ok() const { return status_.ok(); }
        const Status &status() const { return status_; }

    private:
        Status status_{};
    };
} // namespace geoserve
