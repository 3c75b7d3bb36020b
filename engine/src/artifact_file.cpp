#include "robosave/artifact_file.hpp"

#include <cerrno>
#include <system_error>

#include <spdlog/spdlog.h>

namespace robosave
{

    namespace
    {

        std::error_code last_io_error()
        {
            if (errno != 0)
            {
                return std::error_code(errno, std::generic_category());
            }
            return std::make_error_code(std::errc::io_error);
        }

    } // namespace

    ArtifactFile::~ArtifactFile()
    {
        if (stream_.is_open())
        {
            const auto status = close();
            if (!status)
            {
                spdlog::warn("Closing {} failed: {}", path_.string(), describe(status.failure()));
            }
        }
    }

    Status ArtifactFile::open(const std::filesystem::path &path)
    {
        path_ = path;
        errno = 0;
        stream_.open(path, std::ios::binary | std::ios::out | std::ios::trunc);
        if (!stream_)
        {
            return make_failure(ErrorCode::OutputWriteFailure, "unable to open " + path.string(), last_io_error());
        }
        return success();
    }

    Status ArtifactFile::write(std::span<const std::uint8_t> data)
    {
        if (data.empty())
        {
            return success();
        }
        errno = 0;
        stream_.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!stream_)
        {
            return make_failure(ErrorCode::OutputWriteFailure, "write to " + path_.string() + " failed", last_io_error());
        }
        return success();
    }

    Status ArtifactFile::close()
    {
        if (!stream_.is_open())
        {
            return success();
        }
        errno = 0;
        stream_.flush();
        const bool flushed = static_cast<bool>(stream_);
        stream_.close();
        if (!flushed || stream_.fail())
        {
            return make_failure(ErrorCode::OutputWriteFailure, "closing " + path_.string() + " failed", last_io_error());
        }
        return success();
    }

} // namespace robosave
