/**
 * robosave - Append-only binary file used for the decoded backup and the raw
 * debug capture. Closed on destruction.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <span>

#include "robosave/result.hpp"

namespace robosave
{

    class ArtifactFile
    {
    public:
        ArtifactFile() = default;
        ~ArtifactFile();

        ArtifactFile(const ArtifactFile &) = delete;
        ArtifactFile &operator=(const ArtifactFile &) = delete;

        // Creates or truncates the file.
        Status open(const std::filesystem::path &path);

        Status write(std::span<const std::uint8_t> data);

        Status close();

        bool is_open() const noexcept { return stream_.is_open(); }
        const std::filesystem::path &path() const noexcept { return path_; }

    private:
        std::filesystem::path path_;
        std::ofstream stream_;
    };

} // namespace robosave
