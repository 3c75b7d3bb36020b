/**
 * robosave - Immutable settings for one backup session.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "robosave/progress.hpp"
#include "robosave/protocol.hpp"

namespace robosave
{

    struct SessionConfig
    {
        std::string host;
        std::uint16_t port{23};
        std::string username{"as"};
        protocol::BackupMode mode{protocol::BackupMode::Program};
        std::string base_name;
        std::filesystem::path output_dir{"."};
        std::chrono::milliseconds connect_timeout{std::chrono::seconds{5}};
        // Deadline for each handshake wait.
        std::chrono::milliseconds read_timeout{std::chrono::seconds{10}};
        // Per-read timeout while streaming records; also bounds cancellation latency.
        std::chrono::milliseconds stream_read_timeout{std::chrono::seconds{10}};
        unsigned connect_retries{1};
        std::chrono::milliseconds retry_delay{std::chrono::seconds{1}};
        std::uint64_t progress_interval{ProgressTracker::kDefaultInterval};

        // Throws std::invalid_argument describing the first bad field.
        void validate() const;
    };

    void to_json(nlohmann::json &json, const SessionConfig &config);
    void from_json(const nlohmann::json &json, SessionConfig &config);

    SessionConfig load_session_config(const std::filesystem::path &path);

} // namespace robosave
