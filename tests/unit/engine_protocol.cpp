#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "robosave/error_codes.hpp"
#include "robosave/events.hpp"
#include "robosave/framing.hpp"
#include "robosave/naming.hpp"
#include "robosave/progress.hpp"
#include "robosave/protocol.hpp"
#include "robosave/session_config.hpp"

using namespace robosave;
using namespace robosave::protocol;

void run_engine_session_tests();
void run_client_config_tests();

namespace
{

    std::string record(const std::string &payload)
    {
        return std::string("\x05\x02" "D") + payload + "\r";
    }

    const std::string kEnd("\x05\x02" "E\x17");

    std::span<const std::uint8_t> as_bytes(const std::string &text)
    {
        return {reinterpret_cast<const std::uint8_t *>(text.data()), text.size()};
    }

    std::string as_string(const std::vector<std::uint8_t> &bytes)
    {
        return std::string(bytes.begin(), bytes.end());
    }

    // Feeds the given pieces one after another and decodes after each, the way
    // the streaming loop does.
    std::string decode_pieces(const std::vector<std::string> &pieces, bool &saw_end)
    {
        RecordStream stream;
        std::string output;
        saw_end = false;
        for (const auto &piece : pieces)
        {
            stream.append(as_bytes(piece));
            while (auto payload = stream.next_record())
            {
                output += as_string(*payload);
            }
            if (stream.end_of_transfer())
            {
                saw_end = true;
                break;
            }
        }
        return output;
    }

    void test_command_builders()
    {
        assert(as_string(build_login("as")) == "as\r\n");
        assert(as_string(build_save_command(BackupMode::Program, "cell_1")) == "SAVE cell_1\r\n");
        assert(as_string(build_save_command(BackupMode::Full, "cell_1")) == "SAVE/Full cell_1\r\n");
        assert(save_command_text(BackupMode::Full, "cell_1") == "SAVE/Full cell_1");
        assert(as_string(build_header_marker("cell_1")) == std::string("\x05\x02" "Bcell_1.as\x17"));
        assert(as_string(to_bytes(kSecondaryHeader)) == std::string("\x02" "B    0\x17"));
        assert(kSecondaryHeader.size() == 7);
        assert(kEndOfTransfer.size() == 4);

        assert(to_string(BackupMode::Full) == "full");
        assert(backup_mode_from_string("program") == BackupMode::Program);
        assert(!backup_mode_from_string("partial").has_value());
    }

    void test_marker_search()
    {
        const std::string banner = "Kawasaki\r\nlogin: ";
        assert(find_marker(as_bytes(banner), kLoginPrompt) == 10u);
        assert(!find_marker(as_bytes(std::string("logi")), kLoginPrompt).has_value());

        assert(!find_aux_ready(as_bytes(std::string("AUX"))).has_value());
        assert(!find_aux_ready(as_bytes(std::string("AUXa AUX"))).has_value());
        const std::string prompt = "AUX ready? AUX1 >";
        assert(find_aux_ready(as_bytes(prompt)) == 11u);
    }

    void test_record_decoding()
    {
        const auto buffer = record("hello") + record("world") + kEnd;
        auto first = try_decode_record(as_bytes(buffer));
        assert(first.has_value());
        assert(as_string(first->payload) == "hello\r\n");
        assert(first->bytes_consumed == 9);

        RecordStream stream;
        stream.append(as_bytes(buffer));
        assert(as_string(*stream.next_record()) == "hello\r\n");
        assert(as_string(*stream.next_record()) == "world\r\n");
        assert(!stream.next_record().has_value());
        assert(stream.end_of_transfer());
        assert(stream.buffered() == kEnd.size());
    }

    void test_escaped_record()
    {
        const std::string escaped = std::string("\x17") + record("abc");
        auto decoded = try_decode_record(as_bytes(escaped));
        assert(decoded.has_value());
        assert(as_string(decoded->payload) == "abc\r\n");
        assert(decoded->bytes_consumed == escaped.size());
    }

    void test_incomplete_record_waits()
    {
        RecordStream stream;
        stream.append(as_bytes(std::string("\x05\x02" "Dpart")));
        assert(!stream.next_record().has_value());
        assert(stream.buffered() == 7);
        stream.append(as_bytes(std::string("ial\r")));
        assert(as_string(*stream.next_record()) == "partial\r\n");
        assert(stream.buffered() == 0);
    }

    void test_noise_and_broken_records()
    {
        RecordStream stream;
        stream.append(as_bytes("telnet noise " + record("x")));
        assert(as_string(*stream.next_record()) == "x\r\n");
        assert(stream.buffered() == 0);

        // A line feed inside a record disqualifies it; the next record is still found.
        stream.append(as_bytes(std::string("\x05\x02" "Dab\ncd\r") + record("ok")));
        assert(as_string(*stream.next_record()) == "ok\r\n");
        assert(stream.buffered() == 0);

        stream.append(as_bytes(record("")));
        assert(as_string(*stream.next_record()) == "\r\n");
    }

    void test_fragmentation_independence()
    {
        const auto wire = record("alpha") + record("beta") + "\x17" + record("gamma 1") + kEnd;
        bool saw_end = false;
        const auto whole = decode_pieces({wire}, saw_end);
        assert(saw_end);
        assert(whole == "alpha\r\nbeta\r\ngamma 1\r\n");

        for (std::size_t split = 0; split <= wire.size(); ++split)
        {
            const auto output = decode_pieces({wire.substr(0, split), wire.substr(split)}, saw_end);
            assert(saw_end);
            assert(output == whole);
        }
    }

    void test_end_marker_with_trailing_bytes()
    {
        RecordStream stream;
        stream.append(as_bytes(record("last") + kEnd + "junk"));
        assert(as_string(*stream.next_record()) == "last\r\n");
        assert(stream.end_of_transfer());
        assert(stream.discard() == kEnd.size() + 4);
        assert(stream.buffered() == 0);
        assert(!stream.end_of_transfer());
    }

    void test_progress_tracker()
    {
        ProgressTracker tracker(10);
        assert((tracker.advance(25) == std::vector<std::uint64_t>{10, 20}));
        assert(tracker.advance(4).empty());
        assert((tracker.advance(1) == std::vector<std::uint64_t>{30}));
        assert(tracker.total_written() == 30);
        assert(tracker.last_reported() == 30);
        assert(tracker.advance(0).empty());

        ProgressTracker defaults;
        assert(defaults.interval() == 10 * 1024);

        bool threw = false;
        try
        {
            ProgressTracker invalid(0);
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);
    }

    void test_naming()
    {
        assert(sanitize_base_name("robot #1/a.b-c") == "robot__1_a.b-c");
        assert(sanitize_base_name("Cell_07") == "Cell_07");
        assert(output_path_for("out", "cell_1") == std::filesystem::path("out") / "cell_1.as");

        const auto when = std::chrono::system_clock::now();
        const auto stamp = format_timestamp(when);
        assert(stamp.size() == 15);
        assert(stamp[8] == '_');
        const auto debug = debug_path_for("out", "cell_1", when).filename().string();
        assert(debug == "debug_cell_1_" + stamp + ".log");
    }

    void test_session_config_json()
    {
        const auto json = nlohmann::json::parse(R"({
            "host": "10.0.0.5",
            "base_name": "line3",
            "mode": "full",
            "read_timeout_ms": 2500,
            "connect_retries": 4
        })");
        const auto config = json.get<SessionConfig>();
        assert(config.host == "10.0.0.5");
        assert(config.port == 23);
        assert(config.username == "as");
        assert(config.mode == BackupMode::Full);
        assert(config.read_timeout == std::chrono::milliseconds(2500));
        assert(config.stream_read_timeout == std::chrono::milliseconds(2500));
        assert(config.connect_retries == 4);
        assert(config.progress_interval == 10 * 1024);
        config.validate();

        const auto dumped = nlohmann::json(config);
        assert(dumped.at("mode") == "full");
        assert(dumped.at("retry_delay_ms") == 1000);

        bool threw = false;
        try
        {
            (void)nlohmann::json::parse(R"({"mode": "partial"})").get<SessionConfig>();
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);

        // Out-of-range integers are rejected instead of wrapping.
        for (const auto *text : {R"({"port": 70000})", R"({"port": 0})", R"({"connect_retries": -1})",
                                 R"({"progress_interval": -5})", R"({"port": "23"})"})
        {
            threw = false;
            try
            {
                (void)nlohmann::json::parse(text).get<SessionConfig>();
            }
            catch (const std::invalid_argument &)
            {
                threw = true;
            }
            assert(threw);
        }
        const auto widest = nlohmann::json::parse(R"({"port": 65535, "connect_retries": 7})").get<SessionConfig>();
        assert(widest.port == 65535);
        assert(widest.connect_retries == 7);

        auto invalid = config;
        invalid.connect_retries = 0;
        threw = false;
        try
        {
            invalid.validate();
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);

        const auto path = std::filesystem::temp_directory_path() / "robosave_config_test.json";
        {
            std::ofstream file(path);
            file << R"({"host": "robot", "base_name": "b", "port": 2323})";
        }
        const auto loaded = load_session_config(path);
        assert(loaded.host == "robot");
        assert(loaded.port == 2323);
        std::filesystem::remove(path);
    }

    void test_error_descriptions()
    {
        assert(to_string(ErrorCode::DeviceBusy) == "device_busy");
        assert(to_string(ErrorCode::OutputWriteFailure) == "output_write_failure");

        const Failure failure{.code = ErrorCode::ConnectFailure, .message = "no route"};
        assert(describe(failure) == "connect_failure: no route");
        const BackupError error(failure);
        assert(error.code() == ErrorCode::ConnectFailure);
        assert(std::string(error.what()) == "connect_failure: no route");
    }

    void test_callback_sink()
    {
        std::vector<std::string> statuses;
        CallbackEventSink sink(CallbackEventSink::Callbacks{
            .status = [&](const std::string &text)
            { statuses.push_back(text); },
        });
        sink.on_status("one");
        sink.on_progress(10);
        sink.on_error(Failure{});
        sink.on_complete("a", "b");
        assert(statuses.size() == 1);
        assert(statuses.front() == "one");
    }

} // namespace

int main()
{
    try
    {
        test_command_builders();
        test_marker_search();
        test_record_decoding();
        test_escaped_record();
        test_incomplete_record_waits();
        test_noise_and_broken_records();
        test_fragmentation_independence();
        test_end_marker_with_trailing_bytes();
        test_progress_tracker();
        test_naming();
        test_session_config_json();
        test_error_descriptions();
        test_callback_sink();
        run_engine_session_tests();
        run_client_config_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
