#include <cassert>
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include "robosave/client/config.hpp"

using namespace robosave;
using robosave::client::ClientConfig;
using robosave::client::parse_arguments;

namespace
{

    ClientConfig parse(std::vector<std::string> args)
    {
        args.insert(args.begin(), "robosave");
        std::vector<char *> argv;
        for (auto &arg : args)
        {
            argv.push_back(arg.data());
        }
        return parse_arguments(static_cast<int>(argv.size()), argv.data());
    }

    // Returns the error text, or an empty string when parsing succeeded.
    std::string parse_error(const std::vector<std::string> &args)
    {
        try
        {
            (void)parse(args);
        }
        catch (const std::runtime_error &ex)
        {
            return ex.what();
        }
        return {};
    }

    bool mentions(const std::string &text, const std::string &needle)
    {
        return text.find(needle) != std::string::npos;
    }

    void test_valid_command_line()
    {
        const auto config = parse({"10.1.1.9:2323", "cell_4", "--full", "--retries", "3", "--interval", "2048",
                                   "--read-timeout", "1.5", "--verbose"});
        assert(config.session.host == "10.1.1.9");
        assert(config.session.port == 2323);
        assert(config.session.base_name == "cell_4");
        assert(config.session.mode == protocol::BackupMode::Full);
        assert(config.session.connect_retries == 3);
        assert(config.session.progress_interval == 2048);
        assert(config.session.read_timeout == std::chrono::milliseconds(1500));
        assert(config.session.stream_read_timeout == std::chrono::milliseconds(1500));
        assert(config.verbose);
    }

    void test_bad_numbers_name_their_flag()
    {
        const auto retries = parse_error({"robot", "cell", "--retries", "many"});
        assert(mentions(retries, "--retries"));
        assert(mentions(retries, "many"));

        const auto interval = parse_error({"robot", "cell", "--interval", "10k"});
        assert(mentions(interval, "--interval"));

        assert(mentions(parse_error({"robot", "cell", "--interval", "-4"}), "--interval"));
        assert(mentions(parse_error({"robot", "cell", "--retries", "0"}), "--retries"));
        assert(mentions(parse_error({"robot", "cell", "--retry-delay", "soon"}), "--retry-delay"));
        assert(mentions(parse_error({"robot:telnet", "cell"}), "Port"));
        assert(mentions(parse_error({"robot:70000", "cell"}), "Port out of range"));
    }

    void test_missing_positionals()
    {
        assert(mentions(parse_error({"robot"}), "<name>"));
        assert(parse({"--help"}).show_help);
    }

} // namespace

void run_client_config_tests()
{
    test_valid_command_line();
    test_bad_numbers_name_their_flag();
    test_missing_positionals();
}
