#include "robosave/client/session.hpp"

#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>

#include <csignal>
#include <exception>
#include <iostream>
#include <thread>
#include <utility>

#include "robosave/error_codes.hpp"

namespace robosave::client
{

    ConsoleEventSink::ConsoleEventSink(Logger &logger)
        : logger_(logger)
    {
    }

    void ConsoleEventSink::on_status(const std::string &text)
    {
        std::cout << text << std::endl;
    }

    void ConsoleEventSink::on_progress(std::uint64_t bytes_written)
    {
        std::cout << "  " << bytes_written / 1024 << " KB written" << std::endl;
    }

    void ConsoleEventSink::on_error(const Failure &failure)
    {
        std::cerr << "ERROR: " << to_string(failure.code) << std::endl;
        if (!failure.message.empty())
        {
            std::cerr << failure.message << std::endl;
        }
        logger_.log("error", describe(failure));
    }

    void ConsoleEventSink::on_complete(const std::filesystem::path &output_path,
                                       const std::filesystem::path &debug_path)
    {
        std::cout << "Saved " << output_path.string() << " (raw capture: " << debug_path.string() << ")" << std::endl;
        logger_.log("done", output_path.string(), ' ', debug_path.string());
    }

    ClientSession::ClientSession(ClientConfig config, Logger logger)
        : config_(std::move(config)),
          logger_(std::move(logger)),
          sink_(logger_) {}

    int ClientSession::run()
    {
        BackupEngine engine(config_.session, sink_);

        asio::io_context signal_context;
        asio::signal_set signals(signal_context, SIGINT, SIGTERM);
        signals.async_wait([&engine, this](const std::error_code &ec, int signal_number)
                           {
        if (!ec) {
            logger_.log("signal", "received signal ", signal_number, ", cancelling");
            engine.cancel();
        } });
        std::thread signal_thread([&signal_context]
                                  { signal_context.run(); });

        int exit_code = 0;
        try
        {
            const auto artifacts = engine.run();
            logger_.log("info", "wrote ", artifacts.bytes_written, " bytes in ", artifacts.records, " records");
        }
        catch (const BackupError &ex)
        {
            exit_code = ex.code() == ErrorCode::CancelledByUser ? kExitCancelled : 1;
        }
        catch (const std::exception &ex)
        {
            std::cerr << "ERROR: " << ex.what() << std::endl;
            logger_.log("error", "fatal: ", ex.what());
            exit_code = 1;
        }

        signal_context.stop();
        signal_thread.join();
        return exit_code;
    }

} // namespace robosave::client
