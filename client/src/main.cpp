#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <utility>

#include "robosave/client/config.hpp"
#include "robosave/client/logger.hpp"
#include "robosave/client/session.hpp"
#include "robosave/version.hpp"

int main(int argc, char *argv[])
{
    using robosave::client::ClientConfig;
    using robosave::client::ClientSession;
    using robosave::client::Logger;

    const std::string program_name = argc > 0 ? argv[0] : "robosave";

    ClientConfig config;
    try
    {
        config = robosave::client::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        std::cerr << robosave::client::usage(program_name);
        return EXIT_FAILURE;
    }

    if (config.show_help)
    {
        std::cout << "robosave " << robosave::version() << "\n"
                  << robosave::client::usage(program_name);
        return EXIT_SUCCESS;
    }
    if (config.show_version)
    {
        std::cout << robosave::version() << std::endl;
        return EXIT_SUCCESS;
    }

    try
    {
        Logger logger(config.log_path, config.verbose);
        logger.log("start", "robosave ", robosave::version(), " backing up ", config.session.host, ':',
                   config.session.port, " as ", config.session.base_name);
        ClientSession session(std::move(config), std::move(logger));
        return session.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
}
