#include <iostream>
#include <utility>

#include "clouddrive/client/config.hpp"
#include "clouddrive/client/logger.hpp"
#include "clouddrive/client/session.hpp"

int main(int argc, char *argv[])
{
    using namespace clouddrive::client;

    try
    {
        const auto config = parse_arguments(argc, argv);
        Logger logger(config.log_path, config.debug);
        ClientSession session(config, std::move(logger));
        return session.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return 1;
    }
}
