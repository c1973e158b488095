#include "messaging/Sockets.hh"
#include "main/ClueMain.hh"
#include "main/Config.hh"
#include "Logging.hh"

#include <getopt.h>

#include <array>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>

namespace {

using namespace Clue;
using Main::ClueMain;

class ClueApp {
public:

    ClueApp(Messaging::MessageContext& zmqctx, const std::string& configPath) :
        app {zmqctx, Main::configFromPath(configPath)}
    {
        log(LogLevel::INFO, "Startup completed");
    }

    ~ClueApp()
    {
        log(LogLevel::INFO, "Shutting down");
    }

    void run()
    {
        app.run();
    }

private:

    ClueMain app;
};

std::string parseArguments(int argc, char* argv[])
{
    auto configPath = std::string {};

    const auto short_opt = "vf:";
    auto long_opt = std::array {
        option { "verbose", no_argument, nullptr, 'v' },
        option { "config", required_argument, nullptr, 'f' },
        option { nullptr, 0, nullptr, 0 },
    };
    auto verbosity = 0;
    auto opt_index = 0;
    while (true) {
        const auto c = getopt_long(
            argc, argv, short_opt, long_opt.data(), &opt_index);
        if (c == -1) {
            break;
        } else if (c == 'v') {
            ++verbosity;
        } else if (c == 'f') {
            configPath = optarg;
        } else {
            std::cerr << "Usage: " << argv[0] << " [-v...] [-f config]\n";
            std::exit(EXIT_FAILURE);
        }
    }

    setupLogging(getLogLevel(verbosity), std::cerr);
    return configPath;
}

}

int clue_main(int argc, char* argv[])
{
    const auto configPath = parseArguments(argc, argv);
    Messaging::MessageContext zmqctx;
    ClueApp app {zmqctx, configPath};
    app.run();
    return EXIT_SUCCESS;
}
