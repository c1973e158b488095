#include "Logging.hh"

#include <boost/core/demangle.hpp>

#include <cstdlib>
#include <exception>
#include <typeinfo>

int clue_main(int argc, char* argv[]);

int main(int argc, char* argv[])
{
    try {
        return clue_main(argc, argv);
    } catch (const std::exception& e) {
        log(
            Clue::LogLevel::FATAL,
            "%s terminated with exception of type %s: %s",
            argv[0], boost::core::demangle(typeid(e).name()), e.what());
        return EXIT_FAILURE;
    }
}
