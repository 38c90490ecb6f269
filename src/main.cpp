#include "pngfiles/cli.hpp"
#include "pngfiles/log.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    pngfiles::cli::Invocation invocation;
    try {
        invocation = pngfiles::cli::ParseArgs(argc, argv);
    } catch (const pngfiles::cli::UsageError& exc) {
        std::cerr << exc.what() << "\n";
        pngfiles::cli::PrintUsage(std::cerr);
        return 2;
    }
    try {
        pngfiles::cli::Run(invocation, std::cout);
        return 0;
    } catch (const std::exception& exc) {
        pngfiles::log::Error(exc.what());
        return 1;
    }
}
