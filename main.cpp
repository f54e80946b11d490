#include <iostream>
#include <string>
#include <vector>
#include <stdexcept>

#include "config.hpp"
#include "console.hpp"
#include "dependency_checker.hpp"
#include "errors.hpp"
#include "pipeline.hpp"

void printUsage(const char* progName) {
    std::cerr << "Replace system.img inside an Android super.img with a GSI and build an Odin AP package." << std::endl;
    std::cerr << "Usage: " << progName << " [options]" << std::endl << std::endl;
    std::cerr << "Anything not given as an option is asked for interactively." << std::endl << std::endl;
    std::cerr << "Options:" << std::endl;
    std::cerr << "  --super <path>       Source super.img (sparse or raw)." << std::endl;
    std::cerr << "  --system <path>      Replacement system image (GSI)." << std::endl;
    std::cerr << "  --work-dir <path>    Work directory, created if missing." << std::endl;
    std::cerr << "  --name <name>        Output base name; produces <name>_AP.tar.md5." << std::endl;
    std::cerr << "  -c, --config <file>  JSON file with the same settings plus tool paths." << std::endl;
    std::cerr << "  -y, --yes            Answer yes to every warning prompt." << std::endl;
    std::cerr << "  --manifest           Also write <name>_AP.json describing the run." << std::endl;
    std::cerr << "  -h, --help           Show this help message and exit." << std::endl;
}

int main(int argc, char* argv[]) {
    CommandLine cmd;
    try {
        cmd = parse_command_line(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        printUsage(argv[0]);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    if (cmd.show_help) {
        printUsage(argv[0]);
        return 0;
    }

    Console console = Console::standard(cmd.config.assume_yes);
    check_termux_environment(console);

    console.banner("Super.img GSI Replacement");
    console.blank();

    try {
        run_pipeline(cmd.config, console);
    } catch (const UserAbort& e) {
        console.status(e.what());
        return 1;
    } catch (const std::exception& e) {
        console.error(e.what());
        return 1;
    }

    return 0;
}
