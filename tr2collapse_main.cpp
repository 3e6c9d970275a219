#include "./include/tr2collapse_cli.hpp"
#include <iostream>
#include <stdexcept>

using namespace tr2collapse;

int main(int argc, char* argv[]) {
    CliOptions options;
    try {
        options = parse_command_line(argc, argv);
    } catch (const ConfigException& e) {
        std::cerr << e.what() << "\n";
        print_usage(std::cerr, argv[0]);
        return 2;
    }

    if (options.show_man) {
        print_manual(std::cout, argv[0]);
        return 0;
    }
    if (options.show_help) {
        print_usage(std::cout, argv[0]);
        return 0;
    }

    tr2collapse::log::init_logging(options.config.debug_level);

    int status = 0;
    try {
        std::ios::sync_with_stdio(false);
        Tr2Collapser::run(options.config, std::cin, std::cout);
        std::cout.flush();
    } catch (const Tr2CollapseException& e) {
        tr2collapse::log::logger()->error("{}", e.what());
        status = 1;
    } catch (const std::exception& e) {
        tr2collapse::log::logger()->error("std::exception: {}", e.what());
        status = 1;
    }

    tr2collapse::log::shutdown_logging();
    return status;
}
