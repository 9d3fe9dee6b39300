#include <iostream>
#include <vector>
#include <string>
#include <signal.h>
#include "cli/arg_parser.hpp"
#include "cli/ctlssh_cli.hpp"
#include "cli/theme.hpp"
#include <core/constants.hpp>

void print_usage() {
    std::cout << theme::section("Usage");
    std::cout << theme::usage_row("ctlssh [options] destination [command]", "") << "\n";
    std::cout << theme::usage_row("-p port", "Port to connect to");
    std::cout << theme::usage_row("-l login_name", "Remote user");
    std::cout << theme::usage_row("-i identity_file", "Private key (repeatable)");
    std::cout << theme::usage_row("-F configfile", "ssh_config for the control master");
    std::cout << theme::usage_row("-J destination", "Jump host (control master only)");
    std::cout << theme::usage_row("-D / -L / -R forward", "Port forwards (control master only)");
    std::cout << theme::usage_row("-o Key=Value", "Option override");
    std::cout << theme::usage_row("-A / -a", "Enable / disable agent forwarding");
    std::cout << theme::usage_row("-t / -T", "Force / disable pty allocation");
    std::cout << theme::usage_row("-v", "Verbose");
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    ctlssh --version        Show version\n"
              << "    ctlssh --help           Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);

        if (args.empty()) {
            print_usage();
            return EXIT_CONNECT_FAILED;
        }
        if (args[0] == "--version") {
            std::cout << theme::version_line();
            return 0;
        }
        if (args[0] == "--help") {
            print_usage();
            return 0;
        }

        auto parsed = parse_args(args);
        if (parsed.is_err()) {
            std::cerr << theme::fail(parsed.error);
            print_usage();
            return EXIT_CONNECT_FAILED;
        }

        // Peers going away must surface as write errors.
        signal(SIGPIPE, SIG_IGN);

        CtlsshCLI cli(std::move(parsed.value));
        return cli.run();
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return EXIT_CONNECT_FAILED;
    }
}
