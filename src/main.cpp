#include "cli/App.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>

int main(int argc, char** argv) {
    // stdout carries the JSON result; all logging goes to stderr
    spdlog::set_default_logger(spdlog::stderr_color_mt("funcscan"));

    return funcscan::run_cli(argc, argv, std::cout, std::cerr);
}
