// File: src/cli/main.cpp
#include "cli/profitlift_cli.hpp"
#include <string>
#include <vector>

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    profitlift::ProfitLiftCli cli;
    return cli.Run(args);
}
