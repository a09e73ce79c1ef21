#include <iostream>
#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include "certscan/inventory/reporter.hpp"
#include "certscan/types.hpp"
#include "certscan/utils/logger.hpp"

using namespace certscan;

int main(int argc, char** argv) {
    CLI::App app{"certscan - inventory of PEM certificates, requests, CRLs and RSA keys"};

    ScanConfig config;
    std::vector<std::string> paths;

    app.add_option("paths", paths, "Files or directories to scan (directories are scanned recursively)")
        ->required();

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    utils::GetLogger().Initialize(config.logLevel, config.logFormat, "console");

    try {
        inventory::RunInventory(paths, config, std::cout);
    } catch (const IOError& e) {
        utils::GetLogger().Fatal(std::string(e.what()));
        return 1;
    } catch (const std::exception& e) {
        utils::GetLogger().Fatal("Error: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
