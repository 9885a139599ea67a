#include "data_config.h"
#include "pch.h"

#include <cxxopts.hpp>
#include <filesystem>
#include <iostream>

cxxopts::Options create_options() {
    cxxopts::Options options("StablePop.Tests", "StablePop population stabilisation tests.");
    options.add_options()("d,data", "Path to the test configuration files folder.",
                          cxxopts::value<std::string>())("help",
                                                         "Help about this test application.");

    return options;
}

// NOLINTNEXTLINE(bugprone-exception-escape)
int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);

    std::cout << "\nInitialising with a custom GTest main function.\n\n";

    auto options = create_options();
    auto result = options.parse(argc, argv);
    auto data_path = std::filesystem::path{};
    if (result.count("help")) {
        std::cout << options.help() << '\n';
        return EXIT_SUCCESS;
    }
    if (result.count("data")) {
        data_path = std::filesystem::path{result["data"].as<std::string>()};
        if (data_path.is_relative()) {
            data_path = std::filesystem::absolute(data_path);
        }
    } else {
        data_path = TEST_DATA_PATH;
        std::cout << "Using default test data folder ...\n\n";
    }

    std::cout << "Test location..: " << std::filesystem::current_path().string() << "\n";
    if (std::filesystem::exists(data_path)) {
        std::cout << "Test data......: " << data_path.string() << "\n\n";
        test_data_path = data_path.string();
    } else {
        std::cerr << "Test data......: " << data_path.string() << " *** not found ***.\n\n";
    }

    return RUN_ALL_TESTS();
}
