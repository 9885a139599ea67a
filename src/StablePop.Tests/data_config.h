#pragma once

#include <string>

extern std::string test_data_path;

std::string default_test_data_path();
