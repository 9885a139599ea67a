#pragma once

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>
