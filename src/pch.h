#pragma once

// Standard C++ Library - Most frequently used
#include <string>
#include <vector>
#include <map>
#include <set>
#include <algorithm>
#include <iostream>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <optional>
#include <regex>
#include <cctype>

// Core model types - used by almost every file
#include "common/solution_types.hpp"
#include "common/parse_error.hpp"
