// ----------------------------------------------------------------------------
// -                  MapNav: SpaceMouse navigation for QGIS                  -
// ----------------------------------------------------------------------------
// The MIT License (MIT)
//
// Copyright (c) 2026 MapNav contributors
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING
// FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS
// IN THE SOFTWARE.
// ----------------------------------------------------------------------------

#include "mapnav/utility/ProgramOptions.h"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>

#include "mapnav/utility/Logging.h"

namespace mapnav {
namespace utility {

namespace {

// Returns the argument following `option`, or nullptr if the option is absent
// or is the last argument.
const char *FindOptionValue(int argc, char **argv, const std::string &option) {
    char **itr = std::find(argv, argv + argc, option);
    if (itr == argv + argc || ++itr == argv + argc) {
        return nullptr;
    }
    return *itr;
}

}  // namespace

void PrintProgramOptionsHelp(
        const std::string &header,
        const std::vector<std::pair<std::string, std::string>> &options) {
    LogInfo("{}", header);
    size_t width = 0;
    for (const auto &option : options) {
        width = std::max(width, option.first.size());
    }
    for (const auto &option : options) {
        LogInfo("    {:<{}}  {}", option.first, width, option.second);
    }
}

int GetProgramOptionAsInt(int argc,
                          char **argv,
                          const std::string &option,
                          const int default_value /* = 0*/,
                          const int min_value /* = -2147483647*/,
                          const int max_value /* = 2147483647*/) {
    const char *value = FindOptionValue(argc, argv, option);
    if (value == nullptr) {
        return default_value;
    }
    char *end;
    errno = 0;
    long l = std::strtol(value, &end, 0);
    if ((errno == ERANGE && (l == LONG_MAX || l == LONG_MIN)) ||
        (errno != 0 && l == 0)) {
        return default_value;
    } else if (l > INT_MAX || l < INT_MIN) {
        return default_value;
    } else if (*value == '\0' || *end != '\0') {
        return default_value;
    }
    int v = static_cast<int>(l);
    return std::max(std::min(v, max_value), min_value);
}

double GetProgramOptionAsDouble(int argc,
                                char **argv,
                                const std::string &option,
                                const double default_value /* = 0.0*/,
                                const double min_value /* = -1e300*/,
                                const double max_value /* = 1e300*/) {
    const char *value = FindOptionValue(argc, argv, option);
    if (value == nullptr) {
        return default_value;
    }
    char *end;
    errno = 0;
    double l = std::strtod(value, &end);
    if (errno == ERANGE && (l == HUGE_VAL || l == -HUGE_VAL)) {
        return default_value;
    } else if (*value == '\0' || *end != '\0') {
        return default_value;
    }
    return std::max(std::min(l, max_value), min_value);
}

std::string GetProgramOptionAsString(
        int argc,
        char **argv,
        const std::string &option,
        const std::string &default_value /* = ""*/) {
    const char *value = FindOptionValue(argc, argv, option);
    if (value == nullptr) {
        return default_value;
    }
    return std::string(value);
}

bool ProgramOptionExists(int argc, char **argv, const std::string &option) {
    return std::find(argv, argv + argc, option) != argv + argc;
}

bool ProgramOptionExistsAny(int argc,
                            char **argv,
                            const std::vector<std::string> &options) {
    for (const auto &option : options) {
        if (ProgramOptionExists(argc, argv, option)) {
            return true;
        }
    }
    return false;
}

}  // namespace utility
}  // namespace mapnav
