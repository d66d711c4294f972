/*
Copyright 2015-2021 Velko Hristov
This file is part of McdToolKit.
SPDX-License-Identifier: LGPL-3.0+

McdToolKit is free software: you can redistribute it and/or modify
it under the terms of the GNU Lesser General Public License as published by
the Free Software Foundation, either version 3 of the License, or
(at your option) any later version.

McdToolKit is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
GNU Lesser General Public License for more details.

You should have received a copy of the GNU Lesser General Public License
along with McdToolKit.  If not, see <http://www.gnu.org/licenses/>.
*/


#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "mcd.h"


struct arguments
{
    std::filesystem::path input;
    std::optional<std::filesystem::path> output;
    std::optional<std::filesystem::path> library;
    std::string log_type{ "console" };
    std::string log_level{ "warning" };
};

static
auto usage(const char* program) -> void {
    std::cerr << "mcdtool " << MCD_MAJOR << "." << MCD_MINOR << "." << MCD_PATCH << "." << MCD_BUILD << "\n"
              << "usage: " << program << " [options] <file.mcd> [output.h5]\n"
              << "  without output: prints the file information and the entities\n"
              << "  with output:    converts the recording to hdf5\n"
              << "options:\n"
              << "  --library <path>  native neuroshare library file or directory\n"
              << "  --log <console|file>\n"
              << "  --level <trace|debug|info|warning|error|critical|off>\n";
}

static
auto parse(int argc, char* argv[]) -> std::optional<arguments> {
    arguments result;
    std::vector<std::string> positional;

    for (int i{ 1 }; i < argc; ++i) {
        const std::string x{ argv[i] };
        const bool has_value{ i + 1 < argc };

        if (x == "--library" && has_value) {
            result.library = argv[++i];
        }
        else if (x == "--log" && has_value) {
            result.log_type = argv[++i];
        }
        else if (x == "--level" && has_value) {
            result.log_level = argv[++i];
        }
        else if (x.rfind("--", 0) == 0) {
            return std::nullopt;
        }
        else {
            positional.push_back(x);
        }
    }

    if (positional.empty() || 2 < positional.size()) {
        return std::nullopt;
    }

    result.input = positional[0];
    if (positional.size() == 2) {
        result.output = positional[1];
    }
    return result;
}

static
auto open_reader(const arguments& args) -> mcd::McdReader {
    if (args.library) {
        return mcd::McdReader{ args.input, *args.library };
    }
    return mcd::McdReader{ args.input };
}

static
auto print_info(const arguments& args) -> void {
    auto reader{ open_reader(args) };

    std::cout << args.input.string() << "\n";
    std::cout << reader.Info() << "\n";
    std::cout << "library: " << reader.Library() << "\n";
    std::cout << "         " << reader.LibraryLocation() << "\n\n";

    std::cout << std::left
              << std::setw(6) << "ID"
              << std::setw(10) << "Type"
              << std::setw(34) << "Label"
              << "Items\n";
    for (const auto& x : reader.Entities()) {
        std::cout << std::setw(6) << x.Id
                  << std::setw(10) << x.TypeName
                  << std::setw(34) << x.Label
                  << x.ItemCount << "\n";
    }

    reader.Close();
}

static
auto convert(const arguments& args) -> int {
    const auto progress{ [](int64_t i, int64_t total, const std::string& msg) -> void {
        const double percent{ total == 0 ? 100.0 : 100.0 * static_cast<double>(i) / static_cast<double>(total) };
        std::cout << "[" << std::fixed << std::setprecision(1) << std::setw(5) << percent << "%] " << msg << "\n";
    } };

    const auto summary{ mcd::ConvertToHdf5(args.input, *args.output, progress, args.library) };
    if (!summary.Failed.empty()) {
        std::cerr << summary << "\n";
    }

    std::cout << "Done!\n";
    return 0;
}

auto main(int argc, char* argv[]) -> int {
    const auto args{ parse(argc, argv) };
    if (!args) {
        usage(argv[0]);
        return 1;
    }

    try {
        mcd::impl::scoped_log log{ args->log_type, args->log_level };

        if (args->output) {
            return convert(*args);
        }

        print_info(*args);
    }
    catch (const mcd::McdException& x) {
        std::cerr << x.what() << "\n";
        return 1;
    }
    catch (const std::exception& x) {
        std::cerr << x.what() << "\n";
        return 1;
    }

    return 0;
}
