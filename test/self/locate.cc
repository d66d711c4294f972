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


#define CATCH_CONFIG_MAIN  // This tells Catch to provide a main() - only do this in one cpp file
#include <catch2/catch.hpp>

#include <algorithm>

#include "native/locate.h"
#include "test/util.h"

namespace mcd { namespace impl { namespace test {

namespace fs = std::filesystem;


// a scratch directory tree, removed on destruction
struct scratch_directory
{
    fs::path root;

    explicit scratch_directory(const fs::path& x)
    : root{ x } {
        fs::remove_all(root);
        fs::create_directories(root);
    }

    ~scratch_directory() {
        std::error_code ec;
        fs::remove_all(root, ec);
    }
};


TEST_CASE("library names per platform", "[correct]") {
    REQUIRE(library_names(platform::windows) == std::vector<std::string>{ "nsMCDLibrary64.dll", "nsMCDLibrary.dll" });
    REQUIRE(library_names(platform::macos) == std::vector<std::string>{ "nsMCDLibrary.dylib" });
    REQUIRE(library_names(platform::gnu_linux) == std::vector<std::string>{ "nsMCDLibrary.so" });
}

TEST_CASE("default search directories", "[correct]") {
    const auto xs{ default_search_directories() };
    REQUIRE((xs.size() == 1 || xs.size() == 3));
    REQUIRE(std::count(begin(xs), end(xs), fs::current_path()) == 1);

    if (xs.size() == 1) {
        REQUIRE(xs[0] == fs::current_path());
        return;
    }

    REQUIRE(xs[0] == xs[2] / "Matlab-Import-Filter" / "Matlab_Interface");
    REQUIRE(xs[1] == fs::current_path());
    for (const auto& x : xs) {
        REQUIRE(x.is_absolute());
    }
}

TEST_CASE("explicit file", "[correct]") {
    scratch_directory dir{ "locate_file" };
    temporary_file library{ dir.root / "custom_name.so" };

    const auto found{ locate_library(library.path(), {}, platform::gnu_linux) };
    REQUIRE(found);
    REQUIRE(*found == fs::absolute(library.path()));
}

TEST_CASE("explicit file relative to the working directory", "[correct]") {
    temporary_file library{ "locate_relative.so" };
    REQUIRE(library.path().is_relative());

    const auto found{ locate_library(fs::path{ "locate_relative.so" }, {}, platform::gnu_linux) };
    REQUIRE(found);
    REQUIRE(found->is_absolute());
    REQUIRE(*found == fs::current_path() / "locate_relative.so");
    REQUIRE(found->has_parent_path());
}

TEST_CASE("explicit directory", "[correct]") {
    scratch_directory dir{ "locate_directory" };
    temporary_file library{ dir.root / "nsMCDLibrary.so" };

    const auto found{ locate_library(dir.root, {}, platform::gnu_linux) };
    REQUIRE(found);
    REQUIRE(*found == fs::absolute(library.path()));

    // no macos library in there
    REQUIRE(!locate_library(dir.root, {}, platform::macos));
}

TEST_CASE("preference order on windows", "[correct]") {
    scratch_directory dir{ "locate_windows" };
    temporary_file plain{ dir.root / "nsMCDLibrary.dll" };

    auto found{ locate_library(dir.root, {}, platform::windows) };
    REQUIRE(found);
    REQUIRE(found->filename() == "nsMCDLibrary.dll");

    temporary_file wide{ dir.root / "nsMCDLibrary64.dll" };
    found = locate_library(dir.root, {}, platform::windows);
    REQUIRE(found);
    REQUIRE(found->filename() == "nsMCDLibrary64.dll");
}

TEST_CASE("search directories in order", "[correct]") {
    scratch_directory dir{ "locate_order" };
    fs::create_directories(dir.root / "a");
    fs::create_directories(dir.root / "b");
    fs::create_directories(dir.root / "c");
    temporary_file in_b{ dir.root / "b" / "nsMCDLibrary.dylib" };
    temporary_file in_c{ dir.root / "c" / "nsMCDLibrary.dylib" };

    const std::vector<fs::path> directories{ dir.root / "missing", dir.root / "a", dir.root / "b", dir.root / "c" };
    const auto found{ locate_library(std::nullopt, directories, platform::macos) };
    REQUIRE(found);
    REQUIRE(*found == fs::absolute(in_b.path()));
}

TEST_CASE("missing request falls back to the search directories", "[correct]") {
    scratch_directory dir{ "locate_fallback" };
    temporary_file library{ dir.root / "nsMCDLibrary.so" };

    const auto found{ locate_library(dir.root / "does_not_exist.so", { dir.root }, platform::gnu_linux) };
    REQUIRE(found);
    REQUIRE(*found == fs::absolute(library.path()));

    // a directory without the library falls back too
    fs::create_directories(dir.root / "empty");
    const auto from_empty{ locate_library(dir.root / "empty", { dir.root }, platform::gnu_linux) };
    REQUIRE(from_empty);
    REQUIRE(*from_empty == fs::absolute(library.path()));
}

TEST_CASE("nothing found", "[correct]") {
    scratch_directory dir{ "locate_nothing" };
    REQUIRE(!locate_library(std::nullopt, { dir.root }, platform::gnu_linux));
    REQUIRE(!locate_library(std::nullopt, {}, platform::windows));
}

} /* namespace test */ } /* namespace impl */ } /* namespace mcd */
