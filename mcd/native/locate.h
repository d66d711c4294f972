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

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>


namespace mcd { namespace impl {

    enum class platform{ windows, macos, gnu_linux };

    auto current_platform() -> platform;

    // in order of preference.
    // windows: nsMCDLibrary64.dll, nsMCDLibrary.dll
    // macos:   nsMCDLibrary.dylib
    // gnu_linux: nsMCDLibrary.so
    auto library_names(platform) -> std::vector<std::string>;

    // MCD_LIBRARY_DIR/Matlab-Import-Filter/Matlab_Interface, the current directory, MCD_LIBRARY_DIR.
    // the current directory only if MCD_LIBRARY_DIR is not configured.
    auto default_search_directories() -> std::vector<std::filesystem::path>;

    /*
    1. requested names an existing file: requested.
       requested names an existing directory: the first library name found in it.
    2. the first library name found in directories, tried in order.
    3. std::nullopt: the caller hands library_names(p).front() to the dynamic loader.
    a requested location that does not exist falls through to 2.
    the result is absolute.
    */
    auto locate_library(const std::optional<std::filesystem::path>& requested
                      , const std::vector<std::filesystem::path>& directories
                      , platform p) -> std::optional<std::filesystem::path>;

    // windows: prepends the directory to PATH of the current process so that
    // the dependencies of the library resolve. no-op on the other platforms.
    auto prefix_library_search_path(const std::filesystem::path& directory) -> void;

} /* namespace impl */ } /* namespace mcd */
