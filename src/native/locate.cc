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

#include "native/locate.h"

#include <cstdlib>
#include <system_error>

#include "logger.h"

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif


namespace mcd { namespace impl {

    auto current_platform() -> platform {
#if defined(_WIN32)
        return platform::windows;
#elif defined(__APPLE__)
        return platform::macos;
#else
        return platform::gnu_linux;
#endif
    }

    auto library_names(platform x) -> std::vector<std::string> {
        switch (x) {
            case platform::windows: return { "nsMCDLibrary64.dll", "nsMCDLibrary.dll" };
            case platform::macos: return { "nsMCDLibrary.dylib" };
            case platform::gnu_linux: return { "nsMCDLibrary.so" };
        }
        return {};
    }

    // relative names handed to dlopen are searched on the system library path only
    static
    auto anchored(const std::filesystem::path& x) -> std::filesystem::path {
        std::error_code ec;
        const auto result{ std::filesystem::absolute(x, ec) };
        return ec ? x : result;
    }

    auto default_search_directories() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> result;

#ifdef MCD_LIBRARY_DIR
        const std::string install_dir{ MCD_LIBRARY_DIR };
#else
        const std::string install_dir;
#endif
        if (!install_dir.empty()) {
            result.push_back(anchored(std::filesystem::path{ install_dir } / "Matlab-Import-Filter" / "Matlab_Interface"));
        }

        std::error_code ec;
        const auto cwd{ std::filesystem::current_path(ec) };
        result.push_back(ec ? std::filesystem::path{ "." } : cwd);

        if (!install_dir.empty()) {
            result.push_back(anchored(install_dir));
        }
        return result;
    }


    static
    auto is_file(const std::filesystem::path& x) -> bool {
        std::error_code ec;
        return std::filesystem::is_regular_file(x, ec);
    }

    static
    auto is_dir(const std::filesystem::path& x) -> bool {
        std::error_code ec;
        return std::filesystem::is_directory(x, ec);
    }

    static
    auto search(const std::filesystem::path& directory, const std::vector<std::string>& names) -> std::optional<std::filesystem::path> {
        if (!is_dir(directory)) {
            return std::nullopt;
        }

        for (const auto& name : names) {
            const auto candidate{ directory / name };
            if (is_file(candidate)) {
                return anchored(candidate);
            }
        }
        return std::nullopt;
    }

    auto locate_library(const std::optional<std::filesystem::path>& requested
                      , const std::vector<std::filesystem::path>& directories
                      , platform p) -> std::optional<std::filesystem::path> {
        const auto names{ library_names(p) };

        if (requested) {
            if (is_dir(*requested)) {
                const auto found{ search(*requested, names) };
                if (found) {
                    return found;
                }
            }
            else if (is_file(*requested)) {
                return anchored(*requested);
            }

            mcd_log_warning("[locate_library, locate] " + requested->string() + " does not contain the native library, searching the default locations");
        }

        for (const auto& directory : directories) {
            const auto found{ search(directory, names) };
            if (found) {
                return found;
            }
        }

        return std::nullopt;
    }


    auto prefix_library_search_path(const std::filesystem::path& directory) -> void {
#ifdef _WIN32
        if (directory.empty()) {
            return;
        }

        std::wstring path{ directory.wstring() };
        const DWORD size{ GetEnvironmentVariableW(L"PATH", nullptr, 0) };
        if (size > 0) {
            std::wstring previous(size, L'\0');
            const DWORD written{ GetEnvironmentVariableW(L"PATH", previous.data(), size) };
            previous.resize(written);
            path += L";" + previous;
        }

        if (!SetEnvironmentVariableW(L"PATH", path.c_str())) {
            mcd_log_warning("[prefix_library_search_path, locate] can not update PATH with " + directory.string());
        }
#else
        static_cast<void>(directory);
#endif
    }

} /* namespace impl */ } /* namespace mcd */
