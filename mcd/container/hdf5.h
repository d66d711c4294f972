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

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>


namespace mcd { namespace impl {

    // false if the library was compiled without HDF5 (MCD_HDF5=OFF)
    auto hdf5_available() -> bool;


    /*
    write only view of an HDF5 group.
    every member translates H5::Exception into McdData.
    strings are stored as variable length UTF-8.
    */
    class hdf5_group
    {
    public:
        struct impl;

        explicit hdf5_group(std::shared_ptr<impl>);

        auto create_group(const std::string& name) -> hdf5_group;

        // 1-D dataset of doubles
        auto write_dataset(const std::string& name, const std::vector<double>&) -> void;
        // 2-D dataset of doubles, xs is row major rows x columns
        auto write_dataset(const std::string& name, const std::vector<double>& xs, size_t rows, size_t columns) -> void;

        auto double_attribute(const std::string& name, double) -> void;
        auto int64_attribute(const std::string& name, int64_t) -> void;
        auto string_attribute(const std::string& name, const std::string&) -> void;

    private:
        std::shared_ptr<impl> p;
    };


    // creates (truncates) an HDF5 file. throws McdOpenError or McdDependencyMissing
    class hdf5_file
    {
        struct impl;
        std::unique_ptr<impl> p;

    public:
        explicit hdf5_file(const std::filesystem::path&);
        hdf5_file(const hdf5_file&) = delete;
        auto operator=(const hdf5_file&) -> hdf5_file& = delete;
        ~hdf5_file();

        auto root() -> hdf5_group;

        // flushes and releases the file. idempotent
        auto close() -> void;
    };

} /* namespace impl */ } /* namespace mcd */
