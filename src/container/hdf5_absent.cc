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

// compiled instead of hdf5.cc when MCD_HDF5 is OFF

#include "container/hdf5.h"

#include "exception.h"
#include "logger.h"


namespace mcd { namespace impl {

    using namespace mcd::api::v1;

    auto hdf5_available() -> bool {
        return false;
    }

    [[noreturn]] static
    auto missing(const std::string& func) -> void {
        const std::string e{ "[" + func + ", hdf5] McdToolKit was built without HDF5 support (MCD_HDF5=OFF)" };
        mcd_log_error(e);
        throw McdDependencyMissing{ e };
    }


    struct hdf5_group::impl
    {
    };

    hdf5_group::hdf5_group(std::shared_ptr<impl> x)
    : p{ std::move(x) } {
    }

    auto hdf5_group::create_group(const std::string&) -> hdf5_group {
        missing("create_group");
    }

    auto hdf5_group::write_dataset(const std::string&, const std::vector<double>&) -> void {
        missing("write_dataset");
    }

    auto hdf5_group::write_dataset(const std::string&, const std::vector<double>&, size_t, size_t) -> void {
        missing("write_dataset");
    }

    auto hdf5_group::double_attribute(const std::string&, double) -> void {
        missing("double_attribute");
    }

    auto hdf5_group::int64_attribute(const std::string&, int64_t) -> void {
        missing("int64_attribute");
    }

    auto hdf5_group::string_attribute(const std::string&, const std::string&) -> void {
        missing("string_attribute");
    }


    struct hdf5_file::impl
    {
    };

    hdf5_file::hdf5_file(const std::filesystem::path&) {
        missing("hdf5_file");
    }

    hdf5_file::~hdf5_file() {
    }

    auto hdf5_file::root() -> hdf5_group {
        missing("root");
    }

    auto hdf5_file::close() -> void {
    }

} /* namespace impl */ } /* namespace mcd */
