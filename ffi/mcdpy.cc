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

#include "ffi/bindings.h"


PYBIND11_MODULE(mcdpy, m) {
    mcd::ffi::define_module(m);
}
