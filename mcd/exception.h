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

#include <stdexcept>
#include <string>


namespace mcd { namespace api { namespace v1 {

    // base class
    struct McdException : public std::runtime_error
    {
        explicit McdException(const std::string& msg)
        : std::runtime_error{ msg } {
        }

        explicit McdException(const char* msg)
        : std::runtime_error{ msg } {
        }

        virtual ~McdException() = default;
    };

    // missing source file or entity id out of range
    struct McdNotFound : public McdException
    {
        explicit McdNotFound(const std::string& msg)
        : McdException{ msg } {
        }

        explicit McdNotFound(const char* msg)
        : McdException{ msg } {
        }

        virtual ~McdNotFound() = default;
    };

    // the native library can not be loaded or refuses to interpret the file.
    // also raised when the output container can not be created.
    struct McdOpenError : public McdException
    {
        explicit McdOpenError(const std::string& msg)
        : McdException{ msg } {
        }

        explicit McdOpenError(const char* msg)
        : McdException{ msg } {
        }

        virtual ~McdOpenError() = default;
    };

    // operation on a closed reader
    struct McdNotOpen : public McdException
    {
        explicit McdNotOpen(const std::string& msg)
        : McdException{ msg } {
        }

        explicit McdNotOpen(const char* msg)
        : McdException{ msg } {
        }

        virtual ~McdNotOpen() = default;
    };

    // unrecognized name (entity type, logger type, logger level)
    struct McdInvalidArgument : public McdException
    {
        explicit McdInvalidArgument(const std::string& msg)
        : McdException{ msg } {
        }

        explicit McdInvalidArgument(const char* msg)
        : McdException{ msg } {
        }

        virtual ~McdInvalidArgument() = default;
    };

    // accessor invoked against an entity of another type
    struct McdTypeMismatch : public McdException
    {
        explicit McdTypeMismatch(const std::string& msg)
        : McdException{ msg } {
        }

        explicit McdTypeMismatch(const char* msg)
        : McdException{ msg } {
        }

        virtual ~McdTypeMismatch() = default;
    };

    // index outside of the entity or not representable by the native api
    struct McdOutOfRange : public McdException
    {
        explicit McdOutOfRange(const std::string& msg)
        : McdException{ msg } {
        }

        explicit McdOutOfRange(const char* msg)
        : McdException{ msg } {
        }

        virtual ~McdOutOfRange() = default;
    };

    // optional component not compiled in
    struct McdDependencyMissing : public McdException
    {
        explicit McdDependencyMissing(const std::string& msg)
        : McdException{ msg } {
        }

        explicit McdDependencyMissing(const char* msg)
        : McdException{ msg } {
        }

        virtual ~McdDependencyMissing() = default;
    };

    // the native library failed to deliver or delivered garbage
    struct McdData : public McdException
    {
        explicit McdData(const std::string& msg)
        : McdException{ msg } {
        }

        explicit McdData(const char* msg)
        : McdException{ msg } {
        }

        virtual ~McdData() = default;
    };

    // inconsistent state, detected a bug in this library
    struct McdBug : public McdException
    {
        explicit McdBug(const std::string& msg)
        : McdException{ msg } {
        }

        explicit McdBug(const char* msg)
        : McdException{ msg } {
        }

        virtual ~McdBug() = default;
    };

} /* namespace v1 */ } /* namespace api */ } /* namespace mcd */
