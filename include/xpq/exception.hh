/*
 * This file is open source software, licensed to you under the terms
 * of the Apache License, Version 2.0 (the "License").  See the NOTICE file
 * distributed with this work for additional information regarding copyright
 * ownership.  You may not use this file except in compliance with the License.
 *
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 */
/*
 * Copyright (C) 2020 ScyllaDB
 */

#pragma once

#include <seastar/core/print.hh>
#include <exception>
#include <string>

namespace xpq {

class xpq_exception : public std::exception {
    std::string _msg;
public:
    ~xpq_exception() throw() override {}

    static xpq_exception corrupted_file(const std::string& msg) {
        return xpq_exception(seastar::format("Invalid or corrupted parquet file: {}", msg));
    }

    static xpq_exception not_implemented(const std::string& msg) {
        return xpq_exception(seastar::format("Not implemented: {}", msg));
    }

    explicit xpq_exception(const char* msg) : _msg(msg) {}

    explicit xpq_exception(std::string msg) : _msg(std::move(msg)) {}

    const char* what() const throw() override { return _msg.c_str(); }
};

// The file footer, its thrift metadata or the schema it describes is malformed.
class metadata_error : public xpq_exception {
public:
    using xpq_exception::xpq_exception;
};

// The level streams of a row group cannot be assembled into the declared number of rows.
class assembly_error : public xpq_exception {
    int _row_group;
public:
    assembly_error(int row_group, const std::string& msg)
        : xpq_exception(seastar::format("Row group {}: {}", row_group, msg))
        , _row_group(row_group) {}
    int row_group() const { return _row_group; }
};

// A scalar payload does not match its declared physical type.
class format_error : public xpq_exception {
public:
    using xpq_exception::xpq_exception;
};

class invalid_column : public xpq_exception {
public:
    using xpq_exception::xpq_exception;
};

class invalid_sample_size : public xpq_exception {
public:
    using xpq_exception::xpq_exception;
};

class invalid_argument : public xpq_exception {
public:
    using xpq_exception::xpq_exception;
};

} // namespace xpq
