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

namespace pqmeta {

/*
 * The base of the exceptions thrown by code concerning parquet metadata logic.
 * Other exceptions (of type std::exception) might also arise from the
 * library functions in case of other errors.
 *
 * The library provides only the basic exception safety guarantee.
 *
 * If an exception arises while decoding a metadata blob, the decoder
 * shall be considered broken and it may not be used in any way other
 * than destruction. No partially decoded result is ever returned.
 */
class pqmeta_exception : public std::exception {
    std::string _msg;
public:
    ~pqmeta_exception() throw() override {}

    explicit pqmeta_exception(const char* msg) : _msg(msg) {}

    explicit pqmeta_exception(std::string msg) : _msg(std::move(msg)) {}

    const char* what() const throw() override { return _msg.c_str(); }
};

// Thrown by the compact protocol decoder and the metadata record decoder:
// premature end of data, invalid lengths, overlong varints, nesting overflow,
// unknown wire types, missing required fields.
class malformed_metadata : public pqmeta_exception {
public:
    explicit malformed_metadata(const std::string& msg)
        : pqmeta_exception(seastar::format("Malformed metadata: {}", msg)) {}
};

// Thrown when the flat schema element list cannot be turned into a schema tree.
class malformed_schema : public pqmeta_exception {
public:
    explicit malformed_schema(const std::string& msg)
        : pqmeta_exception(seastar::format("Malformed schema: {}", msg)) {}
};

} // namespace pqmeta
