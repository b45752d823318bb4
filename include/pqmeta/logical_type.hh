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

/* Logical type annotations of leaf and group nodes, as described in:
 * https://github.com/apache/parquet-format/blob/master/LogicalTypes.md
 *
 * In the footer they are a thrift union. Each member below corresponds to
 * one member of that union.
 */

#pragma once

#include <cstdint>
#include <ostream>
#include <variant>

namespace pqmeta::logical_type {

enum class time_unit { MILLIS, MICROS, NANOS };

struct STRING {};
struct MAP {};
struct LIST {};
struct ENUM {};
struct DECIMAL {
    int32_t scale;
    int32_t precision;
};
struct DATE {};
struct TIME {
    bool utc_adjustment;
    time_unit unit;
};
struct TIMESTAMP {
    bool utc_adjustment;
    time_unit unit;
};
struct INTEGER {
    int8_t bit_width;
    bool is_signed;
};
// Always-null column ("UNKNOWN" in the format).
struct NULL_TYPE {};
struct JSON {};
struct BSON {};
struct UUID {};
struct FLOAT16 {};
// A union member introduced after this reader was written.
struct UNRECOGNIZED {
    int16_t field_id;
};

using logical_type = std::variant<
        STRING,
        MAP,
        LIST,
        ENUM,
        DECIMAL,
        DATE,
        TIME,
        TIMESTAMP,
        INTEGER,
        NULL_TYPE,
        JSON,
        BSON,
        UUID,
        FLOAT16,
        UNRECOGNIZED
>;

std::ostream& operator<<(std::ostream& out, time_unit u);
std::ostream& operator<<(std::ostream& out, const logical_type& t);

} // namespace pqmeta::logical_type
