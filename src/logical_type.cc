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

#include <pqmeta/logical_type.hh>
#include <pqmeta/overloaded.hh>

namespace pqmeta::logical_type {

std::ostream& operator<<(std::ostream& out, time_unit u) {
    switch (u) {
    case time_unit::MILLIS: return out << "MILLIS";
    case time_unit::MICROS: return out << "MICROS";
    case time_unit::NANOS: return out << "NANOS";
    }
    return out << "UNKNOWN";
}

std::ostream& operator<<(std::ostream& out, const logical_type& t) {
    std::visit(overloaded {
        [&] (const STRING&) { out << "STRING"; },
        [&] (const MAP&) { out << "MAP"; },
        [&] (const LIST&) { out << "LIST"; },
        [&] (const ENUM&) { out << "ENUM"; },
        [&] (const DECIMAL& x) { out << "DECIMAL(" << x.precision << "," << x.scale << ")"; },
        [&] (const DATE&) { out << "DATE"; },
        [&] (const TIME& x) {
            out << "TIME(" << x.unit << (x.utc_adjustment ? ",UTC" : "") << ")";
        },
        [&] (const TIMESTAMP& x) {
            out << "TIMESTAMP(" << x.unit << (x.utc_adjustment ? ",UTC" : "") << ")";
        },
        [&] (const INTEGER& x) {
            out << (x.is_signed ? "INT(" : "UINT(") << static_cast<int>(x.bit_width) << ")";
        },
        [&] (const NULL_TYPE&) { out << "NULL"; },
        [&] (const JSON&) { out << "JSON"; },
        [&] (const BSON&) { out << "BSON"; },
        [&] (const UUID&) { out << "UUID"; },
        [&] (const FLOAT16&) { out << "FLOAT16"; },
        [&] (const UNRECOGNIZED& x) { out << "UNRECOGNIZED(" << x.field_id << ")"; },
    }, t);
    return out;
}

} // namespace pqmeta::logical_type
