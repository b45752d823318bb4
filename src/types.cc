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

#include <pqmeta/types.hh>

namespace pqmeta {

namespace {

template <typename Enum>
std::ostream& print_unknown(std::ostream& out, Enum value) {
    return out << "UNKNOWN(" << static_cast<int32_t>(value) << ")";
}

} // namespace

std::ostream& operator<<(std::ostream& out, physical_type t) {
    switch (t) {
    case physical_type::BOOLEAN: return out << "BOOLEAN";
    case physical_type::INT32: return out << "INT32";
    case physical_type::INT64: return out << "INT64";
    case physical_type::INT96: return out << "INT96";
    case physical_type::FLOAT: return out << "FLOAT";
    case physical_type::DOUBLE: return out << "DOUBLE";
    case physical_type::BYTE_ARRAY: return out << "BYTE_ARRAY";
    case physical_type::FIXED_LEN_BYTE_ARRAY: return out << "FIXED_LEN_BYTE_ARRAY";
    }
    return print_unknown(out, t);
}

std::ostream& operator<<(std::ostream& out, repetition r) {
    switch (r) {
    case repetition::REQUIRED: return out << "REQUIRED";
    case repetition::OPTIONAL: return out << "OPTIONAL";
    case repetition::REPEATED: return out << "REPEATED";
    }
    return print_unknown(out, r);
}

std::ostream& operator<<(std::ostream& out, converted_type t) {
    switch (t) {
    case converted_type::UTF8: return out << "UTF8";
    case converted_type::MAP: return out << "MAP";
    case converted_type::MAP_KEY_VALUE: return out << "MAP_KEY_VALUE";
    case converted_type::LIST: return out << "LIST";
    case converted_type::ENUM: return out << "ENUM";
    case converted_type::DECIMAL: return out << "DECIMAL";
    case converted_type::DATE: return out << "DATE";
    case converted_type::TIME_MILLIS: return out << "TIME_MILLIS";
    case converted_type::TIME_MICROS: return out << "TIME_MICROS";
    case converted_type::TIMESTAMP_MILLIS: return out << "TIMESTAMP_MILLIS";
    case converted_type::TIMESTAMP_MICROS: return out << "TIMESTAMP_MICROS";
    case converted_type::UINT_8: return out << "UINT_8";
    case converted_type::UINT_16: return out << "UINT_16";
    case converted_type::UINT_32: return out << "UINT_32";
    case converted_type::UINT_64: return out << "UINT_64";
    case converted_type::INT_8: return out << "INT_8";
    case converted_type::INT_16: return out << "INT_16";
    case converted_type::INT_32: return out << "INT_32";
    case converted_type::INT_64: return out << "INT_64";
    case converted_type::JSON: return out << "JSON";
    case converted_type::BSON: return out << "BSON";
    case converted_type::INTERVAL: return out << "INTERVAL";
    }
    return print_unknown(out, t);
}

std::ostream& operator<<(std::ostream& out, encoding e) {
    switch (e) {
    case encoding::PLAIN: return out << "PLAIN";
    case encoding::PLAIN_DICTIONARY: return out << "PLAIN_DICTIONARY";
    case encoding::RLE: return out << "RLE";
    case encoding::BIT_PACKED: return out << "BIT_PACKED";
    case encoding::DELTA_BINARY_PACKED: return out << "DELTA_BINARY_PACKED";
    case encoding::DELTA_LENGTH_BYTE_ARRAY: return out << "DELTA_LENGTH_BYTE_ARRAY";
    case encoding::DELTA_BYTE_ARRAY: return out << "DELTA_BYTE_ARRAY";
    case encoding::RLE_DICTIONARY: return out << "RLE_DICTIONARY";
    case encoding::BYTE_STREAM_SPLIT: return out << "BYTE_STREAM_SPLIT";
    }
    return print_unknown(out, e);
}

std::ostream& operator<<(std::ostream& out, compression_codec c) {
    switch (c) {
    case compression_codec::UNCOMPRESSED: return out << "UNCOMPRESSED";
    case compression_codec::SNAPPY: return out << "SNAPPY";
    case compression_codec::GZIP: return out << "GZIP";
    case compression_codec::LZO: return out << "LZO";
    case compression_codec::BROTLI: return out << "BROTLI";
    case compression_codec::LZ4: return out << "LZ4";
    case compression_codec::ZSTD: return out << "ZSTD";
    case compression_codec::LZ4_RAW: return out << "LZ4_RAW";
    }
    return print_unknown(out, c);
}

} // namespace pqmeta
