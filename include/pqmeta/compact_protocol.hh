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

/* A decoder for the Thrift Compact Protocol, which is the encoding of all
 * metadata structures embedded in parquet files (footer, page headers).
 * The wire format is described in:
 * https://github.com/apache/thrift/blob/master/doc/specs/thrift-compact-protocol.md
 *
 * compact_reader does not know any struct schema. It decodes primitives and
 * structural headers, and it can skip values of any wire type, so that the
 * record decoders built on top of it (metadata.hh) can ignore unknown fields.
 */

#pragma once

#include <pqmeta/bytes.hh>
#include <pqmeta/exception.hh>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace pqmeta {

enum class wire_type : uint8_t {
    STOP = 0,
    BOOLEAN_TRUE = 1,
    BOOLEAN_FALSE = 2,
    BYTE = 3,
    I16 = 4,
    I32 = 5,
    I64 = 6,
    DOUBLE = 7,
    BINARY = 8,
    LIST = 9,
    SET = 10,
    MAP = 11,
    STRUCT = 12,
};

const char* to_string(wire_type t);
std::ostream& operator<<(std::ostream& out, wire_type t);

struct field_header {
    wire_type type;
    int16_t id; // 0 for STOP
};

struct list_header {
    wire_type element_type;
    uint32_t size;
};

struct map_header {
    wire_type key_type; // STOP if size == 0
    wire_type value_type; // STOP if size == 0
    uint32_t size;
};

/* A cursor over a borrowed, immutable byte view.
 * The bytes must outlive the reader. The reader is meant to live on the stack
 * of a single decode call and is not safe for concurrent use.
 * Reads only go forward; the position never exceeds the size of the view.
 */
class compact_reader {
public:
    // Parquet metadata structs nest at most ~6 levels deep.
    static constexpr size_t max_nesting = 8;
    // ceil(64 / 7)
    static constexpr size_t max_varint_bytes = 10;
    // Bounds the recursion of skip() through nested containers.
    static constexpr size_t max_skip_depth = 64;
private:
    bytes_view _data;
    size_t _pos = 0;
    int16_t _last_field_id = 0;
    std::array<int16_t, max_nesting> _field_id_stack{};
    size_t _depth = 0;
    // The compact protocol encodes the value of a boolean field in the type
    // nibble of its field header.
    std::optional<bool> _pending_bool;
private:
    void ensure_available(size_t n, const char* what) const;
    void skip(wire_type type, size_t depth);
public:
    explicit compact_reader(bytes_view data) : _data{data} {}

    size_t position() const { return _pos; }
    size_t remaining() const { return _data.size() - _pos; }
    size_t depth() const { return _depth; }
    int16_t last_field_id() const { return _last_field_id; }

    uint8_t read_byte() {
        ensure_available(1, "byte");
        return _data[_pos++];
    }
    uint64_t read_varint();
    int32_t read_zigzag32() {
        uint32_t n = static_cast<uint32_t>(read_varint());
        return static_cast<int32_t>((n >> 1) ^ -(n & 1));
    }
    int64_t read_zigzag64() {
        uint64_t n = read_varint();
        return static_cast<int64_t>((n >> 1) ^ -(n & 1));
    }
    int16_t read_i16() { return static_cast<int16_t>(read_zigzag32()); }
    int32_t read_i32() { return read_zigzag32(); }
    int64_t read_i64() { return read_zigzag64(); }
    double read_double();
    // The returned view points into the decoded buffer.
    bytes_view read_binary();
    std::string read_string();
    bool read_bool();

    field_header read_field_header();
    list_header read_list_header();
    map_header read_map_header();

    // Must bracket the fields of every struct, because field id deltas are
    // relative to the start of the enclosing struct.
    void push_struct();
    void pop_struct();

    void skip(wire_type type) { skip(type, 0); }
};

} // namespace pqmeta
