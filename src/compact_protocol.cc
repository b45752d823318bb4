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

#include <pqmeta/compact_protocol.hh>
#include <cstring>
#include <limits>

namespace pqmeta {

const char* to_string(wire_type t) {
    switch (t) {
    case wire_type::STOP: return "STOP";
    case wire_type::BOOLEAN_TRUE: return "BOOLEAN_TRUE";
    case wire_type::BOOLEAN_FALSE: return "BOOLEAN_FALSE";
    case wire_type::BYTE: return "BYTE";
    case wire_type::I16: return "I16";
    case wire_type::I32: return "I32";
    case wire_type::I64: return "I64";
    case wire_type::DOUBLE: return "DOUBLE";
    case wire_type::BINARY: return "BINARY";
    case wire_type::LIST: return "LIST";
    case wire_type::SET: return "SET";
    case wire_type::MAP: return "MAP";
    case wire_type::STRUCT: return "STRUCT";
    }
    return "UNKNOWN";
}

std::ostream& operator<<(std::ostream& out, wire_type t) {
    return out << to_string(t);
}

void compact_reader::ensure_available(size_t n, const char* what) const {
    if (remaining() < n) {
        throw malformed_metadata(seastar::format(
                "Unexpected end of data reading {} at offset {}: needed {}B, {}B remaining",
                what, _pos, n, remaining()));
    }
}

uint64_t compact_reader::read_varint() {
    uint64_t result = 0;
    for (size_t i = 0; i < max_varint_bytes; ++i) {
        if (_pos >= _data.size()) {
            throw malformed_metadata(seastar::format(
                    "Unexpected end of data inside varint at offset {}", _pos));
        }
        uint8_t b = _data[_pos++];
        // The last group may only carry bit 63.
        if (i == max_varint_bytes - 1 && (b & 0x7e)) {
            throw malformed_metadata(seastar::format(
                    "Varint ending at offset {} does not fit in 64 bits", _pos));
        }
        result |= static_cast<uint64_t>(b & 0x7f) << (7 * i);
        if ((b & 0x80) == 0) {
            return result;
        }
    }
    throw malformed_metadata(seastar::format(
            "Varint longer than {} bytes ending at offset {}", max_varint_bytes, _pos));
}

double compact_reader::read_double() {
    ensure_available(sizeof(double), "double");
    // Little endian on the wire, as on every supported host.
    double value;
    std::memcpy(&value, _data.data() + _pos, sizeof(value));
    _pos += sizeof(double);
    return value;
}

bytes_view compact_reader::read_binary() {
    uint64_t len = read_varint();
    if (len > remaining()) {
        throw malformed_metadata(seastar::format(
                "Invalid binary length {} at offset {}: only {}B remaining", len, _pos, remaining()));
    }
    bytes_view result = _data.substr(_pos, len);
    _pos += len;
    return result;
}

std::string compact_reader::read_string() {
    return std::string(to_string_view(read_binary()));
}

bool compact_reader::read_bool() {
    if (_pending_bool) {
        bool value = *_pending_bool;
        _pending_bool.reset();
        return value;
    }
    return read_byte() == 1;
}

field_header compact_reader::read_field_header() {
    _pending_bool.reset();
    uint8_t tag = read_byte();
    if (tag == 0) {
        return {wire_type::STOP, 0};
    }
    auto type = static_cast<wire_type>(tag & 0x0f);
    uint8_t delta = tag >> 4;
    int16_t id;
    if (delta != 0) {
        id = static_cast<int16_t>(_last_field_id + delta);
    } else {
        id = read_i16();
    }
    _last_field_id = id;
    if (type == wire_type::BOOLEAN_TRUE) {
        _pending_bool = true;
    } else if (type == wire_type::BOOLEAN_FALSE) {
        _pending_bool = false;
    }
    return {type, id};
}

list_header compact_reader::read_list_header() {
    uint8_t header = read_byte();
    auto element_type = static_cast<wire_type>(header & 0x0f);
    uint64_t size = header >> 4;
    if (size == 15) {
        size = read_varint();
    }
    // Container sizes are i32 in thrift.
    if (size > static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) {
        throw malformed_metadata(seastar::format("Invalid list size {} at offset {}", size, _pos));
    }
    return {element_type, static_cast<uint32_t>(size)};
}

map_header compact_reader::read_map_header() {
    uint64_t size = read_varint();
    if (size == 0) {
        return {wire_type::STOP, wire_type::STOP, 0};
    }
    if (size > static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) {
        throw malformed_metadata(seastar::format("Invalid map size {} at offset {}", size, _pos));
    }
    uint8_t types = read_byte();
    return {static_cast<wire_type>(types >> 4), static_cast<wire_type>(types & 0x0f), static_cast<uint32_t>(size)};
}

void compact_reader::push_struct() {
    if (_depth >= max_nesting) {
        throw malformed_metadata(seastar::format(
                "Struct nesting too deep at offset {}: limit is {}", _pos, max_nesting));
    }
    _field_id_stack[_depth++] = _last_field_id;
    _last_field_id = 0;
}

void compact_reader::pop_struct() {
    if (_depth == 0) {
        throw malformed_metadata(seastar::format("Struct stack underflow at offset {}", _pos));
    }
    _last_field_id = _field_id_stack[--_depth];
}

void compact_reader::skip(wire_type type, size_t depth) {
    if (depth > max_skip_depth) {
        throw malformed_metadata(seastar::format(
                "Containers nested deeper than {} at offset {}", max_skip_depth, _pos));
    }
    switch (type) {
    case wire_type::BOOLEAN_TRUE:
    case wire_type::BOOLEAN_FALSE:
        // A boolean field carries its value in the header. A boolean
        // collection element is a byte of its own.
        read_bool();
        break;
    case wire_type::BYTE:
        ensure_available(1, "byte");
        _pos += 1;
        break;
    case wire_type::I16:
    case wire_type::I32:
    case wire_type::I64:
        read_varint();
        break;
    case wire_type::DOUBLE:
        ensure_available(8, "double");
        _pos += 8;
        break;
    case wire_type::BINARY:
        read_binary();
        break;
    case wire_type::LIST:
    case wire_type::SET: {
        list_header h = read_list_header();
        for (uint32_t i = 0; i < h.size; ++i) {
            skip(h.element_type, depth + 1);
        }
        break;
    }
    case wire_type::MAP: {
        map_header h = read_map_header();
        for (uint32_t i = 0; i < h.size; ++i) {
            skip(h.key_type, depth + 1);
            skip(h.value_type, depth + 1);
        }
        break;
    }
    case wire_type::STRUCT:
        push_struct();
        for (;;) {
            field_header h = read_field_header();
            if (h.type == wire_type::STOP) {
                break;
            }
            skip(h.type, depth + 1);
        }
        pop_struct();
        break;
    default:
        throw malformed_metadata(seastar::format(
                "Cannot skip unknown wire type {} at offset {}", static_cast<int>(type), _pos));
    }
}

} // namespace pqmeta
