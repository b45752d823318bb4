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

#define BOOST_TEST_MODULE pqmeta

#include <pqmeta/compact_protocol.hh>
#include "thrift_reference.hh"

#include <boost/test/included/unit_test.hpp>

#include <array>
#include <cmath>
#include <limits>
#include <vector>

using namespace pqmeta;
using pqmeta::testing::reference_writer;
using apache::thrift::protocol::TType;

namespace {

template <size_t N>
bytes_view view(const std::array<uint8_t, N>& a) {
    return bytes_view{a.data(), a.size()};
}

} // namespace

BOOST_AUTO_TEST_CASE(varint_happy) {
    std::array<uint8_t, 16> packed = {
        0x00, // 0
        0x7f, // 127
        0x80, 0x01, // 128
        0xac, 0x02, // 300
        0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x01, // UINT64_MAX
    };
    compact_reader reader{view(packed)};
    BOOST_CHECK_EQUAL(reader.read_varint(), 0u);
    BOOST_CHECK_EQUAL(reader.read_varint(), 127u);
    BOOST_CHECK_EQUAL(reader.read_varint(), 128u);
    BOOST_CHECK_EQUAL(reader.read_varint(), 300u);
    BOOST_CHECK_EQUAL(reader.read_varint(), std::numeric_limits<uint64_t>::max());
    BOOST_CHECK_EQUAL(reader.position(), packed.size());
    BOOST_CHECK_EQUAL(reader.remaining(), 0u);
}

BOOST_AUTO_TEST_CASE(varint_truncated) {
    std::array<uint8_t, 2> packed = {0x80, 0x80};
    compact_reader reader{view(packed)};
    BOOST_CHECK_THROW(reader.read_varint(), malformed_metadata);
    BOOST_CHECK_LE(reader.position(), packed.size());
}

BOOST_AUTO_TEST_CASE(varint_overflow) {
    // The tenth group carries bits above bit 63.
    std::array<uint8_t, 10> packed = {0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x7f};
    compact_reader reader{view(packed)};
    BOOST_CHECK_THROW(reader.read_varint(), malformed_metadata);

    std::array<uint8_t, 10> top_bit = {0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x01};
    compact_reader top{view(top_bit)};
    BOOST_CHECK_EQUAL(top.read_varint(), uint64_t(1) << 63);
}

BOOST_AUTO_TEST_CASE(varint_too_long) {
    std::array<uint8_t, 11> packed = {0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x01};
    compact_reader reader{view(packed)};
    BOOST_CHECK_THROW(reader.read_varint(), malformed_metadata);
}

BOOST_AUTO_TEST_CASE(zigzag_round_trip) {
    const std::vector<int32_t> values32 = {
        0, 1, -1, 2, -2, 63, -64, 64, 1 << 20, -(1 << 20),
        std::numeric_limits<int32_t>::max(), std::numeric_limits<int32_t>::min()};
    const std::vector<int64_t> values64 = {
        0, 1, -1, int64_t(1) << 40, -(int64_t(1) << 40),
        std::numeric_limits<int64_t>::max(), std::numeric_limits<int64_t>::min()};
    const std::vector<int16_t> values16 = {
        0, -1, 300, -300, std::numeric_limits<int16_t>::max(), std::numeric_limits<int16_t>::min()};

    reference_writer w;
    for (int32_t v : values32) { w->writeI32(v); }
    for (int64_t v : values64) { w->writeI64(v); }
    for (int16_t v : values16) { w->writeI16(v); }
    bytes data = w.data();

    compact_reader reader{data};
    for (int32_t v : values32) { BOOST_CHECK_EQUAL(reader.read_zigzag32(), v); }
    for (int64_t v : values64) { BOOST_CHECK_EQUAL(reader.read_zigzag64(), v); }
    for (int16_t v : values16) { BOOST_CHECK_EQUAL(reader.read_i16(), v); }
    BOOST_CHECK_EQUAL(reader.remaining(), 0u);
}

BOOST_AUTO_TEST_CASE(zigzag_small_values_are_compact) {
    std::array<uint8_t, 4> packed = {0x00, 0x01, 0x02, 0x03}; // 0, -1, 1, -2
    compact_reader reader{view(packed)};
    BOOST_CHECK_EQUAL(reader.read_zigzag32(), 0);
    BOOST_CHECK_EQUAL(reader.read_zigzag32(), -1);
    BOOST_CHECK_EQUAL(reader.read_zigzag64(), 1);
    BOOST_CHECK_EQUAL(reader.read_zigzag64(), -2);
}

BOOST_AUTO_TEST_CASE(double_happy) {
    reference_writer w;
    w->writeDouble(3.141592653589793);
    w->writeDouble(-0.0);
    w->writeDouble(std::numeric_limits<double>::infinity());
    bytes data = w.data();
    BOOST_REQUIRE_EQUAL(data.size(), 24u);

    compact_reader reader{data};
    BOOST_CHECK_EQUAL(reader.read_double(), 3.141592653589793);
    double negative_zero = reader.read_double();
    BOOST_CHECK_EQUAL(negative_zero, 0.0);
    BOOST_CHECK(std::signbit(negative_zero));
    BOOST_CHECK(std::isinf(reader.read_double()));
}

BOOST_AUTO_TEST_CASE(double_little_endian) {
    // 1.0 is 0x3ff0000000000000
    std::array<uint8_t, 8> packed = {0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xf0, 0x3f};
    compact_reader reader{view(packed)};
    BOOST_CHECK_EQUAL(reader.read_double(), 1.0);
}

BOOST_AUTO_TEST_CASE(double_truncated) {
    std::array<uint8_t, 7> packed = {};
    compact_reader reader{view(packed)};
    BOOST_CHECK_THROW(reader.read_double(), malformed_metadata);
    BOOST_CHECK_EQUAL(reader.position(), 0u);
}

BOOST_AUTO_TEST_CASE(binary_and_string) {
    const std::string raw("\x00\x01\xff parquet", 10);
    const std::string text = "za\xc5\xbc\xc3\xb3\xc5\x82\xc4\x87"; // "zażółć"
    reference_writer w;
    w->writeBinary(raw);
    w->writeString(text);
    w->writeBinary("");
    bytes data = w.data();

    compact_reader reader{data};
    bytes_view b = reader.read_binary();
    BOOST_CHECK(to_string_view(b) == raw);
    // The view points into the decoded buffer, no copy is made.
    BOOST_CHECK(b.data() == data.data() + 1);
    BOOST_CHECK_EQUAL(reader.read_string(), text);
    BOOST_CHECK_EQUAL(reader.read_string(), "");
    BOOST_CHECK_EQUAL(reader.remaining(), 0u);
}

BOOST_AUTO_TEST_CASE(binary_length_exceeds_data) {
    std::array<uint8_t, 3> packed = {0x05, 'a', 'b'};
    compact_reader reader{view(packed)};
    BOOST_CHECK_THROW(reader.read_binary(), malformed_metadata);
}

BOOST_AUTO_TEST_CASE(binary_huge_length) {
    // A length which doesn't fit in 32 bits.
    std::array<uint8_t, 6> packed = {0xff, 0xff, 0xff, 0xff, 0xff, 0x0f};
    compact_reader reader{view(packed)};
    BOOST_CHECK_THROW(reader.read_string(), malformed_metadata);
}

BOOST_AUTO_TEST_CASE(field_id_deltas) {
    reference_writer w;
    w->writeStructBegin("s");
    w->writeFieldBegin("f1", TType::T_I32, 1);
    w->writeI32(10);
    w->writeFieldEnd();
    w->writeFieldBegin("f2", TType::T_I64, 2);
    w->writeI64(20);
    w->writeFieldEnd();
    w->writeFieldBegin("f5", TType::T_STRING, 5);
    w->writeString("x");
    w->writeFieldEnd();
    w->writeFieldStop();
    w->writeStructEnd();
    bytes data = w.data();

    // Deltas 1, 1, 3 in the high nibble.
    BOOST_CHECK_EQUAL(data[0], 0x15);

    compact_reader reader{data};
    reader.push_struct();
    field_header h = reader.read_field_header();
    BOOST_CHECK_EQUAL(h.id, 1);
    BOOST_CHECK_EQUAL(h.type, wire_type::I32);
    BOOST_CHECK_EQUAL(reader.read_i32(), 10);
    h = reader.read_field_header();
    BOOST_CHECK_EQUAL(h.id, 2);
    BOOST_CHECK_EQUAL(h.type, wire_type::I64);
    BOOST_CHECK_EQUAL(reader.read_i64(), 20);
    h = reader.read_field_header();
    BOOST_CHECK_EQUAL(h.id, 5);
    BOOST_CHECK_EQUAL(h.type, wire_type::BINARY);
    BOOST_CHECK_EQUAL(reader.read_string(), "x");
    h = reader.read_field_header();
    BOOST_CHECK_EQUAL(h.type, wire_type::STOP);
    BOOST_CHECK_EQUAL(h.id, 0);
    reader.pop_struct();
    BOOST_CHECK_EQUAL(reader.remaining(), 0u);
}

BOOST_AUTO_TEST_CASE(field_id_long_form) {
    reference_writer w;
    w->writeStructBegin("s");
    w->writeFieldBegin("f1", TType::T_I32, 1);
    w->writeI32(1);
    w->writeFieldEnd();
    w->writeFieldBegin("f20", TType::T_I32, 20);
    w->writeI32(2);
    w->writeFieldEnd();
    w->writeFieldBegin("f21", TType::T_I32, 21);
    w->writeI32(3);
    w->writeFieldEnd();
    w->writeFieldBegin("f3", TType::T_I32, 3);
    w->writeI32(4);
    w->writeFieldEnd();
    w->writeFieldBegin("f1000", TType::T_I32, 1000);
    w->writeI32(5);
    w->writeFieldEnd();
    w->writeFieldStop();
    w->writeStructEnd();
    bytes data = w.data();

    compact_reader reader{data};
    reader.push_struct();
    const std::array<int16_t, 5> expected_ids = {1, 20, 21, 3, 1000};
    for (size_t i = 0; i < expected_ids.size(); ++i) {
        field_header h = reader.read_field_header();
        BOOST_CHECK_EQUAL(h.id, expected_ids[i]);
        BOOST_CHECK_EQUAL(h.type, wire_type::I32);
        BOOST_CHECK_EQUAL(reader.read_i32(), static_cast<int32_t>(i + 1));
        BOOST_CHECK_EQUAL(reader.last_field_id(), expected_ids[i]);
    }
    BOOST_CHECK_EQUAL(reader.read_field_header().type, wire_type::STOP);
    reader.pop_struct();
}

BOOST_AUTO_TEST_CASE(pending_bool) {
    // Field 1 of type BOOLEAN_TRUE, followed by a literal false byte.
    std::array<uint8_t, 2> packed = {0x11, 0x00};
    compact_reader reader{view(packed)};
    field_header h = reader.read_field_header();
    BOOST_CHECK_EQUAL(h.type, wire_type::BOOLEAN_TRUE);
    BOOST_CHECK_EQUAL(h.id, 1);
    BOOST_CHECK_EQUAL(reader.position(), 1u);
    BOOST_CHECK_EQUAL(reader.read_bool(), true);
    BOOST_CHECK_EQUAL(reader.position(), 1u);
    BOOST_CHECK_EQUAL(reader.read_bool(), false);
    BOOST_CHECK_EQUAL(reader.position(), 2u);
}

BOOST_AUTO_TEST_CASE(bool_fields_and_elements) {
    reference_writer w;
    w->writeStructBegin("s");
    w->writeFieldBegin("t", TType::T_BOOL, 1);
    w->writeBool(true);
    w->writeFieldEnd();
    w->writeFieldBegin("f", TType::T_BOOL, 2);
    w->writeBool(false);
    w->writeFieldEnd();
    w->writeFieldBegin("l", TType::T_LIST, 3);
    w->writeListBegin(TType::T_BOOL, 3);
    w->writeBool(true);
    w->writeBool(false);
    w->writeBool(true);
    w->writeListEnd();
    w->writeFieldEnd();
    w->writeFieldStop();
    w->writeStructEnd();
    bytes data = w.data();

    compact_reader reader{data};
    reader.push_struct();
    field_header h = reader.read_field_header();
    BOOST_CHECK_EQUAL(h.type, wire_type::BOOLEAN_TRUE);
    BOOST_CHECK_EQUAL(reader.read_bool(), true);
    h = reader.read_field_header();
    BOOST_CHECK_EQUAL(h.type, wire_type::BOOLEAN_FALSE);
    BOOST_CHECK_EQUAL(h.id, 2);
    BOOST_CHECK_EQUAL(reader.read_bool(), false);
    h = reader.read_field_header();
    BOOST_CHECK_EQUAL(h.type, wire_type::LIST);
    list_header lh = reader.read_list_header();
    BOOST_CHECK_EQUAL(lh.size, 3u);
    BOOST_CHECK_EQUAL(reader.read_bool(), true);
    BOOST_CHECK_EQUAL(reader.read_bool(), false);
    BOOST_CHECK_EQUAL(reader.read_bool(), true);
    BOOST_CHECK_EQUAL(reader.read_field_header().type, wire_type::STOP);
    reader.pop_struct();
}

BOOST_AUTO_TEST_CASE(list_headers) {
    reference_writer w;
    w->writeListBegin(TType::T_I32, 0);
    w->writeListBegin(TType::T_STRING, 14);
    for (int i = 0; i < 14; ++i) {
        w->writeString("");
    }
    w->writeSetBegin(TType::T_I64, 15);
    for (int i = 0; i < 15; ++i) {
        w->writeI64(i);
    }
    w->writeListBegin(TType::T_STRUCT, 1000);
    for (int i = 0; i < 1000; ++i) {
        w->writeStructBegin("s");
        w->writeFieldStop();
        w->writeStructEnd();
    }
    bytes data = w.data();

    compact_reader reader{data};
    list_header h = reader.read_list_header();
    BOOST_CHECK_EQUAL(h.element_type, wire_type::I32);
    BOOST_CHECK_EQUAL(h.size, 0u);

    size_t start = reader.position();
    h = reader.read_list_header();
    BOOST_CHECK_EQUAL(h.element_type, wire_type::BINARY);
    BOOST_CHECK_EQUAL(h.size, 14u);
    BOOST_CHECK_EQUAL(reader.position(), start + 1); // Inline size.
    for (int i = 0; i < 14; ++i) {
        reader.skip(h.element_type);
    }

    start = reader.position();
    h = reader.read_list_header();
    BOOST_CHECK_EQUAL(h.element_type, wire_type::I64);
    BOOST_CHECK_EQUAL(h.size, 15u);
    BOOST_CHECK_EQUAL(reader.position(), start + 2); // Escaped size.
    for (int64_t i = 0; i < 15; ++i) {
        BOOST_CHECK_EQUAL(reader.read_i64(), i);
    }

    h = reader.read_list_header();
    BOOST_CHECK_EQUAL(h.element_type, wire_type::STRUCT);
    BOOST_CHECK_EQUAL(h.size, 1000u);
    for (int i = 0; i < 1000; ++i) {
        reader.skip(h.element_type);
    }
    BOOST_CHECK_EQUAL(reader.remaining(), 0u);
}

BOOST_AUTO_TEST_CASE(headers_without_elements) {
    // Escaped list of 20 i32.
    std::array<uint8_t, 2> escaped = {0xf5, 0x14};
    compact_reader r1{view(escaped)};
    list_header lh = r1.read_list_header();
    BOOST_CHECK_EQUAL(lh.element_type, wire_type::I32);
    BOOST_CHECK_EQUAL(lh.size, 20u);
    BOOST_CHECK_EQUAL(r1.remaining(), 0u);

    // Inline list of 3 binaries.
    std::array<uint8_t, 1> inline_list = {0x38};
    compact_reader r2{view(inline_list)};
    lh = r2.read_list_header();
    BOOST_CHECK_EQUAL(lh.element_type, wire_type::BINARY);
    BOOST_CHECK_EQUAL(lh.size, 3u);

    // Map of 3 (binary, binary).
    std::array<uint8_t, 2> map = {0x03, 0x88};
    compact_reader r3{view(map)};
    map_header mh = r3.read_map_header();
    BOOST_CHECK_EQUAL(mh.size, 3u);
    BOOST_CHECK_EQUAL(mh.key_type, wire_type::BINARY);
    BOOST_CHECK_EQUAL(mh.value_type, wire_type::BINARY);
    BOOST_CHECK_EQUAL(r3.position(), 2u);

    // Skipping the contents still runs out of data.
    compact_reader r4{view(escaped)};
    BOOST_CHECK_THROW(r4.skip(wire_type::LIST), malformed_metadata);
}

BOOST_AUTO_TEST_CASE(container_size_out_of_range) {
    // 2^32 elements.
    std::array<uint8_t, 6> list = {0xfc, 0x80, 0x80, 0x80, 0x80, 0x10};
    compact_reader r1{view(list)};
    BOOST_CHECK_THROW(r1.read_list_header(), malformed_metadata);

    std::array<uint8_t, 6> map = {0x80, 0x80, 0x80, 0x80, 0x10, 0x55};
    compact_reader r2{view(map)};
    BOOST_CHECK_THROW(r2.read_map_header(), malformed_metadata);
}

BOOST_AUTO_TEST_CASE(map_headers) {
    reference_writer w;
    w->writeMapBegin(TType::T_I32, TType::T_STRING, 0);
    w->writeMapBegin(TType::T_I32, TType::T_STRING, 3);
    for (int i = 0; i < 3; ++i) {
        w->writeI32(i);
        w->writeString("v");
    }
    w->writeMapEnd();
    bytes data = w.data();

    compact_reader reader{data};
    map_header h = reader.read_map_header();
    BOOST_CHECK_EQUAL(h.size, 0u);
    BOOST_CHECK_EQUAL(h.key_type, wire_type::STOP);
    BOOST_CHECK_EQUAL(h.value_type, wire_type::STOP);
    // No types byte follows an empty map.
    BOOST_CHECK_EQUAL(reader.position(), 1u);

    h = reader.read_map_header();
    BOOST_CHECK_EQUAL(h.size, 3u);
    BOOST_CHECK_EQUAL(h.key_type, wire_type::I32);
    BOOST_CHECK_EQUAL(h.value_type, wire_type::BINARY);
    for (int32_t i = 0; i < 3; ++i) {
        BOOST_CHECK_EQUAL(reader.read_i32(), i);
        BOOST_CHECK_EQUAL(reader.read_string(), "v");
    }
    BOOST_CHECK_EQUAL(reader.remaining(), 0u);
}

BOOST_AUTO_TEST_CASE(nesting_limit) {
    compact_reader reader{bytes_view{}};
    for (size_t i = 0; i < compact_reader::max_nesting; ++i) {
        reader.push_struct();
        BOOST_CHECK_EQUAL(reader.depth(), i + 1);
    }
    BOOST_CHECK_THROW(reader.push_struct(), malformed_metadata);
    for (size_t i = 0; i < compact_reader::max_nesting; ++i) {
        reader.pop_struct();
    }
    BOOST_CHECK_EQUAL(reader.depth(), 0u);
    BOOST_CHECK_THROW(reader.pop_struct(), malformed_metadata);
}

BOOST_AUTO_TEST_CASE(nested_struct_restores_field_id) {
    reference_writer w;
    w->writeStructBegin("outer");
    w->writeFieldBegin("inner", TType::T_STRUCT, 5);
    w->writeStructBegin("inner");
    w->writeFieldBegin("x", TType::T_I32, 2);
    w->writeI32(-7);
    w->writeFieldEnd();
    w->writeFieldStop();
    w->writeStructEnd();
    w->writeFieldEnd();
    w->writeFieldBegin("y", TType::T_I32, 6);
    w->writeI32(7);
    w->writeFieldEnd();
    w->writeFieldStop();
    w->writeStructEnd();
    bytes data = w.data();

    compact_reader reader{data};
    reader.push_struct();
    field_header h = reader.read_field_header();
    BOOST_CHECK_EQUAL(h.id, 5);
    BOOST_CHECK_EQUAL(h.type, wire_type::STRUCT);
    reader.push_struct();
    BOOST_CHECK_EQUAL(reader.last_field_id(), 0);
    h = reader.read_field_header();
    BOOST_CHECK_EQUAL(h.id, 2);
    BOOST_CHECK_EQUAL(reader.read_i32(), -7);
    BOOST_CHECK_EQUAL(reader.read_field_header().type, wire_type::STOP);
    reader.pop_struct();
    BOOST_CHECK_EQUAL(reader.last_field_id(), 5);
    h = reader.read_field_header();
    BOOST_CHECK_EQUAL(h.id, 6);
    BOOST_CHECK_EQUAL(reader.read_i32(), 7);
    BOOST_CHECK_EQUAL(reader.read_field_header().type, wire_type::STOP);
    reader.pop_struct();
    BOOST_CHECK_EQUAL(reader.depth(), 0u);
    BOOST_CHECK_EQUAL(reader.remaining(), 0u);
}

BOOST_AUTO_TEST_CASE(skip_unknown_struct) {
    reference_writer w;
    w->writeStructBegin("outer");
    w->writeFieldBegin("unknown", TType::T_STRUCT, 1);
    w->writeStructBegin("unknown");
    w->writeFieldBegin("a", TType::T_I32, 1);
    w->writeI32(123456);
    w->writeFieldEnd();
    w->writeFieldBegin("b", TType::T_MAP, 2);
    w->writeMapBegin(TType::T_I32, TType::T_STRING, 3);
    for (int32_t i = 0; i < 3; ++i) {
        w->writeI32(i);
        w->writeString("value");
    }
    w->writeMapEnd();
    w->writeFieldEnd();
    w->writeFieldBegin("c", TType::T_DOUBLE, 3);
    w->writeDouble(0.5);
    w->writeFieldEnd();
    w->writeFieldBegin("d", TType::T_BOOL, 4);
    w->writeBool(true);
    w->writeFieldEnd();
    w->writeFieldStop();
    w->writeStructEnd();
    w->writeFieldEnd();
    w->writeFieldBegin("known", TType::T_I64, 2);
    w->writeI64(42);
    w->writeFieldEnd();
    w->writeFieldStop();
    w->writeStructEnd();
    bytes data = w.data();

    compact_reader reader{data};
    reader.push_struct();
    field_header h = reader.read_field_header();
    BOOST_REQUIRE_EQUAL(h.type, wire_type::STRUCT);
    reader.skip(h.type);
    BOOST_CHECK_EQUAL(reader.depth(), 1u);
    h = reader.read_field_header();
    BOOST_CHECK_EQUAL(h.id, 2);
    BOOST_CHECK_EQUAL(h.type, wire_type::I64);
    BOOST_CHECK_EQUAL(reader.read_i64(), 42);
    BOOST_CHECK_EQUAL(reader.read_field_header().type, wire_type::STOP);
    reader.pop_struct();
    BOOST_CHECK_EQUAL(reader.remaining(), 0u);
}

BOOST_AUTO_TEST_CASE(skip_bool_list) {
    reference_writer w;
    w->writeListBegin(TType::T_BOOL, 3);
    w->writeBool(true);
    w->writeBool(false);
    w->writeBool(true);
    w->writeListEnd();
    w->writeI32(99);
    bytes data = w.data();

    compact_reader reader{data};
    reader.skip(wire_type::LIST);
    BOOST_CHECK_EQUAL(reader.read_i32(), 99);
    BOOST_CHECK_EQUAL(reader.remaining(), 0u);
}

BOOST_AUTO_TEST_CASE(skip_unknown_wire_type) {
    // Field 1 with wire type 13.
    std::array<uint8_t, 2> packed = {0x1d, 0x00};
    compact_reader reader{view(packed)};
    reader.push_struct();
    field_header h = reader.read_field_header();
    BOOST_CHECK_EQUAL(h.id, 1);
    BOOST_CHECK_THROW(reader.skip(h.type), malformed_metadata);
}

BOOST_AUTO_TEST_CASE(skip_truncated) {
    reference_writer w;
    w->writeDouble(1.0);
    bytes data = w.data();
    compact_reader reader{bytes_view{data.data(), data.size() - 1}};
    BOOST_CHECK_THROW(reader.skip(wire_type::DOUBLE), malformed_metadata);
    compact_reader empty{bytes_view{}};
    BOOST_CHECK_THROW(empty.skip(wire_type::BYTE), malformed_metadata);
}

BOOST_AUTO_TEST_CASE(skip_depth_limit) {
    // Lists of one list each, nested 100 deep.
    std::vector<uint8_t> packed(100, 0x19);
    compact_reader reader{bytes_view{packed.data(), packed.size()}};
    BOOST_CHECK_THROW(reader.skip(wire_type::LIST), malformed_metadata);
}
