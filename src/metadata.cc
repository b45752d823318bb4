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

#include <pqmeta/metadata.hh>
#include <pqmeta/logger.hh>

namespace pqmeta {

namespace {

void check_type(const field_header& h, wire_type expected, const char* struct_name) {
    bool matches = (h.type == expected)
            || (expected == wire_type::BOOLEAN_TRUE && h.type == wire_type::BOOLEAN_FALSE);
    if (!matches) {
        throw malformed_metadata(seastar::format("{} field {} has wire type {}, expected {}",
                struct_name, h.id, to_string(h.type), to_string(expected)));
    }
}

template <typename T>
T required(std::optional<T>& field, const char* struct_name, const char* field_name) {
    if (!field) {
        throw malformed_metadata(seastar::format("{} is missing required field {}", struct_name, field_name));
    }
    return std::move(*field);
}

/* Reads all fields of a struct, up to and including its STOP marker.
 * handle_field is given the header of each field. It must consume the value
 * and return true, or return false (without consuming anything) if it does not
 * recognize the field, in which case the value is skipped.
 */
template <typename Handler>
void read_struct(compact_reader& reader, const char* struct_name, Handler&& handle_field) {
    reader.push_struct();
    for (;;) {
        field_header h = reader.read_field_header();
        if (h.type == wire_type::STOP) {
            break;
        }
        if (!handle_field(h)) {
            pqmeta_logger.trace("Skipping field {} ({}) of {}", h.id, to_string(h.type), struct_name);
            reader.skip(h.type);
        }
    }
    reader.pop_struct();
}

template <typename ElementReader>
auto read_list(compact_reader& reader, const field_header& h, wire_type element_type,
        const char* struct_name, ElementReader&& read_element) {
    check_type(h, wire_type::LIST, struct_name);
    list_header lh = reader.read_list_header();
    if (lh.size > 0 && lh.element_type != element_type) {
        throw malformed_metadata(seastar::format("{} field {} is a list of {}, expected a list of {}",
                struct_name, h.id, to_string(lh.element_type), to_string(element_type)));
    }
    // Every element takes at least one byte. This rejects absurd sizes
    // before the reservation below.
    if (lh.size > reader.remaining()) {
        throw malformed_metadata(seastar::format("{} field {} declares {} list elements, but only {}B remain",
                struct_name, h.id, lh.size, reader.remaining()));
    }
    std::vector<decltype(read_element())> result;
    result.reserve(lh.size);
    for (uint32_t i = 0; i < lh.size; ++i) {
        result.push_back(read_element());
    }
    return result;
}

int32_t read_i32(compact_reader& reader, const field_header& h, const char* struct_name) {
    check_type(h, wire_type::I32, struct_name);
    return reader.read_i32();
}

int64_t read_i64(compact_reader& reader, const field_header& h, const char* struct_name) {
    check_type(h, wire_type::I64, struct_name);
    return reader.read_i64();
}

bool read_bool(compact_reader& reader, const field_header& h, const char* struct_name) {
    check_type(h, wire_type::BOOLEAN_TRUE, struct_name);
    return reader.read_bool();
}

std::string read_string(compact_reader& reader, const field_header& h, const char* struct_name) {
    check_type(h, wire_type::BINARY, struct_name);
    return reader.read_string();
}

bytes read_bytes(compact_reader& reader, const field_header& h, const char* struct_name) {
    check_type(h, wire_type::BINARY, struct_name);
    return bytes(reader.read_binary());
}

template <typename Enum>
Enum read_enum(compact_reader& reader, const field_header& h, const char* struct_name) {
    return static_cast<Enum>(read_i32(reader, h, struct_name));
}

// Members of LogicalType and TimeUnit which carry no data are empty structs.
void skip_empty_struct(compact_reader& reader, const field_header& h, const char* struct_name) {
    check_type(h, wire_type::STRUCT, struct_name);
    reader.skip(wire_type::STRUCT);
}

logical_type::time_unit read_time_unit(compact_reader& reader) {
    constexpr const char* name = "TimeUnit";
    auto unit = logical_type::time_unit::MILLIS;
    read_struct(reader, name, [&] (const field_header& h) {
        switch (h.id) {
        case 1: skip_empty_struct(reader, h, name); unit = logical_type::time_unit::MILLIS; return true;
        case 2: skip_empty_struct(reader, h, name); unit = logical_type::time_unit::MICROS; return true;
        case 3: skip_empty_struct(reader, h, name); unit = logical_type::time_unit::NANOS; return true;
        default: return false;
        }
    });
    return unit;
}

// TimeType and TimestampType share their layout.
template <typename Result>
Result read_time_type(compact_reader& reader, const char* name) {
    Result result{false, logical_type::time_unit::MILLIS};
    read_struct(reader, name, [&] (const field_header& h) {
        switch (h.id) {
        case 1: result.utc_adjustment = read_bool(reader, h, name); return true;
        case 2: check_type(h, wire_type::STRUCT, name); result.unit = read_time_unit(reader); return true;
        default: return false;
        }
    });
    return result;
}

logical_type::DECIMAL read_decimal_type(compact_reader& reader) {
    constexpr const char* name = "DecimalType";
    std::optional<int32_t> scale;
    std::optional<int32_t> precision;
    read_struct(reader, name, [&] (const field_header& h) {
        switch (h.id) {
        case 1: scale = read_i32(reader, h, name); return true;
        case 2: precision = read_i32(reader, h, name); return true;
        default: return false;
        }
    });
    return {required(scale, name, "scale"), required(precision, name, "precision")};
}

logical_type::INTEGER read_int_type(compact_reader& reader) {
    constexpr const char* name = "IntType";
    std::optional<int8_t> bit_width;
    std::optional<bool> is_signed;
    read_struct(reader, name, [&] (const field_header& h) {
        switch (h.id) {
        case 1:
            check_type(h, wire_type::BYTE, name);
            bit_width = static_cast<int8_t>(reader.read_byte());
            return true;
        case 2: is_signed = read_bool(reader, h, name); return true;
        default: return false;
        }
    });
    return {required(bit_width, name, "bitWidth"), required(is_signed, name, "isSigned")};
}

logical_type::logical_type read_logical_type(compact_reader& reader) {
    namespace lt = logical_type;
    constexpr const char* name = "LogicalType";
    // A union: exactly one member is expected to be set.
    std::optional<lt::logical_type> result;
    read_struct(reader, name, [&] (const field_header& h) {
        switch (h.id) {
        case 1: skip_empty_struct(reader, h, name); result = lt::STRING{}; return true;
        case 2: skip_empty_struct(reader, h, name); result = lt::MAP{}; return true;
        case 3: skip_empty_struct(reader, h, name); result = lt::LIST{}; return true;
        case 4: skip_empty_struct(reader, h, name); result = lt::ENUM{}; return true;
        case 5:
            check_type(h, wire_type::STRUCT, name);
            result = read_decimal_type(reader);
            return true;
        case 6: skip_empty_struct(reader, h, name); result = lt::DATE{}; return true;
        case 7:
            check_type(h, wire_type::STRUCT, name);
            result = read_time_type<lt::TIME>(reader, "TimeType");
            return true;
        case 8:
            check_type(h, wire_type::STRUCT, name);
            result = read_time_type<lt::TIMESTAMP>(reader, "TimestampType");
            return true;
        case 10:
            check_type(h, wire_type::STRUCT, name);
            result = read_int_type(reader);
            return true;
        case 11: skip_empty_struct(reader, h, name); result = lt::NULL_TYPE{}; return true;
        case 12: skip_empty_struct(reader, h, name); result = lt::JSON{}; return true;
        case 13: skip_empty_struct(reader, h, name); result = lt::BSON{}; return true;
        case 14: skip_empty_struct(reader, h, name); result = lt::UUID{}; return true;
        case 15: skip_empty_struct(reader, h, name); result = lt::FLOAT16{}; return true;
        default:
            reader.skip(h.type);
            result = lt::UNRECOGNIZED{h.id};
            return true;
        }
    });
    if (!result) {
        return lt::UNRECOGNIZED{0};
    }
    return *result;
}

statistics read_statistics(compact_reader& reader) {
    constexpr const char* name = "Statistics";
    statistics s;
    read_struct(reader, name, [&] (const field_header& h) {
        switch (h.id) {
        case 1: s.max = read_bytes(reader, h, name); return true;
        case 2: s.min = read_bytes(reader, h, name); return true;
        case 3: s.null_count = read_i64(reader, h, name); return true;
        case 4: s.distinct_count = read_i64(reader, h, name); return true;
        case 5: s.max_value = read_bytes(reader, h, name); return true;
        case 6: s.min_value = read_bytes(reader, h, name); return true;
        case 7: s.is_max_value_exact = read_bool(reader, h, name); return true;
        case 8: s.is_min_value_exact = read_bool(reader, h, name); return true;
        default: return false;
        }
    });
    return s;
}

key_value read_key_value(compact_reader& reader) {
    constexpr const char* name = "KeyValue";
    std::optional<std::string> key;
    std::optional<std::string> value;
    read_struct(reader, name, [&] (const field_header& h) {
        switch (h.id) {
        case 1: key = read_string(reader, h, name); return true;
        case 2: value = read_string(reader, h, name); return true;
        default: return false;
        }
    });
    return {required(key, name, "key"), std::move(value)};
}

sorting_column read_sorting_column(compact_reader& reader) {
    constexpr const char* name = "SortingColumn";
    std::optional<int32_t> column_idx;
    std::optional<bool> descending;
    std::optional<bool> nulls_first;
    read_struct(reader, name, [&] (const field_header& h) {
        switch (h.id) {
        case 1: column_idx = read_i32(reader, h, name); return true;
        case 2: descending = read_bool(reader, h, name); return true;
        case 3: nulls_first = read_bool(reader, h, name); return true;
        default: return false;
        }
    });
    return {required(column_idx, name, "column_idx"),
            required(descending, name, "descending"),
            required(nulls_first, name, "nulls_first")};
}

column_chunk read_column_chunk(compact_reader& reader) {
    constexpr const char* name = "ColumnChunk";
    column_chunk c;
    std::optional<int64_t> file_offset;
    read_struct(reader, name, [&] (const field_header& h) {
        switch (h.id) {
        case 1: c.file_path = read_string(reader, h, name); return true;
        case 2: file_offset = read_i64(reader, h, name); return true;
        case 3:
            check_type(h, wire_type::STRUCT, name);
            c.meta_data = read_column_metadata(reader);
            return true;
        default: return false;
        }
    });
    c.file_offset = required(file_offset, name, "file_offset");
    return c;
}

} // namespace

schema_element read_schema_element(compact_reader& reader) {
    constexpr const char* name = "SchemaElement";
    schema_element e;
    std::optional<std::string> element_name;
    read_struct(reader, name, [&] (const field_header& h) {
        switch (h.id) {
        case 1: e.type = read_enum<physical_type>(reader, h, name); return true;
        case 2: e.type_length = read_i32(reader, h, name); return true;
        case 3: e.repetition_type = read_enum<repetition>(reader, h, name); return true;
        case 4: element_name = read_string(reader, h, name); return true;
        case 5: e.num_children = read_i32(reader, h, name); return true;
        case 6: e.converted = read_enum<converted_type>(reader, h, name); return true;
        case 7: e.scale = read_i32(reader, h, name); return true;
        case 8: e.precision = read_i32(reader, h, name); return true;
        case 9: e.field_id = read_i32(reader, h, name); return true;
        case 10:
            check_type(h, wire_type::STRUCT, name);
            e.logical = read_logical_type(reader);
            return true;
        default: return false;
        }
    });
    e.name = required(element_name, name, "name");
    return e;
}

column_metadata read_column_metadata(compact_reader& reader) {
    constexpr const char* name = "ColumnMetaData";
    std::optional<physical_type> type;
    std::optional<std::vector<encoding>> encodings;
    std::optional<std::vector<std::string>> path_in_schema;
    std::optional<compression_codec> codec;
    std::optional<int64_t> num_values;
    std::optional<int64_t> total_uncompressed_size;
    std::optional<int64_t> total_compressed_size;
    std::optional<int64_t> data_page_offset;
    std::optional<int64_t> index_page_offset;
    std::optional<int64_t> dictionary_page_offset;
    std::optional<statistics> stats;
    read_struct(reader, name, [&] (const field_header& h) {
        switch (h.id) {
        case 1: type = read_enum<physical_type>(reader, h, name); return true;
        case 2:
            encodings = read_list(reader, h, wire_type::I32, name, [&] {
                return static_cast<encoding>(reader.read_i32());
            });
            return true;
        case 3:
            path_in_schema = read_list(reader, h, wire_type::BINARY, name, [&] {
                return reader.read_string();
            });
            return true;
        case 4: codec = read_enum<compression_codec>(reader, h, name); return true;
        case 5: num_values = read_i64(reader, h, name); return true;
        case 6: total_uncompressed_size = read_i64(reader, h, name); return true;
        case 7: total_compressed_size = read_i64(reader, h, name); return true;
        case 9: data_page_offset = read_i64(reader, h, name); return true;
        case 10: index_page_offset = read_i64(reader, h, name); return true;
        case 11: dictionary_page_offset = read_i64(reader, h, name); return true;
        case 12:
            check_type(h, wire_type::STRUCT, name);
            stats = read_statistics(reader);
            return true;
        default: return false;
        }
    });
    return column_metadata{
            required(type, name, "type"),
            required(encodings, name, "encodings"),
            required(path_in_schema, name, "path_in_schema"),
            required(codec, name, "codec"),
            required(num_values, name, "num_values"),
            required(total_uncompressed_size, name, "total_uncompressed_size"),
            required(total_compressed_size, name, "total_compressed_size"),
            required(data_page_offset, name, "data_page_offset"),
            index_page_offset,
            dictionary_page_offset,
            std::move(stats)};
}

row_group read_row_group(compact_reader& reader) {
    constexpr const char* name = "RowGroup";
    row_group rg;
    std::optional<std::vector<column_chunk>> columns;
    std::optional<int64_t> total_byte_size;
    std::optional<int64_t> num_rows;
    read_struct(reader, name, [&] (const field_header& h) {
        switch (h.id) {
        case 1:
            columns = read_list(reader, h, wire_type::STRUCT, name, [&] { return read_column_chunk(reader); });
            return true;
        case 2: total_byte_size = read_i64(reader, h, name); return true;
        case 3: num_rows = read_i64(reader, h, name); return true;
        case 4:
            rg.sorting_columns = read_list(reader, h, wire_type::STRUCT, name, [&] {
                return read_sorting_column(reader);
            });
            return true;
        case 5: rg.file_offset = read_i64(reader, h, name); return true;
        case 6: rg.total_compressed_size = read_i64(reader, h, name); return true;
        case 7:
            check_type(h, wire_type::I16, name);
            rg.ordinal = reader.read_i16();
            return true;
        default: return false;
        }
    });
    rg.columns = required(columns, name, "columns");
    rg.total_byte_size = required(total_byte_size, name, "total_byte_size");
    rg.num_rows = required(num_rows, name, "num_rows");
    return rg;
}

file_metadata read_file_metadata(compact_reader& reader) {
    constexpr const char* name = "FileMetaData";
    file_metadata md;
    std::optional<int32_t> version;
    std::optional<std::vector<schema_element>> schema;
    std::optional<int64_t> num_rows;
    std::optional<std::vector<row_group>> row_groups;
    read_struct(reader, name, [&] (const field_header& h) {
        switch (h.id) {
        case 1: version = read_i32(reader, h, name); return true;
        case 2:
            schema = read_list(reader, h, wire_type::STRUCT, name, [&] { return read_schema_element(reader); });
            return true;
        case 3: num_rows = read_i64(reader, h, name); return true;
        case 4:
            row_groups = read_list(reader, h, wire_type::STRUCT, name, [&] { return read_row_group(reader); });
            return true;
        case 5:
            md.key_value_metadata = read_list(reader, h, wire_type::STRUCT, name, [&] {
                return read_key_value(reader);
            });
            return true;
        case 6: md.created_by = read_string(reader, h, name); return true;
        default: return false;
        }
    });
    md.version = required(version, name, "version");
    md.schema = required(schema, name, "schema");
    md.num_rows = required(num_rows, name, "num_rows");
    md.row_groups = required(row_groups, name, "row_groups");
    return md;
}

file_metadata decode_file_metadata(bytes_view serialized) {
    compact_reader reader{serialized};
    file_metadata md = read_file_metadata(reader);
    pqmeta_logger.debug("Decoded FileMetaData ({}B of {}B): {} rows, {} row groups, {} schema elements",
            reader.position(), serialized.size(), md.num_rows, md.row_groups.size(), md.schema.size());
    return md;
}

} // namespace pqmeta
