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

/* Records of the parquet footer and the decoders which map the fields of
 * their compact protocol encoding onto them.
 *
 * Only the fields this library uses are kept. Every other field (including
 * ones added to the format in the future) is skipped.
 */

#pragma once

#include <pqmeta/bytes.hh>
#include <pqmeta/compact_protocol.hh>
#include <pqmeta/logical_type.hh>
#include <pqmeta/types.hh>
#include <optional>
#include <string>
#include <vector>

namespace pqmeta {

struct schema_element {
    std::string name;
    std::optional<physical_type> type; // Unset for group nodes.
    std::optional<int32_t> type_length;
    std::optional<repetition> repetition_type; // Unset (or meaningless) for the root.
    std::optional<int32_t> num_children;
    std::optional<converted_type> converted;
    std::optional<int32_t> scale;
    std::optional<int32_t> precision;
    std::optional<int32_t> field_id;
    std::optional<logical_type::logical_type> logical;
};

struct key_value {
    std::string key;
    std::optional<std::string> value;
};

struct sorting_column {
    int32_t column_idx;
    bool descending;
    bool nulls_first;
};

struct statistics {
    std::optional<bytes> max;
    std::optional<bytes> min;
    std::optional<int64_t> null_count;
    std::optional<int64_t> distinct_count;
    std::optional<bytes> max_value;
    std::optional<bytes> min_value;
    std::optional<bool> is_max_value_exact;
    std::optional<bool> is_min_value_exact;
};

struct column_metadata {
    physical_type type;
    std::vector<encoding> encodings;
    std::vector<std::string> path_in_schema;
    compression_codec codec;
    int64_t num_values;
    int64_t total_uncompressed_size;
    int64_t total_compressed_size;
    int64_t data_page_offset;
    std::optional<int64_t> index_page_offset;
    std::optional<int64_t> dictionary_page_offset;
    std::optional<statistics> stats;
};

struct column_chunk {
    std::optional<std::string> file_path;
    int64_t file_offset;
    std::optional<column_metadata> meta_data;
};

struct row_group {
    std::vector<column_chunk> columns;
    int64_t total_byte_size;
    int64_t num_rows;
    std::vector<sorting_column> sorting_columns;
    std::optional<int64_t> file_offset;
    std::optional<int64_t> total_compressed_size;
    std::optional<int16_t> ordinal;
};

struct file_metadata {
    int32_t version;
    std::vector<schema_element> schema; // Flattened in preorder.
    int64_t num_rows;
    std::vector<row_group> row_groups;
    std::vector<key_value> key_value_metadata;
    std::optional<std::string> created_by;
};

// Each of these reads one struct (including its STOP marker) from the reader.
schema_element read_schema_element(compact_reader& reader);
column_metadata read_column_metadata(compact_reader& reader);
row_group read_row_group(compact_reader& reader);
file_metadata read_file_metadata(compact_reader& reader);

// Decode a serialized FileMetaData, as found at the end of a parquet file.
// Throws malformed_metadata.
file_metadata decode_file_metadata(bytes_view serialized);

} // namespace pqmeta
