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

#include <pqmeta/metadata_reader.hh>
#include <pqmeta/exception.hh>

namespace pqmeta {

metadata_reader metadata_reader::parse(bytes_view serialized_footer) {
    metadata_reader mr;
    mr._metadata = std::make_unique<file_metadata>(decode_file_metadata(serialized_footer));
    return mr;
}

const column_chunk& metadata_reader::chunk(uint32_t row_group, uint32_t column) {
    if (row_group >= metadata().row_groups.size()) {
        throw pqmeta_exception(seastar::format(
                "Row group {} out of range: the file has {} row groups",
                row_group, metadata().row_groups.size()));
    }
    if (column >= schema().columns().size()) {
        throw pqmeta_exception(seastar::format(
                "Column {} out of range: the schema has {} leaf columns",
                column, schema().columns().size()));
    }
    const struct row_group& rg = metadata().row_groups[row_group];
    if (column >= rg.columns.size()) {
        throw malformed_metadata(seastar::format(
                "Selected column {} is missing from row group {} metadata ({} columns)",
                column, row_group, rg.columns.size()));
    }
    const column_chunk& cc = rg.columns[column];
    if (cc.meta_data && cc.meta_data->type != schema().column(column).type) {
        throw malformed_metadata(seastar::format(
                "Chunk of column {} in row group {} does not match the physical type of {}",
                column, row_group, schema().column(column).dotted_path()));
    }
    return cc;
}

} // namespace pqmeta
