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

#include <pqmeta/metadata.hh>
#include <pqmeta/schema.hh>
#include <memory>

namespace pqmeta {

/* The metadata of one parquet file: the decoded footer and the schema built
 * from it. The serialized footer is fetched by the caller; locating it in the
 * file is not the business of this class.
 */
class metadata_reader {
    std::unique_ptr<file_metadata> _metadata;
    std::unique_ptr<schema_descriptor> _schema;
private:
    metadata_reader() {};
public:
    // The entry point to this library. Throws malformed_metadata.
    static metadata_reader parse(bytes_view serialized_footer);
    const file_metadata& metadata() const { return *_metadata; }
    // The schema is computed lazily (not on parse) for robustness.
    // This way the raw metadata can still be inspected even if the schema
    // cannot be understood/validated by our reader.
    // Not safe to call concurrently before the first call has returned.
    const schema_descriptor& schema() {
        if (!_schema) {
            _schema = std::make_unique<schema_descriptor>(metadata().schema);
        }
        return *_schema;
    }

    // The chunk of the given leaf column in the given row group.
    // Throws pqmeta_exception on out-of-range indices, and malformed_metadata
    // if the row group doesn't match the schema.
    const column_chunk& chunk(uint32_t row_group, uint32_t column);
};

} // namespace pqmeta
