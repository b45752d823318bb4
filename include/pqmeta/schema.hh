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
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace pqmeta {

struct schema_node {
    const schema_element& element;
    // Back-reference, only for navigation. nullptr for the root.
    const schema_node* parent;
    std::vector<schema_node> children; // Empty for leaves.

    bool is_leaf() const { return element.type.has_value(); }
    const std::string& name() const { return element.name; }
};

struct column_descriptor {
    uint32_t column_index;
    std::vector<std::string> path; // From (excluding) the root to the leaf.
    physical_type type;
    std::optional<int32_t> type_length;
    uint32_t max_def_level;
    uint32_t max_rep_level;
    const schema_element* element;
    const schema_node* node;

    // Path elements joined with '.'.
    std::string dotted_path() const;
};

std::ostream& operator<<(std::ostream& out, const column_descriptor& c);

/* The schema tree of a parquet file, rebuilt from the flat list of schema
 * elements stored in the footer, and the descriptors of its leaf columns.
 *
 * The descriptor refers to the schema elements it was built from, so they
 * must outlive it. It is immutable once constructed.
 */
class schema_descriptor {
public:
    // Deeper schemas are rejected rather than risking a stack overflow.
    // Unrelated to compact_reader::max_nesting: the schema is a flat list on
    // the wire, and nested lists and maps legitimately go deeper than 8.
    static constexpr size_t max_depth = 64;
private:
    std::unique_ptr<schema_node> _root;
    std::vector<column_descriptor> _columns;
public:
    // Throws malformed_schema.
    explicit schema_descriptor(const std::vector<schema_element>& flat_schema);
    // The tree refers to the elements, which a temporary would not keep alive.
    explicit schema_descriptor(std::vector<schema_element>&& flat_schema) = delete;

    const schema_node& root() const { return *_root; }
    // Leaves in preorder, which is the order of column chunks in a row group.
    const std::vector<column_descriptor>& columns() const { return _columns; }
    const column_descriptor& column(size_t i) const { return _columns.at(i); }
    // nullptr if there is no such leaf column.
    const column_descriptor* find_column(std::string_view dotted_path) const;
};

// Indented dump of a schema tree, one node per line.
void print_schema(std::ostream& out, const schema_node& root);

} // namespace pqmeta
