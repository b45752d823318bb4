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

#include <pqmeta/schema.hh>
#include <pqmeta/exception.hh>
#include <pqmeta/logger.hh>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/join.hpp>
#include <sstream>

namespace pqmeta {

namespace {

// The schema tree is stored as a flat vector in the metadata (obtained by walking
// the tree in preorder), because Thrift doesn't support recursive structures.
// We recover the tree structure by using the num_children attribute:
// a node with k children is immediately followed by the k flattened subtrees
// of its children.
class shape_builder {
    const std::vector<schema_element>& _flat_schema;
    size_t _index = 0;
private:
    void build_children(schema_node& node, size_t depth) {
        if (depth > schema_descriptor::max_depth) {
            throw malformed_schema(seastar::format(
                    "Schema tree deeper than {} levels at element {}", schema_descriptor::max_depth, node.name()));
        }
        int32_t num_children = node.element.num_children.value_or(0);
        if (num_children < 0) {
            throw malformed_schema(seastar::format(
                    "Element {} declares a negative number of children: {}", node.name(), num_children));
        }
        if (num_children > 0 && node.is_leaf()) {
            throw malformed_schema(seastar::format(
                    "Primitive element {} declares {} children", node.name(), num_children));
        }
        if (static_cast<size_t>(num_children) > _flat_schema.size() - _index) {
            throw malformed_schema(seastar::format(
                    "Element {} declares {} children, but only {} elements remain",
                    node.name(), num_children, _flat_schema.size() - _index));
        }
        // The children never move after this, so their parent pointers stay valid.
        node.children.reserve(num_children);
        for (int32_t i = 0; i < num_children; ++i) {
            if (_index >= _flat_schema.size()) {
                throw malformed_schema(seastar::format(
                        "Unexpected end of flat schema while reading children of {}", node.name()));
            }
            node.children.push_back(schema_node{_flat_schema[_index++], &node, {}});
            build_children(node.children.back(), depth + 1);
        }
    }
public:
    explicit shape_builder(const std::vector<schema_element>& flat_schema)
        : _flat_schema{flat_schema} {}

    std::unique_ptr<schema_node> build() {
        if (_flat_schema.empty()) {
            throw malformed_schema("Schema must contain at least a root element");
        }
        auto root = std::unique_ptr<schema_node>(new schema_node{_flat_schema[_index++], nullptr, {}});
        build_children(*root, 0);
        if (_index != _flat_schema.size()) {
            throw malformed_schema(seastar::format(
                    "Schema element count mismatch: tree consumed {} of {} elements",
                    _index, _flat_schema.size()));
        }
        return root;
    }
};

// Computes the levels and paths of leaves, and collects them in preorder.
class leaf_collector {
    std::vector<column_descriptor> _columns;
    std::vector<std::string> _path;
public:
    void collect(const schema_node& node, uint32_t def, uint32_t rep) {
        // The root has no repetition semantics: there is nothing above it
        // which could be absent or repeated.
        if (node.parent) {
            _path.push_back(node.name());
            switch (node.element.repetition_type.value_or(repetition::REQUIRED)) {
            case repetition::REQUIRED:
                break;
            case repetition::OPTIONAL:
                ++def;
                break;
            case repetition::REPEATED:
                ++def;
                ++rep;
                break;
            default:
                throw malformed_schema(seastar::format("Element {} has unknown repetition type {}",
                        node.name(), static_cast<int32_t>(*node.element.repetition_type)));
            }
        }
        if (node.is_leaf()) {
            _columns.push_back(column_descriptor{
                    static_cast<uint32_t>(_columns.size()),
                    _path,
                    *node.element.type,
                    node.element.type_length,
                    def,
                    rep,
                    &node.element,
                    &node});
        } else {
            for (const schema_node& child : node.children) {
                collect(child, def, rep);
            }
        }
        if (node.parent) {
            _path.pop_back();
        }
    }

    std::vector<column_descriptor> release() { return std::move(_columns); }
};

template <typename T>
std::string lowercase(const T& value) {
    std::ostringstream ss;
    ss << value;
    return boost::algorithm::to_lower_copy(ss.str());
}

void print_node(std::ostream& out, const schema_node& node, size_t indent) {
    out << std::string(indent, ' ');
    if (node.parent) {
        out << lowercase(node.element.repetition_type.value_or(repetition::REQUIRED)) << ' ';
    }
    if (!node.parent) {
        out << "message";
    } else if (node.is_leaf()) {
        out << lowercase(*node.element.type);
        if (*node.element.type == physical_type::FIXED_LEN_BYTE_ARRAY && node.element.type_length) {
            out << '(' << *node.element.type_length << ')';
        }
    } else {
        out << "group";
    }
    out << ' ' << node.name();
    if (node.element.logical) {
        out << " (" << *node.element.logical << ')';
    } else if (node.element.converted) {
        out << " (" << *node.element.converted << ')';
    }
    if (node.is_leaf()) {
        out << ";\n";
        return;
    }
    out << " {\n";
    for (const schema_node& child : node.children) {
        print_node(out, child, indent + 2);
    }
    out << std::string(indent, ' ') << "}\n";
}

} // namespace

std::string column_descriptor::dotted_path() const {
    return boost::algorithm::join(path, ".");
}

std::ostream& operator<<(std::ostream& out, const column_descriptor& c) {
    out << c.dotted_path() << ": " << c.type;
    if (c.type_length) {
        out << '(' << *c.type_length << ')';
    }
    return out << " max_def_level=" << c.max_def_level << " max_rep_level=" << c.max_rep_level;
}

schema_descriptor::schema_descriptor(const std::vector<schema_element>& flat_schema)
    : _root{shape_builder{flat_schema}.build()} {
    leaf_collector collector;
    collector.collect(*_root, 0, 0);
    _columns = collector.release();
    pqmeta_logger.debug("Built schema tree of {} elements with {} leaf columns",
            flat_schema.size(), _columns.size());
}

const column_descriptor* schema_descriptor::find_column(std::string_view dotted_path) const {
    for (const column_descriptor& c : _columns) {
        if (c.dotted_path() == dotted_path) {
            return &c;
        }
    }
    return nullptr;
}

void print_schema(std::ostream& out, const schema_node& root) {
    print_node(out, root, 0);
}

} // namespace pqmeta
