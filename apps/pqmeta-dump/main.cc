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
#include <seastar/core/app-template.hh>
#include <seastar/core/file.hh>
#include <seastar/core/seastar.hh>
#include <seastar/core/temporary_buffer.hh>
#include <iostream>

namespace bpo = boost::program_options;

using namespace pqmeta;

namespace {

seastar::future<seastar::temporary_buffer<uint8_t>> read_whole_file(std::string path) {
    return seastar::open_file_dma(path, seastar::open_flags::ro).then(
    [] (seastar::file file) {
        return file.size().then([file] (uint64_t size) mutable {
            if (size == 0) {
                throw pqmeta_exception("File is empty");
            }
            return file.dma_read_exactly<uint8_t>(0, size);
        }).finally([file] () mutable {
            return file.close();
        });
    });
}

void print_summary(std::ostream& out, const file_metadata& md) {
    out << "version: " << md.version << '\n';
    out << "created_by: " << md.created_by.value_or("(unknown)") << '\n';
    out << "num_rows: " << md.num_rows << '\n';
    out << "row_groups: " << md.row_groups.size() << '\n';
    for (const key_value& kv : md.key_value_metadata) {
        out << "metadata: " << kv.key << " = " << kv.value.value_or("(null)") << '\n';
    }
}

void print_row_groups(std::ostream& out, metadata_reader& mr) {
    const auto& row_groups = mr.metadata().row_groups;
    const auto& columns = mr.schema().columns();
    for (uint32_t rg = 0; rg < row_groups.size(); ++rg) {
        out << "row group " << rg << ": " << row_groups[rg].num_rows << " rows, "
            << row_groups[rg].total_byte_size << "B\n";
        for (uint32_t c = 0; c < columns.size(); ++c) {
            const column_chunk& cc = mr.chunk(rg, c);
            out << "  " << columns[c].dotted_path() << ": ";
            if (!cc.meta_data) {
                out << "metadata in " << cc.file_path.value_or("(this file)")
                    << " at offset " << cc.file_offset << '\n';
                continue;
            }
            const column_metadata& cmd = *cc.meta_data;
            out << cmd.codec << ", " << cmd.num_values << " values, "
                << cmd.total_compressed_size << "B compressed, "
                << cmd.total_uncompressed_size << "B uncompressed, data page at " << cmd.data_page_offset;
            if (cmd.dictionary_page_offset) {
                out << ", dictionary page at " << *cmd.dictionary_page_offset;
            }
            if (cmd.stats && cmd.stats->null_count) {
                out << ", " << *cmd.stats->null_count << " nulls";
            }
            out << '\n';
        }
    }
}

} // namespace

int main(int argc, char* argv[]) {
    seastar::app_template app;
    app.add_options()
        ("file", bpo::value<std::string>()->required(), "Serialized FileMetaData path")
        ("tree", bpo::bool_switch(), "Print the schema tree")
        ("row-groups", bpo::bool_switch(), "Print the column chunks of every row group");
    return app.run(argc, argv, [&app] {
        auto&& config = app.configuration();
        std::string file = config["file"].as<std::string>();
        bool tree = config["tree"].as<bool>();
        bool row_groups = config["row-groups"].as<bool>();

        return read_whole_file(file).then(
        [tree, row_groups] (seastar::temporary_buffer<uint8_t> serialized) {
            auto mr = metadata_reader::parse(bytes_view{serialized.get(), serialized.size()});
            print_summary(std::cout, mr.metadata());
            if (tree) {
                print_schema(std::cout, mr.schema().root());
            }
            for (const column_descriptor& c : mr.schema().columns()) {
                std::cout << c.column_index << ": " << c << '\n';
            }
            if (row_groups) {
                print_row_groups(std::cout, mr);
            }
        }).handle_exception([file] (std::exception_ptr eptr) {
            try {
                std::rethrow_exception(eptr);
            } catch (const std::exception& e) {
                return seastar::make_exception_future<>(pqmeta_exception(seastar::format(
                        "Could not dump metadata of {}: {}", file, e.what())));
            }
        });
    });
}
