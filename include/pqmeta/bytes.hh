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

#include <cstdint>
#include <string>
#include <string_view>

namespace pqmeta {

using bytes = std::basic_string<uint8_t>;
using bytes_view = std::basic_string_view<uint8_t>;
using byte = bytes::value_type;

inline bytes_view to_bytes_view(std::string_view s) {
    return {reinterpret_cast<const byte*>(s.data()), s.size()};
}

inline std::string_view to_string_view(bytes_view b) {
    return {reinterpret_cast<const char*>(b.data()), b.size()};
}

} // namespace pqmeta
