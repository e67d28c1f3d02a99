// Copyright 2024 Robert A. Dunnagan
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#pragma once

#include <string>
#include <cstdio>
#include <cstdlib>
#include <cerrno>
#include <charconv>
#include <cmath>

#include <cowl/support/types.h>
#include <cowl/support/exception.h>

namespace cowl {

inline
std::string int_to_str(int64_t v) {
    char buf[24];
    auto len = std::snprintf(buf, 23, "%lld", (long long)v);
    ASSERT(len > 0);
    return {buf, (size_t)len};
}

inline
std::string int_to_str(uint64_t v) {
    char buf[24];
    auto len = std::snprintf(buf, 23, "%llu", (unsigned long long)v);
    ASSERT(len > 0);
    return {buf, (size_t)len};
}

inline
std::string float_to_str(double v) {
    char buf[32];
    // 17 significant digits are required for a double to survive a round trip
    auto len = std::snprintf(buf, 31, "%.17g", v);
    ASSERT(len > 0);
    return {buf, (size_t)len};
}

/// Parse a signed integer.
/// @return Returns false unless the whole string is consumed.
inline
bool str_to_int(const StringView& str, Int& value) {
    const char* beg = str.data();
    const char* end = beg + str.size();
    auto result = std::from_chars(beg, end, value);
    return result.ec == std::errc() && result.ptr == end;
}

/// Parse an unsigned integer.
/// @return Returns false unless the whole string is consumed.
inline
bool str_to_uint(const StringView& str, UInt& value) {
    const char* beg = str.data();
    const char* end = beg + str.size();
    auto result = std::from_chars(beg, end, value);
    return result.ec == std::errc() && result.ptr == end;
}

/// Parse a floating point number.
/// @return Returns false unless the whole string is consumed.
inline
bool str_to_float(const StringView& str, Float& value) {
    if (str.empty()) return false;
    std::string copy{str};  // strtod requires null termination
    char* end = nullptr;
    errno = 0;
    value = std::strtod(copy.c_str(), &end);
    if (errno == ERANGE && std::isinf(value)) return false;
    return end == copy.c_str() + copy.size();
}

} // cowl namespace
