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
/** @file */
#pragma once

#include "Cow.h"
#include <cowl/support/string.h>
#include <cowl/support/logging.h>
#include <cowl/support/exception.h>

#include <cmath>
#include <limits>
#include <optional>
#include <utility>

/////////////////////////////////////////////////////////////////////////////
/// Serialization to, and deserialization from, a tagged string form.
/// - The first character of the serialized form identifies the type:
///     - '1' false, '2' true
///     - '3' signed integer
///     - '4' unsigned integer
///     - '5' floating point
///     - '6' string
/// - Other types participate by providing the overloads,
/// @code
///   std::string serialize(const T&);
///   bool deserialize(const std::string_view&, T&);
/// @endcode
///   in the namespace of T. A `deserialize` overload must leave its target
///   unchanged when it returns false.
/// - A Cow serializes exactly as its view, so the variant is not visible in
///   the serialized form, and always deserializes to the Owned variant.
/////////////////////////////////////////////////////////////////////////////
namespace cowl {

inline
std::string serialize(is_bool auto value) {
    return value? "2": "1";
}

inline
std::string serialize(is_like_Int auto value) {
    return '3' + int_to_str((Int)value);
}

inline
std::string serialize(is_like_UInt auto value) {
    return '4' + int_to_str((UInt)value);
}

inline
std::string serialize(is_like_Float auto value) {
    return '5' + float_to_str((Float)value);
}

inline
std::string serialize(const StringView& value) {
    std::string result;
    result.reserve(value.size() + 1);
    result += '6';
    result += value;
    return result;
}

inline
bool deserialize(const StringView& data, bool& value) {
    if (data.size() != 1) return false;
    switch (data[0]) {
        case '1': value = false; return true;
        case '2': value = true;  return true;
        default:  return false;
    }
}

template <is_like_Int T>
bool deserialize(const StringView& data, T& value) {
    if (data.size() < 2 || data[0] != '3') return false;
    Int parsed;
    if (!str_to_int(data.substr(1), parsed)) return false;
    if (parsed < std::numeric_limits<T>::min() || parsed > std::numeric_limits<T>::max()) return false;
    value = (T)parsed;
    return true;
}

template <is_like_UInt T>
bool deserialize(const StringView& data, T& value) {
    if (data.size() < 2 || data[0] != '4') return false;
    UInt parsed;
    if (!str_to_uint(data.substr(1), parsed) || parsed > std::numeric_limits<T>::max()) return false;
    value = (T)parsed;
    return true;
}

template <is_like_Float T>
bool deserialize(const StringView& data, T& value) {
    if (data.size() < 2 || data[0] != '5') return false;
    Float parsed;
    if (!str_to_float(data.substr(1), parsed)) return false;
    if (std::isfinite(parsed) && std::fabs(parsed) > std::numeric_limits<T>::max()) return false;
    value = (T)parsed;
    return true;
}

inline
bool deserialize(const StringView& data, String& value) {
    if (data.size() < 1 || data[0] != '6') return false;
    value.assign(data.substr(1));  // reuses the existing buffer
    return true;
}

template <typename T>
concept is_serializable = requires (const T& value) {
    { serialize(value) } -> std::convertible_to<std::string>;
};

template <typename T>
concept is_deserializable = requires (const StringView& data, T& value) {
    { deserialize(data, value) } -> std::convertible_to<bool>;
};

template <typename Owned, typename Borrowed>
    requires has_view<Owned, Borrowed> && is_serializable<std::remove_cvref_t<view_t<Borrowed>>>
std::string serialize(const Cow<Owned, Borrowed>& cow) {
    return serialize(cow.as_view());
}

/// Deserialize into an existing container.
/// - If the container is Owned, its payload is deserialized in place, so that
///   buffers held by the payload can be reused.
/// - If the container is Borrowed, the reference is discarded and replaced
///   with a freshly deserialized Owned payload.
/// @return Returns false, leaving the container unchanged, if the data is malformed.
template <typename Owned, typename Borrowed>
    requires is_deserializable<Owned> && std::default_initializable<Owned> && std::is_nothrow_move_constructible_v<Owned>
bool deserialize(const StringView& data, Cow<Owned, Borrowed>& cow) {
    if (auto p_owned = cow.owned_ptr(); p_owned != nullptr) {
        if (!deserialize(data, *p_owned)) {
            COWL_DEBUG("rejected serialized data: {}", data.substr(0, DeserializeError::context));
            return false;
        }
        return true;
    }

    Owned value{};
    if (!deserialize(data, value)) {
        COWL_DEBUG("rejected serialized data: {}", data.substr(0, DeserializeError::context));
        return false;
    }

    COWL_DEBUG("deserialize replaced a borrowed reference");
    cow = Cow<Owned, Borrowed>{owned, std::move(value)};
    return true;
}

/// Deserialize a new container, which is always Owned.
/// @param error Assigned a DeserializeError describing malformed data.
/// @return Returns std::nullopt if the data is malformed.
template <is_cow_type C>
    requires is_deserializable<typename C::owned_type> && std::default_initializable<typename C::owned_type>
std::optional<C> deserialize(const StringView& data, std::optional<DeserializeError>& error) {
    typename C::owned_type value{};
    if (!deserialize(data, value)) {
        COWL_DEBUG("rejected serialized data: {}", data.substr(0, DeserializeError::context));
        error.emplace(data, "malformed data");
        return std::nullopt;
    }
    return C{owned, std::move(value)};
}

/// Deserialize a new container, which is always Owned.
/// @throws DeserializeError if the data is malformed.
template <is_cow_type C>
    requires is_deserializable<typename C::owned_type> && std::default_initializable<typename C::owned_type>
C deserialize(const StringView& data) {
    std::optional<DeserializeError> error;
    auto opt_cow = deserialize<C>(data, error);
    if (!opt_cow) {
        ASSERT(error.has_value());
        throw std::move(*error);
    }
    return std::move(*opt_cow);
}

}  // cowl namespace
