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

#include <concepts>
#include <functional>
#include <optional>
#include <ostream>
#include <ranges>
#include <span>
#include <type_traits>
#include <vector>

namespace cowl {

/////////////////////////////////////////////////////////////////////////////
/// Non-owning view types stand in for referents whose extent is only known
/// at runtime, such as character sequences and slices.
/// - A view type is held by value in the Borrowed variant of a Cow.
/// - Examples: std::string_view, std::span<const T>.
/////////////////////////////////////////////////////////////////////////////
template <typename T>
concept is_view_type = std::ranges::view<T> &&
                       std::ranges::borrowed_range<T> &&
                       std::is_trivially_copyable_v<T>;

/////////////////////////////////////////////////////////////////////////////
/// Describes how the Borrowed variant of a Cow refers to its referent.
/// - For ordinary types the handle is a std::reference_wrapper and the view
///   is a const reference.
/// - For view types the handle and the view are the view type itself.
/////////////////////////////////////////////////////////////////////////////
template <typename Borrowed>
struct ref_traits
{
    using handle_type = std::reference_wrapper<const Borrowed>;
    using view_type = const Borrowed&;

    static view_type deref(const handle_type& handle) { return handle.get(); }
};

template <is_view_type Borrowed>
struct ref_traits<Borrowed>
{
    using handle_type = Borrowed;
    using view_type = Borrowed;

    static view_type deref(const handle_type& handle) { return handle; }
};

template <typename Borrowed>
using view_t = typename ref_traits<Borrowed>::view_type;

/// True if the Owned type converts to the view without materializing a temporary.
template <typename Owned, typename Borrowed>
concept is_viewable_as = (is_view_type<Borrowed> && std::convertible_to<const Owned&, Borrowed>) ||
                         (!is_view_type<Borrowed> && std::convertible_to<const Owned*, const Borrowed*>);

/////////////////////////////////////////////////////////////////////////////
/// As-reference capability: projects an Owned value to the Borrowed view.
/// - Defined by default when is_viewable_as<Owned, Borrowed> holds.
/// - Specialize for other pairs. A specialization provides:
/// @code
///   static view_t<Borrowed> as_view(const Owned&);
/// @endcode
/////////////////////////////////////////////////////////////////////////////
template <typename Owned, typename Borrowed>
struct view_traits
{
};

template <typename Owned, typename Borrowed>
    requires is_viewable_as<Owned, Borrowed>
struct view_traits<Owned, Borrowed>
{
    static view_t<Borrowed> as_view(const Owned& owned) { return owned; }
};

/////////////////////////////////////////////////////////////////////////////
/// Borrow capability: a narrower alternative to view_traits for pairs that
/// have a borrow relation but no as-reference conversion.
/// - Must agree with view_traits when both are defined for a pair.
/// - Specialize with the same signature as view_traits, naming it `borrow`.
/////////////////////////////////////////////////////////////////////////////
template <typename Owned, typename Borrowed>
struct borrow_traits
{
};

template <typename Owned, typename Borrowed>
    requires is_viewable_as<Owned, Borrowed>
struct borrow_traits<Owned, Borrowed>
{
    static view_t<Borrowed> borrow(const Owned& owned) { return owned; }
};

/////////////////////////////////////////////////////////////////////////////
/// Infallible promotion capability: constructs an Owned value from the view.
/// - Defined by default when Owned is constructible from the view.
/// - A specialization provides:
/// @code
///   static Owned make(view_t<Borrowed>);
/// @endcode
/////////////////////////////////////////////////////////////////////////////
template <typename Owned, typename Borrowed>
struct from_view_traits
{
};

template <typename Owned, typename Borrowed>
    requires std::constructible_from<Owned, view_t<Borrowed>>
struct from_view_traits<Owned, Borrowed>
{
    static Owned make(view_t<Borrowed> view) { return Owned(view); }
};

template <typename T, typename Alloc>
struct from_view_traits<std::vector<T, Alloc>, std::span<const T>>
{
    static std::vector<T, Alloc> make(std::span<const T> view) { return {view.begin(), view.end()}; }
};

template <typename Owned, typename Borrowed>
concept has_view = requires (const Owned& owned) {
    { view_traits<Owned, Borrowed>::as_view(owned) } -> std::convertible_to<view_t<Borrowed>>;
};

template <typename Owned, typename Borrowed>
concept has_borrow = requires (const Owned& owned) {
    { borrow_traits<Owned, Borrowed>::borrow(owned) } -> std::convertible_to<view_t<Borrowed>>;
};

template <typename Owned, typename Borrowed>
concept has_from_view = requires (view_t<Borrowed> view) {
    { from_view_traits<Owned, Borrowed>::make(view) } -> std::same_as<Owned>;
};

/// Error type of the blanket fallible promotion, which cannot fail.
struct infallible_t
{
    infallible_t() = delete;
};

/////////////////////////////////////////////////////////////////////////////
/// Fallible promotion capability: constructs an Owned value from the view, or
/// reports why it cannot.
/// - Every pair with an infallible promotion gets a fallible one whose
///   error_type, infallible_t, cannot be constructed.
/// - A specialization provides:
/// @code
///   using error_type = ...;
///   static std::optional<Owned> make(view_t<Borrowed>, std::optional<error_type>& error);
/// @endcode
///   On failure, `make` returns std::nullopt and assigns `error`.
/////////////////////////////////////////////////////////////////////////////
template <typename Owned, typename Borrowed>
struct try_from_view_traits
{
};

template <typename Owned, typename Borrowed>
    requires has_from_view<Owned, Borrowed>
struct try_from_view_traits<Owned, Borrowed>
{
    using error_type = infallible_t;

    static std::optional<Owned> make(view_t<Borrowed> view, std::optional<error_type>&) {
        return from_view_traits<Owned, Borrowed>::make(view);
    }
};

template <typename Owned, typename Borrowed>
using try_from_view_error_t = typename try_from_view_traits<Owned, Borrowed>::error_type;

template <typename Owned, typename Borrowed>
concept has_try_from_view = requires (view_t<Borrowed> view, std::optional<try_from_view_error_t<Owned, Borrowed>>& error) {
    { try_from_view_traits<Owned, Borrowed>::make(view, error) } -> std::same_as<std::optional<Owned>>;
};

template <typename T>
concept is_hashable = requires (const T& value) {
    { std::hash<T>{}(value) } -> std::convertible_to<size_t>;
};

template <typename T>
concept is_streamable = requires (std::ostream& stream, const T& value) {
    { stream << value } -> std::convertible_to<std::ostream&>;
};

} // namespace cowl
