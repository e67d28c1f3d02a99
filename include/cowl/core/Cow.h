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

#include <compare>
#include <iomanip>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <cowl/core/traits.h>
#include <cowl/support/exception.h>
#include <cowl/support/types.h>

/// Cowl namespace
namespace cowl {

/////////////////////////////////////////////////////////////////////////////
/// A clone-on-write container holding either an owned value, or a reference
/// to a value owned elsewhere.
/// - Both variants are read through one view, see as_view(). Equality,
///   ordering, hashing and formatting are defined on the view, so an Owned
///   container and a Borrowed container with equal views are
///   indistinguishable to a reader.
/// - The Borrowed variant is promoted to Owned by make_mut() and
///   try_make_mut(), which construct a new Owned value from the view. This is
///   the only transition between variants, and it happens at most once.
/// - The referent of the Borrowed variant is never modified or destroyed by
///   the container. It must outlive the container, or its promotion.
///   Construction from temporaries is rejected at compile time.
/// - The capabilities each operation requires of the Owned/Borrowed pair are
///   described in cowl/core/traits.h.
///
/// @tparam Owned The type of the owned payload.
/// @tparam Borrowed The type of the referent, or a view type (such as
///         std::string_view) for referents of runtime extent.
/////////////////////////////////////////////////////////////////////////////
template <typename Owned, typename Borrowed = Owned>
class Cow
{
  public:
    enum ReprIX {
        OWNED,
        BORROWED
    };

    using owned_type = Owned;
    using borrowed_type = Borrowed;
    using handle_type = typename ref_traits<Borrowed>::handle_type;
    using view_type = view_t<Borrowed>;

  private:
    using Repr = std::variant<Owned, handle_type>;

    struct ArrowProxy
    {
        const Borrowed* operator -> () const { return &m_view; }
        Borrowed m_view;
    };

  public:
    static std::string_view type_name(ReprIX repr_ix) {
        switch (repr_ix) {
            case OWNED:    return "Owned";
            case BORROWED: return "Borrowed";
            default:       throw std::logic_error("invalid repr_ix");
        }
    }

  public:
    Cow() requires std::default_initializable<Owned> : m_repr{std::in_place_index<OWNED>} {}

    /// Construct the Owned variant, forwarding the arguments to the Owned constructor.
    template <typename ... Args>
        requires std::constructible_from<Owned, Args&&...>
    Cow(owned_t, Args&& ... args) : m_repr{std::in_place_index<OWNED>, std::forward<Args>(args)...} {}

    /// Construct the Borrowed variant referring to `ref`.
    Cow(borrowed_t, const Borrowed& ref) requires (!is_view_type<Borrowed>)
      : m_repr{std::in_place_index<BORROWED>, std::cref(ref)} {}

    Cow(borrowed_t, const Borrowed&&) requires (!is_view_type<Borrowed>) = delete;

    /// Construct the Borrowed variant holding the view, `view`.
    Cow(borrowed_t, Borrowed view) requires is_view_type<Borrowed>
      : m_repr{std::in_place_index<BORROWED>, view} {}

    /// A view of an rvalue range that does not model std::ranges::borrowed_range
    /// would dangle as soon as the constructor returns.
    template <typename Range>
        requires is_view_type<Borrowed> && std::convertible_to<Range, Borrowed> &&
                 std::ranges::range<Range> && (!std::ranges::borrowed_range<Range>) && (!std::same_as<std::remove_cvref_t<Range>, Borrowed>)
    Cow(borrowed_t, Range&&) = delete;

    ReprIX type() const         { return static_cast<ReprIX>(m_repr.index()); }
    std::string_view type_name() const { return type_name(type()); }

    bool is_owned() const    { return m_repr.index() == OWNED; }
    bool is_borrowed() const { return m_repr.index() == BORROWED; }

    /// Returns the owned payload, or nullptr if the container is Borrowed.
    /// Unlike make_mut(), this function never promotes.
    const Owned* owned_ptr() const { return std::get_if<OWNED>(&m_repr); }
    Owned* owned_ptr()             { return std::get_if<OWNED>(&m_repr); }

    /// Consume the container, and return the owned payload.
    /// - An Owned payload is moved out.
    /// - A Borrowed container constructs a new Owned value from its view.
    Owned into_owned() && requires has_from_view<Owned, Borrowed> {
        if (is_owned())
            return std::move(std::get<OWNED>(m_repr));
        return from_view_traits<Owned, Borrowed>::make(borrowed_view());
    }

    /// Consume the container, and return the owned payload, or report why an
    /// Owned value could not be constructed from the view.
    /// @param error Assigned the conversion error on failure.
    /// @return Returns std::nullopt on failure.
    template <typename O = Owned>
        requires std::same_as<O, Owned> && has_try_from_view<O, Borrowed>
    std::optional<O> try_into_owned(std::optional<try_from_view_error_t<O, Borrowed>>& error) && {
        if (is_owned())
            return std::move(std::get<OWNED>(m_repr));
        return try_from_view_traits<O, Borrowed>::make(borrowed_view(), error);
    }

    /// Throwing variant of try_into_owned for conversions whose error type is an exception.
    template <typename O = Owned>
        requires std::same_as<O, Owned> && has_try_from_view<O, Borrowed> && std::derived_from<try_from_view_error_t<O, Borrowed>, std::exception>
    O try_into_owned() && {
        std::optional<try_from_view_error_t<O, Borrowed>> error;
        auto opt_owned = std::move(*this).template try_into_owned<O>(error);
        if (!opt_owned) {
            ASSERT(error.has_value());
            throw std::move(*error);
        }
        return std::move(*opt_owned);
    }

    /// Returns a mutable reference to the owned payload, promoting the
    /// container to Owned first if it is Borrowed.
    /// Promotion moves the new value into the container, and requires a
    /// non-throwing move so that the container always holds a variant.
    Owned& make_mut() requires has_from_view<Owned, Borrowed> && std::is_nothrow_move_constructible_v<Owned> {
        if (is_borrowed()) {
            Owned value = from_view_traits<Owned, Borrowed>::make(borrowed_view());
            m_repr.template emplace<OWNED>(std::move(value));
        }
        return std::get<OWNED>(m_repr);
    }

    /// Fallible variant of make_mut().
    /// @param error Assigned the conversion error on failure.
    /// @return Returns nullptr on failure, in which case the container is unchanged.
    template <typename O = Owned>
        requires std::same_as<O, Owned> && has_try_from_view<O, Borrowed> && std::is_nothrow_move_constructible_v<O>
    O* try_make_mut(std::optional<try_from_view_error_t<O, Borrowed>>& error) {
        if (is_borrowed()) {
            auto opt_owned = try_from_view_traits<O, Borrowed>::make(borrowed_view(), error);
            if (!opt_owned) return nullptr;
            m_repr.template emplace<OWNED>(std::move(*opt_owned));
        }
        return &std::get<OWNED>(m_repr);
    }

    /// Throwing variant of try_make_mut for conversions whose error type is an exception.
    template <typename O = Owned>
        requires std::same_as<O, Owned> && has_try_from_view<O, Borrowed> && std::is_nothrow_move_constructible_v<O> &&
                 std::derived_from<try_from_view_error_t<O, Borrowed>, std::exception>
    O& try_make_mut() {
        std::optional<try_from_view_error_t<O, Borrowed>> error;
        auto p_owned = this->template try_make_mut<O>(error);
        if (p_owned == nullptr) {
            ASSERT(error.has_value());
            throw std::move(*error);
        }
        return *p_owned;
    }

    /// Returns the view of the value, without copying.
    /// The view of an Owned container refers into the container, so a view of a
    /// temporary container is rejected.
    view_type as_view() const& requires has_view<Owned, Borrowed> {
        if (is_owned())
            return view_traits<Owned, Borrowed>::as_view(std::get<OWNED>(m_repr));
        return borrowed_view();
    }

    /// Returns the view of the value through the borrow capability.
    view_type borrow() const& requires has_borrow<Owned, Borrowed> {
        if (is_owned())
            return borrow_traits<Owned, Borrowed>::borrow(std::get<OWNED>(m_repr));
        return borrowed_view();
    }

    view_type as_view() const&& = delete;
    view_type borrow() const&& = delete;

    view_type operator * () const& requires has_view<Owned, Borrowed> { return as_view(); }
    view_type operator * () const&& = delete;

    auto operator -> () const requires has_view<Owned, Borrowed> {
        if constexpr (is_view_type<Borrowed>) {
            return ArrowProxy{as_view()};
        } else {
            return std::addressof(as_view());
        }
    }

    operator view_type () const& requires has_view<Owned, Borrowed> { return as_view(); }
    operator view_type () const&& = delete;

    /// Return the hash of the view.
    size_t hash() const requires has_view<Owned, Borrowed> && is_hashable<std::remove_cvref_t<view_type>> {
        return std::hash<std::remove_cvref_t<view_type>>{}(as_view());
    }

    /// Returns a string identifying the variant as well as the value, for example,
    /// `Borrowed("text")`. String-like views are quoted.
    std::string to_debug_str() const requires has_view<Owned, Borrowed> && is_streamable<std::remove_cvref_t<view_type>> {
        StringStream ss;
        ss << type_name() << '(';
        if constexpr (std::convertible_to<view_type, StringView>) {
            ss << std::quoted(static_cast<StringView>(as_view()));
        } else {
            ss << as_view();
        }
        ss << ')';
        return ss.str();
    }

    friend bool operator == (const Cow& lhs, const Cow& rhs)
        requires has_view<Owned, Borrowed> && std::equality_comparable<std::remove_cvref_t<view_type>> {
        return lhs.as_view() == rhs.as_view();
    }

    friend bool operator == (const Cow& lhs, view_type rhs)
        requires has_view<Owned, Borrowed> && std::equality_comparable<std::remove_cvref_t<view_type>> {
        return lhs.as_view() == rhs;
    }

    friend auto operator <=> (const Cow& lhs, const Cow& rhs)
        requires has_view<Owned, Borrowed> && std::three_way_comparable<std::remove_cvref_t<view_type>> {
        return lhs.as_view() <=> rhs.as_view();
    }

    friend auto operator <=> (const Cow& lhs, view_type rhs)
        requires has_view<Owned, Borrowed> && std::three_way_comparable<std::remove_cvref_t<view_type>> {
        return lhs.as_view() <=> rhs;
    }

    friend std::ostream& operator<< (std::ostream& ostream, const Cow& cow)
        requires has_view<Owned, Borrowed> && is_streamable<std::remove_cvref_t<view_type>> {
        return ostream << cow.as_view();
    }

  private:
    view_type borrowed_view() const { return ref_traits<Borrowed>::deref(std::get<BORROWED>(m_repr)); }

  private:
    Repr m_repr;
};

using CowString = Cow<std::string, std::string_view>;

template <typename T>
using CowVector = Cow<std::vector<T>, std::span<const T>>;

template <typename T>
struct is_cow : std::false_type {};

template <typename Owned, typename Borrowed>
struct is_cow<Cow<Owned, Borrowed>> : std::true_type {};

template <typename T>
concept is_cow_type = is_cow<std::remove_cvref_t<T>>::value;

struct CowHash
{
    template <typename Owned, typename Borrowed>
    size_t operator () (const Cow<Owned, Borrowed>& cow) const {
        return cow.hash();
    }
};

} // namespace cowl


namespace std {

//////////////////////////////////////////////////////////////////////////////
/// Cow hash function support
//////////////////////////////////////////////////////////////////////////////
template<typename Owned, typename Borrowed>
    requires requires (const cowl::Cow<Owned, Borrowed>& cow) { cow.hash(); }
struct hash<cowl::Cow<Owned, Borrowed>>
{
    std::size_t operator () (const cowl::Cow<Owned, Borrowed>& cow) const noexcept {
        return cow.hash();
    }
};

} // namespace std
