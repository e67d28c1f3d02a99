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

#include <fmt/format.h>
#include <cowl/core/Cow.h>

namespace fmt {

/// Formats a Cow exactly as its view, including the format spec.
template <typename Owned, typename Borrowed, typename Char>
struct formatter<cowl::Cow<Owned, Borrowed>, Char>
  : formatter<std::remove_cvref_t<cowl::view_t<Borrowed>>, Char>
{
    using base = formatter<std::remove_cvref_t<cowl::view_t<Borrowed>>, Char>;

    template <typename FormatContext>
    auto format(const cowl::Cow<Owned, Borrowed>& cow, FormatContext& ctx) const {
        return base::format(cow.as_view(), ctx);
    }
};

} // namespace fmt
