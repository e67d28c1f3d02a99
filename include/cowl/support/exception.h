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

#include <cpptrace/cpptrace.hpp>

#include <exception>
#include <string>
#include <string_view>
#include <sstream>

#define ASSERT(cond) { if (!(cond)) throw ::cowl::Assert{#cond}; }

namespace cowl {

class CowlException : public cpptrace::exception_with_message
{
  public:
    CowlException(std::string&& msg) : cpptrace::exception_with_message(std::forward<std::string>(msg)) {}
};

class Assert : public cpptrace::exception_with_message
{
  public:
    Assert(std::string&& msg) : cpptrace::exception_with_message(std::forward<std::string>(msg)) {}
};

/// Raised when serialized data cannot be converted back into a value.
/// - The message quotes (a prefix of) the rejected input, and the reason.
struct DeserializeError : public CowlException
{
    constexpr static size_t context = 72;

    static std::string make_message(const std::string_view& data, const std::string_view& reason) {
        std::stringstream ss;
        ss << reason << ": '" << data.substr(0, context);
        if (data.size() > context) ss << "...";
        ss << '\'';
        return ss.str();
    }

    DeserializeError(const std::string_view& data, const std::string_view& reason)
      : CowlException(make_message(data, reason)), m_reason{reason} {}

    const std::string& reason() const { return m_reason; }

  private:
    std::string m_reason;
};

} // cowl namespace
