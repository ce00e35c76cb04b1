//  Copyright 2025 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include <utf8.h>

#include <cwctype>
#include <iterator>
#include <string>

#include "utils/string/convert.hpp"

namespace conv {
auto ToBytes(const std::wstring& wstr) -> std::string {
  std::string str;
  if constexpr (sizeof(wchar_t) == 2) {
    utf8::utf16to8(wstr.begin(), wstr.end(), std::back_inserter(str));
  } else {
    utf8::utf32to8(wstr.begin(), wstr.end(), std::back_inserter(str));
  }
  return str;
}

auto FromBytes(const std::string& str) -> std::wstring {
  const std::string valid = SanitizeUtf8(str);
  std::wstring      wstr;
  if constexpr (sizeof(wchar_t) == 2) {
    utf8::utf8to16(valid.begin(), valid.end(), std::back_inserter(wstr));
  } else {
    utf8::utf8to32(valid.begin(), valid.end(), std::back_inserter(wstr));
  }
  return wstr;
}

auto SanitizeUtf8(const std::string& str) -> std::string {
  if (utf8::is_valid(str.begin(), str.end())) {
    return str;
  }
  std::string fixed;
  utf8::replace_invalid(str.begin(), str.end(), std::back_inserter(fixed));
  return fixed;
}

auto ToLowerUtf8(const std::string& str) -> std::string {
  std::wstring wstr = FromBytes(str);
  for (auto& ch : wstr) {
    ch = static_cast<wchar_t>(std::towlower(static_cast<std::wint_t>(ch)));
  }
  return ToBytes(wstr);
}

auto Trim(const std::string& str) -> std::string {
  const char* ws    = " \t\r\n\f\v";
  const auto  begin = str.find_first_not_of(ws);
  if (begin == std::string::npos) {
    return "";
  }
  const auto end = str.find_last_not_of(ws);
  return str.substr(begin, end - begin + 1);
}
};  // namespace conv
