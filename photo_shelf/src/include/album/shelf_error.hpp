//  Copyright 2026 Yurun Zi
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

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace photoshelf {
enum class ShelfErrorCode : uint8_t {
  VALIDATION = 0,  // missing or malformed required field
  NOT_FOUND,       // url absent from the store
  PERSISTENCE,     // collection could not be read or written
  FORMAT           // top-level ingest payload has an unknown shape
};

class ShelfError : public std::runtime_error {
 public:
  ShelfError(ShelfErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  auto Code() const -> ShelfErrorCode { return code_; }

 private:
  ShelfErrorCode code_;
};

inline auto ErrorCodeName(ShelfErrorCode code) -> const char* {
  switch (code) {
    case ShelfErrorCode::VALIDATION:
      return "validation";
    case ShelfErrorCode::NOT_FOUND:
      return "not_found";
    case ShelfErrorCode::PERSISTENCE:
      return "persistence";
    case ShelfErrorCode::FORMAT:
      return "format";
  }
  return "unknown";
}
};  // namespace photoshelf
