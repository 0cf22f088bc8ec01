// Copyright 2025 The Boundcache Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "boundcache/removal_cause.h"

#include <ostream>
#include <string_view>

namespace boundcache {

std::string_view RemovalCauseName(RemovalCause cause) {
  switch (cause) {
    case RemovalCause::kExplicit:
      return "EXPLICIT";
    case RemovalCause::kReplaced:
      return "REPLACED";
    case RemovalCause::kCollected:
      return "COLLECTED";
    case RemovalCause::kSize:
      return "SIZE";
    case RemovalCause::kExpired:
      return "EXPIRED";
  }
  return "UNKNOWN";
}

std::ostream& operator<<(std::ostream& os, RemovalCause cause) {
  return os << RemovalCauseName(cause);
}

}  // namespace boundcache
