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

#include "boundcache/internal/cache/node.h"

#include <ostream>

namespace boundcache {
namespace internal_cache {

std::ostream& operator<<(std::ostream& os, NodeState state) {
  switch (state) {
    case NodeState::kAlive:
      return os << "alive";
    case NodeState::kRetired:
      return os << "retired";
    case NodeState::kDead:
      return os << "dead";
  }
  return os << "<invalid node state>";
}

}  // namespace internal_cache
}  // namespace boundcache
