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

#include "boundcache/internal/cache/bounded_cache_impl.h"

#include "absl/base/attributes.h"
#include "boundcache/internal/log/verbose_flag.h"

namespace boundcache {
namespace internal_cache {

ABSL_CONST_INIT internal_log::VerboseFlag bounded_cache_logging(
    "bounded_cache");

}  // namespace internal_cache
}  // namespace boundcache
