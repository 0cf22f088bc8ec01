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

#include "boundcache/internal/thread.h"

#if defined(__linux__) || defined(__APPLE__)
#include <pthread.h>
#endif

#include <string.h>

namespace boundcache {
namespace internal {

void TrySetCurrentThreadName(const char* name) {
  if (name == nullptr) return;
#if defined(__linux__)
  // Linux limits names to 15 characters plus the terminator.
  char buffer[16];
  strncpy(buffer, name, sizeof(buffer) - 1);
  buffer[sizeof(buffer) - 1] = '\0';
  pthread_setname_np(pthread_self(), buffer);
#elif defined(__APPLE__)
  pthread_setname_np(name);
#endif
}

}  // namespace internal
}  // namespace boundcache
