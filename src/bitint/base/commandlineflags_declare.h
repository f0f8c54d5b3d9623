// Copyright 2026 The BitInt Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS-IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//

#ifndef BITINT_BASE_COMMANDLINEFLAGS_DECLARE_H_
#define BITINT_BASE_COMMANDLINEFLAGS_DECLARE_H_

#include <cstdint>

#include "absl/flags/declare.h"

#define BITINT_DECLARE_int32(name) ABSL_DECLARE_FLAG(int32_t, name)

#endif  // BITINT_BASE_COMMANDLINEFLAGS_DECLARE_H_
