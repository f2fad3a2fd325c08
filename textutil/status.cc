// Copyright 2026 Google LLC
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
#include "textutil/status.h"

#include <string>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"

namespace textutil {

StatusBuilder::operator absl::Status() const {
  const std::string streamed = stream_.str();
  std::string message;
  if (prepend_) {
    message = absl::StrCat(streamed, original_message_);
  } else if (original_message_.empty() || streamed.empty()) {
    message = absl::StrCat(original_message_, streamed);
  } else {
    message = absl::StrCat(original_message_, "; ", streamed);
  }
  return absl::Status(code_, message);
}

}  // namespace textutil
