/*
 * xattr/errors.cc
 * -------------------------------------------------------------------------
 * Classification of negative errno results (implementation).
 * -------------------------------------------------------------------------
 *
 * Copyright (c) 2026, The gxattr Authors.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "xattr/errors.h"

#include <errno.h>
#include <string.h>

namespace gxattr {
namespace xattr {

Errors::Kind Errors::Classify(int r, Access access) {
  if (r == 0) return Kind::NONE;
  if (r == -EILSEQ || r == -EBADMSG) return Kind::MALFORMED_IDENTIFIER;
  return (access == Access::READ) ? Kind::ATTRIBUTE_UNAVAILABLE
                                  : Kind::WRITE_FAILURE;
}

const char *Errors::KindName(Kind kind) {
  switch (kind) {
    case Kind::NONE:
      return "none";
    case Kind::ATTRIBUTE_UNAVAILABLE:
      return "attribute unavailable";
    case Kind::MALFORMED_IDENTIFIER:
      return "malformed identifier";
    case Kind::WRITE_FAILURE:
      return "write failure";
  }
  return "unknown";
}

std::string Errors::ToString(int r) {
  if (r == 0) return "success";
  return std::string(strerror(-r)) + " (" + std::to_string(-r) + ")";
}

}  // namespace xattr
}  // namespace gxattr
