/*
 * xattr/errors.h
 * -------------------------------------------------------------------------
 * Classification of negative errno results into error kinds.
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

#ifndef GXATTR_XATTR_ERRORS_H
#define GXATTR_XATTR_ERRORS_H

#include <string>

namespace gxattr {
namespace xattr {
class Errors {
 public:
  enum class Kind {
    NONE,
    ATTRIBUTE_UNAVAILABLE,
    MALFORMED_IDENTIFIER,
    WRITE_FAILURE
  };

  enum class Access { READ, WRITE };

  // |r| is a value returned by an accessor: 0 or a negative errno.
  // -EILSEQ and -EBADMSG come from the identifier codec and are malformed
  // identifiers; any other failure, -EINVAL included, came from the store and
  // is ATTRIBUTE_UNAVAILABLE on a read and WRITE_FAILURE on a write.
  static Kind Classify(int r, Access access);

  static const char *KindName(Kind kind);
  static std::string ToString(int r);
};
}  // namespace xattr
}  // namespace gxattr

#endif
