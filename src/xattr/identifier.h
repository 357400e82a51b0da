/*
 * xattr/identifier.h
 * -------------------------------------------------------------------------
 * UUID text to and from its 16-byte binary form.
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

#ifndef GXATTR_XATTR_IDENTIFIER_H
#define GXATTR_XATTR_IDENTIFIER_H

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <vector>

namespace gxattr {
namespace xattr {
class IdentifierCodec {
 public:
  static constexpr size_t ENCODED_SIZE = 16;

  // Accepts the hyphenated (8-4-4-4-12) and the plain 32-digit forms, in
  // either case. Returns -EILSEQ for anything else.
  static int Encode(const std::string &text, std::vector<uint8_t> *output);

  // Returns -EBADMSG unless |size| is exactly ENCODED_SIZE. Output is
  // lowercase and hyphenated.
  static int Decode(const uint8_t *input, size_t size, std::string *output);
  inline static int Decode(const std::vector<uint8_t> &input,
                           std::string *output) {
    return Decode(input.data(), input.size(), output);
  }
};
}  // namespace xattr
}  // namespace gxattr

#endif
