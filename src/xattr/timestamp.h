/*
 * xattr/timestamp.h
 * -------------------------------------------------------------------------
 * Xtime value type and its 8-byte big-endian encoding.
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

#ifndef GXATTR_XATTR_TIMESTAMP_H
#define GXATTR_XATTR_TIMESTAMP_H

#include <stddef.h>
#include <stdint.h>

#include <ostream>
#include <vector>

namespace gxattr {
namespace xattr {
// Sub-second count is application defined and not normalized.
struct Xtime {
  uint32_t seconds = 0;
  uint32_t subseconds = 0;
};

inline bool operator==(const Xtime &a, const Xtime &b) {
  return a.seconds == b.seconds && a.subseconds == b.subseconds;
}

inline bool operator!=(const Xtime &a, const Xtime &b) { return !(a == b); }

inline std::ostream &operator<<(std::ostream &o, const Xtime &x) {
  return o << "(" << x.seconds << ", " << x.subseconds << ")";
}

class TimestampCodec {
 public:
  static constexpr size_t ENCODED_SIZE = 8;

  static std::vector<uint8_t> Encode(uint32_t seconds, uint32_t subseconds);
  inline static std::vector<uint8_t> Encode(const Xtime &xtime) {
    return Encode(xtime.seconds, xtime.subseconds);
  }

  // Never fails. A field without 4 bytes of input left decodes as 0, and
  // anything past ENCODED_SIZE is ignored.
  static Xtime Decode(const uint8_t *input, size_t size);
  inline static Xtime Decode(const std::vector<uint8_t> &input) {
    return Decode(input.data(), input.size());
  }
};
}  // namespace xattr
}  // namespace gxattr

#endif
