/*
 * xattr/timestamp.cc
 * -------------------------------------------------------------------------
 * Xtime encoding (implementation).
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

#include "xattr/timestamp.h"

#include <endian.h>
#include <string.h>

namespace gxattr {
namespace xattr {

namespace {
constexpr size_t FIELD_SIZE = sizeof(uint32_t);

inline void WriteField(uint32_t value, uint8_t *out) {
  const uint32_t be = htobe32(value);
  memcpy(out, &be, FIELD_SIZE);
}

inline uint32_t ReadField(const uint8_t *input, size_t size, size_t offset) {
  if (size < offset + FIELD_SIZE) return 0;

  uint32_t be;
  memcpy(&be, input + offset, FIELD_SIZE);
  return be32toh(be);
}
}  // namespace

constexpr size_t TimestampCodec::ENCODED_SIZE;

std::vector<uint8_t> TimestampCodec::Encode(uint32_t seconds,
                                            uint32_t subseconds) {
  std::vector<uint8_t> out(ENCODED_SIZE);
  WriteField(seconds, &out[0]);
  WriteField(subseconds, &out[FIELD_SIZE]);
  return out;
}

Xtime TimestampCodec::Decode(const uint8_t *input, size_t size) {
  Xtime xtime;
  if (!input) return xtime;

  xtime.seconds = ReadField(input, size, 0);
  xtime.subseconds = ReadField(input, size, FIELD_SIZE);
  return xtime;
}

}  // namespace xattr
}  // namespace gxattr
