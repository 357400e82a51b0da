/*
 * xattr/identifier.cc
 * -------------------------------------------------------------------------
 * UUID encoding (implementation).
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

#include "xattr/identifier.h"

#include <ctype.h>
#include <errno.h>

#include <algorithm>
#include <stdexcept>

#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "base/logger.h"

namespace gxattr {
namespace xattr {

namespace {
constexpr size_t HYPHENATED_LEN = 36;
constexpr size_t SIMPLE_LEN = 32;

inline bool IsHexDigit(char c) {
  return isxdigit(static_cast<unsigned char>(c)) != 0;
}

inline bool IsHyphenPosition(size_t i) {
  return i == 8 || i == 13 || i == 18 || i == 23;
}

// boost's string_generator is more permissive (braces, hyphens anywhere
// after the first group), so check the layout here first.
bool IsWellFormed(const std::string &text) {
  if (text.size() == SIMPLE_LEN)
    return std::all_of(text.begin(), text.end(),
                       [](char c) { return IsHexDigit(c); });

  if (text.size() != HYPHENATED_LEN) return false;

  for (size_t i = 0; i < text.size(); i++) {
    if (IsHyphenPosition(i) ? (text[i] != '-') : !IsHexDigit(text[i]))
      return false;
  }
  return true;
}
}  // namespace

constexpr size_t IdentifierCodec::ENCODED_SIZE;

int IdentifierCodec::Encode(const std::string &text,
                            std::vector<uint8_t> *output) {
  if (!IsWellFormed(text)) {
    GXATTR_LOG(LOG_DEBUG, "IdentifierCodec::Encode", "[%s] is not a uuid.\n",
               text.c_str());
    return -EILSEQ;
  }

  boost::uuids::uuid id;
  try {
    id = boost::uuids::string_generator()(text);
  } catch (const std::runtime_error &e) {
    GXATTR_LOG(LOG_DEBUG, "IdentifierCodec::Encode", "cannot parse [%s]: %s\n",
               text.c_str(), e.what());
    return -EILSEQ;
  }

  output->assign(id.begin(), id.end());
  return 0;
}

int IdentifierCodec::Decode(const uint8_t *input, size_t size,
                            std::string *output) {
  if (size != ENCODED_SIZE || !input) {
    GXATTR_LOG(LOG_DEBUG, "IdentifierCodec::Decode",
               "expected %zu bytes, got %zu.\n", ENCODED_SIZE, size);
    return -EBADMSG;
  }

  boost::uuids::uuid id;
  std::copy(input, input + ENCODED_SIZE, id.begin());
  *output = boost::uuids::to_string(id);
  return 0;
}

}  // namespace xattr
}  // namespace gxattr
