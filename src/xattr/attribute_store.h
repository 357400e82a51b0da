/*
 * xattr/attribute_store.h
 * -------------------------------------------------------------------------
 * Interface to a key-value store of extended attributes, addressed by
 * path and attribute name.
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

#ifndef GXATTR_XATTR_ATTRIBUTE_STORE_H
#define GXATTR_XATTR_ATTRIBUTE_STORE_H

#include <cstdint>
#include <string>
#include <vector>

namespace gxattr {
namespace xattr {
// Each call is a single read or write; implementations return 0 on success
// or a negative errno.
class AttributeStore {
 public:
  virtual ~AttributeStore() = default;

  virtual int Get(const std::string &path, const std::string &name,
                  std::vector<uint8_t> *value) const = 0;

  virtual int Set(const std::string &path, const std::string &name,
                  const std::vector<uint8_t> &value) = 0;
};
}  // namespace xattr
}  // namespace gxattr

#endif
