/*
 * xattr/local_attribute_store.h
 * -------------------------------------------------------------------------
 * Attribute store backed by the host's extended attribute syscalls.
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

#ifndef GXATTR_XATTR_LOCAL_ATTRIBUTE_STORE_H
#define GXATTR_XATTR_LOCAL_ATTRIBUTE_STORE_H

#include <stddef.h>

#include <memory>
#include <string>
#include <vector>

#include "xattr/attribute_store.h"

namespace gxattr {
namespace xattr {
class LocalAttributeStore : public AttributeStore {
 public:
  // Uses the follow_symlinks and max_value_size configuration keys.
  static std::unique_ptr<LocalAttributeStore> FromConfig();

  inline LocalAttributeStore(bool follow_symlinks, size_t max_value_size)
      : follow_symlinks_(follow_symlinks), max_value_size_(max_value_size) {}

  ~LocalAttributeStore() override = default;

  int Get(const std::string &path, const std::string &name,
          std::vector<uint8_t> *value) const override;

  int Set(const std::string &path, const std::string &name,
          const std::vector<uint8_t> &value) override;

  inline bool follow_symlinks() const { return follow_symlinks_; }
  inline size_t max_value_size() const { return max_value_size_; }

 private:
  const bool follow_symlinks_;
  const size_t max_value_size_;
};
}  // namespace xattr
}  // namespace gxattr

#endif
