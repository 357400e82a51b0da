/*
 * xattr/memory_attribute_store.h
 * -------------------------------------------------------------------------
 * In-process attribute store, keyed by path and attribute name.
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

#ifndef GXATTR_XATTR_MEMORY_ATTRIBUTE_STORE_H
#define GXATTR_XATTR_MEMORY_ATTRIBUTE_STORE_H

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "xattr/attribute_store.h"

namespace gxattr {
namespace xattr {
// Behaves like a filesystem with extended attribute support: paths must be
// added before attributes can be read or written on them (-ENOENT
// otherwise), and missing attributes read as -ENODATA.
class MemoryAttributeStore : public AttributeStore {
 public:
  MemoryAttributeStore() = default;
  ~MemoryAttributeStore() override = default;

  void AddPath(const std::string &path);
  void RemovePath(const std::string &path);

  // Subsequent writes fail with -EROFS.
  void set_read_only(bool read_only);

  int Get(const std::string &path, const std::string &name,
          std::vector<uint8_t> *value) const override;

  int Set(const std::string &path, const std::string &name,
          const std::vector<uint8_t> &value) override;

  std::vector<std::string> GetNames(const std::string &path) const;

 private:
  using Key = std::pair<std::string, std::string>;

  mutable std::mutex mutex_;
  std::set<std::string> paths_;
  std::map<Key, std::vector<uint8_t>> values_;
  bool read_only_ = false;
};
}  // namespace xattr
}  // namespace gxattr

#endif
