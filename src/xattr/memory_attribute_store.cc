/*
 * xattr/memory_attribute_store.cc
 * -------------------------------------------------------------------------
 * In-process attribute store (implementation).
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

#include "xattr/memory_attribute_store.h"

#include <errno.h>

#include "base/logger.h"

namespace gxattr {
namespace xattr {

void MemoryAttributeStore::AddPath(const std::string &path) {
  std::lock_guard<std::mutex> lock(mutex_);
  paths_.insert(path);
}

void MemoryAttributeStore::RemovePath(const std::string &path) {
  std::lock_guard<std::mutex> lock(mutex_);
  paths_.erase(path);

  auto iter = values_.lower_bound(Key(path, ""));
  while (iter != values_.end() && iter->first.first == path)
    iter = values_.erase(iter);
}

void MemoryAttributeStore::set_read_only(bool read_only) {
  std::lock_guard<std::mutex> lock(mutex_);
  read_only_ = read_only;
}

int MemoryAttributeStore::Get(const std::string &path, const std::string &name,
                              std::vector<uint8_t> *value) const {
  std::lock_guard<std::mutex> lock(mutex_);

  if (paths_.find(path) == paths_.end()) return -ENOENT;

  auto iter = values_.find(Key(path, name));
  if (iter == values_.end()) return -ENODATA;

  *value = iter->second;
  return 0;
}

int MemoryAttributeStore::Set(const std::string &path, const std::string &name,
                              const std::vector<uint8_t> &value) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (paths_.find(path) == paths_.end()) return -ENOENT;
  if (read_only_) return -EROFS;

  GXATTR_LOG(LOG_DEBUG, "MemoryAttributeStore::Set",
             "[%s] on [%s]: %zu bytes.\n", name.c_str(), path.c_str(),
             value.size());
  values_[Key(path, name)] = value;
  return 0;
}

std::vector<std::string> MemoryAttributeStore::GetNames(
    const std::string &path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;

  for (auto iter = values_.lower_bound(Key(path, ""));
       iter != values_.end() && iter->first.first == path; ++iter)
    names.push_back(iter->first.second);

  return names;
}

}  // namespace xattr
}  // namespace gxattr
