/*
 * xattr/local_attribute_store.cc
 * -------------------------------------------------------------------------
 * Attribute store backed by the host's extended attribute syscalls
 * (implementation).
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

#include "xattr/local_attribute_store.h"

#include <errno.h>
#include <sys/types.h>
#include <sys/xattr.h>

#include "base/config.h"
#include "base/logger.h"
#include "xattr/errors.h"

namespace gxattr {
namespace xattr {

namespace {
ssize_t ReadAttribute(bool follow, const std::string &path,
                      const std::string &name, void *buffer, size_t size) {
  return follow ? getxattr(path.c_str(), name.c_str(), buffer, size)
                : lgetxattr(path.c_str(), name.c_str(), buffer, size);
}

int WriteAttribute(bool follow, const std::string &path,
                   const std::string &name, const void *value, size_t size) {
  return follow ? setxattr(path.c_str(), name.c_str(), value, size, 0)
                : lsetxattr(path.c_str(), name.c_str(), value, size, 0);
}
}  // namespace

std::unique_ptr<LocalAttributeStore> LocalAttributeStore::FromConfig() {
  return std::unique_ptr<LocalAttributeStore>(new LocalAttributeStore(
      base::Config::follow_symlinks(),
      static_cast<size_t>(base::Config::max_value_size())));
}

int LocalAttributeStore::Get(const std::string &path, const std::string &name,
                             std::vector<uint8_t> *value) const {
  // probe for the size first
  ssize_t size = ReadAttribute(follow_symlinks_, path, name, nullptr, 0);
  if (size < 0) {
    const int r = -errno;
    GXATTR_LOG(LOG_DEBUG, "LocalAttributeStore::Get",
               "cannot size [%s] on [%s]: %s\n", name.c_str(), path.c_str(),
               Errors::ToString(r).c_str());
    return r;
  }

  if (static_cast<size_t>(size) > max_value_size_) {
    GXATTR_LOG(LOG_WARNING, "LocalAttributeStore::Get",
               "[%s] on [%s] is %zd bytes, larger than the %zu allowed.\n",
               name.c_str(), path.c_str(), size, max_value_size_);
    return -E2BIG;
  }

  value->resize(size);
  if (size == 0) return 0;

  // fails with ERANGE if the value grew since the probe
  size = ReadAttribute(follow_symlinks_, path, name, &(*value)[0],
                       value->size());
  if (size < 0) {
    const int r = -errno;
    value->clear();
    GXATTR_LOG(LOG_DEBUG, "LocalAttributeStore::Get",
               "cannot read [%s] on [%s]: %s\n", name.c_str(), path.c_str(),
               Errors::ToString(r).c_str());
    return r;
  }

  value->resize(size);
  return 0;
}

int LocalAttributeStore::Set(const std::string &path, const std::string &name,
                             const std::vector<uint8_t> &value) {
  if (WriteAttribute(follow_symlinks_, path, name, value.data(),
                     value.size()) == -1) {
    const int r = -errno;
    GXATTR_LOG(LOG_DEBUG, "LocalAttributeStore::Set",
               "cannot write [%s] on [%s]: %s\n", name.c_str(), path.c_str(),
               Errors::ToString(r).c_str());
    return r;
  }

  return 0;
}

}  // namespace xattr
}  // namespace gxattr
