/*
 * xattr/remapped_attribute_store.cc
 * -------------------------------------------------------------------------
 * Attribute store namespace decorator (implementation).
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

#include "xattr/remapped_attribute_store.h"

#include <stdexcept>
#include <utility>

#include "xattr/names.h"

namespace gxattr {
namespace xattr {

RemappedAttributeStore::RemappedAttributeStore(
    std::shared_ptr<AttributeStore> target, const std::string &target_namespace)
    : target_(std::move(target)),
      source_prefix_(std::string(Names::TRUSTED_NAMESPACE) + "."),
      target_prefix_(target_namespace + ".") {
  if (!target_) throw std::invalid_argument("target store cannot be null");
}

std::string RemappedAttributeStore::Remap(const std::string &name) const {
  if (name.compare(0, source_prefix_.size(), source_prefix_) != 0) return name;
  return target_prefix_ + name.substr(source_prefix_.size());
}

int RemappedAttributeStore::Get(const std::string &path,
                                const std::string &name,
                                std::vector<uint8_t> *value) const {
  return target_->Get(path, Remap(name), value);
}

int RemappedAttributeStore::Set(const std::string &path,
                                const std::string &name,
                                const std::vector<uint8_t> &value) {
  return target_->Set(path, Remap(name), value);
}

}  // namespace xattr
}  // namespace gxattr
