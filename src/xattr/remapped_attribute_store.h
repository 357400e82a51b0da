/*
 * xattr/remapped_attribute_store.h
 * -------------------------------------------------------------------------
 * Attribute store decorator that moves trusted.* names into another
 * namespace.
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

#ifndef GXATTR_XATTR_REMAPPED_ATTRIBUTE_STORE_H
#define GXATTR_XATTR_REMAPPED_ATTRIBUTE_STORE_H

#include <memory>
#include <string>
#include <vector>

#include "xattr/attribute_store.h"

namespace gxattr {
namespace xattr {
// Rewrites names starting with "trusted." to start with "<target>." before
// handing them to the wrapped store. Other names pass through unchanged.
class RemappedAttributeStore : public AttributeStore {
 public:
  RemappedAttributeStore(std::shared_ptr<AttributeStore> target,
                         const std::string &target_namespace);

  ~RemappedAttributeStore() override = default;

  int Get(const std::string &path, const std::string &name,
          std::vector<uint8_t> *value) const override;

  int Set(const std::string &path, const std::string &name,
          const std::vector<uint8_t> &value) override;

  std::string Remap(const std::string &name) const;

 private:
  std::shared_ptr<AttributeStore> target_;
  const std::string source_prefix_, target_prefix_;
};
}  // namespace xattr
}  // namespace gxattr

#endif
