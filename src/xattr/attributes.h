/*
 * xattr/attributes.h
 * -------------------------------------------------------------------------
 * Typed accessors for file identity and geo-replication attributes.
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

#ifndef GXATTR_XATTR_ATTRIBUTES_H
#define GXATTR_XATTR_ATTRIBUTES_H

#include <stdint.h>

#include <memory>
#include <string>

#include "xattr/attribute_store.h"
#include "xattr/timestamp.h"

namespace gxattr {
namespace xattr {
// All methods return 0 on success or a negative errno; see Errors for how
// results map to error kinds. Each call performs at most one store access.
class Attributes {
 public:
  // Bound to the local filesystem, using the current configuration. If
  // attribute_namespace isn't "trusted", names are remapped into it.
  static Attributes Local();

  explicit Attributes(std::shared_ptr<AttributeStore> store);

  int GetGfid(const std::string &path, std::string *gfid) const;
  int SetGfid(const std::string &path, const std::string &gfid) const;

  int GetVolumeId(const std::string &path, std::string *volume_id) const;
  int SetVolumeId(const std::string &path, const std::string &volume_id) const;

  int GetXtime(const std::string &path, const std::string &volume_id,
               Xtime *xtime) const;
  int SetXtime(const std::string &path, const std::string &volume_id,
               uint32_t seconds, uint32_t subseconds) const;

  int GetStime(const std::string &path, const std::string &master_id,
               const std::string &slave_id, Xtime *stime) const;
  int SetStime(const std::string &path, const std::string &master_id,
               const std::string &slave_id, uint32_t seconds,
               uint32_t subseconds) const;

  // Same as Get/SetStime, but on Names::LegacyStime().
  int GetLegacyStime(const std::string &path, const std::string &master_id,
                     const std::string &slave_id, Xtime *stime) const;
  int SetLegacyStime(const std::string &path, const std::string &master_id,
                     const std::string &slave_id, uint32_t seconds,
                     uint32_t subseconds) const;

  inline const std::shared_ptr<AttributeStore> &store() const {
    return store_;
  }

 private:
  int GetIdentifier(const std::string &path, const std::string &name,
                    std::string *id) const;
  int SetIdentifier(const std::string &path, const std::string &name,
                    const std::string &id) const;

  int GetTimestamp(const std::string &path, const std::string &name,
                   Xtime *xtime) const;
  int SetTimestamp(const std::string &path, const std::string &name,
                   uint32_t seconds, uint32_t subseconds) const;

  std::shared_ptr<AttributeStore> store_;
};
}  // namespace xattr
}  // namespace gxattr

#endif
