/*
 * xattr/names.h
 * -------------------------------------------------------------------------
 * Attribute names used for file identity and geo-replication state.
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

#ifndef GXATTR_XATTR_NAMES_H
#define GXATTR_XATTR_NAMES_H

#include <string>

namespace gxattr {
namespace xattr {
// Identifier arguments are concatenated as given. Nothing is escaped or
// validated, so malformed identifiers just yield names that don't exist.
class Names {
 public:
  static constexpr char TRUSTED_NAMESPACE[] = "trusted";

  static constexpr char GFID[] = "trusted.gfid";
  static constexpr char VOLUME_ID[] = "trusted.glusterfs.volume-id";

  // prefix shared by the xtime and stime names
  static constexpr char GLUSTERFS_PREFIX[] = "trusted.glusterfs";
  static constexpr char XTIME_SUFFIX[] = "xtime";
  static constexpr char STIME_SUFFIX[] = "stime";

  static std::string Gfid();
  static std::string VolumeId();

  // trusted.glusterfs.<volume_id>.xtime
  static std::string Xtime(const std::string &volume_id);

  // trusted.glusterfs.<master_id>.<slave_id>.stime
  static std::string Stime(const std::string &master_id,
                           const std::string &slave_id);

  // Older releases built the stime name and then passed it through the
  // xtime builder, so their values live under
  // trusted.glusterfs.trusted.glusterfs.<master_id>.<slave_id>.stime.xtime
  static std::string LegacyStime(const std::string &master_id,
                                 const std::string &slave_id);
};
}  // namespace xattr
}  // namespace gxattr

#endif
