/*
 * xattr/names.cc
 * -------------------------------------------------------------------------
 * Attribute names (implementation).
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

#include "xattr/names.h"

namespace gxattr {
namespace xattr {

constexpr char Names::TRUSTED_NAMESPACE[];
constexpr char Names::GFID[];
constexpr char Names::VOLUME_ID[];
constexpr char Names::GLUSTERFS_PREFIX[];
constexpr char Names::XTIME_SUFFIX[];
constexpr char Names::STIME_SUFFIX[];

std::string Names::Gfid() { return GFID; }

std::string Names::VolumeId() { return VOLUME_ID; }

std::string Names::Xtime(const std::string &volume_id) {
  return std::string(GLUSTERFS_PREFIX) + "." + volume_id + "." + XTIME_SUFFIX;
}

std::string Names::Stime(const std::string &master_id,
                         const std::string &slave_id) {
  return std::string(GLUSTERFS_PREFIX) + "." + master_id + "." + slave_id +
         "." + STIME_SUFFIX;
}

std::string Names::LegacyStime(const std::string &master_id,
                               const std::string &slave_id) {
  return Xtime(Stime(master_id, slave_id));
}

}  // namespace xattr
}  // namespace gxattr
