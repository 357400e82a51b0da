/*
 * gxattr.cc
 * -------------------------------------------------------------------------
 * Free-function accessors (implementation).
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

#include "gxattr.h"

#include "xattr/attributes.h"

namespace gxattr {

int GetGfid(const std::string &path, std::string *gfid) {
  return xattr::Attributes::Local().GetGfid(path, gfid);
}

int SetGfid(const std::string &path, const std::string &gfid) {
  return xattr::Attributes::Local().SetGfid(path, gfid);
}

int GetVolumeId(const std::string &path, std::string *volume_id) {
  return xattr::Attributes::Local().GetVolumeId(path, volume_id);
}

int SetVolumeId(const std::string &path, const std::string &volume_id) {
  return xattr::Attributes::Local().SetVolumeId(path, volume_id);
}

int GetXtime(const std::string &path, const std::string &volume_id,
             Xtime *xtime) {
  return xattr::Attributes::Local().GetXtime(path, volume_id, xtime);
}

int SetXtime(const std::string &path, const std::string &volume_id,
             uint32_t seconds, uint32_t subseconds) {
  return xattr::Attributes::Local().SetXtime(path, volume_id, seconds,
                                             subseconds);
}

int GetStime(const std::string &path, const std::string &master_id,
             const std::string &slave_id, Xtime *stime) {
  return xattr::Attributes::Local().GetStime(path, master_id, slave_id, stime);
}

int SetStime(const std::string &path, const std::string &master_id,
             const std::string &slave_id, uint32_t seconds,
             uint32_t subseconds) {
  return xattr::Attributes::Local().SetStime(path, master_id, slave_id,
                                             seconds, subseconds);
}

int GetLegacyStime(const std::string &path, const std::string &master_id,
                   const std::string &slave_id, Xtime *stime) {
  return xattr::Attributes::Local().GetLegacyStime(path, master_id, slave_id,
                                                   stime);
}

int SetLegacyStime(const std::string &path, const std::string &master_id,
                   const std::string &slave_id, uint32_t seconds,
                   uint32_t subseconds) {
  return xattr::Attributes::Local().SetLegacyStime(path, master_id, slave_id,
                                                   seconds, subseconds);
}

}  // namespace gxattr
