/*
 * gxattr.h
 * -------------------------------------------------------------------------
 * Free-function accessors for the geo-replication attributes of files on
 * the local filesystem.
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

#ifndef GXATTR_GXATTR_H
#define GXATTR_GXATTR_H

#include <stdint.h>

#include <string>

#include "xattr/errors.h"
#include "xattr/timestamp.h"

namespace gxattr {
using Xtime = xattr::Xtime;
using Errors = xattr::Errors;

// Each call goes through xattr::Attributes::Local(), so configuration
// changes made with base::Config::Init() apply to the next call. Returns 0
// or a negative errno.

// trusted.gfid
int GetGfid(const std::string &path, std::string *gfid);
int SetGfid(const std::string &path, const std::string &gfid);

// trusted.glusterfs.volume-id
int GetVolumeId(const std::string &path, std::string *volume_id);
int SetVolumeId(const std::string &path, const std::string &volume_id);

// trusted.glusterfs.<volume_id>.xtime
int GetXtime(const std::string &path, const std::string &volume_id,
             Xtime *xtime);
int SetXtime(const std::string &path, const std::string &volume_id,
             uint32_t seconds, uint32_t subseconds);

// trusted.glusterfs.<master_id>.<slave_id>.stime
int GetStime(const std::string &path, const std::string &master_id,
             const std::string &slave_id, Xtime *stime);
int SetStime(const std::string &path, const std::string &master_id,
             const std::string &slave_id, uint32_t seconds,
             uint32_t subseconds);

// stime as written by older releases; see xattr::Names::LegacyStime()
int GetLegacyStime(const std::string &path, const std::string &master_id,
                   const std::string &slave_id, Xtime *stime);
int SetLegacyStime(const std::string &path, const std::string &master_id,
                   const std::string &slave_id, uint32_t seconds,
                   uint32_t subseconds);
}  // namespace gxattr

#endif
