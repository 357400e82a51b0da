/*
 * xattr/attributes.cc
 * -------------------------------------------------------------------------
 * Typed accessors (implementation).
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

#include "xattr/attributes.h"

#include <stdexcept>
#include <utility>
#include <vector>

#include "base/config.h"
#include "base/logger.h"
#include "xattr/errors.h"
#include "xattr/identifier.h"
#include "xattr/local_attribute_store.h"
#include "xattr/names.h"
#include "xattr/remapped_attribute_store.h"

namespace gxattr {
namespace xattr {

Attributes Attributes::Local() {
  std::shared_ptr<AttributeStore> store = LocalAttributeStore::FromConfig();
  const std::string &ns = base::Config::attribute_namespace();

  if (ns != Names::TRUSTED_NAMESPACE)
    store = std::make_shared<RemappedAttributeStore>(std::move(store), ns);

  return Attributes(std::move(store));
}

Attributes::Attributes(std::shared_ptr<AttributeStore> store)
    : store_(std::move(store)) {
  if (!store_) throw std::invalid_argument("attribute store cannot be null");
}

int Attributes::GetGfid(const std::string &path, std::string *gfid) const {
  return GetIdentifier(path, Names::Gfid(), gfid);
}

int Attributes::SetGfid(const std::string &path,
                        const std::string &gfid) const {
  return SetIdentifier(path, Names::Gfid(), gfid);
}

int Attributes::GetVolumeId(const std::string &path,
                            std::string *volume_id) const {
  return GetIdentifier(path, Names::VolumeId(), volume_id);
}

int Attributes::SetVolumeId(const std::string &path,
                            const std::string &volume_id) const {
  return SetIdentifier(path, Names::VolumeId(), volume_id);
}

int Attributes::GetXtime(const std::string &path, const std::string &volume_id,
                         Xtime *xtime) const {
  return GetTimestamp(path, Names::Xtime(volume_id), xtime);
}

int Attributes::SetXtime(const std::string &path, const std::string &volume_id,
                         uint32_t seconds, uint32_t subseconds) const {
  return SetTimestamp(path, Names::Xtime(volume_id), seconds, subseconds);
}

int Attributes::GetStime(const std::string &path, const std::string &master_id,
                         const std::string &slave_id, Xtime *stime) const {
  return GetTimestamp(path, Names::Stime(master_id, slave_id), stime);
}

int Attributes::SetStime(const std::string &path, const std::string &master_id,
                         const std::string &slave_id, uint32_t seconds,
                         uint32_t subseconds) const {
  return SetTimestamp(path, Names::Stime(master_id, slave_id), seconds,
                      subseconds);
}

int Attributes::GetLegacyStime(const std::string &path,
                               const std::string &master_id,
                               const std::string &slave_id,
                               Xtime *stime) const {
  return GetTimestamp(path, Names::LegacyStime(master_id, slave_id), stime);
}

int Attributes::SetLegacyStime(const std::string &path,
                               const std::string &master_id,
                               const std::string &slave_id, uint32_t seconds,
                               uint32_t subseconds) const {
  return SetTimestamp(path, Names::LegacyStime(master_id, slave_id), seconds,
                      subseconds);
}

int Attributes::GetIdentifier(const std::string &path, const std::string &name,
                              std::string *id) const {
  std::vector<uint8_t> value;
  int r = store_->Get(path, name, &value);

  if (r == 0) r = IdentifierCodec::Decode(value, id);

  if (r)
    GXATTR_LOG(LOG_DEBUG, "Attributes::GetIdentifier",
               "cannot get [%s] on [%s]: %s\n", name.c_str(), path.c_str(),
               Errors::ToString(r).c_str());
  return r;
}

int Attributes::SetIdentifier(const std::string &path, const std::string &name,
                              const std::string &id) const {
  std::vector<uint8_t> value;

  // never touch the store with an unparsable identifier
  int r = IdentifierCodec::Encode(id, &value);
  if (r == 0) r = store_->Set(path, name, value);

  if (r)
    GXATTR_LOG(LOG_DEBUG, "Attributes::SetIdentifier",
               "cannot set [%s] to [%s] on [%s]: %s\n", name.c_str(),
               id.c_str(), path.c_str(), Errors::ToString(r).c_str());
  return r;
}

int Attributes::GetTimestamp(const std::string &path, const std::string &name,
                             Xtime *xtime) const {
  std::vector<uint8_t> value;
  const int r = store_->Get(path, name, &value);

  if (r) {
    GXATTR_LOG(LOG_DEBUG, "Attributes::GetTimestamp",
               "cannot get [%s] on [%s]: %s\n", name.c_str(), path.c_str(),
               Errors::ToString(r).c_str());
    return r;
  }

  if (value.size() < TimestampCodec::ENCODED_SIZE)
    GXATTR_LOG(LOG_DEBUG, "Attributes::GetTimestamp",
               "[%s] on [%s] is truncated (%zu bytes).\n", name.c_str(),
               path.c_str(), value.size());

  *xtime = TimestampCodec::Decode(value);
  return 0;
}

int Attributes::SetTimestamp(const std::string &path, const std::string &name,
                             uint32_t seconds, uint32_t subseconds) const {
  const int r =
      store_->Set(path, name, TimestampCodec::Encode(seconds, subseconds));

  if (r)
    GXATTR_LOG(LOG_DEBUG, "Attributes::SetTimestamp",
               "cannot set [%s] on [%s]: %s\n", name.c_str(), path.c_str(),
               Errors::ToString(r).c_str());
  return r;
}

}  // namespace xattr
}  // namespace gxattr
