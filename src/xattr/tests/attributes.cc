#include <errno.h>

#include <memory>
#include <stdexcept>

#include <gtest/gtest.h>

#include "base/config.h"
#include "xattr/attributes.h"
#include "xattr/errors.h"
#include "xattr/local_attribute_store.h"
#include "xattr/memory_attribute_store.h"
#include "xattr/names.h"
#include "xattr/remapped_attribute_store.h"

namespace gxattr {
namespace xattr {
namespace tests {

namespace {
constexpr char PATH[] = "/bricks/b1/f1";
constexpr char MISSING_PATH[] = "/bricks/b1/missing";
constexpr char GFID[] = "bb74c663-2552-41aa-a0ae-d4d94d9dd187";
constexpr char MASTER[] = "0a118af0-3c20-4bdd-aded-694a17af6b5a";
constexpr char SLAVE[] = "af95963b-bbe6-49cb-bf6d-db7260ea6f72";

class FailingAttributeStore : public AttributeStore {
 public:
  explicit FailingAttributeStore(int error) : error_(error) {}

  int Get(const std::string &, const std::string &,
          std::vector<uint8_t> *) const override {
    return error_;
  }

  int Set(const std::string &, const std::string &,
          const std::vector<uint8_t> &) override {
    return error_;
  }

 private:
  int error_;
};

class AttributesTest : public ::testing::Test {
 protected:
  AttributesTest()
      : store_(std::make_shared<MemoryAttributeStore>()), attrs_(store_) {}

  void SetUp() override { store_->AddPath(PATH); }

  std::shared_ptr<MemoryAttributeStore> store_;
  Attributes attrs_;
};
}  // namespace

TEST_F(AttributesTest, Gfid) {
  std::string gfid;

  ASSERT_EQ(0, attrs_.SetGfid(PATH, GFID));
  ASSERT_EQ(0, attrs_.GetGfid(PATH, &gfid));
  EXPECT_EQ(GFID, gfid);

  std::vector<uint8_t> raw;
  ASSERT_EQ(0, store_->Get(PATH, "trusted.gfid", &raw));
  EXPECT_EQ(16u, raw.size());
}

TEST_F(AttributesTest, VolumeIdIsCanonicalized) {
  std::string volume_id;

  ASSERT_EQ(0, attrs_.SetVolumeId(PATH, "0A118AF0-3C20-4BDD-ADED-694A17AF6B5A"));
  ASSERT_EQ(0, attrs_.GetVolumeId(PATH, &volume_id));
  EXPECT_EQ(MASTER, volume_id);
  EXPECT_EQ(std::vector<std::string>{"trusted.glusterfs.volume-id"},
            store_->GetNames(PATH));
}

TEST_F(AttributesTest, Xtime) {
  Xtime xtime;

  ASSERT_EQ(0, attrs_.SetXtime(PATH, MASTER, 100, 2));
  ASSERT_EQ(0, attrs_.GetXtime(PATH, MASTER, &xtime));
  EXPECT_EQ((Xtime{100, 2}), xtime);

  std::vector<uint8_t> raw;
  ASSERT_EQ(0, store_->Get(PATH, Names::Xtime(MASTER), &raw));
  EXPECT_EQ((std::vector<uint8_t>{0, 0, 0, 100, 0, 0, 0, 2}), raw);
}

TEST_F(AttributesTest, XtimePerVolume) {
  Xtime xtime;

  ASSERT_EQ(0, attrs_.SetXtime(PATH, MASTER, 1, 1));
  ASSERT_EQ(0, attrs_.SetXtime(PATH, SLAVE, 2, 2));
  ASSERT_EQ(0, attrs_.GetXtime(PATH, MASTER, &xtime));
  EXPECT_EQ((Xtime{1, 1}), xtime);
  ASSERT_EQ(0, attrs_.GetXtime(PATH, SLAVE, &xtime));
  EXPECT_EQ((Xtime{2, 2}), xtime);
}

TEST_F(AttributesTest, StimeUsesDocumentedName) {
  Xtime stime;

  ASSERT_EQ(0, attrs_.SetStime(PATH, MASTER, SLAVE, 1481540557, 16683));
  ASSERT_EQ(0, attrs_.GetStime(PATH, MASTER, SLAVE, &stime));
  EXPECT_EQ((Xtime{1481540557, 16683}), stime);
  EXPECT_EQ(std::vector<std::string>{std::string("trusted.glusterfs.") +
                                     MASTER + "." + SLAVE + ".stime"},
            store_->GetNames(PATH));
}

// Older releases wrote stime under a different name. The two are separate
// attributes: values written by one are invisible to the other.
TEST_F(AttributesTest, LegacyStimeIsSeparateAttribute) {
  Xtime stime;

  ASSERT_EQ(0, attrs_.SetLegacyStime(PATH, MASTER, SLAVE, 10, 20));
  EXPECT_EQ(-ENODATA, attrs_.GetStime(PATH, MASTER, SLAVE, &stime));

  ASSERT_EQ(0, attrs_.SetStime(PATH, MASTER, SLAVE, 30, 40));
  ASSERT_EQ(0, attrs_.GetLegacyStime(PATH, MASTER, SLAVE, &stime));
  EXPECT_EQ((Xtime{10, 20}), stime);
  ASSERT_EQ(0, attrs_.GetStime(PATH, MASTER, SLAVE, &stime));
  EXPECT_EQ((Xtime{30, 40}), stime);

  EXPECT_EQ(2u, store_->GetNames(PATH).size());
}

TEST_F(AttributesTest, TruncatedTimestamp) {
  Xtime xtime{9, 9};

  ASSERT_EQ(0, store_->Set(PATH, Names::Xtime(MASTER),
                           std::vector<uint8_t>{0, 0, 0, 100}));
  ASSERT_EQ(0, attrs_.GetXtime(PATH, MASTER, &xtime));
  EXPECT_EQ((Xtime{100, 0}), xtime);

  ASSERT_EQ(0, store_->Set(PATH, Names::Xtime(MASTER), std::vector<uint8_t>()));
  ASSERT_EQ(0, attrs_.GetXtime(PATH, MASTER, &xtime));
  EXPECT_EQ(Xtime(), xtime);
}

TEST_F(AttributesTest, MalformedIdentifierText) {
  int r = attrs_.SetGfid(PATH, "not-a-uuid");
  EXPECT_EQ(-EILSEQ, r);
  EXPECT_EQ(Errors::Kind::MALFORMED_IDENTIFIER,
            Errors::Classify(r, Errors::Access::WRITE));

  r = attrs_.SetVolumeId(PATH, "");
  EXPECT_EQ(Errors::Kind::MALFORMED_IDENTIFIER,
            Errors::Classify(r, Errors::Access::WRITE));

  // nothing was written
  EXPECT_TRUE(store_->GetNames(PATH).empty());
}

TEST(Attributes, StoreInvalidArgument) {
  Attributes attrs(std::make_shared<FailingAttributeStore>(-EINVAL));
  std::string gfid;
  Xtime xtime;

  int r = attrs.GetGfid(PATH, &gfid);
  EXPECT_EQ(-EINVAL, r);
  EXPECT_EQ(Errors::Kind::ATTRIBUTE_UNAVAILABLE,
            Errors::Classify(r, Errors::Access::READ));

  r = attrs.SetGfid(PATH, GFID);
  EXPECT_EQ(-EINVAL, r);
  EXPECT_EQ(Errors::Kind::WRITE_FAILURE,
            Errors::Classify(r, Errors::Access::WRITE));

  r = attrs.GetXtime(PATH, MASTER, &xtime);
  EXPECT_EQ(Errors::Kind::ATTRIBUTE_UNAVAILABLE,
            Errors::Classify(r, Errors::Access::READ));
}

TEST_F(AttributesTest, MalformedIdentifierBytes) {
  std::string gfid = "untouched";

  ASSERT_EQ(0, store_->Set(PATH, "trusted.gfid", std::vector<uint8_t>(8, 1)));
  const int r = attrs_.GetGfid(PATH, &gfid);
  EXPECT_EQ(-EBADMSG, r);
  EXPECT_EQ(Errors::Kind::MALFORMED_IDENTIFIER,
            Errors::Classify(r, Errors::Access::READ));
  EXPECT_EQ("untouched", gfid);
}

TEST_F(AttributesTest, MissingAttribute) {
  std::string id;
  Xtime xtime;

  EXPECT_EQ(-ENODATA, attrs_.GetGfid(PATH, &id));
  EXPECT_EQ(-ENODATA, attrs_.GetVolumeId(PATH, &id));
  EXPECT_EQ(-ENODATA, attrs_.GetXtime(PATH, MASTER, &xtime));
  EXPECT_EQ(-ENODATA, attrs_.GetStime(PATH, MASTER, SLAVE, &xtime));
}

TEST_F(AttributesTest, MissingPathIsUnavailable) {
  std::string id;
  Xtime xtime;
  const int results[] = {attrs_.GetGfid(MISSING_PATH, &id),
                         attrs_.GetVolumeId(MISSING_PATH, &id),
                         attrs_.GetXtime(MISSING_PATH, MASTER, &xtime),
                         attrs_.GetStime(MISSING_PATH, MASTER, SLAVE, &xtime),
                         attrs_.GetLegacyStime(MISSING_PATH, MASTER, SLAVE,
                                               &xtime)};

  for (const int r : results)
    EXPECT_EQ(Errors::Kind::ATTRIBUTE_UNAVAILABLE,
              Errors::Classify(r, Errors::Access::READ));
}

TEST_F(AttributesTest, WriteFailure) {
  store_->set_read_only(true);
  const int results[] = {attrs_.SetGfid(PATH, GFID),
                         attrs_.SetVolumeId(PATH, MASTER),
                         attrs_.SetXtime(PATH, MASTER, 1, 2),
                         attrs_.SetStime(PATH, MASTER, SLAVE, 1, 2)};

  for (const int r : results) {
    EXPECT_EQ(-EROFS, r);
    EXPECT_EQ(Errors::Kind::WRITE_FAILURE,
              Errors::Classify(r, Errors::Access::WRITE));
  }
}

TEST(Attributes, NullStore) {
  EXPECT_THROW(Attributes(nullptr), std::invalid_argument);
}

TEST(Attributes, LocalUsesConfiguredNamespace) {
  base::Config::Reset();
  EXPECT_TRUE(dynamic_cast<LocalAttributeStore *>(
      Attributes::Local().store().get()));
}

}  // namespace tests
}  // namespace xattr
}  // namespace gxattr
