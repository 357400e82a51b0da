#include <errno.h>

#include <gtest/gtest.h>

#include "xattr/memory_attribute_store.h"

namespace gxattr {
namespace xattr {
namespace tests {

namespace {
const std::vector<uint8_t> VALUE = {1, 2, 3, 4};
}  // namespace

TEST(MemoryAttributeStore, SetAndGet) {
  MemoryAttributeStore store;
  std::vector<uint8_t> out;

  store.AddPath("/b1/f1");
  ASSERT_EQ(0, store.Set("/b1/f1", "user.a", VALUE));
  ASSERT_EQ(0, store.Get("/b1/f1", "user.a", &out));
  EXPECT_EQ(VALUE, out);
}

TEST(MemoryAttributeStore, Overwrite) {
  MemoryAttributeStore store;
  std::vector<uint8_t> out;

  store.AddPath("/b1/f1");
  ASSERT_EQ(0, store.Set("/b1/f1", "user.a", VALUE));
  ASSERT_EQ(0, store.Set("/b1/f1", "user.a", std::vector<uint8_t>{9}));
  ASSERT_EQ(0, store.Get("/b1/f1", "user.a", &out));
  EXPECT_EQ(std::vector<uint8_t>{9}, out);
}

TEST(MemoryAttributeStore, MissingPath) {
  MemoryAttributeStore store;
  std::vector<uint8_t> out;

  EXPECT_EQ(-ENOENT, store.Get("/b1/f1", "user.a", &out));
  EXPECT_EQ(-ENOENT, store.Set("/b1/f1", "user.a", VALUE));
}

TEST(MemoryAttributeStore, MissingAttribute) {
  MemoryAttributeStore store;
  std::vector<uint8_t> out;

  store.AddPath("/b1/f1");
  store.AddPath("/b1/f2");
  ASSERT_EQ(0, store.Set("/b1/f1", "user.a", VALUE));
  EXPECT_EQ(-ENODATA, store.Get("/b1/f1", "user.b", &out));
  EXPECT_EQ(-ENODATA, store.Get("/b1/f2", "user.a", &out));
}

TEST(MemoryAttributeStore, RemovePath) {
  MemoryAttributeStore store;
  std::vector<uint8_t> out;

  store.AddPath("/b1/f1");
  store.AddPath("/b1/f10");
  ASSERT_EQ(0, store.Set("/b1/f1", "user.a", VALUE));
  ASSERT_EQ(0, store.Set("/b1/f10", "user.a", VALUE));

  store.RemovePath("/b1/f1");
  EXPECT_EQ(-ENOENT, store.Get("/b1/f1", "user.a", &out));
  EXPECT_EQ(0, store.Get("/b1/f10", "user.a", &out));

  // re-created paths start out empty
  store.AddPath("/b1/f1");
  EXPECT_EQ(-ENODATA, store.Get("/b1/f1", "user.a", &out));
}

TEST(MemoryAttributeStore, ReadOnly) {
  MemoryAttributeStore store;
  std::vector<uint8_t> out;

  store.AddPath("/b1/f1");
  ASSERT_EQ(0, store.Set("/b1/f1", "user.a", VALUE));
  store.set_read_only(true);
  EXPECT_EQ(-EROFS, store.Set("/b1/f1", "user.a", std::vector<uint8_t>{9}));
  ASSERT_EQ(0, store.Get("/b1/f1", "user.a", &out));
  EXPECT_EQ(VALUE, out);
}

TEST(MemoryAttributeStore, GetNames) {
  MemoryAttributeStore store;

  store.AddPath("/b1/f1");
  store.AddPath("/b1/f2");
  ASSERT_EQ(0, store.Set("/b1/f1", "user.b", VALUE));
  ASSERT_EQ(0, store.Set("/b1/f1", "user.a", VALUE));
  ASSERT_EQ(0, store.Set("/b1/f2", "user.c", VALUE));

  EXPECT_EQ((std::vector<std::string>{"user.a", "user.b"}),
            store.GetNames("/b1/f1"));
  EXPECT_TRUE(store.GetNames("/b1/f3").empty());
}

}  // namespace tests
}  // namespace xattr
}  // namespace gxattr
