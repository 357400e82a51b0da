#include <stdlib.h>

#include <gtest/gtest.h>

#include "base/paths.h"

namespace gxattr {
namespace base {
namespace tests {

TEST(Paths, Unchanged) {
  EXPECT_EQ("/etc/" PACKAGE_NAME ".conf",
            Paths::Transform("/etc/" PACKAGE_NAME ".conf"));
  EXPECT_EQ("relative/~path", Paths::Transform("relative/~path"));
  EXPECT_EQ("", Paths::Transform(""));
}

TEST(Paths, ExpandsHome) {
  const std::string home = Paths::HomeDirectory();
  EXPECT_EQ(home + "/." PACKAGE_NAME, Paths::Transform("~/." PACKAGE_NAME));
  EXPECT_EQ(home, Paths::Transform("~"));
}

TEST(Paths, HomeFromEnvironment) {
  const char *old = getenv("HOME");
  const std::string saved = old ? old : "";

  setenv("HOME", "/home/geo", 1);
  EXPECT_EQ("/home/geo/.conf", Paths::Transform("~/.conf"));

  if (old)
    setenv("HOME", saved.c_str(), 1);
  else
    unsetenv("HOME");
}

}  // namespace tests
}  // namespace base
}  // namespace gxattr
