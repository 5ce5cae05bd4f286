#include <gtest/gtest.h>
#include "../../src/acl/acl_registry.h"

using namespace Meshwork;

TEST(AclManifestTest, LoadsNamespaces) {
    const char* manifest = R"(
default_policy: allow
namespaces:
  - prefix: content
    readers: ["*"]
    writers: [publisher, external]
  - prefix: settings
    read_only: true
    readers: ["*"]
)";
    AclRegistry acl;
    std::vector<std::string> errors;
    ASSERT_TRUE(LoadAclManifestString(manifest, acl, &errors));
    EXPECT_TRUE(errors.empty());
    EXPECT_EQ(acl.NamespaceCount(), 2u);
    EXPECT_TRUE(acl.CanWrite("external", "content:1"));
    EXPECT_FALSE(acl.CanWrite("external", "settings:theme"));
    EXPECT_TRUE(acl.CanWrite("anyone", "misc:1"));
}

TEST(AclManifestTest, RejectsZeroWriterNamespace) {
    const char* manifest = R"(
namespaces:
  - prefix: content
    readers: ["*"]
)";
    AclRegistry acl;
    std::vector<std::string> errors;
    EXPECT_FALSE(LoadAclManifestString(manifest, acl, &errors));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("zero writers"), std::string::npos);
}

TEST(AclManifestTest, CollectsEveryProblemAndLeavesRegistryUntouched) {
    NamespaceRule existing;
    existing.prefix = "jobs";
    existing.writers = {"cron"};
    AclRegistry acl;
    ASSERT_EQ(acl.AddNamespace(existing), MeshError::kOk);

    const char* manifest = R"(
default_policy: sometimes
namespaces:
  - prefix: a
    writers: [x]
  - prefix: a
    writers: [y]
  - prefix: b
    read_only: true
    writers: [z]
  - readers: ["*"]
)";
    std::vector<std::string> errors;
    EXPECT_FALSE(LoadAclManifestString(manifest, acl, &errors));
    EXPECT_EQ(errors.size(), 4u);
    EXPECT_EQ(acl.NamespaceCount(), 1u);
    EXPECT_TRUE(acl.CanWrite("cron", "jobs:1"));
}

TEST(AclManifestTest, KeepsConfiguredDefaultWithoutPolicy) {
    const char* manifest = R"(
namespaces:
  - prefix: content
    readers: ["*"]
    writers: [publisher]
)";
    AclRegistry acl(/*default_allow=*/true);
    ASSERT_TRUE(LoadAclManifestString(manifest, acl, nullptr));
    EXPECT_TRUE(acl.DefaultAllow());
    EXPECT_TRUE(acl.CanWrite("anyone", "misc:1"));
    EXPECT_FALSE(acl.CanWrite("anyone", "content:1"));

    ASSERT_TRUE(LoadAclManifestString("default_policy: deny\n", acl, nullptr));
    EXPECT_FALSE(acl.DefaultAllow());
    EXPECT_FALSE(acl.CanWrite("anyone", "misc:1"));
}

TEST(AclManifestTest, MalformedDocument) {
    AclRegistry acl;
    std::vector<std::string> errors;
    EXPECT_FALSE(LoadAclManifestString("namespaces: [", acl, &errors));
    EXPECT_FALSE(errors.empty());
}

TEST(AclManifestTest, SampleManifestLoads) {
    AclRegistry acl;
    std::vector<std::string> errors;
    ASSERT_TRUE(LoadAclManifestFile("config/acl_manifest.yaml", acl, &errors));
    EXPECT_TRUE(acl.CanWrite("indexer", "content:index:1"));
    EXPECT_FALSE(acl.CanWrite("publisher", "settings:theme"));
}
