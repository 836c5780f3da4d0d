#include <filesystem>
#include <fstream>
#include <sstream>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "vidlift/storage/local_storage.h"

using vidlift::storage::LocalStorage;

namespace {

void WriteFile(const std::string& path, const std::string& contents) {
    std::ofstream out(path, std::ios::binary);
    out << contents;
}

std::string ReadFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream contents;
    contents << in.rdbuf();
    return contents.str();
}

}  // namespace

TEST(PathSafety, AcceptsIdentifiers) {
    EXPECT_TRUE(LocalStorage::IsSafeName("org-1"));
    EXPECT_TRUE(LocalStorage::IsSafeName("ups_3f2a.b"));
}

TEST(PathSafety, RejectsTraversal) {
    EXPECT_FALSE(LocalStorage::IsSafeName("../secret"));
    EXPECT_FALSE(LocalStorage::IsSafeName(".."));
    EXPECT_FALSE(LocalStorage::IsSafeName("a/b"));
    EXPECT_FALSE(LocalStorage::IsSafeName(""));
    EXPECT_FALSE(LocalStorage::IsSafeName(std::string(256, 'a')));
}

TEST(PathSafety, KeysAreScopedByOrganizationAndVideo) {
    EXPECT_EQ(LocalStorage::ObjectKey("org-1", "vid-1"), "orgs/org-1/videos/vid-1/original");
    EXPECT_EQ(LocalStorage::ThumbnailKey("org-1", "vid-1"), "orgs/org-1/videos/vid-1/thumbnail");
}

TEST(LocalStorage, ComposesPartsInIndexOrder) {
    const auto root = std::filesystem::temp_directory_path() /
                      ("vidlift_storage_" + Poco::UUIDGenerator().createOne().toString());
    {
        LocalStorage storage((root / "objects").string(), (root / "tmp").string());
        const std::string chunks[] = {"alpha-", "beta-", "gamma"};
        for (int i = 2; i >= 0; --i) {
            const auto temp = storage.NewTempPath();
            WriteFile(temp, chunks[i]);
            auto adopted = storage.AdoptPart(temp, "ups_1", i);
            ASSERT_TRUE(adopted.ok());
            EXPECT_FALSE(std::filesystem::exists(temp));
        }

        const auto key = LocalStorage::ObjectKey("org-1", "vid-1");
        auto composed = storage.ComposeObject(key, "ups_1", 3);
        ASSERT_TRUE(composed.ok());
        EXPECT_EQ(composed.value().size_bytes, 16u);
        EXPECT_EQ(composed.value().etag.size(), 64u);
        EXPECT_EQ(ReadFile(storage.ObjectPath(key)), "alpha-beta-gamma");

        auto stat = storage.StatObject(key);
        ASSERT_TRUE(stat.ok());
        EXPECT_EQ(stat.value().size_bytes, 16u);

        ASSERT_TRUE(storage.RemoveSessionParts("ups_1").ok());
        EXPECT_FALSE(std::filesystem::exists(storage.SessionDir("ups_1")));
    }
    std::filesystem::remove_all(root);
}

TEST(LocalStorage, ComposeFailsWhenPartIsMissing) {
    const auto root = std::filesystem::temp_directory_path() /
                      ("vidlift_storage_" + Poco::UUIDGenerator().createOne().toString());
    {
        LocalStorage storage((root / "objects").string(), (root / "tmp").string());
        const auto temp = storage.NewTempPath();
        WriteFile(temp, "only");
        ASSERT_TRUE(storage.AdoptPart(temp, "ups_1", 0).ok());

        auto composed = storage.ComposeObject("orgs/o/videos/v/original", "ups_1", 2);
        ASSERT_FALSE(composed.ok());
        EXPECT_EQ(composed.error().code, vidlift::core::ErrorCode::kNotFound);
        EXPECT_EQ(storage.StatObject("orgs/o/videos/v/original").error().code,
                  vidlift::core::ErrorCode::kNotFound);
    }
    std::filesystem::remove_all(root);
}

TEST(LocalStorage, RejectsUnsafeSessionIds) {
    const auto root = std::filesystem::temp_directory_path() /
                      ("vidlift_storage_" + Poco::UUIDGenerator().createOne().toString());
    {
        LocalStorage storage((root / "objects").string(), (root / "tmp").string());
        const auto temp = storage.NewTempPath();
        WriteFile(temp, "x");
        auto adopted = storage.AdoptPart(temp, "../escape", 0);
        ASSERT_FALSE(adopted.ok());
        EXPECT_EQ(adopted.error().code, vidlift::core::ErrorCode::kInvalidArgument);
        EXPECT_FALSE(std::filesystem::exists(temp));
    }
    std::filesystem::remove_all(root);
}
