#include <gtest/gtest.h>

#include <filesystem>
#include <thread>

#include "jobctl/repository.hpp"

using namespace jobctl;

namespace {

class RepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root = std::filesystem::temp_directory_path() / (std::string("jobctl-repo-") + info->name());
        std::filesystem::remove_all(root);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    static JobRecord record(const JobId& id, Status status = Status::Queued, const std::string& kind = "step") {
        JobRecord rec;
        rec.id = id;
        rec.kind = kind;
        rec.status = status;
        rec.timestamp = std::chrono::system_clock::now();
        return rec;
    }

    std::filesystem::path root;
};

}

TEST_F(RepositoryTest, CreatesWorkspaceLayout) {
    FileJobRepository repository(root);
    ASSERT_TRUE(repository.isValid());
    for (const char* dir : {"queued", "running", "cancelling", "completed", "failed", "cancelled", ".writing"}) {
        EXPECT_TRUE(std::filesystem::is_directory(root / dir)) << dir;
    }
}

TEST_F(RepositoryTest, OpeningMissingWorkspaceWithoutCreateIsInvalid) {
    FileJobRepository repository(root, false);
    EXPECT_FALSE(repository.isValid());
    EXPECT_FALSE(std::filesystem::exists(root));
}

TEST_F(RepositoryTest, CreateAndGet) {
    FileJobRepository repository(root);
    ASSERT_TRUE(repository.create(record("alpha", Status::Queued, "render")));

    auto found = repository.get("alpha");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, "alpha");
    EXPECT_EQ(found->kind, "render");
    EXPECT_EQ(found->status, Status::Queued);
    EXPECT_EQ(found->message, "");
    EXPECT_TRUE(std::filesystem::is_directory(root / "queued" / "alpha"));
    EXPECT_FALSE(std::filesystem::exists(root / ".writing" / "alpha"));

    EXPECT_FALSE(repository.get("missing").has_value());
}

TEST_F(RepositoryTest, UpdateMovesBetweenStatusDirectories) {
    FileJobRepository repository(root);
    ASSERT_TRUE(repository.create(record("beta")));

    ASSERT_TRUE(repository.updateStatus("beta", Status::Running, ""));
    EXPECT_EQ(repository.status("beta"), Status::Running);

    ASSERT_TRUE(repository.updateStatus("beta", Status::Failed, "out of memory"));
    EXPECT_FALSE(std::filesystem::exists(root / "queued" / "beta"));
    EXPECT_FALSE(std::filesystem::exists(root / "running" / "beta"));

    auto found = repository.get("beta");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->status, Status::Failed);
    EXPECT_EQ(found->message, "out of memory");

    EXPECT_FALSE(repository.updateStatus("nobody", Status::Completed, ""));
}

TEST_F(RepositoryTest, CreateReplacesEarlierHistory) {
    FileJobRepository repository(root);
    ASSERT_TRUE(repository.create(record("gamma")));
    ASSERT_TRUE(repository.updateStatus("gamma", Status::Completed, "first run"));

    ASSERT_TRUE(repository.create(record("gamma")));
    EXPECT_EQ(repository.status("gamma"), Status::Queued);
    EXPECT_FALSE(std::filesystem::exists(root / "completed" / "gamma"));
    EXPECT_EQ(repository.get("gamma")->message, "");
}

TEST_F(RepositoryTest, RejectsUnsafeIds) {
    FileJobRepository repository(root);
    EXPECT_FALSE(repository.create(record("")));
    EXPECT_FALSE(repository.create(record("..")));
    EXPECT_FALSE(repository.create(record("a/b")));
    EXPECT_FALSE(repository.updateStatus("../escape", Status::Failed, ""));
    EXPECT_FALSE(repository.get("a/b").has_value());
    EXPECT_FALSE(repository.status("").has_value());
}

TEST_F(RepositoryTest, ListIsNewestFirstAndLimited) {
    FileJobRepository repository(root);
    for (const char* id : {"one", "two", "three"}) {
        ASSERT_TRUE(repository.create(record(id)));
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    auto all = repository.list();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id, "three");
    EXPECT_EQ(all[1].id, "two");
    EXPECT_EQ(all[2].id, "one");

    auto limited = repository.list(2);
    ASSERT_EQ(limited.size(), 2u);
    EXPECT_EQ(limited[0].id, "three");
}

TEST_F(RepositoryTest, RecoversOrphanedJobs) {
    {
        FileJobRepository repository(root);
        ASSERT_TRUE(repository.create(record("waiting")));
        ASSERT_TRUE(repository.create(record("busy", Status::Running)));
        ASSERT_TRUE(repository.create(record("stopping", Status::Cancelling)));
        ASSERT_TRUE(repository.create(record("done", Status::Completed)));
    }

    FileJobRepository reopened(root, false);
    ASSERT_TRUE(reopened.isValid());
    EXPECT_EQ(reopened.recoverOrphaned(), 3u);

    EXPECT_EQ(reopened.status("waiting"), Status::Failed);
    EXPECT_EQ(reopened.status("busy"), Status::Failed);
    EXPECT_EQ(reopened.status("stopping"), Status::Failed);
    EXPECT_EQ(reopened.status("done"), Status::Completed);
    EXPECT_EQ(reopened.get("busy")->message, "interrupted: process exited while job was running");

    EXPECT_EQ(reopened.recoverOrphaned(), 0u);
}
