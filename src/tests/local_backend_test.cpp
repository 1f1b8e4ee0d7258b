#include <gtest/gtest.h>
#include <atomic>
#include <future>
#include <mutex>
#include <vector>
#include "store/local_backend.hpp"
#include "test_utils.hpp"
#include "utils/file_utils.hpp"

using namespace blobxfer;
using storage::Snapshot;
using storage::StorageError;
using storage::StorageErrorCode;
using storage::TaskStatus;

class LocalBackendTest : public ::testing::Test {
protected:
    TempDir dir{"blobxfer_backend_test_"};
    std::unique_ptr<store::LocalBackend> backend;

    void SetUp() override {
        store::LocalBackendOptions options;
        options.chunk_size = 8;
        backend = std::make_unique<store::LocalBackend>(dir.path() / "objects", options);
    }

    // Waits for the terminal snapshot of a task
    static std::pair<TaskStatus, Snapshot> wait_terminal(storage::Task& task) {
        auto promise = std::make_shared<std::promise<std::pair<TaskStatus, Snapshot>>>();
        auto future = promise->get_future();
        auto once = std::make_shared<std::once_flag>();
        task.observe(TaskStatus::SUCCESS, [promise, once](const Snapshot& snapshot) {
            std::call_once(*once, [&] { promise->set_value({TaskStatus::SUCCESS, snapshot}); });
        });
        task.observe(TaskStatus::FAILURE, [promise, once](const Snapshot& snapshot) {
            std::call_once(*once, [&] { promise->set_value({TaskStatus::FAILURE, snapshot}); });
        });
        EXPECT_EQ(future.wait_for(std::chrono::seconds(10)), std::future_status::ready);
        return future.get();
    }
};

TEST_F(LocalBackendTest, ReferenceNaming) {
    auto ref = backend->reference("user//docs/report.pdf");
    EXPECT_EQ(ref->path(), "/user/docs/report.pdf");
    EXPECT_EQ(ref->name(), "report.pdf");
    EXPECT_EQ(ref->clone()->path(), ref->path());
}

TEST_F(LocalBackendTest, UserReferenceFollowsSession) {
    EXPECT_EQ(backend->user_reference("a.txt"), nullptr);

    backend->sign_in("alice");
    auto ref = backend->user_reference("a.txt");
    ASSERT_NE(ref, nullptr);
    EXPECT_EQ(ref->path(), "/alice/a.txt");
    EXPECT_EQ(backend->user_id(), "alice");

    backend->sign_out();
    EXPECT_EQ(backend->user_reference("a.txt"), nullptr);
}

TEST_F(LocalBackendTest, PutReportsProgressThenSuccess) {
    auto ref = backend->reference("/user/data.bin");
    std::vector<uint8_t> payload(50, 0xAB);

    std::mutex mutex;
    std::vector<uint64_t> completed;
    auto task = ref->put_data(payload);
    task->observe(TaskStatus::PROGRESS, [&](const Snapshot& snapshot) {
        std::lock_guard<std::mutex> lock(mutex);
        ASSERT_TRUE(snapshot.progress.has_value());
        EXPECT_EQ(snapshot.progress->total_units, 50u);
        completed.push_back(snapshot.progress->completed_units);
    });

    auto result = wait_terminal(*task);
    EXPECT_EQ(result.first, TaskStatus::SUCCESS);
    EXPECT_FALSE(result.second.error.has_value());
    ASSERT_NE(result.second.reference, nullptr);
    EXPECT_EQ(result.second.reference->path(), "/user/data.bin");
    EXPECT_EQ(backend->read_object("/user/data.bin"), payload);

    std::lock_guard<std::mutex> lock(mutex);
    for (size_t i = 1; i < completed.size(); ++i) {
        EXPECT_LE(completed[i - 1], completed[i]);
    }
}

TEST_F(LocalBackendTest, LateObserverSeesTerminalEvent) {
    auto task = backend->reference("/user/x")->put_data({1, 2, 3});
    auto first = wait_terminal(*task);
    ASSERT_EQ(first.first, TaskStatus::SUCCESS);

    // Registered after completion, replayed once
    auto second = wait_terminal(*task);
    EXPECT_EQ(second.first, TaskStatus::SUCCESS);
}

TEST_F(LocalBackendTest, WriteToFileCopiesObject) {
    backend->write_object("/user/photo.jpg", bytes_of("jpeg bytes"));
    std::filesystem::path local = dir.path() / "photo.jpg";

    auto task = backend->reference("/user/photo.jpg")->write_to_file(local);
    auto result = wait_terminal(*task);
    EXPECT_EQ(result.first, TaskStatus::SUCCESS);
    ASSERT_TRUE(result.second.progress.has_value());
    EXPECT_EQ(result.second.progress->completed_units, 10u);
    EXPECT_EQ(utils::read_file(local), bytes_of("jpeg bytes"));
}

TEST_F(LocalBackendTest, MissingObjectFailsWithObjectNotFound) {
    auto task = backend->reference("/user/none")->write_to_file(dir.path() / "none");
    auto result = wait_terminal(*task);
    EXPECT_EQ(result.first, TaskStatus::FAILURE);
    ASSERT_TRUE(result.second.error.has_value());
    EXPECT_EQ(result.second.error->code, static_cast<int>(StorageErrorCode::OBJECT_NOT_FOUND));
}

TEST_F(LocalBackendTest, CancelledTaskFailsWithCancelled) {
    store::LocalBackendOptions options;
    options.chunk_size = 1;
    options.step_delay = std::chrono::milliseconds(5);
    store::LocalBackend slow(dir.path() / "slow", options);

    auto task = slow.reference("/user/big")->put_data(std::vector<uint8_t>(2000, 1));
    task->cancel();
    auto result = wait_terminal(*task);
    EXPECT_EQ(result.first, TaskStatus::FAILURE);
    ASSERT_TRUE(result.second.error.has_value());
    EXPECT_EQ(result.second.error->code, static_cast<int>(StorageErrorCode::CANCELLED));
    EXPECT_FALSE(slow.has_object("/user/big"));
}

TEST_F(LocalBackendTest, PauseAndResume) {
    store::LocalBackendOptions options;
    options.chunk_size = 1;
    options.step_delay = std::chrono::milliseconds(1);
    store::LocalBackend slow(dir.path() / "slow", options);

    std::atomic<int> pauses{0};
    std::atomic<int> resumes{0};
    auto task = slow.reference("/user/paused")->put_data(std::vector<uint8_t>(200, 1));
    task->observe(TaskStatus::PAUSE, [&](const Snapshot&) { ++pauses; });
    task->observe(TaskStatus::RESUME, [&](const Snapshot&) { ++resumes; });

    task->pause();
    task->pause();
    task->resume();

    auto result = wait_terminal(*task);
    EXPECT_EQ(result.first, TaskStatus::SUCCESS);
    EXPECT_LE(pauses.load(), 1);
    EXPECT_EQ(pauses.load(), resumes.load());
}

TEST_F(LocalBackendTest, RemoveAndDownloadUrl) {
    backend->write_object("/user/doc", bytes_of("doc"));

    std::promise<std::optional<std::string>> url;
    backend->reference("/user/doc")->download_url(
        [&url](const std::optional<std::string>& value, const std::optional<StorageError>&) {
            url.set_value(value);
        });
    auto resolved = url.get_future().get();
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->rfind("file://", 0), 0u);

    std::promise<std::optional<StorageError>> removed;
    backend->reference("/user/doc")->remove([&removed](const std::optional<StorageError>& error) {
        removed.set_value(error);
    });
    EXPECT_FALSE(removed.get_future().get().has_value());
    EXPECT_FALSE(backend->has_object("/user/doc"));

    std::promise<std::optional<StorageError>> again;
    backend->reference("/user/doc")->remove([&again](const std::optional<StorageError>& error) {
        again.set_value(error);
    });
    auto error = again.get_future().get();
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code, static_cast<int>(StorageErrorCode::OBJECT_NOT_FOUND));
}

TEST_F(LocalBackendTest, OperationsAfterShutdownAreCancelled) {
    auto ref = backend->reference("/user/late");
    backend->shutdown();

    auto result = wait_terminal(*ref->put_data({1}));
    EXPECT_EQ(result.first, TaskStatus::FAILURE);
    EXPECT_EQ(result.second.error->code, static_cast<int>(StorageErrorCode::CANCELLED));

    bool called = false;
    ref->remove([&called](const std::optional<StorageError>& error) {
        called = true;
        ASSERT_TRUE(error.has_value());
        EXPECT_EQ(error->code, static_cast<int>(StorageErrorCode::CANCELLED));
    });
    EXPECT_TRUE(called);
}
