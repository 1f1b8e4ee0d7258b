#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "crypto/sealed_box.hpp"
#include "transfer/upload_transfer.hpp"
#include "fake_backend.hpp"
#include "test_utils.hpp"

using namespace blobxfer;
using namespace blobxfer::transfer;
using storage::StorageErrorCode;
using storage::TaskStatus;
using ::testing::_;
using ::testing::NiceMock;
using State = TransferState::State;

class UploadTransferTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeTaskControl> control = std::make_shared<FakeTaskControl>();
    NiceMock<MockReference>* ref = nullptr;
    std::vector<uint8_t> sent;
    TransferRecorder recorder;
    std::vector<uint8_t> payload = bytes_of("quarterly numbers");

    // Upload whose backend records the bytes it was handed
    std::unique_ptr<UploadTransfer> make_upload(std::optional<crypto::SymmetricKey> key = std::nullopt) {
        auto mock = std::make_unique<NiceMock<MockReference>>();
        ref = mock.get();
        ON_CALL(*ref, put_data(_)).WillByDefault([this](std::vector<uint8_t> data) {
            sent = std::move(data);
            return std::unique_ptr<storage::Task>(std::make_unique<FakeTask>(control));
        });
        return std::make_unique<UploadTransfer>(std::move(mock), payload, std::move(key));
    }

    void start(UploadTransfer& upload) {
        upload.start([this](const Progress& progress) { recorder.on_progress(progress); },
                     [this](const std::optional<TransferError>& error) { recorder.on_complete(error); });
    }

    static storage::Snapshot error_snapshot(StorageErrorCode code) {
        storage::Snapshot snapshot;
        snapshot.error = storage::StorageError::from_code(code);
        return snapshot;
    }
};

TEST_F(UploadTransferTest, ConstructionDoesNoWork) {
    auto upload = make_upload();
    EXPECT_CALL(*ref, put_data(_)).Times(0);
    EXPECT_EQ(upload->state(), State::IDLE);
    EXPECT_EQ(upload->latest_progress(), (Progress{0, payload.size()}));
}

TEST_F(UploadTransferTest, StartTwiceStartsOneTask) {
    auto upload = make_upload();
    EXPECT_CALL(*ref, put_data(_)).Times(1);

    start(*upload);
    start(*upload);
    EXPECT_EQ(upload->state(), State::STARTED);
    EXPECT_EQ(recorder.outcomes(), 0);
}

TEST_F(UploadTransferTest, PlainPayloadIsSentAsIs) {
    auto upload = make_upload();
    start(*upload);
    EXPECT_EQ(sent, payload);
}

TEST_F(UploadTransferTest, PayloadIsSealedWithKey) {
    crypto::SymmetricKey key = crypto::SymmetricKey::generate();
    auto upload = make_upload(key);
    start(*upload);

    EXPECT_NE(sent, payload);
    EXPECT_EQ(sent.size(), payload.size() + crypto::SealedBox::OVERHEAD);
    EXPECT_EQ(crypto::SealedBox::open(sent, key), payload);
    EXPECT_EQ(upload->latest_progress().total_units, sent.size());
}

TEST_F(UploadTransferTest, ProgressThenSuccess) {
    auto upload = make_upload();
    start(*upload);

    control->fire_progress(5, payload.size());
    control->fire_progress(3, payload.size());
    control->fire_progress(12, payload.size());
    control->fire(TaskStatus::SUCCESS);

    ASSERT_EQ(recorder.outcomes(), 1);
    EXPECT_FALSE(recorder.error().has_value());
    EXPECT_EQ(upload->state(), State::SUCCEEDED);
    EXPECT_TRUE(recorder.progress_is_monotonic());
    ASSERT_FALSE(recorder.progress().empty());
    EXPECT_EQ(recorder.progress().back(), (Progress{payload.size(), payload.size()}));
}

TEST_F(UploadTransferTest, FailureIsMapped) {
    auto upload = make_upload();
    start(*upload);

    control->fire_failure(static_cast<int>(StorageErrorCode::QUOTA_EXCEEDED));
    ASSERT_EQ(recorder.outcomes(), 1);
    EXPECT_EQ(*recorder.error(), TransferErrc::SERVICE_UNAVAILABLE);
    EXPECT_EQ(upload->state(), State::FAILED);
}

TEST_F(UploadTransferTest, FailureWithoutCodeIsUnknown) {
    auto upload = make_upload();
    start(*upload);

    control->fire_failure(std::nullopt);
    ASSERT_EQ(recorder.outcomes(), 1);
    EXPECT_EQ(*recorder.error(), TransferErrc::UNKNOWN);
}

TEST_F(UploadTransferTest, SuccessCarryingErrorIsFailure) {
    auto upload = make_upload();
    start(*upload);

    control->fire(TaskStatus::SUCCESS, error_snapshot(StorageErrorCode::UNAUTHORIZED));
    ASSERT_EQ(recorder.outcomes(), 1);
    EXPECT_EQ(*recorder.error(), TransferErrc::UNAUTHORIZED);
}

TEST_F(UploadTransferTest, CancelDeliversOnceAndStopsBackend) {
    auto upload = make_upload();
    start(*upload);
    control->fire_progress(4, payload.size());

    upload->cancel();
    ASSERT_EQ(recorder.outcomes(), 1);
    EXPECT_EQ(*recorder.error(), TransferErrc::CANCELLED);
    EXPECT_EQ(control->cancel_calls, 1);
    EXPECT_EQ(upload->state(), State::CANCELLED);

    // Backend acknowledges later, nothing more is delivered
    control->fire_progress(8, payload.size());
    control->fire_failure(static_cast<int>(StorageErrorCode::CANCELLED));
    upload->cancel();
    EXPECT_EQ(recorder.outcomes(), 1);
    EXPECT_FALSE(recorder.progress_after_outcome());
}

TEST_F(UploadTransferTest, CancelBeforeStart) {
    auto upload = make_upload();
    EXPECT_CALL(*ref, put_data(_)).Times(0);

    upload->cancel();
    EXPECT_EQ(upload->state(), State::CANCELLED);
    EXPECT_EQ(recorder.outcomes(), 0);

    start(*upload);
    ASSERT_EQ(recorder.outcomes(), 1);
    EXPECT_EQ(*recorder.error(), TransferErrc::CANCELLED);

    start(*upload);
    EXPECT_EQ(recorder.outcomes(), 1);
}

TEST_F(UploadTransferTest, CancelFromProgressCallback) {
    auto upload = make_upload();
    upload->start([&upload](const Progress&) { upload->cancel(); },
                  [this](const std::optional<TransferError>& error) { recorder.on_complete(error); });

    control->fire(TaskStatus::SUCCESS);
    ASSERT_EQ(recorder.outcomes(), 1);
    EXPECT_EQ(*recorder.error(), TransferErrc::CANCELLED);
}

TEST_F(UploadTransferTest, PauseResumeOnlyWhileRunning) {
    auto upload = make_upload();
    upload->pause();
    EXPECT_EQ(control->pause_calls, 0);

    start(*upload);
    upload->pause();
    control->fire(TaskStatus::PAUSE);
    upload->resume();
    control->fire(TaskStatus::RESUME);
    EXPECT_EQ(control->pause_calls, 1);
    EXPECT_EQ(control->resume_calls, 1);
    EXPECT_EQ(upload->state(), State::STARTED);

    control->fire(TaskStatus::SUCCESS);
    upload->pause();
    EXPECT_EQ(control->pause_calls, 1);
}

TEST_F(UploadTransferTest, DestroyingInFlightCancelsSilently) {
    auto upload = make_upload();
    start(*upload);
    upload.reset();

    EXPECT_EQ(control->cancel_calls, 1);
    control->fire_progress(1, 2);
    control->fire(TaskStatus::SUCCESS);
    EXPECT_EQ(recorder.outcomes(), 0);
    EXPECT_TRUE(recorder.progress().empty());
}

TEST_F(UploadTransferTest, NullReferenceIsRejected) {
    EXPECT_THROW(UploadTransfer(nullptr, payload, std::nullopt), std::invalid_argument);
}
