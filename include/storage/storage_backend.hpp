#ifndef BLOBXFER_STORAGE_BACKEND_HPP
#define BLOBXFER_STORAGE_BACKEND_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "storage/storage_error_code.hpp"

namespace blobxfer::storage {

class Reference;
class Task;

// Status changes a task reports to its observers
enum class TaskStatus {
    RESUME,
    PROGRESS,
    PAUSE,
    SUCCESS,
    FAILURE
};

const char* task_status_to_string(TaskStatus status);

inline bool is_terminal_status(TaskStatus status) {
    return status == TaskStatus::SUCCESS || status == TaskStatus::FAILURE;
}

struct TaskProgress {
    uint64_t completed_units = 0;
    // Empty while the backend does not know the size yet
    std::optional<uint64_t> total_units;
};

// Point-in-time view of a task handed to observers
struct Snapshot {
    std::optional<TaskProgress> progress;
    std::optional<StorageError> error;
    std::shared_ptr<const Reference> reference;
};

using SnapshotHandler = std::function<void(const Snapshot&)>;
using DeletionHandler = std::function<void(const std::optional<StorageError>&)>;
using DownloadUrlHandler = std::function<void(const std::optional<std::string>&,
                                              const std::optional<StorageError>&)>;

// Handle to an in-flight backend operation. Tasks start running when they
// are created. Handlers may be invoked on any thread; handlers for SUCCESS
// and FAILURE fire at most once and every observer is dropped afterwards.
class Task {
public:
    virtual ~Task() = default;

    virtual void pause() = 0;
    virtual void resume() = 0;
    // Requests cancellation, completion is reported through FAILURE
    virtual void cancel() = 0;

    // Returns a handle that can be passed to remove_observer
    virtual std::string observe(TaskStatus status, SnapshotHandler handler) = 0;
    virtual void remove_observer(const std::string& handle) = 0;
};

// Handle to a remote object
class Reference {
public:
    virtual ~Reference() = default;

    // Short name of the object, the last segment of its path
    virtual std::string name() const = 0;
    // Fully qualified remote path
    virtual std::string path() const = 0;
    virtual std::unique_ptr<Reference> clone() const = 0;

    // Starts uploading raw bytes to this object
    virtual std::unique_ptr<Task> put_data(std::vector<uint8_t> data) = 0;
    // Starts downloading this object into a local file
    virtual std::unique_ptr<Task> write_to_file(const std::filesystem::path& local_path) = 0;
    // Deletes the object, completion receives an error on failure
    virtual void remove(DeletionHandler completion) = 0;
    // Resolves a long lived shareable link to the object
    virtual void download_url(DownloadUrlHandler completion) = 0;
};

} // namespace blobxfer::storage

#endif // BLOBXFER_STORAGE_BACKEND_HPP
