#ifndef BLOBXFER_PROGRESS_HPP
#define BLOBXFER_PROGRESS_HPP

#include <cstdint>
#include <optional>
#include <ostream>

namespace blobxfer::transfer {

// Completed and total byte counts of one transfer
struct Progress {
    uint64_t completed_units = 0;
    // Empty while the total is unknown
    std::optional<uint64_t> total_units;

    // completed/total clamped to [0, 1]; 0 while the total is unknown
    double fraction_completed() const;
    bool is_indeterminate() const { return !total_units.has_value(); }

    // completed_units never moves backwards within one transfer
    void update(uint64_t completed, std::optional<uint64_t> total);
    // Marks all known units complete
    void complete();

    bool operator==(const Progress& other) const {
        return completed_units == other.completed_units && total_units == other.total_units;
    }
    bool operator!=(const Progress& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& os, const Progress& progress);

} // namespace blobxfer::transfer

#endif // BLOBXFER_PROGRESS_HPP
