#include "transfer/progress.hpp"
#include <algorithm>
#include <iomanip>

namespace blobxfer::transfer {

double Progress::fraction_completed() const {
    if (!total_units) {
        return 0.0;
    }
    if (*total_units == 0) {
        return 1.0;
    }
    double fraction = static_cast<double>(completed_units) / static_cast<double>(*total_units);
    return std::clamp(fraction, 0.0, 1.0);
}

void Progress::update(uint64_t completed, std::optional<uint64_t> total) {
    completed_units = std::max(completed_units, completed);
    if (total) {
        total_units = total;
    }
}

void Progress::complete() {
    if (total_units) {
        completed_units = std::max(completed_units, *total_units);
    }
}

std::ostream& operator<<(std::ostream& os, const Progress& progress) {
    os << progress.completed_units << "/";
    if (progress.total_units) {
        os << *progress.total_units << " bytes ("
           << std::fixed << std::setprecision(1) << progress.fraction_completed() * 100.0 << "%)";
    } else {
        os << "? bytes";
    }
    return os;
}

} // namespace blobxfer::transfer
