#include "run/RunReport.hpp"

std::string md::run::to_string(const RunStatus status) {
    switch (status) {
        case RunStatus::Completed: return "completed";
        case RunStatus::NoMatchingGroup: return "no matching group";
        case RunStatus::Superseded: return "superseded";
        case RunStatus::Cancelled: return "cancelled";
        case RunStatus::Failed: return "failed";
    }
    return "unknown";
}
