#include "core/run_summary.hpp"
#include <iomanip>
#include <sstream>

const char *runStateName(RunState state)
{
    switch (state)
    {
    case RunState::Running:
        return "running";
    case RunState::Completed:
        return "completed";
    case RunState::Cancelled:
        return "cancelled";
    case RunState::Aborted:
        return "aborted";
    }
    return "unknown";
}

int RunSummary::exitCode() const
{
    switch (state)
    {
    case RunState::Aborted:
        return 3;
    case RunState::Cancelled:
        return 2;
    case RunState::Running:
    case RunState::Completed:
        break;
    }
    return failed > 0 ? 1 : 0;
}

nlohmann::json RunSummary::toJson() const
{
    nlohmann::json j;
    j["state"] = runStateName(state);
    j["root"] = root;
    if (!abort_reason.empty())
        j["abort_reason"] = abort_reason;

    j["counters"] = {
        {"scanned", scanned},
        {"uploaded", uploaded},
        {"skipped_duplicate", skipped_duplicate},
        {"failed", failed},
        {"cancelled", cancelled},
        {"scan_errors", scan_errors},
        {"total_bytes", total_bytes}};

    j["started_at"] = std::chrono::duration_cast<std::chrono::seconds>(started_at.time_since_epoch()).count();
    j["elapsed_ms"] = elapsed.count();
    j["exit_code"] = exitCode();

    j["failed_files"] = nlohmann::json::array();
    for (const auto &f : failed_files)
    {
        j["failed_files"].push_back({{"path", f.path}, {"kind", f.kind}, {"message", f.message}, {"attempts", f.attempts}});
    }

    j["uploaded_files"] = nlohmann::json::array();
    for (const auto &u : uploaded_files)
    {
        j["uploaded_files"].push_back({{"path", u.path},
                                       {"relative_path", u.relative_path},
                                       {"fingerprint", u.fingerprint},
                                       {"remote_id", u.remote_id},
                                       {"size", u.size},
                                       {"mime_type", u.mime_type},
                                       {"category", u.category}});
    }

    j["scan_errors"] = nlohmann::json::array();
    for (const auto &e : scan_error_entries)
    {
        j["scan_errors"].push_back({{"path", e.path}, {"kind", e.kind}, {"message", e.message}});
    }

    j["cancelled_paths"] = cancelled_paths;
    return j;
}

std::string RunSummary::toString() const
{
    std::stringstream ss;
    ss << "Run " << runStateName(state) << " for " << root << " in "
       << std::fixed << std::setprecision(2) << (elapsed.count() / 1000.0) << "s\n";
    ss << "  scanned:           " << scanned << "\n";
    ss << "  uploaded:          " << uploaded << " (" << total_bytes << " bytes)\n";
    ss << "  skipped duplicate: " << skipped_duplicate << "\n";
    ss << "  failed:            " << failed << "\n";
    ss << "  cancelled:         " << cancelled << "\n";
    ss << "  scan errors:       " << scan_errors << "\n";
    if (!abort_reason.empty())
        ss << "  abort reason:      " << abort_reason << "\n";

    for (const auto &f : failed_files)
    {
        ss << "  FAILED " << f.path << " [" << f.kind << ", " << f.attempts << " attempts]: " << f.message << "\n";
    }
    for (const auto &e : scan_error_entries)
    {
        ss << "  SCAN ERROR " << e.path << " [" << e.kind << "]: " << e.message << "\n";
    }
    return ss.str();
}
