#include "binpack/normalizer.hpp"

#include <nlohmann/json.hpp>

namespace binpack {

std::string serialize_report(const NormalizeReport& report) {
    nlohmann::json j;
    j["ok"] = report.ok;
    if (!report.ok) {
        j["error"] = report.error;
        j["code"] = error_code_to_string(report.code);
        j["exit_code"] = exit_code_for(report.code);
    }

    j["package"] = {
        {"name", report.package.name},
        {"version", report.package.version},
        {"target_platform", report.package.target_platform},
    };
    j["prefix"] = report.prefix;
    j["probe"] = report.probe;
    j["rename_policy"] = report.rename_policy;
    j["started_at"] = report.started_at;

    if (report.artifact_found) {
        j["artifact"] = {
            {"path", report.artifact.path},
            {"format", archive_format_to_string(report.artifact.format)},
            {"size", report.artifact.size},
            {"sha256", report.artifact.sha256},
        };
    } else {
        j["artifact"] = nullptr;
    }

    j["flatten_iterations"] = report.flatten_iterations;
    j["flattened"] = report.flattened;

    nlohmann::json entries = nlohmann::json::array();
    for (const auto& e : report.entries) {
        entries.push_back({
            {"name", e.name},
            {"kind", entry_kind_to_string(e.kind)},
            {"destination", entry_destination_to_string(e.destination)},
        });
    }
    j["entries"] = entries;

    nlohmann::json renames = nlohmann::json::array();
    for (const auto& r : report.renames) {
        renames.push_back({{"from", r.from}, {"to", r.to}});
    }
    j["renames"] = renames;

    return j.dump(2);
}

} // namespace binpack
