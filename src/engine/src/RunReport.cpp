#include "RunReport.hpp"
#include "LogUtils.hpp"
#include "TimestampUtils.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace {

nlohmann::json time_or_null(const std::optional<Timestamp>& t) {
    if (!t) return nullptr;
    return TimestampUtils::to_iso8601(*t);
}

nlohmann::json masked_map(const std::map<std::string, std::string>& values, const SecretMasker& masker) {
    nlohmann::json obj = nlohmann::json::object();
    for (const auto& [key, value] : values) obj[key] = masker.mask(value);
    return obj;
}

} // namespace

nlohmann::json RunReport::to_json(const RunContext& run, const SecretMasker& masker) {
    const Workflow& workflow = run.plan().workflow();

    nlohmann::json report;
    report["workflow"] = workflow.name;
    report["status"] = to_string(run.run_status());
    report["cancelled"] = run.cancelled_externally();
    report["jobs"] = nlohmann::json::array();

    for (const auto& rec : run.snapshot()) {
        const JobInstance& instance = run.plan().instance(rec.id);

        nlohmann::json job;
        job["id"] = rec.id;
        job["job"] = rec.job_key;
        job["matrix"] = instance.matrix;
        job["status"] = to_string(rec.status);
        job["continue_on_error"] = rec.continue_on_error;
        job["outputs"] = masked_map(rec.outputs, masker);
        job["started_at"] = time_or_null(rec.started_at);
        job["finished_at"] = time_or_null(rec.finished_at);
        if (rec.error != ErrorKind::None) {
            job["error"] = {{"kind", to_string(rec.error)}, {"detail", masker.mask(rec.error_detail)}};
        }

        job["steps"] = nlohmann::json::array();
        for (const auto& step : rec.steps) {
            nlohmann::json s;
            s["key"] = step.key;
            s["name"] = step.name;
            s["outcome"] = to_string(step.status);
            s["conclusion"] = to_string(step.conclusion);
            s["exit_code"] = step.exit_code;
            s["attempts"] = step.attempts;
            s["outputs"] = masked_map(step.outputs, masker);
            s["started_at"] = time_or_null(step.started_at);
            s["finished_at"] = time_or_null(step.finished_at);
            if (step.error != ErrorKind::None) {
                s["error"] = {{"kind", to_string(step.error)}, {"detail", masker.mask(step.error_detail)}};
            }
            nlohmann::json log = nlohmann::json::array();
            for (const auto& line : step.log) log.push_back(masker.mask(line));
            s["log"] = std::move(log);
            job["steps"].push_back(std::move(s));
        }
        report["jobs"].push_back(std::move(job));
    }
    return report;
}

void RunReport::write(const std::string& path, const RunContext& run, const SecretMasker& masker) {
    std::filesystem::path file(path);
    if (file.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(file.parent_path(), ec);
    }

    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot write run report: " + path);
    }
    out << to_json(run, masker).dump(2) << std::endl;
    LogUtils::info("Run report written to {}", path);
}
