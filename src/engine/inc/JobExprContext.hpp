#pragma once

#include "CancellationToken.hpp"
#include "ExprContext.hpp"
#include "RunContext.hpp"
#include <map>
#include <string>

using SecretMap = std::map<std::string, std::string>;

// Expression context of one job instance, reading live state from the run.
//
// At job level (the job's `if`), success() means every needed instance passed and
// failure() means some ancestor failed. At step level they describe the earlier
// steps of the same instance.
class JobExprContext : public ExprContext {
public:
    enum class Level {
        Job,
        Step
    };

    JobExprContext(const RunContext& run,
                   const JobInstance& instance,
                   EnvMap env,
                   const SecretMap& secrets,
                   const CancellationToken& token,
                   Level level = Level::Job,
                   bool steps_failed = false);

    std::optional<ExprValue> lookup(const std::vector<std::string>& path) const override;
    std::optional<std::vector<ExprValue>> lookup_collection(const std::vector<std::string>& path) const override;

    bool status_success() const override;
    bool status_failure() const override;
    bool status_cancelled() const override;

private:
    std::optional<ExprValue> lookup_steps(const std::vector<std::string>& path) const;
    std::optional<ExprValue> lookup_job(const std::string& job_key, const std::vector<std::string>& rest) const;
    bool needs_job(const std::string& job_key) const;
    bool ancestor_failed(const std::string& id, bool count_continue_on_error) const;

    const RunContext& run_;
    const JobInstance& instance_;
    EnvMap env_;
    const SecretMap& secrets_;
    CancellationToken token_;
    Level level_;
    bool steps_failed_;
};
