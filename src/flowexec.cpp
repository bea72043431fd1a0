#include "LogUtils.hpp"
#include "ParameterContext.hpp"
#include "JobScheduler.hpp"
#include "LocalArtifactStore.hpp"
#include "LocalShellSandbox.hpp"
#include "RunReport.hpp"
#include "SignalManager.hpp"
#include "StringUtils.hpp"
#include <csignal>
#include <cstring>
#include <iostream>

namespace {

constexpr int EXIT_RUN_FAILED = 1;
constexpr int EXIT_RUN_CANCELLED = 2;

void print_plan(const JobDAG& plan) {
    const Workflow& workflow = plan.workflow();
    std::cout << "Workflow: " << (workflow.name.empty() ? "(unnamed)" : workflow.name) << "\n"
              << "Jobs: " << workflow.jobs.size() << ", instances: " << plan.size() << "\n"
              << "Execution order:\n";

    size_t position = 1;
    for (const auto& id : plan.topological_order()) {
        std::cout << "  " << position++ << ". " << id;
        auto deps = plan.dependencies(id);
        if (!deps.empty()) {
            std::cout << "  <- " << StringUtils::join(deps, ", ");
        }
        const JobInstance& instance = plan.instance(id);
        if (!instance.concurrency_group.empty()) {
            std::cout << "  [group: " << instance.concurrency_group << "]";
        }
        std::cout << "\n";
    }
}

int exit_code_for(Status status) {
    switch (status) {
        case Status::Success:   return 0;
        case Status::Cancelled: return EXIT_RUN_CANCELLED;
        default:                return EXIT_RUN_FAILED;
    }
}

int execute(const ConfigData& config) {
    const GlobalConfig& global = config.global;

    // Secrets: secrets file first, then the process environment
    MapSecretProvider file_secrets;
    if (!global.secrets_file.empty()) {
        file_secrets = MapSecretProvider::from_yaml_file(global.secrets_file);
    }
    EnvSecretProvider env_secrets;
    ChainedSecretProvider secrets;
    secrets.add(&file_secrets);
    secrets.add(&env_secrets);

    LocalShellSandbox sandbox;
    LocalArtifactStore artifacts(global.artifact_dir);

    JobScheduler scheduler(config, sandbox, secrets, &artifacts);

    if (global.validate_only) {
        print_plan(scheduler.plan());
        return 0;
    }

    // Cancellation only sets a flag; the control loop does the rest
    SignalManager::on_interrupt([&scheduler](int) { scheduler.cancel(); });

    Status status = scheduler.run();
    const int signum = SignalManager::last_signal();
    SignalManager::reset();

    if (!global.report_file.empty()) {
        RunReport::write(global.report_file, scheduler.context(), scheduler.masker());
        LogUtils::info("Run report written to {}", global.report_file);
    }

    switch (status) {
        case Status::Success:
            LogUtils::info("All jobs completed successfully!");
            break;
        case Status::Cancelled:
            if (signum != 0) {
                LogUtils::warn("Run cancelled by signal {} ({})", signum, strsignal(signum));
            } else {
                LogUtils::warn("Run cancelled");
            }
            break;
        default:
            LogUtils::error("Run finished with status {}", to_string(status));
            break;
    }
    return exit_code_for(status);
}

}

int main(int argc, char* argv[]) {
    int result = 0;

    // Console and default file until the configured log directory is known
    LogUtils::LoggerGuard logging;

    try {
        // 1. Create parameter context and initialize
        ParameterContext context;
        if (!context.init(argc, argv)) {
            return 0;
        }

        const ConfigData& config = context.get_config_data();
        // Reopen the log under the configured directory
        LogUtils::init(config.global.verbose ? LogUtils::Level::Debug : LogUtils::Level::Info,
                       LogUtils::log_file_in(config.global.log_dir));

        for (const auto& warning : config.workflow.warnings) {
            LogUtils::warn(warning);
        }

        // 2. Plan and run
        try {
            result = execute(config);
        } catch (const std::exception& e) {
            LogUtils::error("Error during workflow execution: {}", e.what());
            result = EXIT_RUN_FAILED;
        }

    } catch (const std::exception& e) {
        LogUtils::error("Error: {}", e.what());
        LogUtils::error("Use --help or -? to show usage information");
        result = EXIT_RUN_FAILED;
    }

    return result;
}
