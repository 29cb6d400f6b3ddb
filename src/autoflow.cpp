#include "LogUtils.hpp"
#include "SignalManager.hpp"
#include "ParameterContext.hpp"
#include "WorkflowParser.hpp"
#include "WorkflowValidator.hpp"
#include "WorkflowRunner.hpp"
#include "WorkflowErrors.hpp"
#include "DriverFactory.hpp"
#include "FileStorage.hpp"
#include <csignal>
#include <fstream>
#include <iostream>

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_INVALID = 2;

bool write_result(const std::string& path, const ExecutionResult& result) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        LogUtils::error("Failed to open output file: {}", path);
        return false;
    }
    out << result.to_json().dump(2) << std::endl;
    return out.good();
}

}

int main(int argc, char* argv[]) {
    int result = EXIT_OK;
    CancellationToken cancel_token;

    try {
        // 1. Create parameter context and initialize
        ParameterContext context;
        if (!context.init(argc, argv)) {
            goto end;
        }

        const GlobalConfig& global = context.get_global_config();
        LogUtils::init(LogUtils::parse_level(global.log_level),
                       global.log_file.empty() ? "log/autoflow.log" : global.log_file);

        SignalManager::register_signal(SIGINT, [&cancel_token](int) { cancel_token.cancel(); });
        SignalManager::register_signal(SIGTERM, [&cancel_token](int) { cancel_token.cancel(); });
        SignalManager::setup();

        // 2. Load and validate the workflow before any step runs
        Workflow workflow;
        try {
            workflow = WorkflowParser::parse_file(context.get_workflow_file());
            WorkflowValidator(global.max_nesting_depth).validate_or_throw(workflow);
        } catch (const ValidationError& e) {
            LogUtils::error("{}", e.what());
            result = EXIT_INVALID;
            goto end;
        }

        // 3. Run it against the configured collaborators
        try {
            auto driver = DriverFactory::create(global.driver);
            FileStorage storage(global.storage);

            WorkflowRunner runner(std::move(workflow), *driver, storage, global);
            runner.set_cancellation_token(&cancel_token);

            ExecutionResult execution = runner.run(context.get_variable_overrides());
            driver->close();
            if (int signum = SignalManager::last_signal()) {
                LogUtils::warn("Received signal {} during the run", signum);
            }

            if (global.output_file.empty()) {
                std::cout << execution.to_json().dump(2) << std::endl;
            } else if (!write_result(global.output_file, execution)) {
                result = EXIT_FAILED;
                goto end;
            }

            if (!execution.succeeded()) {
                result = EXIT_FAILED;
                goto end;
            }

            LogUtils::info("Workflow {} completed successfully!", execution.workflow_name);
            goto end;

        } catch (const std::exception& e) {
            LogUtils::error("Error during workflow execution: {}", e.what());
            result = EXIT_FAILED;
            goto end;
        }

    } catch (const std::exception& e) {
        LogUtils::error("Error: {}", e.what());
        LogUtils::error("Use --help or -? to show usage information");
        result = EXIT_INVALID;
        goto end;
    }

end:
    SignalManager::reset();
    LogUtils::shutdown();
    return result;
}
