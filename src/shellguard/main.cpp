#define ELPP_DEFAULT_LOG_FILE "var/log/shellguard.log"
#include "easylogging++.h"

#include "CommandGateway.hpp"
#include "ConfigurationException.hpp"
#include "Database.hpp"
#include "DatabaseFactory.hpp"
#include "ExecutionAuditService.hpp"
#include "ShellGuardConfig.hpp"
#include "exec/ConfirmationPrompt.hpp"
#include "exec/SandboxedExecutor.hpp"
#include "policy/CommandPolicyTable.hpp"
#include "policy/DecisionEngine.hpp"
#include "policy/PatternClassifier.hpp"
#include "scoring/CurlHttpTransport.hpp"
#include "scoring/RiskScoringClient.hpp"

#include <boost/program_options.hpp>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#ifdef __GNUC__
#include <execinfo.h>
#include <signal.h>
#include <unistd.h>
#endif

INITIALIZE_EASYLOGGINGPP

struct CommandLineRequest {
    std::string command;
    bool dryRun = false;
    bool interactive = false;
    std::string workingDirectory;
    int timeoutSeconds = 0;
    bool capabilities = false;
    bool systemInfo = false;
    bool listDirectory = false;
    std::string listDirectoryPath;
    bool processes = false;
    bool diskUsage = false;
    int auditTail = 0;
    std::string usage;
};

ShellGuardConfig BuildConfiguration(int argc, const char* argv[], CommandLineRequest& request);

int RunRequest(const ShellGuardConfig& config, const CommandLineRequest& request);

#ifdef __GNUC__
void SignalHandler(int sig);
#endif

int main(int argc, const char* argv[]) {
#ifdef __GNUC__
    signal(SIGSEGV, SignalHandler);
#endif

    try {
        CommandLineRequest request;
        auto config = BuildConfiguration(argc, argv, request);

        el::Loggers::setDefaultConfigurations(config.loggerConfig, true);
        START_EASYLOGGINGPP(argc, argv);

        return RunRequest(config, request);
    } catch (const boost::program_options::error& e) {
        std::cerr << e.what() << "\n";
    } catch (const ConfigurationException& e) {
        LOG(ERROR) << e.what();
        std::cerr << e.what() << "\n";
    } catch (const DatabaseException& e) {
        LOG(ERROR) << "Audit store unavailable: " << e.what();
        std::cerr << e.what() << "\n";
    } catch (const std::invalid_argument& e) {
        LOG(ERROR) << "Invalid configuration: " << e.what();
        std::cerr << "invalid configuration: " << e.what() << "\n";
    } catch (const std::exception& e) {
        LOG(ERROR) << "Fatal error: " << e.what();
        std::cerr << e.what() << "\n";
    }

    return EXIT_FAILURE;
}

namespace {

void PrintDecision(const std::string& command, const policy::Decision& decision) {
    std::cout << "command: " << command << "\n"
              << "security level: " << policy::ToString(decision.finalLevel) << "\n"
              << "pattern level: " << policy::ToString(decision.patternLevel) << "\n"
              << "risk score: " << decision.riskScore << " (" << policy::DescribeRiskScore(decision.riskScore)
              << ")\n"
              << "requires confirmation: " << (decision.requiresConfirmation ? "yes" : "no") << "\n"
              << "reason: " << decision.reason << "\n";

    for (const auto& alternative : decision.safeAlternatives) {
        std::cout << "alternative: " << alternative << "\n";
    }
}

int PrintResult(const exec::ExecutionResult& result) {
    std::cout << result.stdOut;
    if (!result.stdOut.empty() && result.stdOut.back() != '\n') {
        std::cout << "\n";
    }

    std::cerr << result.stdErr;
    if (!result.stdErr.empty() && result.stdErr.back() != '\n') {
        std::cerr << "\n";
    }

    LOG(INFO) << "Finished '" << result.command << "': " << exec::ToString(result.status)
              << " rc=" << result.returnCode << " level=" << policy::ToString(result.securityLevel)
              << " elapsed=" << result.elapsedSeconds << "s";

    return result.returnCode;
}

void PrintList(const char* label, const std::vector<std::string>& items) {
    std::cout << label << ":";
    for (const auto& item : items) {
        std::cout << " " << item;
    }
    std::cout << "\n";
}

} // namespace

int RunRequest(const ShellGuardConfig& config, const CommandLineRequest& request) {
    scoring::CurlGlobalScope curlScope;
    scoring::CurlHttpTransport transport;

    scoring::ScoringConfig scoringConfig;
    scoringConfig.apiBase = config.scoringApiBase;
    scoringConfig.apiKey = config.scoringApiKey;
    scoringConfig.model = config.scoringModel;
    scoringConfig.timeout = std::chrono::seconds(config.scoringTimeoutSeconds);
    scoringConfig.temperature = config.scoringTemperature;
    scoringConfig.maxTokens = config.scoringMaxTokens;
    scoring::RiskScoringClient scorer{scoringConfig, &transport};

    if (!scorer.IsEnabled()) {
        LOG(WARNING) << "Risk scoring service not configured; decisions rely on pattern rules only";
    }

    policy::PatternClassifier classifier{policy::CommandPolicyTable::BuildDefault()};
    policy::DecisionEngine engine;
    exec::ConsoleConfirmationPrompt prompt{std::cin, std::cout};

    exec::ExecutorConfig executorConfig;
    executorConfig.rootDirectory = config.rootDirectory.empty() ? "." : config.rootDirectory;
    executorConfig.defaultTimeout = std::chrono::seconds(config.defaultTimeoutSeconds);
    executorConfig.maxOutputBytes = static_cast<std::size_t>(config.maxOutputBytes);
    exec::SandboxedExecutor executor{executorConfig, classifier, scorer, engine, &prompt};

    auto auditDatabase = CreateAuditDatabaseConnection(config);
    std::unique_ptr<ExecutionAuditService> audit;
    if (auditDatabase) {
        audit = std::make_unique<ExecutionAuditService>(auditDatabase.get());
    }

    CommandGateway gateway{executor, scorer, audit.get()};

    LOG(INFO) << "shellguard ready: root=" << executor.RootDirectory()
              << " timeout=" << executor.DefaultTimeout().count() << "s"
              << " max_output=" << executor.MaxOutputBytes();

    if (request.capabilities) {
        const auto capabilities = gateway.GetSecurityCapabilities();
        std::cout << "scoring enabled: " << (capabilities.scoringEnabled ? "yes" : "no") << "\n";
        PrintList("layers", capabilities.layers);
        PrintList("features", capabilities.features);
        return EXIT_SUCCESS;
    }

    if (request.systemInfo) {
        const auto info = gateway.GetSystemInfo();
        std::cout << "os: " << info.os << "\n"
                  << "user: " << info.user << "\n"
                  << "working directory: " << info.workingDirectory << "\n";
        return info.ok ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    if (request.listDirectory) {
        const auto listing = gateway.ListDirectory(request.listDirectoryPath);
        if (!listing.error.empty()) {
            std::cerr << listing.error << "\n";
            return EXIT_FAILURE;
        }

        for (const auto& entry : listing.entries) {
            std::cout << entry.permissions << " " << entry.links << " " << entry.owner << " " << entry.group << " "
                      << entry.size << " " << entry.date << " " << entry.name << "\n";
        }
        return EXIT_SUCCESS;
    }

    if (request.processes) {
        return PrintResult(gateway.GetProcessList());
    }

    if (request.diskUsage) {
        return PrintResult(gateway.GetDiskUsage());
    }

    if (request.auditTail > 0) {
        if (!audit) {
            std::cerr << "command audit is disabled; set audit_enabled=true\n";
            return EXIT_FAILURE;
        }

        for (const auto& entry : audit->RecentEntries(request.auditTail)) {
            std::cout << entry.id << " " << entry.recordedAt << " " << entry.mode << " " << entry.finalLevel
                      << " " << entry.riskScore << " " << entry.status << " rc=" << entry.returnCode << " "
                      << entry.command << "\n";
        }
        return EXIT_SUCCESS;
    }

    if (request.command.empty()) {
        std::cerr << request.usage << "\n";
        return EXIT_FAILURE;
    }

    if (request.dryRun) {
        const auto decision = gateway.EvaluateOnly(request.command);
        PrintDecision(request.command, decision);
        return decision.finalLevel == policy::SecurityLevel::Blocked ? exec::RETURN_CODE_POLICY_BLOCKED : EXIT_SUCCESS;
    }

    exec::ExecutionOptions options;
    options.workingDirectory = request.workingDirectory;
    options.timeoutSeconds = request.timeoutSeconds;
    options.interactive = request.interactive;

    return PrintResult(gateway.EvaluateAndExecute(request.command, options));
}

ShellGuardConfig BuildConfiguration(int argc, const char* argv[], CommandLineRequest& request) {
    namespace po = boost::program_options;
    ShellGuardConfig config;
    std::string configFile;
    std::vector<std::string> commandWords;

    auto ResolveDefaultPath = [](const std::vector<std::string>& candidatePaths) {
        for (const auto& candidatePath : candidatePaths) {
            std::ifstream candidate(candidatePath.c_str());
            if (candidate.good()) {
                return candidatePath;
            }
        }

        return candidatePaths.empty() ? std::string{} : candidatePaths.front();
    };

    // Declare a group of options that will be
    // allowed only on command line
    po::options_description generic("Generic options");
    generic.add_options()
        ("help,h", "produces help message")
        ("config,c", po::value<std::string>(&configFile)->default_value("etc/shellguard/shellguard.cfg"),
            "sets path to the configuration file")
        ("logger_config", po::value<std::string>(&config.loggerConfig)->default_value("etc/shellguard/logger.cfg"),
            "sets path to the logger configuration file")
        ;

    po::options_description actions("Actions");
    actions.add_options()
        ("dry_run,n", po::bool_switch(&request.dryRun), "evaluates the command without running it")
        ("interactive,i", po::bool_switch(&request.interactive),
            "asks for confirmation before running commands that need it")
        ("working_directory,w", po::value<std::string>(&request.workingDirectory),
            "working directory, relative to root_directory or absolute inside it")
        ("timeout,t", po::value<int>(&request.timeoutSeconds)->default_value(0),
            "timeout in seconds (0 uses default_timeout_seconds)")
        ("capabilities", po::bool_switch(&request.capabilities), "prints the active security layers")
        ("system_info", po::bool_switch(&request.systemInfo), "prints operating system, user and directory")
        ("list_directory", po::value<std::string>(&request.listDirectoryPath), "lists a directory")
        ("processes", po::bool_switch(&request.processes), "prints the first running processes")
        ("disk_usage", po::bool_switch(&request.diskUsage), "prints disk usage")
        ("audit_tail", po::value<int>(&request.auditTail)->default_value(0),
            "prints the newest N audit entries")
        ("command", po::value<std::vector<std::string>>(&commandWords), "command to vet and run")
        ;

    po::options_description options("Configuration");
    options.add_options()
        ("root_directory", po::value<std::string>(&config.rootDirectory)->default_value(""),
            "gateway root and default working directory (empty uses the current directory)")
        ("default_timeout_seconds", po::value<int>(&config.defaultTimeoutSeconds)->default_value(30),
            "default command timeout in seconds")
        ("max_output_bytes", po::value<int64_t>(&config.maxOutputBytes)->default_value(1024 * 1024),
            "bytes captured per output stream")
        ("scoring_api_base", po::value<std::string>(&config.scoringApiBase)->default_value("https://api.moonshot.cn/v1"),
            "risk scoring service base URL")
        ("scoring_api_key", po::value<std::string>(&config.scoringApiKey)->default_value(""),
            "risk scoring bearer token (can be overridden by SHELLGUARD_SCORING_API_KEY)")
        ("scoring_model", po::value<std::string>(&config.scoringModel)->default_value("moonshot-v1-8k"),
            "risk scoring model name")
        ("scoring_timeout_seconds", po::value<int>(&config.scoringTimeoutSeconds)->default_value(10),
            "risk scoring request timeout in seconds")
        ("scoring_temperature", po::value<double>(&config.scoringTemperature)->default_value(0.1),
            "risk scoring request temperature")
        ("scoring_max_tokens", po::value<int>(&config.scoringMaxTokens)->default_value(1000),
            "risk scoring response token cap")
        ("audit_enabled", po::value<bool>(&config.auditEnabled)->default_value(false),
            "records every decision and execution in the audit database")
        ("audit_database_path", po::value<std::string>(&config.auditDatabasePath)->default_value("var/shellguard/audit.db"),
            "path to the SQLite audit database")
        ;

    po::positional_options_description positional;
    positional.add("command", -1);

    po::options_description cmdline_options;
    cmdline_options.add(generic).add(actions).add(options);

    po::options_description config_file_options;
    config_file_options.add(options);

    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv).options(cmdline_options).positional(positional).run(), vm);
    po::notify(vm);

    if (vm["config"].defaulted()) {
        configFile = ResolveDefaultPath({"shellguard.cfg", configFile});
    }
    if (vm["logger_config"].defaulted()) {
        config.loggerConfig = ResolveDefaultPath({"logger.cfg", config.loggerConfig});
    }

    if (vm.count("help")) {
        std::cout << "usage: shellguard [options] [--] command...\n" << cmdline_options << "\n";
        exit(EXIT_SUCCESS);
    }

    std::ifstream ifs(configFile.c_str());
    if (!ifs) {
        throw ConfigurationException("cannot open configuration file: " + configFile);
    }

    po::store(po::parse_config_file(ifs, config_file_options), vm);
    po::notify(vm);

    const char* keyFromEnv = std::getenv("SHELLGUARD_SCORING_API_KEY");
    if (keyFromEnv != nullptr) {
        config.scoringApiKey = keyFromEnv;
    }

    ValidateConfiguration(config);

    request.listDirectory = vm.count("list_directory") > 0;
    for (const auto& word : commandWords) {
        if (!request.command.empty()) {
            request.command += " ";
        }
        request.command += word;
    }

    std::ostringstream usage;
    usage << "usage: shellguard [options] [--] command...\n" << cmdline_options;
    request.usage = usage.str();

    return config;
}

#ifdef __GNUC__
void SignalHandler(int sig) {
    const int BACKTRACE_LIMIT = 10;
    void *arr[BACKTRACE_LIMIT];
    auto size = backtrace(arr, BACKTRACE_LIMIT);

    fprintf(stderr, "Error: signal %d:\n", sig);
    backtrace_symbols_fd(arr, size, STDERR_FILENO);
    exit(1);
}
#endif
