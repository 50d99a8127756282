#include <atomic>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "backupmanager.hpp"
#include "confirmationmanager.hpp"
#include "eventbus.hpp"
#include "fileorganizer.hpp"
#include "interruptionmanager.hpp"
#include "logging.hpp"
#include "organizerconfig.hpp"
#include "organizererrors.hpp"
#include "safetycoordinator.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

std::atomic<bool> g_interruptRequested{false};

void onSignal(int) { g_interruptRequested.store(true); }

/**
 * @brief Asks on the terminal, "y" or "yes" confirms
 */
class ConsoleConfirmationHandler : public IConfirmationHandler {
public:
  ConfirmationDecision confirm(const ConfirmationRequest &request) override {
    std::cout << "\n" << request.title << "\n  " << request.message << "\n";
    if (!request.details.empty())
      std::cout << "  " << request.details << "\n";
    std::cout << "Proceed? [y/N] " << std::flush;

    std::string answer;
    if (!std::getline(std::cin, answer))
      return ConfirmationDecision::Cancel;
    return (answer == "y" || answer == "Y" || answer == "yes")
               ? ConfirmationDecision::Confirm
               : ConfirmationDecision::Cancel;
  }
};

void printUsage() {
  std::cout
      << "Usage: mediasort-cli <command> [options]\n\n"
         "Commands:\n"
         "  plan      -s SRC -d DST     Show the planned operations\n"
         "  simulate  -s SRC -d DST     Classify the planned operations\n"
         "  organize  -s SRC -d DST     Organize SRC into the library DST\n"
         "  backup create PATH...       Back up files or directories\n"
         "  backup list                 List backups\n"
         "  backup restore ID TARGET    Restore a backup into TARGET\n"
         "  backup verify ID            Check the checksum of a backup\n"
         "  backup cleanup [--days N] [--keep K]\n"
         "  strategies                  List naming strategies\n\n"
         "Options:\n"
         "  -s, --source DIR       Source directory\n"
         "  -d, --dest DIR         Library root\n"
         "  -n, --naming NAME      Naming strategy\n"
         "      --move             Move instead of copy\n"
         "      --mode MODE        normal|safe|test|simulation|emergency\n"
         "      --strategy NAME    Backup strategy: copy|zip|incremental|mirror\n"
         "  -y, --yes              Confirm every request\n"
         "  -c, --config FILE      YAML configuration\n"
         "  -v, --verbose          Debug logging\n"
         "  -h, --help             This help\n";
}

} // namespace

/**
 * @class Application
 * @brief Command line front end of the organizer
 *
 * Parses the arguments, builds the components from the configuration and
 * runs one command. Ctrl+C during "organize" requests an interruption; the
 * batch stops before its next file.
 */
class Application {
private:
  struct Options {
    std::string command;
    std::vector<std::string> positional;
    fs::path source;
    fs::path dest;
    std::optional<std::string> naming;
    bool move = false;
    std::optional<SafetyMode> mode;
    std::optional<BackupStrategy> backupStrategy;
    std::optional<int> days;
    std::optional<std::size_t> keep;
    bool yes = false;
    bool verbose = false;
    fs::path configFile;
  };

  Options options;
  OrganizerConfig config;
  EventBusPtr bus = std::make_shared<EventBus>();

public:
  int run(int argc, char *argv[]) {
    if (!parseArguments(argc, argv))
      return 2;

    try {
      if (!options.configFile.empty())
        config = loadConfig(options.configFile);
    } catch (const ValidationError &e) {
      std::cerr << "Configuration error: " << e.what() << std::endl;
      return 2;
    }
    if (options.naming)
      config.namingStrategy = *options.naming;
    if (options.mode)
      config.safety.defaultMode = *options.mode;

    initLogging(config.logging.file, config.logging.console,
                options.verbose ? "debug" : config.logging.level);

    int rc = 1;
    try {
      if (options.command == "plan")
        rc = runPlan();
      else if (options.command == "simulate")
        rc = runSimulate();
      else if (options.command == "organize")
        rc = runOrganize();
      else if (options.command == "backup")
        rc = runBackup();
      else if (options.command == "strategies")
        rc = runStrategies();
      else {
        printUsage();
        rc = 2;
      }
    } catch (const OrganizerError &e) {
      MEDIASORT_LOG_ERROR("{} error: {}", errorKindName(e.kind()), e.what());
      std::cerr << e.what() << std::endl;
      rc = 1;
    }

    shutdownLogging();
    return rc;
  }

private:
  bool parseArguments(int argc, char *argv[]) {
    auto value = [&](int &i, const std::string &arg) -> std::optional<std::string> {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << arg << std::endl;
        return std::nullopt;
      }
      return std::string(argv[++i]);
    };

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "-h" || arg == "--help") {
        printUsage();
        return false;
      } else if (arg == "-s" || arg == "--source") {
        auto v = value(i, arg);
        if (!v)
          return false;
        options.source = *v;
      } else if (arg == "-d" || arg == "--dest") {
        auto v = value(i, arg);
        if (!v)
          return false;
        options.dest = *v;
      } else if (arg == "-n" || arg == "--naming") {
        auto v = value(i, arg);
        if (!v)
          return false;
        options.naming = *v;
      } else if (arg == "--move") {
        options.move = true;
      } else if (arg == "--mode") {
        auto v = value(i, arg);
        if (!v)
          return false;
        options.mode = parseSafetyMode(*v);
        if (!options.mode) {
          std::cerr << "Unknown mode: " << *v << std::endl;
          return false;
        }
      } else if (arg == "--strategy") {
        auto v = value(i, arg);
        if (!v)
          return false;
        options.backupStrategy = parseBackupStrategy(*v);
        if (!options.backupStrategy) {
          std::cerr << "Unknown backup strategy: " << *v << std::endl;
          return false;
        }
      } else if (arg == "--days" || arg == "--keep") {
        auto v = value(i, arg);
        if (!v)
          return false;
        if (!v->empty() && v->front() == '-') {
          std::cerr << arg << " must not be negative: " << *v << std::endl;
          return false;
        }
        try {
          if (arg == "--days")
            options.days = std::stoi(*v);
          else
            options.keep = static_cast<std::size_t>(std::stoul(*v));
        } catch (const std::exception &) {
          std::cerr << "Not a number: " << *v << std::endl;
          return false;
        }
      } else if (arg == "-y" || arg == "--yes") {
        options.yes = true;
      } else if (arg == "-v" || arg == "--verbose") {
        options.verbose = true;
      } else if (arg == "-c" || arg == "--config") {
        auto v = value(i, arg);
        if (!v)
          return false;
        options.configFile = *v;
      } else if (options.command.empty()) {
        options.command = arg;
      } else {
        options.positional.push_back(arg);
      }
    }

    if (options.command.empty()) {
      printUsage();
      return false;
    }
    return true;
  }

  bool requireSourceAndDest() const {
    if (options.source.empty() || options.dest.empty()) {
      std::cerr << options.command << " needs -s SRC and -d DST" << std::endl;
      return false;
    }
    return true;
  }

  OrganizeRequest request() const {
    OrganizeRequest req;
    req.sourceDir = options.source;
    req.destRoot = options.dest;
    req.operationType = options.move ? OperationType::Move : OperationType::Copy;
    return req;
  }

  int runStrategies() const {
    for (const auto &name : NamingStrategyFactory::availableStrategies())
      std::cout << std::left << std::setw(10) << name << " "
                << NamingStrategyFactory::description(name) << "\n";
    return 0;
  }

  int runPlan() {
    if (!requireSourceAndDest())
      return 2;

    FileOrganizer organizer(config, bus);
    const auto plans = organizer.plan(request());
    for (const auto &plan : plans) {
      std::cout << toString(plan.operationType) << "  " << plan.sourcePath.string()
                << "\n   -> " << plan.targetPath.string() << "\n";
    }

    const auto stats = organizer.planner().statistics(plans);
    const auto validation = organizer.planner().validatePlans(plans);
    std::cout << "\n" << stats.totalFiles << " files, "
              << formatBytes(static_cast<long long>(stats.totalSizeBytes))
              << ", about " << static_cast<long long>(stats.estimatedSeconds)
              << " s\n";
    for (const auto &error : validation.errors)
      std::cout << "error: " << error << "\n";
    for (const auto &conflict : validation.conflicts)
      std::cout << "conflict: " << conflict << "\n";
    for (const auto &warning : validation.warnings)
      std::cout << "warning: " << warning << "\n";
    return validation.valid ? 0 : 1;
  }

  int runSimulate() {
    if (!requireSourceAndDest())
      return 2;

    FileOrganizer organizer(config, bus);
    const SimulationReport report = organizer.simulate(request());
    for (const auto &item : report.items) {
      const char *tag = item.outcome == SimulatedOutcome::Success    ? "ok      "
                        : item.outcome == SimulatedOutcome::Conflict ? "conflict"
                                                                     : "error   ";
      std::cout << tag << "  " << item.sourcePath.filename().string();
      if (!item.message.empty())
        std::cout << "  (" << item.message << ")";
      std::cout << "\n";
    }
    std::cout << "\n" << report.successCount << " ok, " << report.conflictCount
              << " conflicts, " << report.errorCount << " errors, "
              << formatBytes(static_cast<long long>(report.totalBytes)) << "\n";
    return report.errorCount == 0 ? 0 : 1;
  }

  int runOrganize() {
    if (!requireSourceAndDest())
      return 2;

    BackupManager backups(config.backup, bus);
    ConfirmationManager confirmations(config.confirmation, bus);
    InterruptionManager interruptions(config.interruption, bus);
    SafetyCoordinator safety(config.safety, backups, confirmations,
                             interruptions, bus);

    if (options.yes) {
      confirmations.setHandler(std::make_shared<FunctionConfirmationHandler>(
          [](const ConfirmationRequest &) {
            return ConfirmationDecision::Confirm;
          }));
    } else {
      confirmations.setHandler(std::make_shared<ConsoleConfirmationHandler>());
    }
    safety.init();

    FileOrganizer organizer(config, bus, &interruptions);
    const auto plans = organizer.plan(request());
    if (plans.empty()) {
      std::cout << "Nothing to organize in " << options.source.string() << "\n";
      safety.shutdown();
      return 0;
    }

    std::vector<fs::path> files;
    for (const auto &plan : plans)
      files.push_back(plan.sourcePath);

    const std::string operationId = FileOrganizer::newOperationId();
    bool interruptSent = false;
    organizer.setProgressCallback([&](const BatchProgress &progress) {
      std::cout << "\r[" << std::setw(3) << static_cast<int>(progress.percent)
                << "%] " << progress.current << "/" << progress.total << "  "
                << std::fixed << std::setprecision(1)
                << progress.megabytesPerSecond << " MB/s" << std::flush;

      if (g_interruptRequested.load() && !interruptSent) {
        InterruptionRequest req;
        req.operationId = operationId;
        req.reason = InterruptionReason::UserRequest;
        interruptSent = interruptions.requestInterruption(req);
      }
    });

    std::signal(SIGINT, onSignal);

    OrganizeReport report;
    const SafetyOperation kind =
        options.move ? SafetyOperation::Move : SafetyOperation::Copy;
    const SafeOperationResult outcome = safety.requestSafeOperationDetailed(
        kind, files, [&] {
          report = organizer.executePlans(plans, operationId);
          return report.batch.errorCount == 0;
        });

    std::signal(SIGINT, SIG_DFL);
    std::cout << "\n";

    if (outcome.outcome == SafeOperationOutcome::Simulated) {
      std::cout << "Nothing changed (" << toString(safety.mode())
                << " mode), " << plans.size() << " files at "
                << toString(outcome.riskLevel) << " risk\n";
    } else if (outcome.outcome == SafeOperationOutcome::Executed ||
               outcome.outcome == SafeOperationOutcome::CallbackFailed) {
      std::cout << report.batch.successCount << " done, "
                << report.batch.errorCount << " failed, "
                << report.batch.skippedCount << " skipped";
      if (report.batch.cancelled)
        std::cout << " (interrupted)";
      std::cout << "\n";
    } else {
      std::cout << "Not executed: " << toString(outcome.outcome);
      if (outcome.errorMessage)
        std::cout << " (" << *outcome.errorMessage << ")";
      std::cout << "\n";
    }
    if (outcome.backupId)
      std::cout << "Backup: " << *outcome.backupId << "\n";
    std::cout << "Safety score: " << safety.safetyScore() << "\n";

    safety.shutdown();
    return outcome.success ? 0 : 1;
  }

  int runBackup() {
    if (options.positional.empty()) {
      std::cerr << "backup needs a subcommand" << std::endl;
      return 2;
    }

    BackupManager backups(config.backup, bus);
    if (!backups.init()) {
      std::cerr << "Cannot open backup directory "
                << config.backup.backupRoot.string() << std::endl;
      return 1;
    }

    const std::string sub = options.positional.front();
    const std::vector<std::string> args(options.positional.begin() + 1,
                                        options.positional.end());

    if (sub == "create") {
      if (args.empty()) {
        std::cerr << "backup create needs at least one path" << std::endl;
        return 2;
      }
      std::vector<fs::path> paths(args.begin(), args.end());
      auto info = backups.createBackup(paths, options.backupStrategy);
      if (!info) {
        std::cerr << "Backup failed" << std::endl;
        return 1;
      }
      std::cout << info->id << "  " << info->filesBackedUp << " files, "
                << formatBytes(static_cast<long long>(info->sizeBytes)) << "\n";
      return 0;
    }

    if (sub == "list") {
      for (const auto &info : backups.listBackups()) {
        std::cout << info.id << "  " << std::left << std::setw(12)
                  << toString(info.strategy) << info.filesBackedUp
                  << " files  "
                  << formatBytes(static_cast<long long>(info.sizeBytes)) << "\n";
      }
      return 0;
    }

    if (sub == "restore") {
      if (args.size() != 2) {
        std::cerr << "backup restore needs ID and TARGET" << std::endl;
        return 2;
      }
      return backups.restoreBackup(args[0], args[1]) ? 0 : 1;
    }

    if (sub == "verify") {
      if (args.size() != 1) {
        std::cerr << "backup verify needs ID" << std::endl;
        return 2;
      }
      const bool ok = backups.verifyBackup(args[0]);
      std::cout << args[0] << (ok ? ": OK\n" : ": checksum mismatch\n");
      return ok ? 0 : 1;
    }

    if (sub == "cleanup") {
      const int removed =
          (options.days || options.keep)
              ? backups.cleanupOldBackups(options.days, options.keep)
              : backups.cleanupOldBackups();
      std::cout << removed << " backups removed\n";
      return 0;
    }

    std::cerr << "Unknown backup subcommand: " << sub << std::endl;
    return 2;
  }
};

int main(int argc, char *argv[]) {
  Application app;
  return app.run(argc, argv);
}
