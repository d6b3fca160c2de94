#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "planid/core/command_counter_registry.hpp"
#include "planid/core/command_ledger.hpp"
#include "planid/core/id_format.hpp"
#include "planid/core/log.hpp"
#include "planid/core/normalizer.hpp"
#include "planid/core/planner_payload.hpp"
#include "planid/core/session_registry.hpp"
#include "tool_settings.hpp"

namespace {

using planid::cli::ToolSettings;
using planid::core::ErrorCode;
using planid::core::SessionId;
using planid::core::SessionRegistry;

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

struct CommandLine {
  std::string config_path = planid::cli::kToolSettingsFile;
  std::string log_level{};
  std::string log_file{};
  std::string session_id{};
  bool pretty = false;
  std::string command{};
  std::vector<std::string> arguments{};
};

void PrintUsage(std::ostream& out) {
  out << "usage: planid [--config FILE] [--log-level LEVEL] [--log-file FILE]\n"
         "              [--session SESSION_ID] [--pretty] COMMAND [ARGS]\n"
         "\n"
         "commands:\n"
         "  session              mint a new session id\n"
         "  check ID...          report the kind of each canonical id\n"
         "  normalize FILE|-     normalize a planner payload for the session\n"
         "  demo                 normalize the demo tree and dispatch its commands\n";
}

bool ParseCommandLine(int argc, char** argv, CommandLine* cli, std::string* error) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const auto take_value = [&](std::string* out) {
      if (i + 1 >= argc) {
        *error = arg + " expects a value";
        return false;
      }
      *out = argv[++i];
      return true;
    };
    if (!cli->command.empty()) {
      cli->arguments.push_back(arg);
    } else if (arg == "--config") {
      if (!take_value(&cli->config_path)) {
        return false;
      }
    } else if (arg == "--log-level") {
      if (!take_value(&cli->log_level)) {
        return false;
      }
    } else if (arg == "--log-file") {
      if (!take_value(&cli->log_file)) {
        return false;
      }
    } else if (arg == "--session") {
      if (!take_value(&cli->session_id)) {
        return false;
      }
    } else if (arg == "--pretty") {
      cli->pretty = true;
    } else if (arg.rfind("--", 0) == 0) {
      *error = "unknown option " + arg;
      return false;
    } else {
      cli->command = arg;
    }
  }
  if (cli->command.empty()) {
    *error = "missing command";
    return false;
  }
  return true;
}

// Command-line flags win over the settings file.
bool MergeSettings(const CommandLine& cli, ToolSettings* settings, std::string* error) {
  if (!cli.log_level.empty() && !planid::cli::apply_setting_line("log_level=" + cli.log_level, settings, error)) {
    return false;
  }
  if (!cli.log_file.empty()) {
    settings->log.file_path = cli.log_file;
  }
  if (!cli.session_id.empty()) {
    settings->session_id = cli.session_id;
  }
  if (cli.pretty) {
    settings->pretty = true;
  }
  return true;
}

bool ReadPayload(const std::string& source, std::string* text, std::string* error) {
  if (source == "-") {
    text->assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return true;
  }
  std::ifstream ifs(source);
  if (!ifs.is_open()) {
    *error = "cannot open payload file '" + source + "'";
    return false;
  }
  std::ostringstream buffer;
  buffer << ifs.rdbuf();
  *text = buffer.str();
  return true;
}

int ReportError(ErrorCode code, const std::string& message) {
  std::cerr << "error [" << planid::core::to_string(code) << "]: " << message << "\n";
  return kExitFailure;
}

// Resolves the session for a planning command: the configured one when set,
// otherwise a freshly minted one.
bool EnterSession(SessionRegistry& sessions, const ToolSettings& settings, SessionId* session, int* exit_code) {
  if (settings.session_id.empty()) {
    *session = sessions.OpenSession();
    return true;
  }
  const auto accepted = sessions.AcceptClientSession(settings.session_id);
  if (!accepted.ok) {
    *exit_code = ReportError(accepted.code, accepted.error);
    return false;
  }
  *session = accepted.value;
  return true;
}

int RunSession() {
  std::cout << planid::core::format_session_id().text << "\n";
  return kExitOk;
}

int RunCheck(const std::vector<std::string>& ids) {
  if (ids.empty()) {
    std::cerr << "check expects at least one id\n";
    return kExitUsage;
  }
  int exit_code = kExitOk;
  for (const std::string& id : ids) {
    const auto kind = planid::core::entity_kind_of(id);
    if (!kind) {
      std::cout << id << "\tnot canonical\n";
      exit_code = kExitFailure;
      continue;
    }
    std::cout << id << "\t" << planid::core::to_string(*kind);
    if (*kind == planid::core::EntityKind::kCommand) {
      std::cout << "\tplan=" << planid::core::parse_command_id(id).value.plan.text;
    }
    std::cout << "\n";
  }
  return exit_code;
}

int RunNormalize(const std::vector<std::string>& arguments, const ToolSettings& settings) {
  if (arguments.size() != 1) {
    std::cerr << "normalize expects one payload file (or - for stdin)\n";
    return kExitUsage;
  }
  std::string text;
  std::string error;
  if (!ReadPayload(arguments.front(), &text, &error)) {
    std::cerr << error << "\n";
    return kExitFailure;
  }
  const auto raw_tree = planid::core::decode_planner_payload(text);
  if (!raw_tree.ok) {
    return ReportError(raw_tree.code, raw_tree.error);
  }

  SessionRegistry sessions;
  SessionId session;
  int exit_code = kExitOk;
  if (!EnterSession(sessions, settings, &session, &exit_code)) {
    return exit_code;
  }
  const auto normalized = sessions.Plan(session, raw_tree.value);
  if (!normalized.ok) {
    return ReportError(normalized.code, normalized.error);
  }
  const auto style = settings.pretty ? planid::core::PayloadStyle::kYaml : planid::core::PayloadStyle::kJson;
  std::cout << planid::core::encode_normalized_tree(normalized.value, style) << "\n";
  return kExitOk;
}

int RunDemo(const ToolSettings& settings) {
  SessionRegistry sessions;
  SessionId session;
  int exit_code = kExitOk;
  if (!EnterSession(sessions, settings, &session, &exit_code)) {
    return exit_code;
  }
  const auto normalized = sessions.Plan(session, planid::core::make_demo_tree());
  if (!normalized.ok) {
    return ReportError(normalized.code, normalized.error);
  }
  const auto& tree = normalized.value;
  std::cout << "session " << session.text << "\n";

  planid::core::CommandCounterRegistry registry;
  planid::core::CommandLedger ledger(registry);
  const auto approved = ledger.RegisterApprovedPlans(tree);
  if (!approved.ok) {
    return ReportError(approved.code, approved.error);
  }

  for (const auto& goal : tree.goals) {
    std::cout << goal.id.text << "  " << goal.label << "  (raw " << goal.raw_id << ")\n";
    for (const auto& plan : goal.plans) {
      std::cout << "  " << plan.id.text << "  " << plan.action_type;
      for (const auto& edge : plan.depends_on) {
        std::cout << "  after " << edge.target_id;
      }
      std::cout << "\n";

      const auto command = ledger.Issue(plan.id, plan.action_type);
      if (!command.ok) {
        return ReportError(command.code, command.error);
      }
      std::cout << "    " << command.value.id.text << "\n";
    }
  }

  // One failed dispatch retried under the same plan.
  const auto& first_plan = tree.goals.front().plans.front();
  const auto history = ledger.commands_for_plan(first_plan.id);
  const auto marked = ledger.Mark(history.front().id, planid::core::CommandStatus::kFailed);
  if (!marked.ok) {
    return ReportError(marked.code, marked.error);
  }
  const auto retry = ledger.Retry(history.front().id);
  if (!retry.ok) {
    return ReportError(retry.code, retry.error);
  }
  std::cout << "retry " << retry.value.id.text << " <- " << retry.value.attempt_of->text << "\n";
  std::cout << ledger.command_count() << " commands issued\n";
  return kExitOk;
}

}  // namespace

int main(int argc, char** argv) {
  CommandLine cli;
  std::string error;
  if (!ParseCommandLine(argc, argv, &cli, &error)) {
    std::cerr << error << "\n";
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  planid::cli::SettingsLoadReport report;
  ToolSettings settings = planid::cli::LoadToolSettings(cli.config_path, &report);
  if (!MergeSettings(cli, &settings, &error)) {
    std::cerr << error << "\n";
    return kExitUsage;
  }

  try {
    planid::core::log::init(settings.log);
  } catch (const spdlog::spdlog_ex& e) {
    std::cerr << "cannot open log sink: " << e.what() << "\n";
    return kExitFailure;
  }
  const auto logger = planid::core::log::get();
  for (const std::string& warning : report.warnings) {
    logger->warn("{}", warning);
  }
  if (report.file_found) {
    logger->debug("settings loaded from {}", cli.config_path);
  }

  if (cli.command == "session") {
    return RunSession();
  }
  if (cli.command == "check") {
    return RunCheck(cli.arguments);
  }
  if (cli.command == "normalize") {
    return RunNormalize(cli.arguments, settings);
  }
  if (cli.command == "demo") {
    return RunDemo(settings);
  }
  std::cerr << "unknown command " << cli.command << "\n";
  PrintUsage(std::cerr);
  return kExitUsage;
}
