#include <fcntl.h>
#include <unistd.h>
#include <fstream>
#include <iostream>
#include <iterator>
#include <filesystem>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <argparse/argparse.hpp>
#include <nlohmann/json.hpp>
#include <polyrun/broker.h>
#include <polyrun/config.h>
#include <polyrun/logger.h>
#include <polyrun/paths.h>
#include <polyrun/utils.h>
#include "line_server.h"

namespace {

bool to_lock = true;

struct Options {
  bool list = false, serve = false;
  std::string language, source_file, input_file, caller = "cli";
  Limits limits;
} options;

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "polyrun");
  parser.add_argument("-c", "--config")
    .required().default_value(std::string("/etc/polyrun.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-p", "--parallel")
    .scan<'d', int>()
    .help("Number of maximum parallel executions");
  parser.add_argument("--no-lock")
    .default_value(false)
    .implicit_value(true)
    .help("Not check for other running instances");
  parser.add_argument("--pinned-cpus")
    .default_value(std::string(""))
    .help("Comma-separated list of CPUs to pin or simply \"all\"");
  parser.add_argument("-l", "--language")
    .default_value(std::string(""))
    .help("Language identifier or alias of the snippet");
  parser.add_argument("-f", "--file")
    .default_value(std::string("-"))
    .help("Source file of the snippet; \"-\" for standard input");
  parser.add_argument("-i", "--input")
    .default_value(std::string(""))
    .help("File passed to the snippet as standard input");
  parser.add_argument("--caller")
    .default_value(std::string("cli"))
    .help("Caller identity used for admission");
  parser.add_argument("-t", "--time-limit-ms")
    .scan<'d', long>()
    .help("Wall-clock and CPU time limit of the program");
  parser.add_argument("-m", "--memory-limit-mb")
    .scan<'d', long>()
    .help("Memory limit of the program");
  parser.add_argument("--list")
    .default_value(false)
    .implicit_value(true)
    .help("List the available languages and exit");
  parser.add_argument("--serve")
    .default_value(false)
    .implicit_value(true)
    .help("Serve line-delimited JSON requests on standard input");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  fs::path config_file = parser.get<std::string>("--config");
  if (!ParseConfig(config_file)) {
    spdlog::error("Failed to parse configuration file {}", std::string(config_file));
    exit(1);
  }
  if (auto val = parser.present<int>("--parallel")) {
    kMaxParallel = val.value();
  }
  to_lock = parser["--no-lock"] == false;
  if (auto pinned_cpus = parser.get<std::string>("--pinned-cpus"); pinned_cpus.size()) {
    if (!SetPinnedCpus(pinned_cpus)) exit(1);
  }
  options.list = parser["--list"] == true;
  options.serve = parser["--serve"] == true;
  options.language = parser.get<std::string>("--language");
  options.source_file = parser.get<std::string>("--file");
  options.input_file = parser.get<std::string>("--input");
  options.caller = parser.get<std::string>("--caller");
  if (auto val = parser.present<long>("--time-limit-ms")) {
    options.limits.wall_time = options.limits.cpu_time = val.value() * 1000;
  }
  if (auto val = parser.present<long>("--memory-limit-mb")) {
    options.limits.memory = val.value() * 1024;
  }
  if (!options.list && !options.serve && options.language.empty()) {
    std::cerr << "One of --language, --list or --serve is required" << std::endl;
    std::cerr << parser;
    exit(1);
  }
  if (!ValidateConfig()) exit(1);
  if (!options.limits.Valid()) {
    spdlog::error("Limits must not be negative");
    exit(1);
  }
}

bool LockFile() {
  fs::path lock_file = InstanceLockPath();
  int fd = open(lock_file.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) return false;
  struct flock lock{};
  lock.l_type = F_WRLCK;
  lock.l_whence = SEEK_SET;
  lock.l_start = lock.l_len = 0;
  if (fcntl(fd, F_SETLK, &lock) < 0) return false;
  return true; // held until exit
}

bool ReadAll(const std::string& path, std::string& ret) {
  if (path == "-") {
    ret.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return true;
  }
  std::ifstream fin(path, std::ios::binary);
  if (!fin) return false;
  ret.assign(std::istreambuf_iterator<char>(fin), std::istreambuf_iterator<char>());
  return true;
}

void ListLanguages(const LanguageRegistry& registry) {
  for (auto& id : registry.Identifiers()) {
    const LanguageProfile* profile = registry.Resolve(id);
    std::cout << id << '\t' << profile->stages.size() << (profile->stages.size() == 1 ? " stage" : " stages")
              << '\t' << (IsAvailable(*profile) ? "available" : "not installed") << '\n';
  }
}

int RunSnippet() {
  std::string source, input;
  if (!ReadAll(options.source_file, source)) {
    spdlog::error("Cannot read source file {}", options.source_file);
    return 1;
  }
  ExecutionRequest req(options.language, std::move(source), std::nullopt, options.caller);
  if (options.input_file.size()) {
    if (!ReadAll(options.input_file, input)) {
      spdlog::error("Cannot read input file {}", options.input_file);
      return 1;
    }
    req.input = std::move(input);
  }
  req.limits = options.limits;
  ExecutionResult res = SubmitExecution(std::move(req)).Get();
  std::cout << ResultToJson(res).dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  // stdout carries results
  spdlog::set_default_logger(spdlog::stderr_color_mt("polyrun"));
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  ParseArgs(argc, argv);

  LanguageRegistry registry;
  if (!LoadRegistry(registry)) {
    spdlog::error("Failed to load language definitions");
    return 1;
  }
  if (options.list) {
    ListLanguages(registry);
    return 0;
  }
  if (geteuid() != 0) {
    spdlog::error("Must be run as root.");
    return 1;
  }
  if (to_lock && !LockFile()) {
    spdlog::error("Another polyrun instance is running.");
    return 1;
  }
  if (!InitBroker(std::move(registry))) return 1;
  int ret = 0;
  if (options.serve) {
    ServeLoop(*GetBroker(), std::cin, std::cout);
  } else {
    ret = RunSnippet();
  }
  ShutdownBroker();
  return ret;
}
