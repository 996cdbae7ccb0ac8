#include <polyrun/language.h>

#include <unistd.h>
#include <sys/stat.h>
#include <cstdlib>
#include <fstream>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <polyrun/utils.h>

namespace {

constexpr long kSec = 1'000'000; // us
constexpr long kMiB = 1024; // KiB

const Limits kCompileLimits(20 * kSec, 20 * kSec, 512 * kMiB, 32, 64 * kMiB);
const Limits kHeavyCompileLimits(30 * kSec, 30 * kSec, 1024 * kMiB, 64, 128 * kMiB);
const Limits kInterpretLimits(5 * kSec, 5 * kSec, 128 * kMiB, 16);
const Limits kNativeLimits(5 * kSec, 5 * kSec, 64 * kMiB, 8);
const Limits kVmLimits(10 * kSec, 10 * kSec, 512 * kMiB, 64);

LanguageStage Stage(std::string name, std::string exe, std::vector<std::string> args,
                    std::vector<std::string> envs = {}) {
  LanguageStage ret(std::move(name), std::move(exe), std::move(args));
  ret.envs = std::move(envs);
  return ret;
}

LanguageStage Compile(std::string exe, std::vector<std::string> args,
                      std::vector<std::string> envs = {}, const Limits& lim = kCompileLimits) {
  LanguageStage ret = Stage("compile", std::move(exe), std::move(args), std::move(envs));
  ret.limits = lim;
  return ret;
}

LanguageProfile Profile(std::string id, std::string extension, std::vector<LanguageStage> stages,
                        const Limits& lim) {
  LanguageProfile ret;
  ret.id = std::move(id);
  ret.extension = std::move(extension);
  ret.stages = std::move(stages);
  ret.limits = lim;
  return ret;
}

LanguageProfile Interpreted(std::string id, std::string extension, std::string exe,
                            std::vector<std::string> args = {"{source}"},
                            const Limits& lim = kInterpretLimits) {
  return Profile(std::move(id), std::move(extension),
                 {Stage("run", std::move(exe), std::move(args))}, lim);
}

// compile stage followed by ./{program}
LanguageProfile Native(std::string id, std::string extension, LanguageStage compile,
                       const Limits& lim = kNativeLimits) {
  return Profile(std::move(id), std::move(extension),
                 {std::move(compile), Stage("run", "./{program}", {})}, lim);
}

std::vector<LanguageProfile> BuiltinProfiles() {
  std::vector<LanguageProfile> ret = {
    // scripting
    Interpreted("python3", ".py", "python3"),
    Interpreted("python2", ".py", "python2"),
    Interpreted("pypy3", ".py", "pypy3", {"{source}"}, Limits(5 * kSec, 5 * kSec, 256 * kMiB, 16)),
    Interpreted("ruby", ".rb", "ruby"),
    Interpreted("perl", ".pl", "perl"),
    Interpreted("php", ".php", "php"),
    Interpreted("lua", ".lua", "lua"),
    Interpreted("javascript", ".js", "node", {"{source}"}, Limits(5 * kSec, 5 * kSec, 256 * kMiB, 32)),
    Interpreted("typescript", ".ts", "ts-node", {"{source}"}, Limits(10 * kSec, 10 * kSec, 512 * kMiB, 32)),
    Interpreted("bash", ".sh", "bash", {"{source}"}, Limits(5 * kSec, 5 * kSec, 64 * kMiB, 32)),
    Interpreted("sh", ".sh", "sh", {"{source}"}, Limits(5 * kSec, 5 * kSec, 64 * kMiB, 32)),
    Interpreted("awk", ".awk", "awk", {"-f", "{source}"}),
    Interpreted("tcl", ".tcl", "tclsh"),
    Interpreted("r", ".R", "Rscript", {"--vanilla", "{source}"}, Limits(10 * kSec, 10 * kSec, 256 * kMiB, 16)),
    Interpreted("julia", ".jl", "julia", {"--startup-file=no", "{source}"}, kVmLimits),
    Interpreted("octave", ".m", "octave-cli", {"--no-init-file", "--quiet", "{source}"}, kVmLimits),
    Interpreted("powershell", ".ps1", "pwsh", {"-NoProfile", "-NonInteractive", "-File", "{source}"}, kVmLimits),
    Interpreted("dart", ".dart", "dart", {"run", "{source}"}, kVmLimits),
    Interpreted("groovy", ".groovy", "groovy", {"{source}"}, kVmLimits),
    Interpreted("scala", ".scala", "scala", {"{source}"}, kVmLimits),
    // functional & lisps
    Interpreted("elixir", ".exs", "elixir", {"{source}"}, kVmLimits),
    Interpreted("erlang", ".erl", "escript", {"{source}"}, kVmLimits),
    Interpreted("ocaml", ".ml", "ocaml", {"{source}"}),
    Interpreted("racket", ".rkt", "racket", {"{source}"}, Limits(10 * kSec, 10 * kSec, 256 * kMiB, 16)),
    Interpreted("scheme", ".scm", "guile", {"--no-auto-compile", "-s", "{source}"}),
    Interpreted("commonlisp", ".lisp", "sbcl", {"--script", "{source}"}, Limits(5 * kSec, 5 * kSec, 256 * kMiB, 16)),
    Interpreted("clojure", ".clj", "clojure", {"-M", "{source}"}, kVmLimits),
    Interpreted("prolog", ".pl", "swipl", {"-q", "-g", "main", "-t", "halt", "{source}"}),
    Interpreted("forth", ".fs", "gforth", {"{source}", "-e", "bye"}),
    // compiled to a native executable
    Native("c", ".c", Compile("gcc", {"-std=c17", "-O2", "-w", "-o", "{program}", "{source}", "-lm"})),
    Native("cpp", ".cpp", Compile("g++", {"-std=c++17", "-O2", "-w", "-o", "{program}", "{source}"})),
    Native("clang", ".c", Compile("clang", {"-std=c17", "-O2", "-w", "-o", "{program}", "{source}", "-lm"})),
    Native("clang++", ".cpp", Compile("clang++", {"-std=c++17", "-O2", "-w", "-o", "{program}", "{source}"})),
    Native("objc", ".m", Compile("gcc", {"-x", "objective-c", "-O2", "-w", "-o", "{program}", "{source}", "-lobjc"})),
    Native("d", ".d", Compile("gdc", {"-O2", "-o", "{program}", "{source}"})),
    Native("fortran", ".f90", Compile("gfortran", {"-O2", "-o", "{program}", "{source}"})),
    Native("pascal", ".pas", Compile("fpc", {"-O2", "-v0", "-o{program}", "{source}"})),
    Native("cobol", ".cob", Compile("cobc", {"-x", "-free", "-o", "{program}", "{source}"})),
    Native("haskell", ".hs", Compile("ghc", {"-O", "-v0", "-o", "{program}", "{source}"}, {},
                                     kHeavyCompileLimits)),
    Native("rust", ".rs", Compile("rustc", {"-O", "-o", "{program}", "{source}"}, {}, kHeavyCompileLimits)),
    Native("go", ".go", Compile("go", {"build", "-o", "{program}", "{source}"},
                                {"GOCACHE={workdir}/.cache", "GOPATH={workdir}/.go", "CGO_ENABLED=0"},
                                kHeavyCompileLimits),
           Limits(5 * kSec, 5 * kSec, 128 * kMiB, 32)),
    Native("swift", ".swift", Compile("swiftc", {"-O", "-o", "{program}", "{source}"}, {},
                                      kHeavyCompileLimits)),
    Native("nim", ".nim", Compile("nim", {"compile", "--hints:off", "-d:release", "--nimcache:{workdir}/.nimcache",
                                          "-o:{program}", "{source}"}, {}, kHeavyCompileLimits)),
    Native("zig", ".zig", Compile("zig", {"build-exe", "-O", "ReleaseSafe", "-femit-bin={program}", "{source}"},
                                  {"ZIG_GLOBAL_CACHE_DIR={workdir}/.zig"}, kHeavyCompileLimits)),
    Native("crystal", ".cr", Compile("crystal", {"build", "--no-color", "-o", "{program}", "{source}"},
                                     {"CRYSTAL_CACHE_DIR={workdir}/.crystal"}, kHeavyCompileLimits)),
  };

  // assemble, link, run
  ret.push_back(Profile("nasm", ".asm", {
    Stage("assemble", "nasm", {"-f", "elf64", "-o", "{program}.o", "{source}"}),
    Stage("link", "ld", {"-o", "{program}", "{program}.o"}),
    Stage("run", "./{program}", {}),
  }, kNativeLimits));
  ret.back().stages[0].limits = ret.back().stages[1].limits = kCompileLimits;

  // the compiled JavaScript is printed and handed over to node
  {
    LanguageStage compile = Compile("coffee", {"--print", "{source}"});
    compile.feeds_next = true;
    compile.feed_file = "prog.js";
    ret.push_back(Profile("coffeescript", ".coffee", {
      std::move(compile),
      Stage("run", "node", {"{feed}"}),
    }, Limits(5 * kSec, 5 * kSec, 256 * kMiB, 32)));
  }

  // bytecode VMs
  ret.push_back(Profile("java", ".java", {
    Compile("javac", {"-J-Xms16m", "-J-Xmx512m", "-encoding", "UTF-8", "{source}"}, {}, kHeavyCompileLimits),
    Stage("run", "java", {"-Xss64m", "-XX:+UseSerialGC", "-cp", "{workdir}", "{program}"}),
  }, kVmLimits));
  ret.back().source_name = "Main";
  ret.push_back(Profile("kotlin", ".kt", {
    Compile("kotlinc", {"{source}", "-include-runtime", "-d", "{program}.jar"}, {"JAVA_OPTS=-Xmx512m"},
            Limits(60 * kSec, 60 * kSec, 1024 * kMiB, 64, 128 * kMiB)),
    Stage("run", "java", {"-Xss64m", "-XX:+UseSerialGC", "-jar", "{program}.jar"}),
  }, kVmLimits));
  ret.push_back(Profile("csharp", ".cs", {
    Compile("mcs", {"-optimize+", "-out:{program}.exe", "{source}"}, {}, kHeavyCompileLimits),
    Stage("run", "mono", {"{program}.exe"}),
  }, kVmLimits));
  ret.push_back(Profile("fsharp", ".fsx", {
    Stage("run", "dotnet", {"fsi", "--quiet", "{source}"}, {"DOTNET_CLI_HOME={workdir}",
                                                           "DOTNET_CLI_TELEMETRY_OPTOUT=1"}),
  }, Limits(15 * kSec, 15 * kSec, 512 * kMiB, 64)));
  ret.push_back(Profile("brainfuck", ".bf", {Stage("run", "beef", {"{source}"})}, kNativeLimits));
  return ret;
}

const std::vector<std::pair<std::string, std::string>> kBuiltinAliases = {
  {"py", "python3"}, {"python", "python3"}, {"py3", "python3"}, {"py2", "python2"}, {"pypy", "pypy3"},
  {"rb", "ruby"}, {"pl", "perl"}, {"js", "javascript"}, {"node", "javascript"},
  {"ts", "typescript"}, {"shell", "bash"}, {"R", "r"}, {"jl", "julia"}, {"matlab", "octave"},
  {"ps1", "powershell"}, {"pwsh", "powershell"}, {"ex", "elixir"}, {"exs", "elixir"},
  {"erl", "erlang"}, {"ml", "ocaml"}, {"rkt", "racket"}, {"scm", "scheme"}, {"guile", "scheme"},
  {"lisp", "commonlisp"}, {"sbcl", "commonlisp"}, {"clj", "clojure"}, {"swipl", "prolog"},
  {"c++", "cpp"}, {"cxx", "cpp"}, {"cc", "cpp"}, {"gcc", "c"}, {"g++", "cpp"},
  {"objective-c", "objc"}, {"f90", "fortran"}, {"pas", "pascal"}, {"cob", "cobol"},
  {"hs", "haskell"}, {"rs", "rust"}, {"golang", "go"}, {"asm", "nasm"},
  {"coffee", "coffeescript"}, {"kt", "kotlin"}, {"cs", "csharp"}, {"c#", "csharp"},
  {"f#", "fsharp"}, {"fs", "fsharp"}, {"bf", "brainfuck"},
};

bool ValidTemplate(const std::string& tmpl, const LanguageProfile& profile, const std::string& where) {
  try {
    ExpandTemplate(tmpl, profile, "feed");
  } catch (const fmt::format_error& err) {
    spdlog::warn("Language {}: invalid template \"{}\" in {}: {}", profile.id, tmpl, where, err.what());
    return false;
  }
  return true;
}

inline bool PlainFileName(const std::string& name) {
  return !name.empty() && name != "." && name != ".." && name.find('/') == std::string::npos;
}

bool ValidProfile(const LanguageProfile& profile) {
  if (profile.id.empty()) {
    spdlog::warn("Language without an identifier");
    return false;
  }
  if (profile.stages.empty()) {
    spdlog::warn("Language {}: no stages", profile.id);
    return false;
  }
  if (!PlainFileName(profile.SourceFile()) || profile.source_name.empty()) {
    spdlog::warn("Language {}: invalid source file name {}", profile.id, profile.SourceFile());
    return false;
  }
  if (!profile.limits.Valid()) {
    spdlog::warn("Language {}: negative limits", profile.id);
    return false;
  }
  for (size_t i = 0; i < profile.stages.size(); i++) {
    auto& stage = profile.stages[i];
    if (stage.name.empty() || stage.executable.empty()) {
      spdlog::warn("Language {}: stage {} has no name or executable", profile.id, i);
      return false;
    }
    if (!stage.limits.Valid()) {
      spdlog::warn("Language {}: negative limits in stage {}", profile.id, stage.name);
      return false;
    }
    if (stage.feeds_next && (i + 1 == profile.stages.size() || !PlainFileName(stage.feed_file) ||
                             stage.feed_file == profile.SourceFile())) {
      spdlog::warn("Language {}: stage {} cannot feed the next stage", profile.id, stage.name);
      return false;
    }
    if (!ValidTemplate(stage.executable, profile, stage.name)) return false;
    for (auto& arg : stage.args) {
      if (!ValidTemplate(arg, profile, stage.name)) return false;
    }
    for (auto& env : stage.envs) {
      if (env.find('=') == std::string::npos) {
        spdlog::warn("Language {}: malformed env entry {} in {}", profile.id, env, stage.name);
        return false;
      }
      if (!ValidTemplate(env, profile, stage.name)) return false;
    }
  }
  return true;
}

std::vector<std::string> StringList(const nlohmann::json& obj, const char* key) {
  if (!obj.contains(key)) return {};
  return obj[key].get<std::vector<std::string>>();
}

LanguageProfile ProfileFromJson(const nlohmann::json& obj) {
  LanguageProfile ret;
  ret.id = obj.at("id").get<std::string>();
  ret.extension = obj.value("extension", std::string());
  ret.source_name = obj.value("source_name", ret.source_name);
  if (obj.contains("limits")) ret.limits = LimitsFromJson(obj["limits"]);
  ret.dirs = StringList(obj, "dirs");
  for (auto& item : obj.at("stages")) {
    LanguageStage stage;
    stage.name = item.value("name", std::string("run"));
    stage.executable = item.at("executable").get<std::string>();
    stage.args = StringList(item, "args");
    stage.envs = StringList(item, "env");
    if (item.contains("limits")) stage.limits = LimitsFromJson(item["limits"]);
    stage.feeds_next = item.value("feeds_next", false);
    stage.feed_file = item.value("feed_file", std::string());
    ret.stages.push_back(std::move(stage));
  }
  return ret;
}

} // namespace

std::string ExpandTemplate(const std::string& tmpl, const LanguageProfile& profile, const std::string& feed) {
  return fmt::format(fmt::runtime(tmpl),
                     fmt::arg("source", profile.SourceFile()),
                     fmt::arg("program", profile.source_name),
                     fmt::arg("workdir", "/workdir"),
                     fmt::arg("feed", feed));
}

LanguageRegistry::LanguageRegistry() : max_limits_(kMaxLimits) {}

LanguageRegistry LanguageRegistry::Builtin() {
  LanguageRegistry ret;
  for (auto& profile : BuiltinProfiles()) {
    std::string id = profile.id;
    if (!ret.Add(std::move(profile))) spdlog::error("Built-in language {} rejected", id);
  }
  for (auto& [alias, id] : kBuiltinAliases) ret.AddAlias(alias, id);
  spdlog::debug("Built-in registry: {} languages, {} aliases", ret.profiles_.size(), ret.aliases_.size());
  return ret;
}

bool LanguageRegistry::Add(LanguageProfile&& profile) {
  if (!ValidProfile(profile)) return false;
  if (aliases_.count(profile.id)) {
    spdlog::warn("Language {} clashes with an alias of {}", profile.id, aliases_[profile.id]);
    return false;
  }
  std::string id = profile.id;
  profiles_[id] = std::move(profile);
  return true;
}

bool LanguageRegistry::AddAlias(const std::string& alias, const std::string& id) {
  if (!profiles_.count(id)) {
    spdlog::warn("Alias {} refers to unknown language {}", alias, id);
    return false;
  }
  if (profiles_.count(alias)) {
    spdlog::warn("Alias {} clashes with a language identifier", alias);
    return false;
  }
  auto it = aliases_.find(alias);
  if (it != aliases_.end() && it->second != id) {
    spdlog::warn("Duplicate alias {} ({} and {})", alias, it->second, id);
    return false;
  }
  aliases_[alias] = id;
  return true;
}

bool LanguageRegistry::LoadJson(const nlohmann::json& doc) {
  LanguageRegistry tmp = *this;
  try {
    const auto& list = doc.at("languages");
    if (!list.is_array()) {
      spdlog::warn("\"languages\" is not an array");
      return false;
    }
    for (auto& obj : list) {
      LanguageProfile profile = ProfileFromJson(obj);
      std::string id = profile.id;
      if (!tmp.Add(std::move(profile))) return false;
      for (auto& alias : StringList(obj, "aliases")) {
        if (!tmp.AddAlias(alias, id)) return false;
      }
    }
  } catch (const nlohmann::json::exception& err) {
    spdlog::warn("Malformed language definitions: {}", err.what());
    return false;
  }
  *this = std::move(tmp);
  return true;
}

bool LanguageRegistry::LoadFile(const std::string& path) {
  std::ifstream fin(path);
  if (!fin) {
    spdlog::warn("Cannot open language definitions {}", path);
    return false;
  }
  nlohmann::json doc = nlohmann::json::parse(fin, nullptr, false);
  if (doc.is_discarded()) {
    spdlog::warn("Language definitions {} is not valid JSON", path);
    return false;
  }
  if (!LoadJson(doc)) return false;
  spdlog::info("Loaded language definitions from {}", path);
  return true;
}

bool LanguageRegistry::SetDefaultLimits(const std::string& id, const Limits& limits) {
  auto it = profiles_.find(id);
  if (it == profiles_.end() || !limits.Valid()) return false;
  Limits& lim = it->second.limits;
  lim = Limits(limits).Fill(lim);
  return true;
}

const LanguageProfile* LanguageRegistry::Resolve(const std::string& identifier) const {
  if (auto it = profiles_.find(identifier); it != profiles_.end()) return &it->second;
  if (auto it = aliases_.find(identifier); it != aliases_.end()) {
    if (auto pt = profiles_.find(it->second); pt != profiles_.end()) return &pt->second;
  }
  return nullptr;
}

std::vector<std::string> LanguageRegistry::Identifiers() const {
  std::vector<std::string> ret;
  for (auto& i : profiles_) ret.push_back(i.first);
  return ret;
}

Limits LanguageRegistry::EffectiveLimits(const LanguageProfile& profile, const Limits& requested) const {
  Limits ret = requested;
  ret.Fill(profile.limits).Fill(kDefaultLimits).Clamp(max_limits_);
  return ret;
}

Limits LanguageRegistry::StageLimits(const LanguageStage& stage, const Limits& effective) const {
  Limits ret = stage.limits;
  ret.Fill(effective).Clamp(max_limits_);
  return ret;
}

std::string FindExecutable(const std::string& name) {
  auto Executable = [](const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
  };
  if (name.empty()) return "";
  if (name.find('/') != std::string::npos) return Executable(name) ? name : "";
  const char* path_env = getenv("PATH");
  std::string path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
  for (size_t pos = 0; pos <= path.size();) {
    size_t nxt = path.find(':', pos);
    if (nxt == std::string::npos) nxt = path.size();
    std::string dir = path.substr(pos, nxt - pos);
    if (!dir.empty()) {
      std::string candidate = dir + "/" + name;
      if (Executable(candidate)) return candidate;
    }
    pos = nxt + 1;
  }
  return "";
}

const LanguageStage* MissingToolchain(const LanguageProfile& profile) {
  for (auto& stage : profile.stages) {
    auto& exe = stage.executable;
    // produced by an earlier stage
    if (exe.compare(0, 2, "./") == 0 || exe.find('{') != std::string::npos) continue;
    if (FindExecutable(exe).empty()) {
      spdlog::debug("Language {}: {} not found", profile.id, exe);
      return &stage;
    }
  }
  return nullptr;
}
