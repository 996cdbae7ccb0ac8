#include <polyrun/config.h>

#include <sys/sysinfo.h>
#include <fstream>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <polyrun/paths.h>
#include <polyrun/runner.h>
#include "cpuset.h"

std::string kLanguagesFile;

namespace {

// per-language sections are looked up when the registry is built
tortellini::ini config_ini;

// limits are written in ms / MiB
Limits ReadLimits(tortellini::ini& ini, const std::string& section, const std::string& prefix,
                  const Limits& fallback) {
  auto Get = [&](const std::string& key, long val) -> long {
    return ini[section][prefix + key] | val;
  };
  Limits ret;
  ret.wall_time = Get("wall_time_ms", fallback.wall_time / 1000) * 1000;
  ret.cpu_time = Get("cpu_time_ms", fallback.cpu_time / 1000) * 1000;
  ret.memory = Get("memory_mb", fallback.memory / 1024) * 1024;
  ret.proc_num = Get("proc_num", fallback.proc_num);
  ret.fsize = Get("file_size_mb", fallback.fsize / 1024) * 1024;
  return ret;
}

} // namespace

bool SetPinnedCpus(const std::string& cpus) {
  cpu_set_t set;
  if (!CpusetParse(cpus.c_str(), &set, get_nprocs())) {
    spdlog::error("Invalid CPU list {}", cpus);
    return false;
  }
  kPinnedCpus = set;
  return true;
}

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  return ParseConfig(fin);
}

bool ParseConfig(std::istream& in) {
  tortellini::ini ini;
  in >> ini;
  std::string box_root = ini[""]["box_root"] | "";
  if (box_root.size()) kBoxRoot = box_root;
  kMaxParallel = ini[""]["parallel"] | kMaxParallel;
  kMaxPerCaller = ini[""]["max_per_caller"] | kMaxPerCaller;
  kMaxOutput = ini[""]["max_output_bytes"] | kMaxOutput;
  kWorkAreaSize = (ini[""]["work_area_mb"] | (kWorkAreaSize / 1024)) * 1024;
  std::string pinned_cpus = ini[""]["pinned_cpus"] | "";
  if (pinned_cpus.size() && !SetPinnedCpus(pinned_cpus)) return false;
  kLanguagesFile = ini[""]["languages_file"] | kLanguagesFile;
  kDefaultLimits = ReadLimits(ini, "", "default_", kDefaultLimits);
  kMaxLimits = ReadLimits(ini, "", "max_", kMaxLimits);
  if (!ValidateConfig()) return false;
  config_ini = std::move(ini);
  return true;
}

bool ValidateConfig() {
  if (kMaxParallel < 1 || kMaxParallel > SandboxRunner::kUidPoolSize) {
    spdlog::error("parallel must be between 1 and {}", SandboxRunner::kUidPoolSize);
    return false;
  }
  if (kMaxPerCaller < 1 || kMaxOutput < 1 || kWorkAreaSize < 1024) {
    spdlog::error("max_per_caller, max_output_bytes and work_area_mb must be positive");
    return false;
  }
  if (!kDefaultLimits.Valid() || !kMaxLimits.Valid()) {
    spdlog::error("Limits must not be negative");
    return false;
  }
  return true;
}

bool LoadRegistry(LanguageRegistry& registry) {
  registry = LanguageRegistry::Builtin();
  registry.SetMaxLimits(kMaxLimits);
  if (kLanguagesFile.size() && !registry.LoadFile(kLanguagesFile)) return false;
  for (auto& id : registry.Identifiers()) {
    Limits lim = ReadLimits(config_ini, id, "", Limits());
    lim.fsize = 0;
    if (!lim.wall_time && !lim.cpu_time && !lim.memory && !lim.proc_num) continue;
    if (!registry.SetDefaultLimits(id, lim)) {
      spdlog::error("Invalid limits for language {}", id);
      return false;
    }
    spdlog::info("Limits of {} overridden: wall={} cpu={} memory={} proc={}",
                 id, lim.wall_time, lim.cpu_time, lim.memory, lim.proc_num);
  }
  return true;
}
