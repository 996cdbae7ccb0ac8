#ifndef INCLUDE_POLYRUN_LANGUAGE_H_
#define INCLUDE_POLYRUN_LANGUAGE_H_

#include <map>
#include <string>
#include <vector>
#include <unordered_map>

#include <nlohmann/json_fwd.hpp>
#include "execution.h"

// Argument templates and env entries may contain these placeholders:
//   {source}  source file name, e.g. prog.c
//   {program} base name of the source, e.g. prog
//   {workdir} the work area as seen inside the sandbox
//   {feed}    feed_file of the previous stage
struct LanguageStage {
  std::string name;
  // template; looked up in PATH unless it contains a '/'
  // relative paths (./{program}) are products of earlier stages
  std::string executable;
  std::vector<std::string> args;
  std::vector<std::string> envs;
  Limits limits; // fixed limits of this stage; not affected by request overrides
  bool feeds_next; // stdout is written to feed_file for the next stage
  std::string feed_file;

  LanguageStage() : feeds_next(false) {}
  LanguageStage(std::string name, std::string executable, std::vector<std::string> args) :
      name(std::move(name)), executable(std::move(executable)), args(std::move(args)),
      feeds_next(false) {}
};

struct LanguageProfile {
  std::string id;
  std::vector<LanguageStage> stages; // non-empty; only the last one receives stdin
  std::string extension; // including the dot
  std::string source_name;
  Limits limits; // defaults of the final stage
  std::vector<std::string> dirs; // extra read-only paths exposed in the sandbox

  LanguageProfile() : source_name("prog") {}

  std::string SourceFile() const { return source_name + extension; }
  bool IsCompiled() const { return stages.size() > 1; }
};

class LanguageRegistry {
  std::map<std::string, LanguageProfile> profiles_;
  std::unordered_map<std::string, std::string> aliases_;
  Limits max_limits_;
 public:
  LanguageRegistry();
  // the built-in definition set with its alias table
  static LanguageRegistry Builtin();

  // add or replace profiles from {"languages": [...]}; the registry is unchanged on failure
  bool LoadJson(const nlohmann::json&);
  bool LoadFile(const std::string& path);
  bool Add(LanguageProfile&&);
  bool AddAlias(const std::string& alias, const std::string& id);
  // only fields set in limits are replaced
  bool SetDefaultLimits(const std::string& id, const Limits& limits);
  void SetMaxLimits(const Limits& limits) { max_limits_ = limits; }
  const Limits& MaxLimits() const { return max_limits_; }

  // exact match first, then aliases; nullptr if not found
  const LanguageProfile* Resolve(const std::string& identifier) const;
  std::vector<std::string> Identifiers() const;
  size_t Size() const { return profiles_.size(); }

  // requested -> profile -> kDefaultLimits, then clamped to the maxima
  Limits EffectiveLimits(const LanguageProfile&, const Limits& requested) const;
  // stage limits on top of the effective limits of a request
  Limits StageLimits(const LanguageStage&, const Limits& effective) const;
};

// Expands the placeholders of an argument template or env entry;
// throws fmt::format_error on unknown placeholders (literal braces are written {{ }})
std::string ExpandTemplate(const std::string& tmpl, const LanguageProfile& profile,
                           const std::string& feed = "");

// First stage whose executable cannot be found on the toolchain PATH; nullptr if none
const LanguageStage* MissingToolchain(const LanguageProfile&);
inline bool IsAvailable(const LanguageProfile& profile) { return !MissingToolchain(profile); }
// Empty if not found
std::string FindExecutable(const std::string& name);

#endif  // INCLUDE_POLYRUN_LANGUAGE_H_
