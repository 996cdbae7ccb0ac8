#ifndef INCLUDE_POLYRUN_CONFIG_H_
#define INCLUDE_POLYRUN_CONFIG_H_

#include <string>
#include <istream>
#include <filesystem>

#include "language.h"

extern std::string kLanguagesFile;

// Reads the INI configuration into the k* globals; false if the file cannot be opened
bool ParseConfig(const std::filesystem::path& conf_path);
bool ParseConfig(std::istream& in);
// Range checks of the k* globals; called by ParseConfig and again after command-line overrides
bool ValidateConfig();

// Built-in profiles + languages_file + per-language sections of the last parsed config
bool LoadRegistry(LanguageRegistry& registry);

bool SetPinnedCpus(const std::string& cpus);

#endif  // INCLUDE_POLYRUN_CONFIG_H_
