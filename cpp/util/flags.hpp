#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include <cstdint>
#include <string>

struct Flags {
  // Common flags
  static std::string log_file;
  static std::string store_directory;
  static std::string temp_directory;
  static bool keep_sandboxes;

  // Engine flags
  static std::string catalog_file;
  static std::string languages_file;
  static int32_t autosave_interval_millis;
  static int32_t sweep_interval_millis;

  // Executor flags
  static int32_t num_cores;
};

#endif
