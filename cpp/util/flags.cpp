#include "util/flags.hpp"

std::string Flags::log_file;
std::string Flags::store_directory = "sessions";
std::string Flags::temp_directory = "temp";
bool Flags::keep_sandboxes = false;

std::string Flags::catalog_file;
std::string Flags::languages_file;
int32_t Flags::autosave_interval_millis = 30000;
int32_t Flags::sweep_interval_millis = 60000;

int32_t Flags::num_cores = 0;
