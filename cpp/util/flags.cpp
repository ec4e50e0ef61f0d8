#include "util/flags.hpp"

std::string Flags::log_file;
bool Flags::verbose = false;
std::string Flags::temp_directory = "/tmp/script-sandbox";

std::string Flags::output_directory = "generated_plots";
std::string Flags::worker_executable;
std::vector<std::string> Flags::allowed_modules;
std::vector<std::string> Flags::read_roots;
std::vector<std::string> Flags::bindings;
std::string Flags::language = "python";
bool Flags::expression = false;
uint32_t Flags::timeout_millis = 30000;
uint32_t Flags::startup_timeout_millis = 10000;
uint32_t Flags::max_output_bytes = 1024 * 1024;
uint32_t Flags::memory_limit_kb = 2 * 1024 * 1024;
uint32_t Flags::max_file_size_kb = 64 * 1024;
