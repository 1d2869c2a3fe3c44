#ifndef CHUNKER_CLI_HPP
#define CHUNKER_CLI_HPP

#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "chunker/engine/chunk_engine.hpp"
#include "chunker/logger/logger.hpp"

namespace chunker {
namespace cli {

static constexpr int EXIT_OK = 0;
static constexpr int EXIT_ERROR = 1;
static constexpr int EXIT_VERIFY_FAILED = 2;

class UsageError : public std::invalid_argument {
public:
  explicit UsageError(const std::string& message) : std::invalid_argument(message) {}
};

struct CommandLine {
  std::string command;
  std::vector<std::string> positional;
  engine::ChunkOptions chunk_options;
  // Output folder for chunk, output file for rebuild
  std::optional<std::string> out;
  logging::LogConfig log_config;
  bool help = false;
};

// Parses arguments after the program name; throws UsageError
CommandLine parse_command_line(const std::vector<std::string>& args);

class CLI {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  CLI(std::ostream& out, std::ostream& err);


  // ---- STARTUP ----
  // Returns the process exit code
  int run(int argc, char* argv[]);
  int run(const std::vector<std::string>& args);

  void print_usage(std::ostream& stream) const;

private:
  // ---- PARAMETERS ----
  std::ostream& out_;
  std::ostream& err_;
  std::string program_name_;


  // ---- COMMAND PROCESSING ----
  int process_command(const CommandLine& command_line);
  int handle_chunk_command(const CommandLine& command_line);
  int handle_rebuild_command(const CommandLine& command_line);
  int handle_verify_command(const CommandLine& command_line);
  int handle_stats_command(const CommandLine& command_line);
  void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace chunker

#endif // CHUNKER_CLI_HPP
