#include "chunker/cli/cli.hpp"
#include <cctype>
#include <iomanip>
#include <set>
#include <boost/log/trivial.hpp>

namespace chunker {
namespace cli {

namespace {

const std::set<std::string> COMMANDS = {"chunk", "rebuild", "verify", "stats"};
const std::set<std::string> CHUNK_ONLY_FLAGS = {"--chunk", "--level", "--min-gain"};

uint64_t parse_unsigned(const std::string& flag, const std::string& value) {
  if (value.empty() || !std::isdigit(static_cast<unsigned char>(value[0]))) {
    throw UsageError("Invalid value for " + flag + ": " + value);
  }
  size_t consumed = 0;
  unsigned long long parsed = 0;
  try {
    parsed = std::stoull(value, &consumed);
  } catch (const std::logic_error&) {
    throw UsageError("Invalid value for " + flag + ": " + value);
  }
  if (consumed != value.size()) {
    throw UsageError("Invalid value for " + flag + ": " + value);
  }
  return parsed;
}

int parse_int(const std::string& flag, const std::string& value) {
  size_t consumed = 0;
  int parsed = 0;
  try {
    parsed = std::stoi(value, &consumed);
  } catch (const std::logic_error&) {
    throw UsageError("Invalid value for " + flag + ": " + value);
  }
  if (consumed != value.size()) {
    throw UsageError("Invalid value for " + flag + ": " + value);
  }
  return parsed;
}

double parse_double(const std::string& flag, const std::string& value) {
  size_t consumed = 0;
  double parsed = 0.0;
  try {
    parsed = std::stod(value, &consumed);
  } catch (const std::logic_error&) {
    throw UsageError("Invalid value for " + flag + ": " + value);
  }
  if (consumed != value.size()) {
    throw UsageError("Invalid value for " + flag + ": " + value);
  }
  return parsed;
}

void apply_option(CommandLine& command_line, const std::string& flag, const std::string& value) {
  if (flag == "--out") {
    command_line.out = value;
  } else if (flag == "--chunk") {
    uint64_t chunk_size = parse_unsigned(flag, value);
    if (chunk_size == 0) {
      throw UsageError("--chunk must be positive");
    }
    command_line.chunk_options.chunk_size = chunk_size;
  } else if (flag == "--level") {
    int level = parse_int(flag, value);
    if (level < 0 || level > 9) {
      throw UsageError("--level must be between 0 and 9");
    }
    command_line.chunk_options.compression_level = level;
  } else if (flag == "--min-gain") {
    double ratio = parse_double(flag, value);
    if (!(ratio >= 0.0 && ratio < 1.0)) {
      throw UsageError("--min-gain must be in [0, 1)");
    }
    command_line.chunk_options.min_gain_ratio = ratio;
  } else if (flag == "--log-file") {
    command_line.log_config.log_file = value;
  } else if (flag == "--log-level") {
    try {
      command_line.log_config.min_level = logging::parse_severity(value);
    } catch (const std::invalid_argument& e) {
      throw UsageError(e.what());
    }
  } else {
    throw UsageError("Unknown argument: " + flag);
  }
}

} // namespace

//==============================================
// ARGUMENT PARSING
//==============================================

CommandLine parse_command_line(const std::vector<std::string>& args) {
  CommandLine command_line;
  std::set<std::string> flags_seen;

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    if (token == "-h" || token == "--help") {
      command_line.help = true;
      continue;
    }

    if (token.rfind("--", 0) == 0) {
      // Accept both "--flag value" and "--flag=value"
      std::string flag = token;
      std::string value;
      auto eq = token.find('=');
      if (eq != std::string::npos) {
        flag = token.substr(0, eq);
        value = token.substr(eq + 1);
      } else {
        if (i + 1 >= args.size()) {
          throw UsageError("Missing value for " + flag);
        }
        value = args[++i];
      }
      apply_option(command_line, flag, value);
      flags_seen.insert(flag);
      continue;
    }

    if (command_line.command.empty()) {
      command_line.command = token;
    } else {
      command_line.positional.push_back(token);
    }
  }

  if (command_line.help) {
    return command_line;
  }

  if (command_line.command.empty()) {
    throw UsageError("No command given");
  }
  if (COMMANDS.count(command_line.command) == 0) {
    throw UsageError("Unknown command: " + command_line.command);
  }
  if (command_line.positional.size() != 1) {
    throw UsageError("Command '" + command_line.command + "' takes exactly one path argument");
  }
  if (command_line.command != "chunk") {
    for (const auto& flag : CHUNK_ONLY_FLAGS) {
      if (flags_seen.count(flag)) {
        throw UsageError(flag + " is only valid for the chunk command");
      }
    }
  }
  if (command_line.command == "rebuild" && !command_line.out) {
    throw UsageError("rebuild requires --out <file>");
  }
  if ((command_line.command == "verify" || command_line.command == "stats") && command_line.out) {
    throw UsageError("--out is not valid for the " + command_line.command + " command");
  }

  if (command_line.command == "chunk" && command_line.out) {
    command_line.chunk_options.out_dir = std::filesystem::path(*command_line.out);
  }
  return command_line;
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(std::ostream& out, std::ostream& err)
  : out_(out)
  , err_(err)
  , program_name_("chunker") {
}

//==============================================
// STARTUP
//==============================================

int CLI::run(int argc, char* argv[]) {
  if (argc > 0 && argv && argv[0]) {
    program_name_ = std::filesystem::path(argv[0]).filename().string();
  }
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  return run(args);
}

int CLI::run(const std::vector<std::string>& args) {
  CommandLine command_line;
  try {
    command_line = parse_command_line(args);
  } catch (const UsageError& e) {
    err_ << "ERROR: " << e.what() << '\n';
    print_usage(err_);
    return EXIT_ERROR;
  }

  if (command_line.help) {
    print_usage(out_);
    return EXIT_OK;
  }

  try {
    logging::init_logging(command_line.log_config);
    return process_command(command_line);
  } catch (const std::exception& e) {
    log_and_display_error("Command '" + command_line.command + "' failed", e.what());
    return EXIT_ERROR;
  }
}

void CLI::print_usage(std::ostream& stream) const {
  stream << "Usage: " << program_name_ << " [options] <command> <path>\n"
         << "Commands:\n"
         << "  chunk <file>      Split <file> into chunks and write manifest.json\n"
         << "  rebuild <folder>  Rebuild the original file from <folder> (requires --out)\n"
         << "  verify <folder>   Verify every chunk and the whole-file hash\n"
         << "  stats <folder>    Show raw/gzip chunk counts and on-disk sizes\n"
         << "Options:\n"
         << "  --out <path>          Output folder (chunk) or file (rebuild)\n"
         << "  --chunk <bytes>       Chunk size, default " << engine::DEFAULT_CHUNK_SIZE << "\n"
         << "  --level <0-9>         gzip level, default " << engine::DEFAULT_COMPRESSION_LEVEL << "\n"
         << "  --min-gain <ratio>    Minimum gain to keep gzip, default " << engine::DEFAULT_MIN_GAIN_RATIO << "\n"
         << "  --log-file <path>     Also write the log to <path>\n"
         << "  --log-level <level>   trace|debug|info|warning|error|fatal, default warning\n"
         << "  -h, --help            Display this help message\n";
}

//==============================================
// COMMAND PROCESSING
//==============================================

int CLI::process_command(const CommandLine& command_line) {
  BOOST_LOG_TRIVIAL(debug) << "CLI: Processing command: " << command_line.command
                           << " with path: " << command_line.positional.front();

  if (command_line.command == "chunk") {
    return handle_chunk_command(command_line);
  }
  if (command_line.command == "rebuild") {
    return handle_rebuild_command(command_line);
  }
  if (command_line.command == "verify") {
    return handle_verify_command(command_line);
  }
  return handle_stats_command(command_line);
}

int CLI::handle_chunk_command(const CommandLine& command_line) {
  std::filesystem::path folder = engine::chunk_file(command_line.positional.front(),
                                                    command_line.chunk_options);
  out_ << "OK: chunks in " << folder.string() << '\n';
  out_ << "OK: manifest at " << manifest::manifest_path(folder).string() << '\n';
  return EXIT_OK;
}

int CLI::handle_rebuild_command(const CommandLine& command_line) {
  engine::rebuild(command_line.positional.front(), *command_line.out);
  out_ << "OK: rebuilt at " << *command_line.out << '\n';
  return EXIT_OK;
}

int CLI::handle_verify_command(const CommandLine& command_line) {
  engine::VerifyResult result = engine::verify(command_line.positional.front());
  if (!result.ok) {
    out_ << "FAIL: " << result.reason << '\n';
    return EXIT_VERIFY_FAILED;
  }

  out_ << "OK: intact | chunks=" << result.chunks
       << " | ratio=" << std::fixed << std::setprecision(2) << result.ratio
       << std::defaultfloat << std::setprecision(6)
       << " | min_gain=" << result.min_gain_ratio << '\n';
  return EXIT_OK;
}

int CLI::handle_stats_command(const CommandLine& command_line) {
  engine::StatsResult result = engine::stats(command_line.positional.front());
  out_ << "STATS: chunks_total=" << result.chunks_total
       << " raw=" << result.chunks_raw
       << " gzip=" << result.chunks_gzip
       << " chunk_size=" << result.chunk_size
       << " size_raw=" << result.size_file_raw
       << " size_stored=" << result.size_file_stored_actual
       << " ratio=" << std::fixed << std::setprecision(2) << result.ratio
       << std::defaultfloat << std::setprecision(6);
  if (result.chunks_missing > 0) {
    out_ << " missing=" << result.chunks_missing;
  }
  out_ << '\n';
  return EXIT_OK;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  err_ << "ERROR: " << error << '\n';
}

} // namespace cli
} // namespace chunker
