#include "commands/find.hpp"
#include "commands/read.hpp"
#include "commands/regions.hpp"
#include "commands/version.hpp"
#include "commands/windows.hpp"
#include <args.hxx>
#include <redlog.hpp>
#include <iostream>
#include <string>

#include "p33k/utils/env_config.hpp"
#include "p33k/utils/verbosity.hpp"

namespace cli {
args::Group arguments("arguments");
args::HelpFlag help_flag(arguments, "help", "help", {'h', "help"});
args::CounterFlag verbosity_flag(arguments, "verbosity", "verbosity level", {'v'});
args::ValueFlag<int> pid_flag(arguments, "pid", "target process id", {'p', "pid"});
args::ValueFlag<std::string> process_flag(
    arguments, "name", "target process name (default: hackmud_lin.x86_64)", {"process"}
);
args::ValueFlag<std::string> cache_flag(arguments, "path", "address cache file", {"cache"});
args::ValueFlag<std::string> offsets_flag(arguments, "path", "field offset table (json)", {"offsets"});
args::Flag no_cache_flag(arguments, "no-cache", "always scan; never read or write the cache", {"no-cache"});

void apply_verbosity() {
  p33k::utils::apply_verbosity(static_cast<int>(args::get(verbosity_flag)), p33k::utils::env_config("P33K"));
}

p33kx::commands::target_options target() {
  p33kx::commands::target_options options;
  if (pid_flag) {
    options.pid = args::get(pid_flag);
  }
  if (process_flag) {
    options.process_name = args::get(process_flag);
  }
  if (cache_flag) {
    options.cache_path = args::get(cache_flag);
  }
  if (offsets_flag) {
    options.offsets_path = args::get(offsets_flag);
  }
  options.no_cache = args::get(no_cache_flag);
  return options;
}
} // namespace cli

int main(int argc, char* argv[]) {
  args::ArgumentParser parser("p33kx - live memory reader for hackmud");
  parser.helpParams.showTerminator = false;
  parser.helpParams.helpindent = 2;
  parser.helpParams.width = 120;

  // global flags
  parser.Add(cli::arguments);

  // read command
  args::Command read_cmd(parser, "read", "print the text of a game window");
  args::ValueFlag<std::string> read_window_flag(read_cmd, "window", "window name (shell, chat, ...)", {'w', "window"});
  args::ValueFlag<size_t> read_lines_flag(
      read_cmd, "lines", "most recent lines to print (default: all)", {'n', "lines"}
  );
  args::Flag read_colors_flag(read_cmd, "colors", "keep <color> markup", {"colors"});

  // version command
  args::Command version_cmd(parser, "version", "guess the running game version");

  // windows command
  args::Command windows_cmd(parser, "windows", "list located window objects");
  args::Flag windows_all_flag(windows_cmd, "all", "locate every known window before listing", {'a', "all"});

  // regions command
  args::Command regions_cmd(parser, "regions", "list mapped memory regions of the target");
  args::Flag regions_all_flag(regions_cmd, "all", "include regions the heap scans skip", {'a', "all"});

  // find command
  args::Command find_cmd(parser, "find", "scan target memory for a hex signature");
  args::Positional<std::string> find_pattern_arg(find_cmd, "signature", "hex bytes, ?? for wildcards");
  args::ValueFlag<size_t> find_max_flag(find_cmd, "max", "maximum matches, 0 for no limit (default: 100)", {"max"});
  args::Flag find_all_flag(find_cmd, "all", "scan every readable region", {'a', "all"});

  try {
    parser.ParseCLI(argc, argv);
    cli::apply_verbosity();

    if (read_cmd) {
      p33kx::commands::read_request request;
      request.target = cli::target();
      request.window = read_window_flag ? args::get(read_window_flag) : std::string();
      request.lines = read_lines_flag ? args::get(read_lines_flag) : 0;
      request.colors = args::get(read_colors_flag);
      return p33kx::commands::read_command(request);
    } else if (version_cmd) {
      p33kx::commands::version_request request;
      request.target = cli::target();
      return p33kx::commands::version_command(request);
    } else if (windows_cmd) {
      p33kx::commands::windows_request request;
      request.target = cli::target();
      request.locate_all = args::get(windows_all_flag);
      return p33kx::commands::windows_command(request);
    } else if (regions_cmd) {
      p33kx::commands::regions_request request;
      request.target = cli::target();
      request.all = args::get(regions_all_flag);
      return p33kx::commands::regions_command(request);
    } else if (find_cmd) {
      p33kx::commands::find_request request;
      request.target = cli::target();
      request.pattern = find_pattern_arg ? args::get(find_pattern_arg) : std::string();
      if (find_max_flag) {
        request.max_results = args::get(find_max_flag);
      }
      request.all = args::get(find_all_flag);
      return p33kx::commands::find_command(request);
    } else {
      std::cerr << "error: no command specified" << std::endl;
      std::cerr << parser;
      return 1;
    }

  } catch (const args::Help&) {
    std::cout << parser;
    return 0;
  } catch (const args::ParseError& e) {
    std::cerr << e.what() << std::endl;
    std::cerr << parser;
    return 1;
  } catch (const args::ValidationError& e) {
    std::cerr << e.what() << std::endl;
    std::cerr << parser;
    return 1;
  }

  return 0;
}
