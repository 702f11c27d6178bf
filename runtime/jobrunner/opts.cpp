#include "opts.hpp"

#include <cxxopts.hpp>
#include <spdlog/spdlog.h>

namespace cumulus::runtime::jobrunner {

  Options opts(int argc, char** argv)
  {
    cxxopts::Options options("cumulus-jobrunner", "Executes a single function invocation.");
    options.add_options()("config", "Startup payload written by the supervisor.", cxxopts::value<std::string>())(
        "result-fd", "Descriptor of the completion pipe.", cxxopts::value<int>()
    )("v,verbose", "Verbose output", cxxopts::value<bool>()->default_value("false"));
    auto parsed_options = options.parse(argc, argv);

    if (!parsed_options.count("config") || !parsed_options.count("result-fd")) {
      spdlog::error("Task runner requires --config and --result-fd!");
      exit(1);
    }

    Options result;
    result.config = parsed_options["config"].as<std::string>();
    result.result_fd = parsed_options["result-fd"].as<int>();
    result.verbose = parsed_options["verbose"].as<bool>();

    return result;
  }

} // namespace cumulus::runtime::jobrunner
