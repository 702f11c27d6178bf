#include <cumulus/runtime/handler/amqp.hpp>
#include <cumulus/runtime/handler/config.hpp>
#include <cumulus/runtime/handler/supervisor.hpp>
#include <cumulus/runtime/job.hpp>

#include <fstream>
#include <iostream>

#include <cxxopts.hpp>
#include <spdlog/spdlog.h>

int main(int argc, char** argv)
{
  cxxopts::Options options("cumulus-handler", "Executes a single cumulus job event.");
  options.add_options()(
      "e,event", "Job event JSON; read from stdin when not given.",
      cxxopts::value<std::string>()->default_value("")
  )("c,config", "JSON config.", cxxopts::value<std::string>()->default_value(""))(
      "v,verbose", "Verbose output", cxxopts::value<bool>()->default_value("false")
  );
  auto parsed_options = options.parse(argc, argv);

  std::string config_file{parsed_options["config"].as<std::string>()};
  std::string event_file{parsed_options["event"].as<std::string>()};

  cumulus::runtime::config::Handler config;
  if (config_file.length() > 0) {
    std::ifstream in_stream{config_file};
    if (!in_stream.is_open()) {
      spdlog::error("Could not open config file {}", config_file);
      return 1;
    }
    try {
      config = cumulus::runtime::config::Handler::deserialize(in_stream);
    } catch (std::exception& exc) {
      spdlog::error("Could not parse config file {}, reason: {}", config_file, exc.what());
      return 1;
    }
  } else {
    config.set_defaults();
  }
  config.load_env();
  if (parsed_options["verbose"].as<bool>()) {
    config.verbose = true;
  }

  if (config.verbose)
    spdlog::set_level(spdlog::level::debug);
  else
    spdlog::set_level(spdlog::level::info);
  spdlog::set_pattern("[%H:%M:%S:%f] [P %P] [T %t] [%l] %v ");
  spdlog::info("Executing cumulus handler!");

  cumulus::runtime::JobEvent event;
  try {
    if (event_file.length() > 0) {
      std::ifstream in_stream{event_file};
      if (!in_stream.is_open()) {
        spdlog::error("Could not open event file {}", event_file);
        return 1;
      }
      event = cumulus::runtime::JobEvent::deserialize(in_stream);
    } else {
      event = cumulus::runtime::JobEvent::deserialize(std::cin);
    }
  } catch (std::exception& exc) {
    spdlog::error("Could not parse the job event, reason: {}", exc.what());
    return 1;
  }

  std::unique_ptr<cumulus::runtime::QueueConnector> connector;
#if defined(WITH_AMQP_MONITOR)
  connector = std::make_unique<cumulus::runtime::AMQPConnector>();
#endif

  cumulus::runtime::Supervisor supervisor{config, std::move(connector)};
  try {
    supervisor.function_handler(event);
  } catch (std::exception& exc) {
    spdlog::error("Could not store the status of {}, reason: {}", event.invocation_key(), exc.what());
    return 1;
  }

  spdlog::info("Cumulus handler is closing down");
  return 0;
}
