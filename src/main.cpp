#include <cpptrace/cpptrace.hpp>
#include <filesystem>
#include <string>
#include <vector>

#include "woxxy_engine.hpp"
#include "command_line_parser.hpp"
#include "settings_manager.hpp"
#include "log.hpp"

int main(int argc, char** argv){
  try {
    auto settings = std::make_shared<SettingsManager>();
    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "woxxy");

    std::vector<std::string> args;
    for(int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    // First pass only finds --config; argv is applied again on top of the file.
    SettingsManager probe;
    std::string error;
    if(!parser.try_parse(args, probe, error)) {
      parser.usage();
      print_err("{}", error);
      return 1;
    }
    if(probe.help_requested()) {
      parser.usage();
      return 0;
    }
    auto config = probe.get<std::string>("config");
    if(!config.empty()) settings->set_settings_path(config);
    if(!settings->load() && !config.empty()) {
      print_err("Unable to read settings from {}", config);
      return 1;
    }
    parser.parse(argc, argv, *settings);

    WoxxyEngine::Options options;
    options.start_cli_thread = true;

    WoxxyEngine engine(settings, options);
    auto logger = engine.logger();
    if(settings->get<bool>("verbose")) {
      logger->debug("Verbose logging enabled");
    }

    engine.start();
    engine.run();
    engine.stop();

    return 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("woxxy-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
