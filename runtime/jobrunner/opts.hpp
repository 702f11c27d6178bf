#ifndef CUMULUS_RUNTIME_JOBRUNNER_OPTS_HPP
#define CUMULUS_RUNTIME_JOBRUNNER_OPTS_HPP

#include <string>

namespace cumulus::runtime::jobrunner {

  struct Options {

    std::string config;

    int result_fd;

    bool verbose;
  };

  Options opts(int argc, char** argv);

} // namespace cumulus::runtime::jobrunner

#endif
