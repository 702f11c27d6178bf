#ifndef CUMULUS_RUNTIME_JOBRUNNER_FUNCTIONS_HPP
#define CUMULUS_RUNTIME_JOBRUNNER_FUNCTIONS_HPP

#include <cumulus/function/context.hpp>
#include <cumulus/runtime/package.hpp>

#include <filesystem>
#include <string>
#include <unordered_map>

namespace cumulus::runtime::jobrunner {

  /**
   * @brief Materializes the modules of a function package and loads its entry point.
   */
  struct FunctionsLibrary {

    FunctionsLibrary(const FunctionPackage& package, const std::filesystem::path& module_path);
    FunctionsLibrary(const FunctionsLibrary&) = delete;
    FunctionsLibrary(FunctionsLibrary&&) = delete;
    FunctionsLibrary& operator=(const FunctionsLibrary&) = delete;
    FunctionsLibrary& operator=(FunctionsLibrary&&) = delete;
    ~FunctionsLibrary();

    function::FuncType function() const
    {
      return _function;
    }

  private:
    void _materialize(const FunctionPackage& package, const std::filesystem::path& module_path);

    void* _library{};

    function::FuncType _function{};
  };

} // namespace cumulus::runtime::jobrunner

#endif
