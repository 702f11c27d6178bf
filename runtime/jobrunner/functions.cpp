#include "functions.hpp"

#include <cumulus/common/exceptions.hpp>

#include <fstream>

#include <spdlog/spdlog.h>

#include <dlfcn.h>

namespace fs = std::filesystem;

namespace cumulus::runtime::jobrunner {

  FunctionsLibrary::FunctionsLibrary(const FunctionPackage& package, const fs::path& module_path)
  {
    _materialize(package, module_path);

    fs::path library_path = module_path / package.main_module;
    // RTLD_GLOBAL - other modules of the package may depend on symbols of the main one.
    _library = dlopen(library_path.c_str(), RTLD_NOW | RTLD_GLOBAL);
    if (_library == nullptr) {
      throw common::CumulusException{
          fmt::format("Couldn't open the library {}, reason: {}", library_path.string(), dlerror())};
    }

    void* func_handle = dlsym(_library, package.function.c_str());
    if (func_handle == nullptr) {
      const char* error = dlerror();
      std::string reason = error ? error : "symbol is null";
      dlclose(_library);
      _library = nullptr;
      throw common::CumulusException{
          fmt::format("Couldn't get the function {}, reason: {}", package.function, reason)};
    }
    _function = reinterpret_cast<function::FuncType>(func_handle);

    spdlog::debug("Loaded function {} from {}", package.function, package.main_module);
  }

  FunctionsLibrary::~FunctionsLibrary()
  {
    if (_library != nullptr) {
      dlclose(_library);
    }
  }

  void FunctionsLibrary::_materialize(const FunctionPackage& package, const fs::path& module_path)
  {
    std::error_code ec;
    fs::remove_all(module_path, ec);
    fs::create_directories(module_path, ec);
    if (ec) {
      throw common::CumulusException{fmt::format(
          "Could not prepare module directory {}: {}", module_path.string(), ec.message()
      )};
    }

    for (const auto& [name, contents] : package.modules) {

      fs::path path = module_path / fs::path{name}.filename();
      std::ofstream out_file(path, std::ios::binary);
      if (!out_file) {
        throw common::CumulusException{
            fmt::format("Unable to open file for writing: {}", path.string())};
      }
      out_file.write(contents.data(), contents.size());
      if (!out_file) {
        throw common::CumulusException{fmt::format("Unable to write to file: {}", path.string())};
      }
      SPDLOG_DEBUG("Materialized module {}, size {}", path.string(), contents.size());
    }
  }

} // namespace cumulus::runtime::jobrunner
