#ifndef CUMULUS_RUNTIME_PACKAGE_HPP
#define CUMULUS_RUNTIME_PACKAGE_HPP

#include <filesystem>
#include <map>
#include <string>

#include <cereal/cereal.hpp>
#include <cereal/types/map.hpp>
#include <cereal/types/string.hpp>

namespace cumulus::runtime {

  /**
   * @brief The object stored under func_key: shared libraries with user code and the symbol
   * to call.
   *
   * The entry symbol must have the signature
   *   extern "C" int fn(cumulus::function::Invocation&, cumulus::function::Context&);
   */
  struct FunctionPackage {

    std::string function;

    // File name of the module exporting the function; must be one of the modules.
    std::string main_module;

    // File name -> library contents.
    std::map<std::string, std::string> modules;

    void add_module(const std::filesystem::path& path);

    std::string to_bytes() const;

    static FunctionPackage from_bytes(const std::string& data);

    static FunctionPackage from_library(const std::filesystem::path& library, std::string function);

    template <typename Ar>
    void save(Ar& archive) const
    {
      archive(CEREAL_NVP(function));
      archive(CEREAL_NVP(main_module));
      archive(CEREAL_NVP(modules));
    }

    template <typename Ar>
    void load(Ar& archive)
    {
      archive(CEREAL_NVP(function));
      archive(CEREAL_NVP(main_module));
      archive(CEREAL_NVP(modules));
    }
  };

} // namespace cumulus::runtime

#endif
