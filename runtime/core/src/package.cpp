#include <cumulus/runtime/package.hpp>

#include <cumulus/common/exceptions.hpp>

#include <fstream>
#include <iterator>
#include <sstream>

#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/stream.hpp>
#include <cereal/archives/binary.hpp>
#include <fmt/format.h>

namespace cumulus::runtime {

  void FunctionPackage::add_module(const std::filesystem::path& path)
  {
    std::ifstream in{path, std::ios::in | std::ios::binary};
    if (!in.is_open()) {
      throw common::CumulusException{fmt::format("Could not find file {}", path.string())};
    }
    modules[path.filename().string()] =
        std::string{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
  }

  std::string FunctionPackage::to_bytes() const
  {
    std::ostringstream out;
    {
      cereal::BinaryOutputArchive archive_out{out};
      archive_out(*this);
    }
    return out.str();
  }

  FunctionPackage FunctionPackage::from_bytes(const std::string& data)
  {
    FunctionPackage package;
    try {
      boost::iostreams::stream<boost::iostreams::array_source> stream(data.data(), data.size());
      cereal::BinaryInputArchive archive_in{stream};
      archive_in(package);
    } catch (cereal::Exception& exc) {
      throw common::CumulusException{
          fmt::format("Could not decode the function package, reason: {}", exc.what())};
    }

    if (package.modules.find(package.main_module) == package.modules.end()) {
      throw common::CumulusException{
          fmt::format("Function package does not contain its main module {}", package.main_module)};
    }
    return package;
  }

  FunctionPackage FunctionPackage::from_library(const std::filesystem::path& library, std::string function)
  {
    FunctionPackage package;
    package.function = std::move(function);
    package.main_module = library.filename().string();
    package.add_module(library);
    return package;
  }

} // namespace cumulus::runtime
