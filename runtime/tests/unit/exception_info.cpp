#include <cumulus/common/exceptions.hpp>
#include <cumulus/runtime/exception_info.hpp>
#include <cumulus/runtime/package.hpp>

#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

using namespace cumulus::runtime;
using cumulus::common::InvocationFailure;

TEST(ExceptionInfo, StandardException)
{
  std::invalid_argument exc{"wrong argument"};
  auto info = ExceptionInfo::from_exception(exc);

  EXPECT_EQ(info.type, "std::invalid_argument");
  EXPECT_EQ(info.message, "wrong argument");
  EXPECT_TRUE(info.tag.empty());
  EXPECT_TRUE(info.args.empty());
}

TEST(ExceptionInfo, TaggedFailure)
{
  InvocationFailure exc{
      InvocationFailure::Tag::WRONGVERSION, "version mismatch", {"0.3.0", "0.4.1"}};
  auto info = ExceptionInfo::from_exception(exc);

  EXPECT_EQ(info.type, "cumulus::common::InvocationFailure");
  EXPECT_EQ(info.tag, "WRONGVERSION");
  ASSERT_EQ(info.args.size(), 2);
  EXPECT_EQ(info.args[0], "0.3.0");

  auto copy = ExceptionInfo::from_json(info.to_json());
  EXPECT_EQ(copy.type, info.type);
  EXPECT_EQ(copy.tag, info.tag);
  EXPECT_EQ(copy.message, info.message);
  EXPECT_EQ(copy.args, info.args);
}

TEST(ExceptionInfo, CurrentException)
{
  ExceptionInfo info;
  try {
    throw 42;
  } catch (...) {
    info = ExceptionInfo::from_current_exception();
  }
  EXPECT_EQ(info.type, "int");
  EXPECT_FALSE(info.message.empty());
}

TEST(ExceptionInfo, InvalidJSON)
{
  EXPECT_ANY_THROW(ExceptionInfo::from_json("Traceback (most recent call last)"));
  EXPECT_ANY_THROW(ExceptionInfo::from_json(R"({"other": 1})"));
}

TEST(FunctionPackage, Encoding)
{
  FunctionPackage package;
  package.function = "entry";
  package.main_module = "libmain.so";
  package.modules["libmain.so"] = std::string{"\x7f" "ELF\0\1", 6};
  package.modules["libdep.so"] = "dependency";

  auto copy = FunctionPackage::from_bytes(package.to_bytes());
  EXPECT_EQ(copy.function, "entry");
  EXPECT_EQ(copy.main_module, "libmain.so");
  EXPECT_EQ(copy.modules, package.modules);
}

TEST(FunctionPackage, MissingMainModule)
{
  FunctionPackage package;
  package.function = "entry";
  package.main_module = "libmain.so";
  package.modules["libdep.so"] = "dependency";

  EXPECT_THROW(FunctionPackage::from_bytes(package.to_bytes()), cumulus::common::CumulusException);
  EXPECT_THROW(FunctionPackage::from_bytes("garbage"), cumulus::common::CumulusException);
}

TEST(FunctionPackage, FromLibrary)
{
  auto path = std::filesystem::temp_directory_path() / "libcumulus-package-test.so";
  {
    std::ofstream out{path, std::ios::binary};
    out << "library contents";
  }

  auto package = FunctionPackage::from_library(path, "handler");
  EXPECT_EQ(package.function, "handler");
  EXPECT_EQ(package.main_module, "libcumulus-package-test.so");
  EXPECT_EQ(package.modules.at("libcumulus-package-test.so"), "library contents");

  std::filesystem::remove(path);

  EXPECT_THROW(
      FunctionPackage::from_library(path, "handler"), cumulus::common::CumulusException
  );
}
