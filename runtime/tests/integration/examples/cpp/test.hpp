#ifndef CUMULUS_RUNTIME_TESTS_INTEGRATION_TEST_HPP
#define CUMULUS_RUNTIME_TESTS_INTEGRATION_TEST_HPP

#include <cereal/archives/binary.hpp>
#include <cereal/types/string.hpp>

struct Input {
  int arg1;
  int arg2;

  template <typename Ar>
  void save(Ar& archive) const
  {
    archive(CEREAL_NVP(arg1));
    archive(CEREAL_NVP(arg2));
  }

  template <typename Ar>
  void load(Ar& archive)
  {
    archive(CEREAL_NVP(arg1));
    archive(CEREAL_NVP(arg2));
  }
};

struct Output {
  int result{};

  template <typename Ar>
  void save(Ar& archive) const
  {
    archive(CEREAL_NVP(result));
  }

  template <typename Ar>
  void load(Ar& archive)
  {
    archive(CEREAL_NVP(result));
  }
};

// Name of the marker file left by scratch_marker in the invocation's scratch directory.
constexpr char SCRATCH_MARKER[] = "marker";

#endif
