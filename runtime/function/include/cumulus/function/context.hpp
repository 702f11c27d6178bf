#ifndef CUMULUS_FUNCTION_CONTEXT_HPP
#define CUMULUS_FUNCTION_CONTEXT_HPP

#include <cumulus/function/invocation.hpp>

#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include <cereal/archives/binary.hpp>

namespace cumulus::runtime::jobrunner {
  struct JobRunner;
} // namespace cumulus::runtime::jobrunner

namespace cumulus::function {

  struct Future {
    std::string executor_id;
    std::string job_id;
    std::string call_id;
  };

  struct Context {

    // Replaces the output stored under output_key when the function returns 0.
    void set_output(std::string output)
    {
      _output = std::move(output);
    }

    template <typename Obj>
    void serialize_output(const Obj& obj)
    {
      std::ostringstream out_stream;
      {
        cereal::BinaryOutputArchive archive_out{out_stream};
        archive_out(obj);
      }
      _output = out_stream.str();
    }

    const std::string& output() const
    {
      return _output;
    }

    // Records a sub-invocation spawned by this function; reported back as new_futures.
    void add_future(Future future);

    const std::vector<Future>& futures() const
    {
      return _futures;
    }

    // Private directory of this invocation, cleared before the next one.
    const std::filesystem::path& scratch_directory() const
    {
      return _scratch_directory;
    }

  private:
    Context(std::filesystem::path scratch_directory)
        : _scratch_directory(std::move(scratch_directory))
    {
    }

    std::string _output;

    std::vector<Future> _futures;

    std::filesystem::path _scratch_directory;

    friend struct runtime::jobrunner::JobRunner;
  };

  using FuncType = int (*)(Invocation&, Context&);

  template <typename Obj>
  void deserialize(const Invocation& invocation, Obj& obj)
  {
    std::istringstream in_stream{invocation.data};
    cereal::BinaryInputArchive archive_in{in_stream};
    archive_in(obj);
  }

} // namespace cumulus::function

#endif
