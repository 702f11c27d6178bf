#include <cumulus/function/context.hpp>
#include <cumulus/function/invocation.hpp>

#include <cereal/cereal.hpp>
#include <cereal/types/string.hpp>

#include <string>

struct Greeting {
  std::string name;

  template <typename Ar>
  void serialize(Ar& archive)
  {
    archive(CEREAL_NVP(name));
  }
};

struct Result {
  std::string message;

  template <typename Ar>
  void serialize(Ar& archive)
  {
    archive(CEREAL_NVP(message));
  }
};

extern "C" int
hello_world(cumulus::function::Invocation& invocation, cumulus::function::Context& context)
{
  Greeting greeting;
  cumulus::function::deserialize(invocation, greeting);

  Result res{"Hello, " + greeting.name + "!"};
  context.serialize_output(res);
  return 0;
}
