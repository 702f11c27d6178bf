#include <cumulus/function/context.hpp>

#include <cumulus/common/exceptions.hpp>

namespace cumulus::function {

  void Context::add_future(Future future)
  {
    if (future.executor_id.empty() || future.job_id.empty() || future.call_id.empty()) {
      throw common::CumulusException{"A future requires executor, job and call identifiers"};
    }
    _futures.push_back(std::move(future));
  }

} // namespace cumulus::function
