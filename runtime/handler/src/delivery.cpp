#include <cumulus/runtime/handler/delivery.hpp>

#include <cumulus/common/util.hpp>

#include <thread>

namespace cumulus::runtime {

  StatusDelivery::StatusDelivery(
      std::unique_ptr<QueueConnector> connector, std::chrono::milliseconds retry_interval
  )
      : _connector(std::move(connector)), _retry_interval(retry_interval)
  {
    _logger = common::util::create_logger("StatusDelivery");
  }

  void StatusDelivery::store(
      storage::ObjectStorage& storage, const std::string& status_key, const std::string& payload
  )
  {
    _logger->info("Storing execution stats - status.json - Size: {}", common::util::sizeof_fmt(payload.size()));
    storage.put(status_key, payload);
  }

  bool StatusDelivery::publish(
      const std::string& url, const std::string& queue, const std::string& payload
  )
  {
    if (!_connector) {
      _logger->error("Cannot publish status to {} - no message queue support", queue);
      return false;
    }

    for (int attempt = 1; attempt <= MAX_ATTEMPTS; ++attempt) {

      try {
        auto connection = _connector->connect(url);
        connection->declare_queue(queue, true);
        connection->publish(queue, payload);
        connection->close();
        SPDLOG_LOGGER_DEBUG(_logger, "Published status to {} in attempt {}", queue, attempt);
        return true;
      } catch (std::exception& exc) {
        _logger->error(
            "Unable to send status to the message queue {}, attempt {}/{}: {}", queue, attempt,
            MAX_ATTEMPTS, exc.what()
        );
      }

      if (attempt < MAX_ATTEMPTS) {
        std::this_thread::sleep_for(_retry_interval);
      }
    }

    _logger->error("Dropping status for the message queue {}", queue);
    return false;
  }

  std::string StatusDelivery::queue_name(const std::string& executor_id, const std::string& job_id)
  {
    return fmt::format("{}-{}", executor_id, job_id);
  }

} // namespace cumulus::runtime
