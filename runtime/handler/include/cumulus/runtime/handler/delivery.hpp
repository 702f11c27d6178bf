#ifndef CUMULUS_RUNTIME_HANDLER_DELIVERY_HPP
#define CUMULUS_RUNTIME_HANDLER_DELIVERY_HPP

#include <cumulus/storage/storage.hpp>

#include <chrono>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace cumulus::runtime {

  struct QueueConnection {

    virtual ~QueueConnection() = default;

    virtual void declare_queue(const std::string& name, bool auto_delete) = 0;

    // Publishes through the default exchange.
    virtual void publish(const std::string& routing_key, const std::string& body) = 0;

    virtual void close() = 0;
  };

  struct QueueConnector {

    virtual ~QueueConnector() = default;

    virtual std::unique_ptr<QueueConnection> connect(const std::string& url) = 0;
  };

  /**
   * @brief Both paths of returning a status record to the orchestrator.
   *
   * Object storage is the authoritative path. The message queue is a low-latency side channel
   * that may lose records.
   */
  struct StatusDelivery {

    static constexpr int MAX_ATTEMPTS = 5;
    static constexpr std::chrono::milliseconds DEFAULT_RETRY_INTERVAL{200};

    StatusDelivery(
        std::unique_ptr<QueueConnector> connector,
        std::chrono::milliseconds retry_interval = DEFAULT_RETRY_INTERVAL
    );

    /**
     * @brief Single write of the record to status_key; errors of the storage propagate.
     */
    void store(storage::ObjectStorage& storage, const std::string& status_key, const std::string& payload);

    /**
     * @brief Best-effort publication; every attempt opens a new connection.
     *
     * @return false when the record was dropped
     */
    bool publish(const std::string& url, const std::string& queue, const std::string& payload);

    static std::string queue_name(const std::string& executor_id, const std::string& job_id);

  private:
    std::unique_ptr<QueueConnector> _connector;

    std::chrono::milliseconds _retry_interval;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace cumulus::runtime

#endif
