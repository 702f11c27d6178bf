#ifndef CUMULUS_RUNTIME_HANDLER_AMQP_HPP
#define CUMULUS_RUNTIME_HANDLER_AMQP_HPP

#if defined(WITH_AMQP_MONITOR)

#include <cumulus/runtime/handler/delivery.hpp>

#include <SimpleAmqpClient/SimpleAmqpClient.h>

namespace cumulus::runtime {

  struct AMQPConnection : QueueConnection {

    AMQPConnection(const std::string& url);

    void declare_queue(const std::string& name, bool auto_delete) override;

    void publish(const std::string& routing_key, const std::string& body) override;

    void close() override;

  private:
    AmqpClient::Channel::ptr_t _channel;
  };

  struct AMQPConnector : QueueConnector {

    std::unique_ptr<QueueConnection> connect(const std::string& url) override;
  };

} // namespace cumulus::runtime

#endif

#endif
