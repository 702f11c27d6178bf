#include <cumulus/runtime/handler/amqp.hpp>

#if defined(WITH_AMQP_MONITOR)

#include <cumulus/common/exceptions.hpp>

namespace cumulus::runtime {

  AMQPConnection::AMQPConnection(const std::string& url)
  {
    _channel = AmqpClient::Channel::CreateFromUri(url);
  }

  void AMQPConnection::declare_queue(const std::string& name, bool auto_delete)
  {
    if (!_channel) {
      throw common::CumulusException{"AMQP channel is closed"};
    }
    _channel->DeclareQueue(name, false, false, false, auto_delete);
  }

  void AMQPConnection::publish(const std::string& routing_key, const std::string& body)
  {
    if (!_channel) {
      throw common::CumulusException{"AMQP channel is closed"};
    }
    _channel->BasicPublish("", routing_key, AmqpClient::BasicMessage::Create(body));
  }

  void AMQPConnection::close()
  {
    // Dropping the last reference closes the connection.
    _channel.reset();
  }

  std::unique_ptr<QueueConnection> AMQPConnector::connect(const std::string& url)
  {
    return std::make_unique<AMQPConnection>(url);
  }

} // namespace cumulus::runtime

#endif
