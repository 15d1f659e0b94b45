#pragma once
#include <string>
#include <utility>

namespace snapvc {

// Supplies the commit message. The core blocks on request_message() and
// never starts processes itself.
class MessageProvider {
public:
  virtual ~MessageProvider() = default;
  virtual std::string request_message() = 0;
};

class FixedMessage : public MessageProvider {
public:
  explicit FixedMessage(std::string message) : message_(std::move(message)) {}
  std::string request_message() override { return message_; }

private:
  std::string message_;
};

} // namespace snapvc
