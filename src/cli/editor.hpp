#pragma once
#include "snapvc/message.hpp"

#include <filesystem>
#include <string>
#include <utility>

namespace snapvc::cli {

// Collects a commit message by opening $VISUAL, $EDITOR or vi on
// .snapvc/COMMIT_MSG and waiting for it to exit.
class EditorMessage : public MessageProvider {
public:
  explicit EditorMessage(std::filesystem::path meta_dir) : meta_dir_(std::move(meta_dir)) {}
  std::string request_message() override;

private:
  std::filesystem::path meta_dir_;
};

} // namespace snapvc::cli
