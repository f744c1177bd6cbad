#pragma once

#include <map>
#include <string>

#include "prdchat/v1/chat.pb.h"

namespace prdchat::pipeline {

/*
  Role-specific system prompts.

  Built-in prompts for PM, DEV and QA can be replaced per role from
  configuration (keys "pm", "dev", "qa"). An unspecified role answers
  as PM. The document itself never goes into the system prompt; it is
  supplied as a marked context message.
*/
class SystemPrompts {
 public:
  SystemPrompts() = default;
  explicit SystemPrompts(const std::map<std::string, std::string>& overrides);

  // Role prompt followed by the shared rules for using context material.
  std::string Build(prdchat::v1::AssistantRole role) const;

  const std::string& RolePrompt(prdchat::v1::AssistantRole role) const;

  static const char* RoleKey(prdchat::v1::AssistantRole role);

 private:
  std::map<std::string, std::string> overrides_;
};

} // namespace prdchat::pipeline
