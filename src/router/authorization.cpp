#include "tgassist/router/authorization.hpp"

#include <algorithm>

namespace tgassist::router {

StaticAuthorizationPolicy::StaticAuthorizationPolicy(std::vector<std::int64_t> allowed_chats,
                                                     std::vector<std::int64_t> authorized_users)
    : allowed_chats_(allowed_chats.begin(), allowed_chats.end()),
      authorized_user_set_(authorized_users.begin(), authorized_users.end()) {
  // Keep configuration order for membership lookups, minus duplicates.
  for (const auto user : authorized_users) {
    if (std::find(authorized_users_.begin(), authorized_users_.end(), user) ==
        authorized_users_.end()) {
      authorized_users_.push_back(user);
    }
  }
}

std::shared_ptr<StaticAuthorizationPolicy>
StaticAuthorizationPolicy::from_config(const config::TelegramConfig &config) {
  return std::make_shared<StaticAuthorizationPolicy>(config.allowed_chat_ids,
                                                     config.authorized_user_ids);
}

bool StaticAuthorizationPolicy::is_allowed_chat(const std::int64_t chat_id) const {
  return allowed_chats_.contains(chat_id);
}

bool StaticAuthorizationPolicy::is_authorized_user(const std::int64_t user_id) const {
  return authorized_user_set_.contains(user_id);
}

std::vector<std::int64_t> StaticAuthorizationPolicy::authorized_users() const {
  return authorized_users_;
}

} // namespace tgassist::router
