#pragma once

#include "tgassist/config/schema.hpp"

#include <cstdint>
#include <memory>
#include <unordered_set>
#include <vector>

namespace tgassist::router {

/// Who may talk to the assistant. Read-only once built.
class AuthorizationPolicy {
public:
  virtual ~AuthorizationPolicy() = default;

  [[nodiscard]] virtual bool is_allowed_chat(std::int64_t chat_id) const = 0;
  [[nodiscard]] virtual bool is_authorized_user(std::int64_t user_id) const = 0;
  /// Users whose presence in a group vouches for it.
  [[nodiscard]] virtual std::vector<std::int64_t> authorized_users() const = 0;
};

class StaticAuthorizationPolicy final : public AuthorizationPolicy {
public:
  StaticAuthorizationPolicy(std::vector<std::int64_t> allowed_chats,
                            std::vector<std::int64_t> authorized_users);

  [[nodiscard]] static std::shared_ptr<StaticAuthorizationPolicy>
  from_config(const config::TelegramConfig &config);

  [[nodiscard]] bool is_allowed_chat(std::int64_t chat_id) const override;
  [[nodiscard]] bool is_authorized_user(std::int64_t user_id) const override;
  [[nodiscard]] std::vector<std::int64_t> authorized_users() const override;

private:
  std::unordered_set<std::int64_t> allowed_chats_;
  std::unordered_set<std::int64_t> authorized_user_set_;
  std::vector<std::int64_t> authorized_users_;
};

} // namespace tgassist::router
