#include "tgassist/channels/chat.hpp"

namespace tgassist::channels {

const char *chat_kind_name(const ChatKind kind) {
  switch (kind) {
  case ChatKind::Private:
    return "private";
  case ChatKind::Group:
    return "group";
  }
  return "unknown";
}

} // namespace tgassist::channels
