#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"
#include "tgassist/channels/dispatcher.hpp"
#include "tgassist/channels/telegram/telegram.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

namespace ch = tgassist::channels;

ch::ChannelConfig offline_config() {
  ch::ChannelConfig cfg;
  cfg.id = "telegram";
  cfg.settings["bot_token"] = "123:test-token";
  cfg.settings["api_base"] = "https://telegram.test/";
  cfg.settings["bot_username"] = "@assistbot";
  cfg.settings["polling_enabled"] = "false";
  return cfg;
}

std::string member_response(const std::string &status, const std::string &extra = "") {
  return R"({"ok":true,"result":{"user":{"id":42},"status":")" + status + "\"" + extra + "}}";
}

} // namespace

void register_channels_tests(std::vector<tgassist::tests::TestCase> &tests) {
  using tgassist::tests::require;
  namespace t = tgassist::testing;

  tests.push_back({"channels_parse_update_private_text", [] {
                     auto parsed = ch::telegram::parse_update(
                         R"({"update_id":1001,"message":{"message_id":88,"date":1700000000,"text":"hello","from":{"id":42,"username":"alice"},"chat":{"id":42,"type":"private"}}})");
                     require(parsed.ok(), parsed.ok() ? "" : parsed.error());
                     const auto &event = parsed.value().event;
                     require(event.has_value(), "private text should produce an event");
                     require(event->chat_kind == ch::ChatKind::Private, "kind mismatch");
                     require(event->chat_id == 42 && event->sender_id == 42, "ids mismatch");
                     require(event->message_id == 88, "message id mismatch");
                     require(event->sender_username == "alice", "username mismatch");
                     require(event->text == "hello", "text mismatch");
                   }});

  tests.push_back({"channels_parse_update_groups_and_supergroups", [] {
                     for (const std::string type : {"group", "supergroup"}) {
                       auto parsed = ch::telegram::parse_update(
                           R"({"update_id":5,"message":{"message_id":3,"text":"@assistbot hi","from":{"id":7},"chat":{"id":-100200,"type":")" +
                           type + R"("}}})");
                       require(parsed.ok(), parsed.ok() ? "" : parsed.error());
                       require(parsed.value().event.has_value(), type + " should produce an event");
                       require(parsed.value().event->chat_kind == ch::ChatKind::Group,
                               type + " should map to Group");
                       require(parsed.value().event->chat_id == -100200, "negative chat id kept");
                     }
                   }});

  tests.push_back({"channels_parse_update_skips_unsupported", [] {
                     auto channel_post = ch::telegram::parse_update(
                         R"({"update_id":6,"message":{"message_id":1,"text":"news","from":{"id":1},"chat":{"id":-5,"type":"channel"}}})");
                     require(channel_post.ok() && !channel_post.value().event.has_value(),
                             "channel chats are skipped");

                     auto sticker = ch::telegram::parse_update(
                         R"({"update_id":7,"message":{"message_id":2,"sticker":{"file_id":"x"},"from":{"id":1},"chat":{"id":1,"type":"private"}}})");
                     require(sticker.ok() && !sticker.value().event.has_value(),
                             "messages without text are skipped");
                     require(sticker.value().skip_reason == "no text", "skip reason mismatch");
                     require(sticker.value().update_id == 7, "skipped updates keep their id");

                     auto edited = ch::telegram::parse_update(
                         R"({"update_id":8,"edited_message":{"message_id":2,"text":"x","from":{"id":1},"chat":{"id":1,"type":"private"}}})");
                     require(edited.ok() && !edited.value().event.has_value(),
                             "edits are skipped");

                     require(!ch::telegram::parse_update(R"({"message":{}})").ok(),
                             "missing update_id should fail");
                   }});

  tests.push_back({"channels_parse_update_reply_does_not_shadow_text", [] {
                     auto parsed = ch::telegram::parse_update(
                         R"({"update_id":9,"message":{"message_id":11,"reply_to_message":{"message_id":10,"text":"older","from":{"id":99},"chat":{"id":1,"type":"private"}},"text":"newer","from":{"id":1},"chat":{"id":1,"type":"private"}}})");
                     require(parsed.ok() && parsed.value().event.has_value(), "event expected");
                     require(parsed.value().event->text == "newer", "text should be the new message");
                     require(parsed.value().event->sender_id == 1, "sender should be the author");
                   }});

  tests.push_back({"channels_telegram_send_reply_quotes_message", [] {
                     auto http = std::make_shared<t::MockHttpClient>();
                     http->push_response(200, R"({"ok":true,"result":{"message_id":5}})");
                     ch::telegram::TelegramChannel channel(http);
                     auto started = channel.start(offline_config());
                     require(started.ok(), started.error());
                     require(channel.bot_handle() == "assistbot", "configured handle mismatch");

                     auto sent = channel.send_reply(-100, "line \"one\"\nline two", 77);
                     require(sent.ok(), sent.error());
                     const auto requests = http->requests();
                     require(requests.size() == 1, "one request expected");
                     require(requests[0].url == "https://telegram.test/bot123:test-token/sendMessage",
                             "url mismatch: " + requests[0].url);
                     require(requests[0].body.find("\"chat_id\":-100") != std::string::npos,
                             "chat id missing");
                     require(requests[0].body.find(R"(line \"one\"\nline two)") != std::string::npos,
                             "text should be JSON escaped");
                     require(requests[0].body.find("\"reply_to_message_id\":77") !=
                                 std::string::npos,
                             "reply target missing");
                     channel.stop();
                   }});

  tests.push_back({"channels_telegram_send_reply_reports_api_errors", [] {
                     auto http = std::make_shared<t::MockHttpClient>();
                     http->push_response(403, R"({"ok":false,"description":"bot was kicked"})");
                     ch::telegram::TelegramChannel channel(http);
                     require(channel.start(offline_config()).ok(), "start should succeed");

                     auto sent = channel.send_reply(-100, "hello", std::nullopt);
                     require(!sent.ok(), "403 should fail");
                     require(sent.error().find("sendMessage") != std::string::npos,
                             "error should name the operation");
                     require(http->requests()[0].body.find("reply_to_message_id") ==
                                 std::string::npos,
                             "no reply target without a message id");
                     require(!channel.send_reply(-100, "   ", std::nullopt).ok(),
                             "blank text should be refused");
                   }});

  tests.push_back({"channels_telegram_membership_states", [] {
                     auto http = std::make_shared<t::MockHttpClient>();
                     http->push_response(200, member_response("creator"));
                     http->push_response(200, member_response("member"));
                     http->push_response(200, member_response("left"));
                     http->push_response(200, member_response("kicked"));
                     http->push_response(200, member_response("restricted", R"(,"is_member":true)"));
                     http->push_response(200, member_response("restricted", R"(,"is_member":false)"));
                     http->push_response(400, R"({"ok":false,"description":"Bad Request: user not found"})");
                     http->push_network_error("connection reset");
                     ch::telegram::TelegramChannel channel(http);
                     require(channel.start(offline_config()).ok(), "start should succeed");

                     // creator, member, left, kicked, restricted x2, 400 "user not found"
                     const std::vector<bool> expected = {true, true, false, false, true, false, false};
                     std::vector<bool> actual;
                     for (std::size_t i = 0; i < expected.size(); ++i) {
                       auto member = channel.is_member(-100, 42);
                       require(member.ok(), member.ok() ? "" : member.error());
                       actual.push_back(member.value());
                     }
                     require(actual == expected, "membership classification mismatch");

                     auto failed = channel.is_member(-100, 42);
                     require(!failed.ok(), "network error must not read as 'not a member'");
                     require(http->requests()[0].url.find("/getChatMember") != std::string::npos,
                             "lookup endpoint mismatch");
                     require(http->requests()[0].body == R"({"chat_id":-100,"user_id":42})",
                             "lookup body mismatch");
                   }});

  tests.push_back({"channels_telegram_leave_chat", [] {
                     auto http = std::make_shared<t::MockHttpClient>();
                     http->push_response(200, R"({"ok":true,"result":true})");
                     ch::telegram::TelegramChannel channel(http);
                     require(channel.start(offline_config()).ok(), "start should succeed");

                     auto left = channel.leave_chat(-100555);
                     require(left.ok(), left.error());
                     const auto requests = http->requests();
                     require(requests[0].url.ends_with("/leaveChat"), "leave endpoint mismatch");
                     require(requests[0].body == R"({"chat_id":-100555})", "leave body mismatch");
                   }});

  tests.push_back({"channels_telegram_start_fetches_handle", [] {
                     auto http = std::make_shared<t::MockHttpClient>();
                     http->push_response(200, R"({"ok":true,"result":{"id":1,"is_bot":true,"username":"FancyBot"}})");
                     ch::telegram::TelegramChannel channel(http);
                     auto cfg = offline_config();
                     cfg.settings.erase("bot_username");
                     auto started = channel.start(cfg);
                     require(started.ok(), started.error());
                     require(channel.bot_handle() == "FancyBot", "handle should come from getMe");
                     require(http->requests()[0].url.ends_with("/getMe"), "getMe expected");
                   }});

  tests.push_back({"channels_telegram_start_requires_token", [] {
                     auto http = std::make_shared<t::MockHttpClient>();
                     ch::telegram::TelegramChannel channel(http);
                     auto cfg = offline_config();
                     cfg.settings["bot_token"] = "  ";
                     require(!channel.start(cfg).ok(), "blank token should fail");

                     http->push_response(401, R"({"ok":false,"description":"Unauthorized"})");
                     auto no_handle = offline_config();
                     no_handle.settings.erase("bot_username");
                     require(!channel.start(no_handle).ok(), "getMe failure should fail start");
                   }});

  tests.push_back({"channels_telegram_polling_dispatches_and_advances_offset", [] {
                     auto http = std::make_shared<t::MockHttpClient>();
                     http->push_response(200, R"({"ok":true,"result":[{"update_id":1001,"message":{"message_id":88,"text":"hello from telegram","from":{"id":42},"chat":{"id":42,"type":"private"}}},{"update_id":1002,"message":{"message_id":89,"photo":[],"from":{"id":42},"chat":{"id":42,"type":"private"}}}]})");

                     ch::telegram::TelegramChannel channel(http);
                     std::mutex wait_mutex;
                     std::condition_variable wait_cv;
                     std::vector<ch::ChatEvent> received;
                     channel.on_event([&](const ch::ChatEvent &event) {
                       std::lock_guard<std::mutex> lock(wait_mutex);
                       received.push_back(event);
                       wait_cv.notify_all();
                     });

                     auto cfg = offline_config();
                     cfg.settings["polling_enabled"] = "true";
                     cfg.settings["poll_timeout_seconds"] = "0";
                     cfg.settings["idle_sleep_ms"] = "5";
                     auto started = channel.start(cfg);
                     require(started.ok(), started.error());

                     {
                       std::unique_lock<std::mutex> lock(wait_mutex);
                       (void)wait_cv.wait_for(lock, std::chrono::milliseconds(500),
                                              [&]() { return !received.empty(); });
                     }
                     require(http->wait_for_requests(2, std::chrono::milliseconds(500)),
                             "channel should keep polling");
                     channel.stop();

                     require(received.size() == 1, "only the text message is dispatched");
                     require(received[0].text == "hello from telegram", "text mismatch");
                     const auto requests = http->requests();
                     require(requests[0].url.ends_with("/getUpdates"), "polling endpoint mismatch");
                     require(requests[0].body.find("\"offset\":0") != std::string::npos,
                             "first poll starts at offset 0");
                     require(requests[1].body.find("\"offset\":1003") != std::string::npos,
                             "offset must pass skipped updates too: " + requests[1].body);
                   }});

  tests.push_back({"channels_dispatcher_runs_events_concurrently", [] {
                     std::atomic<int> active{0};
                     std::atomic<int> peak{0};
                     std::atomic<int> handled{0};
                     ch::UpdateDispatcher dispatcher(3, [&](const ch::ChatEvent &) {
                       const int now = ++active;
                       int seen = peak.load();
                       while (now > seen && !peak.compare_exchange_weak(seen, now)) {
                       }
                       std::this_thread::sleep_for(std::chrono::milliseconds(40));
                       --active;
                       ++handled;
                     });
                     dispatcher.start();
                     for (int i = 0; i < 6; ++i) {
                       require(dispatcher.submit(t::private_message(42, "hi", i + 1)),
                               "submit should succeed while running");
                     }
                     dispatcher.stop();
                     require(handled.load() == 6, "stop should drain queued events");
                     require(peak.load() > 1, "events should overlap across workers");
                   }});

  tests.push_back({"channels_dispatcher_rejects_after_stop", [] {
                     ch::UpdateDispatcher dispatcher(1, [](const ch::ChatEvent &) {});
                     require(!dispatcher.submit(t::private_message(1, "early")),
                             "submit before start should fail");
                     dispatcher.start();
                     dispatcher.stop();
                     require(!dispatcher.submit(t::private_message(1, "late")),
                             "submit after stop should fail");
                     require(dispatcher.queue_depth() == 0, "queue should be empty");
                   }});

  tests.push_back({"channels_dispatcher_survives_throwing_handler", [] {
                     std::atomic<int> handled{0};
                     ch::UpdateDispatcher dispatcher(1, [&](const ch::ChatEvent &event) {
                       ++handled;
                       if (event.message_id == 1) {
                         throw std::runtime_error("boom");
                       }
                     });
                     dispatcher.start();
                     (void)dispatcher.submit(t::private_message(1, "first", 1));
                     (void)dispatcher.submit(t::private_message(1, "second", 2));
                     dispatcher.stop();
                     require(handled.load() == 2, "worker should continue after a throw");
                   }});
}
