#include "sortfeed/feed_event.hh"

#include "sortfeed/detail/id_codec.hh"

namespace sortfeed {

std::string to_string(feed_event_type x) {
  return x == feed_event_type::publish ? "publish" : "retract";
}

std::string to_string(const feed_event& x) {
  std::string result = to_string(x.type);
  result += '(';
  result += detail::encode_id(x.id);
  if (x.type == feed_event_type::publish) {
    result += ", \"";
    result += x.content;
    result += '"';
  }
  result += ')';
  return result;
}

std::string encode(const feed_event& x) {
  auto result = detail::encode_id(x.id);
  if (x.type == feed_event_type::publish) {
    result += '\0';
    result += x.content;
  }
  return result;
}

expected<feed_event> decode_publish(std::string_view payload) {
  auto sep = payload.find('\0');
  if (sep == std::string_view::npos)
    return make_error(ec::invalid_message,
                      "publish payload lacks the ID separator");
  item_id id = 0;
  if (!detail::decode_id(payload.substr(0, sep), id))
    return make_error(ec::invalid_message, "publish payload has no valid ID");
  return feed_event::make_publish(id, std::string{payload.substr(sep + 1)});
}

expected<feed_event> decode_retract(std::string_view payload) {
  item_id id = 0;
  if (!detail::decode_id(payload, id))
    return make_error(ec::invalid_message, "retract payload is not an ID");
  return feed_event::make_retract(id);
}

} // namespace sortfeed
