#include "sortfeed/message.hh"

namespace sortfeed {

std::string to_string(const message& x) {
  std::string result = "message(";
  result += x.channel;
  result += ", \"";
  for (auto ch : x.payload) {
    if (ch == '\0')
      result += "\\0";
    else
      result += ch;
  }
  result += "\")";
  return result;
}

} // namespace sortfeed
