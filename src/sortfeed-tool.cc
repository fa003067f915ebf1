#include <cstdlib>
#include <exception>
#include <iostream>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sortfeed/backend.hh"
#include "sortfeed/configuration.hh"
#include "sortfeed/detail/id_codec.hh"
#include "sortfeed/detail/make_backend.hh"
#include "sortfeed/error.hh"
#include "sortfeed/expected.hh"
#include "sortfeed/internal/logger.hh"
#include "sortfeed/sorted_feed.hh"

using sortfeed::expected;
using sortfeed::item_id;
using sortfeed::sorted_feed;

namespace {

constexpr std::string_view usage_text =
  "usage: sortfeed-tool [options] <feed> <command> [args]\n"
  "\n"
  "commands:\n"
  "  publish <content>          adds an item to the end of the feed\n"
  "  append <content>           same as publish\n"
  "  prepend <content>          adds an item to the beginning of the feed\n"
  "  before <anchor> <content>  adds an item before an existing item\n"
  "  after <anchor> <content>   adds an item after an existing item\n"
  "  edit <id> <content>        replaces the content of an item\n"
  "  retract <id>               removes an item\n"
  "  ids                        prints all IDs in feed order\n"
  "  get <id>                   prints the content of an item\n"
  "  items                      prints all items as '<id> <content>'\n"
  "  publishes                  prints the number of publish events\n"
  "  schemas                    prints the store keys of the feed\n";

using args_list = std::vector<std::string>;

int print_error(const sortfeed::error& err) {
  std::cerr << "*** " << to_string(err) << '\n';
  return EXIT_FAILURE;
}

int usage_error(std::string_view what) {
  std::cerr << "*** " << what << "\n\n" << usage_text;
  return EXIT_FAILURE;
}

bool parse_id(const std::string& str, item_id& id) {
  if (sortfeed::detail::decode_id(str, id))
    return true;
  std::cerr << "*** invalid item ID: " << str << '\n';
  return false;
}

int print_result(const expected<item_id>& res) {
  if (!res)
    return print_error(res.error());
  std::cout << *res << '\n';
  return EXIT_SUCCESS;
}

int print_result(const expected<void>& res) {
  if (!res)
    return print_error(res.error());
  return EXIT_SUCCESS;
}

int run(sorted_feed& feed, const std::string& cmd, const args_list& args) {
  auto expect_args = [&](size_t n) {
    if (args.size() == n)
      return true;
    std::cerr << "*** " << cmd << " expects " << n << " argument(s), got "
              << args.size() << '\n';
    return false;
  };
  if (cmd == "publish" || cmd == "append" || cmd == "prepend") {
    if (!expect_args(1))
      return EXIT_FAILURE;
    if (cmd == "prepend")
      return print_result(feed.prepend(args[0]));
    return print_result(feed.publish(args[0]));
  }
  if (cmd == "before" || cmd == "after") {
    item_id anchor = 0;
    if (!expect_args(2) || !parse_id(args[0], anchor))
      return EXIT_FAILURE;
    if (cmd == "before")
      return print_result(feed.publish_before(anchor, args[1]));
    return print_result(feed.publish_after(anchor, args[1]));
  }
  if (cmd == "edit") {
    item_id id = 0;
    if (!expect_args(2) || !parse_id(args[0], id))
      return EXIT_FAILURE;
    return print_result(feed.edit(id, args[1]));
  }
  if (cmd == "retract") {
    item_id id = 0;
    if (!expect_args(1) || !parse_id(args[0], id))
      return EXIT_FAILURE;
    return print_result(feed.retract(id));
  }
  if (cmd == "get") {
    item_id id = 0;
    if (!expect_args(1) || !parse_id(args[0], id))
      return EXIT_FAILURE;
    auto res = feed.get_item(id);
    if (!res)
      return print_error(res.error());
    std::cout << *res << '\n';
    return EXIT_SUCCESS;
  }
  if (cmd == "ids") {
    if (!expect_args(0))
      return EXIT_FAILURE;
    auto res = feed.get_ids();
    if (!res)
      return print_error(res.error());
    for (auto id : *res)
      std::cout << id << '\n';
    return EXIT_SUCCESS;
  }
  if (cmd == "items") {
    if (!expect_args(0))
      return EXIT_FAILURE;
    auto res = feed.get_items();
    if (!res)
      return print_error(res.error());
    for (auto& [id, content] : *res)
      std::cout << id << ' ' << content << '\n';
    return EXIT_SUCCESS;
  }
  if (cmd == "publishes") {
    if (!expect_args(0))
      return EXIT_FAILURE;
    auto res = feed.publishes();
    if (!res)
      return print_error(res.error());
    std::cout << *res << '\n';
    return EXIT_SUCCESS;
  }
  if (cmd == "schemas") {
    if (!expect_args(0))
      return EXIT_FAILURE;
    for (auto& key : feed.schemas())
      std::cout << key << '\n';
    return EXIT_SUCCESS;
  }
  return usage_error("unknown command: " + cmd);
}

} // namespace

int main(int argc, char** argv) try {
  sortfeed::configuration cfg{sortfeed::skip_init};
  try {
    cfg.init(argc, argv);
  } catch (std::exception& ex) {
    std::cerr << "*** error while reading config: " << ex.what() << '\n';
    return EXIT_FAILURE;
  }
  if (cfg.cli_helptext_printed()) {
    std::cout << '\n' << usage_text;
    return EXIT_SUCCESS;
  }
  cfg.init_logger();
  auto& positional = cfg.remainder();
  if (positional.size() < 2)
    return usage_error("expected a feed name and a command");
  auto backend_type = cfg.backend_type();
  sortfeed::internal::log::app::debug("open-backend",
                                      "opening {} backend for feed {}",
                                      backend_type, positional[0]);
  sortfeed::detail::backend_ptr backend =
    sortfeed::detail::make_backend(backend_type, cfg.backend_options());
  if (!backend) {
    std::cerr << "*** unable to open the " << to_string(backend_type)
              << " backend\n";
    return EXIT_FAILURE;
  }
  sorted_feed feed{std::move(backend), positional[0], nullptr, cfg.retry()};
  args_list args{positional.begin() + 2, positional.end()};
  return run(feed, positional[1], args);
} catch (std::exception& ex) {
  std::cerr << "*** exception: " << ex.what() << '\n';
  return EXIT_FAILURE;
}
