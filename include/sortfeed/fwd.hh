#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

namespace sortfeed {

// -- PODs ---------------------------------------------------------------------

struct feed_event;
struct feed_keys;
struct message;
struct retry_options;

// -- classes ------------------------------------------------------------------

class channel_hub;
class configuration;
class error;
class event;
class event_observer;
class event_sink;
class sorted_feed;
class subscriber;

// -- templates ----------------------------------------------------------------

template <class T>
class expected;

// -- enum classes -------------------------------------------------------------

enum class backend : uint8_t;
enum class ec : uint8_t;
enum class insert_position : uint8_t;

// -- aliases ------------------------------------------------------------------

/// Identifies a single item within a feed.
using item_id = uint64_t;

/// Modification counter of a single store key.
using version_type = uint64_t;

using backend_options = std::unordered_map<std::string, std::string>;

using event_sink_ptr = std::shared_ptr<event_sink>;

using event_observer_ptr = std::shared_ptr<event_observer>;

} // namespace sortfeed

namespace sortfeed::detail {

class abstract_backend;
class exponential_backoff_retry_policy;
class flare;
class id_allocator;
class item_store;
class order_store;
class shared_message_queue;
class transaction;

using backend_ptr = std::shared_ptr<abstract_backend>;

} // namespace sortfeed::detail
