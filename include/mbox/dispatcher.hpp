#ifndef MBOX_DISPATCHER_HPP_
#define MBOX_DISPATCHER_HPP_

#include "protocol.hpp"
#include "response_builder.hpp"
#include "store.hpp"
#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

namespace mbox {

// ============================================================================
// Dispatcher - decoded frame -> handler -> response
// ============================================================================
//
// Stateless apart from the Store reference; one instance may serve any
// number of connections. Handlers are looked up in a table indexed by the
// request code.

class Dispatcher {
 public:
  explicit Dispatcher(Store& store) : store_(store) {}

  // Decode the payload for `header`, run the handler and encode the result.
  // Never throws; any failure becomes an error response.
  Response dispatch(const RequestHeader& header, const uint8_t* payload, size_t len) noexcept;

  // Run the handler for an already decoded request.
  HandlerResult handle(const Request& request);

 private:
  using Handler = HandlerResult (*)(Store& store, const Request& request);

  struct HandlerEntry {
    RequestCode code;
    Handler handler;
    bool requires_identity;  // caller id must name a registered client
  };

  static const HandlerEntry* find_handler(RequestCode code);

  static HandlerResult on_register(Store& store, const Request& request);
  static HandlerResult on_client_list(Store& store, const Request& request);
  static HandlerResult on_public_key(Store& store, const Request& request);
  static HandlerResult on_send_message(Store& store, const Request& request);
  static HandlerResult on_pending_messages(Store& store, const Request& request);

  static const HandlerEntry kHandlers[];

  Store& store_;
};

}  // namespace mbox

#endif  // MBOX_DISPATCHER_HPP_
