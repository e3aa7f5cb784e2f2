#pragma once
#include <zmq.h>
#include <iostream>
#include <string>

/**
 * @brief ZeroMQ control command responder
 *
 * Receives operator commands as JSON and sends the replies produced by
 * ControlAPI::handle_command(). Every recv() must be followed by exactly
 * one reply().
 */
struct ControlRep {
  void* ctx{nullptr};  ///< ZeroMQ context
  void* rep{nullptr};  ///< ZeroMQ REP socket

private:
  std::string bind_address_;
  bool bound_{false};

public:
  /**
   * @brief Constructor - creates and binds responder socket
   * @param endpoint ZeroMQ endpoint to bind
   */
  explicit ControlRep(const std::string& endpoint = "tcp://127.0.0.1:5555")
    : bind_address_(endpoint) {
    ctx = zmq_ctx_new();
    rep = zmq_socket(ctx, ZMQ_REP);
    int linger = 0;
    zmq_setsockopt(rep, ZMQ_LINGER, &linger, sizeof(linger));
    int rc = zmq_bind(rep, endpoint.c_str());
    bound_ = (rc == 0);
    if (!bound_) {
      std::cerr << "ControlRep: bind to " << endpoint << " failed: " << zmq_strerror(zmq_errno()) << std::endl;
    }
  }

  /**
   * @brief Destructor - cleanup ZeroMQ resources
   */
  ~ControlRep() {
    zmq_close(rep);
    zmq_ctx_term(ctx);
  }

  ControlRep(const ControlRep&) = delete;
  ControlRep& operator=(const ControlRep&) = delete;

  bool is_connected() const { return bound_; }
  const std::string& get_bind_address() const { return bind_address_; }

  /**
   * @brief Wait for a pending command
   * @param timeout_ms Poll timeout in milliseconds
   * @return true if recv() will not block
   */
  bool poll(int timeout_ms) {
    if (!bound_) return false;
    zmq_pollitem_t items[] = {{rep, 0, ZMQ_POLLIN, 0}};
    int rc = zmq_poll(items, 1, timeout_ms);
    return rc > 0 && (items[0].revents & ZMQ_POLLIN);
  }

  /**
   * @brief Receive command (blocking)
   * @return Received JSON string. Caller must reply.
   */
  std::string recv() {
    zmq_msg_t msg;
    zmq_msg_init(&msg);
    int n = zmq_msg_recv(&msg, rep, 0);
    std::string s;
    if (n > 0) {
      s.assign(static_cast<const char*>(zmq_msg_data(&msg)), zmq_msg_size(&msg));
    }
    zmq_msg_close(&msg);
    return s;
  }

  /**
   * @brief Send reply to received command
   * @param s Response string (typically JSON)
   * @return false if the send failed
   */
  bool reply(const std::string& s) {
    return zmq_send(rep, s.data(), s.size(), 0) >= 0;
  }
};
