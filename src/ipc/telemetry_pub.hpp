#pragma once
#include <zmq.h>
#include <iostream>
#include <mutex>
#include <string>

/**
 * @brief ZeroMQ status publisher
 *
 * Publishes status snapshots as JSON messages on the "status" topic.
 * send() may be called from the scheduler thread, the interlock trip
 * callback and the main thread; a ZeroMQ socket is not thread-safe, so
 * sends are serialised.
 *
 * Message format: see StatusSnapshot::to_json()
 */
struct TelemetryPub {
  void* ctx{nullptr};  ///< ZeroMQ context
  void* pub{nullptr};  ///< ZeroMQ PUB socket
  std::string topic{"status"};

private:
  std::string bind_address_;
  bool bound_{false};
  std::mutex send_mutex_;

public:
  /**
   * @brief Constructor - creates and binds publisher socket
   * @param endpoint ZeroMQ endpoint to bind
   */
  explicit TelemetryPub(const std::string& endpoint = "tcp://127.0.0.1:5556")
    : bind_address_(endpoint) {
    ctx = zmq_ctx_new();
    pub = zmq_socket(ctx, ZMQ_PUB);
    int linger = 0;
    zmq_setsockopt(pub, ZMQ_LINGER, &linger, sizeof(linger));
    int rc = zmq_bind(pub, endpoint.c_str());
    bound_ = (rc == 0);
    if (!bound_) {
      std::cerr << "TelemetryPub: bind to " << endpoint << " failed: " << zmq_strerror(zmq_errno()) << std::endl;
    }
  }

  /**
   * @brief Destructor - cleanup ZeroMQ resources
   */
  ~TelemetryPub() {
    zmq_close(pub);
    zmq_ctx_term(ctx);
  }

  TelemetryPub(const TelemetryPub&) = delete;
  TelemetryPub& operator=(const TelemetryPub&) = delete;

  bool is_connected() const { return bound_; }
  const std::string& get_bind_address() const { return bind_address_; }

  /**
   * @brief Send one message on the status topic
   * @param s JSON string to send
   * @return false if the socket is unbound or the send failed
   */
  bool send(const std::string& s) {
    if (!bound_) return false;
    std::lock_guard<std::mutex> lock(send_mutex_);
    if (zmq_send(pub, topic.data(), topic.size(), ZMQ_SNDMORE) < 0) return false;
    return zmq_send(pub, s.data(), s.size(), 0) >= 0;
  }
};
