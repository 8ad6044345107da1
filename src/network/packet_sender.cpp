// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/packet_sender.hpp"

#include "util/logging.hpp"

#include <asio.hpp>

namespace lanwake {
namespace network {

std::string UdpBroadcastSender::send(const std::string& address, uint16_t port, const uint8_t* data, size_t len) {
  try {
    asio::io_context io;

    asio::error_code ec;
    auto ip = asio::ip::make_address(address, ec);
    if (ec) {
      return "invalid destination address '" + address + "'";
    }
    asio::ip::udp::endpoint destination(ip, port);

    asio::ip::udp::socket socket(io);
    socket.open(destination.protocol(), ec);
    if (ec) {
      return "socket: " + ec.message();
    }
    if (ip.is_v4()) {
      socket.set_option(asio::socket_base::broadcast(true), ec);
      if (ec) {
        return "SO_BROADCAST: " + ec.message();
      }
    }

    size_t sent = socket.send_to(asio::buffer(data, len), destination, 0, ec);
    if (ec) {
      return "sendto " + address + ":" + std::to_string(port) + ": " + ec.message();
    }
    if (sent != len) {
      return "short send (" + std::to_string(sent) + " of " + std::to_string(len) + " bytes)";
    }
    return {};
  } catch (const std::exception& e) {
    LOG_WOL_ERROR("UdpBroadcastSender: unexpected exception sending to {}:{}: {}", address, port, e.what());
    return e.what();
  }
}

}  // namespace network
}  // namespace lanwake
