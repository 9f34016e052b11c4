#include "pwss.hpp"
#include <algorithm>
#include <cstdint>
#include <iostream>
#include <limits>
#include <string>
#include <thread>

// Echoes every decoded message back to its sender.
int main(int argc, char* argv[]) {
  uint16_t port = 8080;
  std::string name = "echo";

  if (argc > 1) {
    port = static_cast<uint16_t>(std::stoi(argv[1]));
  }
  if (argc > 2) {
    name = argv[2];
  }

  try {
    auto incoming = pwss::Protocol::Builder("EchoIn")
                        .variant("Ping")
                        .variant("Say", {pwss::FieldType::kString})
                        .variant("Add", {pwss::FieldType::kI32, pwss::FieldType::kI32})
                        .build();
    auto outgoing = pwss::Protocol::Builder("EchoOut")
                        .variant("Pong")
                        .variant("Said", {pwss::FieldType::kString})
                        .variant("Sum", {pwss::FieldType::kI32})
                        .build();

    pwss::Server server(port, name, incoming, outgoing);

    while (auto stream = server.accept()) {
      std::cout << "Client #" << stream->get_id() << " connected to " << stream->path() << std::endl;

      std::thread([stream, outgoing] {
        while (auto msg = stream->read()) {
          const pwss::Message& m = msg.value();
          pwss::Message reply;
          switch (m.opcode()) {
            case 0:
              reply = outgoing->make("Pong");
              break;
            case 1:
              reply = outgoing->make("Said", m.get<std::string>(0));
              break;
            case 2: {
              // Saturate rather than overflow.
              int64_t sum = static_cast<int64_t>(m.get<int32_t>(0)) + m.get<int32_t>(1);
              sum = std::max<int64_t>(std::min<int64_t>(sum, std::numeric_limits<int32_t>::max()),
                                      std::numeric_limits<int32_t>::min());
              reply = outgoing->make("Sum", sum);
              break;
            }
            default:
              continue;
          }
          auto r = stream->send(reply);
          if (!r) {
            std::cerr << "Client #" << stream->get_id() << " send failed: " << pwss::error_string(r.get_error())
                      << std::endl;
            break;
          }
        }
        std::cout << "Client #" << stream->get_id() << " closed ("
                  << pwss::error_string(stream->last_error()) << ")" << std::endl;
        stream->shutdown();
      }).detach();
    }

  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
