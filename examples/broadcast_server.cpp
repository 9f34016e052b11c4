#include "pwss.hpp"
#include <algorithm>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

// Shared by the reader threads; each thread holds its own reference.
class ChatRoom {
 public:
  explicit ChatRoom(pwss::Protocol::Ptr outgoing) : outgoing_(std::move(outgoing)) {}

  const pwss::Protocol& outgoing() const { return *outgoing_; }

  size_t join(const std::shared_ptr<pwss::ClientStream>& stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    members_.push_back(stream);
    return members_.size();
  }

  size_t leave(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    members_.erase(std::remove_if(members_.begin(), members_.end(),
                                  [&](const std::weak_ptr<pwss::ClientStream>& weak) {
                                    auto ptr = weak.lock();
                                    return !ptr || ptr->get_id() == id;
                                  }),
                   members_.end());
    return members_.size();
  }

  // Sends outside the lock so a slow peer only delays this relay.
  void broadcast(const pwss::Message& msg) {
    std::vector<std::shared_ptr<pwss::ClientStream>> targets;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (auto& weak : members_) {
        if (auto target = weak.lock()) {
          targets.push_back(std::move(target));
        }
      }
    }
    for (auto& target : targets) {
      (void)target->send(msg);  // a dead peer is reaped by its own reader
    }
  }

 private:
  pwss::Protocol::Ptr outgoing_;
  std::mutex mutex_;
  std::vector<std::weak_ptr<pwss::ClientStream>> members_;
};

}  // namespace

// Chat relay: every Say from one client is broadcast to all clients.
int main(int argc, char* argv[]) {
  uint16_t port = 8080;
  std::string name = "chat";

  if (argc > 1) {
    port = static_cast<uint16_t>(std::stoi(argv[1]));
  }
  if (argc > 2) {
    name = argv[2];
  }

  try {
    auto incoming = pwss::Protocol::Builder("ChatIn")
                        .variant("Join", {pwss::FieldType::kString})
                        .variant("Say", {pwss::FieldType::kString})
                        .build();
    auto outgoing = pwss::Protocol::Builder("ChatOut")
                        .variant("Joined", {pwss::FieldType::kU64, pwss::FieldType::kString})
                        .variant("Said", {pwss::FieldType::kU64, pwss::FieldType::kString})
                        .variant("Left", {pwss::FieldType::kU64})
                        .build();

    pwss::Server server(port, name, incoming, outgoing);
    auto room = std::make_shared<ChatRoom>(outgoing);

    while (auto stream = server.accept()) {
      size_t total = room->join(stream);
      std::cout << "Client #" << stream->get_id() << " connected. (" << total << " total)" << std::endl;

      std::thread([room, stream] {
        uint64_t id = stream->get_id();
        while (auto msg = stream->read()) {
          const pwss::Message& m = msg.value();
          if (m.opcode() == 0) {
            room->broadcast(room->outgoing().make("Joined", id, m.get<std::string>(0)));
          } else {
            room->broadcast(room->outgoing().make("Said", id, m.get<std::string>(0)));
          }
        }
        stream->shutdown();

        size_t remaining = room->leave(id);
        room->broadcast(room->outgoing().make("Left", id));
        std::cout << "Client #" << id << " closed. (" << remaining << " remaining)" << std::endl;
      }).detach();
    }

  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
