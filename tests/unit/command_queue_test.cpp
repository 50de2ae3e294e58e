#include "internal/command/command_queue.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

#include "internal/command/queued_command_publisher.hpp"
#include "internal/util/time.hpp"

namespace {

using fieldwake::command::CommandQueue;
using fieldwake::command::QueuedCommandPublisher;

fieldwake::v1::DeviceCommand Command(const std::string& device_id) {
  fieldwake::v1::DeviceCommand command;
  command.set_device_id(device_id);
  command.set_topic("ESP32CAM/" + device_id + "/cmd");
  return command;
}

void TestFifoOrder() {
  CommandQueue queue(4);
  queue.Push(Command("A"));
  queue.Push(Command("B"));

  assert(queue.Size() == 2);
  assert(queue.Pop(std::chrono::milliseconds(0))->device_id() == "A");
  assert(queue.Pop(std::chrono::milliseconds(0))->device_id() == "B");
  assert(!queue.Pop(std::chrono::milliseconds(10)).has_value());
}

void TestOverflowDropsOldest() {
  CommandQueue queue(2);
  assert(queue.Push(Command("A")));
  assert(queue.Push(Command("B")));
  assert(!queue.Push(Command("C")));

  assert(queue.Dropped() == 1);
  assert(queue.Pop(std::chrono::milliseconds(0))->device_id() == "B");
  assert(queue.Pop(std::chrono::milliseconds(0))->device_id() == "C");
}

void TestShutdownDrainsThenCloses() {
  CommandQueue queue(4);
  queue.Push(Command("A"));
  queue.Shutdown();

  assert(queue.IsShutdown());
  assert(queue.Pop(std::chrono::seconds(5))->device_id() == "A");

  const auto started = std::chrono::steady_clock::now();
  assert(!queue.Pop(std::chrono::seconds(5)).has_value());
  assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(1));
}

void TestPopWakesOnPush() {
  CommandQueue queue(4);
  std::thread  producer([&queue] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.Push(Command("late"));
  });

  auto command = queue.Pop(std::chrono::seconds(5));
  producer.join();
  assert(command.has_value());
  assert(command->device_id() == "late");
}

void TestPublisherRendersFirmwareDirectives() {
  auto                   queue = std::make_shared<CommandQueue>(8);
  const auto             fixed = fieldwake::util::FromUnixMillis(1'700'000'000'000ULL);
  QueuedCommandPublisher publisher(queue, [fixed] { return fixed; });

  publisher.PublishCapture("AABBCCDDEEFF", "AABBCCDDEEFF_1.jpg");
  publisher.PublishMissingFragments("AABBCCDDEEFF", "AABBCCDDEEFF_1.jpg", {2, 5});
  publisher.PublishSleep("AABBCCDDEEFF", "8:00AM");

  auto capture = queue->Pop(std::chrono::milliseconds(0));
  assert(capture->topic() == "ESP32CAM/AABBCCDDEEFF/cmd");
  assert(capture->kind() == fieldwake::v1::COMMAND_KIND_CAPTURE);
  assert(capture->payload_json().find("\"capture_image\":true") != std::string::npos);
  assert(capture->payload_json().find("AABBCCDDEEFF_1.jpg") != std::string::npos);
  assert(fieldwake::util::FromProto(capture->issued_at()) == fixed);

  auto missing = queue->Pop(std::chrono::milliseconds(0));
  assert(missing->kind() == fieldwake::v1::COMMAND_KIND_MISSING_FRAGMENTS);
  assert(missing->payload_json().find("\"missing_chunks\":[2,5]") != std::string::npos);

  auto sleep = queue->Pop(std::chrono::milliseconds(0));
  assert(sleep->kind() == fieldwake::v1::COMMAND_KIND_SLEEP);
  assert(sleep->payload_json().find("\"next_wake\":\"8:00AM\"") != std::string::npos);
}

} // namespace

int main() {
  TestFifoOrder();
  TestOverflowDropsOldest();
  TestShutdownDrainsThenCloses();
  TestPopWakesOnPush();
  TestPublisherRendersFirmwareDirectives();

  std::cout << "fieldwake_unit_command_queue: pass\n";
  return 0;
}
