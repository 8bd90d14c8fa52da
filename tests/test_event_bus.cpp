#include "pv/orchestrator/event_bus.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "pv/crypto/sha256.h"

namespace {

using pv::orchestrator::Event;
using pv::orchestrator::EventBus;
using pv::orchestrator::EventCategory;
using pv::orchestrator::EventField;
using pv::orchestrator::EventSeverity;
using pv::orchestrator::FieldPrivacy;

Event SampleEvent() {
  Event event;
  event.category = EventCategory::kLifecycle;
  event.severity = EventSeverity::kInfo;
  event.event_id = std::string(pv::orchestrator::events::kBackupCreated);
  event.message = "Backup \"created\"";
  event.fields.emplace_back("records", "2", FieldPrivacy::kPublic, true);
  event.fields.emplace_back("record", "grid-7", FieldPrivacy::kHash);
  event.fields.emplace_back("password", "hunter2", FieldPrivacy::kRedact);
  return event;
}

std::vector<std::string> ReadLines(const std::filesystem::path& path) {
  std::ifstream in(path);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  return lines;
}

void TestJson() {
  const auto json = pv::orchestrator::BuildEventJson(SampleEvent(), "2025-01-01T00:00:00.000000Z");
  assert(json.front() == '{' && json.back() == '}');
  assert(json.find("\"ts\":\"2025-01-01T00:00:00.000000Z\"") != std::string::npos);
  assert(json.find("\"event_id\":\"backup.created\"") != std::string::npos);
  assert(json.find("\"category\":\"lifecycle\"") != std::string::npos);
  assert(json.find("Backup \\\"created\\\"") != std::string::npos);
  assert(json.find("\"records\":2") != std::string::npos);
  assert(json.find("grid-7") == std::string::npos);
  assert(json.find(pv::crypto::SHA256_HexDigest("grid-7")) != std::string::npos);
  assert(json.find("hunter2") == std::string::npos);
  assert(json.find("[REDACTED]") != std::string::npos);
}

void TestSubscribersAndReentrancy() {
  pv::orchestrator::ResetEventBusForTesting();
  auto& bus = EventBus::Instance();
  int delivered = 0;
  bus.Subscribe([&delivered, &bus](const Event& event) {
    ++delivered;
    // Publishing from a subscriber is suppressed.
    bus.Publish(event);
  });
  bus.Publish(SampleEvent());
  assert(delivered == 1);
  pv::orchestrator::ResetEventBusForTesting();
  EventBus::Instance().Publish(SampleEvent());
  assert(delivered == 1);
}

void TestFileLogRotation() {
  const auto dir = std::filesystem::temp_directory_path() / "pv_event_bus_test";
  std::filesystem::remove_all(dir);
  const auto log = dir / "backup.jsonl";

  pv::orchestrator::ResetEventBusForTesting();
  auto& bus = EventBus::Instance();
  bus.ConfigureFileLog(log, 600);
  for (int i = 0; i < 12; ++i) {
    bus.Publish(SampleEvent());
  }
  assert(std::filesystem::exists(log));
  assert(std::filesystem::exists(dir / "backup.jsonl.1"));
  assert(!std::filesystem::exists(dir / "backup.jsonl.4"));
  assert(std::filesystem::file_size(log) <= 600);
  for (const auto& line : ReadLines(log)) {
    assert(line.find("\"event_id\":\"backup.created\"") != std::string::npos);
    assert(line.find("hunter2") == std::string::npos);
  }

  bus.ConfigureFileLog({}, 0);
  const auto before = ReadLines(log).size();
  bus.Publish(SampleEvent());
  assert(ReadLines(log).size() == before);

  pv::orchestrator::ResetEventBusForTesting();
  std::filesystem::remove_all(dir);
}

}  // namespace

int main() {
  TestJson();
  TestSubscribersAndReentrancy();
  TestFileLogRotation();
  std::cout << "event bus tests ok\n";
  return 0;
}
