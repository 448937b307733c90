// LogBus.h
#pragma once
#include <functional>
#include <string>
#include <glm/glm.hpp>

// Gameplay log: every line goes to stdout and, when a sink is attached,
// to the on-screen activity feed.
namespace LogBus {
  using Sink = std::function<void(const std::string& line, const glm::vec3& rgb, float lifetime)>;

  void attach(Sink sink);
  void detach();

  void info(const std::string& s);
  void warn(const std::string& s);
  void error(const std::string& s);
  void colored(const std::string& s, const glm::vec3& rgb, float lifetime=3.f);
}
