// LogBus.cpp
#include "LogBus.h"
#include <iostream>
#include <utility>

static LogBus::Sink g_sink;

void LogBus::attach(Sink sink){ g_sink = std::move(sink); }
void LogBus::detach(){ g_sink = nullptr; }

static void push(const std::string& s, const glm::vec3& c, float life=3.f){
  if (g_sink) g_sink(s, c, life);
  std::cout << s << "\n";
}

void LogBus::info (const std::string& s){ push(s, {1,1,1}); }
void LogBus::warn (const std::string& s){ push("[WARN] "  + s, {1,0.9f,0.2f}); }
void LogBus::error(const std::string& s){ push("[ERROR] " + s, {1,0.3f,0.3f}, 5.f); }
void LogBus::colored(const std::string& s, const glm::vec3& rgb, float life){ push(s, rgb, life); }
