#pragma once
#include <ArduinoJson.h>
#include <string>
#include <vector>

// Small file helpers shared by the state providers.
namespace JsonStore {
  // false if the file is missing or not valid JSON (doc is left empty).
  bool load(const std::string &path, JsonDocument &doc);
  // Writes <path>.tmp then renames over path.
  bool save(const std::string &path, const JsonDocument &doc);

  bool readLines(const std::string &path, std::vector<std::string> &lines);
  bool writeLines(const std::string &path, const std::vector<std::string> &lines);
  bool appendLine(const std::string &path, const std::string &line);

  bool fileExists(const std::string &path);
  bool ensureDir(const std::string &path);
}
