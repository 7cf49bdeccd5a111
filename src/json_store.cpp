#include "json_store.h"

#include <errno.h>
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>

#include <fstream>
#include <sstream>

#include "logger.h"
DEFINE_MODULE_LOGGER(StoreLog)

namespace JsonStore {

bool fileExists(const std::string &path) {
  struct stat st;
  return stat(path.c_str(), &st) == 0;
}

bool ensureDir(const std::string &path) {
  if (path.empty()) return false;
  std::string partial;
  size_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find('/', pos + 1);
    partial = path.substr(0, pos);
    if (partial.empty()) continue;
    if (mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
      StoreLog::printf("[Store] mkdir %s failed: %s\n", partial.c_str(), strerror(errno));
      return false;
    }
  }
  return true;
}

bool load(const std::string &path, JsonDocument &doc) {
  doc.clear();
  std::ifstream in(path);
  if (!in.is_open()) return false;
  std::stringstream ss;
  ss << in.rdbuf();
  DeserializationError err = deserializeJson(doc, ss.str());
  if (err) {
    StoreLog::printf("[Store] %s: parse error %s\n", path.c_str(), err.c_str());
    doc.clear();
    return false;
  }
  return true;
}

bool save(const std::string &path, const JsonDocument &doc) {
  std::string out;
  serializeJsonPretty(doc, out);
  std::string tmp = path + ".tmp";
  {
    std::ofstream f(tmp, std::ios::trunc);
    if (!f.is_open()) {
      StoreLog::printf("[Store] cannot open %s: %s\n", tmp.c_str(), strerror(errno));
      return false;
    }
    f << out;
    f.flush();
    if (!f.good()) {
      StoreLog::printf("[Store] write failed on %s\n", tmp.c_str());
      f.close();
      remove(tmp.c_str());
      return false;
    }
  }
  if (rename(tmp.c_str(), path.c_str()) != 0) {
    StoreLog::printf("[Store] rename %s failed: %s\n", tmp.c_str(), strerror(errno));
    remove(tmp.c_str());
    return false;
  }
  return true;
}

bool readLines(const std::string &path, std::vector<std::string> &lines) {
  lines.clear();
  std::ifstream in(path);
  if (!in.is_open()) return false;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty()) lines.push_back(line);
  }
  return true;
}

bool writeLines(const std::string &path, const std::vector<std::string> &lines) {
  std::string tmp = path + ".tmp";
  {
    std::ofstream f(tmp, std::ios::trunc);
    if (!f.is_open()) {
      StoreLog::printf("[Store] cannot open %s: %s\n", tmp.c_str(), strerror(errno));
      return false;
    }
    for (const auto &l : lines) f << l << '\n';
    f.flush();
    if (!f.good()) {
      f.close();
      remove(tmp.c_str());
      StoreLog::printf("[Store] write failed on %s\n", tmp.c_str());
      return false;
    }
  }
  if (rename(tmp.c_str(), path.c_str()) != 0) {
    StoreLog::printf("[Store] rename %s failed: %s\n", tmp.c_str(), strerror(errno));
    remove(tmp.c_str());
    return false;
  }
  return true;
}

bool appendLine(const std::string &path, const std::string &line) {
  std::ofstream f(path, std::ios::app);
  if (!f.is_open()) {
    StoreLog::printf("[Store] cannot append to %s: %s\n", path.c_str(), strerror(errno));
    return false;
  }
  f << line << '\n';
  return f.good();
}

}  // namespace JsonStore
