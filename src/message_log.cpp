#include "message_log.h"

#include <time.h>

#include <algorithm>
#include <chrono>
#include <iterator>
#include <utility>

#include "json_store.h"
#include "logger.h"
DEFINE_MODULE_LOGGER(StoreLog)

namespace {

bool parseMessage(const std::string &line, InkPet::Message &msg) {
  DynamicJsonDocument doc(line.size() * 2 + 256);
  if (deserializeJson(doc, line) || !doc.is<JsonObject>()) return false;
  msg.id        = doc["id"] | static_cast<int64_t>(0);
  msg.from      = doc["from"] | "Unknown";
  msg.text      = doc["message"] | "";
  msg.type      = doc["type"] | "text";
  msg.timestamp = doc["timestamp"] | "";
  msg.read      = doc["read"] | false;
  return true;
}

std::string encodeMessage(const InkPet::Message &msg) {
  DynamicJsonDocument doc(msg.from.size() + msg.text.size() + msg.type.size() +
                          msg.timestamp.size() + 256);
  doc["id"] = msg.id;
  doc["from"] = msg.from;
  doc["message"] = msg.text;
  doc["type"] = msg.type;
  doc["timestamp"] = msg.timestamp;
  doc["read"] = msg.read;
  std::string out;
  serializeJson(doc, out);
  return out;
}

}  // namespace

namespace InkPet {

MessageLog::MessageLog(std::string path) : _path(std::move(path)) {}

std::vector<MessageLog::Record> MessageLog::readRecords() const {
  std::vector<std::string> lines;
  std::vector<Record> out;
  if (!JsonStore::readLines(_path, lines)) return out;
  out.reserve(lines.size());
  for (auto &line : lines) {
    Record rec;
    rec.valid = parseMessage(line, rec.msg);
    if (!rec.valid) {
      StoreLog::debugf("[Messages] unreadable line in %s kept as is\n", _path.c_str());
      rec.raw = std::move(line);
    }
    out.push_back(std::move(rec));
  }
  return out;
}

std::vector<Message> MessageLog::readAll() const {
  std::vector<Message> out;
  for (auto &rec : readRecords()) {
    if (rec.valid) out.push_back(std::move(rec.msg));
  }
  return out;
}

bool MessageLog::writeRecords(const std::vector<Record> &records) const {
  std::vector<std::string> lines;
  lines.reserve(records.size());
  for (const auto &rec : records) lines.push_back(rec.valid ? encodeMessage(rec.msg) : rec.raw);
  return JsonStore::writeLines(_path, lines);
}

bool MessageLog::add(const std::string &from, const std::string &text, const std::string &type) {
  Message msg;
  auto now = std::chrono::system_clock::now();
  msg.id = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
  msg.from = from;
  msg.text = text;
  msg.type = type;
  time_t t = std::chrono::system_clock::to_time_t(now);
  struct tm tmInfo;
  gmtime_r(&t, &tmInfo);
  char buf[32];
  strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tmInfo);
  msg.timestamp = buf;

  if (!JsonStore::appendLine(_path, encodeMessage(msg))) return false;

  std::vector<Record> records = readRecords();
  size_t valid = static_cast<size_t>(std::count_if(records.begin(), records.end(),
                                                   [](const Record &r) { return r.valid; }));
  if (valid <= MAX_MESSAGES) return true;
  auto cut = records.begin();
  while (valid > MAX_MESSAGES) {
    if (cut->valid) valid--;
    ++cut;
  }
  records.erase(records.begin(), cut);
  return writeRecords(records);
}

std::vector<Message> MessageLog::recent(size_t limit, bool unreadOnly) const {
  std::vector<Message> all = readAll();
  std::vector<Message> out;
  for (auto it = all.rbegin(); it != all.rend() && out.size() < limit; ++it) {
    if (unreadOnly && it->read) continue;
    out.push_back(*it);
  }
  return out;
}

size_t MessageLog::unreadCount() const {
  std::vector<Message> all = readAll();
  return static_cast<size_t>(std::count_if(all.begin(), all.end(),
                                           [](const Message &m) { return !m.read; }));
}

bool MessageLog::markAllRead() {
  std::vector<Record> records = readRecords();
  if (records.empty()) return true;
  for (auto &rec : records) rec.msg.read = true;
  return writeRecords(records);
}

bool MessageLog::deleteMessage(int64_t id) {
  std::vector<Record> records = readRecords();
  auto end = std::remove_if(records.begin(), records.end(),
                            [id](const Record &r) { return r.valid && r.msg.id == id; });
  if (end == records.end()) return false;
  records.erase(end, records.end());
  return writeRecords(records);
}

bool MessageLog::deleteMostRecent() {
  std::vector<Record> records = readRecords();
  auto it = std::find_if(records.rbegin(), records.rend(), [](const Record &r) { return r.valid; });
  if (it == records.rend()) return false;
  records.erase(std::next(it).base());
  return writeRecords(records);
}

}  // namespace InkPet
