#pragma once
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

namespace InkPet {

struct Message {
  int64_t id = 0;
  std::string from;
  std::string text;
  std::string type = "text";
  std::string timestamp;
  bool read = false;
};

// messages.jsonl, one JSON object per line, oldest first.
// The file is re-read on every query since the API process appends to it.
class MessageLog {
public:
  static constexpr size_t MAX_MESSAGES = 50;

  explicit MessageLog(std::string path);

  bool add(const std::string &from, const std::string &text, const std::string &type = "text");
  // Most recent first.
  std::vector<Message> recent(size_t limit = 20, bool unreadOnly = false) const;
  size_t unreadCount() const;
  bool markAllRead();
  bool deleteMessage(int64_t id);
  bool deleteMostRecent();

private:
  // One line of the file; lines that do not parse are written back untouched.
  struct Record {
    bool valid = false;
    Message msg;
    std::string raw;
  };

  std::vector<Record> readRecords() const;
  std::vector<Message> readAll() const;
  bool writeRecords(const std::vector<Record> &records) const;

  std::string _path;
};

}  // namespace InkPet
