#pragma once
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ticketfs {

struct Attachment {
  std::string id;
  std::string filename;
  // Change token; the tracker's creation timestamp.
  std::string created;
};

struct Comment {
  std::string created;
  std::string author;
  std::string body;
};

// Remote issue as returned by the tracker. Everything is derived from `raw`,
// so a snapshot restored from disk behaves exactly like a fetched one.
class IssueSnapshot {
public:
  IssueSnapshot() = default;
  IssueSnapshot(std::string key, nlohmann::json raw);

  const std::string& key() const { return key_; }
  const nlohmann::json& raw() const { return raw_; }
  const nlohmann::json& fields() const;

  std::vector<Attachment> attachments() const;
  std::vector<Comment> comments() const;

private:
  std::string key_;
  nlohmann::json raw_ = nlohmann::json::object();
};

// Persisted as {"options": ..., "raw": ...}.
struct CachedIssueSnapshot {
  nlohmann::json options = nlohmann::json::object();
  nlohmann::json raw = nlohmann::json::object();
};

void to_json(nlohmann::json& j, const CachedIssueSnapshot& s);
void from_json(const nlohmann::json& j, CachedIssueSnapshot& s);
void to_json(nlohmann::json& j, const Attachment& a);
void from_json(const nlohmann::json& j, Attachment& a);

class IssueTrackerClient {
public:
  virtual ~IssueTrackerClient() = default;

  virtual IssueSnapshot issue(const std::string& key) = 0;
  virtual std::string attachment_content(const Attachment& attachment) = 0;
  virtual Attachment add_attachment(const std::string& key,
                                    const std::string& filename,
                                    const std::string& content) = 0;
  virtual void delete_attachment(const Attachment& attachment) = 0;
  // `fields` is a JSON object of field name -> new value.
  virtual void update(const std::string& key, const nlohmann::json& fields) = 0;
  virtual void add_comment(const std::string& key, const std::string& body) = 0;

  // Connection options recorded alongside cached snapshots.
  virtual nlohmann::json options() const { return nlohmann::json::object(); }
};

}
