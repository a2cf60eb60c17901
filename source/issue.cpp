#include <ticketfs/issue.hpp>

namespace ticketfs {

static const nlohmann::json kEmptyObject = nlohmann::json::object();

static std::string as_text(const nlohmann::json& v) {
  if (v.is_null()) return "";
  if (v.is_string()) return v.get<std::string>();
  return v.dump();
}

IssueSnapshot::IssueSnapshot(std::string key, nlohmann::json raw)
    : key_(std::move(key)), raw_(std::move(raw)) {}

const nlohmann::json& IssueSnapshot::fields() const {
  auto it = raw_.find("fields");
  if (it == raw_.end() || !it->is_object()) return kEmptyObject;
  return *it;
}

std::vector<Attachment> IssueSnapshot::attachments() const {
  std::vector<Attachment> out;
  const auto& f = fields();
  auto it = f.find("attachment");
  if (it == f.end() || !it->is_array()) return out;
  for (const auto& a : *it) out.push_back(a.get<Attachment>());
  return out;
}

std::vector<Comment> IssueSnapshot::comments() const {
  std::vector<Comment> out;
  const auto& f = fields();
  auto it = f.find("comment");
  if (it == f.end() || !it->is_object()) return out;
  auto cs = it->find("comments");
  if (cs == it->end() || !cs->is_array()) return out;
  for (const auto& c : *cs) {
    Comment comment;
    comment.created = as_text(c.value("created", nlohmann::json()));
    const auto author = c.value("author", nlohmann::json());
    if (author.is_object()) {
      comment.author = as_text(author.value("displayName", author.value("name", nlohmann::json())));
    } else {
      comment.author = as_text(author);
    }
    comment.body = as_text(c.value("body", nlohmann::json()));
    out.push_back(std::move(comment));
  }
  return out;
}

void to_json(nlohmann::json& j, const CachedIssueSnapshot& s) {
  j = nlohmann::json{{"options", s.options}, {"raw", s.raw}};
}

void from_json(const nlohmann::json& j, CachedIssueSnapshot& s) {
  s.options = j.at("options");
  s.raw = j.at("raw");
}

void to_json(nlohmann::json& j, const Attachment& a) {
  j = nlohmann::json{{"id", a.id}, {"filename", a.filename}, {"created", a.created}};
}

void from_json(const nlohmann::json& j, Attachment& a) {
  a.id = as_text(j.value("id", nlohmann::json()));
  a.filename = j.at("filename").get<std::string>();
  a.created = as_text(j.value("created", nlohmann::json()));
}

}
