#pragma once
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>

#include <ticketfs/issue.hpp>

namespace ticketfs {

using FileTree = std::map<std::string, std::string>;
using FieldMap = std::map<std::string, std::string>;

class FieldCodec {
public:
  using FileReader = std::function<std::optional<std::string>(const std::string& filename)>;

  virtual ~FieldCodec() = default;

  virtual FileTree render(const IssueSnapshot& issue) const = 0;
  // Recovers the locally editable fields; `read` yields nullopt for absent files.
  virtual FieldMap parse(const FileReader& read) const = 0;

  FieldMap parse(const FileTree& files) const;
};

// Indented "name::" block format, one file per file-valued field and a
// read-only comment transcript.
class RstFieldCodec : public FieldCodec {
public:
  RstFieldCodec();
  RstFieldCodec(std::set<std::string> file_fields, std::set<std::string> no_detail_fields);

  FileTree render(const IssueSnapshot& issue) const override;
  FieldMap parse(const FileReader& read) const override;
  using FieldCodec::parse;

  static std::string render_value(const nlohmann::json& value);
  static FieldMap parse_details(const std::string& text);

private:
  std::set<std::string> file_fields_;
  std::set<std::string> no_detail_fields_;
};

}
