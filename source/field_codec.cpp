#include <ticketfs/field_codec.hpp>
#include <ticketfs/constants.hpp>
#include <ticketfs/util.hpp>

#include <fmt/format.h>

#include <cctype>
#include <sstream>

namespace ticketfs {

static const std::string kMargin = "    ";

static void write_block(std::ostringstream& out, const std::string& header, const std::string& text) {
  out << header << "::\n\n";
  for (const auto& line : split_lines(normalize_newlines(text))) {
    out << kMargin << line << '\n';
  }
  if (text.empty()) out << kMargin << '\n';
  out << '\n';
}

static bool is_header(const std::string& line) {
  if (line.size() < 3 || line.compare(line.size() - 2, 2, "::") != 0) return false;
  for (char c : line) {
    if (std::isspace(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

FieldMap FieldCodec::parse(const FileTree& files) const {
  return parse([&files](const std::string& name) -> std::optional<std::string> {
    auto it = files.find(name);
    if (it == files.end()) return std::nullopt;
    return it->second;
  });
}

RstFieldCodec::RstFieldCodec() : RstFieldCodec(kFileFields, kNoDetailFields) {}

RstFieldCodec::RstFieldCodec(std::set<std::string> file_fields, std::set<std::string> no_detail_fields)
    : file_fields_(std::move(file_fields)), no_detail_fields_(std::move(no_detail_fields)) {}

std::string RstFieldCodec::render_value(const nlohmann::json& value) {
  if (value.is_null()) return "";
  if (value.is_string()) return strip(normalize_newlines(value.get<std::string>()));
  return value.dump();
}

FileTree RstFieldCodec::render(const IssueSnapshot& issue) const {
  FileTree files;
  std::ostringstream details;

  // nlohmann::json objects iterate in key order.
  for (const auto& [name, raw_value] : issue.fields().items()) {
    if (file_fields_.count(name)) {
      files[file_field_filename(name)] = render_value(raw_value) + "\n";
      continue;
    }
    if (no_detail_fields_.count(name)) continue;
    write_block(details, name, render_value(raw_value));
  }
  files[kTicketDetails] = details.str();

  std::ostringstream comments;
  for (const auto& c : issue.comments()) {
    write_block(comments, fmt::format("{}: {}", c.created, c.author), c.body);
  }
  files[kTicketComments] = comments.str();
  return files;
}

FieldMap RstFieldCodec::parse_details(const std::string& text) {
  FieldMap fields;
  std::optional<std::string> current;
  std::string value;

  auto flush = [&]() {
    if (current) fields[*current] = strip(value);
    value.clear();
  };

  for (const auto& line : split_lines(normalize_newlines(text))) {
    if (is_header(line)) {
      flush();
      current = line.substr(0, line.size() - 2);
      continue;
    }
    if (!current) continue;
    if (line.compare(0, kMargin.size(), kMargin) == 0) {
      value += line.substr(kMargin.size());
    } else {
      value += strip(line);
    }
    value += '\n';
  }
  flush();
  return fields;
}

FieldMap RstFieldCodec::parse(const FileReader& read) const {
  FieldMap fields;
  if (auto details = read(kTicketDetails)) fields = parse_details(*details);
  for (const auto& name : file_fields_) {
    if (auto content = read(file_field_filename(name))) {
      fields[name] = strip(normalize_newlines(*content));
    }
  }
  return fields;
}

std::string file_field_filename(const std::string& field_name) {
  std::string out = kFileFieldTemplate;
  const std::string placeholder = "{field_name}";
  auto pos = out.find(placeholder);
  if (pos != std::string::npos) out.replace(pos, placeholder.size(), field_name);
  return out;
}

}
