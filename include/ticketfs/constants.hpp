#pragma once
#include <string>
#include <set>

namespace ticketfs {

inline const std::string kMetadataDir = ".ticketfs";
inline const std::string kGitDir = "git";
inline const std::string kShadowDir = "shadow";
inline const std::string kExcludesFile = "gitignore";
inline const std::string kVersionFile = "version";
inline const std::string kOperationLog = "operation.log";
inline const std::string kCachedIssueFile = "issue.json";
inline const std::string kRemoteFilesFile = ".ticketfs/remote_files.json";

inline const std::string kTicketDetails = "fields.ticket.rst";
inline const std::string kTicketComments = "comments.read_only.ticket.rst";
inline const std::string kTicketNewComment = "new_comment.ticket.rst";
// "{field_name}" is replaced with the field name.
inline const std::string kFileFieldTemplate = "{field_name}.ticket.rst";

inline const std::string kIgnoreFile = ".ticketfs_ignore";
inline const std::string kRemoteIgnoreFile = ".ticketfs_remote_ignore";

inline const std::string kMasterBranch = "master";
inline const std::string kTrackingBranch = "jira";

inline const std::set<std::string> kFileFields = {"description"};
inline const std::set<std::string> kNoDetailFields = {"attachment", "comment", "watches"};

constexpr int kInitialRepoVersion = 1;
constexpr int kCurrentRepoVersion = 3;

std::string file_field_filename(const std::string& field_name);

}
