#pragma once
#include <cstddef>
#include <string_view>

namespace gitling::consts {

// Directory and file names
inline constexpr std::string_view kGitDir         = ".git";
inline constexpr std::string_view kObjectsDir     = "objects";
inline constexpr std::string_view kBranchesDir    = "branches";
inline constexpr std::string_view kRefsDir        = "refs";
inline constexpr std::string_view kHeadsDir       = "refs/heads";
inline constexpr std::string_view kTagsDir        = "refs/tags";
inline constexpr std::string_view kHeadFile       = "HEAD";
inline constexpr std::string_view kConfigFile     = "config";
inline constexpr std::string_view kDescriptionFile = "description";
inline constexpr std::string_view kDefaultBranch  = "master";

inline constexpr std::string_view kDefaultDescription =
    "Unnamed repository; edit this file 'description' to name the repository.\n";

// Object type strings
inline constexpr std::string_view kTypeBlob   = "blob";
inline constexpr std::string_view kTypeTree   = "tree";
inline constexpr std::string_view kTypeCommit = "commit";
inline constexpr std::string_view kTypeTag    = "tag";

// ——— Object ID sizes ———
inline constexpr std::size_t kOidRawLen = 20;  // 20 bytes (SHA-1)
inline constexpr std::size_t kOidHexLen = 40;  // 40 hex chars (SHA-1)

// ——— Object store fanout ———
inline constexpr std::size_t kFanoutDirHexLen = 2; // "aa/" + "bbbb..." in objects/

// ——— Tree leaf grammar ———
inline constexpr std::size_t kModeMinLen = 5;
inline constexpr std::size_t kModeMaxLen = 6;

// ——— Commit header keys ———
inline constexpr std::string_view kTreeKey   = "tree";
inline constexpr std::string_view kParentKey = "parent";
inline constexpr std::string_view kRefPrefix = "ref: ";

// ——— Config ———
inline constexpr std::string_view kCoreSection   = "core";
inline constexpr std::string_view kFormatVersion = "repositoryformatversion";
inline constexpr int kSupportedFormatVersion     = 0;

// ——— Common characters ———
inline constexpr char kSpace = ' ';
inline constexpr char kNul   = '\0';
inline constexpr char kLF    = '\n';

} // namespace gitling::consts
