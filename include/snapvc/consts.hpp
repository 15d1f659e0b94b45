#pragma once
#include <cstddef>
#include <string_view>

namespace snapvc::consts {

// Directory and file names
inline constexpr std::string_view kMetaDir     = ".snapvc";
inline constexpr std::string_view kCommitsDir  = "commits";
inline constexpr std::string_view kStagedFile  = "staged";
inline constexpr std::string_view kTrackedFile = "tracked";
inline constexpr std::string_view kHistoryFile = "history";
inline constexpr std::string_view kStatusFile  = "status";
inline constexpr std::string_view kConfigFile  = "config";
inline constexpr std::string_view kLockFile    = "lock";
inline constexpr std::string_view kMessageFile = "COMMIT_MSG";

// Snapshots are assembled under commits/<kTempPrefix><random> then renamed
inline constexpr std::string_view kTempPrefix = ".tmp-";

// Sentinel ref for the last commit
inline constexpr std::string_view kHeadRef = "HEAD";

// ——— Commit id sizes ———
inline constexpr std::size_t kHashRawLen = 20; // 20 bytes (SHA-1)
inline constexpr std::size_t kHashHexLen = 40; // 40 hex chars (SHA-1)
inline constexpr std::size_t kShortHashLen = 7;

// ——— State file record prefixes ———
inline constexpr std::string_view kCommitPrefix = "commit ";
inline constexpr std::string_view kHeadPrefix   = "head: ";

// ——— Common characters ———
inline constexpr char kSpace = ' ';
inline constexpr char kLF    = '\n';

} // namespace snapvc::consts
