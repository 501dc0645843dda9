#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace raptorboost::consts {

// Directory and file names under the server base directory
inline constexpr std::string_view kCompleteDir = "complete";
inline constexpr std::string_view kPartialDir  = "partial";
inline constexpr std::string_view kTransfersDir = "transfers";
inline constexpr std::string_view kConfigFile  = "raptorboost.conf";

// ——— Digest sizes ———
inline constexpr std::size_t kDigestRawLen = 32;  // 32 bytes (SHA-256)
inline constexpr std::size_t kDigestHexLen = 64;  // 64 hex chars (SHA-256)

// ——— Object store fanout ———
inline constexpr std::size_t kFanoutDirHexLen = 2; // "aa/" + "aabb..." in complete/

// ——— Generated transfer directory names ———
inline constexpr std::string_view kTransferPrefix = "transfer-";

// ——— Network defaults ———
inline constexpr std::string_view kDefaultHost = "::1";
inline constexpr int portNumber = 7272;
inline constexpr std::uint64_t kDefaultMaxFragmentBytes = 64ULL * 1024 * 1024;
inline constexpr std::size_t kClientChunkBytes = 1024 * 1024;

// ——— Protocol ———
inline constexpr std::string_view kHelloLine   = "HELLO 1";
inline constexpr std::string_view kOpVersion   = "OP VERSION";
inline constexpr std::string_view kOpUpload    = "OP UPLOAD ";
inline constexpr std::string_view kOpSend      = "OP SEND";
inline constexpr std::string_view kOpAssign    = "OP ASSIGN ";
inline constexpr std::string_view kTokVersion  = "VERSION ";
inline constexpr std::string_view kTokState    = "STATE ";
inline constexpr std::string_view kTokFirst    = "FIRST ";
inline constexpr std::string_view kTokData     = "DATA ";
inline constexpr std::string_view kTokEnd      = "END";
inline constexpr std::string_view kTokStatus   = "STATUS ";
inline constexpr std::string_view kTokDigest   = "DIGEST ";
inline constexpr std::string_view kTokTransfer = "TRANSFER ";
inline constexpr std::string_view kTokName     = "NAME ";
inline constexpr std::string_view kTokDone     = "DONE";
inline constexpr std::string_view kTokErr      = "ERR ";
inline constexpr std::string_view kNoTransfer  = "-";

} // namespace raptorboost::consts
