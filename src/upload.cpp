#include "raptorboost/upload.hpp"

#include "raptorboost/errors.hpp"
#include "raptorboost/hash.hpp"

#include <type_traits>
#include <utility>

namespace raptorboost {

auto UploadCoordinator::negotiate(const std::vector<std::string> &digests) const
    -> std::vector<FileState> {
  for (const auto &hex : digests) {
    require_sha256_hex(hex);
  }

  std::vector<FileState> out;
  out.reserve(digests.size());
  for (const auto &hex : digests) {
    const auto status = store_.query(hex);
    if (status.state == ObjectState::Complete) {
      out.push_back(FileState{.sha256sum = hex, .state = FileStateResult::Complete, .offset = {}});
    } else {
      out.push_back(FileState{
          .sha256sum = hex, .state = FileStateResult::NeedMoreData, .offset = status.offset});
    }
  }
  return out;
}

void IngestSession::first(std::string_view hex, bool force, std::span<const std::uint8_t> bytes) {
  finalize_active();

  auto writer = store_->open_writer(hex, force);
  if (!writer) {
    slot_ = Discarding{std::string(hex)};
    return;
  }
  writer->append(bytes);
  slot_ = Writing{std::move(*writer)};
}

void IngestSession::data(std::span<const std::uint8_t> bytes) {
  if (auto *w = std::get_if<Writing>(&slot_)) {
    w->writer.append(bytes);
    return;
  }
  if (std::holds_alternative<NoActiveDigest>(slot_)) {
    throw ProtocolError("data fragment without a preceding first marker");
  }
  // Discarding: nothing to store
}

SendStatus IngestSession::finish() {
  finalize_active();
  return last_;
}

void IngestSession::abandon() noexcept { slot_ = NoActiveDigest{}; }

auto IngestSession::active_digest() const -> std::optional<std::string> {
  return std::visit(
      [](const auto &s) -> std::optional<std::string> {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, Writing>) {
          return s.writer.hex();
        } else if constexpr (std::is_same_v<T, Discarding>) {
          return s.hex;
        } else {
          return std::nullopt;
        }
      },
      slot_);
}

void IngestSession::finalize_active() {
  auto slot = std::exchange(slot_, NoActiveDigest{});
  if (auto *w = std::get_if<Writing>(&slot)) {
    last_ = w->writer.finalize() == FinalizeResult::Complete ? SendStatus::Complete
                                                             : SendStatus::ErrorChecksum;
  } else if (std::holds_alternative<Discarding>(slot)) {
    last_ = SendStatus::Complete;
  }
}

} // namespace raptorboost
