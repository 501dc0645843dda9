#pragma once
#include "raptorboost/object_store.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace raptorboost {

enum class AssignNameStatus { Unspecified, Success, AlreadyExists };

struct NameStatus {
  std::string name;
  AssignNameStatus status{AssignNameStatus::Unspecified};
  std::string error; // why the name could not be bound (status Unspecified)
};

// One digest and every name it should appear under.
struct Sha256Filenames {
  std::string sha256sum;
  std::vector<std::string> names;
};

struct AssignNamesResult {
  std::string transfer; // resolved (possibly generated) transfer directory name
  std::vector<NameStatus> statuses;
};

// Relative, '/'-separated, no empty/"."/".." components, no NUL or newline.
auto is_valid_name(std::string_view name) -> bool;
// A single component that is_valid_name accepts.
auto is_valid_transfer_name(std::string_view name) -> bool;

/**
 * Projects complete store objects into per-transfer directory trees:
 *   <base>/transfers/<transfer>/<name>  ->  symlink to complete/<hh>/<hex>
 * Bytes are never copied. Bindings are created with symlink(2), which fails
 * if the name exists, and replaced (force) by renaming a fresh link over the
 * old one, so every name points at exactly one digest at any time.
 */
class TransferNamer {
public:
  explicit TransferNamer(const ContentStore &store);

  [[nodiscard]] auto transfers_dir() const -> std::filesystem::path;
  [[nodiscard]] auto transfer_path(std::string_view transfer) const -> std::filesystem::path;

  // Every digest must be complete (PreconditionFailed) and every name valid
  // (InvalidName) before anything is created. Names are then bound one by
  // one; an existing name or a filesystem error on one name does not stop
  // the others (the failed name is reported Unspecified).
  AssignNamesResult assign_names(const std::optional<std::string> &transfer, bool force,
                                 const std::vector<Sha256Filenames> &entries) const;

  // Digest a name is bound to, if any.
  [[nodiscard]] auto lookup(std::string_view transfer, std::string_view name) const
      -> std::optional<std::string>;

private:
  auto create_generated_transfer() const -> std::string;
  auto bind(const std::filesystem::path &dir, const std::string &name, const std::string &hex,
            bool force) const -> AssignNameStatus;

  const ContentStore &store_;
};

} // namespace raptorboost
