#pragma once

#include <string>
#include <string_view>

#include "writelink/common.hpp"

namespace writelink::core {

// UUID (RFC 4122) identifying a note.
// Canonical form is 36 characters, upper-case hex, hyphenated 8-4-4-4-12.
class NoteId {
 public:
  // Create new random (version 4) UUID
  static NoteId generate();

  // Parse UUID from string (either case accepted, stored canonical)
  static Result<NoteId> fromString(std::string_view str);

  // Default constructor creates invalid ID
  NoteId() = default;

  // Get canonical string representation
  std::string toString() const;

  // Comparison operators
  bool operator==(const NoteId& other) const noexcept;
  bool operator!=(const NoteId& other) const noexcept;
  bool operator<(const NoteId& other) const noexcept;

  // Check if ID is valid
  bool isValid() const noexcept;

  // Hash support for containers
  struct Hash {
    std::size_t operator()(const NoteId& id) const noexcept;
  };

 private:
  explicit NoteId(std::string id);

  // Validate UUID format
  static bool isValidFormat(std::string_view str);

  std::string id_;
};

}  // namespace writelink::core

// Hash specialization for std::unordered_map
namespace std {
template <>
struct hash<writelink::core::NoteId> : writelink::core::NoteId::Hash {};
}  // namespace std
