#pragma once

#include <chrono>
#include <optional>
#include <string_view>
#include <vector>

#include "writelink/common.hpp"
#include "writelink/core/note.hpp"
#include "writelink/core/note_id.hpp"

namespace writelink::store {

// Abstract interface for note storage
class NoteStore {
 public:
  virtual ~NoteStore() = default;

  // CRUD operations
  virtual Result<writelink::core::Note> create(const writelink::core::Note& note) = 0;
  virtual Result<std::optional<writelink::core::Note>> read(const writelink::core::NoteId& id) = 0;
  virtual Result<writelink::core::Note> update(const writelink::core::Note& note) = 0;
  virtual Result<void> remove(const writelink::core::NoteId& id) = 0;
  virtual Result<bool> exists(const writelink::core::NoteId& id) = 0;

  // Query operations. Results are ordered by modification time, newest first.
  virtual Result<std::vector<writelink::core::Note>> listAll() = 0;
  virtual Result<std::vector<writelink::core::Note>> search(std::string_view query) = 0;
  virtual Result<std::vector<writelink::core::Note>> listModifiedSince(
      std::chrono::system_clock::time_point since) = 0;
};

}  // namespace writelink::store
