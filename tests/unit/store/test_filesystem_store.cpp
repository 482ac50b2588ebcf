#include <gtest/gtest.h>

#include <chrono>
#include <fstream>
#include <iterator>
#include <string>
#include <memory>
#include <thread>
#include <vector>

#include "writelink/core/note_codec.hpp"
#include "writelink/store/filesystem_store.hpp"
#include "temp_directory.hpp"
#include "test_helpers.hpp"

using namespace writelink::core;
using namespace writelink::store;
using namespace writelink::test;
using writelink::ErrorCode;
using namespace std::chrono_literals;

class FilesystemStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_dir_ = std::make_unique<TempDirectory>();
    notes_dir_ = temp_dir_->path() / "notes";

    auto store = FilesystemStore::open({notes_dir_, "md"});
    ASSERT_TRUE(store.has_value()) << store.error().message();
    store_ = std::move(*store);
  }

  void TearDown() override {
    store_.reset();
    temp_dir_.reset();
  }

  std::unique_ptr<TempDirectory> temp_dir_;
  std::filesystem::path notes_dir_;
  std::unique_ptr<FilesystemStore> store_;
};

TEST_F(FilesystemStoreTest, OpenCreatesDirectory) {
  EXPECT_TRUE(std::filesystem::is_directory(notes_dir_));
}

TEST_F(FilesystemStoreTest, OpenFailsOnFile) {
  auto file = temp_dir_->createFile("not_a_dir", "x");
  auto store = FilesystemStore::open({file, "md"});
  ASSERT_FALSE(store.has_value());
  EXPECT_EQ(store.error().code(), ErrorCode::kFileSystemError);
}

TEST_F(FilesystemStoreTest, NotePathUsesCanonicalId) {
  auto id = NoteId::fromString("123e4567-e89b-42d3-a456-426614174000");
  ASSERT_OK(id);
  EXPECT_EQ(store_->getNotePath(*id).filename().string(),
            "123E4567-E89B-42D3-A456-426614174000.md");
  EXPECT_TRUE(store_->getNotePath(*id).parent_path() == notes_dir_);
}

TEST_F(FilesystemStoreTest, CreateThenRead) {
  auto note = makeNote("First", "Hello world", testTime());

  auto created = store_->create(note);
  ASSERT_OK(created);
  EXPECT_EQ(*created, note);

  auto read = store_->read(note.id());
  ASSERT_OK(read);
  ASSERT_TRUE(read->has_value());
  EXPECT_EQ(**read, note);

  // File content is the serialized form
  EXPECT_EQ(readFileContent(store_->getNotePath(note.id())), NoteCodec::serialize(note));
}

TEST_F(FilesystemStoreTest, DuplicateCreateFails) {
  auto note = makeNote("Once", "", testTime());
  ASSERT_OK(store_->create(note));

  auto again = store_->create(note.updatingContent("changed", testTime(1s)));
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error().code(), ErrorCode::kAlreadyExists);
  EXPECT_EQ(again.error().subject(), note.id().toString());

  // Original kept
  auto read = store_->read(note.id());
  ASSERT_OK(read);
  ASSERT_TRUE(read->has_value());
  EXPECT_EQ((*read)->content(), "");
}

TEST_F(FilesystemStoreTest, ReadMissingIsEmpty) {
  auto read = store_->read(NoteId::generate());
  ASSERT_OK(read);
  EXPECT_FALSE(read->has_value());
}

TEST_F(FilesystemStoreTest, ReadCorruptFileIsDecodingError) {
  auto id = NoteId::generate();
  std::filesystem::path path = store_->getNotePath(id);
  {
    std::ofstream file(path);
    file << "not a note";
  }

  auto read = store_->read(id);
  ASSERT_FALSE(read.has_value());
  EXPECT_EQ(read.error().code(), ErrorCode::kDecodingError);
  EXPECT_EQ(read.error().subject(), id.toString());
  EXPECT_EQ(read.error().details().size(), 4u);
}

TEST_F(FilesystemStoreTest, Update) {
  auto note = makeNote("Title", "v1", testTime());
  ASSERT_OK(store_->create(note));

  auto changed = note.updatingContent("v2", testTime(1min));
  auto updated = store_->update(changed);
  ASSERT_OK(updated);
  EXPECT_EQ(*updated, changed);

  auto read = store_->read(note.id());
  ASSERT_OK(read);
  ASSERT_TRUE(read->has_value());
  EXPECT_EQ((*read)->content(), "v2");
  EXPECT_EQ((*read)->created(), testTime());
  EXPECT_EQ((*read)->updated(), testTime(1min));
}

TEST_F(FilesystemStoreTest, UpdateMissingFails) {
  auto note = makeNote("Ghost", "", testTime());
  auto result = store_->update(note);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code(), ErrorCode::kNotFound);
  EXPECT_EQ(result.error().subject(), note.id().toString());

  // Nothing written
  EXPECT_FALSE(std::filesystem::exists(store_->getNotePath(note.id())));
}

TEST_F(FilesystemStoreTest, DeleteThenRead) {
  auto note = makeNote("Doomed", "", testTime());
  ASSERT_OK(store_->create(note));

  ASSERT_OK(store_->remove(note.id()));

  auto read = store_->read(note.id());
  ASSERT_OK(read);
  EXPECT_FALSE(read->has_value());

  EXPECT_ERROR(store_->remove(note.id()), ErrorCode::kNotFound);
}

TEST_F(FilesystemStoreTest, Exists) {
  auto note = makeNote("Here", "", testTime());
  auto before = store_->exists(note.id());
  ASSERT_OK(before);
  EXPECT_FALSE(*before);

  ASSERT_OK(store_->create(note));
  auto after = store_->exists(note.id());
  ASSERT_OK(after);
  EXPECT_TRUE(*after);
}

TEST_F(FilesystemStoreTest, ListAllOrdersNewestFirst) {
  auto oldest = makeNote("Oldest", "", testTime());
  auto newest = makeNote("Newest", "", testTime(2h));
  auto middle = makeNote("Middle", "", testTime(1h));
  ASSERT_OK(store_->create(oldest));
  ASSERT_OK(store_->create(newest));
  ASSERT_OK(store_->create(middle));

  auto notes = store_->listAll();
  ASSERT_OK(notes);
  ASSERT_EQ(notes->size(), 3u);
  EXPECT_EQ((*notes)[0].title(), "Newest");
  EXPECT_EQ((*notes)[1].title(), "Middle");
  EXPECT_EQ((*notes)[2].title(), "Oldest");
}

TEST_F(FilesystemStoreTest, ListAllTiesFollowFileNameOrder) {
  auto a = NoteId::fromString("AAAAAAAA-0000-4000-8000-000000000000");
  auto b = NoteId::fromString("BBBBBBBB-0000-4000-8000-000000000000");
  auto c = NoteId::fromString("CCCCCCCC-0000-4000-8000-000000000000");
  ASSERT_OK(a);
  ASSERT_OK(b);
  ASSERT_OK(c);

  ASSERT_OK(store_->create(Note(*c, "C", "", testTime(), testTime())));
  ASSERT_OK(store_->create(Note(*a, "A", "", testTime(), testTime())));
  ASSERT_OK(store_->create(Note(*b, "B", "", testTime(), testTime())));

  for (int run = 0; run < 3; ++run) {
    auto notes = store_->listAll();
    ASSERT_OK(notes);
    ASSERT_EQ(notes->size(), 3u);
    EXPECT_EQ((*notes)[0].title(), "A");
    EXPECT_EQ((*notes)[1].title(), "B");
    EXPECT_EQ((*notes)[2].title(), "C");
  }
}

TEST_F(FilesystemStoreTest, ListAllSkipsCorruptAndForeignFiles) {
  auto good = makeNote("Good", "fine", testTime());
  ASSERT_OK(store_->create(good));

  {
    std::ofstream corrupt(notes_dir_ / (NoteId::generate().toString() + ".md"));
    corrupt << "---\ntitle: no id\n---\nbody";
  }
  {
    std::ofstream other(notes_dir_ / "readme.txt");
    other << "not a note";
  }
  {
    // Leftover temp file from an interrupted write
    std::ofstream temp(notes_dir_ / ("." + good.id().toString() + ".md.tmp.123456"));
    temp << NoteCodec::serialize(good.updatingTitle("Stale", testTime(1h)));
  }
  std::filesystem::create_directories(notes_dir_ / "subdir.md");

  auto notes = store_->listAll();
  ASSERT_OK(notes);
  ASSERT_EQ(notes->size(), 1u);
  EXPECT_EQ((*notes)[0], good);
}

TEST_F(FilesystemStoreTest, ListAllEmpty) {
  auto notes = store_->listAll();
  ASSERT_OK(notes);
  EXPECT_TRUE(notes->empty());
}

TEST_F(FilesystemStoreTest, ListAllFailsWhenDirectoryVanishes) {
  std::filesystem::remove_all(notes_dir_);
  EXPECT_ERROR(store_->listAll(), ErrorCode::kFileSystemError);
}

TEST_F(FilesystemStoreTest, SearchIsCaseInsensitive) {
  ASSERT_OK(store_->create(makeNote("Groceries", "Buy MILK", testTime())));
  ASSERT_OK(store_->create(makeNote("Work", "Quarterly planning", testTime(1s))));
  ASSERT_OK(store_->create(makeNote("Milk recipes", "Pancakes", testTime(2s))));

  auto milk = store_->search("milk");
  ASSERT_OK(milk);
  ASSERT_EQ(milk->size(), 2u);
  EXPECT_EQ((*milk)[0].title(), "Milk recipes");
  EXPECT_EQ((*milk)[1].title(), "Groceries");

  auto planning = store_->search("PLANNING");
  ASSERT_OK(planning);
  ASSERT_EQ(planning->size(), 1u);
  EXPECT_EQ((*planning)[0].title(), "Work");

  auto none = store_->search("nothing matches");
  ASSERT_OK(none);
  EXPECT_TRUE(none->empty());
}

TEST_F(FilesystemStoreTest, EmptySearchReturnsEverything) {
  ASSERT_OK(store_->create(makeNote("One", "", testTime())));
  ASSERT_OK(store_->create(makeNote("Two", "", testTime(1s))));

  auto all = store_->search("");
  ASSERT_OK(all);
  EXPECT_EQ(all->size(), 2u);
}

TEST_F(FilesystemStoreTest, ListModifiedSinceIsStrict) {
  ASSERT_OK(store_->create(makeNote("Before", "", testTime(-1s))));
  ASSERT_OK(store_->create(makeNote("Exactly", "", testTime())));
  ASSERT_OK(store_->create(makeNote("After", "", testTime(1ms))));

  auto modified = store_->listModifiedSince(testTime());
  ASSERT_OK(modified);
  ASSERT_EQ(modified->size(), 1u);
  EXPECT_EQ((*modified)[0].title(), "After");
}

TEST_F(FilesystemStoreTest, CustomExtension) {
  auto store = FilesystemStore::open({temp_dir_->path() / "txt_notes", "txt"});
  ASSERT_OK(store);

  auto note = makeNote("Text", "", testTime());
  ASSERT_OK((*store)->create(note));
  EXPECT_EQ((*store)->getNotePath(note.id()).extension().string(), ".txt");

  auto notes = (*store)->listAll();
  ASSERT_OK(notes);
  EXPECT_EQ(notes->size(), 1u);
}

TEST_F(FilesystemStoreTest, ConcurrentUpdatesStayConsistent) {
  auto note = makeNote("Shared", "v0", testTime());
  ASSERT_OK(store_->create(note));

  constexpr int kThreads = 8;
  constexpr int kWritesPerThread = 20;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([this, &note, t] {
      for (int i = 0; i < kWritesPerThread; ++i) {
        auto content = "thread " + std::to_string(t) + " write " + std::to_string(i);
        auto result = store_->update(note.updatingContent(content, testTime(1s)));
        EXPECT_TRUE(result.has_value());
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  // Whatever write won, the file decodes cleanly and no temp files remain
  auto read = store_->read(note.id());
  ASSERT_OK(read);
  ASSERT_TRUE(read->has_value());
  EXPECT_EQ((*read)->content().rfind("thread ", 0), 0u);

  auto files = std::distance(std::filesystem::directory_iterator(notes_dir_),
                             std::filesystem::directory_iterator{});
  EXPECT_EQ(files, 1);
}
