#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <chrono>
#include <memory>
#include <optional>

#include "writelink/service/note_service.hpp"
#include "writelink/store/filesystem_store.hpp"
#include "temp_directory.hpp"
#include "test_helpers.hpp"

using namespace writelink::core;
using namespace writelink::service;
using namespace writelink::test;
using writelink::Error;
using writelink::ErrorCode;
using writelink::Result;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;
using namespace std::chrono_literals;

namespace {

class MockNoteStore : public writelink::store::NoteStore {
 public:
  MOCK_METHOD(Result<Note>, create, (const Note& note), (override));
  MOCK_METHOD(Result<std::optional<Note>>, read, (const NoteId& id), (override));
  MOCK_METHOD(Result<Note>, update, (const Note& note), (override));
  MOCK_METHOD(Result<void>, remove, (const NoteId& id), (override));
  MOCK_METHOD(Result<bool>, exists, (const NoteId& id), (override));
  MOCK_METHOD(Result<std::vector<Note>>, listAll, (), (override));
  MOCK_METHOD(Result<std::vector<Note>>, search, (std::string_view query), (override));
  MOCK_METHOD(Result<std::vector<Note>>, listModifiedSince,
              (std::chrono::system_clock::time_point since), (override));
};

Result<Note> echo(const Note& note) {
  return note;
}

}  // namespace

class NoteServiceTest : public ::testing::Test {
 protected:
  NoteServiceTest() : service_(store_, [this] { return now_; }) {}

  ::testing::StrictMock<MockNoteStore> store_;
  std::chrono::system_clock::time_point now_ = testTime(1h);
  NoteService service_;
};

TEST_F(NoteServiceTest, CreateNoteTrimsTitleAndStampsClock) {
  EXPECT_CALL(store_, create(_)).WillOnce(Invoke(echo));

  auto note = service_.createNote("  Weekly review \n", "Body");
  ASSERT_OK(note);
  EXPECT_EQ(note->title(), "Weekly review");
  EXPECT_EQ(note->content(), "Body");
  EXPECT_TRUE(note->id().isValid());
  EXPECT_EQ(note->created(), now_);
  EXPECT_EQ(note->updated(), now_);
}

TEST_F(NoteServiceTest, CreateNoteRejectsBlankTitle) {
  EXPECT_ERROR(service_.createNote("", "content"), ErrorCode::kValidationError);
  EXPECT_ERROR(service_.createNote(" \t\n", "content"), ErrorCode::kValidationError);
}

TEST_F(NoteServiceTest, CreateNotePropagatesStoreError) {
  EXPECT_CALL(store_, create(_))
      .WillOnce(Return(Result<Note>(std::unexpected(Error(ErrorCode::kAlreadyExists, "taken")))));
  EXPECT_ERROR(service_.createNote("Title"), ErrorCode::kAlreadyExists);
}

TEST_F(NoteServiceTest, EditContentStampsUpdatedAt) {
  auto existing = makeNote("Title", "old", testTime());
  EXPECT_CALL(store_, read(existing.id()))
      .WillOnce(Return(Result<std::optional<Note>>(existing)));
  EXPECT_CALL(store_, update(_)).WillOnce(Invoke(echo));

  auto edited = service_.editContent(existing.id(), "new");
  ASSERT_OK(edited);
  EXPECT_EQ(edited->content(), "new");
  EXPECT_EQ(edited->title(), "Title");
  EXPECT_EQ(edited->created(), testTime());
  EXPECT_EQ(edited->updated(), now_);
}

TEST_F(NoteServiceTest, UnchangedEditsDoNotWrite) {
  auto existing = makeNote("Title", "same", testTime());
  EXPECT_CALL(store_, read(existing.id()))
      .Times(3)
      .WillRepeatedly(Return(Result<std::optional<Note>>(existing)));
  // StrictMock fails the test on any update() call

  auto content = service_.editContent(existing.id(), "same");
  ASSERT_OK(content);
  EXPECT_EQ(*content, existing);

  auto title = service_.editTitle(existing.id(), "  Title  ");
  ASSERT_OK(title);
  EXPECT_EQ(*title, existing);

  auto both = service_.edit(existing.id(), "Title", "same");
  ASSERT_OK(both);
  EXPECT_EQ(*both, existing);
}

TEST_F(NoteServiceTest, EditTitleTrims) {
  auto existing = makeNote("Old", "body", testTime());
  EXPECT_CALL(store_, read(existing.id()))
      .WillOnce(Return(Result<std::optional<Note>>(existing)));
  EXPECT_CALL(store_, update(_)).WillOnce(Invoke(echo));

  auto edited = service_.editTitle(existing.id(), " New ");
  ASSERT_OK(edited);
  EXPECT_EQ(edited->title(), "New");
  EXPECT_EQ(edited->content(), "body");
  EXPECT_EQ(edited->updated(), now_);
}

TEST_F(NoteServiceTest, EditTitleRejectsBlankBeforeReading) {
  EXPECT_ERROR(service_.editTitle(NoteId::generate(), "   "), ErrorCode::kValidationError);
  EXPECT_ERROR(service_.edit(NoteId::generate(), "", "content"), ErrorCode::kValidationError);
}

TEST_F(NoteServiceTest, EditBoth) {
  auto existing = makeNote("Old", "old", testTime());
  EXPECT_CALL(store_, read(existing.id()))
      .WillOnce(Return(Result<std::optional<Note>>(existing)));
  EXPECT_CALL(store_, update(_)).WillOnce(Invoke(echo));

  auto edited = service_.edit(existing.id(), "New", "new");
  ASSERT_OK(edited);
  EXPECT_EQ(edited->id(), existing.id());
  EXPECT_EQ(edited->title(), "New");
  EXPECT_EQ(edited->content(), "new");
  EXPECT_EQ(edited->updated(), now_);
}

TEST_F(NoteServiceTest, EditMissingNoteIsNotFound) {
  auto id = NoteId::generate();
  EXPECT_CALL(store_, read(id))
      .Times(3)
      .WillRepeatedly(Return(Result<std::optional<Note>>(std::nullopt)));

  EXPECT_ERROR(service_.editContent(id, "x"), ErrorCode::kNotFound);
  EXPECT_ERROR(service_.editTitle(id, "x"), ErrorCode::kNotFound);

  auto result = service_.edit(id, "x", "y");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code(), ErrorCode::kNotFound);
  EXPECT_EQ(result.error().subject(), id.toString());
}

TEST_F(NoteServiceTest, ReadErrorsPropagate) {
  auto id = NoteId::generate();
  EXPECT_CALL(store_, read(id))
      .WillOnce(Return(Result<std::optional<Note>>(
          std::unexpected(Error(ErrorCode::kDecodingError, "corrupt")))));

  EXPECT_ERROR(service_.getNote(id), ErrorCode::kDecodingError);
}

TEST_F(NoteServiceTest, ReplaceKeepsTimestampsVerbatim) {
  auto incoming = Note(NoteId::generate(), "Synced", "remote", testTime(-24h), testTime(-1h));
  EXPECT_CALL(store_, update(incoming)).WillOnce(Invoke(echo));

  auto replaced = service_.replace(incoming);
  ASSERT_OK(replaced);
  EXPECT_EQ(*replaced, incoming);
}

TEST_F(NoteServiceTest, DeleteForwardsToStore) {
  auto id = NoteId::generate();
  EXPECT_CALL(store_, remove(id))
      .WillOnce(Return(Result<void>()))
      .WillOnce(Return(Result<void>(std::unexpected(Error(ErrorCode::kNotFound, "gone")))));

  EXPECT_OK(service_.deleteNote(id));
  EXPECT_ERROR(service_.deleteNote(id), ErrorCode::kNotFound);
}

TEST_F(NoteServiceTest, QueriesForwardToStore) {
  std::vector<Note> notes = {makeNote("A", "", testTime())};
  EXPECT_CALL(store_, listAll()).WillOnce(Return(Result<std::vector<Note>>(notes)));
  EXPECT_CALL(store_, search(std::string_view("a"))).WillOnce(Return(Result<std::vector<Note>>(notes)));
  EXPECT_CALL(store_, listModifiedSince(testTime()))
      .WillOnce(Return(Result<std::vector<Note>>(std::vector<Note>{})));

  auto all = service_.listNotes();
  ASSERT_OK(all);
  EXPECT_EQ(all->size(), 1u);

  auto found = service_.searchNotes("a");
  ASSERT_OK(found);
  EXPECT_EQ(found->size(), 1u);

  auto since = service_.listModifiedSince(testTime());
  ASSERT_OK(since);
  EXPECT_TRUE(since->empty());
}

// End to end against the real store
class NoteServiceFilesystemTest : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_dir_ = std::make_unique<TempDirectory>();
    auto store = writelink::store::FilesystemStore::open({temp_dir_->path() / "notes", "md"});
    ASSERT_TRUE(store.has_value()) << store.error().message();
    store_ = std::move(*store);
    service_ = std::make_unique<NoteService>(*store_);
  }

  std::unique_ptr<TempDirectory> temp_dir_;
  std::unique_ptr<writelink::store::FilesystemStore> store_;
  std::unique_ptr<NoteService> service_;
};

TEST_F(NoteServiceFilesystemTest, CreateEditDelete) {
  auto created = service_->createNote("Draft", "first");
  ASSERT_OK(created);

  auto edited = service_->editContent(created->id(), "second");
  ASSERT_OK(edited);
  EXPECT_GE(edited->updated(), created->updated());

  auto loaded = service_->getNote(created->id());
  ASSERT_OK(loaded);
  EXPECT_EQ(*loaded, *edited);

  auto found = service_->searchNotes("SECOND");
  ASSERT_OK(found);
  ASSERT_EQ(found->size(), 1u);

  ASSERT_OK(service_->deleteNote(created->id()));
  EXPECT_ERROR(service_->getNote(created->id()), ErrorCode::kNotFound);
}
