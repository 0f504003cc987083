#include <gtest/gtest.h>

#include "markdd/edit/file_persistence.hpp"
#include "markdd/core/text_buffer.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>

using markdd::edit::FileSaveCollaborator;

namespace
{

class TempDirectory
{
public:
    TempDirectory()
    {
        std::random_device rd;
        std::mt19937_64 rng(rd());
        std::uniform_int_distribution<std::uint64_t> dist;
        path = std::filesystem::temp_directory_path() / ("markdd_edit_test_" + std::to_string(dist(rng)));
        std::filesystem::create_directories(path);
    }

    ~TempDirectory()
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path path;
};

std::string readAll(const std::filesystem::path &path)
{
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

} // namespace

TEST(FilePersistence, LoadsExistingFiles)
{
    TempDirectory dir;
    auto file = dir.path / "notes.md";
    {
        std::ofstream out(file, std::ios::binary);
        out << "# Notes\n- item\n";
    }

    auto loaded = markdd::edit::loadTextFile(file);
    ASSERT_TRUE(loaded.ok());
    EXPECT_EQ(*loaded.content, "# Notes\n- item\n");
}

TEST(FilePersistence, ReportsMissingFiles)
{
    TempDirectory dir;
    auto loaded = markdd::edit::loadTextFile(dir.path / "missing.md");
    EXPECT_FALSE(loaded.ok());
    EXPECT_NE(std::string::npos, loaded.error.find("missing.md"));
}

TEST(FilePersistence, RecognisesMarkdownExtensions)
{
    EXPECT_TRUE(markdd::edit::isMarkdownFileName("README.md"));
    EXPECT_TRUE(markdd::edit::isMarkdownFileName("docs/Guide.MARKDOWN"));
    EXPECT_FALSE(markdd::edit::isMarkdownFileName("notes.txt"));
    EXPECT_FALSE(markdd::edit::isMarkdownFileName("md"));
}

TEST(FileSaveCollaborator, WritesToTheCurrentFile)
{
    TempDirectory dir;
    auto file = dir.path / "doc.md";
    FileSaveCollaborator collaborator;

    auto result = collaborator.save(file.string(), "hello");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.filePath.value_or(""), file.string());
    EXPECT_EQ(readAll(file), "hello");
}

TEST(FileSaveCollaborator, AsksForANameWhenUntitled)
{
    TempDirectory dir;
    auto file = dir.path / "chosen.md";
    int prompts = 0;
    FileSaveCollaborator collaborator([&](const std::optional<std::string> &suggestion) -> std::optional<std::string> {
        ++prompts;
        EXPECT_FALSE(suggestion.has_value());
        return file.string();
    });

    auto result = collaborator.save(std::nullopt, "text");
    EXPECT_EQ(1, prompts);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.filePath.value_or(""), file.string());
}

TEST(FileSaveCollaborator, CancelledPromptIsNotAnError)
{
    FileSaveCollaborator collaborator([](const std::optional<std::string> &) -> std::optional<std::string> {
        return std::nullopt;
    });

    auto result = collaborator.save(std::nullopt, "text");
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error.has_value());
}

TEST(FileSaveCollaborator, ReportsWriteFailures)
{
    TempDirectory dir;
    FileSaveCollaborator collaborator;
    auto result = collaborator.save((dir.path / "no" / "such" / "dir" / "doc.md").string(), "text");
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_NE(std::string::npos, result.error->find("doc.md"));
}

TEST(FileSaveCollaborator, BufferSaveClearsTheModifiedFlag)
{
    TempDirectory dir;
    auto file = dir.path / "buffer.md";
    FileSaveCollaborator collaborator([&](const std::optional<std::string> &) -> std::optional<std::string> {
        return file.string();
    });

    markdd::core::TextBuffer buffer;
    buffer.insertText("- item");
    ASSERT_TRUE(buffer.isFileModified());

    auto result = buffer.save(collaborator);
    ASSERT_TRUE(result.success);
    EXPECT_FALSE(buffer.isFileModified());
    EXPECT_EQ(buffer.getCurrentFile().value_or(""), file.string());
    EXPECT_EQ(readAll(file), "- item");
}

TEST(FilePersistence, UntitledDocumentsUndoBackToEmpty)
{
    markdd::core::TextBuffer buffer;
    markdd::edit::adoptDocument(buffer, std::nullopt, std::string());
    buffer.insertText("a");
    buffer.insertText("b");
    buffer.insertText("c");

    int undone = 0;
    while (buffer.undo())
        ++undone;
    EXPECT_EQ(undone, 3);
    EXPECT_EQ(buffer.getContent(), "");
    EXPECT_FALSE(buffer.getCurrentFile().has_value());
}

TEST(FilePersistence, NamedDocumentsKeepTheirIdentity)
{
    markdd::core::TextBuffer buffer;
    markdd::edit::adoptDocument(buffer, std::string("/tmp/todo.md"), "- [ ] write");
    EXPECT_EQ(buffer.getCurrentFile().value_or(""), "/tmp/todo.md");
    EXPECT_FALSE(buffer.isFileModified());
    EXPECT_EQ(buffer.history().size(), 1u);
}
