#pragma once

#include "markdd/core/save_collaborator.hpp"
#include "markdd/core/text_buffer.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace markdd::edit
{

struct LoadResult
{
    std::optional<std::string> content;
    std::string error;

    bool ok() const noexcept { return content.has_value(); }
};

LoadResult loadTextFile(const std::filesystem::path &path);

core::SaveResult writeTextFile(const std::filesystem::path &path, const std::string &content);

bool isMarkdownFileName(std::string_view path);

// Puts a freshly created window's document into `buffer`. Untitled documents
// also get a baseline snapshot so the first edit can be undone.
void adoptDocument(core::TextBuffer &buffer, std::optional<std::string> fileName, std::string content);

// Writes documents to disk. Untitled documents, and every save while
// forceSaveAs() is set, go through the prompt; an empty answer cancels.
class FileSaveCollaborator : public core::SaveCollaborator
{
public:
    using SaveAsPrompt = std::function<std::optional<std::string>(const std::optional<std::string> &suggestion)>;

    explicit FileSaveCollaborator(SaveAsPrompt prompt = {});

    void setForceSaveAs(bool value) noexcept { forceSaveAs = value; }

    core::SaveResult save(const std::optional<std::string> &currentFile, const std::string &content) override;

private:
    SaveAsPrompt prompt;
    bool forceSaveAs = false;
};

} // namespace markdd::edit
