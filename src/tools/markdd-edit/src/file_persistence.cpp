#include "markdd/edit/file_persistence.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

namespace markdd::edit
{

namespace
{

std::string lowercase(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::string describeFailure(std::string_view verb, const std::filesystem::path &path)
{
    std::ostringstream text;
    text << "Error " << verb << " file " << path.string() << '.';
    return text.str();
}

} // namespace

LoadResult loadTextFile(const std::filesystem::path &path)
{
    LoadResult result;
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec))
    {
        result.error = describeFailure("reading", path);
        return result;
    }

    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in)
    {
        result.error = describeFailure("reading", path);
        PLOGW << result.error;
        return result;
    }

    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad())
    {
        result.error = describeFailure("reading", path);
        PLOGW << result.error;
        return result;
    }

    PLOGD << "Loaded " << text.size() << " bytes from " << path.string();
    result.content = std::move(text);
    return result;
}

core::SaveResult writeTextFile(const std::filesystem::path &path, const std::string &content)
{
    if (path.empty())
        return core::SaveResult::failed("No file name given.");

    std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out)
        return core::SaveResult::failed(describeFailure("creating", path));

    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out)
        return core::SaveResult::failed(describeFailure("writing", path));

    return core::SaveResult::saved(path.string());
}

bool isMarkdownFileName(std::string_view path)
{
    std::string extension = lowercase(std::filesystem::path(path).extension().string());
    return extension == ".md" || extension == ".markdown" || extension == ".mdown" || extension == ".mkd";
}

void adoptDocument(core::TextBuffer &buffer, std::optional<std::string> fileName, std::string content)
{
    if (fileName)
        buffer.openFile(std::move(*fileName), std::move(content));
    else
        buffer.setContent(std::move(content));
}

FileSaveCollaborator::FileSaveCollaborator(SaveAsPrompt prompt)
    : prompt(std::move(prompt))
{
}

core::SaveResult FileSaveCollaborator::save(const std::optional<std::string> &currentFile, const std::string &content)
{
    std::optional<std::string> target = currentFile;
    if (!target || target->empty() || forceSaveAs)
    {
        if (!prompt)
            return core::SaveResult::failed("No file name given.");
        target = prompt(currentFile);
        if (!target || target->empty())
            return core::SaveResult::cancelled();
    }

    core::SaveResult result = writeTextFile(*target, content);
    if (result.success)
        PLOGI << "Saved " << content.size() << " bytes to " << *target;
    return result;
}

} // namespace markdd::edit
