#pragma once

#include <optional>
#include <string>
#include <utility>

namespace markdd::core
{

struct SaveResult
{
    bool success = false;
    std::optional<std::string> filePath;
    std::optional<std::string> error; // absent on success and when the user cancelled

    static SaveResult saved(std::string path) { return SaveResult{true, std::move(path), std::nullopt}; }
    static SaveResult failed(std::string message) { return SaveResult{false, std::nullopt, std::move(message)}; }
    static SaveResult cancelled() { return SaveResult{}; }
};

// Persistence is delegated; the editing core never touches the file system.
class SaveCollaborator
{
public:
    virtual ~SaveCollaborator() = default;

    virtual SaveResult save(const std::optional<std::string> &currentFile, const std::string &content) = 0;
};

} // namespace markdd::core
