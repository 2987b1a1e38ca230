#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>
#include <core/models.hpp>
#include <operations/file_operations.hpp>

// Reads and appends the per-directory .safename.json audit file through the
// active backend. Writes go to .safename.json.tmp first and are then swapped
// in, so a reader never sees a half-written document.
class SidecarManager {
public:
    explicit SidecarManager(FileOperations& ops);

    // nullopt if the directory has no sidecar. Malformed content is an error.
    Result<std::optional<SidecarDocument>> read_sidecar(const std::string& directory);

    // Append in order, refresh the timestamp, write atomically.
    // An existing sidecar that cannot be parsed is left untouched.
    Result<SidecarDocument> append_entries(const std::string& directory,
                                           const std::vector<SidecarEntry>& entries);

    std::string sidecar_path(const std::string& directory) const;

    static std::string to_json(const SidecarDocument& doc);
    static Result<SidecarDocument> parse_sidecar(const std::string& text);

private:
    FileOperations& ops_;
};
