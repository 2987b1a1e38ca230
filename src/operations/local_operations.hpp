#pragma once

#include <operations/file_operations.hpp>

// Local disk and mounted network shares via std::filesystem.
// Paths are UTF-8 strings; joining is textual so UNC (\\server\share) and
// drive-letter roots keep their leading separators and native separator.
class LocalFileOperations : public FileOperations {
public:
    Result<void> preflight(const std::string& root) override;
    Result<std::vector<DirEntry>> list_entries(const std::string& directory) override;
    Result<bool> exists(const std::string& path) override;
    Result<bool> same_file(const std::string& a, const std::string& b) override;
    Result<void> move(const std::string& from, const std::string& to) override;
    Result<std::unique_ptr<ByteStream>> open_for_read(const std::string& path) override;

    // Local files are always hashed by reading them.
    Result<std::optional<std::string>> stored_hash(const std::string&, const std::string&) override {
        return Result<std::optional<std::string>>::Ok(std::nullopt);
    }

    Result<std::optional<std::string>> read_text(const std::string& path) override;
    Result<void> write_text(const std::string& path, const std::string& data) override;
    Result<void> replace(const std::string& from, const std::string& to) override;

    std::string join(const std::string& directory, const std::string& name) const override;

    ErrorKind failure_kind() const override { return ErrorKind::IOFailure; }
    std::string backend_name() const override { return "local"; }
};
