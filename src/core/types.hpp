#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Captured output of an external tool invocation
struct ProcessOutput {
    int exit_code = -1;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stderr_data.empty() ? stdout_data : stderr_data;
    }
};

// One entry of a directory listing, local or remote
struct DirEntry {
    std::string name;
    bool is_directory = false;   // for a symlink, what it points to
    bool is_symlink = false;
    std::string error;           // set when the entry's type could not be determined
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
