//! # Output Writer
//!
//! Writes companion files atomically and only when their content changed.
//!
//! ## Write Protocol
//!
//! ```text
//! lock(path) → read existing → equal? → Unchanged
//!                            → write <path>.sfg-tmp-<n> → rename over path → Written
//! ```
//!
//! Writes to the same path are serialized through a per-path mutex. The
//! temporary sibling is owned by a `TempFileGuard`, which deletes it unless
//! the rename succeeded.

#ifndef SFG_IO_OUTPUT_WRITER_HPP
#define SFG_IO_OUTPUT_WRITER_HPP

#include "common.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace sfg::io {

namespace fs = std::filesystem;

struct WriteError {
    std::string path;
    std::string reason;
};

enum class WriteOutcome { Written, Unchanged };

/// Removes a temporary file on scope exit unless `commit()` was called.
class TempFileGuard {
public:
    explicit TempFileGuard(fs::path path) : path_(std::move(path)) {}
    ~TempFileGuard();

    TempFileGuard(const TempFileGuard&) = delete;
    auto operator=(const TempFileGuard&) -> TempFileGuard& = delete;

    void commit() {
        committed_ = true;
    }

    [[nodiscard]] auto path() const -> const fs::path& {
        return path_;
    }

private:
    fs::path path_;
    bool committed_ = false;
};

class OutputWriter {
public:
    /// Replaces `path` with `text` unless it already holds exactly that text.
    /// Missing parent directories are created.
    [[nodiscard]] auto write(const fs::path& path, std::string_view text)
        -> Result<WriteOutcome, WriteError>;

    /// Deletes `path`. Returns false when it did not exist.
    [[nodiscard]] auto remove(const fs::path& path) -> Result<bool, WriteError>;

private:
    std::mutex table_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks_;
    std::atomic<uint64_t> temp_counter_{0};

    auto lock_for(const fs::path& path) -> std::shared_ptr<std::mutex>;
};

/// Whole file contents, `nullopt` when the file cannot be read.
[[nodiscard]] auto read_file(const fs::path& path) -> std::optional<std::string>;

/// True when `path` exists and starts with the generated-code header.
[[nodiscard]] auto is_generated_file(const fs::path& path) -> bool;

} // namespace sfg::io

#endif // SFG_IO_OUTPUT_WRITER_HPP
