#include "io/output_writer.hpp"

#include "log/log.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

namespace sfg::io {

namespace {

// The freezed header starts with a coverage line; the generated marker is on line 2.
constexpr std::string_view MARKER = "// GENERATED CODE - DO NOT MODIFY BY HAND";
constexpr size_t HEADER_PROBE = 256;

auto canonical_key(const fs::path& path) -> std::string {
    std::error_code ec;
    auto absolute = fs::absolute(path, ec);
    return (ec ? path : absolute).lexically_normal().string();
}

} // anonymous namespace

TempFileGuard::~TempFileGuard() {
    if (committed_) {
        return;
    }
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        SFG_LOG_WARN("io", "Could not remove temporary file " << path_.string() << ": "
                                                               << ec.message());
    }
}

auto read_file(const fs::path& path) -> std::optional<std::string> {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return std::nullopt;
    }
    return ss.str();
}

auto is_generated_file(const fs::path& path) -> bool {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    std::string head(HEADER_PROBE, '\0');
    in.read(head.data(), static_cast<std::streamsize>(head.size()));
    head.resize(static_cast<size_t>(in.gcount()));
    return head.find(MARKER) != std::string::npos;
}

auto OutputWriter::lock_for(const fs::path& path) -> std::shared_ptr<std::mutex> {
    std::lock_guard<std::mutex> lock(table_mutex_);
    auto& slot = locks_[canonical_key(path)];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

auto OutputWriter::write(const fs::path& path, std::string_view text)
    -> Result<WriteOutcome, WriteError> {
    auto path_mutex = lock_for(path);
    std::lock_guard<std::mutex> lock(*path_mutex);

    if (auto existing = read_file(path); existing && *existing == text) {
        SFG_LOG_TRACE("io", "Unchanged " << path.string());
        return WriteOutcome::Unchanged;
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return WriteError{.path = path.string(),
                              .reason = "cannot create directory: " + ec.message()};
        }
    }

    fs::path temp = path;
    temp += ".sfg-tmp-" + std::to_string(temp_counter_.fetch_add(1));
    TempFileGuard guard(temp);
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return WriteError{.path = path.string(),
                              .reason = std::string("cannot open for writing: ") +
                                        std::strerror(errno)};
        }
        out.write(text.data(), static_cast<std::streamsize>(text.size()));
        out.flush();
        if (!out) {
            return WriteError{.path = path.string(), .reason = "write failed"};
        }
    }

    fs::rename(temp, path, ec);
    if (ec) {
        return WriteError{.path = path.string(), .reason = "rename failed: " + ec.message()};
    }
    guard.commit();
    SFG_LOG_DEBUG("io", "Wrote " << path.string() << " (" << text.size() << " bytes)");
    return WriteOutcome::Written;
}

auto OutputWriter::remove(const fs::path& path) -> Result<bool, WriteError> {
    auto path_mutex = lock_for(path);
    std::lock_guard<std::mutex> lock(*path_mutex);

    std::error_code ec;
    bool removed = fs::remove(path, ec);
    if (ec) {
        return WriteError{.path = path.string(), .reason = "cannot remove: " + ec.message()};
    }
    if (removed) {
        SFG_LOG_DEBUG("io", "Removed " << path.string());
    }
    return removed;
}

} // namespace sfg::io
