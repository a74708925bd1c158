#include "chunkbus/state/record_store.hpp"

#include <cctype>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <system_error>

namespace chunkbus::state {
namespace fs = std::filesystem;

namespace {

constexpr const char* kRecordExtension = ".json";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

// ──────────────────────────────────────────────────────────
// MemoryRecordStore
// ──────────────────────────────────────────────────────────

std::string MemoryRecordStore::make_key(const RecordKey& key) {
    return section_name(key) + "|" + key.file_id;
}

Result<std::optional<std::string>> MemoryRecordStore::get(const RecordKey& key) const {
    std::shared_lock lock(mutex_);
    auto it = records_.find(make_key(key));
    if (it == records_.end()) {
        return Ok(std::optional<std::string>{});
    }
    return Ok(std::optional<std::string>{it->second});
}

Result<void> MemoryRecordStore::put(const RecordKey& key, const std::string& blob) {
    std::unique_lock lock(mutex_);
    records_[make_key(key)] = blob;
    return Ok();
}

Result<void> MemoryRecordStore::remove(const RecordKey& key) {
    std::unique_lock lock(mutex_);
    records_.erase(make_key(key));
    return Ok();
}

Result<std::vector<std::string>> MemoryRecordStore::list(Role role) const {
    std::shared_lock lock(mutex_);
    const std::string prefix = std::string(to_string(role)) + "|";

    std::vector<std::string> ids;
    for (const auto& [key, blob] : records_) {
        if (key.compare(0, prefix.size(), prefix) == 0) {
            ids.push_back(key.substr(prefix.size()));
        }
    }
    return Ok(std::move(ids));
}

size_t MemoryRecordStore::size() const {
    std::shared_lock lock(mutex_);
    return records_.size();
}

// ──────────────────────────────────────────────────────────
// DirectoryRecordStore
// ──────────────────────────────────────────────────────────

std::string encode_file_name(const std::string& file_id) {
    std::ostringstream oss;
    for (unsigned char c : file_id) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.') {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
                << static_cast<int>(c) << std::nouppercase << std::dec;
        }
    }
    return oss.str();
}

std::optional<std::string> decode_file_name(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (std::size_t i = 0; i < name.size(); ++i) {
        if (name[i] != '%') {
            out.push_back(name[i]);
            continue;
        }
        if (i + 2 >= name.size()) {
            return std::nullopt;
        }
        const int high = hex_value(name[i + 1]);
        const int low = hex_value(name[i + 2]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<char>((high << 4) | low));
        i += 2;
    }
    return out;
}

DirectoryRecordStore::DirectoryRecordStore(fs::path root) : root_(std::move(root)) {}

fs::path DirectoryRecordStore::path_for(const RecordKey& key) const {
    return root_ / section_name(key) / (encode_file_name(key.file_id) + kRecordExtension);
}

Result<std::optional<std::string>> DirectoryRecordStore::get(const RecordKey& key) const {
    std::shared_lock lock(mutex_);
    const auto path = path_for(key);

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Ok(std::optional<std::string>{});
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::optional<std::string>>(ErrorCode::StateStore, "Failed to open record: " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return Ok(std::optional<std::string>{buffer.str()});
}

Result<void> DirectoryRecordStore::put(const RecordKey& key, const std::string& blob) {
    std::unique_lock lock(mutex_);
    const auto path = path_for(key);

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec && !fs::exists(path.parent_path())) {
        return Err<void>(ErrorCode::StateStore, "Failed to create directory: " + path.parent_path().string());
    }

    auto temp = path;
    temp += ".tmp";
    {
        std::ofstream output(temp, std::ios::binary | std::ios::trunc);
        if (!output) {
            return Err<void>(ErrorCode::StateStore, "Failed to open record for writing: " + temp.string());
        }
        output.write(blob.data(), static_cast<std::streamsize>(blob.size()));
        output.flush();
        if (!output) {
            return Err<void>(ErrorCode::StateStore, "Failed to write record: " + temp.string());
        }
    }

    fs::rename(temp, path, ec);
    if (ec) {
        return Err<void>(ErrorCode::StateStore, "Failed to replace record " + path.string() + ": " + ec.message());
    }
    return Ok();
}

Result<void> DirectoryRecordStore::remove(const RecordKey& key) {
    std::unique_lock lock(mutex_);
    const auto path = path_for(key);

    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        return Err<void>(ErrorCode::StateStore, "Failed to remove record " + path.string() + ": " + ec.message());
    }
    return Ok();
}

Result<std::vector<std::string>> DirectoryRecordStore::list(Role role) const {
    std::shared_lock lock(mutex_);
    const auto dir = root_ / to_string(role);

    std::vector<std::string> ids;
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        return Ok(std::move(ids));
    }

    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != kRecordExtension) {
            continue;
        }
        if (auto id = decode_file_name(entry.path().stem().string())) {
            ids.push_back(*id);
        }
    }
    if (ec) {
        return Err<std::vector<std::string>>(ErrorCode::StateStore, "Failed to list " + dir.string() + ": " + ec.message());
    }
    return Ok(std::move(ids));
}

} // namespace chunkbus::state
