#include <spdlog/spdlog.h>
#include <ktree/model/entry_codec.h>
#include <ktree/storage/entry_store.h>
#include <ktree/storage/path_utils.h>

#include <algorithm>
#include <fstream>
#include <random>
#include <sstream>

namespace ktree::storage {

// Constants
constexpr size_t TEMP_NAME_LENGTH = 16;

struct FileEntryStore::Impl {
    EntryStoreConfig config;
    mutable EntryStoreStats stats;

    explicit Impl(EntryStoreConfig cfg) : config(std::move(cfg)) {
        if (!config.createRoot) {
            return;
        }
        std::error_code ec;
        std::filesystem::create_directories(config.root, ec);
        if (ec) {
            throw std::runtime_error(
                fmt::format("Failed to create knowledge root {}: {}", config.root.string(),
                            ec.message()));
        }
    }
};

FileEntryStore::FileEntryStore(EntryStoreConfig config)
    : pImpl(std::make_unique<Impl>(std::move(config))) {
    spdlog::debug("Initialized entry store at: {}", pImpl->config.root.string());
}

FileEntryStore::~FileEntryStore() = default;

FileEntryStore::FileEntryStore(FileEntryStore&&) noexcept = default;
FileEntryStore& FileEntryStore::operator=(FileEntryStore&&) noexcept = default;

Result<std::filesystem::path> FileEntryStore::resolve(std::string_view path) const {
    if (path.empty() || path.front() == '/') {
        return Error{ErrorCode::InvalidArgument, fmt::format("Invalid entry key '{}'", path)};
    }
    auto rel = std::filesystem::path(std::string(path)).lexically_normal();
    for (const auto& part : rel) {
        if (part == "..") {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("Entry key '{}' escapes the knowledge root", path)};
        }
    }
    return pImpl->config.root / rel;
}

std::filesystem::path FileEntryStore::getTempPath(const std::filesystem::path& target) const {
    static thread_local std::random_device rd;
    static thread_local std::mt19937 gen(rd());
    static thread_local std::uniform_int_distribution<> dis(0, 15);

    std::string tempName = ".";
    tempName += target.filename().string();
    tempName += '.';
    for (size_t i = 0; i < TEMP_NAME_LENGTH; ++i) {
        tempName += fmt::format("{:x}", dis(gen));
    }
    tempName += ".tmp";

    // Same directory as the target so the final rename never crosses filesystems
    return target.parent_path() / tempName;
}

Result<void> FileEntryStore::atomicWrite(const std::filesystem::path& target,
                                         std::string_view data) {
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        spdlog::error("Failed to create directory {}: {}", target.parent_path().string(),
                      ec.message());
        return Error{ErrorCode::PermissionDenied,
                     fmt::format("Failed to create directory {}: {}",
                                 target.parent_path().string(), ec.message())};
    }

    auto tempPath = getTempPath(target);
    {
        std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
        if (!file) {
            spdlog::error("Failed to create temp file: {}", tempPath.string());
            return Error{ErrorCode::WriteError,
                         fmt::format("Failed to create temp file {}", tempPath.string())};
        }
        file.write(data.data(), static_cast<std::streamsize>(data.size()));
        if (!file) {
            file.close();
            std::filesystem::remove(tempPath, ec);
            return Error{ErrorCode::WriteError,
                         fmt::format("Failed to write {}", tempPath.string())};
        }
    }

    std::filesystem::rename(tempPath, target, ec);
    if (ec) {
        std::error_code cleanup;
        std::filesystem::remove(tempPath, cleanup);
        spdlog::error("Failed to rename {} to {}: {}", tempPath.string(), target.string(),
                      ec.message());
        return Error{ErrorCode::WriteError,
                     fmt::format("Failed to replace {}: {}", target.string(), ec.message())};
    }
    return {};
}

Result<bool> FileEntryStore::exists(std::string_view path) const {
    auto full = resolve(path);
    if (!full) {
        return full.error();
    }
    std::error_code ec;
    bool present = std::filesystem::is_regular_file(full.value(), ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return Error{ErrorCode::IOError,
                     fmt::format("Failed to stat {}: {}", full.value().string(), ec.message())};
    }
    return present;
}

Result<model::Entry> FileEntryStore::read(std::string_view path) const {
    auto full = resolve(path);
    if (!full) {
        return full.error();
    }
    pImpl->stats.reads++;

    std::error_code ec;
    if (!std::filesystem::is_regular_file(full.value(), ec)) {
        return Error{ErrorCode::NotFound, fmt::format("Entry not found: {}", path)};
    }

    std::ifstream file(full.value(), std::ios::binary);
    if (!file) {
        pImpl->stats.failedOperations++;
        return Error{ErrorCode::IOError, fmt::format("Failed to open entry {}", path)};
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        pImpl->stats.failedOperations++;
        return Error{ErrorCode::IOError, fmt::format("Failed to read entry {}", path)};
    }

    auto decoded = model::decodeEntry(buffer.str());
    if (!decoded) {
        pImpl->stats.failedOperations++;
        auto err = decoded.error();
        err.message = fmt::format("Failed to read knowledge entry at {}: {}", path, err.message);
        return err;
    }
    return decoded;
}

Result<void> FileEntryStore::write(std::string_view path, const model::Entry& entry) {
    auto full = resolve(path);
    if (!full) {
        return full.error();
    }
    auto result = atomicWrite(full.value(), model::encodeEntry(entry));
    if (!result) {
        pImpl->stats.failedOperations++;
        return result;
    }
    pImpl->stats.writes++;
    spdlog::debug("Wrote entry {}", path);
    return {};
}

Result<void> FileEntryStore::remove(std::string_view path) {
    auto full = resolve(path);
    if (!full) {
        return full.error();
    }
    std::error_code ec;
    bool removed = std::filesystem::remove(full.value(), ec);
    if (ec) {
        pImpl->stats.failedOperations++;
        spdlog::error("Failed to delete {}: {}", full.value().string(), ec.message());
        return Error{ErrorCode::IOError,
                     fmt::format("Failed to delete entry {}: {}", path, ec.message())};
    }
    if (!removed) {
        return Error{ErrorCode::NotFound, fmt::format("Entry not found: {}", path)};
    }
    pImpl->stats.deletes++;
    spdlog::debug("Deleted entry {}", path);
    return {};
}

Result<std::vector<std::string>> FileEntryStore::listAll() const {
    namespace fs = std::filesystem;
    pImpl->stats.scans++;

    std::vector<std::string> paths;
    const auto& root = pImpl->config.root;

    std::error_code ec;
    if (!fs::exists(root, ec)) {
        // Nothing has been written yet
        return paths;
    }

    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return Error{ErrorCode::IOError,
                     fmt::format("Failed to scan {}: {}", root.string(), ec.message())};
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            spdlog::warn("Entry scan error under {}: {}", root.string(), ec.message());
            ec.clear();
            continue;
        }
        const auto name = it->path().filename().string();
        // Hidden files and directories: control file, temp files, VCS metadata
        if (!name.empty() && name.front() == '.') {
            if (it->is_directory(ec)) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!it->is_regular_file(ec) || !name.ends_with(kEntryExtension)) {
            continue;
        }
        paths.push_back(it->path().lexically_relative(root).generic_string());
    }

    std::sort(paths.begin(), paths.end());
    return paths;
}

EntryStoreStats FileEntryStore::getStats() const noexcept {
    return pImpl->stats;
}

std::shared_ptr<IEntryStore> makeFileEntryStore(const std::filesystem::path& root) {
    return std::make_shared<FileEntryStore>(EntryStoreConfig{.root = root, .createRoot = true});
}

} // namespace ktree::storage
