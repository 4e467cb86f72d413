#pragma once

#include <ktree/core/types.h>
#include <ktree/model/entry.h>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace ktree::storage {

struct EntryStoreConfig {
    std::filesystem::path root;
    // Create the root directory on construction when missing
    bool createRoot = true;
};

// Store operation counters
struct EntryStoreStats {
    std::atomic<uint64_t> reads{0};
    std::atomic<uint64_t> writes{0};
    std::atomic<uint64_t> deletes{0};
    std::atomic<uint64_t> scans{0};
    std::atomic<uint64_t> failedOperations{0};

    EntryStoreStats() = default;
    EntryStoreStats(const EntryStoreStats& other) noexcept
        : reads(other.reads.load()), writes(other.writes.load()), deletes(other.deletes.load()),
          scans(other.scans.load()), failedOperations(other.failedOperations.load()) {}
};

/**
 * Keyed persistence of entries: one document per path, the path being both the location
 * below the root and the primary key. Paths handed to the store are already normalized.
 *
 * No caching: every call goes to the backing store, so two operations on the same path only
 * agree as of their own read.
 */
class IEntryStore {
public:
    virtual ~IEntryStore() = default;

    virtual Result<bool> exists(std::string_view path) const = 0;

    // NotFound when absent, Malformed when the stored bytes are not a valid entry
    virtual Result<model::Entry> read(std::string_view path) const = 0;

    // Creates parent directories; replaces the file atomically (temp file + rename)
    virtual Result<void> write(std::string_view path, const model::Entry& entry) = 0;

    virtual Result<void> remove(std::string_view path) = 0;

    // Full recursive scan; sorted relative paths
    virtual Result<std::vector<std::string>> listAll() const = 0;

    virtual EntryStoreStats getStats() const noexcept = 0;
};

/**
 * Filesystem implementation rooted at EntryStoreConfig::root.
 */
class FileEntryStore : public IEntryStore {
public:
    explicit FileEntryStore(EntryStoreConfig config);
    ~FileEntryStore() override;

    FileEntryStore(const FileEntryStore&) = delete;
    FileEntryStore& operator=(const FileEntryStore&) = delete;
    FileEntryStore(FileEntryStore&&) noexcept;
    FileEntryStore& operator=(FileEntryStore&&) noexcept;

    Result<bool> exists(std::string_view path) const override;
    Result<model::Entry> read(std::string_view path) const override;
    Result<void> write(std::string_view path, const model::Entry& entry) override;
    Result<void> remove(std::string_view path) override;
    Result<std::vector<std::string>> listAll() const override;

    EntryStoreStats getStats() const noexcept override;

    // Absolute location of an entry; rejects keys escaping the root
    Result<std::filesystem::path> resolve(std::string_view path) const;

private:
    std::filesystem::path getTempPath(const std::filesystem::path& target) const;
    Result<void> atomicWrite(const std::filesystem::path& target, std::string_view data);

    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

std::shared_ptr<IEntryStore> makeFileEntryStore(const std::filesystem::path& root);

} // namespace ktree::storage
