#pragma once

#include <ktree/storage/entry_store.h>

#include <memory>
#include <set>
#include <string>

namespace ktree::test {

// Delegating store that fails writes to selected paths and can report
// whole path prefixes as taken
class FaultyEntryStore : public storage::IEntryStore {
public:
    explicit FaultyEntryStore(std::shared_ptr<storage::IEntryStore> inner)
        : inner_(std::move(inner)) {}

    void failWritesTo(const std::string& path) { failingWrites_.insert(path); }

    // exists() answers true for every path starting with `prefix`
    void occupy(const std::string& prefix) { occupied_.insert(prefix); }

    Result<bool> exists(std::string_view path) const override {
        for (const auto& prefix : occupied_) {
            if (path.substr(0, prefix.size()) == prefix) {
                return true;
            }
        }
        return inner_->exists(path);
    }
    Result<model::Entry> read(std::string_view path) const override { return inner_->read(path); }

    Result<void> write(std::string_view path, const model::Entry& entry) override {
        if (failingWrites_.count(std::string(path))) {
            return Error{ErrorCode::WriteError, "injected write failure"};
        }
        return inner_->write(path, entry);
    }

    Result<void> remove(std::string_view path) override { return inner_->remove(path); }
    Result<std::vector<std::string>> listAll() const override { return inner_->listAll(); }
    storage::EntryStoreStats getStats() const noexcept override { return inner_->getStats(); }

private:
    std::shared_ptr<storage::IEntryStore> inner_;
    std::set<std::string> failingWrites_;
    std::set<std::string> occupied_;
};

} // namespace ktree::test
