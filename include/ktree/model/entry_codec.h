#pragma once

#include <ktree/core/types.h>
#include <ktree/model/entry.h>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace ktree::model {

/**
 * JSON codec for entry documents.
 *
 * Two decode flavours exist:
 *  - strict (store boundary): anything that is not a complete, well-typed entry is
 *    ErrorCode::Malformed, with every problem listed in Error::details.
 *  - draft (caller input): type and enum problems are ErrorCode::ValidationError; missing
 *    required fields are left empty so the service validator can report them together with
 *    its own checks.
 */

nlohmann::json toJson(const Relation& relation);
nlohmann::json toJson(const Example& example);
nlohmann::json toJson(const Entry& entry);

// Pretty-printed (2-space) document bytes
std::string encodeEntry(const Entry& entry);

Result<Entry> decodeEntry(std::string_view bytes);
Result<Entry> entryFromJson(const nlohmann::json& doc);

Result<Entry> decodeEntryDraft(const nlohmann::json& doc);
Result<EntryPatch> decodeEntryPatch(const nlohmann::json& doc);

} // namespace ktree::model
