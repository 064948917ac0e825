/**
 * @file report.cpp
 * @brief Verification report output and address change detection
 */

#include "evmverify/report.hpp"

#include "evmverify/inputs.hpp"
#include "evmverify/schema_validate.hpp"
#include "evmverify/version.hpp"

#include <algorithm>
#include <map>
#include <print>
#include <set>
#include <system_error>
#include <utility>

namespace evmverify::report {

namespace {

using Snapshot = std::map<std::pair<std::string, std::string>, std::string>;

[[nodiscard]] nlohmann::json outcomes_to_json(const std::vector<VerificationOutcome>& outcomes)
{
    nlohmann::json list = nlohmann::json::array();
    for (const auto& outcome : outcomes) {
        list.push_back(to_json(outcome));
    }
    return list;
}

[[nodiscard]] std::set<std::string> json_file_names(const std::filesystem::path& dir)
{
    std::set<std::string> names;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->path().extension() == ".json") {
            names.insert(it->path().filename().string());
        }
    }
    return names;
}

[[nodiscard]] evmverify::VoidResult load_snapshot(const std::filesystem::path& dir,
                                                  const std::string& file,
                                                  Snapshot& snapshot)
{
    const auto path = dir / file;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return {};
    }
    auto j = inputs::read_json_file(path);
    if (!j) {
        return std::unexpected(j.error());
    }
    if (!j->is_object()) {
        return std::unexpected(
            Error::make("ParseError", "Address file must be a JSON object: " + path.string()));
    }
    for (const auto& [name, value] : j->items()) {
        if (!value.is_string()) {
            continue;
        }
        const auto& address = value.get_ref<const std::string&>();
        if (address.empty() || is_zero_address(address)) {
            continue;
        }
        snapshot.emplace(std::make_pair(file, name), common::to_lower(address));
    }
    return {};
}

[[nodiscard]] nlohmann::json change_to_json(const AddressChange& change)
{
    nlohmann::json j = {
        {       "file",                        change.file},
        {       "name",                        change.name},
        {    "address",                     change.address},
        {"change_type", std::string(to_string(change.kind))}
    };
    if (change.old_address) {
        j["old_address"] = *change.old_address;
    }
    return j;
}

}  // namespace

nlohmann::json to_json(const VerificationReport& report)
{
    nlohmann::json skipped = nlohmann::json::array();
    for (const auto& name : report.skipped) {
        skipped.push_back(name);
    }
    const nlohmann::json summary = {
        {   "total",          report.total()},
        {"verified", report.verified.size()},
        {  "failed",   report.failed.size()},
        { "skipped",  report.skipped.size()}
    };
    return nlohmann::json{
        {"schema_version",              kReportSchemaVersion},
        {      "verified", outcomes_to_json(report.verified)},
        {        "failed",   outcomes_to_json(report.failed)},
        {       "skipped",                           skipped},
        {       "summary",                           summary}
    };
}

evmverify::VoidResult write_report(const std::filesystem::path& path,
                                   const VerificationReport& report,
                                   const std::filesystem::path& schema_dir)
{
    const nlohmann::json document = to_json(report);
    if (auto valid = common::validate_document(document, schema_dir, kReportSchemaVersion); !valid) {
        return std::unexpected(valid.error());
    }
    return inputs::write_canonical_json_file(path, document);
}

void print_summary(const VerificationReport& report, std::FILE* out)
{
    std::println(out, "");
    std::println(out, "{}", std::string(60, '='));
    std::println(out, "VERIFICATION SUMMARY");
    std::println(out, "{}", std::string(60, '='));
    std::println(out, "  Verified: {}", report.verified.size());
    std::println(out, "  Failed:   {}", report.failed.size());
    if (!report.skipped.empty()) {
        std::println(out, "  Skipped:  {}", report.skipped.size());
    }
    std::println(out, "  Total:    {}", report.total());
    if (!report.failed.empty()) {
        std::println(out, "");
        std::println(out, "Failed contracts:");
        for (const auto& outcome : report.failed) {
            std::println(out, "  - {}: {}", outcome.identity.logical_name,
                         outcome.error.value_or("unknown error"));
        }
    }
}

std::string_view to_string(ChangeKind kind) noexcept
{
    switch (kind) {
        case ChangeKind::kAdded:
            return "added";
        case ChangeKind::kModified:
            return "modified";
        case ChangeKind::kRemoved:
            return "removed";
    }
    return "modified";
}

evmverify::Result<ChangeSet> detect_changes(const std::filesystem::path& base_dir,
                                            const std::filesystem::path& head_dir,
                                            const std::vector<std::string>& files)
{
    std::set<std::string> names(files.begin(), files.end());
    if (names.empty()) {
        names = json_file_names(base_dir);
        names.merge(json_file_names(head_dir));
    }

    Snapshot base;
    Snapshot head;
    for (const auto& file : names) {
        if (auto loaded = load_snapshot(base_dir, file, base); !loaded) {
            return std::unexpected(loaded.error());
        }
        if (auto loaded = load_snapshot(head_dir, file, head); !loaded) {
            return std::unexpected(loaded.error());
        }
    }

    // Snapshot keys are ordered, so each list comes out sorted by (file, name)
    ChangeSet changes;
    for (const auto& [key, address] : head) {
        auto previous = base.find(key);
        if (previous == base.end()) {
            changes.added.push_back(AddressChange{.file = key.first,
                                                  .name = key.second,
                                                  .address = address,
                                                  .old_address = std::nullopt,
                                                  .kind = ChangeKind::kAdded});
        } else if (previous->second != address) {
            changes.modified.push_back(AddressChange{.file = key.first,
                                                     .name = key.second,
                                                     .address = address,
                                                     .old_address = previous->second,
                                                     .kind = ChangeKind::kModified});
        }
    }
    for (const auto& [key, address] : base) {
        if (!head.contains(key)) {
            changes.removed.push_back(AddressChange{.file = key.first,
                                                    .name = key.second,
                                                    .address = address,
                                                    .old_address = std::nullopt,
                                                    .kind = ChangeKind::kRemoved});
        }
    }
    return changes;
}

nlohmann::json to_json(const ChangeSet& changes)
{
    nlohmann::json list = nlohmann::json::array();
    for (const auto& change : changes.added) {
        list.push_back(change_to_json(change));
    }
    for (const auto& change : changes.modified) {
        list.push_back(change_to_json(change));
    }
    return list;
}

void print_changes(const ChangeSet& changes, std::FILE* out)
{
    if (changes.total() == 0) {
        std::println(out, "No address changes detected");
        return;
    }
    std::println(out, "Detected {} address change(s):", changes.total());
    if (!changes.added.empty()) {
        std::println(out, "");
        std::println(out, "New addresses ({}):", changes.added.size());
        for (const auto& change : changes.added) {
            std::println(out, "  + {}: {}", change.name, change.address);
        }
    }
    if (!changes.modified.empty()) {
        std::println(out, "");
        std::println(out, "Modified addresses ({}):", changes.modified.size());
        for (const auto& change : changes.modified) {
            std::println(out, "  ~ {}:", change.name);
            std::println(out, "      {} -> {}", change.old_address.value_or("?"), change.address);
        }
    }
    if (!changes.removed.empty()) {
        std::println(out, "");
        std::println(out, "Removed addresses ({}):", changes.removed.size());
        for (const auto& change : changes.removed) {
            std::println(out, "  - {}: {}", change.name, change.address);
        }
    }
}

}  // namespace evmverify::report
