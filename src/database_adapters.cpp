#include "database_adapters.hpp"
#include <algorithm>
#include <regex>
#include <cctype>

namespace {

const std::regex kUseLine(R"(^USE\s+`([^`]+)`;\s*$)");
const std::regex kCreateDatabaseLine(R"(^(CREATE DATABASE\s+(?:/\*!\d+\s+IF NOT EXISTS\s*\*/\s*|IF NOT EXISTS\s+)?)`([^`]+)`(.*)$)");

const std::string& targetOf(const DatabaseMappingEntry& entry) {
    return entry.targetName.empty() ? entry.originalName : entry.targetName;
}

} // namespace

bool isSafeDatabaseName(const std::string& name) {
    if (name.empty() || name.size() > 64) {
        return false;
    }
    return std::ranges::all_of(name, [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '$' || c == '-';
    });
}

MySqlDumpFilter::MySqlDumpFilter(std::vector<DatabaseMappingEntry> mapping, std::optional<std::string> targetDatabase)
    : mapping_(std::move(mapping)), targetDatabase_(std::move(targetDatabase)) {
    passthrough_ = mapping_.empty() && !targetDatabase_;
}

std::optional<std::string> MySqlDumpFilter::apply(const std::string& line) {
    if (passthrough_) {
        return line;
    }

    auto entryFor = [this](const std::string& name) -> const DatabaseMappingEntry* {
        auto it = std::ranges::find(mapping_, name, &DatabaseMappingEntry::originalName);
        return it == mapping_.end() ? nullptr : &*it;
    };

    std::smatch match;
    if (std::regex_match(line, match, kUseLine)) {
        if (mapping_.empty()) {
            return std::nullopt;
        }
        const DatabaseMappingEntry* entry = entryFor(match[1].str());
        if (!entry) {
            skipSection_ = false;
            return line;
        }
        if (!entry->selected) {
            skipSection_ = true;
            return std::nullopt;
        }
        skipSection_ = false;
        return "USE `" + targetOf(*entry) + "`;";
    }

    if (std::regex_match(line, match, kCreateDatabaseLine)) {
        if (mapping_.empty()) {
            return std::nullopt;
        }
        const DatabaseMappingEntry* entry = entryFor(match[2].str());
        if (!entry) {
            return line;
        }
        if (!entry->selected) {
            return std::nullopt;
        }
        return match[1].str() + "`" + targetOf(*entry) + "`" + match[3].str();
    }

    if (skipSection_) {
        return std::nullopt;
    }
    return line;
}
