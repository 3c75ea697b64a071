/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: resource_store.cpp

    Description:
        CSV reading and replace-all writing of the resource table.

        Parsing follows the usual rules for this kind of file: whitespace
        around a field is trimmed, a field may be double-quoted (and then may
        contain commas, line breaks and significant spaces; "" is an escaped
        quote), the first line is skipped when it looks like a header.
*******************************************************************************/

#include "resources/resource_store.h"
#include "common/errors.h"
#include "common/logger.h"

#include <fstream>
#include <set>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <cerrno>
#include <sys/stat.h>

namespace roomalloc {

static const char* const CSV_HEADER =
    "id,kind,status,capacity,requester,program,requested_at,assigned_at";

std::string ResourceStore::trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::vector<std::string> ResourceStore::split(const std::string& line) {
    std::vector<std::string> tokens;
    std::string current;
    bool in_quotes = false;
    bool quoted = false;
    size_t closed_at = 0;       // end of the quoted text within current

    auto finish_field = [&]() {
        if (quoted) {
            // Whitespace inside the quotes is data; outside it is not
            tokens.push_back(current.substr(0, closed_at) + trim(current.substr(closed_at)));
        } else {
            tokens.push_back(trim(current));
        }
        current.clear();
        quoted = false;
        closed_at = 0;
    };

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (in_quotes) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                current += '"';
                ++i;
            } else if (c == '"') {
                in_quotes = false;
                closed_at = current.size();
            } else {
                current += c;
            }
        } else if (c == '"' && !quoted && trim(current).empty()) {
            current.clear();
            in_quotes = true;
            quoted = true;
        } else if (c == ',') {
            finish_field();
        } else {
            current += c;
        }
    }
    finish_field();
    return tokens;
}

bool ResourceStore::has_open_quote(const std::string& record) {
    return std::count(record.begin(), record.end(), '"') % 2 != 0;
}

std::string ResourceStore::quote(const std::string& field) {
    bool padded = !field.empty() &&
                  (std::isspace(static_cast<unsigned char>(field.front())) ||
                   std::isspace(static_cast<unsigned char>(field.back())));
    if (!padded && field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

bool ResourceStore::exists() const {
    struct stat st;
    return stat(path_.c_str(), &st) == 0;
}

std::vector<Resource> ResourceStore::load() const {
    Logger::info("Loading resource table from " + path_);

    std::ifstream file(path_);
    if (!file.is_open()) {
        throw PersistenceError("Failed to open resource file: " + path_);
    }

    std::vector<Resource> resources;
    std::set<std::string> seen;
    std::string line;
    size_t line_num = 0;

    while (std::getline(file, line)) {
        line_num++;
        size_t record_start = line_num;

        // A quoted field may span lines
        std::string continuation;
        while (has_open_quote(line) && std::getline(file, continuation)) {
            line_num++;
            line += "\n" + continuation;
        }
        if (trim(line).empty()) continue;

        if (record_start == 1) {
            std::string lower = line;
            std::transform(lower.begin(), lower.end(), lower.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (lower.find("id") == 0 && lower.find("kind") != std::string::npos) {
                continue;
            }
        }

        auto tokens = split(line);
        if (tokens.size() < 8) {
            Logger::warning("Invalid line " + std::to_string(record_start) +
                            " in " + path_ + ": insufficient columns");
            continue;
        }

        try {
            Resource resource;
            resource.id = tokens[0];
            resource.kind = kind_from_string(tokens[1]);
            resource.status = status_from_string(tokens[2]);
            resource.capacity = std::stoi(tokens[3]);
            resource.requester = tokens[4];
            resource.program = tokens[5];
            resource.requested_at = tokens[6];
            resource.assigned_at = tokens[7];

            if (!resource.is_consistent()) {
                Logger::warning("Skipping inconsistent resource '" + resource.id +
                                "' on line " + std::to_string(record_start));
                continue;
            }
            if (!seen.insert(resource.id).second) {
                Logger::warning("Skipping duplicate resource '" + resource.id +
                                "' on line " + std::to_string(record_start));
                continue;
            }
            resources.push_back(resource);
        } catch (const std::exception& e) {
            Logger::warning("Failed to parse line " + std::to_string(record_start) +
                            " in " + path_ + ": " + e.what());
        }
    }

    Logger::info("Loaded " + std::to_string(resources.size()) +
                 " resources from " + path_);
    return resources;
}

void ResourceStore::save(const std::vector<Resource>& resources) const {
    std::string tmp_path = path_ + ".tmp";

    {
        std::ofstream file(tmp_path, std::ios::trunc);
        if (!file.is_open()) {
            throw PersistenceError("Failed to open " + tmp_path + " for writing");
        }

        file << CSV_HEADER << "\n";
        for (const auto& r : resources) {
            file << quote(r.id) << ","
                 << kind_to_string(r.kind) << ","
                 << status_to_string(r.status) << ","
                 << r.capacity << ","
                 << quote(r.requester) << ","
                 << quote(r.program) << ","
                 << quote(r.requested_at) << ","
                 << quote(r.assigned_at) << "\n";
        }

        file.flush();
        if (!file.good()) {
            std::remove(tmp_path.c_str());
            throw PersistenceError("Failed to write resource file " + tmp_path);
        }
    }

    if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        std::string reason = strerror(errno);
        std::remove(tmp_path.c_str());
        throw PersistenceError("Failed to replace " + path_ + ": " + reason);
    }

    Logger::debug("Resource table persisted to " + path_ + " (" +
                  std::to_string(resources.size()) + " rows)");
}

} // namespace roomalloc
