/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: resource_store.h

    Description:
        Durable backing of a resource table: one CSV file, one row per
        resource, with a header row.

            id,kind,status,capacity,requester,program,requested_at,assigned_at
            S001,room,available,40,,,,
            L001,lab,assigned,25,Engineering,Systems,2026-...,2026-...

        The file is rewritten in full on every save (write to "<path>.tmp",
        then rename over the previous file) and read in full at startup. There is
        no append mode and no partial update.

    Error Handling:
        - load(): PersistenceError if the file cannot be opened; malformed
          rows are logged and skipped
        - save(): PersistenceError if the temporary file cannot be written or
          renamed; the previous file is left untouched in that case
*******************************************************************************/

#ifndef RESOURCE_STORE_H
#define RESOURCE_STORE_H

#include "resources/resource.h"

#include <string>
#include <vector>

namespace roomalloc {

class ResourceStore {
private:
    std::string path_;

    static std::vector<std::string> split(const std::string& line);
    static std::string trim(const std::string& str);
    static std::string quote(const std::string& field);
    // true while a quoted field is still open at the end of `record`
    static bool has_open_quote(const std::string& record);

public:
    explicit ResourceStore(const std::string& path) : path_(path) {}

    const std::string& path() const { return path_; }

    bool exists() const;

    std::vector<Resource> load() const;

    void save(const std::vector<Resource>& resources) const;
};

} // namespace roomalloc

#endif // RESOURCE_STORE_H
