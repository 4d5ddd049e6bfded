#pragma once

#include "docqa_core/db/connection_pool.hpp"
#include <filesystem>
#include <memory>
#include <string>

namespace docqa_core {

// Owns the schema and the connection pool of one SQLite database file.
class DatabaseManager {
public:
    // Creates the parent directory and schema, then opens pool_size connections.
    DatabaseManager(const std::filesystem::path& db_path, int pool_size);
    ~DatabaseManager();

    // These methods are used by the PooledConnection guard
    std::unique_ptr<sqlite::database> get_connection();
    void return_connection(std::unique_ptr<sqlite::database> conn);

    void shutdown();
    bool is_open() const { return is_open_; }

    const std::filesystem::path& db_path() const { return db_path_; }

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

private:
    void setup_schema();

    std::filesystem::path db_path_;
    std::unique_ptr<ConnectionPool> pool_;
    bool is_open_ = false;
};

} // namespace docqa_core
