#pragma once

#include "recollect/common/result.hpp"

#include <sqlite3.h>

#include <filesystem>
#include <string>
#include <vector>

namespace recollect::memory {

[[nodiscard]] std::string sha256_hex(const std::string &text);

[[nodiscard]] std::vector<unsigned char> vector_to_blob(const std::vector<float> &values);
[[nodiscard]] std::vector<float> blob_to_vector(const void *blob, int bytes);

/// Run one or more statements; failures carry ErrorCode::StoreIo.
[[nodiscard]] common::Status exec_sql(sqlite3 *db, const std::string &sql);

/// NULL-safe text column accessor.
[[nodiscard]] std::string column_text(sqlite3_stmt *stmt, int column);

/// Open `path` (creating parent directories) with WAL, synchronous=FULL and a busy timeout.
[[nodiscard]] common::Result<sqlite3 *> open_database(const std::filesystem::path &path);

/// StoreIo status carrying the connection's last error.
[[nodiscard]] common::Status sqlite_error(sqlite3 *db, const std::string &what);

} // namespace recollect::memory
