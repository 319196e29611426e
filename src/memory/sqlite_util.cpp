#include "recollect/memory/sqlite_util.hpp"

#include <openssl/sha.h>

#include <cstring>
#include <iomanip>
#include <sstream>

namespace recollect::memory {

std::string sha256_hex(const std::string &text) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const unsigned char c : digest) {
    stream << std::setw(2) << static_cast<int>(c);
  }
  return stream.str();
}

std::vector<unsigned char> vector_to_blob(const std::vector<float> &values) {
  std::vector<unsigned char> blob(values.size() * sizeof(float));
  if (!blob.empty()) {
    std::memcpy(blob.data(), values.data(), blob.size());
  }
  return blob;
}

std::vector<float> blob_to_vector(const void *blob, const int bytes) {
  if (blob == nullptr || bytes <= 0 || (bytes % static_cast<int>(sizeof(float)) != 0)) {
    return {};
  }

  const std::size_t length = static_cast<std::size_t>(bytes) / sizeof(float);
  std::vector<float> values(length);
  std::memcpy(values.data(), blob, static_cast<std::size_t>(bytes));
  return values;
}

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(common::ErrorCode::StoreIo, msg);
  }
  return common::Status::success();
}

std::string column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = sqlite3_column_text(stmt, column);
  if (text == nullptr) {
    return "";
  }
  return reinterpret_cast<const char *>(text);
}

common::Result<sqlite3 *> open_database(const std::filesystem::path &path) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      return common::Result<sqlite3 *>::failure(
          common::ErrorCode::StoreIo,
          "failed to create " + path.parent_path().string() + ": " + ec.message());
    }
  }

  sqlite3 *db = nullptr;
  if (sqlite3_open(path.string().c_str(), &db) != SQLITE_OK) {
    const std::string msg = db == nullptr ? "out of memory" : sqlite3_errmsg(db);
    if (db != nullptr) {
      sqlite3_close(db);
    }
    return common::Result<sqlite3 *>::failure(common::ErrorCode::StoreIo,
                                              "cannot open " + path.string() + ": " + msg);
  }

  sqlite3_busy_timeout(db, 5000);
  for (const char *pragma : {"PRAGMA journal_mode=WAL;", "PRAGMA synchronous=FULL;"}) {
    auto status = exec_sql(db, pragma);
    if (!status.ok()) {
      sqlite3_close(db);
      return common::Result<sqlite3 *>::failure(status);
    }
  }
  return common::Result<sqlite3 *>::success(db);
}

common::Status sqlite_error(sqlite3 *db, const std::string &what) {
  const std::string detail = db == nullptr ? "database is not open" : sqlite3_errmsg(db);
  return common::Status::error(common::ErrorCode::StoreIo, what + ": " + detail);
}

} // namespace recollect::memory
