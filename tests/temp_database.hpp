#pragma once

#include <gtest/gtest.h>
#include <sqlite3.h>
#include <cstdio>
#include <string>

namespace riskwatch::test {

/// A database file under the test temp dir, removed on destruction
/// execute() runs SQL over a second connection, e.g. to install a trigger
/// that makes the store's next write fail
class TempDatabase {
public:
    explicit TempDatabase(const std::string& name)
        : path_(::testing::TempDir() + "riskwatch_" + name + ".db")
    {
        remove_files();
    }

    ~TempDatabase() {
        remove_files();
    }

    TempDatabase(const TempDatabase&) = delete;
    TempDatabase& operator=(const TempDatabase&) = delete;

    [[nodiscard]] const std::string& path() const noexcept {
        return path_;
    }

    void execute(const std::string& sql) const {
        sqlite3* db = nullptr;
        int rc = sqlite3_open(path_.c_str(), &db);
        std::string message;
        if (rc == SQLITE_OK) {
            char* err = nullptr;
            rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
            if (err != nullptr) {
                message = err;
                sqlite3_free(err);
            }
        }
        sqlite3_close(db);
        ASSERT_EQ(rc, SQLITE_OK) << sql << ": " << message;
    }

private:
    void remove_files() const {
        for (const char* suffix : {"", "-wal", "-shm"}) {
            std::remove((path_ + suffix).c_str());
        }
    }

    std::string path_;
};

}  // namespace riskwatch::test
