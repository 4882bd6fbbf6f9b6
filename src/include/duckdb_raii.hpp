#pragma once

#include <duckdb.h>
#include <string>
#include <utility>

namespace sqlbatch {

/**
 * RAII wrapper for DuckDB string pointers.
 * Frees memory allocated by DuckDB (e.g. duckdb_value_varchar) on destruction.
 * Supports move semantics but not copy semantics.
 */
class DuckDBString {
public:
    explicit DuckDBString(char* ptr) noexcept : ptr_(ptr) {}

    ~DuckDBString() {
        if (ptr_) {
            duckdb_free(ptr_);
        }
    }

    DuckDBString(const DuckDBString&) = delete;
    DuckDBString& operator=(const DuckDBString&) = delete;

    DuckDBString(DuckDBString&& other) noexcept : ptr_(other.ptr_) {
        other.ptr_ = nullptr;
    }

    DuckDBString& operator=(DuckDBString&& other) noexcept {
        if (this != &other) {
            if (ptr_) {
                duckdb_free(ptr_);
            }
            ptr_ = other.ptr_;
            other.ptr_ = nullptr;
        }
        return *this;
    }

    const char* get() const noexcept { return ptr_; }

    /**
     * Convert to std::string.
     * Returns empty string if pointer is null.
     */
    std::string to_string() const {
        return ptr_ ? std::string(ptr_) : "";
    }

    bool is_null() const noexcept { return ptr_ == nullptr; }

private:
    char* ptr_;
};

/**
 * RAII wrapper for DuckDB result structures.
 * Destroys the result when going out of scope, including results of failed
 * queries (which still own their error message).
 */
class DuckDBResult {
public:
    DuckDBResult() noexcept : has_result_(false) {}

    ~DuckDBResult() {
        if (has_result_) {
            duckdb_destroy_result(&result_);
        }
    }

    DuckDBResult(const DuckDBResult&) = delete;
    DuckDBResult& operator=(const DuckDBResult&) = delete;

    DuckDBResult(DuckDBResult&& other) noexcept
        : has_result_(other.has_result_) {
        if (other.has_result_) {
            result_ = other.result_;
            other.has_result_ = false;
        }
    }

    DuckDBResult& operator=(DuckDBResult&& other) noexcept {
        if (this != &other) {
            if (has_result_) {
                duckdb_destroy_result(&result_);
            }
            has_result_ = other.has_result_;
            if (other.has_result_) {
                result_ = other.result_;
                other.has_result_ = false;
            }
        }
        return *this;
    }

    /**
     * Get non-const pointer to the result structure.
     * Use this to pass to DuckDB functions that populate the result.
     */
    duckdb_result* get() noexcept { return &result_; }

    const duckdb_result* get() const noexcept { return &result_; }

    /**
     * Mark the result as initialized (call after duckdb_query, whatever its return state).
     */
    void set_initialized() noexcept { has_result_ = true; }

    bool has_result() const noexcept { return has_result_; }

    void reset() {
        if (has_result_) {
            duckdb_destroy_result(&result_);
            has_result_ = false;
        }
    }

private:
    duckdb_result result_;
    bool has_result_;
};

/**
 * RAII wrapper for a duckdb_config under construction.
 * The config is only needed until duckdb_open_ext returns.
 */
class DuckDBConfig {
public:
    DuckDBConfig() : config_(nullptr) {
        if (duckdb_create_config(&config_) == DuckDBError) {
            config_ = nullptr;
        }
    }

    ~DuckDBConfig() {
        if (config_) {
            duckdb_destroy_config(&config_);
        }
    }

    DuckDBConfig(const DuckDBConfig&) = delete;
    DuckDBConfig& operator=(const DuckDBConfig&) = delete;

    duckdb_config get() const noexcept { return config_; }

    bool is_valid() const noexcept { return config_ != nullptr; }

    /**
     * Set a single option; returns false if DuckDB rejects the name or value.
     */
    bool set(const std::string& key, const std::string& value) {
        return config_ && duckdb_set_config(config_, key.c_str(), value.c_str()) != DuckDBError;
    }

private:
    duckdb_config config_;
};

} // namespace sqlbatch
