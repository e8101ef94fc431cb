#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

namespace auditfusion {

/**
 * @brief Append-only JSON-lines file (one row per line).
 *
 * The file is opened in append mode on construction and stays open.
 * read_all() reopens the path for reading, so rows written by earlier
 * processes are visible.
 *
 * Not internally synchronized; the owning store serializes access.
 */
class JsonlFile {
public:
    /// @throws PersistenceError if the file cannot be opened
    explicit JsonlFile(std::string path);
    ~JsonlFile();

    JsonlFile(const JsonlFile&) = delete;
    JsonlFile& operator=(const JsonlFile&) = delete;

    /// Append one row (newline added). Returns false on a stream error.
    [[nodiscard]] bool write(std::string_view json_line);

    /**
     * @brief Encode one row as a single line.
     * @throws PersistenceError if the row cannot be encoded (e.g. invalid UTF-8)
     */
    [[nodiscard]] static std::string serialize(const nlohmann::json& row);

    /// @throws PersistenceError on an encoding or stream error
    void append(const nlohmann::json& row);

    void flush();
    void close();

    /**
     * @brief Parse every row currently in the file.
     * Blank lines are ignored.
     * @throws PersistenceError on unreadable file or malformed row
     */
    [[nodiscard]] std::vector<nlohmann::json> read_all() const;

    [[nodiscard]] const std::string& path() const { return path_; }
    [[nodiscard]] size_t current_file_size() const { return current_file_size_; }

private:
    std::string path_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
};

} // namespace auditfusion
