#include "store/jsonl_file.hpp"
#include "core/error.hpp"

#include <filesystem>
#include <format>

namespace auditfusion {

JsonlFile::JsonlFile(std::string path)
    : path_(std::move(path)) {
    file_stream_.open(path_, std::ios::app);
    if (!file_stream_.is_open()) {
        throw PersistenceError("Failed to open store file: " + path_);
    }

    std::error_code ec;
    const auto file_size = std::filesystem::file_size(path_, ec);
    if (!ec) {
        current_file_size_ = static_cast<size_t>(file_size);
    }
}

JsonlFile::~JsonlFile() {
    close();
}

bool JsonlFile::write(std::string_view json_line) {
    file_stream_.write(json_line.data(), static_cast<std::streamsize>(json_line.size()));
    file_stream_.put('\n');
    current_file_size_ += json_line.size() + 1;
    return file_stream_.good();
}

std::string JsonlFile::serialize(const nlohmann::json& row) {
    try {
        return row.dump();
    } catch (const nlohmann::json::exception& e) {
        throw PersistenceError(std::format("Cannot encode store row: {}", e.what()));
    }
}

void JsonlFile::append(const nlohmann::json& row) {
    if (!write(serialize(row))) {
        throw PersistenceError("Write failed on store file: " + path_);
    }
}

void JsonlFile::flush() {
    file_stream_.flush();
    if (!file_stream_.good()) {
        throw PersistenceError("Flush failed on store file: " + path_);
    }
}

void JsonlFile::close() {
    if (file_stream_.is_open()) {
        file_stream_.flush();
        file_stream_.close();
    }
}

std::vector<nlohmann::json> JsonlFile::read_all() const {
    std::ifstream in(path_);
    if (!in.is_open()) {
        throw PersistenceError("Failed to read store file: " + path_);
    }

    std::vector<nlohmann::json> rows;
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        try {
            rows.push_back(nlohmann::json::parse(line));
        } catch (const nlohmann::json::parse_error& e) {
            throw PersistenceError(std::format("{}:{}: malformed row: {}", path_, line_no, e.what()));
        }
    }
    return rows;
}

} // namespace auditfusion
