/**
 * ChunkFile.cpp - Implementation
 */

#include "tsarchive/ChunkFile.h"
#include "tsarchive/TimeUtils.h"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

namespace {
    const char* DATE_COLUMN = "Date";

    bool needs_quoting(const std::string& field) {
        return field.find_first_of(",\"\n\r") != std::string::npos;
    }

    void append_field(std::string& out, const std::string& field) {
        if (!needs_quoting(field)) {
            out += field;
            return;
        }
        out += '"';
        for (char c : field) {
            if (c == '"') out += '"';
            out += c;
        }
        out += '"';
    }

    // Splits one logical CSV record starting at pos; advances pos past the
    // record terminator. Quoted fields may span lines.
    bool next_record(const std::string& text, size_t& pos, std::vector<std::string>& fields) {
        fields.clear();
        if (pos >= text.size()) return false;

        std::string field;
        bool in_quotes = false;
        while (pos < text.size()) {
            char c = text[pos++];
            if (in_quotes) {
                if (c == '"') {
                    if (pos < text.size() && text[pos] == '"') {
                        field += '"';
                        ++pos;
                    } else {
                        in_quotes = false;
                    }
                } else {
                    field += c;
                }
            } else if (c == '"') {
                in_quotes = true;
            } else if (c == ',') {
                fields.push_back(std::move(field));
                field.clear();
            } else if (c == '\n') {
                break;
            } else if (c != '\r') {
                field += c;
            }
        }
        if (in_quotes) {
            throw std::runtime_error("Unterminated quoted field in CSV");
        }
        fields.push_back(std::move(field));
        return true;
    }

    int64_t parse_row_timestamp(const std::string& field) {
        auto ts = parse_utc_iso(field);
        if (!ts) {
            throw std::runtime_error("Malformed row timestamp '" + field + "'");
        }
        return *ts;
    }

    std::string read_whole_file(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            throw chunk_file::make_store_error("Failed to open " + path, errno);
        }
        std::ostringstream oss;
        oss << file.rdbuf();
        return oss.str();
    }
}

namespace chunk_file {

StoreIOError make_store_error(const std::string& context, int err) {
    StoreIOError::Kind kind = StoreIOError::Kind::Io;
    switch (err) {
        case ENOSPC:
        case EDQUOT:
            kind = StoreIOError::Kind::NoSpace;
            break;
        case EACCES:
        case EPERM:
        case EROFS:
            kind = StoreIOError::Kind::Permission;
            break;
        default:
            break;
    }
    std::string message = context;
    if (err != 0) message += ": " + std::string(std::strerror(err));
    return StoreIOError(kind, message);
}

StoreIOError make_store_error(const std::string& context, const std::error_code& ec) {
    if (ec.category() == std::generic_category() || ec.category() == std::system_category()) {
        return make_store_error(context, ec.value());
    }
    return StoreIOError(StoreIOError::Kind::Io, context + ": " + ec.message());
}

std::string to_csv(const RowTable& table) {
    if (table.rows.empty()) return std::string();

    std::string out;
    out += DATE_COLUMN;
    for (const auto& column : table.columns) {
        out += ',';
        append_field(out, column);
    }
    out += '\n';

    for (const auto& row : table.rows) {
        out += format_utc_iso(row.timestamp);
        for (const auto& value : row.values) {
            out += ',';
            append_field(out, value);
        }
        out += '\n';
    }
    return out;
}

RowTable parse_csv(const std::string& text) {
    RowTable table;
    size_t pos = 0;
    std::vector<std::string> fields;

    if (!next_record(text, pos, fields)) return table;
    if (fields.empty() || fields[0] != DATE_COLUMN) {
        throw std::runtime_error("CSV header must start with a Date column");
    }
    table.columns.assign(fields.begin() + 1, fields.end());

    while (next_record(text, pos, fields)) {
        if (fields.size() == 1 && fields[0].empty()) continue;
        RowTable::Row row;
        row.timestamp = parse_row_timestamp(fields[0]);
        row.values.assign(fields.begin() + 1, fields.end());
        table.rows.push_back(std::move(row));
    }
    return table;
}

void write_rows(const std::string& path, const RowTable& table) {
    std::string content = to_csv(table);

    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw make_store_error("Failed to create " + path, errno);
    }

    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            throw make_store_error("Failed to write " + path, err);
        }
        written += static_cast<size_t>(n);
    }

    if (::fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        throw make_store_error("Failed to sync " + path, err);
    }
    if (::close(fd) != 0) {
        throw make_store_error("Failed to close " + path, errno);
    }
}

ChunkBounds read_chunk_bounds(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw make_store_error("Failed to open " + path, errno);
    }

    ChunkBounds bounds;
    std::string line;
    bool header_seen = false;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        if (!header_seen) {
            header_seen = true;
            continue;
        }
        // Timestamps are never quoted, so the first comma ends the field.
        // Continuation lines of multi-line quoted values never parse as a timestamp.
        std::string field = line.substr(0, line.find(','));
        auto ts = parse_utc_iso(field);
        if (!ts) continue;

        if (bounds.empty) {
            bounds.first_timestamp = *ts;
            bounds.empty = false;
        }
        bounds.last_timestamp = *ts;
        ++bounds.row_count;
    }
    if (file.bad()) {
        throw make_store_error("Failed to read " + path, errno);
    }
    return bounds;
}

RowTable read_rows(const std::string& path) {
    std::string text = read_whole_file(path);
    try {
        return parse_csv(text);
    } catch (const std::runtime_error& e) {
        throw StoreIOError(StoreIOError::Kind::Io, "Corrupt chunk " + path + ": " + e.what());
    }
}

}  // namespace chunk_file
