/**
 * ArchiveTypes.cpp - Name helpers for archive enums
 */

#include "tsarchive/ArchiveTypes.h"

std::string chunk_status_name(ChunkStatus status) {
    switch (status) {
        case ChunkStatus::Complete: return "complete";
        case ChunkStatus::Incomplete: return "incomplete";
        case ChunkStatus::Empty: return "empty";
    }
    return "unknown";
}

std::string store_error_kind_name(StoreIOError::Kind kind) {
    switch (kind) {
        case StoreIOError::Kind::Io: return "io";
        case StoreIOError::Kind::NoSpace: return "no_space";
        case StoreIOError::Kind::Permission: return "permission";
        case StoreIOError::Kind::Conflict: return "conflict";
    }
    return "unknown";
}
