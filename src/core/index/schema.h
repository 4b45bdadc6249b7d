#pragma once

namespace rc {

// Per-connection pragmas, safe on every open.
constexpr const char* kConnectionPragmas = R"(
PRAGMA busy_timeout = 30000;
PRAGMA foreign_keys = ON;
PRAGMA cache_size = -32768;
PRAGMA mmap_size = 30000000;
)";

// Database-level pragmas. The lexical database is built next to the live one
// and renamed into place, so it uses a rollback journal rather than WAL to keep
// the whole index in a single file.
constexpr const char* kDatabasePragmas = R"(
PRAGMA journal_mode = DELETE;
PRAGMA synchronous = NORMAL;
PRAGMA application_id = 0x52434c;
PRAGMA user_version = 1;
)";

constexpr int kCurrentSchemaVersion = 1;

// One row per item, one row per retrieval unit (chunk or whole item).
// search_index.content is the BM25 text: title, each tag twice, description, body.
constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS items (
    id TEXT PRIMARY KEY,
    title TEXT NOT NULL,
    body TEXT NOT NULL,
    tags TEXT NOT NULL DEFAULT '[]',
    metadata TEXT NOT NULL DEFAULT '{}',
    modified_at REAL NOT NULL,
    indexed_at REAL NOT NULL,
    status TEXT NOT NULL DEFAULT 'active'
);

CREATE INDEX IF NOT EXISTS idx_items_status ON items(status);
CREATE INDEX IF NOT EXISTS idx_items_modified_at ON items(modified_at DESC);

CREATE TABLE IF NOT EXISTS documents (
    doc_id TEXT PRIMARY KEY,
    item_id TEXT NOT NULL REFERENCES items(id) ON DELETE CASCADE,
    chunk_index INTEGER NOT NULL,
    chunk_total INTEGER NOT NULL,
    start_offset INTEGER NOT NULL,
    end_offset INTEGER NOT NULL,
    model_id TEXT,
    embedding BLOB,
    UNIQUE(item_id, chunk_index)
);

CREATE INDEX IF NOT EXISTS idx_documents_item_id ON documents(item_id);

CREATE VIRTUAL TABLE IF NOT EXISTS search_index USING fts5(
    doc_id UNINDEXED,
    content,
    tokenize = 'unicode61 remove_diacritics 2'
);

-- build_id: shared with vectors.meta.json and index.json of the same build
CREATE TABLE IF NOT EXISTS settings (
    key TEXT PRIMARY KEY,
    value TEXT NOT NULL
);
)";

} // namespace rc
