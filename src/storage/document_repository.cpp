#include "storage/document_repository.hpp"
#include "core/sync_id.hpp"
#include "storage/document_codec.hpp"

namespace docsync::storage {

namespace {

constexpr std::string_view kDocumentColumns = R"SQL(
    SELECT local_id, sync_id, user_id, title, category, notes, attachment_refs,
           renewal_date, version, server_version, created_at, last_modified,
           sync_state, conflict_id, deleted, deleted_at
    FROM documents
)SQL";

Result<Document, Error> row_to_document(Statement& stmt) {
    auto refs = codec::decode_refs(stmt.column_text(6));
    if (refs.is_err()) return propagate<Document>(refs);

    const auto state_text = stmt.column_text(12);
    const auto state = parse_sync_state(state_text);
    if (!state) {
        return Result<Document, Error>::err(
            Error::storage("Unknown sync_state '" + state_text + "' in documents"));
    }

    return Result<Document, Error>::ok(Document{
        .local_id = stmt.column_int64(0),
        .sync_id = stmt.column_optional_text(1),
        .user_id = stmt.column_text(2),
        .title = stmt.column_text(3),
        .category = stmt.column_text(4),
        .notes = stmt.column_optional_text(5),
        .attachment_refs = std::move(refs).unwrap(),
        .renewal_date = stmt.column_optional_timestamp(7),
        .version = stmt.column_int64(8),
        .server_version = stmt.column_int64(9),
        .created_at = stmt.column_timestamp(10),
        .last_modified = stmt.column_timestamp(11),
        .sync_state = *state,
        .conflict_id = stmt.column_optional_text(13),
        .deleted = stmt.column_bool(14),
        .deleted_at = stmt.column_optional_timestamp(15),
    });
}

Result<std::vector<Document>, Error> collect(Result<std::vector<Result<Document, Error>>, Error> rows) {
    if (rows.is_err()) return propagate<std::vector<Document>>(rows);
    std::vector<Document> docs;
    for (auto& row : rows.unwrap()) {
        if (row.is_err()) return propagate<std::vector<Document>>(row);
        docs.push_back(std::move(row).unwrap());
    }
    return Result<std::vector<Document>, Error>::ok(std::move(docs));
}

Result<FileAttachment, Error> row_to_attachment(Statement& stmt) {
    const auto state_text = stmt.column_text(7);
    const auto state = parse_sync_state(state_text);
    if (!state) {
        return Result<FileAttachment, Error>::err(
            Error::storage("Unknown sync_state '" + state_text + "' in file_attachments"));
    }
    return Result<FileAttachment, Error>::ok(FileAttachment{
        .sync_id = stmt.column_text(0),
        .document_sync_id = stmt.column_text(1),
        .file_name = stmt.column_text(2),
        .blob_key = stmt.column_optional_text(3),
        .local_ref = stmt.column_optional_text(4),
        .file_size = stmt.column_int64(5),
        .checksum = stmt.column_optional_text(6),
        .sync_state = *state,
    });
}

} // namespace

Result<Document, Error> DocumentRepository::save(const Document& input) {
    auto valid = validate(input);
    if (valid.is_err()) return propagate<Document>(valid);

    Document doc = input;
    if (doc.sync_id) doc.sync_id = sync_id::normalize(*doc.sync_id);
    const auto refs = codec::encode_refs(doc.attachment_refs);
    const std::string state(to_string(doc.sync_state));

    if (doc.local_id == 0) {
        auto inserted = db_.run(R"SQL(
            INSERT INTO documents (sync_id, user_id, title, category, notes, attachment_refs,
                                   renewal_date, version, server_version, created_at,
                                   last_modified, sync_state, conflict_id, deleted, deleted_at)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
        )SQL",
            doc.sync_id, doc.user_id, doc.title, doc.category, doc.notes, refs,
            doc.renewal_date, doc.version, doc.server_version, doc.created_at,
            doc.last_modified, state, doc.conflict_id, doc.deleted, doc.deleted_at);
        if (inserted.is_err()) return propagate<Document>(inserted);
        doc.local_id = db_.last_insert_rowid();
        return Result<Document, Error>::ok(std::move(doc));
    }

    auto updated = db_.run(R"SQL(
        UPDATE documents SET sync_id = ?, user_id = ?, title = ?, category = ?, notes = ?,
               attachment_refs = ?, renewal_date = ?, version = ?, server_version = ?,
               created_at = ?, last_modified = ?, sync_state = ?, conflict_id = ?,
               deleted = ?, deleted_at = ?
        WHERE local_id = ?;
    )SQL",
        doc.sync_id, doc.user_id, doc.title, doc.category, doc.notes, refs,
        doc.renewal_date, doc.version, doc.server_version, doc.created_at,
        doc.last_modified, state, doc.conflict_id, doc.deleted, doc.deleted_at,
        doc.local_id);
    if (updated.is_err()) return propagate<Document>(updated);
    if (updated.unwrap() == 0) {
        return Result<Document, Error>::err(
            Error::not_found("No document with local id " + std::to_string(doc.local_id)));
    }
    return Result<Document, Error>::ok(std::move(doc));
}

Result<std::vector<Document>, Error> DocumentRepository::select(std::string_view where_clause,
                                                                const std::string& arg) {
    std::string sql(kDocumentColumns);
    sql += where_clause;
    sql += " ORDER BY local_id;";
    if (arg.empty() && where_clause.empty()) {
        return collect(db_.query<Result<Document, Error>>(sql, row_to_document));
    }
    return collect(db_.query<Result<Document, Error>>(sql, row_to_document, arg));
}

Result<std::optional<Document>, Error> DocumentRepository::get(std::int64_t local_id) {
    std::string sql(kDocumentColumns);
    sql += " WHERE local_id = ?;";
    auto docs = collect(db_.query<Result<Document, Error>>(sql, row_to_document, local_id));
    if (docs.is_err()) return propagate<std::optional<Document>>(docs);
    if (docs.unwrap().empty()) return Result<std::optional<Document>, Error>::ok(std::nullopt);
    return Result<std::optional<Document>, Error>::ok(docs.unwrap().front());
}

Result<std::optional<Document>, Error> DocumentRepository::get_by_sync_id(std::string_view raw) {
    auto docs = select(" WHERE sync_id = ?", sync_id::normalize(raw));
    if (docs.is_err()) return propagate<std::optional<Document>>(docs);
    if (docs.unwrap().empty()) return Result<std::optional<Document>, Error>::ok(std::nullopt);
    return Result<std::optional<Document>, Error>::ok(docs.unwrap().front());
}

Result<std::vector<Document>, Error> DocumentRepository::all() {
    return select("", "");
}

Result<std::vector<Document>, Error> DocumentRepository::in_state(SyncState state) {
    return select(" WHERE sync_state = ?", std::string(to_string(state)));
}

Result<std::vector<Document>, Error> DocumentRepository::for_user(const std::string& user_id) {
    return select(" WHERE user_id = ?", user_id);
}

Result<bool, Error> DocumentRepository::remove(std::int64_t local_id) {
    auto removed = db_.run("DELETE FROM documents WHERE local_id = ?;", local_id);
    if (removed.is_err()) return propagate<bool>(removed);
    return Result<bool, Error>::ok(removed.unwrap() > 0);
}

Result<void, Error> DocumentRepository::save_attachment(const FileAttachment& a) {
    auto need = transfer_need(a);
    if (need.is_err()) return propagate<void>(need);

    auto saved = db_.run(R"SQL(
        INSERT INTO file_attachments (sync_id, document_sync_id, file_name, blob_key,
                                      local_ref, file_size, checksum, sync_state)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(sync_id) DO UPDATE SET
            document_sync_id = excluded.document_sync_id,
            file_name = excluded.file_name,
            blob_key = excluded.blob_key,
            local_ref = excluded.local_ref,
            file_size = excluded.file_size,
            checksum = excluded.checksum,
            sync_state = excluded.sync_state;
    )SQL",
        a.sync_id, a.document_sync_id, a.file_name, a.blob_key, a.local_ref,
        a.file_size, a.checksum, std::string(to_string(a.sync_state)));
    if (saved.is_err()) return propagate<void>(saved);
    return Result<void, Error>::ok();
}

Result<std::vector<FileAttachment>, Error> DocumentRepository::attachments_for(
    const std::string& document_sync_id) {
    auto rows = db_.query<Result<FileAttachment, Error>>(R"SQL(
        SELECT sync_id, document_sync_id, file_name, blob_key, local_ref,
               file_size, checksum, sync_state
        FROM file_attachments WHERE document_sync_id = ? ORDER BY rowid;
    )SQL", row_to_attachment, document_sync_id);
    if (rows.is_err()) return propagate<std::vector<FileAttachment>>(rows);

    std::vector<FileAttachment> out;
    for (auto& row : rows.unwrap()) {
        if (row.is_err()) return propagate<std::vector<FileAttachment>>(row);
        out.push_back(std::move(row).unwrap());
    }
    return Result<std::vector<FileAttachment>, Error>::ok(std::move(out));
}

Result<int, Error> DocumentRepository::remove_attachments_for(const std::string& document_sync_id) {
    return db_.run("DELETE FROM file_attachments WHERE document_sync_id = ?;", document_sync_id);
}

} // namespace docsync::storage
