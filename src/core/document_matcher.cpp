#include "core/document_matcher.hpp"
#include "core/sync_id.hpp"
#include "crypto/digest.hpp"

#include <algorithm>
#include <iterator>
#include <map>

namespace docsync::matcher {

namespace {

// Length-prefixed fields keep the encoding unambiguous ("ab"+"c" != "a"+"bc").
void append_field(std::string& out, std::string_view tag, std::string_view value) {
    out.append(tag);
    out += ':';
    out.append(std::to_string(value.size()));
    out += ':';
    out.append(value);
    out += '\n';
}

} // namespace

Result<std::optional<Document>, Error> match_by_sync_id(const std::vector<Document>& documents,
                                                        std::string_view sync_id) {
    auto parsed = sync_id::parse(sync_id);
    if (parsed.is_err()) {
        return propagate<std::optional<Document>>(parsed);
    }
    const auto& wanted = parsed.unwrap();

    for (const auto& doc : documents) {
        if (doc.has_sync_id() && sync_id::normalize(*doc.sync_id) == wanted) {
            return Result<std::optional<Document>, Error>::ok(doc);
        }
    }
    return Result<std::optional<Document>, Error>::ok(std::nullopt);
}

std::string content_hash(const Document& doc) {
    auto refs = doc.attachment_refs;
    std::sort(refs.begin(), refs.end());

    std::string canonical;
    append_field(canonical, "title", doc.title);
    append_field(canonical, "category", doc.category);
    append_field(canonical, "notes", doc.notes.value_or(""));
    append_field(canonical, "refs", std::to_string(refs.size()));
    for (const auto& ref : refs) {
        append_field(canonical, "ref", ref);
    }
    return crypto::sha256_hex(canonical);
}

std::vector<Document> match_by_content_hash(const std::vector<Document>& documents,
                                            std::string_view hash) {
    std::vector<Document> matches;
    for (const auto& doc : documents) {
        if (content_hash(doc) == hash) {
            matches.push_back(doc);
        }
    }
    return matches;
}

bool have_same_content(const Document& a, const Document& b) {
    return content_hash(a) == content_hash(b);
}

std::vector<Document> find_without_identity(const std::vector<Document>& documents) {
    std::vector<Document> out;
    std::copy_if(documents.begin(), documents.end(), std::back_inserter(out),
                 [](const Document& d) { return !d.has_sync_id(); });
    return out;
}

IdentityReport validate_unique_identities(const std::vector<Document>& documents) {
    IdentityReport report;
    report.total_documents = documents.size();

    std::map<std::string, std::vector<Document>> groups;
    for (const auto& doc : documents) {
        if (!doc.has_sync_id()) {
            ++report.without_identity;
            continue;
        }
        ++report.with_identity;
        groups[sync_id::normalize(*doc.sync_id)].push_back(doc);
    }

    for (auto& [id, members] : groups) {
        if (members.size() > 1) {
            report.duplicates.push_back(DuplicateIdentity{.sync_id = id, .documents = std::move(members)});
        }
    }
    return report;
}

std::string IdentityReport::summary() const {
    if (duplicates.empty()) {
        return "all " + std::to_string(with_identity) + " sync ids are unique";
    }
    std::string out;
    for (const auto& dup : duplicates) {
        out += "duplicate sync id " + dup.sync_id + ": " +
               std::to_string(dup.documents.size()) + " documents (";
        for (size_t i = 0; i < dup.documents.size(); ++i) {
            if (i > 0) out += ", ";
            out += "\"" + dup.documents[i].title + "\"";
        }
        out += ")\n";
    }
    return out;
}

} // namespace docsync::matcher
