#include "core/sync_id.hpp"
#include "core/types.hpp"

#include <algorithm>
#include <cctype>

namespace docsync::sync_id {

namespace {

bool is_hex(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

} // namespace

std::string generate() {
    return Uuid::generate().to_string();
}

std::string normalize(std::string_view raw) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!raw.empty() && is_space(static_cast<unsigned char>(raw.front()))) raw.remove_prefix(1);
    while (!raw.empty() && is_space(static_cast<unsigned char>(raw.back()))) raw.remove_suffix(1);

    std::string out(raw);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool is_valid(std::string_view raw) {
    const auto id = normalize(raw);
    if (id.size() != 36) return false;

    for (size_t i = 0; i < id.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (id[i] != '-') return false;
        } else if (!is_hex(id[i])) {
            return false;
        }
    }
    // xxxxxxxx-xxxx-4xxx-[89ab]xxx-xxxxxxxxxxxx
    if (id[14] != '4') return false;
    const char variant = id[19];
    return variant == '8' || variant == '9' || variant == 'a' || variant == 'b';
}

Result<std::string, Error> parse(std::string_view raw) {
    if (!is_valid(raw)) {
        return Result<std::string, Error>::err(
            Error::validation("Malformed sync id: '" + std::string(raw) + "'"));
    }
    return Result<std::string, Error>::ok(normalize(raw));
}

} // namespace docsync::sync_id
