#include "skill_document.hpp"
#include "utils.hpp"
#include <sstream>

namespace skilldeck {

namespace {

const char* const kRequiredKeys[] = {"name", "description", "when_to_use"};

std::string strip_quotes(const std::string& raw) {
    std::string value = trim(raw);
    if (value.size() < 2) return value;
    char q = value.front();
    if ((q != '"' && q != '\'') || value.back() != q) return value;

    std::string inner = value.substr(1, value.size() - 2);
    if (q == '\'') {
        // YAML single quotes: '' is a literal quote
        std::string out;
        for (size_t i = 0; i < inner.size(); i++) {
            out += inner[i];
            if (inner[i] == '\'' && i + 1 < inner.size() && inner[i + 1] == '\'') i++;
        }
        return out;
    }

    std::string out;
    out.reserve(inner.size());
    for (size_t i = 0; i < inner.size(); i++) {
        if (inner[i] == '\\' && i + 1 < inner.size()) {
            char n = inner[++i];
            switch (n) {
                case 'n': out += '\n'; break;
                case 't': out += '\t'; break;
                default:  out += n;    break;
            }
        } else {
            out += inner[i];
        }
    }
    return out;
}

int brace_delta(const std::string& s) {
    int depth = 0;
    bool in_quotes = false;
    for (size_t i = 0; i < s.size(); i++) {
        char c = s[i];
        if (c == '"' && (i == 0 || s[i - 1] != '\\')) {
            in_quotes = !in_quotes;
            continue;
        }
        if (in_quotes) continue;
        if (c == '{') depth++;
        else if (c == '}') depth--;
    }
    return depth;
}

std::string rtrim_line(const std::string& line) {
    size_t end = line.find_last_not_of(" \t\r");
    return end == std::string::npos ? "" : line.substr(0, end + 1);
}

// Locates the "---" fenced header. On success header/body are filled and
// the body starts right after the closing fence line.
bool split_header(const std::string& text, std::string& header, std::string& body,
                  std::string& reason) {
    size_t pos = 0;
    if (text.compare(0, 3, "\xEF\xBB\xBF") == 0) pos = 3;  // UTF-8 BOM

    size_t first_eol = text.find('\n', pos);
    std::string first_line = text.substr(pos, first_eol == std::string::npos
                                                  ? std::string::npos : first_eol - pos);
    if (rtrim_line(first_line) != "---" || first_eol == std::string::npos) {
        reason = "missing '---' metadata header";
        return false;
    }

    size_t header_start = first_eol + 1;
    size_t line_start = header_start;
    while (line_start <= text.size()) {
        size_t eol = text.find('\n', line_start);
        size_t line_end = (eol == std::string::npos) ? text.size() : eol;
        if (rtrim_line(text.substr(line_start, line_end - line_start)) == "---") {
            header = text.substr(header_start, line_start - header_start);
            body = (eol == std::string::npos) ? "" : text.substr(eol + 1);
            return true;
        }
        if (eol == std::string::npos) break;
        line_start = eol + 1;
    }

    reason = "unterminated metadata header (no closing '---')";
    return false;
}

// Joins continuation lines. Folding turns single line breaks into spaces;
// a blank line always stays a break.
std::string join_lines(const std::vector<std::string>& lines, bool folded) {
    std::string text;
    for (size_t i = 0; i < lines.size(); i++) {
        const auto& part = lines[i];
        if (i > 0) {
            bool fold = folded && !part.empty() && !lines[i - 1].empty();
            text += fold ? " " : "\n";
        }
        text += part;
    }
    return trim(text);
}

std::string join_list(const std::vector<std::string>& items) {
    std::string out = "[";
    for (size_t i = 0; i < items.size(); i++) {
        if (i > 0) out += ", ";
        out += items[i];
    }
    out += "]";
    return out;
}

} // namespace

// ── SkillMetadata / SkillDocument ────────────────────────────────────

std::string SkillDocument::category() const {
    return id.substr(0, id.find('/'));
}

// ── Header parsing ───────────────────────────────────────────────────

std::vector<std::string> parse_list_value(const std::string& value) {
    std::string v = trim(value);
    if (v.size() >= 2 && v.front() == '[' && v.back() == ']') {
        v = v.substr(1, v.size() - 2);
    }

    std::vector<std::string> out;
    std::string current;
    bool in_quotes = false;
    char quote = 0;
    for (char c : v) {
        if ((c == '"' || c == '\'') && (!in_quotes || c == quote)) {
            in_quotes = !in_quotes;
            quote = in_quotes ? c : 0;
            current += c;
            continue;
        }
        if (c == ',' && !in_quotes) {
            std::string item = strip_quotes(current);
            if (!item.empty()) out.push_back(item);
            current.clear();
            continue;
        }
        current += c;
    }
    std::string item = strip_quotes(current);
    if (!item.empty()) out.push_back(item);
    return out;
}

std::map<std::string, std::string> parse_frontmatter(const std::string& header) {
    enum class Pending { none, nested, block_scalar, plain_scalar, json_object };

    std::map<std::string, std::string> result;
    Pending pending = Pending::none;
    std::string open_key;
    std::vector<std::string> list_items;
    bool had_nested = false;
    std::string block_text;
    bool block_folded = false;
    int brace_depth = 0;

    auto finish_pending = [&]() {
        switch (pending) {
            case Pending::nested:
                if (!list_items.empty()) result[open_key] = join_list(list_items);
                else if (!had_nested) result[open_key] = "";
                break;
            case Pending::block_scalar:
                result[open_key] = join_lines(list_items, block_folded);
                break;
            case Pending::plain_scalar:
                // "key: text" wrapped onto indented lines
                result[open_key] = strip_quotes(join_lines(list_items, true));
                break;
            case Pending::json_object:
                result[open_key] = block_text;
                break;
            case Pending::none:
                break;
        }
        pending = Pending::none;
        open_key.clear();
        list_items.clear();
        had_nested = false;
        block_text.clear();
    };

    std::istringstream stream(header);
    std::string line;
    while (std::getline(stream, line)) {
        line = rtrim_line(line);
        size_t indent = line.find_first_not_of(" \t");
        std::string content = trim(line);

        if (pending == Pending::json_object) {
            if (content.empty()) continue;
            block_text += "\n" + content;
            brace_depth += brace_delta(content);
            if (brace_depth <= 0) finish_pending();
            continue;
        }

        if (pending == Pending::block_scalar || pending == Pending::plain_scalar) {
            if (content.empty() || indent > 0) {
                list_items.push_back(content);
                continue;
            }
            finish_pending();
        }

        if (content.empty() || content[0] == '#') continue;

        if (pending == Pending::nested) {
            if (content == "-" || content.rfind("- ", 0) == 0) {
                std::string item = strip_quotes(content.substr(1));
                if (!item.empty()) list_items.push_back(item);
                continue;
            }
            if (indent > 0 && content.front() == '{' && list_items.empty() && !had_nested) {
                // metadata:\n  { ... } spread over several lines
                pending = Pending::json_object;
                block_text = content;
                brace_depth = brace_delta(content);
                if (brace_depth <= 0) finish_pending();
                continue;
            }
            if (indent > 0) {
                auto colon = content.find(':');
                if (colon == std::string::npos && list_items.empty() && !had_nested) {
                    // "key:" with its value starting on the next line
                    pending = Pending::plain_scalar;
                    list_items.push_back(content);
                    continue;
                }
                if (colon != std::string::npos) {
                    std::string key = trim(content.substr(0, colon));
                    result[open_key + "." + key] = strip_quotes(content.substr(colon + 1));
                    had_nested = true;
                }
                continue;
            }
            finish_pending();
        }

        auto colon = content.find(':');
        if (colon == std::string::npos) continue;

        std::string key = trim(content.substr(0, colon));
        std::string value = trim(content.substr(colon + 1));
        if (key.empty()) continue;

        if (value.empty()) {
            pending = Pending::nested;
            open_key = key;
        } else if (value == "|" || value == "|-" || value == ">" || value == ">-") {
            pending = Pending::block_scalar;
            open_key = key;
            block_folded = value[0] == '>';
        } else if (value.front() == '{' && brace_delta(value) > 0) {
            pending = Pending::json_object;
            open_key = key;
            block_text = value;
            brace_depth = brace_delta(value);
        } else {
            pending = Pending::plain_scalar;
            open_key = key;
            list_items.push_back(value);
        }
    }
    finish_pending();
    return result;
}

// ── Document parsing ─────────────────────────────────────────────────

ParseResult parse_skill_document(const std::string& text, const std::string& path) {
    std::string header, body, reason;
    if (!split_header(text, header, body, reason)) {
        return ParseError{path, reason};
    }

    auto fields = parse_frontmatter(header);

    for (const char* key : kRequiredKeys) {
        auto it = fields.find(key);
        if (it == fields.end()) {
            return ParseError{path, std::string("missing required field '") + key + "'"};
        }
        if (trim(it->second).empty()) {
            return ParseError{path, std::string("required field '") + key + "' is empty"};
        }
    }

    SkillDocument doc;
    doc.path = path;
    doc.body = std::move(body);

    for (auto& [key, value] : fields) {
        if (key == "name") {
            doc.meta.name = value;
        } else if (key == "description") {
            doc.meta.description = value;
        } else if (key == "when_to_use") {
            doc.meta.when_to_use = value;
        } else if (key == "version") {
            doc.meta.version = value;
        } else if (key == "languages") {
            for (auto& lang : parse_list_value(value)) {
                doc.meta.languages.insert(to_lower(lang));
            }
        } else {
            doc.meta.extra[key] = value;
        }
    }

    return doc;
}

} // namespace skilldeck
