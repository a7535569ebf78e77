// =================================================================
// src/Folio/ContentTransformer.cpp
// =================================================================
// Implementation for content transforms.

#include "Folio/ContentTransformer.hpp"
#include "Folio/Errors.hpp"
#include <unordered_map>
#include <vector>

namespace Folio {

namespace {

struct Lines {
    std::vector<std::string> lines;
    bool trailing_newline = false;
};

Lines splitLines(const std::string& content) {
    Lines result;
    if (content.empty()) {
        return result;
    }

    size_t start = 0;
    while (true) {
        size_t end = content.find('\n', start);
        if (end == std::string::npos) {
            result.lines.push_back(content.substr(start));
            break;
        }
        result.lines.push_back(content.substr(start, end - start));
        start = end + 1;
        if (start == content.size()) {
            result.trailing_newline = true;
            break;
        }
    }
    return result;
}

std::string joinLines(const Lines& lines) {
    std::string joined;
    for (size_t i = 0; i < lines.lines.size(); ++i) {
        if (i > 0) {
            joined += '\n';
        }
        joined += lines.lines[i];
    }
    if (lines.trailing_newline && !lines.lines.empty()) {
        joined += '\n';
    }
    return joined;
}

void rtrim(std::string& line) {
    size_t last = line.find_last_not_of(" \t\f\v");
    line.erase(last == std::string::npos ? 0 : last + 1);
}

bool isBlank(const std::string& line) {
    return line.find_first_not_of(" \t\f\v") == std::string::npos;
}

bool isContinuationByte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

size_t codePointCount(const std::string& text) {
    size_t count = 0;
    for (char c : text) {
        if (!isContinuationByte(c)) {
            ++count;
        }
    }
    return count;
}

// Longest prefix holding at most max_code_points code points.
std::string codePointPrefix(const std::string& text, size_t max_code_points) {
    size_t count = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (!isContinuationByte(text[i])) {
            if (count == max_code_points) {
                return text.substr(0, i);
            }
            ++count;
        }
    }
    return text;
}

void stripLineComments(Lines& lines, const std::string& marker) {
    for (auto& line : lines.lines) {
        size_t pos = line.find(marker);
        if (pos != std::string::npos) {
            line.erase(pos);
        }
        rtrim(line);
    }
}

std::string stripBlockComments(const std::string& content) {
    std::string stripped;
    size_t pos = 0;

    while (true) {
        size_t open = content.find("/*", pos);
        if (open == std::string::npos) {
            stripped.append(content, pos, std::string::npos);
            break;
        }
        size_t close = content.find("*/", open + 2);
        if (close == std::string::npos) {
            // Unterminated comment is left as is
            stripped.append(content, pos, std::string::npos);
            break;
        }
        stripped.append(content, pos, open - pos);
        pos = close + 2;
    }

    return stripped;
}

} // namespace

CommentSyntax commentSyntaxFor(const std::string& extension) {
    static const std::unordered_map<std::string, CommentSyntax> syntax_by_extension = {
        {"py", CommentSyntax::Hash}, {"sh", CommentSyntax::Hash}, {"bash", CommentSyntax::Hash},
        {"zsh", CommentSyntax::Hash}, {"rb", CommentSyntax::Hash}, {"pl", CommentSyntax::Hash},
        {"r", CommentSyntax::Hash}, {"yml", CommentSyntax::Hash}, {"yaml", CommentSyntax::Hash},
        {"toml", CommentSyntax::Hash}, {"cfg", CommentSyntax::Hash}, {"conf", CommentSyntax::Hash},
        {"cmake", CommentSyntax::Hash},

        {"c", CommentSyntax::CStyle}, {"h", CommentSyntax::CStyle}, {"cc", CommentSyntax::CStyle},
        {"cpp", CommentSyntax::CStyle}, {"cxx", CommentSyntax::CStyle}, {"hpp", CommentSyntax::CStyle},
        {"hh", CommentSyntax::CStyle}, {"hxx", CommentSyntax::CStyle}, {"cs", CommentSyntax::CStyle},
        {"java", CommentSyntax::CStyle}, {"kt", CommentSyntax::CStyle}, {"scala", CommentSyntax::CStyle},
        {"go", CommentSyntax::CStyle}, {"rs", CommentSyntax::CStyle}, {"swift", CommentSyntax::CStyle},
        {"js", CommentSyntax::CStyle}, {"mjs", CommentSyntax::CStyle}, {"cjs", CommentSyntax::CStyle},
        {"jsx", CommentSyntax::CStyle}, {"ts", CommentSyntax::CStyle}, {"tsx", CommentSyntax::CStyle},
        {"css", CommentSyntax::CStyle}, {"scss", CommentSyntax::CStyle}, {"less", CommentSyntax::CStyle},
        {"html", CommentSyntax::CStyle}
    };

    auto it = syntax_by_extension.find(extension);
    return it == syntax_by_extension.end() ? CommentSyntax::None : it->second;
}

ContentTransformer::ContentTransformer(const TransformConfig& config)
    : m_config(config)
{
}

std::string ContentTransformer::transform(const std::string& raw, const std::string& extension) const {
    size_t error_offset = 0;
    if (!isValidUtf8(raw, &error_offset)) {
        throw DecodeError("Invalid UTF-8 byte sequence at offset " + std::to_string(error_offset));
    }

    std::string content = normalizeLineEndings(raw);

    if (m_config.strip_comments) {
        content = stripComments(content, commentSyntaxFor(extension));
    }

    if (m_config.max_string_length) {
        content = truncateStrings(content, *m_config.max_string_length);
    }

    if (m_config.max_line_length) {
        content = truncateLines(content, *m_config.max_line_length);
    }

    if (m_config.max_blank_lines) {
        content = collapseBlankLines(content, *m_config.max_blank_lines);
    }

    size_t end = content.find_last_not_of('\n');
    if (end == std::string::npos) {
        content.clear();
    } else {
        content.erase(end + 1);
        content += '\n';
    }

    return content;
}

bool ContentTransformer::isValidUtf8(const std::string& text, size_t* error_offset) {
    const size_t length = text.size();
    size_t i = 0;

    while (i < length) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        size_t sequence_length = 0;
        unsigned int code_point = 0;

        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            sequence_length = 2;
            code_point = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            sequence_length = 3;
            code_point = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            sequence_length = 4;
            code_point = c & 0x07;
        } else {
            if (error_offset) *error_offset = i;
            return false;
        }

        if (i + sequence_length > length) {
            if (error_offset) *error_offset = i;
            return false;
        }

        for (size_t k = 1; k < sequence_length; ++k) {
            unsigned char next = static_cast<unsigned char>(text[i + k]);
            if ((next & 0xC0) != 0x80) {
                if (error_offset) *error_offset = i;
                return false;
            }
            code_point = (code_point << 6) | (next & 0x3F);
        }

        // Reject overlong encodings, surrogates and values past U+10FFFF
        bool overlong = (sequence_length == 2 && code_point < 0x80) ||
                        (sequence_length == 3 && code_point < 0x800) ||
                        (sequence_length == 4 && code_point < 0x10000);
        if (overlong || (code_point >= 0xD800 && code_point <= 0xDFFF) || code_point > 0x10FFFF) {
            if (error_offset) *error_offset = i;
            return false;
        }

        i += sequence_length;
    }

    return true;
}

std::string ContentTransformer::normalizeLineEndings(const std::string& text) {
    std::string normalized;
    normalized.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            normalized += '\n';
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
        } else {
            normalized += text[i];
        }
    }

    return normalized;
}

std::string ContentTransformer::stripComments(const std::string& content, CommentSyntax syntax) {
    switch (syntax) {
        case CommentSyntax::Hash: {
            Lines lines = splitLines(content);
            stripLineComments(lines, "#");
            return joinLines(lines);
        }
        case CommentSyntax::CStyle: {
            Lines lines = splitLines(stripBlockComments(content));
            stripLineComments(lines, "//");
            return joinLines(lines);
        }
        default:
            return content;
    }
}

std::string ContentTransformer::truncateStrings(const std::string& content, size_t max_length) {
    std::string result;
    result.reserve(content.size());
    size_t i = 0;

    while (i < content.size()) {
        char c = content[i];
        if (c != '\'' && c != '"' && c != '`') {
            result += c;
            ++i;
            continue;
        }

        std::string delimiter(1, c);
        size_t close = std::string::npos;

        // Triple-quoted literals are tried before single-character ones
        if (c != '`' && content.compare(i, 3, std::string(3, c)) == 0) {
            close = content.find(std::string(3, c), i + 3);
            if (close != std::string::npos) {
                delimiter = std::string(3, c);
            }
        }
        if (delimiter.size() == 1) {
            close = content.find(c, i + 1);
        }

        if (close == std::string::npos) {
            result += c;
            ++i;
            continue;
        }

        size_t interior_start = i + delimiter.size();
        std::string interior = content.substr(interior_start, close - interior_start);

        result += delimiter;
        if (codePointCount(interior) > max_length) {
            result += codePointPrefix(interior, max_length);
            result += kStringTruncatedMarker;
        } else {
            result += interior;
        }
        result += delimiter;

        i = close + delimiter.size();
    }

    return result;
}

std::string ContentTransformer::truncateLines(const std::string& content, size_t max_length) {
    Lines lines = splitLines(content);

    for (auto& line : lines.lines) {
        if (codePointCount(line) > max_length) {
            line = codePointPrefix(line, max_length) + kLineTruncatedMarker;
        }
    }

    return joinLines(lines);
}

std::string ContentTransformer::collapseBlankLines(const std::string& content, size_t max_blank) {
    Lines lines = splitLines(content);
    Lines collapsed;
    collapsed.trailing_newline = lines.trailing_newline;

    size_t blank_run = 0;
    for (auto& line : lines.lines) {
        if (isBlank(line)) {
            ++blank_run;
        } else {
            blank_run = 0;
        }
        if (blank_run <= max_blank) {
            collapsed.lines.push_back(std::move(line));
        }
    }

    return joinLines(collapsed);
}

} // namespace Folio
