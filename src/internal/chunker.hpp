#pragma once

#include "runlet/search.hpp"
#include "runlet/utils.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace runlet::internal {

    using namespace std::string_view_literals;

    struct source_chunk {
        std::string kind{};
        std::string name{};
        std::string qualified_name{};
        // 1-based, inclusive
        size_t start_line{};
        size_t end_line{};
        search::symbol_structure structure{};
        std::optional<std::string> doc{};
        std::string snippet{};
        std::string text{};
    };

    // comments dropped, string literal contents blanked, brace depth tracked across lines
    struct scanned_line {
        std::string_view raw{};
        std::string clean{};
        int depth_before{};
        int depth_after{};
    };

    inline constexpr size_t snippet_line_limit = 10U;
    inline constexpr size_t doc_char_limit = 300U;
    inline constexpr size_t call_limit = 12U;
    inline constexpr size_t header_lookahead_lines = 4U;

    inline constexpr std::array<std::string_view, 12> declaration_modifiers{
            "export "sv,
            "default "sv,
            "async "sv,
            "declare "sv,
            "abstract "sv,
            "public "sv,
            "private "sv,
            "protected "sv,
            "static "sv,
            "readonly "sv,
            "override "sv,
            "get "sv};

    inline constexpr std::array<std::string_view, 16> non_call_keywords{
            "if"sv,
            "for"sv,
            "while"sv,
            "switch"sv,
            "catch"sv,
            "return"sv,
            "function"sv,
            "typeof"sv,
            "await"sv,
            "new"sv,
            "super"sv,
            "import"sv,
            "with"sv,
            "do"sv,
            "else"sv,
            "constructor"sv};

    constexpr bool is_ident_start(char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == '$';
    }

    constexpr bool is_ident_char(char c) {
        return is_ident_start(c) || (c >= '0' && c <= '9');
    }

    constexpr std::string_view read_identifier(std::string_view text, size_t pos = 0U) {
        if (pos >= text.size() || !is_ident_start(text[pos])) {
            return {};
        }
        auto end = pos + 1U;
        while (end < text.size() && is_ident_char(text[end])) {
            ++end;
        }
        return text.substr(pos, end - pos);
    }

    constexpr bool starts_with_identifier(std::string_view text) {
        return !text.empty() && is_ident_start(text.front());
    }

    constexpr std::string_view strip_modifiers(std::string_view text) {
        bool stripped = true;
        while (stripped) {
            stripped = false;
            for (auto modifier : declaration_modifiers) {
                // only strip when another word follows: `get(` and `static() {` are method names
                if (text.starts_with(modifier) && starts_with_identifier(utils::trim_view(text.substr(modifier.size())))) {
                    text = utils::trim_view(text.substr(modifier.size()));
                    stripped = true;
                }
            }
            if (text.starts_with("set "sv) && starts_with_identifier(utils::trim_view(text.substr(4U)))) {
                text = utils::trim_view(text.substr(4U));
                stripped = true;
            }
        }
        return text;
    }

    inline std::vector<scanned_line> scan_lines(std::string_view text) {
        enum class lex_state { code, block_comment, single_quote, double_quote, template_literal };

        std::vector<scanned_line> lines{};
        auto state = lex_state::code;
        int depth = 0;

        size_t pos = 0U;
        while (pos <= text.size()) {
            auto eol = text.find('\n', pos);
            auto raw = text.substr(pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos);
            if (raw.ends_with('\r')) {
                raw.remove_suffix(1U);
            }

            scanned_line line{.raw = raw, .clean = {}, .depth_before = depth, .depth_after = depth};
            line.clean.reserve(raw.size());

            for (size_t i = 0U; i < raw.size(); ++i) {
                char c = raw[i];
                char next = i + 1U < raw.size() ? raw[i + 1U] : '\0';
                switch (state) {
                    case lex_state::code:
                        if (c == '/' && next == '/') {
                            i = raw.size();
                        }
                        else if (c == '/' && next == '*') {
                            state = lex_state::block_comment;
                            ++i;
                        }
                        else {
                            if (c == '\'') {
                                state = lex_state::single_quote;
                            }
                            else if (c == '"') {
                                state = lex_state::double_quote;
                            }
                            else if (c == '`') {
                                state = lex_state::template_literal;
                            }
                            else if (c == '{') {
                                ++depth;
                            }
                            else if (c == '}') {
                                --depth;
                            }
                            line.clean.push_back(c);
                        }
                        break;
                    case lex_state::block_comment:
                        if (c == '*' && next == '/') {
                            state = lex_state::code;
                            ++i;
                            line.clean.push_back(' ');
                        }
                        break;
                    case lex_state::single_quote:
                    case lex_state::double_quote:
                    case lex_state::template_literal: {
                        char quote = state == lex_state::single_quote ? '\''
                                   : state == lex_state::double_quote ? '"'
                                                                      : '`';
                        if (c == '\\') {
                            ++i;
                            line.clean.append("  ");
                        }
                        else if (c == quote) {
                            state = lex_state::code;
                            line.clean.push_back(c);
                        }
                        else {
                            line.clean.push_back(' ');
                        }
                        break;
                    }
                }
            }

            // plain quotes never span lines
            if (state == lex_state::single_quote || state == lex_state::double_quote) {
                state = lex_state::code;
            }

            line.depth_after = depth;
            lines.push_back(std::move(line));

            if (eol == std::string_view::npos) {
                break;
            }
            pos = eol + 1U;
        }
        return lines;
    }

    inline std::string join_clean(const std::vector<scanned_line>& lines, size_t first, size_t count) {
        std::string out{};
        for (size_t i = first; i < lines.size() && i < first + count; ++i) {
            out += lines[i].clean;
            out.push_back(' ');
        }
        return out;
    }

    inline std::string join_raw(const std::vector<scanned_line>& lines, size_t first, size_t last) {
        std::string out{};
        for (size_t i = first; i <= last && i < lines.size(); ++i) {
            if (i != first) {
                out.push_back('\n');
            }
            out.append(lines[i].raw);
        }
        return out;
    }

    // index of the ')' matching the '(' at `open`, or npos
    constexpr size_t find_matching_paren(std::string_view text, size_t open) {
        int nesting = 0;
        for (size_t i = open; i < text.size(); ++i) {
            if (text[i] == '(') {
                ++nesting;
            }
            else if (text[i] == ')' && --nesting == 0) {
                return i;
            }
        }
        return std::string_view::npos;
    }

    inline std::vector<search::parameter_info> parse_parameters(std::string_view list) {
        std::vector<search::parameter_info> params{};
        int nesting = 0;
        size_t piece_start = 0U;

        auto flush = [&](size_t end) {
            auto piece = utils::trim_view(list.substr(piece_start, end - piece_start));
            if (piece.empty()) {
                return;
            }
            if (auto eq = piece.find('='); eq != std::string_view::npos && nesting == 0) {
                piece = utils::trim_view(piece.substr(0U, eq));
            }
            search::parameter_info info{};
            auto colon = piece.find(':');
            // destructuring patterns keep their braces in the name
            if (colon != std::string_view::npos && !piece.starts_with('{') && !piece.starts_with('[')) {
                auto type = utils::trim_view(piece.substr(colon + 1U));
                if (!type.empty()) {
                    info.type = std::string{type};
                }
                piece = utils::trim_view(piece.substr(0U, colon));
            }
            if (piece.ends_with('?')) {
                piece.remove_suffix(1U);
            }
            info.name = std::string{piece};
            params.push_back(std::move(info));
        };

        for (size_t i = 0U; i < list.size(); ++i) {
            char c = list[i];
            if (c == '(' || c == '{' || c == '[' || c == '<') {
                ++nesting;
            }
            else if (c == ')' || c == '}' || c == ']' || (c == '>' && (i == 0U || list[i - 1U] != '='))) {
                --nesting;
            }
            else if (c == ',' && nesting == 0) {
                flush(i);
                piece_start = i + 1U;
            }
        }
        flush(list.size());
        return params;
    }

    // parameters and return annotation from the text following the symbol name
    // `x => ...`: a single bare parameter
    constexpr std::string_view bare_arrow_parameter(std::string_view value) {
        auto name = read_identifier(value);
        if (name.empty() || !utils::trim_view(value.substr(name.size())).starts_with("=>"sv)) {
            return {};
        }
        return name;
    }

    // `(a, b) => ...`, `(a): T => ...` or `x => ...`
    constexpr bool is_arrow_function(std::string_view value) {
        if (!bare_arrow_parameter(value).empty()) {
            return true;
        }
        if (!value.starts_with('(')) {
            return false;
        }
        auto close = find_matching_paren(value, 0U);
        if (close == std::string_view::npos) {
            return false;
        }
        auto tail = utils::trim_view(value.substr(close + 1U));
        return tail.starts_with("=>"sv) || (tail.starts_with(':') && tail.find("=>"sv) != std::string_view::npos);
    }

    inline void parse_signature(std::string_view header, search::symbol_structure& structure) {
        header = utils::trim_view(header);
        if (header.starts_with("async "sv)) {
            header = utils::trim_view(header.substr(6U));
        }
        if (auto bare = bare_arrow_parameter(header); !bare.empty()) {
            structure.parameters.push_back({.name = std::string{bare}, .type = std::nullopt});
            return;
        }

        auto open = header.find('(');
        if (open == std::string_view::npos) {
            return;
        }

        auto close = find_matching_paren(header, open);
        if (close == std::string_view::npos) {
            return;
        }
        structure.parameters = parse_parameters(header.substr(open + 1U, close - open - 1U));

        auto rest = utils::trim_view(header.substr(close + 1U));
        if (!rest.starts_with(':')) {
            return;
        }
        rest = rest.substr(1U);
        auto end = std::min(rest.find('{'), rest.find("=>"sv));
        auto type = utils::trim_view(rest.substr(0U, end));
        if (!type.empty()) {
            structure.return_type = std::string{type};
        }
    }

    inline size_t find_chunk_end(const std::vector<scanned_line>& lines, size_t start) {
        int base = lines[start].depth_before;
        bool opened = false;
        for (size_t j = start; j < lines.size(); ++j) {
            if (!opened && lines[j].clean.find('{') != std::string::npos) {
                opened = true;
            }
            if (opened && lines[j].depth_after <= base) {
                return j;
            }
            if (!opened) {
                auto trimmed = utils::trim_view(lines[j].clean);
                if (trimmed.ends_with(';') || j >= start + header_lookahead_lines) {
                    return j;
                }
            }
        }
        return lines.size() - 1U;
    }

    inline std::optional<std::string> extract_doc(const std::vector<scanned_line>& lines, size_t start) {
        if (start == 0U) {
            return std::nullopt;
        }

        std::vector<std::string_view> parts{};
        auto above = utils::trim_view(lines[start - 1U].raw);

        if (above.ends_with("*/"sv)) {
            for (size_t i = start; i-- > 0U;) {
                auto text = utils::trim_view(lines[i].raw);
                bool first = text.starts_with("/*"sv);
                if (first) {
                    text.remove_prefix(text.starts_with("/**"sv) ? 3U : 2U);
                }
                if (text.ends_with("*/"sv)) {
                    text.remove_suffix(2U);
                }
                text = utils::trim_view(text);
                if (text.starts_with('*')) {
                    text = utils::trim_view(text.substr(1U));
                }
                if (!text.empty()) {
                    parts.push_back(text);
                }
                if (first) {
                    break;
                }
            }
        }
        else {
            for (size_t i = start; i-- > 0U;) {
                auto text = utils::trim_view(lines[i].raw);
                if (!text.starts_with("//"sv)) {
                    break;
                }
                text = utils::trim_view(text.substr(2U));
                if (!text.empty()) {
                    parts.push_back(text);
                }
            }
        }

        if (parts.empty()) {
            return std::nullopt;
        }
        std::ranges::reverse(parts);
        std::string doc{};
        for (auto part : parts) {
            if (!doc.empty()) {
                doc.push_back(' ');
            }
            doc.append(part);
        }
        if (doc.size() > doc_char_limit) {
            doc.resize(doc_char_limit);
        }
        return doc;
    }

    inline std::vector<std::string> extract_calls(
            const std::vector<scanned_line>& lines, size_t start, size_t end, std::string_view own_name) {
        std::vector<std::string> calls{};
        auto body = join_clean(lines, start, end - start + 1U);
        // skip the declaration's own name and parameter list
        auto body_open = body.find('{');
        size_t i = body_open == std::string::npos ? 0U : body_open;

        while (i < body.size() && calls.size() < call_limit) {
            if (!is_ident_start(body[i]) || (i > 0U && (is_ident_char(body[i - 1U]) || body[i - 1U] == '.'))) {
                ++i;
                continue;
            }
            auto chain_start = i;
            auto ident = read_identifier(body, i);
            i += ident.size();
            while (i + 1U < body.size() && body[i] == '.' && is_ident_start(body[i + 1U])) {
                i += 1U + read_identifier(body, i + 1U).size();
            }
            std::string_view chain{body.data() + chain_start, i - chain_start};

            auto after = i;
            while (after < body.size() && body[after] == ' ') {
                ++after;
            }
            if (after >= body.size() || body[after] != '(') {
                continue;
            }
            if (chain == own_name || std::ranges::find(non_call_keywords, chain) != non_call_keywords.end()) {
                continue;
            }
            if (std::ranges::find(calls, chain) == calls.end()) {
                calls.emplace_back(chain);
            }
        }
        return calls;
    }

    struct class_scope {
        std::string name{};
        int depth{};
        size_t end_line{};
    };

    struct declaration {
        std::string kind{};
        std::string name{};
        // text after the name, for the signature
        std::string_view header_rest{};
        std::optional<std::string> inherits_from{};
    };

    // `header` is the candidate line joined with a few following ones; `first_line` is the line alone
    inline std::optional<declaration> match_declaration(
            std::string_view header, std::string_view first_line, bool in_class_body) {
        auto text = strip_modifiers(utils::trim_view(header));

        if (text.starts_with("function"sv)) {
            auto rest = utils::trim_view(text.substr(8U));
            if (rest.starts_with('*')) {
                rest = utils::trim_view(rest.substr(1U));
            }
            auto name = read_identifier(rest);
            if (name.empty() || rest.data() == text.data() + 8U) {
                return std::nullopt;
            }
            return declaration{.kind = "function", .name = std::string{name}, .header_rest = rest.substr(name.size())};
        }

        if (text.starts_with("class "sv)) {
            auto rest = utils::trim_view(text.substr(6U));
            auto name = read_identifier(rest);
            if (name.empty()) {
                return std::nullopt;
            }
            declaration decl{.kind = "class", .name = std::string{name}, .header_rest = rest.substr(name.size())};
            auto class_head = rest.substr(0U, rest.find('{'));
            if (auto ext = class_head.find(" extends "sv); ext != std::string_view::npos) {
                auto base = utils::trim_view(class_head.substr(ext + 9U));
                auto base_end = base.find_first_of(" {<"sv);
                base = base.substr(0U, base_end);
                if (!base.empty()) {
                    decl.inherits_from = std::string{base};
                }
            }
            return decl;
        }

        for (auto binding : {"const "sv, "let "sv, "var "sv}) {
            if (!text.starts_with(binding)) {
                continue;
            }
            auto rest = utils::trim_view(text.substr(binding.size()));
            auto name = read_identifier(rest);
            if (name.empty()) {
                return std::nullopt;
            }
            auto after = rest.substr(name.size());
            auto eq = after.find('=');
            if (eq == std::string_view::npos || (eq + 1U < after.size() && after[eq + 1U] == '=')) {
                return std::nullopt;
            }
            auto value = utils::trim_view(after.substr(eq + 1U));
            if (value.starts_with("async "sv)) {
                value = utils::trim_view(value.substr(6U));
            }
            if (value.starts_with("function"sv) || is_arrow_function(value)) {
                return declaration{.kind = "function", .name = std::string{name}, .header_rest = value};
            }
            return std::nullopt;
        }

        if (in_class_body) {
            if (text.starts_with('*')) {
                text = utils::trim_view(text.substr(1U));
            }
            auto name = read_identifier(text);
            if (name.empty() || std::ranges::find(non_call_keywords, name) != non_call_keywords.end()) {
                if (name != "constructor"sv) {
                    return std::nullopt;
                }
            }
            auto rest = text.substr(name.size());
            if (rest.starts_with('?')) {
                rest.remove_prefix(1U);
            }
            auto trimmed = utils::trim_view(rest);
            if (!trimmed.starts_with('(') && !trimmed.starts_with('<')) {
                return std::nullopt;
            }
            if (utils::trim_view(first_line).ends_with(';')) {
                return std::nullopt;
            }
            return declaration{.kind = "method", .name = std::string{name}, .header_rest = rest};
        }

        return std::nullopt;
    }

    inline std::vector<source_chunk> chunk_source(std::string_view text, std::string_view file_name) {
        auto lines = scan_lines(text);
        std::vector<source_chunk> chunks{};
        std::vector<class_scope> classes{};

        for (size_t i = 0U; i < lines.size(); ++i) {
            while (!classes.empty() && classes.back().end_line < i) {
                classes.pop_back();
            }
            auto trimmed = utils::trim_view(lines[i].clean);
            if (trimmed.empty()) {
                continue;
            }

            bool in_class_body = !classes.empty() && lines[i].depth_before == classes.back().depth + 1;
            auto header = join_clean(lines, i, header_lookahead_lines);
            auto first_char = header.find_first_not_of(' ');
            auto decl = match_declaration(
                    std::string_view{header}.substr(first_char == std::string::npos ? 0U : first_char),
                    trimmed,
                    in_class_body);
            if (!decl) {
                continue;
            }

            auto end = find_chunk_end(lines, i);
            source_chunk chunk{};
            chunk.kind = decl->kind;
            chunk.name = decl->name;
            chunk.qualified_name = decl->name;
            chunk.start_line = i + 1U;
            chunk.end_line = end + 1U;
            chunk.doc = extract_doc(lines, i);
            chunk.snippet = join_raw(lines, i, std::min(end, i + snippet_line_limit - 1U));
            chunk.text = join_raw(lines, i, end);

            if (decl->kind == "class"sv) {
                chunk.structure.inherits_from = decl->inherits_from;
                classes.push_back({.name = decl->name, .depth = lines[i].depth_before, .end_line = end});
            }
            else {
                if (decl->kind == "method"sv) {
                    chunk.structure.parent_class = classes.back().name;
                    chunk.qualified_name = classes.back().name + "." + decl->name;
                }
                parse_signature(decl->header_rest, chunk.structure);
                chunk.structure.calls = extract_calls(lines, i, end, decl->name);
            }
            chunks.push_back(std::move(chunk));
        }

        if (chunks.empty() && !utils::trim_view(text).empty()) {
            source_chunk chunk{};
            chunk.kind = "file";
            chunk.name = std::string{file_name};
            chunk.qualified_name = std::string{file_name};
            chunk.start_line = 1U;
            chunk.end_line = lines.size();
            chunk.snippet = join_raw(lines, 0U, std::min(lines.size(), snippet_line_limit) - 1U);
            chunk.text = std::string{text};
            chunks.push_back(std::move(chunk));
        }
        return chunks;
    }

}  // namespace runlet::internal
