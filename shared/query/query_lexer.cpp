#include "query_lexer.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/core.h>

#include "common/string_helper.hpp"

namespace query {

const char* to_string(TokenKind kind) {
    switch (kind) {
        case TokenKind::Identifier: return "identifier";
        case TokenKind::String:     return "string";
        case TokenKind::Integer:    return "integer";
        case TokenKind::Float:      return "float";
        case TokenKind::LParen:     return "'('";
        case TokenKind::RParen:     return "')'";
        case TokenKind::LBracket:   return "'['";
        case TokenKind::RBracket:   return "']'";
        case TokenKind::Comma:      return "','";
        case TokenKind::Arrow:      return "'->'";
        case TokenKind::Unknown:    return "unknown";
        case TokenKind::End:        return "end of input";
    }
    return "unknown";
}

namespace {

bool isIdentStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

} // namespace

Result<std::vector<Token>> QueryLexer::tokenize(std::string_view in) {
    std::vector<Token> tokens;
    size_t i = 0;
    const size_t n = in.size();

    while (i < n) {
        char c = in[i];

        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }

        const size_t start = i;

        if (c == '-' && i + 1 < n && in[i + 1] == '>') {
            tokens.push_back({TokenKind::Arrow, "->", start});
            i += 2;
            continue;
        }

        if (isIdentStart(c)) {
            while (i < n && isIdentChar(in[i])) ++i;
            tokens.push_back({TokenKind::Identifier, std::string(in.substr(start, i - start)), start});
            continue;
        }

        if (isDigit(c) || (c == '-' && i + 1 < n && isDigit(in[i + 1]))) {
            ++i;
            while (i < n && isDigit(in[i])) ++i;
            bool is_float = false;
            if (i + 1 < n && in[i] == '.' && isDigit(in[i + 1])) {
                is_float = true;
                ++i;
                while (i < n && isDigit(in[i])) ++i;
            }
            tokens.push_back({is_float ? TokenKind::Float : TokenKind::Integer,
                              std::string(in.substr(start, i - start)), start});
            continue;
        }

        if (c == '\'' || c == '"') {
            const char quote = c;
            std::string text;
            ++i;
            bool closed = false;
            while (i < n) {
                char ch = in[i++];
                if (ch == '\\' && i < n) {
                    char esc = in[i++];
                    switch (esc) {
                        case 'n': text += '\n'; break;
                        case 't': text += '\t'; break;
                        default:  text += esc;  break;
                    }
                    continue;
                }
                if (ch == quote) {
                    closed = true;
                    break;
                }
                text += ch;
            }
            if (!closed) {
                return Result<std::vector<Token>>::Error(ResultCode::MalformedQuery,
                    fmt::format("unterminated string literal at offset {}", start));
            }
            tokens.push_back({TokenKind::String, std::move(text), start});
            continue;
        }

        TokenKind kind = TokenKind::Unknown;
        switch (c) {
            case '(': kind = TokenKind::LParen; break;
            case ')': kind = TokenKind::RParen; break;
            case '[': kind = TokenKind::LBracket; break;
            case ']': kind = TokenKind::RBracket; break;
            case ',': kind = TokenKind::Comma; break;
            default: break;
        }
        tokens.push_back({kind, std::string(1, c), start});
        ++i;
    }

    tokens.push_back({TokenKind::End, "", n});
    return Result<std::vector<Token>>::OK(std::move(tokens));
}

std::vector<std::string> QueryLexer::callVerbs(const std::vector<Token>& tokens) {
    std::vector<std::string> verbs;
    for (size_t i = 0; i + 1 < tokens.size(); ++i) {
        if (tokens[i].kind != TokenKind::Identifier || tokens[i + 1].kind != TokenKind::LParen)
            continue;
        auto verb = toLower(tokens[i].text);
        if (std::find(verbs.begin(), verbs.end(), verb) == verbs.end())
            verbs.push_back(std::move(verb));
    }
    return verbs;
}

} // namespace query
