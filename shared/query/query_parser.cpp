#include "query_parser.hpp"

#include <stdexcept>
#include <string>

#include <fmt/core.h>

#include "common/string_helper.hpp"

namespace query {

namespace {

class ParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class Cursor {
public:
    explicit Cursor(const std::vector<Token>& tokens) : tokens_(tokens) {}

    const Token& peek() const { return tokens_[pos_]; }

    const Token& next() {
        const Token& t = tokens_[pos_];
        if (t.kind != TokenKind::End) ++pos_;
        return t;
    }

    bool accept(TokenKind kind) {
        if (peek().kind != kind) return false;
        next();
        return true;
    }

    const Token& expect(TokenKind kind) {
        const Token& t = peek();
        if (t.kind != kind) {
            throw ParseError(fmt::format("expected {} but found {} at offset {}",
                to_string(kind), describe(t), t.pos));
        }
        return next();
    }

    static std::string describe(const Token& t) {
        if (t.kind == TokenKind::End) return to_string(t.kind);
        return fmt::format("'{}'", t.text);
    }

private:
    const std::vector<Token>& tokens_;
    size_t pos_ = 0;
};

Json parseLiteral(Cursor& cur) {
    const Token& t = cur.next();
    switch (t.kind) {
        case TokenKind::String:
            return t.text;
        case TokenKind::Integer:
            try {
                return std::stoll(t.text);
            } catch (const std::out_of_range&) {
                throw ParseError(fmt::format("integer out of range at offset {}", t.pos));
            }
        case TokenKind::Float:
            if (auto v = parseNumber(t.text)) return *v;
            throw ParseError(fmt::format("number out of range at offset {}", t.pos));
        case TokenKind::Identifier: {
            auto word = toLower(t.text);
            if (word == "true") return true;
            if (word == "false") return false;
            if (word == "null") return nullptr;
            break;
        }
        default:
            break;
    }
    throw ParseError(fmt::format("unexpected {} at offset {}", Cursor::describe(t), t.pos));
}

Json parseArg(Cursor& cur) {
    if (!cur.accept(TokenKind::LBracket)) return parseLiteral(cur);

    Json list = Json::array();
    if (cur.accept(TokenKind::RBracket)) return list;
    do {
        list.push_back(parseLiteral(cur));
    } while (cur.accept(TokenKind::Comma));
    cur.expect(TokenKind::RBracket);
    return list;
}

Call parseCall(Cursor& cur) {
    const Token& name = cur.expect(TokenKind::Identifier);
    Call call;
    call.verb = name.text;
    call.pos = name.pos;

    cur.expect(TokenKind::LParen);
    if (cur.accept(TokenKind::RParen)) return call;
    do {
        call.args.push_back(parseArg(cur));
    } while (cur.accept(TokenKind::Comma));
    cur.expect(TokenKind::RParen);
    return call;
}

} // namespace

Result<QueryChain> QueryParser::parse(const std::vector<Token>& tokens) {
    if (tokens.empty() || tokens.front().kind == TokenKind::End)
        return Result<QueryChain>::Error(ResultCode::MalformedQuery, std::string("empty query"));

    Cursor cur(tokens);
    QueryChain chain;
    try {
        do {
            chain.push_back(parseCall(cur));
        } while (cur.accept(TokenKind::Arrow));

        if (cur.peek().kind != TokenKind::End) {
            const Token& t = cur.peek();
            throw ParseError(fmt::format("unexpected {} at offset {}", Cursor::describe(t), t.pos));
        }
    } catch (const ParseError& e) {
        return Result<QueryChain>::Error(ResultCode::MalformedQuery, std::string(e.what()));
    }
    return Result<QueryChain>::OK(std::move(chain));
}

} // namespace query
