#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace query {

using Json = nlohmann::ordered_json;

enum class TokenKind {
    Identifier,
    String,
    Integer,
    Float,
    LParen,
    RParen,
    LBracket,
    RBracket,
    Comma,
    Arrow,      // ->
    Unknown,    // any other character; only the parser rejects it
    End
};

struct Token {
    TokenKind kind;
    std::string text;
    size_t pos = 0;
};

// verb(args...)
struct Call {
    std::string verb;
    std::vector<Json> args;
    size_t pos = 0;
};

using QueryChain = std::vector<Call>;

// Raised by the interpreter; the executor converts it into an ExecutionError.
class EvaluationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

const char* to_string(TokenKind kind);

} // namespace query
