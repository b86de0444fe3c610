#pragma once
#include <string>
#include <string_view>
#include <vector>

#include "common/result.h"
#include "query_types.hpp"

namespace query {

class QueryLexer {
public:
    // Fails only on an unterminated string literal. Characters outside the
    // grammar become Unknown tokens so that verb extraction still sees the
    // calls around them.
    static Result<std::vector<Token>> tokenize(std::string_view input);

    // Lower-cased names of every identifier directly followed by '(',
    // in order of first appearance.
    static std::vector<std::string> callVerbs(const std::vector<Token>& tokens);
};

} // namespace query
