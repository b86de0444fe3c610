#pragma once
#include <vector>

#include "common/result.h"
#include "query_types.hpp"

namespace query {

/**
 * Strict parser for the method-chain grammar:
 *
 *   chain   := call ( '->' call )*
 *   call    := IDENT '(' [ arg ( ',' arg )* ] ')'
 *   arg     := literal | '[' [ literal ( ',' literal )* ] ']'
 *   literal := STRING | INTEGER | FLOAT | true | false | null
 *
 * Anything else is a MalformedQuery; there is no partial acceptance.
 */
class QueryParser {
public:
    static Result<QueryChain> parse(const std::vector<Token>& tokens);
};

} // namespace query
