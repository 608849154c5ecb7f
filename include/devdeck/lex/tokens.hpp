/*
 * DevDeck Token Definitions
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Token kinds produced when scanning developer-authored command text. The
 *   validator only needs to know where words are and where the shell would
 *   chain, pipe or redirect, so operators are kept distinct from words.
 *
 * License (MIT): see lexer.hpp for the full text.
 */
#pragma once
#include <string>
#include <cstddef>
#include <vector>

namespace devdeck {

enum class TokenKind {
    Word,
    AndIf,
    OrIf,
    Pipe,
    Semi,
    LeftParen,
    RightParen,
    RedirOut,
    RedirOutAppend,
    RedirIn,
    RedirErr,
    RedirErrToOut,
    Assign,
    Background,
    Eof,
    Invalid
};

struct Token {
    TokenKind kind;
    std::string lexeme;
    std::size_t pos;
};

using TokenStream = std::vector<Token>;

// Anything the shell interprets rather than passes as an argument.
inline bool is_shell_operator(TokenKind k) {
    return k != TokenKind::Word && k != TokenKind::Assign && k != TokenKind::Eof;
}

// Operators that start a new command (after which a new first word follows).
inline bool is_command_separator(TokenKind k) {
    return k == TokenKind::AndIf || k == TokenKind::OrIf || k == TokenKind::Pipe
        || k == TokenKind::Semi || k == TokenKind::Background;
}

} // namespace devdeck
