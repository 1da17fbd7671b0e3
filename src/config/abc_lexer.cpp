/**
 * ABC Configuration Lexer Implementation
 */

#include "config/abc_lexer.hpp"

#include <sstream>

namespace web::compile::abc {

const char* tokenTypeName(TokenType type) {
    switch (type) {
        case TokenType::LEFT_BRACE:     return "'{'";
        case TokenType::RIGHT_BRACE:    return "'}'";
        case TokenType::LEFT_BRACKET:   return "'['";
        case TokenType::RIGHT_BRACKET:  return "']'";
        case TokenType::COLON:          return "':'";
        case TokenType::COMMA:          return "','";
        case TokenType::STRING_LITERAL: return "string";
        case TokenType::ESCAPED_STRING: return "string";
        case TokenType::IDENTIFIER:     return "identifier";
        case TokenType::INTEGER:        return "integer";
        case TokenType::BOOLEAN_TRUE:   return "true";
        case TokenType::BOOLEAN_FALSE:  return "false";
        case TokenType::NULL_LITERAL:   return "null";
        case TokenType::END_OF_FILE:    return "end of file";
        case TokenType::INVALID:        return "invalid token";
    }
    return "unknown";
}

std::string unescape(std::string_view lexeme) {
    std::string out;
    out.reserve(lexeme.size());
    for (size_t i = 0; i < lexeme.size(); ++i) {
        char c = lexeme[i];
        if (c != '\\' || i + 1 >= lexeme.size()) {
            out += c;
            continue;
        }
        char e = lexeme[++i];
        switch (e) {
            case 'n': out += '\n'; break;
            case 't': out += '\t'; break;
            case 'r': out += '\r'; break;
            default:  out += e;    break;  // \" \\ \/
        }
    }
    return out;
}

Lexer::Lexer(std::string_view source, std::string_view filename)
    : source(source), filename(filename) {}

char Lexer::peek() const {
    if (isAtEnd()) return '\0';
    return source[current];
}

char Lexer::peekNext() const {
    if (current + 1 >= source.size()) return '\0';
    return source[current + 1];
}

char Lexer::advance() {
    char c = source[current++];
    if (c == '\n') {
        line++;
        column = 1;
    } else {
        column++;
    }
    return c;
}

bool Lexer::isDigit(char c) const {
    return c >= '0' && c <= '9';
}

bool Lexer::isAlpha(char c) const {
    return (c >= 'a' && c <= 'z') ||
           (c >= 'A' && c <= 'Z') ||
           c == '_';
}

// Bare words may contain '-' and '.' after the first character
bool Lexer::isIdentifierChar(char c) const {
    return isAlpha(c) || isDigit(c) || c == '-' || c == '.';
}

void Lexer::skipWhitespace() {
    while (!isAtEnd()) {
        char c = peek();
        switch (c) {
            case ' ':
            case '\t':
            case '\r':
            case '\n':
                advance();
                break;
            case '#':
                skipComment();
                break;
            case '/':
                if (peekNext() == '/') {
                    skipComment();
                } else {
                    return;
                }
                break;
            default:
                return;
        }
    }
}

void Lexer::skipComment() {
    while (!isAtEnd() && peek() != '\n') {
        advance();
    }
}

Token Lexer::makeToken(TokenType type) {
    return Token(type, source.substr(start, current - start), startLine, startColumn);
}

Token Lexer::errorToken(const char* message) {
    std::ostringstream oss;
    oss << filename << ":" << startLine << ":" << startColumn << ": error: " << message;
    errors.push_back(oss.str());
    return Token(TokenType::INVALID, message, startLine, startColumn);
}

Token Lexer::peekToken() {
    if (!hasPeeked) {
        peekedToken = scanToken();
        hasPeeked = true;
    }
    return peekedToken;
}

Token Lexer::nextToken() {
    if (hasPeeked) {
        hasPeeked = false;
        return peekedToken;
    }
    return scanToken();
}

Token Lexer::scanToken() {
    skipWhitespace();

    start = current;
    startLine = line;
    startColumn = column;

    if (isAtEnd()) {
        return makeToken(TokenType::END_OF_FILE);
    }

    char c = advance();

    switch (c) {
        case '{': return makeToken(TokenType::LEFT_BRACE);
        case '}': return makeToken(TokenType::RIGHT_BRACE);
        case '[': return makeToken(TokenType::LEFT_BRACKET);
        case ']': return makeToken(TokenType::RIGHT_BRACKET);
        case ':': return makeToken(TokenType::COLON);
        case ',': return makeToken(TokenType::COMMA);
        case '`': return scanRawString();
        case '"': return scanEscapedString();
    }

    if (isAlpha(c)) {
        return scanIdentifier();
    }

    if (isDigit(c) || (c == '-' && isDigit(peek()))) {
        return scanNumber();
    }

    return errorToken("Unexpected character");
}

Token Lexer::scanRawString() {
    size_t contentStart = current;

    while (!isAtEnd() && peek() != '`') {
        advance();
    }

    if (isAtEnd()) {
        return errorToken("Unterminated string");
    }

    std::string_view content = source.substr(contentStart, current - contentStart);
    advance(); // closing `

    return Token(TokenType::STRING_LITERAL, content, startLine, startColumn);
}

Token Lexer::scanEscapedString() {
    size_t contentStart = current;

    while (!isAtEnd() && peek() != '"') {
        if (peek() == '\n') {
            return errorToken("Newline in double-quoted string");
        }
        if (peek() == '\\') {
            advance();
            if (isAtEnd()) break;
            char e = peek();
            if (e != '"' && e != '\\' && e != '/' && e != 'n' && e != 't' && e != 'r') {
                return errorToken("Unsupported escape sequence");
            }
        }
        advance();
    }

    if (isAtEnd()) {
        return errorToken("Unterminated string");
    }

    std::string_view content = source.substr(contentStart, current - contentStart);
    advance(); // closing "

    return Token(TokenType::ESCAPED_STRING, content, startLine, startColumn);
}

Token Lexer::scanIdentifier() {
    while (isIdentifierChar(peek())) {
        advance();
    }

    std::string_view text = source.substr(start, current - start);

    if (text == "true") return makeToken(TokenType::BOOLEAN_TRUE);
    if (text == "false") return makeToken(TokenType::BOOLEAN_FALSE);
    if (text == "null") return makeToken(TokenType::NULL_LITERAL);

    return makeToken(TokenType::IDENTIFIER);
}

Token Lexer::scanNumber() {
    while (isDigit(peek())) {
        advance();
    }

    if (peek() == '.' || peek() == 'e' || peek() == 'E') {
        return errorToken("Floating-point numbers are not supported");
    }

    return makeToken(TokenType::INTEGER);
}

} // namespace web::compile::abc
