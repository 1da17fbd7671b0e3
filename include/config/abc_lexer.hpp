/**
 * ABC Configuration Lexer
 *
 * The lexer transforms raw web-compile.abc text into a stream of tokens.
 * Key features:
 * - Whitespace-insensitive
 * - Backtick strings (raw) and double-quoted strings (with escapes)
 * - Line comments with // or #
 * - Unquoted identifiers for keys and bare values (utf-8, compressed)
 */

#ifndef WEB_COMPILE_ABC_LEXER_HPP
#define WEB_COMPILE_ABC_LEXER_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace web::compile::abc {

/**
 * Token types for the ABC format
 */
enum class TokenType {
    // Structural tokens
    LEFT_BRACE,     // {
    RIGHT_BRACE,    // }
    LEFT_BRACKET,   // [
    RIGHT_BRACKET,  // ]

    // Separators
    COLON,          // :
    COMMA,          // ,

    // Data tokens
    STRING_LITERAL, // `raw text`
    ESCAPED_STRING, // "text with \" escapes" (lexeme excludes the quotes)
    IDENTIFIER,     // unquoted key names and bare words
    INTEGER,        // numeric literal
    BOOLEAN_TRUE,   // true
    BOOLEAN_FALSE,  // false
    NULL_LITERAL,   // null

    // Control tokens
    END_OF_FILE,
    INVALID         // lexical error
};

/**
 * Token structure - lightweight, trivially copyable
 *
 * The lexeme is a view into the source buffer, which must outlive it.
 */
struct Token {
    TokenType type;
    std::string_view lexeme;
    uint32_t line;
    uint32_t column;

    Token() : type(TokenType::INVALID), lexeme(""), line(0), column(0) {}
    Token(TokenType t, std::string_view lex, uint32_t ln, uint32_t col)
        : type(t), lexeme(lex), line(ln), column(col) {}

    bool is(TokenType t) const { return type == t; }
    bool isNot(TokenType t) const { return type != t; }

    bool isString() const {
        return type == TokenType::STRING_LITERAL || type == TokenType::ESCAPED_STRING;
    }
};

const char* tokenTypeName(TokenType type);

/**
 * Resolve \" \\ \n \t \r \/ escapes of a double-quoted lexeme
 */
std::string unescape(std::string_view lexeme);

/**
 * Lexer class - transforms source text into tokens
 */
class Lexer {
public:
    /**
     * @param source The configuration text (must outlive the lexer)
     * @param filename Name used in error messages
     */
    explicit Lexer(std::string_view source, std::string_view filename = "<input>");

    Token nextToken();
    Token peekToken();

    bool isAtEnd() const { return current >= source.size(); }

    uint32_t getLine() const { return line; }
    uint32_t getColumn() const { return column; }
    std::string_view getFilename() const { return filename; }

    /**
     * Errors formatted as "file:line:column: error: message"
     */
    const std::vector<std::string>& getErrors() const { return errors; }
    bool hasErrors() const { return !errors.empty(); }

private:
    std::string_view source;
    std::string_view filename;
    size_t start = 0;           // Start of current token
    size_t current = 0;         // Current position
    uint32_t line = 1;
    uint32_t column = 1;
    uint32_t startLine = 1;
    uint32_t startColumn = 1;
    bool hasPeeked = false;
    Token peekedToken;
    std::vector<std::string> errors;

    // Character helpers
    char peek() const;
    char peekNext() const;
    char advance();
    bool isDigit(char c) const;
    bool isAlpha(char c) const;
    bool isIdentifierChar(char c) const;

    // Token scanning
    void skipWhitespace();
    void skipComment();
    Token scanToken();
    Token scanRawString();
    Token scanEscapedString();
    Token scanIdentifier();
    Token scanNumber();

    Token makeToken(TokenType type);
    Token errorToken(const char* message);
};

} // namespace web::compile::abc

#endif // WEB_COMPILE_ABC_LEXER_HPP
