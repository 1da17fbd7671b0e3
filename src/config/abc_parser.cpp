/**
 * ABC Configuration Parser Implementation
 */

#include "config/abc_parser.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <new>
#include <sstream>

namespace web::compile::abc {

// =============================================================================
// Arena Allocator
// =============================================================================

ArenaAllocator::ArenaAllocator(size_t blockSize)
    : defaultBlockSize(blockSize) {
    allocateNewBlock(blockSize);
}

ArenaAllocator::~ArenaAllocator() {
    for (auto it = destructors.rbegin(); it != destructors.rend(); ++it) {
        it->destroy(it->object);
    }
    for (auto& block : blocks) {
        std::free(block.data);
    }
}

void ArenaAllocator::allocateNewBlock(size_t minSize) {
    size_t size = std::max(minSize, defaultBlockSize);
    Block block;
    block.data = static_cast<char*>(std::malloc(size));
    if (!block.data) {
        throw std::bad_alloc();
    }
    block.size = size;
    block.used = 0;
    blocks.push_back(block);
}

void* ArenaAllocator::allocate(size_t size, size_t alignment) {
    Block& current = blocks.back();

    size_t aligned = (current.used + alignment - 1) & ~(alignment - 1);

    if (aligned + size > current.size) {
        allocateNewBlock(size + alignment);
        return allocate(size, alignment);
    }

    void* ptr = current.data + aligned;
    current.used = aligned + size;
    return ptr;
}

// =============================================================================
// Nodes
// =============================================================================

const char* nodeKindName(ASTNode::Kind kind) {
    switch (kind) {
        case ASTNode::Kind::Object:  return "object";
        case ASTNode::Kind::Array:   return "array";
        case ASTNode::Kind::String:  return "string";
        case ASTNode::Kind::Integer: return "integer";
        case ASTNode::Kind::Boolean: return "boolean";
        case ASTNode::Kind::Null:    return "null";
    }
    return "value";
}

ASTNode* ObjectNode::find(const std::string& key) const {
    for (const auto& pair : members) {
        if (pair.key == key) {
            return pair.value;
        }
    }
    return nullptr;
}

// =============================================================================
// Parser
// =============================================================================

Parser::Parser(Lexer& lexer, ArenaAllocator& arena)
    : lexer(lexer), arena(arena) {
    advance();
}

void Parser::advance() {
    previous = current;
    current = lexer.nextToken();

    // Lexical errors are already formatted by the lexer
    const auto& lexErrors = lexer.getErrors();
    for (; lexerErrorsSeen < lexErrors.size(); ++lexerErrorsSeen) {
        errors.push_back(lexErrors[lexerErrorsSeen]);
    }
    if (current.is(TokenType::INVALID)) {
        panicMode = true;
    }
}

bool Parser::check(TokenType type) const {
    return current.type == type;
}

bool Parser::match(TokenType type) {
    if (!check(type)) return false;
    advance();
    return true;
}

void Parser::consume(TokenType type, const char* message) {
    if (check(type)) {
        advance();
        return;
    }
    errorAtCurrent(message);
}

void Parser::errorAt(const Token& token, const std::string& message) {
    if (panicMode) return;
    panicMode = true;

    std::ostringstream oss;
    oss << lexer.getFilename() << ":" << token.line << ":" << token.column
        << ": error: " << message;
    errors.push_back(oss.str());
}

void Parser::errorAtCurrent(const std::string& message) {
    errorAt(current, message + " (found " + tokenTypeName(current.type) + ")");
}

void Parser::synchronize() {
    panicMode = false;

    while (current.type != TokenType::END_OF_FILE) {
        if (current.type == TokenType::RIGHT_BRACE ||
            current.type == TokenType::RIGHT_BRACKET) {
            advance();
            return;
        }

        // A new key-value pair (key followed by colon)
        if ((current.type == TokenType::IDENTIFIER || current.isString()) &&
            lexer.peekToken().type == TokenType::COLON) {
            return;
        }

        advance();
    }
}

ABCDocument Parser::parse() {
    ABCDocument doc;

    if (!check(TokenType::LEFT_BRACE)) {
        errorAtCurrent("Expected '{' at start of configuration");
        return doc;
    }

    ObjectNode* root = parseObject();

    if (!check(TokenType::END_OF_FILE)) {
        errorAtCurrent("Unexpected content after the top-level object");
    }

    if (!hasErrors()) {
        doc.root = root;
    }
    return doc;
}

ASTNode* Parser::parseValue() {
    if (check(TokenType::LEFT_BRACE)) {
        return parseObject();
    }

    if (check(TokenType::LEFT_BRACKET)) {
        return parseArray();
    }

    if (check(TokenType::INTEGER)) {
        return parseNumber();
    }

    Token at = current;

    if (match(TokenType::STRING_LITERAL)) {
        return node<StringNode>(at, std::string(at.lexeme));
    }

    if (match(TokenType::ESCAPED_STRING)) {
        return node<StringNode>(at, unescape(at.lexeme));
    }

    if (match(TokenType::BOOLEAN_TRUE)) {
        return node<BooleanNode>(at, true);
    }

    if (match(TokenType::BOOLEAN_FALSE)) {
        return node<BooleanNode>(at, false);
    }

    if (match(TokenType::NULL_LITERAL)) {
        return node<NullNode>(at);
    }

    // Bare identifiers as strings (format: compressed)
    if (match(TokenType::IDENTIFIER)) {
        return node<StringNode>(at, std::string(at.lexeme));
    }

    errorAtCurrent("Expected value");
    return nullptr;
}

ObjectNode* Parser::parseObject() {
    Token open = current;
    consume(TokenType::LEFT_BRACE, "Expected '{'");

    auto* obj = node<ObjectNode>(open);

    while (!check(TokenType::RIGHT_BRACE) && !check(TokenType::END_OF_FILE)) {
        Token keyToken = current;
        std::string key;
        if (check(TokenType::IDENTIFIER) || check(TokenType::STRING_LITERAL)) {
            advance();
            key = std::string(keyToken.lexeme);
        } else if (check(TokenType::ESCAPED_STRING)) {
            advance();
            key = unescape(keyToken.lexeme);
        } else {
            errorAtCurrent("Expected key (identifier or string)");
            synchronize();
            continue;
        }

        if (!match(TokenType::COLON)) {
            errorAtCurrent("Expected ':' after key");
            synchronize();
            continue;
        }

        ASTNode* value = parseValue();
        if (!value) {
            synchronize();
            continue;
        }

        if (obj->find(key)) {
            errorAt(keyToken, "Duplicate key '" + key + "'");
        } else {
            obj->members.push_back({key, value, keyToken.line, keyToken.column});
        }

        // Optional trailing comma
        if (check(TokenType::COMMA)) {
            advance();
        } else if (!check(TokenType::RIGHT_BRACE)) {
            errorAtCurrent("Expected ',' or '}' after value");
            synchronize();
        }
    }

    consume(TokenType::RIGHT_BRACE, "Expected '}'");
    return obj;
}

ArrayNode* Parser::parseArray() {
    Token open = current;
    consume(TokenType::LEFT_BRACKET, "Expected '['");

    auto* arr = node<ArrayNode>(open);

    while (!check(TokenType::RIGHT_BRACKET) && !check(TokenType::END_OF_FILE)) {
        ASTNode* element = parseValue();
        if (!element) {
            synchronize();
            continue;
        }

        arr->elements.push_back(element);

        if (check(TokenType::COMMA)) {
            advance();
        } else if (!check(TokenType::RIGHT_BRACKET)) {
            errorAtCurrent("Expected ',' or ']' after element");
            synchronize();
        }
    }

    consume(TokenType::RIGHT_BRACKET, "Expected ']'");
    return arr;
}

ASTNode* Parser::parseNumber() {
    Token at = current;
    consume(TokenType::INTEGER, "Expected number");

    std::string text(at.lexeme);
    errno = 0;
    int64_t value = std::strtoll(text.c_str(), nullptr, 10);
    if (errno == ERANGE) {
        errorAt(at, "Integer out of range: " + text);
    }
    return node<IntegerNode>(at, value);
}

} // namespace web::compile::abc
