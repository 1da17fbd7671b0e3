/**
 * ABC Configuration Parser
 *
 * Recursive-descent parser that constructs an arena-allocated AST.
 * Features:
 * - Arena allocation with destructor tracking
 * - Panic mode error recovery (every error is collected)
 * - Trailing comma support
 * - Duplicate key detection
 */

#ifndef WEB_COMPILE_ABC_PARSER_HPP
#define WEB_COMPILE_ABC_PARSER_HPP

#include "config/abc_lexer.hpp"

#include <cstddef>
#include <string>
#include <type_traits>
#include <vector>

namespace web::compile::abc {

class ASTNode;
class ObjectNode;
class ArrayNode;

/**
 * Arena Allocator for AST nodes
 *
 * O(1) bump allocation; nodes with non-trivial destructors are destroyed
 * in reverse order when the arena goes away.
 */
class ArenaAllocator {
public:
    explicit ArenaAllocator(size_t blockSize = 16 * 1024);
    ~ArenaAllocator();

    ArenaAllocator(const ArenaAllocator&) = delete;
    ArenaAllocator& operator=(const ArenaAllocator&) = delete;

    void* allocate(size_t size, size_t alignment = alignof(std::max_align_t));

    template<typename T, typename... Args>
    T* create(Args&&... args) {
        // Room for the destructor entry first, so the push below cannot throw
        if (!std::is_trivially_destructible<T>::value) {
            destructors.reserve(destructors.size() + 1);
        }
        void* mem = allocate(sizeof(T), alignof(T));
        T* obj = new (mem) T(std::forward<Args>(args)...);
        if (!std::is_trivially_destructible<T>::value) {
            destructors.push_back({obj, [](void* p) { static_cast<T*>(p)->~T(); }});
        }
        return obj;
    }

private:
    struct Block {
        char* data;
        size_t size;
        size_t used;
    };
    struct Destructor {
        void* object;
        void (*destroy)(void*);
    };
    std::vector<Block> blocks;
    std::vector<Destructor> destructors;
    size_t defaultBlockSize;

    void allocateNewBlock(size_t minSize);
};

/**
 * Base class for all AST nodes
 */
class ASTNode {
public:
    virtual ~ASTNode() = default;

    uint32_t line = 0;
    uint32_t column = 0;

    enum class Kind {
        Object,
        Array,
        String,
        Integer,
        Boolean,
        Null
    };

    virtual Kind getKind() const = 0;
};

const char* nodeKindName(ASTNode::Kind kind);

struct KeyValuePair {
    std::string key;
    ASTNode* value;
    uint32_t line;
    uint32_t column;
};

/**
 * Object node - { key: value, ... } in declaration order
 */
class ObjectNode : public ASTNode {
public:
    std::vector<KeyValuePair> members;

    Kind getKind() const override { return Kind::Object; }

    ASTNode* find(const std::string& key) const;
};

/**
 * Array node - [ value, value, ... ]
 */
class ArrayNode : public ASTNode {
public:
    std::vector<ASTNode*> elements;

    Kind getKind() const override { return Kind::Array; }

    size_t size() const { return elements.size(); }
    bool empty() const { return elements.empty(); }
};

/**
 * String node - backtick, double-quoted or bare word
 */
class StringNode : public ASTNode {
public:
    std::string value;

    explicit StringNode(std::string val) : value(std::move(val)) {}

    Kind getKind() const override { return Kind::String; }
};

class IntegerNode : public ASTNode {
public:
    int64_t value;

    explicit IntegerNode(int64_t val) : value(val) {}

    Kind getKind() const override { return Kind::Integer; }
};

class BooleanNode : public ASTNode {
public:
    bool value;

    explicit BooleanNode(bool val) : value(val) {}

    Kind getKind() const override { return Kind::Boolean; }
};

class NullNode : public ASTNode {
public:
    Kind getKind() const override { return Kind::Null; }
};

/**
 * Parsed configuration document
 */
struct ABCDocument {
    ObjectNode* root = nullptr;

    bool valid() const { return root != nullptr; }
};

/**
 * Parser class - constructs AST from token stream
 */
class Parser {
public:
    Parser(Lexer& lexer, ArenaAllocator& arena);

    /**
     * Parse the entire document: a single top-level object
     */
    ABCDocument parse();

    /**
     * Parse a single value (for testing)
     */
    ASTNode* parseValue();

    /**
     * Parser and lexer errors, "file:line:column: error: message"
     */
    const std::vector<std::string>& getErrors() const { return errors; }
    bool hasErrors() const { return !errors.empty(); }

private:
    Lexer& lexer;
    ArenaAllocator& arena;
    Token current;
    Token previous;
    std::vector<std::string> errors;
    size_t lexerErrorsSeen = 0;
    bool panicMode = false;

    // Token handling
    void advance();
    bool check(TokenType type) const;
    bool match(TokenType type);
    void consume(TokenType type, const char* message);

    // Error handling
    void errorAt(const Token& token, const std::string& message);
    void errorAtCurrent(const std::string& message);
    void synchronize();

    template<typename T, typename... Args>
    T* node(const Token& at, Args&&... args) {
        T* n = arena.create<T>(std::forward<Args>(args)...);
        n->line = at.line;
        n->column = at.column;
        return n;
    }

    ObjectNode* parseObject();
    ArrayNode* parseArray();
    ASTNode* parseNumber();
};

} // namespace web::compile::abc

#endif // WEB_COMPILE_ABC_PARSER_HPP
