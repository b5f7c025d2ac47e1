#pragma once

#include <memory>
#include <string>

namespace sysflow {
namespace workflow {

/**
 * Token types for the condition lexer
 */
enum class ConditionTokenType {
    IDENT,      // Variable name
    VAR,        // ${name}
    STRING,     // "text" or 'text'
    NUMBER,     // 42, 3.5 (kept as text)
    TRUE_LITERAL,   // true
    FALSE_LITERAL,  // false
    EQ,         // ==
    NEQ,        // !=
    AND,        // &&
    OR,         // ||
    NOT,        // !
    LPAREN,     // (
    RPAREN,     // )
    END         // End of input
};

struct ConditionToken {
    ConditionTokenType type;
    std::string text;
    size_t position = 0;
};

/**
 * Expression tree for a "when" guard
 */
struct ConditionNode;

using ConditionNodePtr = std::shared_ptr<const ConditionNode>;

struct ConditionNode {
    enum class Type {
        Literal,    // String, number or boolean literal
        VarRef,     // Variable reference, resolved at evaluation time
        Eq,         // left == right
        Neq,        // left != right
        And,        // left && right
        Or,         // left || right
        Not         // !left
    };

    Type type;
    std::string value;       // Literal text or variable name
    bool isBoolean = false;  // Literal came from true/false
    ConditionNodePtr left;
    ConditionNodePtr right;
};

/**
 * Parse a guard expression into a tree
 *
 * Grammar:
 *   expr       := andExpr ( '||' andExpr )*
 *   andExpr    := unary ( '&&' unary )*
 *   unary      := '!' unary | comparison
 *   comparison := primary ( ( '==' | '!=' ) primary )?
 *   primary    := STRING | NUMBER | IDENT | '${' IDENT '}' | true | false | '(' expr ')'
 *
 * Example: status == "ok" && !${skip}
 *
 * Throws ConditionError on malformed input.
 */
ConditionNodePtr parseCondition(const std::string& expression);

/**
 * Tokenizer for guard expressions
 */
class ConditionTokenizer {
public:
    explicit ConditionTokenizer(const std::string& input);
    ConditionToken next();
    ConditionToken peek();

private:
    std::string m_input;
    size_t m_pos = 0;

    void skipWhitespace();
    ConditionToken readString(char quote);
    ConditionToken readNumber();
    ConditionToken readIdentifier();
    ConditionToken readVariable();
    [[noreturn]] void fail(const std::string& detail) const;
};

/**
 * Recursive descent parser for guard expressions
 */
class ConditionParser {
public:
    // Limits that keep recursion bounded; exceeding either is a ConditionError
    static constexpr int kMaxNesting = 64;      // '!' and '(' levels
    static constexpr int kMaxOperators = 256;   // '&&', '||', '==', '!=' in total

    explicit ConditionParser(const std::string& expression);

    /**
     * Parse the whole expression; trailing tokens are an error
     */
    ConditionNodePtr parse();

private:
    std::string m_expression;
    ConditionTokenizer m_tokenizer;
    ConditionToken m_currentToken;
    int m_nesting = 0;
    int m_operators = 0;

    void advance();
    void expect(ConditionTokenType type, const std::string& what);
    [[noreturn]] void fail(const std::string& detail) const;
    void enterNesting();
    void countOperator();

    // Grammar productions
    ConditionNodePtr parseOr();
    ConditionNodePtr parseAnd();
    ConditionNodePtr parseUnary();
    ConditionNodePtr parseComparison();
    ConditionNodePtr parsePrimary();

    static ConditionNodePtr makeBinary(ConditionNode::Type type, ConditionNodePtr left, ConditionNodePtr right);
};

} // namespace workflow
} // namespace sysflow
